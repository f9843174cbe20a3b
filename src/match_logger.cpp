/**
 * PTCG Core - Match Logger Implementation
 */

#include "match_logger.hpp"
#include "game.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <algorithm>

namespace ptcg {

namespace {

std::tm local_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    return *std::localtime(&time_t);
}

} // namespace

MatchLogger::MatchLogger(const std::string& output_dir, const CardDatabase* card_db)
    : card_db_(card_db) {

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Match Logger] Failed to create " << output_dir << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    std::tm tm = local_now();
    auto stamp = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() % 1000000;

    std::ostringstream filename;
    filename << output_dir << "/match_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
             << std::setw(6) << std::setfill('0') << stamp << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Match Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "MATCH LOG - EVENT TRACE\n";
    log_file_ << "Started: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";
    log_file_.flush();
}

MatchLogger::~MatchLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string MatchLogger::fmt_card(const CardID& card_id) const {
    if (card_db_) {
        const Card* card = card_db_->get_card(card_id);
        if (card) {
            return card->name + " (" + card_id + ")";
        }
    }
    return "(" + card_id + ")";
}

std::string MatchLogger::format_pokemon_line(const Player& player, const CardID& pokemon_id,
                                             const std::string& label) const {
    std::ostringstream line;
    line << label << ":  " << fmt_card(pokemon_id);

    int max_hp = 0;
    if (card_db_) {
        const Card* card = card_db_->get_card(pokemon_id);
        if (card) {
            max_hp = card->get_hp().value_or(0);
        }
    }
    int current_hp = std::max(0, max_hp - player.get_damage(pokemon_id));
    if (max_hp > 0) {
        line << " | HP: " << current_hp << "/" << max_hp;
    } else {
        line << " | Damage: " << player.get_damage(pokemon_id);
    }

    line << " | Energy: [";
    auto it = player.attached_energy.find(pokemon_id);
    if (it != player.attached_energy.end()) {
        for (size_t i = 0; i < it->second.size(); i++) {
            if (i > 0) line << ", ";
            line << fmt_card(it->second[i]);
        }
    }
    line << "]";

    auto conditions = player.get_special_conditions(pokemon_id);
    if (!conditions.empty()) {
        line << " | Conditions: [";
        for (size_t i = 0; i < conditions.size(); i++) {
            if (i > 0) line << ", ";
            line << conditions[i].condition.to_string();
        }
        line << "]";
    }
    return line.str();
}

void MatchLogger::write_zone(const std::string& label, const std::vector<CardID>& cards) {
    log_file_ << label << " (" << cards.size() << "): [";
    for (size_t i = 0; i < cards.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << fmt_card(cards[i]);
    }
    log_file_ << "]\n";
}

void MatchLogger::handle_event(const GameEvent& event) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "[#" << event.sequence << " @" << event.timestamp_ms << "] "
              << to_string(event.type) << ": " << event.describe() << "\n";
    events_logged_++;

    if (event.type == EventType::GAME_ENDED) {
        log_game_end(event);
    }
    log_file_.flush();
}

void MatchLogger::log_state(const Game& game) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";

    for (const auto& [player_id, player] : game.players) {
        log_file_ << "[PLAYER " << player_id << "]\n";

        if (player.active_pokemon.has_value()) {
            log_file_ << format_pokemon_line(player, *player.active_pokemon, "ACTIVE") << "\n";
        } else {
            log_file_ << "ACTIVE:  (Empty)\n";
        }
        for (size_t i = 0; i < player.bench.size(); i++) {
            log_file_ << format_pokemon_line(player, player.bench[i], "BENCH " + std::to_string(i + 1)) << "\n";
        }

        write_zone("HAND", player.hand);
        write_zone("PRIZES", player.prizes);
        write_zone("DECK", player.deck);
        write_zone("DISCARD", player.discard_pile);
        log_file_ << "\n";
    }

    log_file_ << "[GLOBAL]\n";
    log_file_ << "State: " << to_string(game.state)
              << " | Phase: " << to_string(game.phase)
              << " | Turn: " << game.turn_number
              << " | Current Player: " << game.get_current_player_id().value_or("(none)") << "\n";
    if (game.state == GameStatus::SETUP) {
        log_file_ << "Setup: " << to_string(game.setup_phase)
                  << " | Mulligans: " << game.mulligan_count << "\n";
    }
    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void MatchLogger::log_game_end(const GameEvent& event) {
    std::tm tm = local_now();

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "GAME END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (event.winner.has_value()) {
        log_file_ << "Winner: Player " << *event.winner << "\n";
    } else {
        log_file_ << "Result: No winner\n";
    }
    log_file_ << "Ended: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";
}

} // namespace ptcg
