/**
 * PTCG Core - Game Implementation
 *
 * Players, cards, events and lifecycle. The setup protocol, turn
 * controller and action execution live in their own translation units.
 */

#include "game.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace ptcg {

namespace {

uint64_t now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

Game::Game(GameRules game_rules, std::optional<uint32_t> seed, std::string game_id)
    : id(std::move(game_id))
    , rules(std::move(game_rules))
{
    if (seed.has_value()) {
        rng_.seed(*seed);
    } else {
        // Seed RNG with current time
        auto clock_seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        rng_.seed(static_cast<std::mt19937::result_type>(clock_seed));
    }
}

// ============================================================================
// PLAYERS AND CARDS
// ============================================================================

OperationResult Game::add_player(Player player) {
    if (state != GameStatus::SETUP) {
        log_error("Game", "Cannot add players after the game has started");
        return OperationResult::fail("Cannot add players after game has started");
    }
    if (players.size() >= MAX_PLAYERS) {
        log_error("Game", "Player limit reached");
        return OperationResult::fail("Maximum of 2 players allowed");
    }
    if (players.count(player.id)) {
        return OperationResult::fail("Player " + player.id + " already joined");
    }

    player.prize_cards = rules.prize_cards;
    PlayerID player_id = player.id;
    players.emplace(player_id, std::move(player));
    log_info("Game", "Player " + player_id + " joined");
    return OperationResult::ok();
}

OperationResult Game::set_player_deck(const PlayerID& player_id, const Deck& deck) {
    if (state != GameStatus::SETUP) {
        return OperationResult::fail("Cannot set deck after game has started");
    }
    Player* player = get_player(player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }

    std::vector<CardID> expanded;
    expanded.reserve(static_cast<size_t>(deck.total_cards()));
    for (const auto& [card_id, quantity] : deck.cards) {
        for (int copy = 1; copy <= quantity; copy++) {
            CardID instance_id = player_id + "/" + card_id + "#" + std::to_string(copy);
            card_database.register_instance(instance_id, card_id);
            expanded.push_back(std::move(instance_id));
        }
    }

    player->set_deck(std::move(expanded));
    if (rules.auto_shuffle) {
        player->shuffle_deck(rng_);
    }
    log_info("Game", "Deck '" + deck.name + "' set for " + player_id + " (" +
             std::to_string(player->deck.size()) + " cards)");
    return OperationResult::ok();
}

Player* Game::get_player(const PlayerID& player_id) {
    auto it = players.find(player_id);
    return it != players.end() ? &it->second : nullptr;
}

const Player* Game::get_player(const PlayerID& player_id) const {
    auto it = players.find(player_id);
    return it != players.end() ? &it->second : nullptr;
}

std::optional<PlayerID> Game::find_card_owner(const CardID& card_id) const {
    for (const auto& [player_id, player] : players) {
        if (player.find_card_location(card_id).has_value()) {
            return player_id;
        }
    }
    return std::nullopt;
}

// ============================================================================
// EVENTS
// ============================================================================

void Game::add_event(GameEvent event) {
    event.sequence = next_sequence_++;
    event.timestamp_ms = now_ms();
    history.push_back(event);

    for (const auto& handler : handlers_) {
        handler->handle_event(history.back());
    }
}

void Game::register_handler(std::shared_ptr<EventHandler> handler) {
    if (!handler) return;

    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&](const auto& h) { return h->name() == handler->name(); });
    if (it != handlers_.end()) {
        *it = std::move(handler);
    } else {
        handlers_.push_back(std::move(handler));
    }
}

bool Game::unregister_handler(const std::string& name) {
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&](const auto& h) { return h->name() == name; });
    if (it == handlers_.end()) return false;
    handlers_.erase(it);
    return true;
}

// ============================================================================
// TURN QUERIES
// ============================================================================

bool Game::is_player_turn(const PlayerID& player_id) const {
    auto current = get_current_player_id();
    return current.has_value() && *current == player_id;
}

std::optional<PlayerID> Game::get_current_player_id() const {
    if (current_player_index >= turn_order.size()) {
        return std::nullopt;
    }
    return turn_order[current_player_index];
}

std::optional<PlayerID> Game::get_opponent_id(const PlayerID& player_id) const {
    for (const auto& [other_id, player] : players) {
        if (other_id != player_id) return other_id;
    }
    return std::nullopt;
}

// ============================================================================
// GAME LIFECYCLE
// ============================================================================

void Game::end_game(std::optional<PlayerID> winner_id) {
    if (is_finished()) return;

    state = GameStatus::FINISHED;
    winner = winner_id;
    add_event(GameEvent::game_ended(winner_id));
    log_info("Game", "Game over. Winner: " + winner_id.value_or("none"));
}

void Game::cancel_game() {
    if (is_finished()) return;

    state = GameStatus::CANCELLED;
    winner.reset();
    add_event(GameEvent::game_ended(std::nullopt));
    log_info("Game", "Game cancelled");
}

OperationResult Game::shuffle_deck(const PlayerID& player_id) {
    Player* player = get_player(player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }
    player->shuffle_deck(rng_);
    add_event(GameEvent::deck_shuffled(player_id));
    return OperationResult::ok();
}

void Game::shuffle_both_decks() {
    for (auto& [player_id, player] : players) {
        player.shuffle_deck(rng_);
        add_event(GameEvent::deck_shuffled(player_id));
    }
}

// ============================================================================
// RANDOMNESS
// ============================================================================

bool Game::flip_coin() {
    std::bernoulli_distribution coin(0.5);
    return coin(rng_);
}

std::vector<bool> Game::flip_coins(int count) {
    std::vector<bool> results;
    for (int i = 0; i < count; i++) {
        results.push_back(flip_coin());
    }
    return results;
}

// ============================================================================
// DIAGNOSTICS
// ============================================================================

OperationResult Game::require_setup(const std::string& operation) const {
    if (state != GameStatus::SETUP) {
        log_error("Setup", operation + " rejected: game is not in setup");
        return OperationResult::fail("Can only " + operation + " during setup phase");
    }
    return OperationResult::ok();
}

void Game::log_info(const std::string& component, const std::string& message) const {
    if (verbose_) {
        std::cout << "[" << component << "] " << message << std::endl;
    }
}

void Game::log_error(const std::string& component, const std::string& message) const {
    if (verbose_) {
        std::cerr << "[" << component << "] " << message << std::endl;
    }
}

} // namespace ptcg
