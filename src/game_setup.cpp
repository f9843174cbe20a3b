/**
 * PTCG Core - Setup Protocol
 *
 * Ordered pre-game steps: turn order, opening hands, the mulligan
 * sub-protocol, active/bench selection and prize placement. Every step
 * requires GameStatus::SETUP and reports failures through its result.
 */

#include "game.hpp"
#include <algorithm>
#include <sstream>

namespace ptcg {

// ============================================================================
// TURN ORDER AND OPENING HANDS
// ============================================================================

OperationResult Game::start_setup() {
    if (state != GameStatus::SETUP) {
        return OperationResult::fail("Game is not in setup state");
    }
    if (players.size() < MAX_PLAYERS) {
        log_error("Setup", "Need at least 2 players, have " + std::to_string(players.size()));
        return OperationResult::fail("Need at least 2 players to start setup");
    }
    for (const auto& [player_id, player] : players) {
        if (player.deck.empty()) {
            log_error("Setup", "Player " + player_id + " has no deck");
            return OperationResult::fail("All players must have decks");
        }
    }

    setup_phase = SetupPhase::WAITING_FOR_TURN_ORDER;
    log_info("Setup", "Setup started for game " + id);
    return OperationResult::ok();
}

OperationResult Game::determine_turn_order() {
    auto check = require_setup("determine turn order");
    if (!check) return check;

    if (players.size() < MAX_PLAYERS) {
        return OperationResult::fail("Need at least 2 players to determine turn order");
    }

    turn_order.clear();
    for (const auto& [player_id, player] : players) {
        turn_order.push_back(player_id);
    }

    // Coin flip: heads keeps the seating order, tails swaps it
    if (!flip_coin()) {
        std::swap(turn_order[0], turn_order[1]);
    }
    current_player_index = 0;

    setup_phase = SetupPhase::WAITING_FOR_HANDS;
    log_info("Setup", "Player " + turn_order[0] + " goes first");
    return OperationResult::ok();
}

OperationResult Game::deal_opening_hands() {
    auto check = require_setup("deal opening hands");
    if (!check) return check;

    if (turn_order.empty()) {
        return OperationResult::fail("Turn order must be determined before dealing hands");
    }
    for (const auto& [player_id, player] : players) {
        if (!player.hand.empty()) {
            return OperationResult::fail("Opening hands have already been dealt");
        }
    }

    for (auto& [player_id, player] : players) {
        player.draw_cards(OPENING_HAND_SIZE);
    }

    setup_phase = SetupPhase::CHECKING_FOR_BASIC_POKEMON;
    return OperationResult::ok();
}

BasicPokemonCheck Game::check_for_basic_pokemon() const {
    BasicPokemonCheck result;
    auto check = require_setup("check for basic Pokemon");
    if (!check) {
        result.error = check.error;
        return result;
    }

    for (const auto& [player_id, player] : players) {
        if (player.find_basic_pokemon_in_hand(card_database).empty()) {
            result.players_without_basic.push_back(player_id);
        }
    }
    result.all_without_basic = !players.empty() &&
                               result.players_without_basic.size() == players.size();
    result.success = true;
    return result;
}

// ============================================================================
// MULLIGAN
// ============================================================================

BasicPokemonCheck Game::declare_no_basic_pokemon() {
    BasicPokemonCheck result = check_for_basic_pokemon();
    if (!result.success) {
        return result;
    }

    setup_phase = result.players_without_basic.empty()
        ? SetupPhase::SELECTING_ACTIVE_POKEMON
        : SetupPhase::MULLIGAN_REQUIRED;
    return result;
}

OperationResult Game::mark_player_for_mulligan(const PlayerID& player_id) {
    auto check = require_setup("mark player for mulligan");
    if (!check) return check;

    if (!get_player(player_id)) {
        return OperationResult::fail("Player not found");
    }

    player_waiting_for_mulligan = player_id;
    log_info("Setup", "Player " + player_id + " will mulligan after the opponent's setup");
    return OperationResult::ok();
}

OperationResult Game::perform_pending_mulligans() {
    auto check = require_setup("perform mulligans");
    if (!check) return check;

    if (player_waiting_for_mulligan.has_value()) {
        PlayerID player_id = *player_waiting_for_mulligan;
        auto result = perform_mulligan(player_id);
        if (!result) return result;
    }

    player_waiting_for_mulligan.reset();
    return OperationResult::ok();
}

OperationResult Game::perform_mulligan(const PlayerID& player_id) {
    auto check = require_setup("perform mulligan");
    if (!check) return check;

    Player* player = get_player(player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }

    player->return_hand_to_deck();
    player->shuffle_deck(rng_);
    player->draw_cards(OPENING_HAND_SIZE);
    mulligan_count++;

    log_info("Setup", "Player " + player_id + " took a mulligan (total " +
             std::to_string(mulligan_count) + ")");
    return OperationResult::ok();
}

MulliganOutcome Game::perform_mulligan_and_check_basic_pokemon(const PlayerID& player_id) {
    MulliganOutcome outcome;
    auto result = perform_mulligan(player_id);
    if (!result) {
        outcome.error = result.error;
        return outcome;
    }

    const Player* player = get_player(player_id);
    outcome.success = true;
    outcome.result = player->find_basic_pokemon_in_hand(card_database).empty()
        ? MulliganResult::one_without_basic(player_id)
        : MulliganResult::all_with_basic();
    return outcome;
}

MulliganOutcome Game::perform_mulligan_for_both_and_check_basic_pokemon() {
    MulliganOutcome outcome;
    auto check = require_setup("perform mulligan");
    if (!check) {
        outcome.error = check.error;
        return outcome;
    }

    std::vector<PlayerID> without_basic;
    for (auto& [player_id, player] : players) {
        auto result = perform_mulligan(player_id);
        if (!result) {
            outcome.error = result.error;
            return outcome;
        }
        if (player.find_basic_pokemon_in_hand(card_database).empty()) {
            without_basic.push_back(player_id);
        }
    }

    outcome.success = true;
    if (without_basic.empty()) {
        outcome.result = MulliganResult::all_with_basic();
    } else if (without_basic.size() == players.size()) {
        outcome.result = MulliganResult::all_without_basic();
    } else {
        outcome.result = MulliganResult::one_without_basic(without_basic.front());
    }
    return outcome;
}

MulliganOutcome Game::declare_and_perform_mulligan(const PlayerID& player_id) {
    MulliganOutcome outcome;
    auto reveal = reveal_hands_for_mulligan(player_id);
    if (!reveal.success) {
        outcome.error = reveal.error;
        return outcome;
    }
    log_info("Setup", "Hands revealed for mulligan:\n" + reveal.text);

    return perform_mulligan_and_check_basic_pokemon(player_id);
}

HandReveal Game::print_player_hand(const PlayerID& player_id) const {
    HandReveal reveal;
    auto check = require_setup("print player hand");
    if (!check) {
        reveal.error = check.error;
        return reveal;
    }

    const Player* player = get_player(player_id);
    if (!player) {
        reveal.error = "Player not found";
        return reveal;
    }

    std::ostringstream out;
    out << "Player " << player->name << "'s hand:\n";
    for (size_t i = 0; i < player->hand.size(); i++) {
        const CardID& card_id = player->hand[i];
        const Card* card = card_database.get_card(card_id);
        out << "  " << (i + 1) << ". " << (card ? card->name : "Unknown card")
            << " (" << card_id << ")\n";
    }

    reveal.success = true;
    reveal.text = out.str();
    return reveal;
}

HandReveal Game::reveal_hands_for_mulligan(const PlayerID& player_id) const {
    HandReveal reveal = print_player_hand(player_id);
    if (!reveal.success) {
        return reveal;
    }

    auto opponent_id = get_opponent_id(player_id);
    if (opponent_id.has_value()) {
        HandReveal opponent = print_player_hand(*opponent_id);
        if (!opponent.success) {
            return opponent;
        }
        reveal.text += opponent.text;
    }
    return reveal;
}

CompensationResult Game::mulligan_compensation(const PlayerID& player_id, int card_count) {
    CompensationResult result;
    auto check = require_setup("perform mulligan compensation");
    if (!check) {
        result.error = check.error;
        return result;
    }

    int limit = get_mulligan_compensation_limit();
    if (card_count < 0) {
        result.error = "Declared card count " + std::to_string(card_count) + " is negative";
        return result;
    }
    if (card_count > limit) {
        result.error = "Declared card count " + std::to_string(card_count) +
                       " exceeds limit " + std::to_string(limit);
        return result;
    }

    Player* player = get_player(player_id);
    if (!player) {
        result.error = "Player not found";
        return result;
    }
    if (mulligan_compensation_used.count(player_id)) {
        result.error = "Mulligan compensation already used by player " + player_id;
        return result;
    }

    result.drawn = player->draw_cards(static_cast<size_t>(card_count));
    mulligan_compensation_used.insert(player_id);
    result.success = true;
    log_info("Setup", "Player " + player_id + " drew " + std::to_string(result.drawn.size()) +
             " compensation cards");
    return result;
}

// ============================================================================
// BOARD SETUP
// ============================================================================

OperationResult Game::select_active_pokemon(const PlayerID& player_id, const CardID& card_id) {
    auto check = require_setup("select active Pokemon");
    if (!check) return check;

    Player* player = get_player(player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }
    if (!player->hand_contains(card_id)) {
        return OperationResult::fail("Selected Pokemon is not in player's hand");
    }

    const Card* card = card_database.get_card(card_id);
    if (!card) {
        return OperationResult::fail("Card not found in database");
    }
    if (!card->is_pokemon()) {
        return OperationResult::fail("Selected card is not a Pokemon");
    }
    if (!card->is_basic_pokemon()) {
        return OperationResult::fail("Selected Pokemon is not a Basic Pokemon");
    }

    if (!player->set_active_pokemon(card_id)) {
        return OperationResult::fail("Failed to set active Pokemon");
    }

    setup_phase = SetupPhase::SETTING_UP_BENCH;
    return OperationResult::ok();
}

OperationResult Game::setup_bench(const PlayerID& player_id, const std::vector<CardID>& card_ids) {
    auto check = require_setup("setup bench");
    if (!check) return check;

    Player* player = get_player(player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }

    if (player->bench.size() + card_ids.size() > Player::MAX_BENCH_SIZE) {
        return OperationResult::fail("Bench can hold at most " +
                                     std::to_string(Player::MAX_BENCH_SIZE) + " Pokemon");
    }

    // Validate the whole batch before moving anything
    std::vector<CardID> remaining_hand = player->hand;
    for (const auto& card_id : card_ids) {
        auto it = std::find(remaining_hand.begin(), remaining_hand.end(), card_id);
        if (it == remaining_hand.end()) {
            return OperationResult::fail("Selected Pokemon is not in player's hand");
        }
        remaining_hand.erase(it);

        const Card* card = card_database.get_card(card_id);
        if (!card) {
            return OperationResult::fail("Card not found in database");
        }
        if (!card->is_pokemon()) {
            return OperationResult::fail("Selected card is not a Pokemon");
        }
    }

    for (const auto& card_id : card_ids) {
        if (!player->bench_pokemon(card_id)) {
            return OperationResult::fail("Failed to place Pokemon on bench");
        }
    }

    setup_phase = SetupPhase::PLACING_PRIZE_CARDS;
    return OperationResult::ok();
}

OperationResult Game::place_prize_cards() {
    auto check = require_setup("place prize cards");
    if (!check) return check;

    for (const auto& [player_id, player] : players) {
        if (!player.prizes.empty()) {
            return OperationResult::fail("Prize cards have already been placed");
        }
    }

    size_t wanted = static_cast<size_t>(std::max(rules.prize_cards, 0));
    for (auto& [player_id, player] : players) {
        std::vector<CardID> prizes = player.draw_prize_cards(wanted);
        player.prize_cards = static_cast<int>(prizes.size());
        player.prizes = std::move(prizes);
        if (player.prizes.size() < wanted) {
            log_info("Setup", "Player " + player_id + " placed only " +
                     std::to_string(player.prizes.size()) + " prize cards");
        }
    }

    setup_phase = SetupPhase::SETUP_COMPLETE;
    return OperationResult::ok();
}

OperationResult Game::complete_setup() {
    auto check = require_setup("complete setup");
    if (!check) return check;

    for (const auto& [player_id, player] : players) {
        if (!player.active_pokemon.has_value()) {
            log_error("Setup", "Player " + player_id + " has no active Pokemon");
            return OperationResult::fail("All players must have an active Pokemon");
        }
    }
    if (turn_order.empty()) {
        return OperationResult::fail("Turn order must be determined before completing setup");
    }

    state = GameStatus::IN_PROGRESS;
    setup_phase = SetupPhase::SETUP_COMPLETE;
    current_player_index = 0;
    add_event(GameEvent::game_started(turn_order));
    log_info("Setup", "Setup complete, game " + id + " in progress");
    return start_turn();
}

} // namespace ptcg
