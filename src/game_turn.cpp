/**
 * PTCG Core - Turn Controller
 *
 * Game start, turn boundaries, phase cycling and win conditions.
 */

#include "game.hpp"
#include "effect_manager.hpp"

namespace ptcg {

// ============================================================================
// START
// ============================================================================

OperationResult Game::start() {
    if (state != GameStatus::SETUP) {
        return OperationResult::fail("Game is not in setup state");
    }
    if (players.size() < MAX_PLAYERS) {
        return OperationResult::fail("Need at least 2 players to start");
    }
    for (const auto& [player_id, player] : players) {
        if (player.deck.empty()) {
            return OperationResult::fail("All players must have decks");
        }
    }

    // Seating order when setup was skipped
    if (turn_order.empty()) {
        for (const auto& [player_id, player] : players) {
            turn_order.push_back(player_id);
        }
        current_player_index = 0;
    }

    state = GameStatus::IN_PROGRESS;
    add_event(GameEvent::game_started(turn_order));
    log_info("Game", "Game " + id + " started");
    return start_turn();
}

// ============================================================================
// TURN BOUNDARIES
// ============================================================================

OperationResult Game::start_turn() {
    if (state != GameStatus::IN_PROGRESS) {
        return OperationResult::fail("Game is not in progress");
    }
    auto current = get_current_player_id();
    if (!current) {
        return OperationResult::fail("No current player");
    }
    const PlayerID player_id = *current;
    Player* player = get_player(player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }

    player->start_turn();
    auto drawn = player->draw_card();
    phase = TurnPhase::BEGINNING_OF_TURN;

    add_event(GameEvent::turn_started(player_id, turn_number));
    add_event(GameEvent::card_drawn(player_id, drawn));

    if (effect_manager_) {
        effect_manager_->on_turn_start(*this, player_id);
    }

    log_info("Turn", "Turn " + std::to_string(turn_number) + " started for " + player_id);
    return OperationResult::ok();
}

OperationResult Game::end_turn() {
    if (state != GameStatus::IN_PROGRESS) {
        return OperationResult::fail("Game is not in progress");
    }
    auto current = get_current_player_id();
    if (!current) {
        return OperationResult::fail("No current player");
    }
    const PlayerID player_id = *current;

    add_event(GameEvent::turn_ended(player_id));

    if (effect_manager_) {
        effect_manager_->on_turn_end(*this, player_id);
    }

    if (check_win_conditions().has_value()) {
        return OperationResult::ok();
    }

    advance_player_index();
    return start_turn();
}

void Game::advance_player_index() {
    if (turn_order.empty()) return;

    current_player_index = (current_player_index + 1) % turn_order.size();
    // A round is complete once play returns to the first player
    if (current_player_index == 0) {
        turn_number++;
    }
}

OperationResult Game::next_phase() {
    if (state != GameStatus::IN_PROGRESS) {
        return OperationResult::fail("Game is not in progress");
    }

    switch (phase) {
        case TurnPhase::BEGINNING_OF_TURN:
            phase = TurnPhase::MAIN;
            break;
        case TurnPhase::MAIN:
            phase = TurnPhase::ATTACK;
            break;
        case TurnPhase::ATTACK:
            phase = TurnPhase::END_OF_TURN;
            break;
        case TurnPhase::END_OF_TURN:
            return end_turn();
    }
    return OperationResult::ok();
}

// ============================================================================
// WIN CONDITIONS
// ============================================================================

std::optional<PlayerID> Game::check_win_conditions() {
    std::optional<PlayerID> found;

    for (const auto& [player_id, player] : players) {
        if (player.has_won()) {
            found = player_id;
            break;
        }

        bool opponent_lost = false;
        for (const auto& [other_id, other] : players) {
            if (other_id != player_id && other.has_lost()) {
                opponent_lost = true;
                break;
            }
        }
        if (opponent_lost) {
            found = player_id;
            break;
        }
    }

    if (found) {
        end_game(found);
    }
    return found;
}

// ============================================================================
// SPECIAL CONDITIONS
// ============================================================================

std::vector<ConditionEffect> Game::process_special_conditions(const PlayerID& player_id) {
    Player* player = get_player(player_id);
    if (!player) {
        return {};
    }

    std::vector<ConditionEffect> effects = player->update_special_conditions(turn_number);
    player->apply_condition_effects(effects, rng_);

    auto opponent = get_opponent_id(player_id);
    for (const auto& effect : effects) {
        if (effect.type != ConditionEffectType::DAMAGE) continue;

        add_event(GameEvent::damage_dealt(opponent.value_or(player_id), effect.pokemon_id, effect.amount));
        if (player->is_in_play(effect.pokemon_id)) {
            resolve_knockout(player_id, effect.pokemon_id);
        }
    }
    return effects;
}

} // namespace ptcg
