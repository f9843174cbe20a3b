/**
 * PTCG Core - Action Execution
 *
 * Single dispatch point for player actions: validate through the rule
 * engine, apply the state change, record events and fire card effects.
 * Each apply_* helper checks everything it needs before touching state,
 * so a failed action leaves the game as it was.
 */

#include "game.hpp"
#include "rule_engine.hpp"
#include "effect_manager.hpp"
#include <algorithm>

namespace ptcg {

namespace {

constexpr const char* EXECUTION_RULE = "ActionExecution";

} // namespace

// ============================================================================
// DISPATCH
// ============================================================================

ActionResult Game::execute_action(const RuleEngine& rule_engine, const GameAction& action) {
    ActionResult result;
    result.violations = rule_engine.validate_action(*this, action);

    if (result.has_blocking_violation()) {
        for (const auto& v : result.violations) {
            log_error("Rules", action.to_string() + " rejected by " + v.rule_name + ": " + v.message);
        }
        return result;
    }

    OperationResult applied;
    switch (action.action_type) {
        case ActionType::DRAW_CARD:
            applied = apply_draw_card(action);
            break;
        case ActionType::PLAY_CARD:
            applied = apply_play_card(action);
            break;
        case ActionType::ATTACH_ENERGY:
            applied = apply_attach_energy(action);
            break;
        case ActionType::USE_ATTACK:
            applied = apply_use_attack(action);
            break;
        case ActionType::RETREAT:
            applied = apply_retreat(action);
            break;
        case ActionType::END_TURN:
            applied = apply_end_turn(action);
            break;
        case ActionType::PASS:
            applied = OperationResult::ok();
            break;
    }

    if (!applied) {
        log_error("Action", action.to_string() + " failed: " + applied.error);
        result.violations = {RuleViolation(EXECUTION_RULE, applied.error, ViolationSeverity::ERROR)};
        return result;
    }

    if (rule_engine.config().auto_apply_effects) {
        auto violation = rule_engine.apply_effects(*this, action);
        if (violation) {
            result.violations = {*violation};
            return result;
        }
    }

    result.success = true;
    return result;
}

// ============================================================================
// DRAW / PLAY / ATTACH
// ============================================================================

OperationResult Game::apply_draw_card(const GameAction& action) {
    Player* player = get_player(action.player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }

    auto drawn = player->draw_card();
    add_event(GameEvent::card_drawn(action.player_id, drawn));
    if (drawn) {
        fire_card_trigger(EffectTrigger(TriggerType::ON_CARD_DRAW), action.player_id, *drawn, std::nullopt);
    }
    return OperationResult::ok();
}

OperationResult Game::apply_play_card(const GameAction& action) {
    if (!action.card_id) {
        return OperationResult::fail("No card specified");
    }
    const CardID& card_id = *action.card_id;

    Player* player = get_player(action.player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }
    if (!player->hand_contains(card_id)) {
        return OperationResult::fail("Card not in hand");
    }
    const Card* card = get_card(card_id);
    if (!card) {
        return OperationResult::fail("Card not found in database");
    }

    bool benched = false;
    if (card->is_trainer()) {
        player->discard_from_hand(card_id);
    } else if (card->is_basic_pokemon()) {
        if (player->bench.size() >= Player::MAX_BENCH_SIZE) {
            return OperationResult::fail("Bench is full");
        }
        player->bench_pokemon(card_id);
        benched = true;
    } else if (card->is_pokemon()) {
        return OperationResult::fail("Only Basic Pokemon can be played to the bench");
    } else {
        return OperationResult::fail("Energy cards are attached, not played");
    }

    add_event(GameEvent::card_played(action.player_id, card_id));
    if (benched) {
        add_event(GameEvent::pokemon_benched(action.player_id, card_id));
        fire_card_trigger(EffectTrigger(TriggerType::ON_ENTER_PLAY), action.player_id, card_id, action.target_id);
    }
    fire_card_trigger(EffectTrigger(TriggerType::ON_PLAY), action.player_id, card_id, action.target_id);
    return OperationResult::ok();
}

OperationResult Game::apply_attach_energy(const GameAction& action) {
    if (!action.card_id || !action.target_id) {
        return OperationResult::fail("Energy and target Pokemon must be specified");
    }
    Player* player = get_player(action.player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }
    const Card* card = get_card(*action.card_id);
    if (!card) {
        return OperationResult::fail("Card not found in database");
    }
    if (!card->is_energy()) {
        return OperationResult::fail("Card is not an energy");
    }
    if (!player->attach_energy(*action.card_id, *action.target_id)) {
        return OperationResult::fail("Energy card not in hand or target Pokemon not in play");
    }

    player->energy_attached_this_turn = true;
    add_event(GameEvent::energy_attached(action.player_id, *action.card_id, *action.target_id));
    fire_card_trigger(EffectTrigger(TriggerType::ON_ENERGY_ATTACH), action.player_id,
                      *action.target_id, action.card_id);
    return OperationResult::ok();
}

// ============================================================================
// ATTACK
// ============================================================================

int Game::calculate_attack_damage(const PlayerID& attacker_owner, const CardID& attacker_id,
                                  const Attack& attack, const CardID& defender_id,
                                  const std::vector<bool>& coin_results) const {
    const Player* player = get_player(attacker_owner);
    int energy_count = player ? static_cast<int>(player->get_attached_energy_count(attacker_id)) : 0;
    int damage = attack.calculate_damage(energy_count, coin_results);
    if (damage <= 0) {
        return 0;
    }

    // Attacking type: the Pokemon's own type, else the first typed cost
    std::optional<EnergyType> attacking_type;
    const Card* attacker = get_card(attacker_id);
    if (attacker && attacker->pokemon_data()) {
        attacking_type = attacker->pokemon_data()->pokemon_type;
    }
    if (!attacking_type) {
        for (EnergyType type : attack.cost) {
            if (type != EnergyType::COLORLESS) {
                attacking_type = type;
                break;
            }
        }
    }

    const Card* defender = get_card(defender_id);
    if (attacking_type && defender && defender->pokemon_data()) {
        const PokemonData* data = defender->pokemon_data();
        if (data->weakness && *data->weakness == *attacking_type) {
            damage *= WEAKNESS_MULTIPLIER;
        }
        if (data->resistance && *data->resistance == *attacking_type) {
            damage = std::max(0, damage - RESISTANCE_REDUCTION);
        }
    }
    return damage;
}

bool Game::resolve_knockout(const PlayerID& owner_id, const CardID& pokemon_id) {
    Player* owner = get_player(owner_id);
    const Card* card = get_card(pokemon_id);
    if (!owner || !card || !owner->is_in_play(pokemon_id)) {
        return false;
    }
    if (!owner->is_pokemon_knocked_out(pokemon_id, *card)) {
        return false;
    }

    fire_card_trigger(EffectTrigger(TriggerType::ON_KNOCK_OUT), owner_id, pokemon_id, std::nullopt);
    owner->knock_out_pokemon(pokemon_id);
    if (effect_manager_) {
        effect_manager_->remove_card_effects(pokemon_id);
    }

    auto opponent_id = get_opponent_id(owner_id);
    add_event(GameEvent::pokemon_knocked_out(opponent_id.value_or(owner_id), pokemon_id));
    log_info("Game", card->name + " (" + pokemon_id + ") was knocked out");

    if (opponent_id) {
        Player* opponent = get_player(*opponent_id);
        if (opponent && opponent->take_prize_card()) {
            add_event(GameEvent::prize_taken(*opponent_id));
        }
    }
    return true;
}

OperationResult Game::apply_use_attack(const GameAction& action) {
    if (!action.card_id || !action.attack_index) {
        return OperationResult::fail("Attacker and attack must be specified");
    }
    const CardID& attacker_id = *action.card_id;

    Player* player = get_player(action.player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }
    if (!player->active_pokemon || *player->active_pokemon != attacker_id) {
        return OperationResult::fail("Attacker Pokemon is not active");
    }
    if (!player->can_pokemon_attack(attacker_id)) {
        return OperationResult::fail("Pokemon cannot attack while Paralyzed or Asleep");
    }
    const Card* attacker = get_card(attacker_id);
    if (!attacker || *action.attack_index >= attacker->attacks.size()) {
        return OperationResult::fail("Invalid attack");
    }
    const Attack attack = attacker->attacks[*action.attack_index];

    auto opponent_id = get_opponent_id(action.player_id);
    Player* opponent = opponent_id ? get_player(*opponent_id) : nullptr;
    if (!opponent) {
        return OperationResult::fail("Target player not found");
    }

    CardID defender_id;
    if (action.target_id) {
        if (!opponent->is_in_play(*action.target_id)) {
            return OperationResult::fail("Target Pokemon is not in play");
        }
        defender_id = *action.target_id;
    } else if (opponent->active_pokemon) {
        defender_id = *opponent->active_pokemon;
    } else {
        return OperationResult::fail("No defending Pokemon");
    }

    // Resolve
    std::vector<bool> coins = flip_coins(attack.required_flips());
    int damage = calculate_attack_damage(action.player_id, attacker_id, attack, defender_id, coins);

    player->has_attacked = true;
    add_event(GameEvent::attack_used(action.player_id, attacker_id, attack.name));

    if (damage > 0) {
        opponent->add_damage(defender_id, damage);
        add_event(GameEvent::damage_dealt(action.player_id, defender_id, damage));
    }

    std::uniform_int_distribution<int> percent(1, 100);
    for (const auto& status : attack.status_effects) {
        bool hits = status.probability >= 100 || percent(rng_) <= status.probability;
        if (!hits) continue;

        if (status.target == "self") {
            player->add_special_condition(attacker_id, status.condition, -1, turn_number);
        } else if (opponent->is_in_play(defender_id)) {
            opponent->add_special_condition(defender_id, status.condition, -1, turn_number);
        }
    }

    fire_card_trigger(EffectTrigger(TriggerType::ON_ATTACK), action.player_id, attacker_id, defender_id);

    resolve_knockout(*opponent_id, defender_id);
    check_win_conditions();
    return OperationResult::ok();
}

// ============================================================================
// RETREAT AND END TURN
// ============================================================================

OperationResult Game::apply_retreat(const GameAction& action) {
    if (!action.card_id) {
        return OperationResult::fail("No bench Pokemon specified");
    }
    Player* player = get_player(action.player_id);
    if (!player) {
        return OperationResult::fail("Player not found");
    }
    if (!player->active_pokemon) {
        return OperationResult::fail("No active Pokemon to retreat");
    }
    const CardID active_id = *player->active_pokemon;
    if (!player->can_pokemon_retreat(active_id)) {
        return OperationResult::fail("Active Pokemon is trapped and cannot retreat");
    }

    const Card* active = get_card(active_id);
    int cost = active && active->pokemon_data() ? active->pokemon_data()->retreat_cost : 0;
    if (static_cast<int>(player->get_attached_energy_count(active_id)) < cost) {
        return OperationResult::fail("Not enough energy to retreat");
    }
    if (!player->retreat(*action.card_id, cost)) {
        return OperationResult::fail("Retreat target is not on the bench");
    }

    fire_card_trigger(EffectTrigger(TriggerType::ON_LEAVE_PLAY), action.player_id, active_id, std::nullopt);
    log_info("Action", "Player " + action.player_id + " retreated " + active_id);
    return OperationResult::ok();
}

OperationResult Game::apply_end_turn(const GameAction& action) {
    if (turn_order.empty()) {
        return OperationResult::fail("Turn order has not been set");
    }

    add_event(GameEvent::turn_ended(action.player_id));

    current_player_index = (current_player_index + 1) % turn_order.size();
    turn_number++;
    phase = TurnPhase::BEGINNING_OF_TURN;

    Player* next = get_player(turn_order[current_player_index]);
    if (next) {
        next->start_turn();
    }
    return OperationResult::ok();
}

// ============================================================================
// EFFECT TRIGGERS
// ============================================================================

void Game::fire_card_trigger(const EffectTrigger& trigger, const PlayerID& controller,
                             const CardID& card_id, const std::optional<CardID>& target) {
    if (!effect_manager_ || !effect_manager_->has_effects(card_id)) {
        return;
    }

    EffectContext context;
    context.controller = controller;
    context.target = target ? EffectTarget::card(*target) : EffectTarget::self();

    for (const auto& result : effect_manager_->trigger_card_effects(*this, card_id, trigger, context)) {
        if (!result.success && result.error) {
            log_error("Effects", result.effect_id + " on " + card_id + ": " + result.error->to_string());
        }
    }
}

} // namespace ptcg
