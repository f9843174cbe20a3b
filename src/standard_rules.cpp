/**
 * PTCG Core - Standard Rules Implementation
 */

#include "standard_rules.hpp"
#include "game.hpp"

namespace ptcg {
namespace rules {

namespace {

RuleViolation error(const std::string& rule, const std::string& message) {
    return RuleViolation(rule, message, ViolationSeverity::ERROR);
}

} // namespace

// ============================================================================
// TURN ORDER
// ============================================================================

std::optional<RuleViolation> TurnOrderRule::validate_action(const Game& game,
                                                            const GameAction& action) const {
    if (!game.is_player_turn(action.player_id)) {
        return error(name(), "Not your turn");
    }
    return std::nullopt;
}

// ============================================================================
// HAND LIMIT
// ============================================================================

std::optional<RuleViolation> HandLimitRule::validate_action(const Game& game,
                                                            const GameAction& action) const {
    if (action.action_type != ActionType::DRAW_CARD) {
        return std::nullopt;
    }

    std::optional<int> limit = max_hand_size_ ? max_hand_size_ : game.rules.max_hand_size;
    const Player* player = game.get_player(action.player_id);
    if (!limit || !player) {
        return std::nullopt;
    }

    if (static_cast<int>(player->hand.size()) >= *limit) {
        return error(name(), "Hand size limit exceeded (" + std::to_string(*limit) + ")");
    }
    return std::nullopt;
}

// ============================================================================
// ENERGY ATTACHMENT
// ============================================================================

std::optional<RuleViolation> EnergyAttachmentRule::validate_action(const Game& game,
                                                                   const GameAction& action) const {
    if (action.action_type != ActionType::ATTACH_ENERGY) {
        return std::nullopt;
    }
    const Player* player = game.get_player(action.player_id);
    if (!player) {
        return std::nullopt;
    }

    if (!action.card_id || !player->hand_contains(*action.card_id)) {
        return error(name(), "Energy card not in hand");
    }
    if (!action.target_id || !player->is_in_play(*action.target_id)) {
        return error(name(), "Target Pokemon not found");
    }

    const Card* card = game.get_card(*action.card_id);
    if (card && !card->is_energy()) {
        return error(name(), "Card is not an energy");
    }
    return std::nullopt;
}

// ============================================================================
// GAME IN PROGRESS
// ============================================================================

std::optional<RuleViolation> GameInProgressRule::validate_action(const Game& game,
                                                                 const GameAction& /*action*/) const {
    if (game.state != GameStatus::IN_PROGRESS) {
        return RuleViolation(name(), std::string("Game is not in progress (") + to_string(game.state) + ")",
                             ViolationSeverity::FATAL);
    }
    return std::nullopt;
}

// ============================================================================
// ATTACK
// ============================================================================

std::optional<RuleViolation> AttackRule::validate_action(const Game& game,
                                                         const GameAction& action) const {
    if (action.action_type != ActionType::USE_ATTACK) {
        return std::nullopt;
    }
    const Player* player = game.get_player(action.player_id);
    if (!player) {
        return error(name(), "Player not found");
    }
    if (player->has_attacked) {
        return error(name(), "Already attacked this turn");
    }
    if (!action.card_id || !player->active_pokemon || *player->active_pokemon != *action.card_id) {
        return error(name(), "Only the active Pokemon can attack");
    }
    if (!player->can_pokemon_attack(*action.card_id)) {
        return error(name(), "Pokemon cannot attack while Paralyzed or Asleep");
    }

    const Card* card = game.get_card(*action.card_id);
    if (!card || !action.attack_index || *action.attack_index >= card->attacks.size()) {
        return error(name(), "Invalid attack");
    }

    const Attack& attack = card->attacks[*action.attack_index];
    auto energy = player->get_attached_energy_types(*action.card_id, game.card_database);
    if (!Card::can_pay_cost(attack.cost, energy)) {
        return error(name(), "Not enough energy for " + attack.name);
    }
    return std::nullopt;
}

// ============================================================================
// FACTORIES
// ============================================================================

RuleEngine StandardRules::create_engine(std::optional<int> max_hand_size, RuleConfig config) {
    RuleEngine engine(config);
    engine.add_rule(std::make_shared<TurnOrderRule>());
    if (max_hand_size) {
        engine.add_rule(std::make_shared<HandLimitRule>(max_hand_size));
    }
    engine.add_rule(std::make_shared<EnergyAttachmentRule>());
    return engine;
}

RuleEngine StandardRules::create_full_engine(std::optional<int> max_hand_size, RuleConfig config) {
    RuleEngine engine = create_engine(max_hand_size, config);
    engine.add_rule(std::make_shared<GameInProgressRule>());
    engine.add_rule(std::make_shared<AttackRule>());
    return engine;
}

} // namespace rules
} // namespace ptcg
