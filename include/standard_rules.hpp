/**
 * PTCG Core - Standard Rules
 *
 * Stock rule set. create_engine() installs the core checks (turn order,
 * hand limit, energy attachment); create_full_engine() adds the
 * game-in-progress and attack checks.
 */

#pragma once

#include "rule_engine.hpp"

namespace ptcg {
namespace rules {

/**
 * The acting player must be the current player.
 */
class TurnOrderRule : public Rule {
public:
    std::string name() const override { return "TurnOrder"; }
    std::optional<RuleViolation> validate_action(const Game& game, const GameAction& action) const override;
};

/**
 * DrawCard is refused once the hand holds max_hand_size cards. Without an
 * explicit limit the game's rules.max_hand_size is used.
 */
class HandLimitRule : public Rule {
public:
    explicit HandLimitRule(std::optional<int> max_hand_size = std::nullopt)
        : max_hand_size_(max_hand_size) {}

    std::string name() const override { return "HandLimit"; }
    std::optional<RuleViolation> validate_action(const Game& game, const GameAction& action) const override;

private:
    std::optional<int> max_hand_size_;
};

/**
 * AttachEnergy needs an energy card from hand and a target in play.
 */
class EnergyAttachmentRule : public Rule {
public:
    std::string name() const override { return "EnergyAttachment"; }
    std::optional<RuleViolation> validate_action(const Game& game, const GameAction& action) const override;
};

/**
 * Actions are only accepted while the game is in progress.
 */
class GameInProgressRule : public Rule {
public:
    std::string name() const override { return "GameInProgress"; }
    std::optional<RuleViolation> validate_action(const Game& game, const GameAction& action) const override;
};

/**
 * UseAttack: the attacker is the actor's active Pokemon, can attack,
 * names a valid attack and has the energy for it; one attack per turn.
 */
class AttackRule : public Rule {
public:
    std::string name() const override { return "Attack"; }
    std::optional<RuleViolation> validate_action(const Game& game, const GameAction& action) const override;
};

class StandardRules {
public:
    /**
     * TurnOrder, HandLimit (only when a limit is given) and EnergyAttachment.
     */
    static RuleEngine create_engine(std::optional<int> max_hand_size = std::nullopt,
                                    RuleConfig config = RuleConfig{});

    /**
     * create_engine() plus GameInProgress and Attack.
     */
    static RuleEngine create_full_engine(std::optional<int> max_hand_size = std::nullopt,
                                         RuleConfig config = RuleConfig{});
};

} // namespace rules
} // namespace ptcg
