/**
 * PTCG Core - Rule Engine
 *
 * Ordered list of pluggable rules. Validation is a pure function of
 * (Game, GameAction); rules may also carry an effect hook that runs after
 * an action passes validation.
 */

#pragma once

#include "rule_violation.hpp"
#include "game_action.hpp"

namespace ptcg {

class Game;

// ============================================================================
// RULE INTERFACE
// ============================================================================

/**
 * Rule - One named check.
 *
 * validate_action must not mutate anything. apply_effect defaults to a
 * no-op.
 */
class Rule {
public:
    virtual ~Rule() = default;

    virtual std::string name() const = 0;

    virtual std::optional<RuleViolation> validate_action(const Game& game,
                                                         const GameAction& action) const = 0;

    virtual std::optional<RuleViolation> apply_effect(Game& /*game*/,
                                                      const GameAction& /*action*/) const {
        return std::nullopt;
    }
};

// ============================================================================
// CONFIGURATION
// ============================================================================

struct RuleConfig {
    bool stop_on_first_violation = false;
    bool auto_apply_effects = true;
    ViolationSeverity min_severity = ViolationSeverity::WARNING;

    bool operator==(const RuleConfig& other) const {
        return stop_on_first_violation == other.stop_on_first_violation &&
               auto_apply_effects == other.auto_apply_effects &&
               min_severity == other.min_severity;
    }
};

// ============================================================================
// RULE ENGINE
// ============================================================================

class RuleEngine {
public:
    explicit RuleEngine(RuleConfig config = RuleConfig{}) : config_(config) {}

    void add_rule(std::shared_ptr<Rule> rule);

    /**
     * Remove every rule with the given name.
     *
     * @return true if any rule was removed
     */
    bool remove_rule(const std::string& rule_name);

    /**
     * Run every rule in order. Violations below min_severity are dropped;
     * with stop_on_first_violation the first kept violation ends the scan.
     */
    std::vector<RuleViolation> validate_action(const Game& game, const GameAction& action) const;

    /**
     * Run each rule's effect hook in order; stops at the first failure.
     */
    std::optional<RuleViolation> apply_effects(Game& game, const GameAction& action) const;

    /**
     * Validate, then (when auto_apply_effects) run the effect hooks. Blocks
     * on any ERROR or FATAL violation.
     */
    ActionResult apply_action(Game& game, const GameAction& action) const;

    std::vector<std::string> get_rule_names() const;
    bool has_rule(const std::string& rule_name) const;
    size_t rule_count() const { return rules_.size(); }

    const RuleConfig& config() const { return config_; }
    void set_config(const RuleConfig& config) { config_ = config; }

private:
    std::vector<std::shared_ptr<Rule>> rules_;
    RuleConfig config_;
};

} // namespace ptcg
