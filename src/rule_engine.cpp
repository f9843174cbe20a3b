/**
 * PTCG Core - Rule Engine Implementation
 */

#include "rule_engine.hpp"
#include <algorithm>

namespace ptcg {

void RuleEngine::add_rule(std::shared_ptr<Rule> rule) {
    if (rule) {
        rules_.push_back(std::move(rule));
    }
}

bool RuleEngine::remove_rule(const std::string& rule_name) {
    auto before = rules_.size();
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&](const auto& rule) { return rule->name() == rule_name; }),
                 rules_.end());
    return rules_.size() != before;
}

std::vector<RuleViolation> RuleEngine::validate_action(const Game& game, const GameAction& action) const {
    std::vector<RuleViolation> violations;

    for (const auto& rule : rules_) {
        auto violation = rule->validate_action(game, action);
        if (!violation) continue;

        if (static_cast<uint8_t>(violation->severity) < static_cast<uint8_t>(config_.min_severity)) {
            continue;
        }
        violations.push_back(std::move(*violation));
        if (config_.stop_on_first_violation) {
            break;
        }
    }
    return violations;
}

std::optional<RuleViolation> RuleEngine::apply_effects(Game& game, const GameAction& action) const {
    for (const auto& rule : rules_) {
        auto violation = rule->apply_effect(game, action);
        if (violation) {
            return violation;
        }
    }
    return std::nullopt;
}

ActionResult RuleEngine::apply_action(Game& game, const GameAction& action) const {
    ActionResult result;
    result.violations = validate_action(game, action);
    if (result.has_blocking_violation()) {
        return result;
    }

    if (config_.auto_apply_effects) {
        auto violation = apply_effects(game, action);
        if (violation) {
            result.violations = {*violation};
            return result;
        }
    }

    result.success = true;
    return result;
}

std::vector<std::string> RuleEngine::get_rule_names() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.push_back(rule->name());
    }
    return names;
}

bool RuleEngine::has_rule(const std::string& rule_name) const {
    return std::any_of(rules_.begin(), rules_.end(),
                       [&](const auto& rule) { return rule->name() == rule_name; });
}

} // namespace ptcg
