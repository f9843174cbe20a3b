/**
 * PTCG Core - Match Configuration
 *
 * JSON configuration for a match using nlohmann/json:
 *
 *   {
 *     "rules": {"format", "prize_cards", "max_hand_size", "turn_time_limit", "auto_shuffle"},
 *     "rule_engine": {"stop_on_first_violation", "auto_apply_effects", "min_severity"},
 *     "seed": 42,
 *     "verbose": false
 *   }
 *
 * Every key is optional; missing keys keep their defaults.
 */

#pragma once

#include "game.hpp"
#include "rule_engine.hpp"
#include <nlohmann/json_fwd.hpp>

namespace ptcg {

struct MatchConfig {
    GameRules rules;
    RuleConfig rule_engine;
    std::optional<uint32_t> seed;
    bool verbose = false;

    bool operator==(const MatchConfig& other) const {
        return rules == other.rules && rule_engine == other.rule_engine &&
               seed == other.seed && verbose == other.verbose;
    }
};

/**
 * Parse a config from JSON text.
 *
 * @return nullopt on malformed JSON or a value of the wrong type
 */
std::optional<MatchConfig> parse_config(const std::string& json_text);

/**
 * Load a config file. Logs and returns nullopt when the file cannot be
 * opened or parsed.
 */
std::optional<MatchConfig> load_config_file(const std::string& filepath);

/**
 * Build a Game from a config: rules, seed and verbosity.
 */
Game make_game(const MatchConfig& config, const std::string& game_id = "game");

std::optional<ViolationSeverity> parse_severity(const std::string& text);

// nlohmann/json ADL hooks
void to_json(nlohmann::json& j, const GameRules& rules);
void from_json(const nlohmann::json& j, GameRules& rules);
void to_json(nlohmann::json& j, const RuleConfig& config);
void from_json(const nlohmann::json& j, RuleConfig& config);
void to_json(nlohmann::json& j, const MatchConfig& config);
void from_json(const nlohmann::json& j, MatchConfig& config);

} // namespace ptcg
