/**
 * PTCG Core - Match Configuration Implementation
 *
 * Reads and writes match configs with nlohmann/json.
 */

#include "game_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace ptcg {

std::optional<ViolationSeverity> parse_severity(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") return ViolationSeverity::WARNING;
    if (lower == "error") return ViolationSeverity::ERROR;
    if (lower == "fatal") return ViolationSeverity::FATAL;
    return std::nullopt;
}

// ============================================================================
// GAME RULES
// ============================================================================

void to_json(json& j, const GameRules& rules) {
    j = json{
        {"format", rules.format},
        {"prize_cards", rules.prize_cards},
        {"auto_shuffle", rules.auto_shuffle}
    };
    j["max_hand_size"] = rules.max_hand_size ? json(*rules.max_hand_size) : json(nullptr);
    j["turn_time_limit"] = rules.turn_time_limit ? json(*rules.turn_time_limit) : json(nullptr);
}

void from_json(const json& j, GameRules& rules) {
    GameRules defaults;
    rules.format = j.value("format", defaults.format);
    rules.prize_cards = j.value("prize_cards", defaults.prize_cards);
    rules.auto_shuffle = j.value("auto_shuffle", defaults.auto_shuffle);

    // Optional limits: absent or null means "no limit"
    rules.max_hand_size.reset();
    if (j.contains("max_hand_size") && !j["max_hand_size"].is_null()) {
        rules.max_hand_size = j["max_hand_size"].get<int>();
    }
    rules.turn_time_limit.reset();
    if (j.contains("turn_time_limit") && !j["turn_time_limit"].is_null()) {
        rules.turn_time_limit = j["turn_time_limit"].get<int>();
    }
}

// ============================================================================
// RULE ENGINE CONFIG
// ============================================================================

void to_json(json& j, const RuleConfig& config) {
    j = json{
        {"stop_on_first_violation", config.stop_on_first_violation},
        {"auto_apply_effects", config.auto_apply_effects},
        {"min_severity", to_string(config.min_severity)}
    };
}

void from_json(const json& j, RuleConfig& config) {
    RuleConfig defaults;
    config.stop_on_first_violation = j.value("stop_on_first_violation", defaults.stop_on_first_violation);
    config.auto_apply_effects = j.value("auto_apply_effects", defaults.auto_apply_effects);
    config.min_severity = defaults.min_severity;

    if (j.contains("min_severity")) {
        std::string text = j["min_severity"].get<std::string>();
        auto severity = parse_severity(text);
        if (!severity) {
            throw std::invalid_argument("Unknown severity: " + text);
        }
        config.min_severity = *severity;
    }
}

// ============================================================================
// MATCH CONFIG
// ============================================================================

void to_json(json& j, const MatchConfig& config) {
    j = json{
        {"rules", config.rules},
        {"rule_engine", config.rule_engine},
        {"verbose", config.verbose}
    };
    if (config.seed) {
        j["seed"] = *config.seed;
    }
}

void from_json(const json& j, MatchConfig& config) {
    config = MatchConfig{};
    if (j.contains("rules")) {
        config.rules = j["rules"].get<GameRules>();
    }
    if (j.contains("rule_engine")) {
        config.rule_engine = j["rule_engine"].get<RuleConfig>();
    }
    if (j.contains("seed") && !j["seed"].is_null()) {
        config.seed = j["seed"].get<uint32_t>();
    }
    config.verbose = j.value("verbose", false);
}

// ============================================================================
// LOADING
// ============================================================================

std::optional<MatchConfig> parse_config(const std::string& json_text) {
    try {
        json data = json::parse(json_text);
        if (!data.is_object()) {
            std::cerr << "[Config] Expected a JSON object" << std::endl;
            return std::nullopt;
        }
        return data.get<MatchConfig>();

    } catch (const json::exception& e) {
        std::cerr << "[Config] JSON error: " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<MatchConfig> load_config_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << filepath << std::endl;
        return std::nullopt;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse_config(text);
}

Game make_game(const MatchConfig& config, const std::string& game_id) {
    Game game(config.rules, config.seed, game_id);
    game.set_verbose(config.verbose);
    return game;
}

} // namespace ptcg
