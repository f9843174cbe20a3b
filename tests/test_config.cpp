/**
 * Tests for match configuration, event serialization and the match logger
 */

#include <sstream>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "test_fixtures.hpp"
#include "game_config.hpp"
#include "event_serialization.hpp"
#include "match_logger.hpp"

using namespace ptcg;
using namespace ptcg::testing;

namespace {

std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::string scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("ptcg_core_tests_" + name);
    std::filesystem::remove_all(dir);
    return dir.string();
}

} // namespace

// ============================================================================
// MATCH CONFIG TESTS
// ============================================================================

TEST(MatchConfig, EmptyObjectKeepsDefaults) {
    auto config = parse_config("{}");
    TEST_ASSERT_TRUE(config.has_value());
    TEST_ASSERT_TRUE(*config == MatchConfig{});
    TEST_ASSERT_EQ(std::string("Standard"), config->rules.format);
    TEST_ASSERT_EQ(6, config->rules.prize_cards);
    TEST_ASSERT_FALSE(config->rules.max_hand_size.has_value());
    TEST_ASSERT_FALSE(config->seed.has_value());
}

TEST(MatchConfig, FullDocument) {
    auto config = parse_config(R"({
        "rules": {"format": "Expanded", "prize_cards": 4, "max_hand_size": 10,
                  "turn_time_limit": null, "auto_shuffle": false},
        "rule_engine": {"stop_on_first_violation": true, "auto_apply_effects": false,
                        "min_severity": "Error"},
        "seed": 42,
        "verbose": true
    })");
    TEST_ASSERT_TRUE(config.has_value());
    TEST_ASSERT_EQ(std::string("Expanded"), config->rules.format);
    TEST_ASSERT_EQ(4, config->rules.prize_cards);
    TEST_ASSERT_EQ(10, config->rules.max_hand_size.value_or(0));
    TEST_ASSERT_FALSE(config->rules.turn_time_limit.has_value());
    TEST_ASSERT_FALSE(config->rules.auto_shuffle);
    TEST_ASSERT_TRUE(config->rule_engine.stop_on_first_violation);
    TEST_ASSERT_FALSE(config->rule_engine.auto_apply_effects);
    TEST_ASSERT(config->rule_engine.min_severity == ViolationSeverity::ERROR);
    TEST_ASSERT_EQ(42u, config->seed.value_or(0));
    TEST_ASSERT_TRUE(config->verbose);
}

TEST(MatchConfig, RejectsBadInput) {
    TEST_ASSERT_FALSE(parse_config("{ not json").has_value());
    TEST_ASSERT_FALSE(parse_config("[1, 2]").has_value());
    TEST_ASSERT_FALSE(parse_config(R"({"rules": {"prize_cards": "six"}})").has_value());
    TEST_ASSERT_FALSE(parse_config(R"({"rule_engine": {"min_severity": "loud"}})").has_value());
}

TEST(MatchConfig, JsonRoundTrip) {
    MatchConfig config;
    config.rules.format = "Expanded";
    config.rules.max_hand_size = 8;
    config.rule_engine.min_severity = ViolationSeverity::FATAL;
    config.seed = 99;

    nlohmann::json j = config;
    TEST_ASSERT_EQ(std::string("Fatal"), j["rule_engine"]["min_severity"].get<std::string>());
    TEST_ASSERT_TRUE(j["rules"]["turn_time_limit"].is_null());

    auto parsed = parse_config(j.dump());
    TEST_ASSERT_TRUE(parsed.has_value());
    TEST_ASSERT_TRUE(*parsed == config);
}

TEST(MatchConfig, SeverityNames) {
    TEST_ASSERT(parse_severity("warning") == ViolationSeverity::WARNING);
    TEST_ASSERT(parse_severity("ERROR") == ViolationSeverity::ERROR);
    TEST_ASSERT(parse_severity("Fatal") == ViolationSeverity::FATAL);
    TEST_ASSERT_FALSE(parse_severity("info").has_value());
}

TEST(MatchConfig, LoadFromFile) {
    std::string dir = scratch_dir("config");
    std::filesystem::create_directories(dir);
    std::string path = dir + "/match.json";
    {
        std::ofstream out(path);
        out << R"({"rules": {"prize_cards": 3}, "seed": 5})";
    }

    auto config = load_config_file(path);
    TEST_ASSERT_TRUE(config.has_value());
    TEST_ASSERT_EQ(3, config->rules.prize_cards);
    TEST_ASSERT_FALSE(load_config_file(dir + "/missing.json").has_value());

    std::filesystem::remove_all(dir);
}

TEST(MatchConfig, MakeGameAppliesSettings) {
    MatchConfig config;
    config.rules.prize_cards = 4;
    config.seed = 3;
    config.verbose = true;

    Game game = make_game(config, "configured");
    TEST_ASSERT_EQ(std::string("configured"), game.id);
    TEST_ASSERT_EQ(4, game.rules.prize_cards);
    TEST_ASSERT_TRUE(game.is_verbose());
    TEST_ASSERT(game.state == GameStatus::SETUP);

    // Same seed, same coin flips
    Game twin = make_game(config, "twin");
    TEST_ASSERT_TRUE(game.flip_coins(16) == twin.flip_coins(16));
}

// ============================================================================
// EVENT SERIALIZATION TESTS
// ============================================================================

TEST(EventJson, FieldsPerType) {
    GameEvent attach = GameEvent::energy_attached("alice", "alice/lightning#3", "alice/pikachu#1");
    nlohmann::json j = event_to_json(attach);
    TEST_ASSERT_EQ(std::string("EnergyAttached"), j["type"].get<std::string>());
    TEST_ASSERT_EQ(std::string("alice/lightning#3"), j["energy"].get<std::string>());
    TEST_ASSERT_EQ(std::string("alice/pikachu#1"), j["pokemon"].get<std::string>());
    TEST_ASSERT_FALSE(j.contains("damage"));

    nlohmann::json empty_draw = event_to_json(GameEvent::card_drawn("bob", std::nullopt));
    TEST_ASSERT_TRUE(empty_draw["card"].is_null());
}

TEST(EventJson, ParseBack) {
    GameEvent damage = GameEvent::damage_dealt("alice", "bob/pikachu#1", 40);
    auto parsed = event_from_json(event_to_json(damage));
    TEST_ASSERT_TRUE(parsed.has_value());
    TEST_ASSERT_TRUE(parsed->same_content(damage));

    auto ended = event_from_json(event_to_json(GameEvent::game_ended(std::nullopt)));
    TEST_ASSERT_TRUE(ended.has_value());
    TEST_ASSERT_FALSE(ended->winner.has_value());
}

TEST(EventJson, RejectsUnknownEntries) {
    TEST_ASSERT_FALSE(event_from_json(nlohmann::json{{"type", "Teleported"}}).has_value());
    TEST_ASSERT_FALSE(event_from_json(nlohmann::json::array()).has_value());
    TEST_ASSERT_FALSE(event_from_json(nlohmann::json{{"type", "DamageDealt"}, {"damage", "lots"}}).has_value());
    TEST_ASSERT_FALSE(event_type_from_string("").has_value());
}

TEST(EventJson, HistoryOfRealGame) {
    StartedGame started;
    started.game.end_turn();

    std::string text = history_to_json(started.game.history).dump();
    auto history = history_from_json(text);
    TEST_ASSERT_TRUE(history.has_value());
    TEST_ASSERT_EQ(started.game.history.size(), history->size());
    for (size_t i = 0; i < history->size(); i++) {
        TEST_ASSERT_TRUE((*history)[i].same_content(started.game.history[i]));
        TEST_ASSERT_EQ(started.game.history[i].sequence, (*history)[i].sequence);
    }

    TEST_ASSERT_FALSE(history_from_json("{}").has_value());
    TEST_ASSERT_FALSE(history_from_json("[{\"type\": 7}]").has_value());
    TEST_ASSERT_FALSE(history_from_json("[").has_value());
}

// ============================================================================
// MATCH LOGGER TESTS
// ============================================================================

TEST(MatchLogger, TracesEventsAndState) {
    std::string dir = scratch_dir("logger");
    std::string path;
    {
        StartedGame started;
        auto logger = std::make_shared<MatchLogger>(dir, &started.game.card_database);
        TEST_ASSERT_TRUE(logger->is_enabled());
        path = logger->get_log_path();
        started.game.register_handler(logger);

        started.game.end_turn();
        TEST_ASSERT_TRUE(logger->events_logged() >= 3);
        logger->log_state(started.game);
        started.game.end_game(std::string("alice"));
    }

    std::string text = read_text_file(path);
    TEST_ASSERT_TRUE(text.find("MATCH LOG - EVENT TRACE") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("TurnEnded") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("[PLAYER alice]") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Pikachu (alice/pikachu@active)") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Winner: Player alice") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(MatchLogger, DisabledLoggerWritesNothing) {
    std::string dir = scratch_dir("logger_disabled");
    MatchLogger logger(dir);
    logger.set_enabled(false);
    logger.handle_event(GameEvent::turn_ended("alice"));
    TEST_ASSERT_EQ(0u, logger.events_logged());
    std::filesystem::remove_all(dir);
}
