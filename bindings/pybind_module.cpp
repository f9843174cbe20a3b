/**
 * PTCG Core - Python Bindings
 *
 * pybind11 wrapper for the rules core: cards, decks, players, the game
 * state machine, the rule engine with the stock rules and the effect
 * manager with host-supplied callback effects.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pybind11/functional.h>
#include <nlohmann/json.hpp>

#include "ptcg_core.hpp"

namespace py = pybind11;

PYBIND11_MODULE(ptcg_core_py, m) {
    m.doc() = "Pokemon TCG rules core";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<ptcg::EnergyType>(m, "EnergyType")
        .value("GRASS", ptcg::EnergyType::GRASS)
        .value("FIRE", ptcg::EnergyType::FIRE)
        .value("WATER", ptcg::EnergyType::WATER)
        .value("LIGHTNING", ptcg::EnergyType::LIGHTNING)
        .value("PSYCHIC", ptcg::EnergyType::PSYCHIC)
        .value("FIGHTING", ptcg::EnergyType::FIGHTING)
        .value("DARKNESS", ptcg::EnergyType::DARKNESS)
        .value("METAL", ptcg::EnergyType::METAL)
        .value("FAIRY", ptcg::EnergyType::FAIRY)
        .value("DRAGON", ptcg::EnergyType::DRAGON)
        .value("COLORLESS", ptcg::EnergyType::COLORLESS)
        .export_values();

    py::enum_<ptcg::EvolutionStage>(m, "EvolutionStage")
        .value("BASIC", ptcg::EvolutionStage::BASIC)
        .value("STAGE_1", ptcg::EvolutionStage::STAGE_1)
        .value("STAGE_2", ptcg::EvolutionStage::STAGE_2)
        .value("MEGA", ptcg::EvolutionStage::MEGA)
        .value("GX", ptcg::EvolutionStage::GX)
        .value("EX", ptcg::EvolutionStage::EX)
        .value("V", ptcg::EvolutionStage::V)
        .value("VMAX", ptcg::EvolutionStage::VMAX)
        .export_values();

    py::enum_<ptcg::TrainerType>(m, "TrainerType")
        .value("ITEM", ptcg::TrainerType::ITEM)
        .value("SUPPORTER", ptcg::TrainerType::SUPPORTER)
        .value("STADIUM", ptcg::TrainerType::STADIUM)
        .value("TOOL", ptcg::TrainerType::TOOL)
        .export_values();

    py::enum_<ptcg::GameStatus>(m, "GameStatus")
        .value("SETUP", ptcg::GameStatus::SETUP)
        .value("IN_PROGRESS", ptcg::GameStatus::IN_PROGRESS)
        .value("FINISHED", ptcg::GameStatus::FINISHED)
        .value("CANCELLED", ptcg::GameStatus::CANCELLED)
        .export_values();

    py::enum_<ptcg::TurnPhase>(m, "TurnPhase")
        .value("BEGINNING_OF_TURN", ptcg::TurnPhase::BEGINNING_OF_TURN)
        .value("MAIN", ptcg::TurnPhase::MAIN)
        .value("ATTACK", ptcg::TurnPhase::ATTACK)
        .value("END_OF_TURN", ptcg::TurnPhase::END_OF_TURN)
        .export_values();

    py::enum_<ptcg::SetupPhase>(m, "SetupPhase")
        .value("WAITING_FOR_TURN_ORDER", ptcg::SetupPhase::WAITING_FOR_TURN_ORDER)
        .value("WAITING_FOR_HANDS", ptcg::SetupPhase::WAITING_FOR_HANDS)
        .value("CHECKING_FOR_BASIC_POKEMON", ptcg::SetupPhase::CHECKING_FOR_BASIC_POKEMON)
        .value("MULLIGAN_REQUIRED", ptcg::SetupPhase::MULLIGAN_REQUIRED)
        .value("SELECTING_ACTIVE_POKEMON", ptcg::SetupPhase::SELECTING_ACTIVE_POKEMON)
        .value("SETTING_UP_BENCH", ptcg::SetupPhase::SETTING_UP_BENCH)
        .value("PLACING_PRIZE_CARDS", ptcg::SetupPhase::PLACING_PRIZE_CARDS)
        .value("SETUP_COMPLETE", ptcg::SetupPhase::SETUP_COMPLETE)
        .export_values();

    py::enum_<ptcg::ActionType>(m, "ActionType")
        .value("DRAW_CARD", ptcg::ActionType::DRAW_CARD)
        .value("PLAY_CARD", ptcg::ActionType::PLAY_CARD)
        .value("ATTACH_ENERGY", ptcg::ActionType::ATTACH_ENERGY)
        .value("USE_ATTACK", ptcg::ActionType::USE_ATTACK)
        .value("RETREAT", ptcg::ActionType::RETREAT)
        .value("END_TURN", ptcg::ActionType::END_TURN)
        .value("PASS", ptcg::ActionType::PASS)
        .export_values();

    py::enum_<ptcg::ViolationSeverity>(m, "ViolationSeverity")
        .value("WARNING", ptcg::ViolationSeverity::WARNING)
        .value("ERROR", ptcg::ViolationSeverity::ERROR)
        .value("FATAL", ptcg::ViolationSeverity::FATAL)
        .export_values();

    py::enum_<ptcg::ConditionKind>(m, "ConditionKind")
        .value("POISONED", ptcg::ConditionKind::POISONED)
        .value("BURNED", ptcg::ConditionKind::BURNED)
        .value("PARALYZED", ptcg::ConditionKind::PARALYZED)
        .value("ASLEEP", ptcg::ConditionKind::ASLEEP)
        .value("CONFUSED", ptcg::ConditionKind::CONFUSED)
        .value("TRAPPED", ptcg::ConditionKind::TRAPPED)
        .value("CUSTOM", ptcg::ConditionKind::CUSTOM)
        .export_values();

    py::enum_<ptcg::EventType>(m, "EventType")
        .value("GAME_STARTED", ptcg::EventType::GAME_STARTED)
        .value("TURN_STARTED", ptcg::EventType::TURN_STARTED)
        .value("CARD_DRAWN", ptcg::EventType::CARD_DRAWN)
        .value("CARD_PLAYED", ptcg::EventType::CARD_PLAYED)
        .value("POKEMON_BENCHED", ptcg::EventType::POKEMON_BENCHED)
        .value("ENERGY_ATTACHED", ptcg::EventType::ENERGY_ATTACHED)
        .value("ATTACK_USED", ptcg::EventType::ATTACK_USED)
        .value("DAMAGE_DEALT", ptcg::EventType::DAMAGE_DEALT)
        .value("POKEMON_KNOCKED_OUT", ptcg::EventType::POKEMON_KNOCKED_OUT)
        .value("PRIZE_TAKEN", ptcg::EventType::PRIZE_TAKEN)
        .value("DECK_SHUFFLED", ptcg::EventType::DECK_SHUFFLED)
        .value("TURN_ENDED", ptcg::EventType::TURN_ENDED)
        .value("GAME_ENDED", ptcg::EventType::GAME_ENDED)
        .export_values();

    py::enum_<ptcg::TriggerType>(m, "TriggerType")
        .value("ON_PLAY", ptcg::TriggerType::ON_PLAY)
        .value("ON_ENTER_PLAY", ptcg::TriggerType::ON_ENTER_PLAY)
        .value("ON_LEAVE_PLAY", ptcg::TriggerType::ON_LEAVE_PLAY)
        .value("ON_KNOCK_OUT", ptcg::TriggerType::ON_KNOCK_OUT)
        .value("ON_TURN_START", ptcg::TriggerType::ON_TURN_START)
        .value("ON_TURN_END", ptcg::TriggerType::ON_TURN_END)
        .value("ON_TAKE_DAMAGE", ptcg::TriggerType::ON_TAKE_DAMAGE)
        .value("ON_DEAL_DAMAGE", ptcg::TriggerType::ON_DEAL_DAMAGE)
        .value("ON_ATTACK", ptcg::TriggerType::ON_ATTACK)
        .value("ON_ENERGY_ATTACH", ptcg::TriggerType::ON_ENERGY_ATTACH)
        .value("ON_CARD_DRAW", ptcg::TriggerType::ON_CARD_DRAW)
        .value("ON_GAME_EVENT", ptcg::TriggerType::ON_GAME_EVENT)
        .value("MANUAL", ptcg::TriggerType::MANUAL)
        .value("ONCE", ptcg::TriggerType::ONCE)
        .export_values();

    py::enum_<ptcg::EffectErrorType>(m, "EffectErrorType")
        .value("INVALID_TARGET", ptcg::EffectErrorType::INVALID_TARGET)
        .value("INSUFFICIENT_RESOURCES", ptcg::EffectErrorType::INSUFFICIENT_RESOURCES)
        .value("INVALID_GAME_STATE", ptcg::EffectErrorType::INVALID_GAME_STATE)
        .value("REQUIREMENTS_NOT_MET", ptcg::EffectErrorType::REQUIREMENTS_NOT_MET)
        .value("GENERAL", ptcg::EffectErrorType::GENERAL)
        .export_values();

    // ========================================================================
    // RESULTS
    // ========================================================================

    py::class_<ptcg::OperationResult>(m, "OperationResult")
        .def_readonly("success", &ptcg::OperationResult::success)
        .def_readonly("error", &ptcg::OperationResult::error)
        .def("__bool__", [](const ptcg::OperationResult& r) { return r.success; });

    py::class_<ptcg::RuleViolation>(m, "RuleViolation")
        .def(py::init<std::string, std::string, ptcg::ViolationSeverity>())
        .def_readonly("rule_name", &ptcg::RuleViolation::rule_name)
        .def_readonly("message", &ptcg::RuleViolation::message)
        .def_readonly("severity", &ptcg::RuleViolation::severity)
        .def("is_blocking", &ptcg::RuleViolation::is_blocking);

    py::class_<ptcg::ActionResult>(m, "ActionResult")
        .def_readonly("success", &ptcg::ActionResult::success)
        .def_readonly("violations", &ptcg::ActionResult::violations)
        .def("has_blocking_violation", &ptcg::ActionResult::has_blocking_violation);

    // ========================================================================
    // CARDS
    // ========================================================================

    py::class_<ptcg::SpecialCondition>(m, "SpecialCondition")
        .def_readonly("kind", &ptcg::SpecialCondition::kind)
        .def_readonly("damage_per_turn", &ptcg::SpecialCondition::damage_per_turn)
        .def_static("poisoned", &ptcg::SpecialCondition::poisoned, py::arg("damage") = 10)
        .def_static("burned", &ptcg::SpecialCondition::burned, py::arg("damage") = 20)
        .def_static("paralyzed", &ptcg::SpecialCondition::paralyzed)
        .def_static("asleep", &ptcg::SpecialCondition::asleep)
        .def_static("confused", &ptcg::SpecialCondition::confused)
        .def_static("trapped", &ptcg::SpecialCondition::trapped)
        .def_static("custom", &ptcg::SpecialCondition::custom)
        .def("__str__", &ptcg::SpecialCondition::to_string);

    py::class_<ptcg::Attack>(m, "Attack")
        .def(py::init<>())
        .def_readwrite("name", &ptcg::Attack::name)
        .def_readwrite("cost", &ptcg::Attack::cost)
        .def_readwrite("damage", &ptcg::Attack::damage)
        .def_readwrite("effect", &ptcg::Attack::effect)
        .def_static("simple", &ptcg::Attack::simple)
        .def_static("with_status", &ptcg::Attack::with_status)
        .def_static("coin_flip_damage", &ptcg::Attack::coin_flip_damage)
        .def("calculate_damage", &ptcg::Attack::calculate_damage);

    py::class_<ptcg::PokemonData>(m, "PokemonData")
        .def_readwrite("species", &ptcg::PokemonData::species)
        .def_readwrite("pokemon_type", &ptcg::PokemonData::pokemon_type)
        .def_readwrite("hp", &ptcg::PokemonData::hp)
        .def_readwrite("retreat_cost", &ptcg::PokemonData::retreat_cost)
        .def_readwrite("weakness", &ptcg::PokemonData::weakness)
        .def_readwrite("resistance", &ptcg::PokemonData::resistance)
        .def_readwrite("stage", &ptcg::PokemonData::stage)
        .def_readwrite("evolves_from", &ptcg::PokemonData::evolves_from);

    py::class_<ptcg::Card>(m, "Card")
        .def_readonly("id", &ptcg::Card::id)
        .def_readonly("name", &ptcg::Card::name)
        .def_readonly("attacks", &ptcg::Card::attacks)
        .def_static("pokemon", &ptcg::Card::pokemon,
                    py::arg("id"), py::arg("name"), py::arg("hp"),
                    py::arg("stage") = ptcg::EvolutionStage::BASIC, py::arg("retreat_cost") = 1)
        .def_static("energy", &ptcg::Card::energy,
                    py::arg("id"), py::arg("name"), py::arg("energy_type"), py::arg("is_basic") = true)
        .def_static("trainer", &ptcg::Card::trainer)
        .def("is_pokemon", &ptcg::Card::is_pokemon)
        .def("is_energy", &ptcg::Card::is_energy)
        .def("is_trainer", &ptcg::Card::is_trainer)
        .def("is_basic_pokemon", &ptcg::Card::is_basic_pokemon)
        .def("get_hp", &ptcg::Card::get_hp)
        .def("get_energy_type", &ptcg::Card::get_energy_type)
        .def("pokemon_data", py::overload_cast<>(&ptcg::Card::pokemon_data),
             py::return_value_policy::reference_internal)
        .def("add_attack", &ptcg::Card::add_attack)
        .def("add_metadata", &ptcg::Card::add_metadata);

    py::class_<ptcg::CardDatabase>(m, "CardDatabase")
        .def(py::init<>())
        .def("add_card", &ptcg::CardDatabase::add_card)
        .def("get_card", &ptcg::CardDatabase::get_card, py::return_value_policy::reference_internal)
        .def("has_card", &ptcg::CardDatabase::has_card)
        .def("get_all_card_ids", &ptcg::CardDatabase::get_all_card_ids)
        .def("card_count", &ptcg::CardDatabase::card_count);

    // ========================================================================
    // DECK
    // ========================================================================

    py::class_<ptcg::DeckValidationError>(m, "DeckValidationError")
        .def_readonly("card_id", &ptcg::DeckValidationError::card_id)
        .def_readonly("minimum", &ptcg::DeckValidationError::minimum)
        .def_readonly("maximum", &ptcg::DeckValidationError::maximum)
        .def_readonly("actual", &ptcg::DeckValidationError::actual)
        .def("__str__", &ptcg::DeckValidationError::to_string);

    py::class_<ptcg::DeckStatistics>(m, "DeckStatistics")
        .def_readonly("total_cards", &ptcg::DeckStatistics::total_cards)
        .def_readonly("unique_cards", &ptcg::DeckStatistics::unique_cards)
        .def_readonly("pokemon_count", &ptcg::DeckStatistics::pokemon_count)
        .def_readonly("trainer_count", &ptcg::DeckStatistics::trainer_count)
        .def_readonly("energy_count", &ptcg::DeckStatistics::energy_count)
        .def_readonly("basic_pokemon_count", &ptcg::DeckStatistics::basic_pokemon_count)
        .def_readonly("energy_distribution", &ptcg::DeckStatistics::energy_distribution);

    py::class_<ptcg::Deck>(m, "Deck")
        .def(py::init<std::string, std::string>(), py::arg("name"), py::arg("format") = "Standard")
        .def_readwrite("name", &ptcg::Deck::name)
        .def_readwrite("format", &ptcg::Deck::format)
        .def_readonly("cards", &ptcg::Deck::cards)
        .def("add_card", &ptcg::Deck::add_card)
        .def("remove_card", &ptcg::Deck::remove_card)
        .def("set_card_quantity", &ptcg::Deck::set_card_quantity)
        .def("get_card_quantity", &ptcg::Deck::get_card_quantity)
        .def("total_cards", &ptcg::Deck::total_cards)
        .def("validate", &ptcg::Deck::validate)
        .def("is_valid", &ptcg::Deck::is_valid)
        .def("get_statistics", &ptcg::Deck::get_statistics)
        .def("export_text", &ptcg::Deck::export_text);

    // ========================================================================
    // PLAYER
    // ========================================================================

    py::class_<ptcg::Player>(m, "Player")
        .def(py::init<ptcg::PlayerID, std::string>())
        .def_readonly("id", &ptcg::Player::id)
        .def_readonly("name", &ptcg::Player::name)
        .def_readonly("hand", &ptcg::Player::hand)
        .def_readonly("deck", &ptcg::Player::deck)
        .def_readonly("discard_pile", &ptcg::Player::discard_pile)
        .def_readonly("prizes", &ptcg::Player::prizes)
        .def_readonly("active_pokemon", &ptcg::Player::active_pokemon)
        .def_readonly("bench", &ptcg::Player::bench)
        .def_readonly("prize_cards", &ptcg::Player::prize_cards)
        .def_readonly("has_attacked", &ptcg::Player::has_attacked)
        .def_readonly("energy_attached_this_turn", &ptcg::Player::energy_attached_this_turn)
        .def("get_damage", &ptcg::Player::get_damage)
        .def("get_pokemon_in_play", &ptcg::Player::get_pokemon_in_play)
        .def("has_lost", &ptcg::Player::has_lost)
        .def("has_won", &ptcg::Player::has_won);

    // ========================================================================
    // ACTIONS AND EVENTS
    // ========================================================================

    py::class_<ptcg::GameAction>(m, "GameAction")
        .def_readonly("action_type", &ptcg::GameAction::action_type)
        .def_readonly("player_id", &ptcg::GameAction::player_id)
        .def_readonly("card_id", &ptcg::GameAction::card_id)
        .def_readonly("target_id", &ptcg::GameAction::target_id)
        .def_readonly("attack_index", &ptcg::GameAction::attack_index)
        .def("__str__", &ptcg::GameAction::to_string)
        .def("__repr__", &ptcg::GameAction::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("draw_card", &ptcg::GameAction::draw_card)
        .def_static("play_card", &ptcg::GameAction::play_card,
                    py::arg("player"), py::arg("card"), py::arg("target") = std::nullopt)
        .def_static("attach_energy", &ptcg::GameAction::attach_energy)
        .def_static("use_attack", &ptcg::GameAction::use_attack,
                    py::arg("player"), py::arg("pokemon"), py::arg("attack_index"),
                    py::arg("target") = std::nullopt)
        .def_static("retreat", &ptcg::GameAction::retreat)
        .def_static("end_turn", &ptcg::GameAction::end_turn)
        .def_static("pass_turn", &ptcg::GameAction::pass);

    py::class_<ptcg::GameEvent>(m, "GameEvent")
        .def_readonly("type", &ptcg::GameEvent::type)
        .def_readonly("sequence", &ptcg::GameEvent::sequence)
        .def_readonly("timestamp_ms", &ptcg::GameEvent::timestamp_ms)
        .def_readonly("player_id", &ptcg::GameEvent::player_id)
        .def_readonly("card_id", &ptcg::GameEvent::card_id)
        .def_readonly("pokemon_id", &ptcg::GameEvent::pokemon_id)
        .def_readonly("damage", &ptcg::GameEvent::damage)
        .def_readonly("winner", &ptcg::GameEvent::winner)
        .def("__str__", &ptcg::GameEvent::describe);

    // ========================================================================
    // GAME
    // ========================================================================

    py::class_<ptcg::GameRules>(m, "GameRules")
        .def(py::init<>())
        .def_readwrite("format", &ptcg::GameRules::format)
        .def_readwrite("prize_cards", &ptcg::GameRules::prize_cards)
        .def_readwrite("max_hand_size", &ptcg::GameRules::max_hand_size)
        .def_readwrite("turn_time_limit", &ptcg::GameRules::turn_time_limit)
        .def_readwrite("auto_shuffle", &ptcg::GameRules::auto_shuffle);

    py::class_<ptcg::BasicPokemonCheck>(m, "BasicPokemonCheck")
        .def_readonly("success", &ptcg::BasicPokemonCheck::success)
        .def_readonly("error", &ptcg::BasicPokemonCheck::error)
        .def_readonly("players_without_basic", &ptcg::BasicPokemonCheck::players_without_basic)
        .def_readonly("all_without_basic", &ptcg::BasicPokemonCheck::all_without_basic);

    py::class_<ptcg::CompensationResult>(m, "CompensationResult")
        .def_readonly("success", &ptcg::CompensationResult::success)
        .def_readonly("error", &ptcg::CompensationResult::error)
        .def_readonly("drawn", &ptcg::CompensationResult::drawn);

    py::class_<ptcg::Game>(m, "Game")
        .def(py::init<ptcg::GameRules, std::optional<uint32_t>, std::string>(),
             py::arg("rules") = ptcg::GameRules{}, py::arg("seed") = std::nullopt,
             py::arg("game_id") = "game")
        .def_readonly("id", &ptcg::Game::id)
        .def_readonly("state", &ptcg::Game::state)
        .def_readonly("winner", &ptcg::Game::winner)
        .def_readonly("phase", &ptcg::Game::phase)
        .def_readonly("turn_order", &ptcg::Game::turn_order)
        .def_readonly("turn_number", &ptcg::Game::turn_number)
        .def_readonly("setup_phase", &ptcg::Game::setup_phase)
        .def_readonly("mulligan_count", &ptcg::Game::mulligan_count)
        .def_readonly("history", &ptcg::Game::history)
        .def("add_player", &ptcg::Game::add_player)
        .def("set_player_deck", &ptcg::Game::set_player_deck)
        .def("add_card_to_database", &ptcg::Game::add_card_to_database)
        .def("get_card", &ptcg::Game::get_card, py::return_value_policy::reference_internal)
        .def("get_player",
             static_cast<ptcg::Player* (ptcg::Game::*)(const ptcg::PlayerID&)>(&ptcg::Game::get_player),
             py::return_value_policy::reference_internal)
        .def("get_current_player_id", &ptcg::Game::get_current_player_id)
        .def("get_opponent_id", &ptcg::Game::get_opponent_id)
        .def("is_finished", &ptcg::Game::is_finished)
        // Setup protocol
        .def("start_setup", &ptcg::Game::start_setup)
        .def("determine_turn_order", &ptcg::Game::determine_turn_order)
        .def("deal_opening_hands", &ptcg::Game::deal_opening_hands)
        .def("check_for_basic_pokemon", &ptcg::Game::check_for_basic_pokemon)
        .def("perform_mulligan", &ptcg::Game::perform_mulligan)
        .def("reveal_hands_for_mulligan",
             [](const ptcg::Game& g, const ptcg::PlayerID& p) { return g.reveal_hands_for_mulligan(p).text; })
        .def("mulligan_compensation", &ptcg::Game::mulligan_compensation)
        .def("select_active_pokemon", &ptcg::Game::select_active_pokemon)
        .def("setup_bench", &ptcg::Game::setup_bench)
        .def("place_prize_cards", &ptcg::Game::place_prize_cards)
        .def("complete_setup", &ptcg::Game::complete_setup)
        // Turn controller
        .def("start", &ptcg::Game::start)
        .def("end_turn", &ptcg::Game::end_turn)
        .def("next_phase", &ptcg::Game::next_phase)
        .def("check_win_conditions", &ptcg::Game::check_win_conditions)
        .def("execute_action", &ptcg::Game::execute_action)
        .def("set_effect_manager", &ptcg::Game::set_effect_manager, py::keep_alive<1, 2>())
        .def("set_seed", &ptcg::Game::set_seed)
        .def("set_verbose", &ptcg::Game::set_verbose)
        .def("history_json", [](const ptcg::Game& g) { return ptcg::history_to_json(g.history).dump(); });

    // ========================================================================
    // RULES
    // ========================================================================

    py::class_<ptcg::RuleConfig>(m, "RuleConfig")
        .def(py::init<>())
        .def_readwrite("stop_on_first_violation", &ptcg::RuleConfig::stop_on_first_violation)
        .def_readwrite("auto_apply_effects", &ptcg::RuleConfig::auto_apply_effects)
        .def_readwrite("min_severity", &ptcg::RuleConfig::min_severity);

    py::class_<ptcg::Rule, std::shared_ptr<ptcg::Rule>>(m, "Rule")
        .def("name", &ptcg::Rule::name)
        .def("validate_action", &ptcg::Rule::validate_action);

    py::class_<ptcg::rules::TurnOrderRule, ptcg::Rule, std::shared_ptr<ptcg::rules::TurnOrderRule>>(m, "TurnOrderRule")
        .def(py::init<>());
    py::class_<ptcg::rules::HandLimitRule, ptcg::Rule, std::shared_ptr<ptcg::rules::HandLimitRule>>(m, "HandLimitRule")
        .def(py::init<std::optional<int>>(), py::arg("max_hand_size") = std::nullopt);
    py::class_<ptcg::rules::EnergyAttachmentRule, ptcg::Rule, std::shared_ptr<ptcg::rules::EnergyAttachmentRule>>(m, "EnergyAttachmentRule")
        .def(py::init<>());
    py::class_<ptcg::rules::GameInProgressRule, ptcg::Rule, std::shared_ptr<ptcg::rules::GameInProgressRule>>(m, "GameInProgressRule")
        .def(py::init<>());
    py::class_<ptcg::rules::AttackRule, ptcg::Rule, std::shared_ptr<ptcg::rules::AttackRule>>(m, "AttackRule")
        .def(py::init<>());

    py::class_<ptcg::RuleEngine>(m, "RuleEngine")
        .def(py::init<ptcg::RuleConfig>(), py::arg("config") = ptcg::RuleConfig{})
        .def("add_rule", &ptcg::RuleEngine::add_rule)
        .def("remove_rule", &ptcg::RuleEngine::remove_rule)
        .def("validate_action", &ptcg::RuleEngine::validate_action)
        .def("apply_action", &ptcg::RuleEngine::apply_action)
        .def("get_rule_names", &ptcg::RuleEngine::get_rule_names)
        .def("has_rule", &ptcg::RuleEngine::has_rule)
        .def("rule_count", &ptcg::RuleEngine::rule_count)
        .def_static("standard", &ptcg::rules::StandardRules::create_engine,
                    py::arg("max_hand_size") = std::nullopt, py::arg("config") = ptcg::RuleConfig{})
        .def_static("full", &ptcg::rules::StandardRules::create_full_engine,
                    py::arg("max_hand_size") = std::nullopt, py::arg("config") = ptcg::RuleConfig{});

    // ========================================================================
    // EFFECTS
    // ========================================================================

    py::class_<ptcg::EffectTrigger>(m, "EffectTrigger")
        .def(py::init<ptcg::TriggerType, std::string>(), py::arg("type"), py::arg("detail") = "")
        .def_readonly("type", &ptcg::EffectTrigger::type)
        .def_readonly("detail", &ptcg::EffectTrigger::detail)
        .def_static("on_game_event", &ptcg::EffectTrigger::on_game_event)
        .def_static("once", &ptcg::EffectTrigger::once)
        .def("__str__", &ptcg::EffectTrigger::to_string);

    py::class_<ptcg::EffectContext>(m, "EffectContext")
        .def(py::init<>())
        .def_readwrite("source_card", &ptcg::EffectContext::source_card)
        .def_readwrite("controller", &ptcg::EffectContext::controller)
        .def_readwrite("parameters", &ptcg::EffectContext::parameters);

    py::class_<ptcg::EffectOutcome>(m, "EffectOutcome")
        .def_readonly("target", &ptcg::EffectOutcome::target)
        .def_readonly("amount", &ptcg::EffectOutcome::amount)
        .def_readonly("description", &ptcg::EffectOutcome::description)
        .def_static("custom", &ptcg::EffectOutcome::custom);

    py::class_<ptcg::EffectResult>(m, "EffectResult")
        .def_readonly("success", &ptcg::EffectResult::success)
        .def_readonly("effect_id", &ptcg::EffectResult::effect_id)
        .def_readonly("outcomes", &ptcg::EffectResult::outcomes)
        .def("error_message", [](const ptcg::EffectResult& r) {
            return r.error ? r.error->to_string() : std::string();
        })
        .def_static("ok", &ptcg::EffectResult::ok, py::arg("outcomes") = std::vector<ptcg::EffectOutcome>{})
        .def_static("fail", &ptcg::EffectResult::fail);

    py::class_<ptcg::Effect, std::shared_ptr<ptcg::Effect>>(m, "Effect")
        .def("id", &ptcg::Effect::id)
        .def("name", &ptcg::Effect::name)
        .def("description", &ptcg::Effect::description)
        .def("triggers", &ptcg::Effect::triggers);

    py::class_<ptcg::effects::DamageEffect, ptcg::Effect, std::shared_ptr<ptcg::effects::DamageEffect>>(m, "DamageEffect")
        .def(py::init<std::string, int, ptcg::EffectID>(), py::arg("name"), py::arg("damage"), py::arg("id") = "");
    py::class_<ptcg::effects::HealEffect, ptcg::Effect, std::shared_ptr<ptcg::effects::HealEffect>>(m, "HealEffect")
        .def(py::init<std::string, int, ptcg::EffectID>(), py::arg("name"), py::arg("amount"), py::arg("id") = "");
    py::class_<ptcg::effects::DrawCardsEffect, ptcg::Effect, std::shared_ptr<ptcg::effects::DrawCardsEffect>>(m, "DrawCardsEffect")
        .def(py::init<std::string, int, ptcg::EffectID>(), py::arg("name"), py::arg("count"), py::arg("id") = "");

    py::class_<ptcg::effects::CallbackEffect, ptcg::Effect, std::shared_ptr<ptcg::effects::CallbackEffect>>(m, "CallbackEffect")
        .def(py::init<std::string, std::string, std::vector<ptcg::EffectTrigger>,
                      ptcg::effects::EffectFn, ptcg::effects::EffectPredicate, ptcg::EffectID>(),
             py::arg("name"), py::arg("description"), py::arg("triggers"), py::arg("fn"),
             py::arg("predicate") = nullptr, py::arg("id") = "");

    py::class_<ptcg::EffectManager>(m, "EffectManager")
        .def(py::init<>())
        .def("register_effect", &ptcg::EffectManager::register_effect)
        .def("unregister_effect", &ptcg::EffectManager::unregister_effect)
        .def("attach_effect", &ptcg::EffectManager::attach_effect)
        .def("detach_effect", &ptcg::EffectManager::detach_effect)
        .def("remove_card_effects", &ptcg::EffectManager::remove_card_effects)
        .def("has_effects", &ptcg::EffectManager::has_effects)
        .def("trigger_effects", &ptcg::EffectManager::trigger_effects)
        .def("effect_count", &ptcg::EffectManager::effect_count);

    // ========================================================================
    // CONFIG
    // ========================================================================

    m.def("game_from_config", [](const std::string& json_text) -> std::optional<ptcg::Game> {
        auto config = ptcg::parse_config(json_text);
        if (!config) return std::nullopt;
        return ptcg::make_game(*config);
    });

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = ptcg::get_version();
    m.attr("__version__") = ptcg::get_version();
}
