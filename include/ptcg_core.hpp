/**
 * PTCG Core - Pokemon Trading Card Game rules core
 *
 * Deck validation, the setup protocol, rule-checked action execution,
 * triggered card effects and the turn controller.
 *
 * Include this header to get access to the complete API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "special_condition.hpp"

// Cards and decks
#include "card.hpp"
#include "card_database.hpp"
#include "deck.hpp"

// Match state
#include "player.hpp"
#include "game_event.hpp"
#include "game_action.hpp"
#include "game.hpp"

// Rules
#include "rule_violation.hpp"
#include "rule_engine.hpp"
#include "standard_rules.hpp"

// Effects
#include "effect.hpp"
#include "effect_manager.hpp"
#include "effects/builtin_effects.hpp"

// Ambient
#include "match_logger.hpp"
#include "game_config.hpp"
#include "event_serialization.hpp"

namespace ptcg {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace ptcg
