/**
 * PTCG Core - Event Serialization
 *
 * JSON export of the event history for replay tools and external
 * observers. Only the fields an event type uses are written.
 */

#pragma once

#include "game_event.hpp"
#include <nlohmann/json_fwd.hpp>

namespace ptcg {

std::optional<EventType> event_type_from_string(const std::string& text);

nlohmann::json event_to_json(const GameEvent& event);

/**
 * Rebuild an event from event_to_json output.
 *
 * @return nullopt when the type is unknown or a field has the wrong type
 */
std::optional<GameEvent> event_from_json(const nlohmann::json& j);

/**
 * The whole history as a JSON array, in sequence order.
 */
nlohmann::json history_to_json(const std::vector<GameEvent>& history);

/**
 * Parse a history array written by history_to_json.
 *
 * @return nullopt if the text is malformed or any entry fails to parse
 */
std::optional<std::vector<GameEvent>> history_from_json(const std::string& json_text);

} // namespace ptcg
