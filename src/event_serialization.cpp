/**
 * PTCG Core - Event Serialization Implementation
 */

#include "event_serialization.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace ptcg {

namespace {

constexpr EventType ALL_EVENT_TYPES[] = {
    EventType::GAME_STARTED,
    EventType::TURN_STARTED,
    EventType::CARD_DRAWN,
    EventType::CARD_PLAYED,
    EventType::POKEMON_BENCHED,
    EventType::ENERGY_ATTACHED,
    EventType::ATTACK_USED,
    EventType::DAMAGE_DEALT,
    EventType::POKEMON_KNOCKED_OUT,
    EventType::PRIZE_TAKEN,
    EventType::DECK_SHUFFLED,
    EventType::TURN_ENDED,
    EventType::GAME_ENDED
};

} // namespace

std::optional<EventType> event_type_from_string(const std::string& text) {
    for (EventType type : ALL_EVENT_TYPES) {
        if (text == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

json event_to_json(const GameEvent& event) {
    json j;
    j["type"] = to_string(event.type);
    j["sequence"] = event.sequence;
    j["timestamp_ms"] = event.timestamp_ms;

    switch (event.type) {
        case EventType::GAME_STARTED:
            j["players"] = event.players;
            break;
        case EventType::TURN_STARTED:
            j["player"] = event.player_id;
            j["turn"] = event.turn_number;
            break;
        case EventType::CARD_DRAWN:
            j["player"] = event.player_id;
            j["card"] = event.card_id ? json(*event.card_id) : json(nullptr);
            break;
        case EventType::CARD_PLAYED:
        case EventType::POKEMON_BENCHED:
            j["player"] = event.player_id;
            j["card"] = event.card_id.value_or("");
            break;
        case EventType::ENERGY_ATTACHED:
            j["player"] = event.player_id;
            j["energy"] = event.card_id.value_or("");
            j["pokemon"] = event.pokemon_id;
            break;
        case EventType::ATTACK_USED:
            j["player"] = event.player_id;
            j["pokemon"] = event.pokemon_id;
            j["attack"] = event.attack_name;
            break;
        case EventType::DAMAGE_DEALT:
            j["player"] = event.player_id;
            j["pokemon"] = event.pokemon_id;
            j["damage"] = event.damage;
            break;
        case EventType::POKEMON_KNOCKED_OUT:
            j["player"] = event.player_id;
            j["pokemon"] = event.pokemon_id;
            break;
        case EventType::PRIZE_TAKEN:
        case EventType::DECK_SHUFFLED:
        case EventType::TURN_ENDED:
            j["player"] = event.player_id;
            break;
        case EventType::GAME_ENDED:
            j["winner"] = event.winner ? json(*event.winner) : json(nullptr);
            break;
    }
    return j;
}

std::optional<GameEvent> event_from_json(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return std::nullopt;
    }
    auto type = event_type_from_string(j["type"].get<std::string>());
    if (!type) {
        return std::nullopt;
    }

    try {
        GameEvent event;
        event.type = *type;
        event.sequence = j.value("sequence", uint64_t{0});
        event.timestamp_ms = j.value("timestamp_ms", uint64_t{0});
        event.player_id = j.value("player", std::string());
        event.pokemon_id = j.value("pokemon", std::string());
        event.attack_name = j.value("attack", std::string());
        event.damage = j.value("damage", 0);
        event.turn_number = j.value("turn", uint32_t{0});

        if (j.contains("players")) {
            event.players = j["players"].get<std::vector<PlayerID>>();
        }
        if (j.contains("card") && !j["card"].is_null()) {
            event.card_id = j["card"].get<CardID>();
        }
        if (j.contains("energy")) {
            event.card_id = j["energy"].get<CardID>();
        }
        if (j.contains("winner") && !j["winner"].is_null()) {
            event.winner = j["winner"].get<PlayerID>();
        }
        return event;

    } catch (const json::exception& e) {
        std::cerr << "[Events] Bad event entry: " << e.what() << std::endl;
        return std::nullopt;
    }
}

json history_to_json(const std::vector<GameEvent>& history) {
    json array = json::array();
    for (const auto& event : history) {
        array.push_back(event_to_json(event));
    }
    return array;
}

std::optional<std::vector<GameEvent>> history_from_json(const std::string& json_text) {
    try {
        json data = json::parse(json_text);
        if (!data.is_array()) {
            std::cerr << "[Events] Expected a JSON array" << std::endl;
            return std::nullopt;
        }

        std::vector<GameEvent> history;
        for (const auto& entry : data) {
            auto event = event_from_json(entry);
            if (!event) {
                return std::nullopt;
            }
            history.push_back(std::move(*event));
        }
        return history;

    } catch (const json::parse_error& e) {
        std::cerr << "[Events] JSON parse error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace ptcg
