/**
 * PTCG Core - Game Event Implementation
 */

#include "game_event.hpp"
#include <iostream>
#include <sstream>

namespace ptcg {

// ============================================================================
// FACTORY METHODS
// ============================================================================

GameEvent GameEvent::game_started(std::vector<PlayerID> players) {
    GameEvent e;
    e.type = EventType::GAME_STARTED;
    e.players = std::move(players);
    return e;
}

GameEvent GameEvent::turn_started(const PlayerID& player, uint32_t turn) {
    GameEvent e;
    e.type = EventType::TURN_STARTED;
    e.player_id = player;
    e.turn_number = turn;
    return e;
}

GameEvent GameEvent::card_drawn(const PlayerID& player, std::optional<CardID> card) {
    GameEvent e;
    e.type = EventType::CARD_DRAWN;
    e.player_id = player;
    e.card_id = std::move(card);
    return e;
}

GameEvent GameEvent::card_played(const PlayerID& player, const CardID& card) {
    GameEvent e;
    e.type = EventType::CARD_PLAYED;
    e.player_id = player;
    e.card_id = card;
    return e;
}

GameEvent GameEvent::pokemon_benched(const PlayerID& player, const CardID& card) {
    GameEvent e;
    e.type = EventType::POKEMON_BENCHED;
    e.player_id = player;
    e.card_id = card;
    return e;
}

GameEvent GameEvent::energy_attached(const PlayerID& player, const CardID& energy, const CardID& pokemon) {
    GameEvent e;
    e.type = EventType::ENERGY_ATTACHED;
    e.player_id = player;
    e.card_id = energy;
    e.pokemon_id = pokemon;
    return e;
}

GameEvent GameEvent::attack_used(const PlayerID& player, const CardID& pokemon, const std::string& attack) {
    GameEvent e;
    e.type = EventType::ATTACK_USED;
    e.player_id = player;
    e.pokemon_id = pokemon;
    e.attack_name = attack;
    return e;
}

GameEvent GameEvent::damage_dealt(const PlayerID& player, const CardID& pokemon, int amount) {
    GameEvent e;
    e.type = EventType::DAMAGE_DEALT;
    e.player_id = player;
    e.pokemon_id = pokemon;
    e.damage = amount;
    return e;
}

GameEvent GameEvent::pokemon_knocked_out(const PlayerID& player, const CardID& pokemon) {
    GameEvent e;
    e.type = EventType::POKEMON_KNOCKED_OUT;
    e.player_id = player;
    e.pokemon_id = pokemon;
    return e;
}

GameEvent GameEvent::prize_taken(const PlayerID& player) {
    GameEvent e;
    e.type = EventType::PRIZE_TAKEN;
    e.player_id = player;
    return e;
}

GameEvent GameEvent::deck_shuffled(const PlayerID& player) {
    GameEvent e;
    e.type = EventType::DECK_SHUFFLED;
    e.player_id = player;
    return e;
}

GameEvent GameEvent::turn_ended(const PlayerID& player) {
    GameEvent e;
    e.type = EventType::TURN_ENDED;
    e.player_id = player;
    return e;
}

GameEvent GameEvent::game_ended(std::optional<PlayerID> winner) {
    GameEvent e;
    e.type = EventType::GAME_ENDED;
    e.winner = std::move(winner);
    return e;
}

// ============================================================================
// DESCRIPTION
// ============================================================================

std::string GameEvent::describe() const {
    std::ostringstream out;
    switch (type) {
        case EventType::GAME_STARTED:
            out << "Game started with " << players.size() << " players";
            break;
        case EventType::TURN_STARTED:
            out << "Turn " << turn_number << " started for player " << player_id;
            break;
        case EventType::CARD_DRAWN:
            out << "Player " << player_id << " drew a card: " << (card_id ? *card_id : "none");
            break;
        case EventType::CARD_PLAYED:
            out << "Player " << player_id << " played card: " << card_id.value_or("");
            break;
        case EventType::POKEMON_BENCHED:
            out << "Player " << player_id << " benched Pokemon: " << card_id.value_or("");
            break;
        case EventType::ENERGY_ATTACHED:
            out << "Player " << player_id << " attached energy " << card_id.value_or("")
                << " to Pokemon " << pokemon_id;
            break;
        case EventType::ATTACK_USED:
            out << "Player " << player_id << " used attack '" << attack_name
                << "' with Pokemon " << pokemon_id;
            break;
        case EventType::DAMAGE_DEALT:
            out << "Player " << player_id << " dealt " << damage << " damage to Pokemon " << pokemon_id;
            break;
        case EventType::POKEMON_KNOCKED_OUT:
            out << "Player " << player_id << " knocked out Pokemon " << pokemon_id;
            break;
        case EventType::PRIZE_TAKEN:
            out << "Player " << player_id << " took a prize card";
            break;
        case EventType::DECK_SHUFFLED:
            out << "Player " << player_id << " shuffled their deck";
            break;
        case EventType::TURN_ENDED:
            out << "Player " << player_id << " ended their turn";
            break;
        case EventType::GAME_ENDED:
            out << "Game ended. Winner: " << (winner ? *winner : "none");
            break;
    }
    return out.str();
}

bool GameEvent::same_content(const GameEvent& other) const {
    return type == other.type &&
           player_id == other.player_id &&
           players == other.players &&
           card_id == other.card_id &&
           pokemon_id == other.pokemon_id &&
           attack_name == other.attack_name &&
           damage == other.damage &&
           turn_number == other.turn_number &&
           winner == other.winner;
}

// ============================================================================
// HANDLERS
// ============================================================================

void ConsoleEventHandler::handle_event(const GameEvent& event) {
    if (show_timestamps_) {
        std::cout << "[" << event.timestamp_ms << "] ";
    }
    std::cout << event.describe() << std::endl;
}

} // namespace ptcg
