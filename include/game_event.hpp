/**
 * PTCG Core - Game Events
 *
 * Append-only log entries mirroring state transitions, plus the push
 * interface handlers implement to observe them as they are emitted.
 */

#pragma once

#include "types.hpp"

namespace ptcg {

enum class EventType : uint8_t {
    GAME_STARTED,
    TURN_STARTED,
    CARD_DRAWN,
    CARD_PLAYED,
    POKEMON_BENCHED,
    ENERGY_ATTACHED,
    ATTACK_USED,
    DAMAGE_DEALT,
    POKEMON_KNOCKED_OUT,
    PRIZE_TAKEN,
    DECK_SHUFFLED,
    TURN_ENDED,
    GAME_ENDED
};

inline const char* to_string(EventType type) {
    switch (type) {
        case EventType::GAME_STARTED: return "GameStarted";
        case EventType::TURN_STARTED: return "TurnStarted";
        case EventType::CARD_DRAWN: return "CardDrawn";
        case EventType::CARD_PLAYED: return "CardPlayed";
        case EventType::POKEMON_BENCHED: return "PokemonBenched";
        case EventType::ENERGY_ATTACHED: return "EnergyAttached";
        case EventType::ATTACK_USED: return "AttackUsed";
        case EventType::DAMAGE_DEALT: return "DamageDealt";
        case EventType::POKEMON_KNOCKED_OUT: return "PokemonKnockedOut";
        case EventType::PRIZE_TAKEN: return "PrizeTaken";
        case EventType::DECK_SHUFFLED: return "DeckShuffled";
        case EventType::TURN_ENDED: return "TurnEnded";
        case EventType::GAME_ENDED: return "GameEnded";
        default: return "Unknown";
    }
}

/**
 * GameEvent - One history entry.
 *
 * Field use by type:
 *   GAME_STARTED        players
 *   TURN_STARTED        player_id, turn_number
 *   CARD_DRAWN          player_id, card_id (empty when the deck was empty)
 *   CARD_PLAYED         player_id, card_id
 *   POKEMON_BENCHED     player_id, card_id
 *   ENERGY_ATTACHED     player_id, card_id (energy), pokemon_id
 *   ATTACK_USED         player_id, pokemon_id, attack_name
 *   DAMAGE_DEALT        player_id, pokemon_id, damage
 *   POKEMON_KNOCKED_OUT player_id, pokemon_id
 *   PRIZE_TAKEN         player_id
 *   DECK_SHUFFLED       player_id
 *   TURN_ENDED          player_id
 *   GAME_ENDED          winner (empty on a draw/cancel)
 *
 * sequence and timestamp_ms are stamped by Game::add_event.
 */
struct GameEvent {
    EventType type = EventType::GAME_STARTED;
    uint64_t sequence = 0;
    uint64_t timestamp_ms = 0;

    PlayerID player_id;
    std::vector<PlayerID> players;
    std::optional<CardID> card_id;
    CardID pokemon_id;
    std::string attack_name;
    int damage = 0;
    uint32_t turn_number = 0;
    std::optional<PlayerID> winner;

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static GameEvent game_started(std::vector<PlayerID> players);
    static GameEvent turn_started(const PlayerID& player, uint32_t turn);
    static GameEvent card_drawn(const PlayerID& player, std::optional<CardID> card);
    static GameEvent card_played(const PlayerID& player, const CardID& card);
    static GameEvent pokemon_benched(const PlayerID& player, const CardID& card);
    static GameEvent energy_attached(const PlayerID& player, const CardID& energy, const CardID& pokemon);
    static GameEvent attack_used(const PlayerID& player, const CardID& pokemon, const std::string& attack);
    static GameEvent damage_dealt(const PlayerID& player, const CardID& pokemon, int amount);
    static GameEvent pokemon_knocked_out(const PlayerID& player, const CardID& pokemon);
    static GameEvent prize_taken(const PlayerID& player);
    static GameEvent deck_shuffled(const PlayerID& player);
    static GameEvent turn_ended(const PlayerID& player);
    static GameEvent game_ended(std::optional<PlayerID> winner);

    /**
     * One-line human-readable description.
     */
    std::string describe() const;

    /**
     * Content equality (sequence and timestamp are ignored).
     */
    bool same_content(const GameEvent& other) const;
};

// ============================================================================
// PUSH INTERFACE
// ============================================================================

/**
 * EventHandler - Receives each event synchronously when it is emitted.
 *
 * Handlers observe only; they must not mutate the game that emits to them.
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual std::string name() const = 0;

    virtual void handle_event(const GameEvent& event) = 0;
};

/**
 * ConsoleEventHandler - Prints one line per event to stdout.
 */
class ConsoleEventHandler : public EventHandler {
public:
    explicit ConsoleEventHandler(bool show_timestamps = false)
        : show_timestamps_(show_timestamps) {}

    std::string name() const override { return "ConsoleHandler"; }

    void handle_event(const GameEvent& event) override;

private:
    bool show_timestamps_;
};

/**
 * RecordingEventHandler - Keeps a copy of every event it receives.
 */
class RecordingEventHandler : public EventHandler {
public:
    explicit RecordingEventHandler(std::string handler_name = "RecordingHandler")
        : name_(std::move(handler_name)) {}

    std::string name() const override { return name_; }

    void handle_event(const GameEvent& event) override { events_.push_back(event); }

    const std::vector<GameEvent>& events() const { return events_; }
    void clear() { events_.clear(); }

private:
    std::string name_;
    std::vector<GameEvent> events_;
};

} // namespace ptcg
