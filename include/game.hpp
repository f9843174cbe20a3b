/**
 * PTCG Core - Game
 *
 * Match state for one two-player game: players, turn order, phase,
 * card database and the append-only event history. The setup protocol,
 * turn controller and action execution are methods on Game, implemented
 * in game_setup.cpp, game_turn.cpp and game_actions.cpp.
 *
 * Lifecycle: players join while SETUP; the setup protocol moves the game
 * to IN_PROGRESS (one-way); FINISHED and CANCELLED are terminal.
 */

#pragma once

#include "card_database.hpp"
#include "deck.hpp"
#include "player.hpp"
#include "game_event.hpp"
#include "game_action.hpp"
#include "rule_violation.hpp"
#include <map>
#include <random>
#include <set>

namespace ptcg {

// Forward declarations
class RuleEngine;
class EffectManager;
struct EffectTrigger;

// ============================================================================
// CONFIGURATION
// ============================================================================

/**
 * Match rules. Read-only once the game is created.
 */
struct GameRules {
    std::string format = "Standard";
    int prize_cards = Player::DEFAULT_PRIZE_CARDS;
    std::optional<int> max_hand_size;
    std::optional<int> turn_time_limit;  // seconds; enforced by the host
    bool auto_shuffle = true;

    bool operator==(const GameRules& other) const {
        return format == other.format &&
               prize_cards == other.prize_cards &&
               max_hand_size == other.max_hand_size &&
               turn_time_limit == other.turn_time_limit &&
               auto_shuffle == other.auto_shuffle;
    }
};

// ============================================================================
// SETUP RESULT TYPES
// ============================================================================

enum class MulliganResultType : uint8_t {
    ALL_WITHOUT_BASIC,
    ALL_WITH_BASIC,
    ONE_WITHOUT_BASIC
};

struct MulliganResult {
    MulliganResultType type = MulliganResultType::ALL_WITH_BASIC;
    PlayerID player_id;  // set for ONE_WITHOUT_BASIC

    static MulliganResult all_without_basic() { return {MulliganResultType::ALL_WITHOUT_BASIC, {}}; }
    static MulliganResult all_with_basic() { return {MulliganResultType::ALL_WITH_BASIC, {}}; }
    static MulliganResult one_without_basic(const PlayerID& player) {
        return {MulliganResultType::ONE_WITHOUT_BASIC, player};
    }

    bool operator==(const MulliganResult& other) const {
        return type == other.type && player_id == other.player_id;
    }
};

/**
 * Result of a mulligan step that reports who still lacks a Basic Pokemon.
 */
struct MulliganOutcome {
    bool success = false;
    std::string error;
    MulliganResult result;
};

/**
 * Result of checking opening hands for Basic Pokemon.
 */
struct BasicPokemonCheck {
    bool success = false;
    std::string error;
    std::vector<PlayerID> players_without_basic;
    bool all_without_basic = false;
};

/**
 * Result of revealing a hand (mulligan fairness step).
 */
struct HandReveal {
    bool success = false;
    std::string error;
    std::string text;
};

/**
 * Result of drawing mulligan compensation cards.
 */
struct CompensationResult {
    bool success = false;
    std::string error;
    std::vector<CardID> drawn;
};

// ============================================================================
// GAME
// ============================================================================

class Game {
public:
    static constexpr size_t MAX_PLAYERS = 2;
    static constexpr size_t OPENING_HAND_SIZE = 7;
    static constexpr int WEAKNESS_MULTIPLIER = 2;
    static constexpr int RESISTANCE_REDUCTION = 30;

    std::string id;
    GameStatus state = GameStatus::SETUP;
    std::optional<PlayerID> winner;  // set when FINISHED with a winner
    TurnPhase phase = TurnPhase::BEGINNING_OF_TURN;
    std::map<PlayerID, Player> players;
    std::vector<PlayerID> turn_order;
    size_t current_player_index = 0;
    CardDatabase card_database;
    uint32_t turn_number = 1;
    GameRules rules;
    std::vector<GameEvent> history;

    // Setup-only state
    SetupPhase setup_phase = SetupPhase::WAITING_FOR_TURN_ORDER;
    std::optional<PlayerID> player_waiting_for_mulligan;
    int mulligan_count = 0;
    std::set<PlayerID> mulligan_compensation_used;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    /**
     * @param game_rules Match rules
     * @param seed RNG seed; a clock-derived seed is used when absent
     * @param game_id Identifier used in logs and events
     */
    explicit Game(GameRules game_rules = GameRules{},
                  std::optional<uint32_t> seed = std::nullopt,
                  std::string game_id = "game");

    // ========================================================================
    // PLAYERS AND CARDS
    // ========================================================================

    /**
     * Add a player while in SETUP (max 2). The player's prize count is set
     * from the rules.
     */
    OperationResult add_player(Player player);

    /**
     * Expand a deck into the player's draw pile. Each copy gets its own
     * instance id registered in the card database. Shuffles when
     * rules.auto_shuffle is set.
     */
    OperationResult set_player_deck(const PlayerID& player_id, const Deck& deck);

    void add_card_to_database(Card card) { card_database.add_card(std::move(card)); }

    const Card* get_card(const CardID& card_id) const { return card_database.get_card(card_id); }

    Player* get_player(const PlayerID& player_id);
    const Player* get_player(const PlayerID& player_id) const;

    /**
     * Find which player holds a card in any zone.
     */
    std::optional<PlayerID> find_card_owner(const CardID& card_id) const;

    // ========================================================================
    // EVENTS
    // ========================================================================

    /**
     * Stamp, append and push an event to every registered handler.
     */
    void add_event(GameEvent event);

    const std::vector<GameEvent>& get_history() const { return history; }

    /**
     * Register a handler; a handler with the same name is replaced.
     */
    void register_handler(std::shared_ptr<EventHandler> handler);
    bool unregister_handler(const std::string& name);
    size_t handler_count() const { return handlers_.size(); }

    // ========================================================================
    // TURN QUERIES
    // ========================================================================

    bool is_player_turn(const PlayerID& player_id) const;

    /**
     * Current player, or nullopt when no turn order has been set.
     */
    std::optional<PlayerID> get_current_player_id() const;

    std::optional<PlayerID> get_opponent_id(const PlayerID& player_id) const;

    bool is_finished() const {
        return state == GameStatus::FINISHED || state == GameStatus::CANCELLED;
    }

    // ========================================================================
    // GAME LIFECYCLE
    // ========================================================================

    void end_game(std::optional<PlayerID> winner_id);
    void cancel_game();

    OperationResult shuffle_deck(const PlayerID& player_id);
    void shuffle_both_decks();

    // ========================================================================
    // SETUP PROTOCOL (game_setup.cpp)
    // ========================================================================

    OperationResult start_setup();

    /**
     * Fix the turn order with a fair coin flip from the game RNG.
     */
    OperationResult determine_turn_order();

    OperationResult deal_opening_hands();

    /**
     * Players whose hand holds no Basic Pokemon.
     */
    BasicPokemonCheck check_for_basic_pokemon() const;

    BasicPokemonCheck declare_no_basic_pokemon();

    OperationResult mark_player_for_mulligan(const PlayerID& player_id);

    OperationResult perform_pending_mulligans();

    /**
     * Hand back into the deck, shuffle, draw 7. Increments mulligan_count.
     */
    OperationResult perform_mulligan(const PlayerID& player_id);

    MulliganOutcome perform_mulligan_and_check_basic_pokemon(const PlayerID& player_id);

    MulliganOutcome perform_mulligan_for_both_and_check_basic_pokemon();

    /**
     * Reveal both hands, then mulligan the declaring player.
     */
    MulliganOutcome declare_and_perform_mulligan(const PlayerID& player_id);

    HandReveal print_player_hand(const PlayerID& player_id) const;

    /**
     * The declaring player's hand followed by the opponent's.
     */
    HandReveal reveal_hands_for_mulligan(const PlayerID& player_id) const;

    int get_mulligan_compensation_limit() const { return mulligan_count; }

    /**
     * Draw up to get_mulligan_compensation_limit() extra cards, once per player.
     */
    CompensationResult mulligan_compensation(const PlayerID& player_id, int card_count);

    OperationResult select_active_pokemon(const PlayerID& player_id, const CardID& card_id);

    /**
     * Bench a batch of Pokemon from hand. All-or-nothing: nothing moves if
     * any card is illegal or the batch would overflow the bench.
     */
    OperationResult setup_bench(const PlayerID& player_id, const std::vector<CardID>& card_ids);

    /**
     * Deal min(rules.prize_cards, deck size) prizes to each player.
     */
    OperationResult place_prize_cards();

    /**
     * Requires every player to have an active Pokemon; moves to IN_PROGRESS
     * and starts the first turn.
     */
    OperationResult complete_setup();

    // ========================================================================
    // TURN CONTROLLER (game_turn.cpp)
    // ========================================================================

    /**
     * Start without the setup protocol: checks players and decks, sets a
     * turn order if none, moves to IN_PROGRESS and starts the first turn.
     */
    OperationResult start();

    OperationResult start_turn();

    OperationResult end_turn();

    OperationResult next_phase();

    /**
     * A player at zero prizes wins; a player whose opponent has lost wins.
     * Finishes the game and emits GameEnded when a winner is found.
     */
    std::optional<PlayerID> check_win_conditions();

    /**
     * Between-turns special condition tick for one player's Pokemon.
     * Caller-invoked; emits DamageDealt and PokemonKnockedOut.
     */
    std::vector<ConditionEffect> process_special_conditions(const PlayerID& player_id);

    // ========================================================================
    // ACTION EXECUTION (game_actions.cpp)
    // ========================================================================

    /**
     * Validate through the rule engine, then apply. Nothing is mutated when
     * a blocking violation is found.
     */
    ActionResult execute_action(const RuleEngine& rule_engine, const GameAction& action);

    /**
     * Damage an attack deals to a defender after weakness and resistance.
     */
    int calculate_attack_damage(const PlayerID& attacker_owner, const CardID& attacker_id,
                                const Attack& attack, const CardID& defender_id,
                                const std::vector<bool>& coin_results) const;

    /**
     * Knock out a Pokemon if its damage reaches its HP; the opponent takes
     * a prize. Returns true when a knockout happened.
     */
    bool resolve_knockout(const PlayerID& owner_id, const CardID& pokemon_id);

    // ========================================================================
    // RANDOMNESS, EFFECTS AND DIAGNOSTICS
    // ========================================================================

    void set_seed(uint32_t seed) { rng_.seed(seed); }
    std::mt19937& rng() { return rng_; }

    bool flip_coin();
    std::vector<bool> flip_coins(int count);

    /**
     * Attach an effect manager notified at turn boundaries and by action
     * execution. Not owned.
     */
    void set_effect_manager(EffectManager* manager) { effect_manager_ = manager; }
    EffectManager* effect_manager() const { return effect_manager_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool is_verbose() const { return verbose_; }

private:
    std::mt19937 rng_;
    std::vector<std::shared_ptr<EventHandler>> handlers_;
    EffectManager* effect_manager_ = nullptr;
    bool verbose_ = false;
    uint64_t next_sequence_ = 1;

    OperationResult require_setup(const std::string& operation) const;
    void log_info(const std::string& component, const std::string& message) const;
    void log_error(const std::string& component, const std::string& message) const;

    // Turn helpers
    void advance_player_index();

    // Action helpers
    OperationResult apply_draw_card(const GameAction& action);
    OperationResult apply_play_card(const GameAction& action);
    OperationResult apply_attach_energy(const GameAction& action);
    OperationResult apply_use_attack(const GameAction& action);
    OperationResult apply_retreat(const GameAction& action);
    OperationResult apply_end_turn(const GameAction& action);
    void fire_card_trigger(const EffectTrigger& trigger, const PlayerID& controller,
                           const CardID& card_id, const std::optional<CardID>& target);
};

} // namespace ptcg
