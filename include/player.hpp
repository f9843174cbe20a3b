/**
 * PTCG Core - Player
 *
 * One player's zones, board, counters and per-turn flags. All cards are
 * held by id; card data is looked up in the CardDatabase when needed.
 *
 * Zone invariants: active and bench never share a card with hand, deck or
 * discard, and the bench holds at most MAX_BENCH_SIZE Pokemon.
 */

#pragma once

#include "card_database.hpp"
#include "special_condition.hpp"
#include <map>
#include <random>

namespace ptcg {

class Player {
public:
    static constexpr size_t MAX_BENCH_SIZE = 5;
    static constexpr int DEFAULT_PRIZE_CARDS = 6;

    PlayerID id;
    std::string name;

    // Zones. The top of the deck is the back of the vector.
    std::vector<CardID> hand;
    std::vector<CardID> deck;
    std::vector<CardID> discard_pile;
    std::vector<CardID> prizes;

    // Board
    std::optional<CardID> active_pokemon;
    std::vector<CardID> bench;

    // Board bookkeeping, keyed by the Pokemon's id
    std::map<CardID, std::vector<CardID>> attached_energy;
    std::map<CardID, int> damage_counters;  // damage points, not counters of 10
    std::map<CardID, std::vector<SpecialConditionInstance>> special_conditions;

    // Counters
    int prize_cards = DEFAULT_PRIZE_CARDS;

    // Turn Flags - reset each turn
    bool has_attacked = false;
    bool can_play_trainer = true;
    bool energy_attached_this_turn = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Player() = default;
    Player(PlayerID player_id, std::string player_name);

    // ========================================================================
    // DECK AND HAND
    // ========================================================================

    void set_deck(std::vector<CardID> cards) { deck = std::move(cards); }
    void shuffle_deck(std::mt19937& rng);

    std::optional<CardID> draw_card();

    /**
     * Draw up to count cards; stops early when the deck runs out.
     */
    std::vector<CardID> draw_cards(size_t count);

    bool discard_from_hand(const CardID& card_id);

    /**
     * Return the whole hand to the deck (used by mulligans).
     */
    void return_hand_to_deck();

    // ========================================================================
    // BOARD
    // ========================================================================

    /**
     * Make a card from hand or bench the active Pokemon. The previous active
     * moves to the bench. Fails when the card is in neither zone, or when
     * the displaced active would overflow the bench.
     */
    bool set_active_pokemon(const CardID& card_id);

    /**
     * Move a card from hand to the bench. Fails on a full bench or a card
     * not in hand.
     */
    bool bench_pokemon(const CardID& card_id);

    /**
     * Move an energy from hand onto an in-play Pokemon.
     */
    bool attach_energy(const CardID& energy_id, const CardID& pokemon_id);

    /**
     * Swap the active with a bench Pokemon, discarding `cost` energy from
     * the old active (most recently attached first).
     */
    bool retreat(const CardID& bench_pokemon_id, int cost);

    /**
     * Move a Pokemon and its attached energy to the discard pile and clear
     * its damage and conditions.
     */
    bool knock_out_pokemon(const CardID& pokemon_id);

    bool is_in_play(const CardID& pokemon_id) const;
    std::vector<CardID> get_pokemon_in_play() const;

    // ========================================================================
    // DAMAGE AND ENERGY
    // ========================================================================

    void add_damage(const CardID& pokemon_id, int damage);

    /**
     * Remove up to amount damage; the entry is erased once it reaches 0.
     */
    void heal_damage(const CardID& pokemon_id, int amount);

    int get_damage(const CardID& pokemon_id) const;

    bool is_pokemon_knocked_out(const CardID& pokemon_id, const Card& card) const;

    size_t get_attached_energy_count(const CardID& pokemon_id) const;

    std::vector<EnergyType> get_attached_energy_types(const CardID& pokemon_id,
                                                      const CardDatabase& db) const;

    // ========================================================================
    // PRIZES AND RESULT
    // ========================================================================

    /**
     * Take one prize: decrements the count and moves the top prize card
     * (if any) to hand.
     */
    bool take_prize_card();

    /**
     * Pop up to count cards off the deck top for use as prizes.
     */
    std::vector<CardID> draw_prize_cards(size_t count);

    void start_turn();

    bool has_lost() const { return !active_pokemon.has_value() && bench.empty(); }
    bool has_won() const { return prize_cards == 0; }

    // ========================================================================
    // QUERIES
    // ========================================================================

    std::optional<CardLocation> find_card_location(const CardID& card_id) const;

    std::vector<CardID> find_basic_pokemon_in_hand(const CardDatabase& db) const;

    bool hand_contains(const CardID& card_id) const;

    // ========================================================================
    // SPECIAL CONDITIONS
    // ========================================================================

    void add_special_condition(const CardID& pokemon_id, const SpecialCondition& condition,
                               int duration, uint32_t current_turn);

    void add_special_condition_with_data(const CardID& pokemon_id, const SpecialCondition& condition,
                                         int duration, uint32_t current_turn,
                                         std::unordered_map<std::string, std::string> data);

    /**
     * Remove every condition of the given kind (payload ignored).
     */
    void remove_special_condition_type(const CardID& pokemon_id, ConditionKind kind);

    void clear_special_conditions(const CardID& pokemon_id);

    bool has_special_condition_type(const CardID& pokemon_id, ConditionKind kind) const;

    std::vector<SpecialConditionInstance> get_special_conditions(const CardID& pokemon_id) const;

    /**
     * Between-turns tick: report poison/burn damage and pending coin flips,
     * count down durations and drop expired conditions.
     *
     * @return Effects in Pokemon-id order, then condition order
     */
    std::vector<ConditionEffect> update_special_conditions(uint32_t current_turn);

    /**
     * Resolve a tick's effects: apply damage, flip coins for burn removal
     * and waking up.
     *
     * @return Number of damage points applied
     */
    int apply_condition_effects(const std::vector<ConditionEffect>& effects, std::mt19937& rng);

    bool can_pokemon_attack(const CardID& pokemon_id) const;
    bool can_pokemon_retreat(const CardID& pokemon_id) const;
};

} // namespace ptcg
