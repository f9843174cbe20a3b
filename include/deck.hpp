/**
 * PTCG Core - Deck
 *
 * A named multiset of card ids with a format tag. Size and copy limits are
 * enforced by validate(), never by the mutators.
 */

#pragma once

#include "card_database.hpp"
#include <map>
#include <random>

namespace ptcg {

// ============================================================================
// VALIDATION
// ============================================================================

enum class DeckErrorType : uint8_t {
    TOO_FEW_CARDS,
    TOO_MANY_CARDS,
    TOO_MANY_COPIES,
    NO_BASIC_POKEMON,
    INVALID_CARD
};

/**
 * One deck validation failure.
 *
 * TOO_FEW_CARDS: minimum + actual
 * TOO_MANY_CARDS: maximum + actual
 * TOO_MANY_COPIES: card_id + maximum + actual
 * INVALID_CARD: card_id (not in the card database)
 */
struct DeckValidationError {
    DeckErrorType type = DeckErrorType::TOO_FEW_CARDS;
    CardID card_id;
    int minimum = 0;
    int maximum = 0;
    int actual = 0;

    static DeckValidationError too_few_cards(int minimum, int actual);
    static DeckValidationError too_many_cards(int maximum, int actual);
    static DeckValidationError too_many_copies(const CardID& card, int maximum, int actual);
    static DeckValidationError no_basic_pokemon();
    static DeckValidationError invalid_card(const CardID& card);

    std::string to_string() const;

    bool operator==(const DeckValidationError& other) const {
        return type == other.type && card_id == other.card_id &&
               minimum == other.minimum && maximum == other.maximum && actual == other.actual;
    }
};

struct DeckStatistics {
    int total_cards = 0;
    int unique_cards = 0;
    int pokemon_count = 0;
    int trainer_count = 0;
    int energy_count = 0;
    int basic_pokemon_count = 0;
    std::map<EnergyType, int> energy_distribution;

    bool operator==(const DeckStatistics& other) const {
        return total_cards == other.total_cards &&
               unique_cards == other.unique_cards &&
               pokemon_count == other.pokemon_count &&
               trainer_count == other.trainer_count &&
               energy_count == other.energy_count &&
               basic_pokemon_count == other.basic_pokemon_count &&
               energy_distribution == other.energy_distribution;
    }
};

// ============================================================================
// DECK
// ============================================================================

class Deck {
public:
    static constexpr int STANDARD_DECK_SIZE = 60;
    static constexpr int LIMITED_MIN_SIZE = 40;
    static constexpr int MAX_COPIES = 4;

    std::string id;
    std::string name;
    std::string format = "Standard";
    std::map<CardID, int> cards;  // ordered so expansion/shuffle are reproducible
    std::unordered_map<std::string, std::string> metadata;

    Deck() = default;
    Deck(std::string deck_name, std::string deck_format);

    // ========================================================================
    // MUTATORS
    // ========================================================================

    void add_card(const CardID& card_id, int quantity);
    void remove_card(const CardID& card_id, int quantity);
    void set_card_quantity(const CardID& card_id, int quantity);
    void add_metadata(const std::string& key, const std::string& value) { metadata[key] = value; }

    // ========================================================================
    // QUERIES
    // ========================================================================

    int get_card_quantity(const CardID& card_id) const;
    int total_cards() const;
    size_t unique_cards() const { return cards.size(); }
    bool contains_card(const CardID& card_id) const { return cards.count(card_id) > 0; }

    /**
     * Flatten to one id per copy, grouped by id in id order.
     */
    std::vector<CardID> to_card_list() const;

    static Deck from_card_list(const std::string& name, const std::string& format,
                               const std::vector<CardID>& card_list);

    /**
     * Flat list shuffled with the caller's engine.
     */
    std::vector<CardID> shuffle(std::mt19937& rng) const;

    /**
     * Check format size, copy limits and the Basic Pokemon requirement.
     *
     * @return Empty when the deck is legal, otherwise every failure found
     */
    std::vector<DeckValidationError> validate(const CardDatabase& db) const;

    bool is_valid(const CardDatabase& db) const { return validate(db).empty(); }

    DeckStatistics get_statistics(const CardDatabase& db) const;

    /**
     * Plain-text deck list grouped into Pokemon / Trainers / Energy.
     */
    std::string export_text(const CardDatabase& db) const;
};

} // namespace ptcg
