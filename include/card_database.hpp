/**
 * PTCG Core - Card Database
 *
 * Sole owner of Card values for a match. Players, decks and effects
 * refer to cards by id only.
 *
 * A deck holds several copies of one definition, so each physical copy in
 * play gets an instance id (e.g. "alice/pikachu#2") that aliases its
 * definition. Lookups accept either form.
 */

#pragma once

#include "card.hpp"
#include <unordered_map>

namespace ptcg {

/**
 * CardDatabase - Central card lookup.
 *
 * Read-mostly: cards are added before or between actions and looked up
 * during validation and execution.
 */
class CardDatabase {
public:
    CardDatabase() = default;
    ~CardDatabase() = default;

    /**
     * Add or replace a card definition.
     */
    void add_card(Card card);

    /**
     * Register a physical copy of a definition.
     */
    void register_instance(const CardID& instance_id, const CardID& definition_id);

    /**
     * Get a card definition by definition or instance ID.
     *
     * Returns nullptr if card not found.
     */
    const Card* get_card(const CardID& card_id) const;

    /**
     * Check if a card exists (definition or instance ID).
     */
    bool has_card(const CardID& card_id) const;

    /**
     * Resolve an instance ID to its definition ID. Definition IDs map to themselves.
     */
    CardID get_definition_id(const CardID& card_id) const;

    size_t instance_count() const { return instances_.size(); }

    /**
     * Get all card IDs (sorted).
     */
    std::vector<CardID> get_all_card_ids() const;

    /**
     * Get card count.
     */
    size_t card_count() const { return cards_.size(); }

private:
    std::unordered_map<CardID, Card> cards_;
    std::unordered_map<CardID, CardID> instances_;  // instance_id -> definition_id
};

} // namespace ptcg
