/**
 * PTCG Core - Card Database Implementation
 */

#include "card_database.hpp"
#include <algorithm>

namespace ptcg {

void CardDatabase::add_card(Card card) {
    CardID id = card.id;
    cards_[id] = std::move(card);
}

void CardDatabase::register_instance(const CardID& instance_id, const CardID& definition_id) {
    if (instance_id == definition_id) return;
    instances_[instance_id] = definition_id;
}

const Card* CardDatabase::get_card(const CardID& card_id) const {
    auto it = cards_.find(card_id);
    if (it != cards_.end()) {
        return &it->second;
    }

    auto inst = instances_.find(card_id);
    if (inst != instances_.end()) {
        auto def = cards_.find(inst->second);
        if (def != cards_.end()) {
            return &def->second;
        }
    }
    return nullptr;
}

bool CardDatabase::has_card(const CardID& card_id) const {
    return get_card(card_id) != nullptr;
}

CardID CardDatabase::get_definition_id(const CardID& card_id) const {
    auto inst = instances_.find(card_id);
    if (inst != instances_.end()) {
        return inst->second;
    }
    return card_id;
}

std::vector<CardID> CardDatabase::get_all_card_ids() const {
    std::vector<CardID> ids;
    ids.reserve(cards_.size());
    for (const auto& [id, card] : cards_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace ptcg
