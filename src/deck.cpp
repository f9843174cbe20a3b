/**
 * PTCG Core - Deck Implementation
 */

#include "deck.hpp"
#include <algorithm>
#include <sstream>

namespace ptcg {

// ============================================================================
// VALIDATION ERRORS
// ============================================================================

DeckValidationError DeckValidationError::too_few_cards(int minimum, int actual) {
    DeckValidationError e;
    e.type = DeckErrorType::TOO_FEW_CARDS;
    e.minimum = minimum;
    e.actual = actual;
    return e;
}

DeckValidationError DeckValidationError::too_many_cards(int maximum, int actual) {
    DeckValidationError e;
    e.type = DeckErrorType::TOO_MANY_CARDS;
    e.maximum = maximum;
    e.actual = actual;
    return e;
}

DeckValidationError DeckValidationError::too_many_copies(const CardID& card, int maximum, int actual) {
    DeckValidationError e;
    e.type = DeckErrorType::TOO_MANY_COPIES;
    e.card_id = card;
    e.maximum = maximum;
    e.actual = actual;
    return e;
}

DeckValidationError DeckValidationError::no_basic_pokemon() {
    DeckValidationError e;
    e.type = DeckErrorType::NO_BASIC_POKEMON;
    return e;
}

DeckValidationError DeckValidationError::invalid_card(const CardID& card) {
    DeckValidationError e;
    e.type = DeckErrorType::INVALID_CARD;
    e.card_id = card;
    return e;
}

std::string DeckValidationError::to_string() const {
    std::ostringstream out;
    switch (type) {
        case DeckErrorType::TOO_FEW_CARDS:
            out << "Too few cards: " << actual << " (minimum " << minimum << ")";
            break;
        case DeckErrorType::TOO_MANY_CARDS:
            out << "Too many cards: " << actual << " (maximum " << maximum << ")";
            break;
        case DeckErrorType::TOO_MANY_COPIES:
            out << "Too many copies of " << card_id << ": " << actual << " (maximum " << maximum << ")";
            break;
        case DeckErrorType::NO_BASIC_POKEMON:
            out << "Deck has no Basic Pokemon";
            break;
        case DeckErrorType::INVALID_CARD:
            out << "Unknown card: " << card_id;
            break;
    }
    return out.str();
}

// ============================================================================
// MUTATORS
// ============================================================================

Deck::Deck(std::string deck_name, std::string deck_format)
    : name(std::move(deck_name))
    , format(std::move(deck_format))
{}

void Deck::add_card(const CardID& card_id, int quantity) {
    if (quantity > 0) {
        cards[card_id] += quantity;
    }
}

void Deck::remove_card(const CardID& card_id, int quantity) {
    auto it = cards.find(card_id);
    if (it == cards.end()) {
        return;
    }
    if (it->second <= quantity) {
        cards.erase(it);
    } else {
        it->second -= quantity;
    }
}

void Deck::set_card_quantity(const CardID& card_id, int quantity) {
    if (quantity <= 0) {
        cards.erase(card_id);
    } else {
        cards[card_id] = quantity;
    }
}

// ============================================================================
// QUERIES
// ============================================================================

int Deck::get_card_quantity(const CardID& card_id) const {
    auto it = cards.find(card_id);
    return it != cards.end() ? it->second : 0;
}

int Deck::total_cards() const {
    int total = 0;
    for (const auto& [card_id, quantity] : cards) {
        total += quantity;
    }
    return total;
}

std::vector<CardID> Deck::to_card_list() const {
    std::vector<CardID> list;
    list.reserve(static_cast<size_t>(total_cards()));
    for (const auto& [card_id, quantity] : cards) {
        for (int i = 0; i < quantity; i++) {
            list.push_back(card_id);
        }
    }
    return list;
}

Deck Deck::from_card_list(const std::string& name, const std::string& format,
                          const std::vector<CardID>& card_list) {
    Deck deck(name, format);
    for (const auto& card_id : card_list) {
        deck.add_card(card_id, 1);
    }
    return deck;
}

std::vector<CardID> Deck::shuffle(std::mt19937& rng) const {
    std::vector<CardID> list = to_card_list();
    std::shuffle(list.begin(), list.end(), rng);
    return list;
}

std::vector<DeckValidationError> Deck::validate(const CardDatabase& db) const {
    std::vector<DeckValidationError> errors;
    int total = total_cards();

    if (format == "Standard" || format == "Expanded") {
        if (total < STANDARD_DECK_SIZE) {
            errors.push_back(DeckValidationError::too_few_cards(STANDARD_DECK_SIZE, total));
        } else if (total > STANDARD_DECK_SIZE) {
            errors.push_back(DeckValidationError::too_many_cards(STANDARD_DECK_SIZE, total));
        }
    } else if (format == "Limited") {
        if (total < LIMITED_MIN_SIZE) {
            errors.push_back(DeckValidationError::too_few_cards(LIMITED_MIN_SIZE, total));
        }
    }
    // Any other format is custom: no size check

    bool has_basic_pokemon = false;

    for (const auto& [card_id, quantity] : cards) {
        const Card* card = db.get_card(card_id);
        if (!card) {
            errors.push_back(DeckValidationError::invalid_card(card_id));
            continue;
        }

        if (!card->is_basic_energy() && quantity > MAX_COPIES) {
            errors.push_back(DeckValidationError::too_many_copies(card_id, MAX_COPIES, quantity));
        }

        if (card->is_basic_pokemon()) {
            has_basic_pokemon = true;
        }
    }

    if (!has_basic_pokemon) {
        errors.push_back(DeckValidationError::no_basic_pokemon());
    }

    return errors;
}

DeckStatistics Deck::get_statistics(const CardDatabase& db) const {
    DeckStatistics stats;
    stats.total_cards = total_cards();
    stats.unique_cards = static_cast<int>(cards.size());

    for (const auto& [card_id, quantity] : cards) {
        const Card* card = db.get_card(card_id);
        if (!card) continue;

        if (const auto* pokemon = card->pokemon_data()) {
            stats.pokemon_count += quantity;
            if (pokemon->stage == EvolutionStage::BASIC) {
                stats.basic_pokemon_count += quantity;
            }
        } else if (const auto* energy = card->energy_data()) {
            stats.energy_count += quantity;
            stats.energy_distribution[energy->energy_type] += quantity;
        } else {
            stats.trainer_count += quantity;
        }
    }

    return stats;
}

std::string Deck::export_text(const CardDatabase& db) const {
    std::vector<std::pair<std::string, int>> pokemon;
    std::vector<std::pair<std::string, int>> trainers;
    std::vector<std::pair<std::string, int>> energy;

    for (const auto& [card_id, quantity] : cards) {
        const Card* card = db.get_card(card_id);
        if (!card) continue;

        if (card->is_pokemon()) {
            pokemon.emplace_back(card->name, quantity);
        } else if (card->is_trainer()) {
            trainers.emplace_back(card->name, quantity);
        } else {
            energy.emplace_back(card->name, quantity);
        }
    }

    std::vector<std::string> lines;
    lines.push_back("Deck: " + name);
    lines.push_back("Format: " + format);
    lines.push_back("");

    auto append_section = [&lines](const std::string& title,
                                   std::vector<std::pair<std::string, int>>& entries,
                                   bool trailing_blank) {
        if (entries.empty()) return;
        std::sort(entries.begin(), entries.end());
        lines.push_back(title);
        for (const auto& [card_name, quantity] : entries) {
            lines.push_back(std::to_string(quantity) + " " + card_name);
        }
        if (trailing_blank) lines.push_back("");
    };

    append_section("Pokemon:", pokemon, true);
    append_section("Trainers:", trainers, true);
    append_section("Energy:", energy, false);

    std::string text;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) text += "\n";
        text += lines[i];
    }
    return text;
}

} // namespace ptcg
