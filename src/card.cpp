/**
 * PTCG Core - Card Implementation
 */

#include "card.hpp"
#include <algorithm>

namespace ptcg {

// ============================================================================
// ATTACK
// ============================================================================

Attack Attack::simple(const std::string& name, EnergyCost cost, int damage) {
    Attack a;
    a.name = name;
    a.cost = std::move(cost);
    a.damage = damage;
    return a;
}

Attack Attack::with_status(const std::string& name, EnergyCost cost, int damage,
                           const SpecialCondition& status, int probability) {
    Attack a = simple(name, std::move(cost), damage);
    StatusEffect effect;
    effect.condition = status;
    effect.probability = probability;
    effect.target = "defending";
    a.status_effects.push_back(effect);
    return a;
}

Attack Attack::coin_flip_damage(const std::string& name, EnergyCost cost,
                                int base_damage, int damage_per_heads, int flips) {
    Attack a = simple(name, std::move(cost), base_damage);
    a.damage_mode = DamageMode::coin_flip_mode(damage_per_heads, flips);
    return a;
}

int Attack::calculate_damage(int energy_count, const std::vector<bool>& coin_results) const {
    int total = damage;
    if (!damage_mode.has_value()) {
        return total;
    }

    switch (damage_mode->type) {
        case DamageModeType::PER_ENERGY:
            total += damage_mode->per_energy * energy_count;
            break;
        case DamageModeType::COIN_FLIP: {
            int heads = static_cast<int>(std::count(coin_results.begin(), coin_results.end(), true));
            total += damage_mode->per_heads * heads;
            break;
        }
        case DamageModeType::PER_POKEMON:
            // Board-independent estimate: two Pokemon at the location
            total += damage_mode->per_pokemon * 2;
            break;
        case DamageModeType::VARIABLE:
            total = damage_mode->min;
            break;
    }
    return total;
}

int Attack::required_flips() const {
    if (damage_mode.has_value() && damage_mode->type == DamageModeType::COIN_FLIP) {
        return damage_mode->flips;
    }
    return 0;
}

// ============================================================================
// CARD
// ============================================================================

Card::Card(CardID card_id, std::string card_name, CardKind card_kind,
           std::string set, std::string number, CardRarity card_rarity)
    : id(std::move(card_id))
    , name(std::move(card_name))
    , kind(std::move(card_kind))
    , set_name(std::move(set))
    , set_number(std::move(number))
    , rarity(card_rarity)
{}

Card Card::pokemon(const CardID& id, const std::string& name, int hp,
                   EvolutionStage stage, int retreat_cost) {
    PokemonData data;
    data.species = name;
    data.hp = hp;
    data.stage = stage;
    data.retreat_cost = retreat_cost;
    return Card(id, name, data);
}

Card Card::energy(const CardID& id, const std::string& name, EnergyType type, bool is_basic) {
    EnergyData data;
    data.energy_type = type;
    data.is_basic = is_basic;
    return Card(id, name, data);
}

Card Card::trainer(const CardID& id, const std::string& name, TrainerType type) {
    TrainerData data;
    data.trainer_type = type;
    return Card(id, name, data);
}

std::optional<int> Card::get_hp() const {
    if (const auto* p = pokemon_data()) {
        return p->hp;
    }
    return std::nullopt;
}

std::optional<EnergyType> Card::get_energy_type() const {
    if (const auto* e = energy_data()) {
        return e->energy_type;
    }
    return std::nullopt;
}

void Card::add_attack(const Attack& attack) {
    if (is_pokemon()) {
        attacks.push_back(attack);
    }
}

void Card::add_ability(const Ability& ability) {
    if (is_pokemon()) {
        abilities.push_back(ability);
    }
}

bool Card::can_pay_cost(const EnergyCost& cost, const std::vector<EnergyType>& attached_energy) {
    std::unordered_map<EnergyType, int> available;
    for (EnergyType type : attached_energy) {
        available[type]++;
    }

    int colorless_needed = 0;
    for (EnergyType type : cost) {
        if (type == EnergyType::COLORLESS) {
            colorless_needed++;
            continue;
        }
        auto it = available.find(type);
        if (it == available.end() || it->second == 0) {
            return false;
        }
        it->second--;
    }

    int leftover = 0;
    for (const auto& [type, count] : available) {
        leftover += count;
    }
    return leftover >= colorless_needed;
}

std::vector<std::pair<size_t, const Attack*>> Card::get_usable_attacks(
    const std::vector<EnergyType>& attached_energy) const {

    std::vector<std::pair<size_t, const Attack*>> usable;
    if (!is_pokemon()) {
        return usable;
    }

    for (size_t i = 0; i < attacks.size(); i++) {
        if (can_pay_cost(attacks[i].cost, attached_energy)) {
            usable.emplace_back(i, &attacks[i]);
        }
    }
    return usable;
}

} // namespace ptcg
