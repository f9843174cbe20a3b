/**
 * PTCG Core - Player Implementation
 */

#include "player.hpp"
#include <algorithm>

namespace ptcg {

namespace {

bool remove_first(std::vector<CardID>& zone, const CardID& card_id) {
    auto it = std::find(zone.begin(), zone.end(), card_id);
    if (it == zone.end()) return false;
    zone.erase(it);
    return true;
}

bool contains(const std::vector<CardID>& zone, const CardID& card_id) {
    return std::find(zone.begin(), zone.end(), card_id) != zone.end();
}

} // anonymous namespace

Player::Player(PlayerID player_id, std::string player_name)
    : id(std::move(player_id))
    , name(std::move(player_name))
{}

// ============================================================================
// DECK AND HAND
// ============================================================================

void Player::shuffle_deck(std::mt19937& rng) {
    std::shuffle(deck.begin(), deck.end(), rng);
}

std::optional<CardID> Player::draw_card() {
    if (deck.empty()) {
        return std::nullopt;
    }
    CardID card = deck.back();
    deck.pop_back();
    hand.push_back(card);
    return card;
}

std::vector<CardID> Player::draw_cards(size_t count) {
    std::vector<CardID> drawn;
    for (size_t i = 0; i < count; i++) {
        auto card = draw_card();
        if (!card.has_value()) break;
        drawn.push_back(*card);
    }
    return drawn;
}

bool Player::discard_from_hand(const CardID& card_id) {
    if (!remove_first(hand, card_id)) {
        return false;
    }
    discard_pile.push_back(card_id);
    return true;
}

void Player::return_hand_to_deck() {
    deck.insert(deck.end(), hand.begin(), hand.end());
    hand.clear();
}

// ============================================================================
// BOARD
// ============================================================================

bool Player::set_active_pokemon(const CardID& card_id) {
    bool in_hand = contains(hand, card_id);
    bool in_bench = contains(bench, card_id);
    if (!in_hand && !in_bench) {
        return false;
    }

    // Promoting from hand with a full bench leaves no room for the old active
    if (in_hand && !in_bench && active_pokemon.has_value() && bench.size() >= MAX_BENCH_SIZE) {
        return false;
    }

    if (in_bench) {
        remove_first(bench, card_id);
    } else {
        remove_first(hand, card_id);
    }

    if (active_pokemon.has_value()) {
        bench.push_back(*active_pokemon);
    }
    active_pokemon = card_id;
    return true;
}

bool Player::bench_pokemon(const CardID& card_id) {
    if (bench.size() >= MAX_BENCH_SIZE) {
        return false;
    }
    if (!remove_first(hand, card_id)) {
        return false;
    }
    bench.push_back(card_id);
    return true;
}

bool Player::attach_energy(const CardID& energy_id, const CardID& pokemon_id) {
    if (!is_in_play(pokemon_id) || !contains(hand, energy_id)) {
        return false;
    }
    remove_first(hand, energy_id);
    attached_energy[pokemon_id].push_back(energy_id);
    return true;
}

bool Player::retreat(const CardID& bench_pokemon_id, int cost) {
    if (!active_pokemon.has_value() || !contains(bench, bench_pokemon_id)) {
        return false;
    }
    CardID old_active = *active_pokemon;
    if (static_cast<int>(get_attached_energy_count(old_active)) < cost) {
        return false;
    }

    auto energy_it = attached_energy.find(old_active);
    for (int i = 0; i < cost && energy_it != attached_energy.end(); i++) {
        discard_pile.push_back(energy_it->second.back());
        energy_it->second.pop_back();
    }
    if (energy_it != attached_energy.end() && energy_it->second.empty()) {
        attached_energy.erase(energy_it);
    }

    // Retreating cures conditions on the Pokemon leaving the active spot
    clear_special_conditions(old_active);

    auto bench_it = std::find(bench.begin(), bench.end(), bench_pokemon_id);
    *bench_it = old_active;
    active_pokemon = bench_pokemon_id;
    return true;
}

bool Player::knock_out_pokemon(const CardID& pokemon_id) {
    if (active_pokemon.has_value() && *active_pokemon == pokemon_id) {
        active_pokemon.reset();
    } else if (!remove_first(bench, pokemon_id)) {
        return false;
    }

    auto energy_it = attached_energy.find(pokemon_id);
    if (energy_it != attached_energy.end()) {
        discard_pile.insert(discard_pile.end(), energy_it->second.begin(), energy_it->second.end());
        attached_energy.erase(energy_it);
    }
    damage_counters.erase(pokemon_id);
    special_conditions.erase(pokemon_id);
    discard_pile.push_back(pokemon_id);
    return true;
}

bool Player::is_in_play(const CardID& pokemon_id) const {
    return (active_pokemon.has_value() && *active_pokemon == pokemon_id) || contains(bench, pokemon_id);
}

std::vector<CardID> Player::get_pokemon_in_play() const {
    std::vector<CardID> pokemon;
    if (active_pokemon.has_value()) {
        pokemon.push_back(*active_pokemon);
    }
    pokemon.insert(pokemon.end(), bench.begin(), bench.end());
    return pokemon;
}

// ============================================================================
// DAMAGE AND ENERGY
// ============================================================================

void Player::add_damage(const CardID& pokemon_id, int damage) {
    if (damage <= 0) return;
    damage_counters[pokemon_id] += damage;
}

void Player::heal_damage(const CardID& pokemon_id, int amount) {
    auto it = damage_counters.find(pokemon_id);
    if (it == damage_counters.end()) return;

    it->second = std::max(0, it->second - amount);
    if (it->second == 0) {
        damage_counters.erase(it);
    }
}

int Player::get_damage(const CardID& pokemon_id) const {
    auto it = damage_counters.find(pokemon_id);
    return it != damage_counters.end() ? it->second : 0;
}

bool Player::is_pokemon_knocked_out(const CardID& pokemon_id, const Card& card) const {
    auto hp = card.get_hp();
    if (!hp.has_value()) {
        return false;
    }
    return get_damage(pokemon_id) >= *hp;
}

size_t Player::get_attached_energy_count(const CardID& pokemon_id) const {
    auto it = attached_energy.find(pokemon_id);
    return it != attached_energy.end() ? it->second.size() : 0;
}

std::vector<EnergyType> Player::get_attached_energy_types(const CardID& pokemon_id,
                                                          const CardDatabase& db) const {
    std::vector<EnergyType> types;
    auto it = attached_energy.find(pokemon_id);
    if (it == attached_energy.end()) {
        return types;
    }
    for (const auto& energy_id : it->second) {
        const Card* card = db.get_card(energy_id);
        if (card) {
            auto type = card->get_energy_type();
            if (type.has_value()) {
                types.push_back(*type);
            }
        }
    }
    return types;
}

// ============================================================================
// PRIZES AND RESULT
// ============================================================================

bool Player::take_prize_card() {
    if (prize_cards <= 0) {
        return false;
    }
    prize_cards--;
    if (!prizes.empty()) {
        hand.push_back(prizes.back());
        prizes.pop_back();
    }
    return true;
}

std::vector<CardID> Player::draw_prize_cards(size_t count) {
    std::vector<CardID> drawn;
    for (size_t i = 0; i < count && !deck.empty(); i++) {
        drawn.push_back(deck.back());
        deck.pop_back();
    }
    return drawn;
}

void Player::start_turn() {
    has_attacked = false;
    can_play_trainer = true;
    energy_attached_this_turn = false;
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<CardLocation> Player::find_card_location(const CardID& card_id) const {
    CardLocation location;

    if (contains(hand, card_id)) {
        location.type = LocationType::HAND;
        return location;
    }
    if (contains(deck, card_id)) {
        location.type = LocationType::DECK;
        return location;
    }
    if (contains(discard_pile, card_id)) {
        location.type = LocationType::DISCARD_PILE;
        return location;
    }
    if (active_pokemon.has_value() && *active_pokemon == card_id) {
        location.type = LocationType::ACTIVE;
        return location;
    }
    auto bench_it = std::find(bench.begin(), bench.end(), card_id);
    if (bench_it != bench.end()) {
        location.type = LocationType::BENCH;
        location.bench_index = static_cast<size_t>(bench_it - bench.begin());
        return location;
    }
    if (contains(prizes, card_id)) {
        location.type = LocationType::PRIZES;
        return location;
    }
    for (const auto& [pokemon_id, energy] : attached_energy) {
        if (contains(energy, card_id)) {
            location.type = LocationType::ATTACHED_ENERGY;
            location.attached_to = pokemon_id;
            return location;
        }
    }
    return std::nullopt;
}

std::vector<CardID> Player::find_basic_pokemon_in_hand(const CardDatabase& db) const {
    std::vector<CardID> basics;
    for (const auto& card_id : hand) {
        const Card* card = db.get_card(card_id);
        if (card && card->is_basic_pokemon()) {
            basics.push_back(card_id);
        }
    }
    return basics;
}

bool Player::hand_contains(const CardID& card_id) const {
    return contains(hand, card_id);
}

// ============================================================================
// SPECIAL CONDITIONS
// ============================================================================

void Player::add_special_condition(const CardID& pokemon_id, const SpecialCondition& condition,
                                   int duration, uint32_t current_turn) {
    add_special_condition_with_data(pokemon_id, condition, duration, current_turn, {});
}

void Player::add_special_condition_with_data(const CardID& pokemon_id, const SpecialCondition& condition,
                                             int duration, uint32_t current_turn,
                                             std::unordered_map<std::string, std::string> data) {
    SpecialConditionInstance instance;
    instance.condition = condition;
    instance.duration = duration;
    instance.applied_turn = current_turn;
    instance.data = std::move(data);
    special_conditions[pokemon_id].push_back(std::move(instance));
}

void Player::remove_special_condition_type(const CardID& pokemon_id, ConditionKind kind) {
    auto it = special_conditions.find(pokemon_id);
    if (it == special_conditions.end()) return;

    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [kind](const SpecialConditionInstance& inst) {
                                  return inst.condition.kind == kind;
                              }),
               list.end());
    if (list.empty()) {
        special_conditions.erase(it);
    }
}

void Player::clear_special_conditions(const CardID& pokemon_id) {
    special_conditions.erase(pokemon_id);
}

bool Player::has_special_condition_type(const CardID& pokemon_id, ConditionKind kind) const {
    auto it = special_conditions.find(pokemon_id);
    if (it == special_conditions.end()) return false;
    for (const auto& inst : it->second) {
        if (inst.condition.kind == kind) return true;
    }
    return false;
}

std::vector<SpecialConditionInstance> Player::get_special_conditions(const CardID& pokemon_id) const {
    auto it = special_conditions.find(pokemon_id);
    if (it == special_conditions.end()) return {};
    return it->second;
}

std::vector<ConditionEffect> Player::update_special_conditions(uint32_t /*current_turn*/) {
    std::vector<ConditionEffect> effects;

    for (auto& [pokemon_id, conditions] : special_conditions) {
        std::vector<SpecialConditionInstance> remaining;

        for (auto& inst : conditions) {
            const auto& condition = inst.condition;

            if (condition.kind == ConditionKind::POISONED || condition.kind == ConditionKind::BURNED) {
                ConditionEffect damage;
                damage.type = ConditionEffectType::DAMAGE;
                damage.pokemon_id = pokemon_id;
                damage.amount = condition.damage_per_turn;
                damage.source = condition.kind == ConditionKind::POISONED ? "Poison" : "Burn";
                effects.push_back(damage);
            }

            if (condition.kind == ConditionKind::BURNED) {
                ConditionEffect flip;
                flip.type = ConditionEffectType::COIN_FLIP;
                flip.pokemon_id = pokemon_id;
                flip.condition = "Burn removal";
                flip.on_success = "Remove burn condition";
                effects.push_back(flip);
            } else if (condition.kind == ConditionKind::ASLEEP) {
                ConditionEffect flip;
                flip.type = ConditionEffectType::COIN_FLIP;
                flip.pokemon_id = pokemon_id;
                flip.condition = "Wake up";
                flip.on_success = "Remove sleep condition";
                effects.push_back(flip);
            }

            if (inst.duration > 0) {
                inst.duration--;
                if (inst.duration == 0) {
                    ConditionEffect removed;
                    removed.type = ConditionEffectType::CONDITION_REMOVED;
                    removed.pokemon_id = pokemon_id;
                    removed.condition = condition.to_string();
                    effects.push_back(removed);
                    continue;
                }
            }
            remaining.push_back(std::move(inst));
        }

        conditions = std::move(remaining);
    }

    for (auto it = special_conditions.begin(); it != special_conditions.end();) {
        if (it->second.empty()) {
            it = special_conditions.erase(it);
        } else {
            ++it;
        }
    }

    return effects;
}

int Player::apply_condition_effects(const std::vector<ConditionEffect>& effects, std::mt19937& rng) {
    std::bernoulli_distribution coin(0.5);
    int total_damage = 0;

    for (const auto& effect : effects) {
        switch (effect.type) {
            case ConditionEffectType::DAMAGE:
                add_damage(effect.pokemon_id, effect.amount);
                total_damage += effect.amount;
                break;
            case ConditionEffectType::COIN_FLIP:
                if (coin(rng)) {
                    ConditionKind kind = effect.condition == "Wake up" ? ConditionKind::ASLEEP
                                                                       : ConditionKind::BURNED;
                    remove_special_condition_type(effect.pokemon_id, kind);
                }
                break;
            case ConditionEffectType::CONDITION_REMOVED:
            case ConditionEffectType::PREVENT_ACTION:
                break;
        }
    }
    return total_damage;
}

bool Player::can_pokemon_attack(const CardID& pokemon_id) const {
    return !has_special_condition_type(pokemon_id, ConditionKind::PARALYZED) &&
           !has_special_condition_type(pokemon_id, ConditionKind::ASLEEP);
}

bool Player::can_pokemon_retreat(const CardID& pokemon_id) const {
    return !has_special_condition_type(pokemon_id, ConditionKind::TRAPPED);
}

} // namespace ptcg
