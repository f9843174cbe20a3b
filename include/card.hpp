/**
 * PTCG Core - Card Definitions
 *
 * Immutable card data: identity, kind (Pokemon / Energy / Trainer),
 * attacks with their damage modes, and abilities.
 * Cards are owned by the CardDatabase and referenced everywhere else by id.
 */

#pragma once

#include "types.hpp"
#include "special_condition.hpp"
#include <variant>

namespace ptcg {

// ============================================================================
// DAMAGE MODES
// ============================================================================

enum class DamageModeType : uint8_t {
    PER_ENERGY,
    COIN_FLIP,
    PER_POKEMON,
    VARIABLE
};

/**
 * Extra damage calculation attached to an attack.
 *
 * PER_ENERGY:  per_energy * attached energy (energy_type optional filter)
 * COIN_FLIP:   per_heads * heads over `flips` flips
 * PER_POKEMON: per_pokemon * Pokemon at `location`
 * VARIABLE:    damage in [min, max]
 */
struct DamageMode {
    DamageModeType type = DamageModeType::PER_ENERGY;
    int per_energy = 0;
    std::optional<EnergyType> energy_type;
    int per_heads = 0;
    int flips = 0;
    int per_pokemon = 0;
    std::string location;
    int min = 0;
    int max = 0;

    static DamageMode per_energy_mode(int per, std::optional<EnergyType> type = std::nullopt) {
        DamageMode m;
        m.type = DamageModeType::PER_ENERGY;
        m.per_energy = per;
        m.energy_type = type;
        return m;
    }

    static DamageMode coin_flip_mode(int per_heads, int flips) {
        DamageMode m;
        m.type = DamageModeType::COIN_FLIP;
        m.per_heads = per_heads;
        m.flips = flips;
        return m;
    }

    static DamageMode per_pokemon_mode(int per, const std::string& location) {
        DamageMode m;
        m.type = DamageModeType::PER_POKEMON;
        m.per_pokemon = per;
        m.location = location;
        return m;
    }

    static DamageMode variable_mode(int min, int max) {
        DamageMode m;
        m.type = DamageModeType::VARIABLE;
        m.min = min;
        m.max = max;
        return m;
    }
};

/**
 * Status effect an attack may inflict. probability is a percentage (0-100),
 * target is "defending" or "self".
 */
struct StatusEffect {
    SpecialCondition condition;
    int probability = 100;
    std::string target = "defending";
};

// ============================================================================
// ATTACKS AND ABILITIES
// ============================================================================

struct Attack {
    std::string name;
    EnergyCost cost;
    int damage = 0;
    std::optional<std::string> effect;
    std::optional<DamageMode> damage_mode;
    std::vector<StatusEffect> status_effects;
    std::vector<std::string> conditions;
    AttackTargetType target_type = AttackTargetType::ACTIVE;

    static Attack simple(const std::string& name, EnergyCost cost, int damage);

    static Attack with_status(const std::string& name, EnergyCost cost, int damage,
                              const SpecialCondition& status, int probability);

    static Attack coin_flip_damage(const std::string& name, EnergyCost cost,
                                   int base_damage, int damage_per_heads, int flips);

    void add_status_effect(const StatusEffect& effect) { status_effects.push_back(effect); }
    void add_condition(const std::string& condition) { conditions.push_back(condition); }
    void set_damage_mode(const DamageMode& mode) { damage_mode = mode; }
    void set_target_type(AttackTargetType target) { target_type = target; }

    /**
     * Damage this attack deals before weakness/resistance.
     *
     * @param energy_count Energy attached to the attacker
     * @param coin_results One entry per flip, true = heads
     */
    int calculate_damage(int energy_count, const std::vector<bool>& coin_results) const;

    /**
     * Number of coin flips the damage mode needs (0 if none).
     */
    int required_flips() const;
};

struct Ability {
    std::string name;
    std::string effect;
    std::string ability_type = "Ability";
};

// ============================================================================
// CARD KINDS
// ============================================================================

struct PokemonData {
    std::string species;
    std::optional<EnergyType> pokemon_type;  // matched against weakness/resistance
    int hp = 0;
    int retreat_cost = 0;
    std::optional<EnergyType> weakness;
    std::optional<EnergyType> resistance;
    EvolutionStage stage = EvolutionStage::BASIC;
    std::optional<std::string> evolves_from;
};

struct EnergyData {
    EnergyType energy_type = EnergyType::COLORLESS;
    bool is_basic = true;
};

struct TrainerData {
    TrainerType trainer_type = TrainerType::ITEM;
};

using CardKind = std::variant<PokemonData, EnergyData, TrainerData>;

// ============================================================================
// CARD
// ============================================================================

/**
 * Card - One card definition.
 *
 * attacks/abilities are only meaningful for Pokemon; add_attack and
 * add_ability ignore other kinds.
 */
struct Card {
    CardID id;
    std::string name;
    CardKind kind;
    std::string set_name;
    std::string set_number;
    CardRarity rarity = CardRarity::COMMON;
    std::vector<Attack> attacks;
    std::vector<Ability> abilities;
    std::vector<std::string> rules;
    std::unordered_map<std::string, std::string> metadata;

    Card() = default;

    Card(CardID card_id, std::string card_name, CardKind card_kind,
         std::string set = "", std::string number = "",
         CardRarity card_rarity = CardRarity::COMMON);

    // Factories
    static Card pokemon(const CardID& id, const std::string& name, int hp,
                        EvolutionStage stage = EvolutionStage::BASIC,
                        int retreat_cost = 1);
    static Card energy(const CardID& id, const std::string& name, EnergyType type,
                       bool is_basic = true);
    static Card trainer(const CardID& id, const std::string& name, TrainerType type);

    // Kind queries
    bool is_pokemon() const { return std::holds_alternative<PokemonData>(kind); }
    bool is_energy() const { return std::holds_alternative<EnergyData>(kind); }
    bool is_trainer() const { return std::holds_alternative<TrainerData>(kind); }

    bool is_basic_pokemon() const {
        const auto* p = pokemon_data();
        return p && p->stage == EvolutionStage::BASIC;
    }

    bool is_basic_energy() const {
        const auto* e = energy_data();
        return e && e->is_basic;
    }

    const PokemonData* pokemon_data() const { return std::get_if<PokemonData>(&kind); }
    PokemonData* pokemon_data() { return std::get_if<PokemonData>(&kind); }
    const EnergyData* energy_data() const { return std::get_if<EnergyData>(&kind); }
    const TrainerData* trainer_data() const { return std::get_if<TrainerData>(&kind); }

    std::optional<int> get_hp() const;
    std::optional<EnergyType> get_energy_type() const;

    // Mutators
    void add_attack(const Attack& attack);
    void add_ability(const Ability& ability);
    void add_rule(const std::string& rule) { rules.push_back(rule); }
    void add_metadata(const std::string& key, const std::string& value) { metadata[key] = value; }

    /**
     * Attacks whose cost is covered by the attached energy.
     * Typed costs must match exactly; Colorless is paid by any leftover energy.
     *
     * @return (attack index, attack) pairs in attack order
     */
    std::vector<std::pair<size_t, const Attack*>> get_usable_attacks(
        const std::vector<EnergyType>& attached_energy) const;

    static bool can_pay_cost(const EnergyCost& cost, const std::vector<EnergyType>& attached_energy);
};

} // namespace ptcg
