/**
 * PTCG Core - Special Conditions
 *
 * Duration-bound status effects attached to Pokemon in play, the effects a
 * between-turns tick produces, and card locations for a player.
 */

#pragma once

#include "types.hpp"
#include <variant>

namespace ptcg {

// ============================================================================
// SPECIAL CONDITION KINDS
// ============================================================================

enum class ConditionKind : uint8_t {
    POISONED,
    BURNED,
    PARALYZED,
    ASLEEP,
    CONFUSED,
    TRAPPED,
    CUSTOM
};

inline const char* to_string(ConditionKind kind) {
    switch (kind) {
        case ConditionKind::POISONED: return "Poisoned";
        case ConditionKind::BURNED: return "Burned";
        case ConditionKind::PARALYZED: return "Paralyzed";
        case ConditionKind::ASLEEP: return "Asleep";
        case ConditionKind::CONFUSED: return "Confused";
        case ConditionKind::TRAPPED: return "Trapped";
        case ConditionKind::CUSTOM: return "Custom";
        default: return "Unknown";
    }
}

/**
 * SpecialCondition - One status condition.
 *
 * damage_per_turn is meaningful for POISONED and BURNED;
 * name/description for CUSTOM.
 */
struct SpecialCondition {
    ConditionKind kind = ConditionKind::POISONED;
    int damage_per_turn = 0;
    std::string name;
    std::string description;

    static SpecialCondition poisoned(int damage = 10) {
        SpecialCondition c;
        c.kind = ConditionKind::POISONED;
        c.damage_per_turn = damage;
        return c;
    }

    static SpecialCondition burned(int damage = 20) {
        SpecialCondition c;
        c.kind = ConditionKind::BURNED;
        c.damage_per_turn = damage;
        return c;
    }

    static SpecialCondition paralyzed() { return of(ConditionKind::PARALYZED); }
    static SpecialCondition asleep() { return of(ConditionKind::ASLEEP); }
    static SpecialCondition confused() { return of(ConditionKind::CONFUSED); }
    static SpecialCondition trapped() { return of(ConditionKind::TRAPPED); }

    static SpecialCondition custom(const std::string& name, const std::string& description) {
        SpecialCondition c;
        c.kind = ConditionKind::CUSTOM;
        c.name = name;
        c.description = description;
        return c;
    }

    static SpecialCondition of(ConditionKind kind) {
        SpecialCondition c;
        c.kind = kind;
        return c;
    }

    std::string to_string() const {
        switch (kind) {
            case ConditionKind::POISONED:
            case ConditionKind::BURNED:
                return std::string(ptcg::to_string(kind)) + "(" + std::to_string(damage_per_turn) + ")";
            case ConditionKind::CUSTOM:
                return "Custom(" + name + ")";
            default:
                return ptcg::to_string(kind);
        }
    }

    bool operator==(const SpecialCondition& other) const {
        return kind == other.kind &&
               damage_per_turn == other.damage_per_turn &&
               name == other.name &&
               description == other.description;
    }
};

/**
 * An applied condition. duration counts down once per tick; -1 never expires.
 */
struct SpecialConditionInstance {
    SpecialCondition condition;
    int duration = -1;
    uint32_t applied_turn = 0;
    std::unordered_map<std::string, std::string> data;
};

// ============================================================================
// CONDITION TICK EFFECTS
// ============================================================================

enum class ConditionEffectType : uint8_t {
    DAMAGE,
    COIN_FLIP,
    CONDITION_REMOVED,
    PREVENT_ACTION
};

/**
 * ConditionEffect - One consequence of a between-turns tick.
 *
 * DAMAGE: amount + source ("Poison"/"Burn")
 * COIN_FLIP: condition ("Burn removal"/"Wake up") + on_success
 * CONDITION_REMOVED: condition (the expired condition's text)
 * PREVENT_ACTION: action
 */
struct ConditionEffect {
    ConditionEffectType type = ConditionEffectType::DAMAGE;
    CardID pokemon_id;
    int amount = 0;
    std::string source;
    std::string condition;
    std::string on_success;
    std::string action;
};

// ============================================================================
// CARD LOCATION
// ============================================================================

enum class LocationType : uint8_t {
    HAND,
    DECK,
    DISCARD_PILE,
    ACTIVE,
    BENCH,
    PRIZES,
    ATTACHED_ENERGY
};

/**
 * Where a card sits for one player. bench_index is set for BENCH,
 * attached_to for ATTACHED_ENERGY.
 */
struct CardLocation {
    LocationType type = LocationType::HAND;
    size_t bench_index = 0;
    CardID attached_to;

    bool is_in_play() const {
        return type == LocationType::ACTIVE ||
               type == LocationType::BENCH ||
               type == LocationType::ATTACHED_ENERGY;
    }

    bool operator==(const CardLocation& other) const {
        return type == other.type && bench_index == other.bench_index && attached_to == other.attached_to;
    }
};

} // namespace ptcg
