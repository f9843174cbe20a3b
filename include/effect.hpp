/**
 * PTCG Core - Effects
 *
 * Generic trigger/target/outcome framework for card effects. Concrete
 * effects derive from Effect and are attached to cards through the
 * EffectManager; the manager fires them when a matching trigger occurs.
 */

#pragma once

#include "types.hpp"
#include "special_condition.hpp"
#include "game_event.hpp"

namespace ptcg {

class Game;

// ============================================================================
// TRIGGERS
// ============================================================================

enum class TriggerType : uint8_t {
    ON_PLAY,
    ON_ENTER_PLAY,
    ON_LEAVE_PLAY,
    ON_KNOCK_OUT,
    ON_TURN_START,
    ON_TURN_END,
    ON_TAKE_DAMAGE,
    ON_DEAL_DAMAGE,
    ON_ATTACK,
    ON_ENERGY_ATTACH,
    ON_CARD_DRAW,
    ON_GAME_EVENT,  // detail = event type name
    MANUAL,
    ONCE            // detail = condition text
};

inline const char* to_string(TriggerType type) {
    switch (type) {
        case TriggerType::ON_PLAY: return "OnPlay";
        case TriggerType::ON_ENTER_PLAY: return "OnEnterPlay";
        case TriggerType::ON_LEAVE_PLAY: return "OnLeavePlay";
        case TriggerType::ON_KNOCK_OUT: return "OnKnockOut";
        case TriggerType::ON_TURN_START: return "OnTurnStart";
        case TriggerType::ON_TURN_END: return "OnTurnEnd";
        case TriggerType::ON_TAKE_DAMAGE: return "OnTakeDamage";
        case TriggerType::ON_DEAL_DAMAGE: return "OnDealDamage";
        case TriggerType::ON_ATTACK: return "OnAttack";
        case TriggerType::ON_ENERGY_ATTACH: return "OnEnergyAttach";
        case TriggerType::ON_CARD_DRAW: return "OnCardDraw";
        case TriggerType::ON_GAME_EVENT: return "OnGameEvent";
        case TriggerType::MANUAL: return "Manual";
        case TriggerType::ONCE: return "Once";
        default: return "Unknown";
    }
}

struct EffectTrigger {
    TriggerType type = TriggerType::MANUAL;
    std::string detail;

    EffectTrigger() = default;
    EffectTrigger(TriggerType t, std::string d = "") : type(t), detail(std::move(d)) {}

    static EffectTrigger on_game_event(EventType event) {
        return EffectTrigger(TriggerType::ON_GAME_EVENT, ptcg::to_string(event));
    }

    static EffectTrigger once(const std::string& condition) {
        return EffectTrigger(TriggerType::ONCE, condition);
    }

    bool operator==(const EffectTrigger& other) const {
        return type == other.type && detail == other.detail;
    }
    bool operator!=(const EffectTrigger& other) const { return !(*this == other); }

    std::string to_string() const {
        std::string result = ptcg::to_string(type);
        if (!detail.empty()) result += "(" + detail + ")";
        return result;
    }
};

// ============================================================================
// TARGETS
// ============================================================================

enum class TargetType : uint8_t {
    NONE,
    SELF,
    CARD,
    PLAYER,
    ALL_PLAYER_POKEMON,
    ALL_POKEMON,
    ACTIVE_POKEMON,
    RANDOM,
    CHOICE
};

/**
 * EffectTarget - What an effect acts on.
 *
 * id holds the card id for CARD and the player id for PLAYER,
 * ALL_PLAYER_POKEMON and ACTIVE_POKEMON.
 */
struct EffectTarget {
    TargetType type = TargetType::NONE;
    std::string id;
    std::string filter;           // RANDOM
    std::vector<CardID> options;  // CHOICE

    static EffectTarget none() { return {}; }
    static EffectTarget self() { return {TargetType::SELF, {}, {}, {}}; }
    static EffectTarget card(const CardID& card_id) { return {TargetType::CARD, card_id, {}, {}}; }
    static EffectTarget player(const PlayerID& player_id) { return {TargetType::PLAYER, player_id, {}, {}}; }
    static EffectTarget all_player_pokemon(const PlayerID& player_id) {
        return {TargetType::ALL_PLAYER_POKEMON, player_id, {}, {}};
    }
    static EffectTarget all_pokemon() { return {TargetType::ALL_POKEMON, {}, {}, {}}; }
    static EffectTarget active_pokemon(const PlayerID& player_id) {
        return {TargetType::ACTIVE_POKEMON, player_id, {}, {}};
    }
    static EffectTarget random(const std::string& filter) { return {TargetType::RANDOM, {}, filter, {}}; }
    static EffectTarget choice(std::vector<CardID> options) {
        return {TargetType::CHOICE, {}, {}, std::move(options)};
    }
};

enum class RequirementType : uint8_t {
    POKEMON,
    ENERGY,
    TRAINER,
    IN_PLAY,
    IN_HAND,
    IN_DISCARD,
    OWNED_BY,
    HAS_ENERGY_TYPE,
    MIN_HP,
    MIN_DAMAGE,
    CUSTOM
};

struct TargetRequirement {
    RequirementType type = RequirementType::POKEMON;
    PlayerID player;                                // OWNED_BY
    EnergyType energy_type = EnergyType::COLORLESS;  // HAS_ENERGY_TYPE
    int value = 0;                                  // MIN_HP, MIN_DAMAGE
    std::string text;                               // CUSTOM

    static TargetRequirement of(RequirementType t) {
        TargetRequirement r;
        r.type = t;
        return r;
    }
    static TargetRequirement owned_by(const PlayerID& player_id) {
        TargetRequirement r = of(RequirementType::OWNED_BY);
        r.player = player_id;
        return r;
    }
    static TargetRequirement has_energy_type(EnergyType type) {
        TargetRequirement r = of(RequirementType::HAS_ENERGY_TYPE);
        r.energy_type = type;
        return r;
    }
    static TargetRequirement min_hp(int hp) {
        TargetRequirement r = of(RequirementType::MIN_HP);
        r.value = hp;
        return r;
    }
    static TargetRequirement min_damage(int damage) {
        TargetRequirement r = of(RequirementType::MIN_DAMAGE);
        r.value = damage;
        return r;
    }
    static TargetRequirement custom(const std::string& text) {
        TargetRequirement r = of(RequirementType::CUSTOM);
        r.text = text;
        return r;
    }
};

/**
 * Check a card against every requirement. CUSTOM requirements are
 * descriptive and always pass.
 */
bool meets_requirements(const Game& game, const CardID& card_id,
                        const std::vector<TargetRequirement>& requirements);

// ============================================================================
// CONTEXT, OUTCOMES AND ERRORS
// ============================================================================

struct EffectContext {
    CardID source_card;
    PlayerID controller;
    EffectTarget target;
    std::unordered_map<std::string, std::string> parameters;
    std::optional<EffectTrigger> trigger;
};

enum class OutcomeType : uint8_t {
    DAMAGE_DEALT,
    HEALING,
    CARDS_DRAWN,
    ENERGY_ATTACHED,
    CARD_MOVED,
    SPECIAL_CONDITION_APPLIED,
    SPECIAL_CONDITION_REMOVED,
    CUSTOM
};

inline const char* to_string(OutcomeType type) {
    switch (type) {
        case OutcomeType::DAMAGE_DEALT: return "DamageDealt";
        case OutcomeType::HEALING: return "Healing";
        case OutcomeType::CARDS_DRAWN: return "CardsDrawn";
        case OutcomeType::ENERGY_ATTACHED: return "EnergyAttached";
        case OutcomeType::CARD_MOVED: return "CardMoved";
        case OutcomeType::SPECIAL_CONDITION_APPLIED: return "SpecialConditionApplied";
        case OutcomeType::SPECIAL_CONDITION_REMOVED: return "SpecialConditionRemoved";
        case OutcomeType::CUSTOM: return "Custom";
        default: return "Unknown";
    }
}

/**
 * EffectOutcome - One observable change an effect made.
 *
 * Field use by type:
 *   DAMAGE_DEALT / HEALING      target, amount
 *   CARDS_DRAWN                 player, cards
 *   ENERGY_ATTACHED             target (Pokemon), cards (energy)
 *   CARD_MOVED                  cards, from, to
 *   SPECIAL_CONDITION_*         target, description (condition)
 *   CUSTOM                      description
 */
struct EffectOutcome {
    OutcomeType type = OutcomeType::CUSTOM;
    CardID target;
    PlayerID player;
    int amount = 0;
    std::vector<CardID> cards;
    std::string from;
    std::string to;
    std::string description;

    static EffectOutcome damage_dealt(const CardID& target, int amount) {
        EffectOutcome o;
        o.type = OutcomeType::DAMAGE_DEALT;
        o.target = target;
        o.amount = amount;
        return o;
    }
    static EffectOutcome healing(const CardID& target, int amount) {
        EffectOutcome o;
        o.type = OutcomeType::HEALING;
        o.target = target;
        o.amount = amount;
        return o;
    }
    static EffectOutcome cards_drawn(const PlayerID& player, std::vector<CardID> cards) {
        EffectOutcome o;
        o.type = OutcomeType::CARDS_DRAWN;
        o.player = player;
        o.amount = static_cast<int>(cards.size());
        o.cards = std::move(cards);
        return o;
    }
    static EffectOutcome condition_applied(const CardID& target, const SpecialCondition& condition) {
        EffectOutcome o;
        o.type = OutcomeType::SPECIAL_CONDITION_APPLIED;
        o.target = target;
        o.description = condition.to_string();
        return o;
    }
    static EffectOutcome custom(const std::string& description) {
        EffectOutcome o;
        o.description = description;
        return o;
    }
};

enum class EffectErrorType : uint8_t {
    INVALID_TARGET,
    INSUFFICIENT_RESOURCES,
    INVALID_GAME_STATE,
    REQUIREMENTS_NOT_MET,
    GENERAL
};

inline const char* to_string(EffectErrorType type) {
    switch (type) {
        case EffectErrorType::INVALID_TARGET: return "Invalid target";
        case EffectErrorType::INSUFFICIENT_RESOURCES: return "Insufficient resources";
        case EffectErrorType::INVALID_GAME_STATE: return "Invalid game state";
        case EffectErrorType::REQUIREMENTS_NOT_MET: return "Requirements not met";
        case EffectErrorType::GENERAL: return "Effect error";
        default: return "Unknown";
    }
}

struct EffectError {
    EffectErrorType type = EffectErrorType::GENERAL;
    std::string message;

    std::string to_string() const {
        return std::string(ptcg::to_string(type)) + ": " + message;
    }
};

/**
 * Result of one effect application. error is set on failure.
 */
struct EffectResult {
    bool success = false;
    EffectID effect_id;
    CardID source_card;
    std::vector<EffectOutcome> outcomes;
    std::optional<EffectError> error;

    static EffectResult ok(std::vector<EffectOutcome> outcomes) {
        EffectResult r;
        r.success = true;
        r.outcomes = std::move(outcomes);
        return r;
    }

    static EffectResult fail(EffectErrorType type, std::string message) {
        EffectResult r;
        r.error = EffectError{type, std::move(message)};
        return r;
    }
};

// ============================================================================
// EFFECT INTERFACE
// ============================================================================

/**
 * Effect - Abstract base for card effects.
 *
 * Subclasses implement name(), description() and apply(). The default
 * can_apply() checks target_requirements() against the targeted card,
 * when the target names one.
 */
class Effect {
public:
    /**
     * @param effect_id Explicit id; when empty, the EffectManager assigns
     *        "effect_N" on registration
     */
    explicit Effect(EffectID effect_id = "");
    virtual ~Effect() = default;

    const EffectID& id() const { return id_; }

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    virtual bool can_apply(const Game& game, const EffectContext& context) const;

    virtual EffectResult apply(Game& game, const EffectContext& context) = 0;

    const std::vector<EffectTrigger>& triggers() const { return triggers_; }
    const std::vector<TargetRequirement>& target_requirements() const { return requirements_; }

    bool has_trigger(const EffectTrigger& trigger) const;

    void add_trigger(EffectTrigger trigger) { triggers_.push_back(std::move(trigger)); }
    void add_requirement(TargetRequirement requirement) { requirements_.push_back(std::move(requirement)); }

protected:
    friend class EffectManager;

    EffectID id_;
    std::vector<EffectTrigger> triggers_;
    std::vector<TargetRequirement> requirements_;
};

/**
 * Resolve a target to concrete card ids in the given game. SELF resolves
 * to the context's source card; RANDOM and CHOICE resolve to nothing here
 * (the host picks).
 */
std::vector<CardID> resolve_target_cards(const Game& game, const EffectContext& context);

} // namespace ptcg
