/**
 * PTCG Core - Built-in Effects
 *
 * Reusable effects covering the common card patterns: damage, healing,
 * card draw and special conditions, plus CallbackEffect for effects whose
 * body is supplied by the host (scripted cards, Python bindings).
 *
 * Usage:
 *   auto burn = std::make_shared<effects::SpecialConditionEffect>(
 *       "Flare", SpecialCondition::burned());
 *   manager.register_effect(burn);
 *   manager.attach_effect("charmander", burn->id());
 */

#pragma once

#include "../effect.hpp"
#include <functional>

namespace ptcg {
namespace effects {

// ============================================================================
// DAMAGE AND HEALING
// ============================================================================

/**
 * Put damage on the targeted Pokemon. Knocked out Pokemon are resolved
 * through Game::resolve_knockout. Fires on OnAttack by default.
 */
class DamageEffect : public Effect {
public:
    DamageEffect(std::string name, int damage, EffectID id = "");

    std::string name() const override { return name_; }
    std::string description() const override { return "Deals damage to target"; }

    EffectResult apply(Game& game, const EffectContext& context) override;

    int damage() const { return damage_; }

private:
    std::string name_;
    int damage_;
};

/**
 * Remove damage from the targeted Pokemon. Fires on OnPlay by default.
 */
class HealEffect : public Effect {
public:
    HealEffect(std::string name, int amount, EffectID id = "");

    std::string name() const override { return name_; }
    std::string description() const override { return "Heals damage from target"; }

    EffectResult apply(Game& game, const EffectContext& context) override;

private:
    std::string name_;
    int amount_;
};

// ============================================================================
// CARD DRAW
// ============================================================================

/**
 * Draw cards for the targeted player (PLAYER target) or the controller.
 * Fires on OnPlay by default.
 */
class DrawCardsEffect : public Effect {
public:
    DrawCardsEffect(std::string name, int count, EffectID id = "");

    std::string name() const override { return name_; }
    std::string description() const override { return "Draws cards"; }

    EffectResult apply(Game& game, const EffectContext& context) override;

private:
    std::string name_;
    int count_;
};

// ============================================================================
// SPECIAL CONDITIONS
// ============================================================================

/**
 * Apply a special condition to the targeted in-play Pokemon.
 */
class SpecialConditionEffect : public Effect {
public:
    SpecialConditionEffect(std::string name, SpecialCondition condition,
                           int duration = -1, EffectID id = "");

    std::string name() const override { return name_; }
    std::string description() const override { return "Applies " + condition_.to_string(); }

    EffectResult apply(Game& game, const EffectContext& context) override;

private:
    std::string name_;
    SpecialCondition condition_;
    int duration_;
};

// ============================================================================
// CALLBACK
// ============================================================================

using EffectFn = std::function<EffectResult(Game&, const EffectContext&)>;
using EffectPredicate = std::function<bool(const Game&, const EffectContext&)>;

/**
 * Effect whose body is a host-supplied function.
 */
class CallbackEffect : public Effect {
public:
    CallbackEffect(std::string name, std::string description,
                   std::vector<EffectTrigger> triggers, EffectFn fn,
                   EffectPredicate predicate = nullptr, EffectID id = "");

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }

    bool can_apply(const Game& game, const EffectContext& context) const override;

    EffectResult apply(Game& game, const EffectContext& context) override;

private:
    std::string name_;
    std::string description_;
    EffectFn fn_;
    EffectPredicate predicate_;
};

} // namespace effects
} // namespace ptcg
