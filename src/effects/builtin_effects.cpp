/**
 * PTCG Core - Built-in Effects Implementation
 */

#include "effects/builtin_effects.hpp"
#include "game.hpp"
#include <algorithm>

namespace ptcg {
namespace effects {

namespace {

/**
 * Targets narrowed to Pokemon currently in play, paired with their owner.
 */
std::vector<std::pair<PlayerID, CardID>> in_play_targets(const Game& game, const EffectContext& context) {
    std::vector<std::pair<PlayerID, CardID>> targets;
    for (const auto& card_id : resolve_target_cards(game, context)) {
        auto owner = game.find_card_owner(card_id);
        if (!owner) continue;
        const Player* player = game.get_player(*owner);
        if (player && player->is_in_play(card_id)) {
            targets.emplace_back(*owner, card_id);
        }
    }
    return targets;
}

} // namespace

// ============================================================================
// DAMAGE EFFECT
// ============================================================================

DamageEffect::DamageEffect(std::string name, int damage, EffectID id)
    : Effect(std::move(id))
    , name_(std::move(name))
    , damage_(damage)
{
    triggers_.push_back(EffectTrigger(TriggerType::ON_ATTACK));
    requirements_.push_back(TargetRequirement::of(RequirementType::POKEMON));
    requirements_.push_back(TargetRequirement::of(RequirementType::IN_PLAY));
}

EffectResult DamageEffect::apply(Game& game, const EffectContext& context) {
    auto targets = in_play_targets(game, context);
    if (targets.empty()) {
        return EffectResult::fail(EffectErrorType::INVALID_TARGET, "Target Pokemon not found");
    }

    std::vector<EffectOutcome> outcomes;
    for (const auto& [owner_id, card_id] : targets) {
        game.get_player(owner_id)->add_damage(card_id, damage_);
        game.add_event(GameEvent::damage_dealt(context.controller, card_id, damage_));
        outcomes.push_back(EffectOutcome::damage_dealt(card_id, damage_));
        game.resolve_knockout(owner_id, card_id);
    }
    return EffectResult::ok(std::move(outcomes));
}

// ============================================================================
// HEAL EFFECT
// ============================================================================

HealEffect::HealEffect(std::string name, int amount, EffectID id)
    : Effect(std::move(id))
    , name_(std::move(name))
    , amount_(amount)
{
    triggers_.push_back(EffectTrigger(TriggerType::ON_PLAY));
    requirements_.push_back(TargetRequirement::of(RequirementType::POKEMON));
    requirements_.push_back(TargetRequirement::of(RequirementType::IN_PLAY));
}

EffectResult HealEffect::apply(Game& game, const EffectContext& context) {
    auto targets = in_play_targets(game, context);
    if (targets.empty()) {
        return EffectResult::fail(EffectErrorType::INVALID_TARGET, "Target Pokemon not found");
    }

    std::vector<EffectOutcome> outcomes;
    for (const auto& [owner_id, card_id] : targets) {
        Player* player = game.get_player(owner_id);
        int healed = std::min(amount_, player->get_damage(card_id));
        player->heal_damage(card_id, amount_);
        outcomes.push_back(EffectOutcome::healing(card_id, healed));
    }
    return EffectResult::ok(std::move(outcomes));
}

// ============================================================================
// DRAW CARDS EFFECT
// ============================================================================

DrawCardsEffect::DrawCardsEffect(std::string name, int count, EffectID id)
    : Effect(std::move(id))
    , name_(std::move(name))
    , count_(count)
{
    triggers_.push_back(EffectTrigger(TriggerType::ON_PLAY));
}

EffectResult DrawCardsEffect::apply(Game& game, const EffectContext& context) {
    PlayerID player_id = context.target.type == TargetType::PLAYER ? context.target.id
                                                                   : context.controller;
    Player* player = game.get_player(player_id);
    if (!player) {
        return EffectResult::fail(EffectErrorType::INVALID_TARGET, "Player not found");
    }
    if (player->deck.empty() && count_ > 0) {
        return EffectResult::fail(EffectErrorType::INSUFFICIENT_RESOURCES, "Deck is empty");
    }

    std::vector<CardID> drawn = player->draw_cards(static_cast<size_t>(std::max(count_, 0)));
    for (const auto& card_id : drawn) {
        game.add_event(GameEvent::card_drawn(player_id, card_id));
    }
    return EffectResult::ok({EffectOutcome::cards_drawn(player_id, std::move(drawn))});
}

// ============================================================================
// SPECIAL CONDITION EFFECT
// ============================================================================

SpecialConditionEffect::SpecialConditionEffect(std::string name, SpecialCondition condition,
                                               int duration, EffectID id)
    : Effect(std::move(id))
    , name_(std::move(name))
    , condition_(std::move(condition))
    , duration_(duration)
{
    triggers_.push_back(EffectTrigger(TriggerType::ON_ATTACK));
    requirements_.push_back(TargetRequirement::of(RequirementType::POKEMON));
    requirements_.push_back(TargetRequirement::of(RequirementType::IN_PLAY));
}

EffectResult SpecialConditionEffect::apply(Game& game, const EffectContext& context) {
    auto targets = in_play_targets(game, context);
    if (targets.empty()) {
        return EffectResult::fail(EffectErrorType::INVALID_TARGET, "Target Pokemon not found");
    }

    std::vector<EffectOutcome> outcomes;
    for (const auto& [owner_id, card_id] : targets) {
        game.get_player(owner_id)->add_special_condition(card_id, condition_, duration_, game.turn_number);
        outcomes.push_back(EffectOutcome::condition_applied(card_id, condition_));
    }
    return EffectResult::ok(std::move(outcomes));
}

// ============================================================================
// CALLBACK EFFECT
// ============================================================================

CallbackEffect::CallbackEffect(std::string name, std::string description,
                               std::vector<EffectTrigger> triggers, EffectFn fn,
                               EffectPredicate predicate, EffectID id)
    : Effect(std::move(id))
    , name_(std::move(name))
    , description_(std::move(description))
    , fn_(std::move(fn))
    , predicate_(std::move(predicate))
{
    triggers_ = std::move(triggers);
}

bool CallbackEffect::can_apply(const Game& game, const EffectContext& context) const {
    if (predicate_) {
        return predicate_(game, context);
    }
    return Effect::can_apply(game, context);
}

EffectResult CallbackEffect::apply(Game& game, const EffectContext& context) {
    if (!fn_) {
        return EffectResult::fail(EffectErrorType::GENERAL, "No callback for " + name_);
    }
    return fn_(game, context);
}

} // namespace effects
} // namespace ptcg
