/**
 * PTCG Core - Effect Manager Implementation
 */

#include "effect_manager.hpp"
#include "game.hpp"
#include <algorithm>
#include <stdexcept>

namespace ptcg {

// ============================================================================
// REGISTRY
// ============================================================================

EffectID EffectManager::register_effect(std::shared_ptr<Effect> effect) {
    if (!effect) {
        return {};
    }
    if (effect->id().empty()) {
        do {
            effect->id_ = "effect_" + std::to_string(next_id_++);
        } while (effects_.count(effect->id_));
    }
    EffectID effect_id = effect->id();
    effects_[effect_id] = std::move(effect);
    return effect_id;
}

bool EffectManager::unregister_effect(const EffectID& effect_id) {
    if (effects_.erase(effect_id) == 0) {
        return false;
    }

    for (auto it = attachments_.begin(); it != attachments_.end();) {
        auto& ids = it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), effect_id), ids.end());
        if (ids.empty()) {
            it = attachments_.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

std::shared_ptr<Effect> EffectManager::get_effect(const EffectID& effect_id) const {
    auto it = effects_.find(effect_id);
    return it != effects_.end() ? it->second : nullptr;
}

// ============================================================================
// ATTACHMENTS
// ============================================================================

OperationResult EffectManager::attach_effect(const CardID& card_id, const EffectID& effect_id) {
    if (!effects_.count(effect_id)) {
        return OperationResult::fail("Effect " + effect_id + " is not registered");
    }
    attachments_[card_id].push_back(effect_id);
    return OperationResult::ok();
}

bool EffectManager::detach_effect(const CardID& card_id, const EffectID& effect_id) {
    auto it = attachments_.find(card_id);
    if (it == attachments_.end()) {
        return false;
    }
    auto& ids = it->second;
    auto pos = std::find(ids.begin(), ids.end(), effect_id);
    if (pos == ids.end()) {
        return false;
    }
    ids.erase(pos);
    if (ids.empty()) {
        attachments_.erase(it);
    }
    return true;
}

size_t EffectManager::remove_card_effects(const CardID& card_id) {
    auto it = attachments_.find(card_id);
    if (it == attachments_.end()) {
        return 0;
    }
    size_t removed = it->second.size();
    attachments_.erase(it);
    return removed;
}

std::vector<std::shared_ptr<Effect>> EffectManager::get_card_effects(const CardID& card_id) const {
    std::vector<std::shared_ptr<Effect>> result;
    auto it = attachments_.find(card_id);
    if (it == attachments_.end()) {
        return result;
    }
    for (const auto& effect_id : it->second) {
        auto effect = get_effect(effect_id);
        if (effect) result.push_back(std::move(effect));
    }
    return result;
}

bool EffectManager::has_effects(const CardID& card_id) const {
    auto it = attachments_.find(card_id);
    return it != attachments_.end() && !it->second.empty();
}

std::vector<std::pair<CardID, std::shared_ptr<Effect>>> EffectManager::get_effects_by_trigger(
    const EffectTrigger& trigger) const {
    std::vector<std::pair<CardID, std::shared_ptr<Effect>>> result;
    for (const auto& [card_id, ids] : attachments_) {
        for (const auto& effect_id : ids) {
            auto effect = get_effect(effect_id);
            if (effect && effect->has_trigger(trigger)) {
                result.emplace_back(card_id, std::move(effect));
            }
        }
    }
    return result;
}

// ============================================================================
// DISPATCH
// ============================================================================

EffectResult EffectManager::run_effect(Game& game, const std::shared_ptr<Effect>& effect,
                                       const CardID& card_id, const EffectTrigger& trigger,
                                       const EffectContext& context) {
    EffectContext bound = context;
    bound.source_card = card_id;
    bound.trigger = trigger;

    EffectResult result;
    try {
        if (!effect->can_apply(game, bound)) {
            result = EffectResult::fail(EffectErrorType::REQUIREMENTS_NOT_MET,
                                        effect->name() + " cannot apply");
        } else {
            result = effect->apply(game, bound);
        }
    } catch (const std::exception& e) {
        // Host callbacks (Python) report failure by throwing
        result = EffectResult::fail(EffectErrorType::GENERAL, effect->name() + " failed: " + e.what());
    }
    result.effect_id = effect->id();
    result.source_card = card_id;
    return result;
}

std::vector<EffectResult> EffectManager::trigger_effects(Game& game, const EffectTrigger& trigger,
                                                         const EffectContext& context) {
    std::vector<EffectResult> results;
    for (const auto& [card_id, effect] : get_effects_by_trigger(trigger)) {
        results.push_back(run_effect(game, effect, card_id, trigger, context));
    }
    return results;
}

std::vector<EffectResult> EffectManager::trigger_card_effects(Game& game, const CardID& card_id,
                                                              const EffectTrigger& trigger,
                                                              const EffectContext& context) {
    std::vector<EffectResult> results;
    for (const auto& effect : get_card_effects(card_id)) {
        if (effect->has_trigger(trigger)) {
            results.push_back(run_effect(game, effect, card_id, trigger, context));
        }
    }
    return results;
}

std::vector<EffectResult> EffectManager::fire_for_player(Game& game, const PlayerID& player_id,
                                                         const EffectTrigger& trigger) {
    std::vector<EffectResult> results;
    const Player* player = game.get_player(player_id);
    if (!player) {
        return results;
    }

    EffectContext context;
    context.controller = player_id;
    context.target = EffectTarget::self();

    for (const auto& card_id : player->get_pokemon_in_play()) {
        auto card_results = trigger_card_effects(game, card_id, trigger, context);
        results.insert(results.end(), card_results.begin(), card_results.end());
    }
    return results;
}

std::vector<EffectResult> EffectManager::on_turn_start(Game& game, const PlayerID& player_id) {
    return fire_for_player(game, player_id, EffectTrigger(TriggerType::ON_TURN_START));
}

std::vector<EffectResult> EffectManager::on_turn_end(Game& game, const PlayerID& player_id) {
    return fire_for_player(game, player_id, EffectTrigger(TriggerType::ON_TURN_END));
}

} // namespace ptcg
