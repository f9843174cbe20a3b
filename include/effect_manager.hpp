/**
 * PTCG Core - Effect Manager
 *
 * Registry of effects plus the card -> effect attachment index. Attachment
 * order is resolution order; the same effect may be attached more than
 * once. Dispatch walks a snapshot of the index, so effects may attach or
 * detach other effects while firing.
 */

#pragma once

#include "effect.hpp"
#include <map>

namespace ptcg {

class EffectManager {
public:
    EffectManager() = default;

    // ========================================================================
    // REGISTRY
    // ========================================================================

    /**
     * Register an effect (replacing any effect with the same id). An effect
     * without an id gets the next "effect_N" id of this manager.
     *
     * @return The effect's id, or an empty id for a null effect
     */
    EffectID register_effect(std::shared_ptr<Effect> effect);

    /**
     * Remove an effect and every attachment of it.
     */
    bool unregister_effect(const EffectID& effect_id);

    std::shared_ptr<Effect> get_effect(const EffectID& effect_id) const;

    size_t effect_count() const { return effects_.size(); }

    // ========================================================================
    // ATTACHMENTS
    // ========================================================================

    /**
     * Attach a registered effect to a card. Fails if the id is unknown.
     */
    OperationResult attach_effect(const CardID& card_id, const EffectID& effect_id);

    /**
     * Remove the first attachment of effect_id from the card.
     */
    bool detach_effect(const CardID& card_id, const EffectID& effect_id);

    /**
     * Drop every attachment on a card.
     *
     * @return Number of attachments removed
     */
    size_t remove_card_effects(const CardID& card_id);

    std::vector<std::shared_ptr<Effect>> get_card_effects(const CardID& card_id) const;

    bool has_effects(const CardID& card_id) const;

    /**
     * Every (card, effect) attachment whose effect listens for the trigger.
     */
    std::vector<std::pair<CardID, std::shared_ptr<Effect>>> get_effects_by_trigger(
        const EffectTrigger& trigger) const;

    // ========================================================================
    // DISPATCH
    // ========================================================================

    /**
     * Fire every attached effect listening for the trigger. source_card in
     * the context is rebound to each effect's card. One effect failing does
     * not stop the others.
     */
    std::vector<EffectResult> trigger_effects(Game& game, const EffectTrigger& trigger,
                                              const EffectContext& context);

    /**
     * Fire the trigger only for effects attached to one card.
     */
    std::vector<EffectResult> trigger_card_effects(Game& game, const CardID& card_id,
                                                   const EffectTrigger& trigger,
                                                   const EffectContext& context);

    /**
     * OnTurnStart / OnTurnEnd for effects on the player's in-play cards.
     */
    std::vector<EffectResult> on_turn_start(Game& game, const PlayerID& player_id);
    std::vector<EffectResult> on_turn_end(Game& game, const PlayerID& player_id);

private:
    std::unordered_map<EffectID, std::shared_ptr<Effect>> effects_;
    std::map<CardID, std::vector<EffectID>> attachments_;
    uint64_t next_id_ = 1;

    EffectResult run_effect(Game& game, const std::shared_ptr<Effect>& effect,
                            const CardID& card_id, const EffectTrigger& trigger,
                            const EffectContext& context);

    std::vector<EffectResult> fire_for_player(Game& game, const PlayerID& player_id,
                                              const EffectTrigger& trigger);
};

} // namespace ptcg
