/**
 * PTCG Core - Effect Implementation
 */

#include "effect.hpp"
#include "game.hpp"
#include <algorithm>

namespace ptcg {

namespace {

bool check_requirement(const Game& game, const CardID& card_id, const Card& card,
                       const TargetRequirement& requirement) {
    auto owner = game.find_card_owner(card_id);
    const Player* player = owner ? game.get_player(*owner) : nullptr;
    auto location = player ? player->find_card_location(card_id) : std::nullopt;

    switch (requirement.type) {
        case RequirementType::POKEMON:
            return card.is_pokemon();
        case RequirementType::ENERGY:
            return card.is_energy();
        case RequirementType::TRAINER:
            return card.is_trainer();
        case RequirementType::IN_PLAY:
            return location.has_value() &&
                   (location->type == LocationType::ACTIVE || location->type == LocationType::BENCH);
        case RequirementType::IN_HAND:
            return location.has_value() && location->type == LocationType::HAND;
        case RequirementType::IN_DISCARD:
            return location.has_value() && location->type == LocationType::DISCARD_PILE;
        case RequirementType::OWNED_BY:
            return owner.has_value() && *owner == requirement.player;
        case RequirementType::HAS_ENERGY_TYPE: {
            if (!player) return false;
            auto types = player->get_attached_energy_types(card_id, game.card_database);
            return std::find(types.begin(), types.end(), requirement.energy_type) != types.end();
        }
        case RequirementType::MIN_HP: {
            auto hp = card.get_hp();
            return hp.has_value() && *hp >= requirement.value;
        }
        case RequirementType::MIN_DAMAGE:
            return player && player->get_damage(card_id) >= requirement.value;
        case RequirementType::CUSTOM:
            return true;
    }
    return false;
}

} // namespace

bool meets_requirements(const Game& game, const CardID& card_id,
                        const std::vector<TargetRequirement>& requirements) {
    const Card* card = game.get_card(card_id);
    if (!card) {
        return false;
    }
    for (const auto& requirement : requirements) {
        if (!check_requirement(game, card_id, *card, requirement)) {
            return false;
        }
    }
    return true;
}

std::vector<CardID> resolve_target_cards(const Game& game, const EffectContext& context) {
    const EffectTarget& target = context.target;
    switch (target.type) {
        case TargetType::SELF:
            return {context.source_card};
        case TargetType::CARD:
            return {target.id};
        case TargetType::ACTIVE_POKEMON: {
            const Player* player = game.get_player(target.id);
            if (player && player->active_pokemon) {
                return {*player->active_pokemon};
            }
            return {};
        }
        case TargetType::ALL_PLAYER_POKEMON: {
            const Player* player = game.get_player(target.id);
            return player ? player->get_pokemon_in_play() : std::vector<CardID>{};
        }
        case TargetType::ALL_POKEMON: {
            std::vector<CardID> cards;
            for (const auto& [player_id, player] : game.players) {
                auto in_play = player.get_pokemon_in_play();
                cards.insert(cards.end(), in_play.begin(), in_play.end());
            }
            return cards;
        }
        case TargetType::NONE:
        case TargetType::PLAYER:
        case TargetType::RANDOM:
        case TargetType::CHOICE:
            return {};
    }
    return {};
}

// ============================================================================
// EFFECT BASE
// ============================================================================

Effect::Effect(EffectID effect_id)
    : id_(std::move(effect_id))
{}

bool Effect::can_apply(const Game& game, const EffectContext& context) const {
    if (requirements_.empty()) {
        return true;
    }
    for (const auto& card_id : resolve_target_cards(game, context)) {
        if (!meets_requirements(game, card_id, requirements_)) {
            return false;
        }
    }
    return true;
}

bool Effect::has_trigger(const EffectTrigger& trigger) const {
    return std::find(triggers_.begin(), triggers_.end(), trigger) != triggers_.end();
}

} // namespace ptcg
