/**
 * PTCG Core - Game Actions
 *
 * The closed set of player intents a driver (UI, AI, network adapter)
 * submits to the rules core.
 */

#pragma once

#include "types.hpp"
#include <functional>

namespace ptcg {

/**
 * GameAction - A single player intent.
 *
 * Field use by type:
 *   DRAW_CARD      player_id
 *   PLAY_CARD      player_id, card_id, target_id (optional)
 *   ATTACH_ENERGY  player_id, card_id (energy), target_id (Pokemon)
 *   USE_ATTACK     player_id, card_id (attacker), attack_index, target_id (optional)
 *   RETREAT        player_id, card_id (bench Pokemon to promote)
 *   END_TURN       player_id
 *   PASS           player_id
 */
struct GameAction {
    ActionType action_type = ActionType::PASS;
    PlayerID player_id;

    std::optional<CardID> card_id;
    std::optional<CardID> target_id;
    std::optional<size_t> attack_index;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    GameAction() = default;

    GameAction(ActionType type, PlayerID player)
        : action_type(type)
        , player_id(std::move(player))
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static GameAction draw_card(const PlayerID& player) {
        return GameAction(ActionType::DRAW_CARD, player);
    }

    static GameAction play_card(const PlayerID& player, const CardID& card,
                                std::optional<CardID> target = std::nullopt) {
        GameAction a(ActionType::PLAY_CARD, player);
        a.card_id = card;
        a.target_id = std::move(target);
        return a;
    }

    static GameAction attach_energy(const PlayerID& player, const CardID& energy, const CardID& pokemon) {
        GameAction a(ActionType::ATTACH_ENERGY, player);
        a.card_id = energy;
        a.target_id = pokemon;
        return a;
    }

    static GameAction use_attack(const PlayerID& player, const CardID& pokemon, size_t attack_index,
                                 std::optional<CardID> target = std::nullopt) {
        GameAction a(ActionType::USE_ATTACK, player);
        a.card_id = pokemon;
        a.attack_index = attack_index;
        a.target_id = std::move(target);
        return a;
    }

    static GameAction retreat(const PlayerID& player, const CardID& bench_pokemon) {
        GameAction a(ActionType::RETREAT, player);
        a.card_id = bench_pokemon;
        return a;
    }

    static GameAction end_turn(const PlayerID& player) {
        return GameAction(ActionType::END_TURN, player);
    }

    static GameAction pass(const PlayerID& player) {
        return GameAction(ActionType::PASS, player);
    }

    // ========================================================================
    // UTILITIES
    // ========================================================================

    std::string to_string() const {
        std::string result = ptcg::to_string(action_type);
        result += "(" + player_id;
        if (card_id) result += ", card=" + *card_id;
        if (target_id) result += ", target=" + *target_id;
        if (attack_index) result += ", attack=" + std::to_string(*attack_index);
        result += ")";
        return result;
    }

    bool operator==(const GameAction& other) const {
        return action_type == other.action_type &&
               player_id == other.player_id &&
               card_id == other.card_id &&
               target_id == other.target_id &&
               attack_index == other.attack_index;
    }

    bool operator!=(const GameAction& other) const {
        return !(*this == other);
    }
};

} // namespace ptcg

// Hash function for GameAction (for use in unordered containers)
namespace std {
template<>
struct hash<ptcg::GameAction> {
    size_t operator()(const ptcg::GameAction& a) const {
        size_t h = hash<uint8_t>()(static_cast<uint8_t>(a.action_type));
        h ^= hash<string>()(a.player_id) << 1;
        if (a.card_id) h ^= hash<string>()(*a.card_id) << 2;
        if (a.target_id) h ^= hash<string>()(*a.target_id) << 3;
        if (a.attack_index) h ^= hash<size_t>()(*a.attack_index) << 4;
        return h;
    }
};
} // namespace std
