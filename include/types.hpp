/**
 * PTCG Core - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the rules core.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <optional>
#include <memory>

namespace ptcg {

// ============================================================================
// ENUMS
// ============================================================================

enum class EnergyType : uint8_t {
    GRASS,
    FIRE,
    WATER,
    LIGHTNING,
    PSYCHIC,
    FIGHTING,
    DARKNESS,
    METAL,
    FAIRY,
    DRAGON,
    COLORLESS
};

enum class EvolutionStage : uint8_t {
    BASIC,
    STAGE_1,
    STAGE_2,
    MEGA,
    GX,
    EX,
    V,
    VMAX
};

enum class TrainerType : uint8_t {
    ITEM,
    SUPPORTER,
    STADIUM,
    TOOL
};

enum class CardRarity : uint8_t {
    COMMON,
    UNCOMMON,
    RARE,
    RARE_HOLO,
    ULTRA_RARE,
    SECRET_RARE,
    PROMO
};

enum class AttackTargetType : uint8_t {
    ACTIVE,
    CHOOSE,
    ALL,
    BENCH,
    SELF
};

enum class GameStatus : uint8_t {
    SETUP,
    IN_PROGRESS,
    FINISHED,
    CANCELLED
};

enum class TurnPhase : uint8_t {
    BEGINNING_OF_TURN,
    MAIN,
    ATTACK,
    END_OF_TURN
};

enum class SetupPhase : uint8_t {
    WAITING_FOR_TURN_ORDER,
    WAITING_FOR_HANDS,
    CHECKING_FOR_BASIC_POKEMON,
    MULLIGAN_REQUIRED,
    SELECTING_ACTIVE_POKEMON,
    SETTING_UP_BENCH,
    PLACING_PRIZE_CARDS,
    SETUP_COMPLETE
};

enum class ActionType : uint8_t {
    DRAW_CARD,
    PLAY_CARD,
    ATTACH_ENERGY,
    USE_ATTACK,
    RETREAT,
    END_TURN,
    PASS
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using CardID = std::string;           // Card identity (e.g., "base1-58")
using PlayerID = std::string;         // Player identity (e.g., "alice")
using EffectID = std::string;         // Registered effect identity
using EnergyCost = std::vector<EnergyType>;

// ============================================================================
// OPERATION RESULTS
// ============================================================================

/**
 * Result of a state-machine operation (setup steps, turn control).
 *
 * Failures are recoverable: the caller fixes the call order and retries.
 */
struct OperationResult {
    bool success = false;
    std::string error;

    static OperationResult ok() {
        OperationResult r;
        r.success = true;
        return r;
    }

    static OperationResult fail(std::string message) {
        OperationResult r;
        r.error = std::move(message);
        return r;
    }

    explicit operator bool() const { return success; }
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(EnergyType type) {
    switch (type) {
        case EnergyType::GRASS: return "Grass";
        case EnergyType::FIRE: return "Fire";
        case EnergyType::WATER: return "Water";
        case EnergyType::LIGHTNING: return "Lightning";
        case EnergyType::PSYCHIC: return "Psychic";
        case EnergyType::FIGHTING: return "Fighting";
        case EnergyType::DARKNESS: return "Darkness";
        case EnergyType::METAL: return "Metal";
        case EnergyType::FAIRY: return "Fairy";
        case EnergyType::DRAGON: return "Dragon";
        case EnergyType::COLORLESS: return "Colorless";
        default: return "Unknown";
    }
}

inline const char* to_string(EvolutionStage stage) {
    switch (stage) {
        case EvolutionStage::BASIC: return "Basic";
        case EvolutionStage::STAGE_1: return "Stage 1";
        case EvolutionStage::STAGE_2: return "Stage 2";
        case EvolutionStage::MEGA: return "Mega";
        case EvolutionStage::GX: return "GX";
        case EvolutionStage::EX: return "EX";
        case EvolutionStage::V: return "V";
        case EvolutionStage::VMAX: return "VMAX";
        default: return "Unknown";
    }
}

inline const char* to_string(TrainerType type) {
    switch (type) {
        case TrainerType::ITEM: return "Item";
        case TrainerType::SUPPORTER: return "Supporter";
        case TrainerType::STADIUM: return "Stadium";
        case TrainerType::TOOL: return "Tool";
        default: return "Unknown";
    }
}

inline const char* to_string(GameStatus status) {
    switch (status) {
        case GameStatus::SETUP: return "setup";
        case GameStatus::IN_PROGRESS: return "in_progress";
        case GameStatus::FINISHED: return "finished";
        case GameStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

inline const char* to_string(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::BEGINNING_OF_TURN: return "beginning_of_turn";
        case TurnPhase::MAIN: return "main";
        case TurnPhase::ATTACK: return "attack";
        case TurnPhase::END_OF_TURN: return "end_of_turn";
        default: return "unknown";
    }
}

inline const char* to_string(SetupPhase phase) {
    switch (phase) {
        case SetupPhase::WAITING_FOR_TURN_ORDER: return "waiting_for_turn_order";
        case SetupPhase::WAITING_FOR_HANDS: return "waiting_for_hands";
        case SetupPhase::CHECKING_FOR_BASIC_POKEMON: return "checking_for_basic_pokemon";
        case SetupPhase::MULLIGAN_REQUIRED: return "mulligan_required";
        case SetupPhase::SELECTING_ACTIVE_POKEMON: return "selecting_active_pokemon";
        case SetupPhase::SETTING_UP_BENCH: return "setting_up_bench";
        case SetupPhase::PLACING_PRIZE_CARDS: return "placing_prize_cards";
        case SetupPhase::SETUP_COMPLETE: return "setup_complete";
        default: return "unknown";
    }
}

inline const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::DRAW_CARD: return "DRAW_CARD";
        case ActionType::PLAY_CARD: return "PLAY_CARD";
        case ActionType::ATTACH_ENERGY: return "ATTACH_ENERGY";
        case ActionType::USE_ATTACK: return "USE_ATTACK";
        case ActionType::RETREAT: return "RETREAT";
        case ActionType::END_TURN: return "END_TURN";
        case ActionType::PASS: return "PASS";
        default: return "UNKNOWN";
    }
}

} // namespace ptcg
