/**
 * Tests for Player zones, board and special conditions
 */

#include <sstream>
#include "test_fixtures.hpp"

using namespace ptcg;
using namespace ptcg::testing;

namespace {

Player player_with_hand(std::vector<CardID> hand) {
    Player player("alice", "Alice");
    player.hand = std::move(hand);
    return player;
}

} // namespace

// ============================================================================
// DECK AND HAND TESTS
// ============================================================================

TEST(PlayerZones, DrawTakesTopOfDeck) {
    Player player("alice", "Alice");
    player.set_deck({"bottom", "middle", "top"});

    auto card = player.draw_card();
    TEST_ASSERT_EQ(std::string("top"), card.value_or(""));
    TEST_ASSERT_EQ(2u, player.deck.size());
    TEST_ASSERT_EQ(1u, player.hand.size());
}

TEST(PlayerZones, DrawStopsOnEmptyDeck) {
    Player player("alice", "Alice");
    player.set_deck({"a", "b"});

    auto drawn = player.draw_cards(5);
    TEST_ASSERT_EQ(2u, drawn.size());
    TEST_ASSERT_TRUE(player.deck.empty());
    TEST_ASSERT_FALSE(player.draw_card().has_value());
}

TEST(PlayerZones, DiscardAndReturnHand) {
    Player player = player_with_hand({"a", "b", "c"});

    TEST_ASSERT_TRUE(player.discard_from_hand("b"));
    TEST_ASSERT_FALSE(player.discard_from_hand("b"));
    TEST_ASSERT_EQ(1u, player.discard_pile.size());

    player.return_hand_to_deck();
    TEST_ASSERT_TRUE(player.hand.empty());
    TEST_ASSERT_EQ(2u, player.deck.size());
}

TEST(PlayerZones, FindCardLocation) {
    Player player = player_with_hand({"in-hand"});
    player.deck = {"in-deck"};
    player.bench = {"bench-a", "bench-b"};
    player.active_pokemon = "active";
    player.attached_energy["active"] = {"energy"};

    TEST_ASSERT(player.find_card_location("in-hand")->type == LocationType::HAND);
    TEST_ASSERT(player.find_card_location("in-deck")->type == LocationType::DECK);
    TEST_ASSERT(player.find_card_location("active")->type == LocationType::ACTIVE);

    auto bench = player.find_card_location("bench-b");
    TEST_ASSERT(bench->type == LocationType::BENCH);
    TEST_ASSERT_EQ(1u, bench->bench_index);

    auto energy = player.find_card_location("energy");
    TEST_ASSERT(energy->type == LocationType::ATTACHED_ENERGY);
    TEST_ASSERT_EQ(std::string("active"), energy->attached_to);
    TEST_ASSERT_TRUE(energy->is_in_play());

    TEST_ASSERT_FALSE(player.find_card_location("nowhere").has_value());
}

// ============================================================================
// BOARD TESTS
// ============================================================================

TEST(PlayerBoard, ActiveFromHandPushesOldActiveToBench) {
    Player player = player_with_hand({"first", "second"});

    TEST_ASSERT_TRUE(player.set_active_pokemon("first"));
    TEST_ASSERT_TRUE(player.set_active_pokemon("second"));
    TEST_ASSERT_EQ(std::string("second"), player.active_pokemon.value_or(""));
    TEST_ASSERT_EQ(1u, player.bench.size());
    TEST_ASSERT_EQ(std::string("first"), player.bench[0]);
    TEST_ASSERT_TRUE(player.hand.empty());

    // Promote back from the bench
    TEST_ASSERT_TRUE(player.set_active_pokemon("first"));
    TEST_ASSERT_EQ(std::string("first"), player.active_pokemon.value_or(""));
    TEST_ASSERT_EQ(std::string("second"), player.bench[0]);

    TEST_ASSERT_FALSE(player.set_active_pokemon("unknown"));
}

TEST(PlayerBoard, BenchHoldsFive) {
    Player player = player_with_hand({"p1", "p2", "p3", "p4", "p5", "p6"});

    for (int i = 1; i <= 5; i++) {
        TEST_ASSERT_TRUE(player.bench_pokemon("p" + std::to_string(i)));
    }
    TEST_ASSERT_FALSE(player.bench_pokemon("p6"));
    TEST_ASSERT_EQ(Player::MAX_BENCH_SIZE, player.bench.size());
    TEST_ASSERT_TRUE(player.hand_contains("p6"));
}

TEST(PlayerBoard, FullBenchBlocksActiveSwapFromHand) {
    Player player = player_with_hand({"p1", "p2", "p3", "p4", "p5", "active", "spare"});
    player.set_active_pokemon("active");
    for (int i = 1; i <= 5; i++) {
        player.bench_pokemon("p" + std::to_string(i));
    }

    TEST_ASSERT_FALSE(player.set_active_pokemon("spare"));
    TEST_ASSERT_EQ(std::string("active"), player.active_pokemon.value_or(""));
    TEST_ASSERT_TRUE(player.hand_contains("spare"));
}

TEST(PlayerBoard, AttachEnergyNeedsPokemonInPlay) {
    Player player = player_with_hand({"mon", "energy-1", "energy-2"});
    player.set_active_pokemon("mon");

    TEST_ASSERT_FALSE(player.attach_energy("energy-1", "bench-mon"));
    TEST_ASSERT_TRUE(player.attach_energy("energy-1", "mon"));
    TEST_ASSERT_FALSE(player.attach_energy("energy-1", "mon"));
    TEST_ASSERT_EQ(1u, player.get_attached_energy_count("mon"));
    TEST_ASSERT_TRUE(player.hand_contains("energy-2"));
}

TEST(PlayerBoard, RetreatDiscardsNewestEnergy) {
    Player player = player_with_hand({"active", "bench", "e1", "e2"});
    player.set_active_pokemon("active");
    player.bench_pokemon("bench");
    player.attach_energy("e1", "active");
    player.attach_energy("e2", "active");
    player.add_special_condition("active", SpecialCondition::poisoned(), -1, 1);

    TEST_ASSERT_TRUE(player.retreat("bench", 1));
    TEST_ASSERT_EQ(std::string("bench"), player.active_pokemon.value_or(""));
    TEST_ASSERT_EQ(std::string("active"), player.bench[0]);
    TEST_ASSERT_EQ(1u, player.discard_pile.size());
    TEST_ASSERT_EQ(std::string("e2"), player.discard_pile[0]);
    TEST_ASSERT_EQ(1u, player.get_attached_energy_count("active"));
    TEST_ASSERT_TRUE(player.get_special_conditions("active").empty());
}

TEST(PlayerBoard, RetreatNeedsEnoughEnergy) {
    Player player = player_with_hand({"active", "bench"});
    player.set_active_pokemon("active");
    player.bench_pokemon("bench");

    TEST_ASSERT_FALSE(player.retreat("bench", 1));
    TEST_ASSERT_FALSE(player.retreat("missing", 0));
    TEST_ASSERT_TRUE(player.retreat("bench", 0));
}

TEST(PlayerBoard, KnockOutDiscardsPokemonAndEnergy) {
    Player player = player_with_hand({"active", "e1", "e2"});
    player.set_active_pokemon("active");
    player.attach_energy("e1", "active");
    player.attach_energy("e2", "active");
    player.add_damage("active", 60);
    player.add_special_condition("active", SpecialCondition::burned(), -1, 1);

    TEST_ASSERT_TRUE(player.knock_out_pokemon("active"));
    TEST_ASSERT_FALSE(player.active_pokemon.has_value());
    TEST_ASSERT_EQ(3u, player.discard_pile.size());
    TEST_ASSERT_EQ(std::string("active"), player.discard_pile.back());
    TEST_ASSERT_EQ(0, player.get_damage("active"));
    TEST_ASSERT_TRUE(player.special_conditions.empty());
    TEST_ASSERT_TRUE(player.has_lost());

    TEST_ASSERT_FALSE(player.knock_out_pokemon("active"));
}

// ============================================================================
// DAMAGE AND PRIZE TESTS
// ============================================================================

TEST(PlayerDamage, HealSaturatesAtZero) {
    Player player("alice", "Alice");
    player.add_damage("mon", 30);
    player.add_damage("mon", -10);
    TEST_ASSERT_EQ(30, player.get_damage("mon"));

    player.heal_damage("mon", 10);
    TEST_ASSERT_EQ(20, player.get_damage("mon"));

    player.heal_damage("mon", 100);
    TEST_ASSERT_EQ(0, player.get_damage("mon"));
    TEST_ASSERT_EQ(0u, player.damage_counters.count("mon"));
}

TEST(PlayerDamage, KnockedOutAtHp) {
    Player player("alice", "Alice");
    Card pikachu = make_pikachu();

    player.add_damage("mon", 50);
    TEST_ASSERT_FALSE(player.is_pokemon_knocked_out("mon", pikachu));
    player.add_damage("mon", 10);
    TEST_ASSERT_TRUE(player.is_pokemon_knocked_out("mon", pikachu));

    Card energy = Card::energy("lightning", "Lightning Energy", EnergyType::LIGHTNING);
    TEST_ASSERT_FALSE(player.is_pokemon_knocked_out("mon", energy));
}

TEST(PlayerDamage, AttachedEnergyTypes) {
    CardDatabase db;
    add_sample_cards(db);
    Player player = player_with_hand({"mon", "lightning", "fire"});
    player.set_active_pokemon("mon");
    player.attach_energy("lightning", "mon");
    player.attach_energy("fire", "mon");

    auto types = player.get_attached_energy_types("mon", db);
    TEST_ASSERT_EQ(2u, types.size());
    TEST_ASSERT(types[0] == EnergyType::LIGHTNING);
    TEST_ASSERT(types[1] == EnergyType::FIRE);
}

TEST(PlayerPrizes, TakePrizeMovesCardToHand) {
    Player player("alice", "Alice");
    player.deck = {"a", "b", "c"};
    player.prizes = player.draw_prize_cards(2);
    player.prize_cards = 2;

    TEST_ASSERT_EQ(1u, player.deck.size());
    TEST_ASSERT_TRUE(player.take_prize_card());
    TEST_ASSERT_EQ(1, player.prize_cards);
    TEST_ASSERT_EQ(1u, player.hand.size());
    TEST_ASSERT_TRUE(player.take_prize_card());
    TEST_ASSERT_TRUE(player.has_won());
    TEST_ASSERT_FALSE(player.take_prize_card());
}

TEST(PlayerPrizes, StartTurnResetsFlags) {
    Player player("alice", "Alice");
    player.has_attacked = true;
    player.energy_attached_this_turn = true;
    player.can_play_trainer = false;

    player.start_turn();
    TEST_ASSERT_FALSE(player.has_attacked);
    TEST_ASSERT_FALSE(player.energy_attached_this_turn);
    TEST_ASSERT_TRUE(player.can_play_trainer);
}

// ============================================================================
// SPECIAL CONDITION TESTS
// ============================================================================

TEST(PlayerConditions, AddQueryRemove) {
    Player player("alice", "Alice");
    player.add_special_condition("mon", SpecialCondition::poisoned(), -1, 1);
    player.add_special_condition("mon", SpecialCondition::paralyzed(), 1, 1);

    TEST_ASSERT_TRUE(player.has_special_condition_type("mon", ConditionKind::POISONED));
    TEST_ASSERT_FALSE(player.can_pokemon_attack("mon"));
    TEST_ASSERT_TRUE(player.can_pokemon_retreat("mon"));

    player.remove_special_condition_type("mon", ConditionKind::PARALYZED);
    TEST_ASSERT_TRUE(player.can_pokemon_attack("mon"));
    TEST_ASSERT_EQ(1u, player.get_special_conditions("mon").size());

    player.add_special_condition("mon", SpecialCondition::trapped(), -1, 1);
    TEST_ASSERT_FALSE(player.can_pokemon_retreat("mon"));

    player.clear_special_conditions("mon");
    TEST_ASSERT_TRUE(player.get_special_conditions("mon").empty());
}

TEST(PlayerConditions, ConditionData) {
    Player player("alice", "Alice");
    player.add_special_condition_with_data("mon", SpecialCondition::custom("Smokescreen", "Flip to attack"),
                                           2, 3, {{"source", "koffing"}});

    auto conditions = player.get_special_conditions("mon");
    TEST_ASSERT_EQ(1u, conditions.size());
    TEST_ASSERT_EQ(3u, conditions[0].applied_turn);
    TEST_ASSERT_EQ(std::string("koffing"), conditions[0].data.at("source"));
    TEST_ASSERT_EQ(std::string("Custom(Smokescreen)"), conditions[0].condition.to_string());
}

TEST(PlayerConditions, TickReportsDamageAndFlips) {
    Player player("alice", "Alice");
    player.add_special_condition("mon", SpecialCondition::poisoned(10), -1, 1);
    player.add_special_condition("mon", SpecialCondition::burned(20), -1, 1);

    auto effects = player.update_special_conditions(2);
    TEST_ASSERT_EQ(3u, effects.size());
    TEST_ASSERT(effects[0].type == ConditionEffectType::DAMAGE);
    TEST_ASSERT_EQ(10, effects[0].amount);
    TEST_ASSERT_EQ(std::string("Poison"), effects[0].source);
    TEST_ASSERT(effects[1].type == ConditionEffectType::DAMAGE);
    TEST_ASSERT_EQ(std::string("Burn"), effects[1].source);
    TEST_ASSERT(effects[2].type == ConditionEffectType::COIN_FLIP);
    TEST_ASSERT_EQ(std::string("Burn removal"), effects[2].condition);

    // Reporting does not apply damage
    TEST_ASSERT_EQ(0, player.get_damage("mon"));
}

TEST(PlayerConditions, DurationsExpire) {
    Player player("alice", "Alice");
    player.add_special_condition("mon", SpecialCondition::paralyzed(), 1, 1);
    player.add_special_condition("mon", SpecialCondition::confused(), 2, 1);

    auto first = player.update_special_conditions(2);
    TEST_ASSERT_EQ(1u, first.size());
    TEST_ASSERT(first[0].type == ConditionEffectType::CONDITION_REMOVED);
    TEST_ASSERT_EQ(std::string("Paralyzed"), first[0].condition);
    TEST_ASSERT_EQ(1u, player.get_special_conditions("mon").size());
    TEST_ASSERT_EQ(1, player.get_special_conditions("mon")[0].duration);

    auto second = player.update_special_conditions(3);
    TEST_ASSERT_EQ(1u, second.size());
    TEST_ASSERT_EQ(std::string("Confused"), second[0].condition);
    TEST_ASSERT_TRUE(player.special_conditions.empty());
}

TEST(PlayerConditions, ApplyEffectsAddsDamage) {
    Player player("alice", "Alice");
    player.add_special_condition("mon", SpecialCondition::poisoned(10), -1, 1);
    std::mt19937 rng(1);

    auto effects = player.update_special_conditions(2);
    int applied = player.apply_condition_effects(effects, rng);
    TEST_ASSERT_EQ(10, applied);
    TEST_ASSERT_EQ(10, player.get_damage("mon"));
    TEST_ASSERT_TRUE(player.has_special_condition_type("mon", ConditionKind::POISONED));
}
