/**
 * Tests for Cards and the Card Database
 */

#include <sstream>
#include "test_fixtures.hpp"

using namespace ptcg;
using namespace ptcg::testing;

// ============================================================================
// CARD KIND TESTS
// ============================================================================

TEST(Card, PokemonFactory) {
    Card card = make_pikachu();

    TEST_ASSERT_TRUE(card.is_pokemon());
    TEST_ASSERT_FALSE(card.is_energy());
    TEST_ASSERT_TRUE(card.is_basic_pokemon());
    TEST_ASSERT_EQ(60, card.get_hp().value_or(0));
    TEST_ASSERT_EQ(2u, card.attacks.size());
    TEST_ASSERT_FALSE(card.get_energy_type().has_value());
}

TEST(Card, Stage1IsNotBasic) {
    Card card = make_raichu();

    TEST_ASSERT_TRUE(card.is_pokemon());
    TEST_ASSERT_FALSE(card.is_basic_pokemon());
    TEST_ASSERT_EQ(std::string("Pikachu"), card.pokemon_data()->evolves_from.value_or(""));
}

TEST(Card, EnergyIgnoresAttacks) {
    Card energy = Card::energy("lightning", "Lightning Energy", EnergyType::LIGHTNING);
    energy.add_attack(Attack::simple("Nothing", {}, 10));
    energy.add_ability(Ability{"Nothing", "No effect", "Ability"});

    TEST_ASSERT_TRUE(energy.is_energy());
    TEST_ASSERT_TRUE(energy.is_basic_energy());
    TEST_ASSERT_TRUE(energy.attacks.empty());
    TEST_ASSERT_TRUE(energy.abilities.empty());
    TEST_ASSERT_FALSE(energy.get_hp().has_value());
    TEST_ASSERT(energy.get_energy_type() == EnergyType::LIGHTNING);
}

TEST(Card, TrainerKind) {
    Card potion = Card::trainer("potion", "Potion", TrainerType::ITEM);
    potion.add_rule("Heal 30 damage from 1 of your Pokemon.");
    potion.add_metadata("set", "Base");

    TEST_ASSERT_TRUE(potion.is_trainer());
    TEST_ASSERT_FALSE(potion.is_basic_pokemon());
    TEST_ASSERT_EQ(1u, potion.rules.size());
    TEST_ASSERT_EQ(std::string("Base"), potion.metadata.at("set"));
}

// ============================================================================
// ENERGY COST TESTS
// ============================================================================

TEST(EnergyCost, TypedCostNeedsMatchingEnergy) {
    EnergyCost cost = {EnergyType::LIGHTNING};

    TEST_ASSERT_TRUE(Card::can_pay_cost(cost, {EnergyType::LIGHTNING}));
    TEST_ASSERT_FALSE(Card::can_pay_cost(cost, {EnergyType::FIRE}));
    TEST_ASSERT_FALSE(Card::can_pay_cost(cost, {}));
}

TEST(EnergyCost, ColorlessPaidByAnySurplus) {
    EnergyCost cost = {EnergyType::FIRE, EnergyType::COLORLESS, EnergyType::COLORLESS};

    TEST_ASSERT_TRUE(Card::can_pay_cost(cost, {EnergyType::FIRE, EnergyType::WATER, EnergyType::GRASS}));
    TEST_ASSERT_FALSE(Card::can_pay_cost(cost, {EnergyType::FIRE, EnergyType::WATER}));
    // The typed part cannot be covered by a different type
    TEST_ASSERT_FALSE(Card::can_pay_cost(cost, {EnergyType::WATER, EnergyType::WATER, EnergyType::WATER}));
}

TEST(EnergyCost, UsableAttacksInOrder) {
    Card card = make_pikachu();

    auto usable = card.get_usable_attacks({EnergyType::LIGHTNING});
    TEST_ASSERT_EQ(1u, usable.size());
    TEST_ASSERT_EQ(0u, usable[0].first);
    TEST_ASSERT_EQ(std::string("Thunder Shock"), usable[0].second->name);

    usable = card.get_usable_attacks({EnergyType::LIGHTNING, EnergyType::FIRE});
    TEST_ASSERT_EQ(2u, usable.size());
    TEST_ASSERT_EQ(1u, usable[1].first);
}

// ============================================================================
// DAMAGE MODE TESTS
// ============================================================================

TEST(DamageMode, SimpleAttackIgnoresInputs) {
    Attack attack = Attack::simple("Tackle", {EnergyType::COLORLESS}, 20);

    TEST_ASSERT_EQ(20, attack.calculate_damage(5, {true, true}));
    TEST_ASSERT_EQ(0, attack.required_flips());
}

TEST(DamageMode, PerEnergy) {
    Attack attack = Attack::simple("Hydro Pump", {EnergyType::WATER}, 10);
    attack.set_damage_mode(DamageMode::per_energy_mode(10));

    TEST_ASSERT_EQ(10, attack.calculate_damage(0, {}));
    TEST_ASSERT_EQ(40, attack.calculate_damage(3, {}));
}

TEST(DamageMode, CoinFlipCountsHeads) {
    Attack attack = Attack::coin_flip_damage("Double Kick", {EnergyType::FIGHTING}, 0, 30, 2);

    TEST_ASSERT_EQ(2, attack.required_flips());
    TEST_ASSERT_EQ(0, attack.calculate_damage(0, {false, false}));
    TEST_ASSERT_EQ(30, attack.calculate_damage(0, {true, false}));
    TEST_ASSERT_EQ(60, attack.calculate_damage(0, {true, true}));
}

TEST(DamageMode, PerPokemonAndVariable) {
    Attack per_pokemon = Attack::simple("Call for Help", {}, 10);
    per_pokemon.set_damage_mode(DamageMode::per_pokemon_mode(20, "bench"));
    TEST_ASSERT_EQ(50, per_pokemon.calculate_damage(0, {}));

    Attack variable = Attack::simple("Wild Swing", {}, 90);
    variable.set_damage_mode(DamageMode::variable_mode(10, 50));
    TEST_ASSERT_EQ(10, variable.calculate_damage(0, {}));
}

TEST(DamageMode, WithStatusFactory) {
    Attack attack = Attack::with_status("Poison Sting", {EnergyType::GRASS}, 10,
                                        SpecialCondition::poisoned(), 50);

    TEST_ASSERT_EQ(1u, attack.status_effects.size());
    TEST_ASSERT_EQ(50, attack.status_effects[0].probability);
    TEST_ASSERT_EQ(std::string("defending"), attack.status_effects[0].target);
    TEST_ASSERT(attack.status_effects[0].condition.kind == ConditionKind::POISONED);
}

// ============================================================================
// CARD DATABASE TESTS
// ============================================================================

TEST(CardDatabase, LookupByDefinitionAndInstance) {
    CardDatabase db;
    add_sample_cards(db);
    db.register_instance("alice/pikachu#1", "pikachu");

    TEST_ASSERT_EQ(6u, db.card_count());
    TEST_ASSERT_NOT_NULL(db.get_card("pikachu"));
    TEST_ASSERT_NOT_NULL(db.get_card("alice/pikachu#1"));
    TEST_ASSERT_EQ(std::string("Pikachu"), db.get_card("alice/pikachu#1")->name);
    TEST_ASSERT_EQ(std::string("pikachu"), db.get_definition_id("alice/pikachu#1"));
    TEST_ASSERT_EQ(std::string("pikachu"), db.get_definition_id("pikachu"));
    TEST_ASSERT_NULL(db.get_card("mewtwo"));
    TEST_ASSERT_FALSE(db.has_card("mewtwo"));
}

TEST(CardDatabase, AllIdsSorted) {
    CardDatabase db;
    add_sample_cards(db);

    auto ids = db.get_all_card_ids();
    TEST_ASSERT_EQ(6u, ids.size());
    TEST_ASSERT_EQ(std::string("charmander"), ids.front());
    TEST_ASSERT_EQ(std::string("raichu"), ids.back());
}

TEST(CardDatabase, AddCardReplaces) {
    CardDatabase db;
    db.add_card(Card::pokemon("pikachu", "Pikachu", 60));
    db.add_card(Card::pokemon("pikachu", "Pikachu", 70));

    TEST_ASSERT_EQ(1u, db.card_count());
    TEST_ASSERT_EQ(70, db.get_card("pikachu")->get_hp().value_or(0));
}
