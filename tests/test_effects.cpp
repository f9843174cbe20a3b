/**
 * Tests for the Effect system: manager, built-in effects and game triggers
 */

#include <sstream>
#include <stdexcept>
#include "test_fixtures.hpp"
#include "effect_manager.hpp"
#include "effects/builtin_effects.hpp"

using namespace ptcg;
using namespace ptcg::testing;
using namespace ptcg::effects;
using ptcg::rules::StandardRules;

namespace {

/**
 * Callback effect that counts how often it fired.
 */
std::shared_ptr<CallbackEffect> counting_effect(const EffectID& id, TriggerType trigger, int& counter) {
    return std::make_shared<CallbackEffect>(
        "Counter", "Counts activations", std::vector<EffectTrigger>{EffectTrigger(trigger)},
        [&counter](Game&, const EffectContext&) {
            counter++;
            return EffectResult::ok({});
        },
        nullptr, id);
}

EffectContext context_for(const PlayerID& controller, EffectTarget target) {
    EffectContext context;
    context.controller = controller;
    context.target = std::move(target);
    return context;
}

} // namespace

// ============================================================================
// REGISTRY TESTS
// ============================================================================

TEST(EffectManager, RegisterAndLookup) {
    EffectManager manager;
    auto heal = std::make_shared<HealEffect>("Potion", 30, "potion-heal");

    TEST_ASSERT_EQ(std::string("potion-heal"), manager.register_effect(heal));
    TEST_ASSERT_EQ(1u, manager.effect_count());
    TEST_ASSERT_TRUE(manager.get_effect("potion-heal") == heal);
    TEST_ASSERT_NULL(manager.get_effect("missing"));
    TEST_ASSERT_TRUE(manager.register_effect(nullptr).empty());
}

TEST(EffectManager, GeneratedIdsPerManager) {
    EffectManager manager;
    auto first = std::make_shared<DrawCardsEffect>("Draw", 1);
    TEST_ASSERT_TRUE(first->id().empty());

    TEST_ASSERT_EQ(std::string("effect_1"), manager.register_effect(first));
    TEST_ASSERT_EQ(std::string("effect_1"), first->id());
    TEST_ASSERT_EQ(std::string("effect_2"), manager.register_effect(std::make_shared<DrawCardsEffect>("Draw", 1)));

    // A generated id never replaces an effect registered under that name
    EffectManager other;
    other.register_effect(std::make_shared<HealEffect>("Heal", 10, "effect_1"));
    TEST_ASSERT_EQ(std::string("effect_2"), other.register_effect(std::make_shared<DrawCardsEffect>("Draw", 1)));
    TEST_ASSERT_EQ(2u, other.effect_count());
}

TEST(EffectManager, AttachNeedsRegisteredEffect) {
    EffectManager manager;
    auto result = manager.attach_effect("card", "nope");
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ(std::string("Effect nope is not registered"), result.error);
    TEST_ASSERT_FALSE(manager.has_effects("card"));
}

TEST(EffectManager, AttachmentsKeepOrderAndDuplicates) {
    EffectManager manager;
    manager.register_effect(std::make_shared<HealEffect>("Heal", 10, "heal"));
    manager.register_effect(std::make_shared<DamageEffect>("Zap", 10, "zap"));

    manager.attach_effect("card", "heal");
    manager.attach_effect("card", "zap");
    manager.attach_effect("card", "heal");

    auto attached = manager.get_card_effects("card");
    TEST_ASSERT_EQ(3u, attached.size());
    TEST_ASSERT_EQ(std::string("heal"), attached[0]->id());
    TEST_ASSERT_EQ(std::string("zap"), attached[1]->id());

    TEST_ASSERT_TRUE(manager.detach_effect("card", "heal"));
    attached = manager.get_card_effects("card");
    TEST_ASSERT_EQ(2u, attached.size());
    TEST_ASSERT_EQ(std::string("zap"), attached[0]->id());
    TEST_ASSERT_EQ(std::string("heal"), attached[1]->id());

    TEST_ASSERT_FALSE(manager.detach_effect("other", "heal"));
    TEST_ASSERT_EQ(2u, manager.remove_card_effects("card"));
    TEST_ASSERT_FALSE(manager.has_effects("card"));
}

TEST(EffectManager, UnregisterDropsAttachments) {
    EffectManager manager;
    manager.register_effect(std::make_shared<HealEffect>("Heal", 10, "heal"));
    manager.attach_effect("a", "heal");
    manager.attach_effect("b", "heal");

    TEST_ASSERT_TRUE(manager.unregister_effect("heal"));
    TEST_ASSERT_FALSE(manager.unregister_effect("heal"));
    TEST_ASSERT_FALSE(manager.has_effects("a"));
    TEST_ASSERT_FALSE(manager.has_effects("b"));
}

TEST(EffectManager, EffectsByTrigger) {
    EffectManager manager;
    manager.register_effect(std::make_shared<HealEffect>("Heal", 10, "heal"));
    manager.register_effect(std::make_shared<DamageEffect>("Zap", 10, "zap"));
    manager.attach_effect("a", "heal");
    manager.attach_effect("b", "zap");

    auto on_play = manager.get_effects_by_trigger(EffectTrigger(TriggerType::ON_PLAY));
    TEST_ASSERT_EQ(1u, on_play.size());
    TEST_ASSERT_EQ(std::string("a"), on_play[0].first);

    TEST_ASSERT_TRUE(manager.get_effects_by_trigger(EffectTrigger(TriggerType::ON_KNOCK_OUT)).empty());
}

// ============================================================================
// DISPATCH TESTS
// ============================================================================

TEST(EffectDispatch, OnlyMatchingTriggerFires) {
    StartedGame started;
    EffectManager manager;
    int turn_starts = 0;
    int turn_ends = 0;
    manager.register_effect(counting_effect("start", TriggerType::ON_TURN_START, turn_starts));
    manager.register_effect(counting_effect("end", TriggerType::ON_TURN_END, turn_ends));
    manager.attach_effect("x", "start");
    manager.attach_effect("y", "end");

    auto results = manager.trigger_effects(started.game, EffectTrigger(TriggerType::ON_TURN_START),
                                           context_for("alice", EffectTarget::self()));
    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT_EQ(1, turn_starts);
    TEST_ASSERT_EQ(0, turn_ends);
    TEST_ASSERT_EQ(std::string("start"), results[0].effect_id);
    TEST_ASSERT_EQ(std::string("x"), results[0].source_card);
}

TEST(EffectDispatch, SourceAndTriggerAreBound) {
    StartedGame started;
    EffectManager manager;
    CardID seen_source;
    std::optional<EffectTrigger> seen_trigger;
    manager.register_effect(std::make_shared<CallbackEffect>(
        "Spy", "Records its context", std::vector<EffectTrigger>{EffectTrigger(TriggerType::MANUAL)},
        [&](Game&, const EffectContext& context) {
            seen_source = context.source_card;
            seen_trigger = context.trigger;
            return EffectResult::ok({EffectOutcome::custom("seen")});
        },
        nullptr, "spy"));
    manager.attach_effect("watched", "spy");

    EffectContext context = context_for("alice", EffectTarget::self());
    context.source_card = "ignored";
    auto results = manager.trigger_card_effects(started.game, "watched",
                                                EffectTrigger(TriggerType::MANUAL), context);
    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT_TRUE(results[0].success);
    TEST_ASSERT_EQ(std::string("watched"), seen_source);
    TEST_ASSERT_TRUE(seen_trigger.has_value() && seen_trigger->type == TriggerType::MANUAL);
}

TEST(EffectDispatch, AttachDuringDispatchWaitsForNextTrigger) {
    StartedGame started;
    EffectManager manager;
    int late_calls = 0;
    manager.register_effect(counting_effect("late", TriggerType::MANUAL, late_calls));
    manager.register_effect(std::make_shared<CallbackEffect>(
        "Summoner", "Attaches another effect", std::vector<EffectTrigger>{EffectTrigger(TriggerType::MANUAL)},
        [&manager](Game&, const EffectContext& context) {
            manager.attach_effect(context.source_card, "late");
            return EffectResult::ok({});
        },
        nullptr, "summoner"));
    manager.attach_effect("card", "summoner");

    EffectContext context = context_for("alice", EffectTarget::self());
    auto first = manager.trigger_card_effects(started.game, "card", EffectTrigger(TriggerType::MANUAL), context);
    TEST_ASSERT_EQ(1u, first.size());
    TEST_ASSERT_EQ(0, late_calls);

    auto second = manager.trigger_card_effects(started.game, "card", EffectTrigger(TriggerType::MANUAL), context);
    TEST_ASSERT_EQ(2u, second.size());
    TEST_ASSERT_EQ(1, late_calls);
    TEST_ASSERT_EQ(3u, manager.get_card_effects("card").size());
}

TEST(EffectDispatch, FailureDoesNotStopOthers) {
    StartedGame started;
    EffectManager manager;
    started.bob().deck.clear();
    int after = 0;
    manager.register_effect(std::make_shared<DrawCardsEffect>("Draw", 2, "draw"));
    manager.register_effect(counting_effect("after", TriggerType::ON_PLAY, after));
    manager.attach_effect("card", "draw");
    manager.attach_effect("card", "after");

    auto results = manager.trigger_card_effects(started.game, "card", EffectTrigger(TriggerType::ON_PLAY),
                                                context_for("alice", EffectTarget::player("bob")));
    TEST_ASSERT_EQ(2u, results.size());
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT(results[0].error->type == EffectErrorType::INSUFFICIENT_RESOURCES);
    TEST_ASSERT_EQ(std::string("Deck is empty"), results[0].error->message);
    TEST_ASSERT_TRUE(results[1].success);
    TEST_ASSERT_EQ(1, after);
}

TEST(EffectDispatch, ThrowingEffectDoesNotStopOthers) {
    StartedGame started;
    EffectManager manager;
    int after = 0;
    manager.register_effect(std::make_shared<CallbackEffect>(
        "Faulty", "Throws from its body", std::vector<EffectTrigger>{EffectTrigger(TriggerType::MANUAL)},
        [](Game&, const EffectContext&) -> EffectResult { throw std::runtime_error("boom"); },
        nullptr, "faulty"));
    manager.register_effect(counting_effect("after", TriggerType::MANUAL, after));
    manager.attach_effect("card", "faulty");
    manager.attach_effect("card", "after");

    auto results = manager.trigger_effects(started.game, EffectTrigger(TriggerType::MANUAL),
                                           context_for("alice", EffectTarget::self()));
    TEST_ASSERT_EQ(2u, results.size());
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT(results[0].error->type == EffectErrorType::GENERAL);
    TEST_ASSERT_EQ(std::string("Faulty failed: boom"), results[0].error->message);
    TEST_ASSERT_EQ(std::string("faulty"), results[0].effect_id);
    TEST_ASSERT_TRUE(results[1].success);
    TEST_ASSERT_EQ(1, after);
}

TEST(EffectDispatch, PredicateGatesCallback) {
    StartedGame started;
    EffectManager manager;
    int calls = 0;
    manager.register_effect(std::make_shared<CallbackEffect>(
        "Picky", "Only for bob", std::vector<EffectTrigger>{EffectTrigger(TriggerType::MANUAL)},
        [&calls](Game&, const EffectContext&) {
            calls++;
            return EffectResult::ok({});
        },
        [](const Game&, const EffectContext& context) { return context.controller == "bob"; },
        "picky"));
    manager.attach_effect("card", "picky");

    auto results = manager.trigger_card_effects(started.game, "card", EffectTrigger(TriggerType::MANUAL),
                                                context_for("alice", EffectTarget::self()));
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT(results[0].error->type == EffectErrorType::REQUIREMENTS_NOT_MET);
    TEST_ASSERT_EQ(std::string("Picky cannot apply"), results[0].error->message);
    TEST_ASSERT_EQ(0, calls);
}

// ============================================================================
// BUILT-IN EFFECT TESTS
// ============================================================================

TEST(BuiltinEffects, DamageTargetsInPlayPokemon) {
    StartedGame started;
    DamageEffect zap("Zap", 30, "zap");

    EffectContext context = context_for("alice", EffectTarget::card(started.bob_active));
    TEST_ASSERT_TRUE(zap.can_apply(started.game, context));
    EffectResult result = zap.apply(started.game, context);
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQ(30, started.bob().get_damage(started.bob_active));
    TEST_ASSERT(result.outcomes[0].type == OutcomeType::DAMAGE_DEALT);
    TEST_ASSERT(started.game.history.back().type == EventType::DAMAGE_DEALT);
}

TEST(BuiltinEffects, DamageRequirementsRejectHandCards) {
    StartedGame started;
    EffectManager manager;
    manager.register_effect(std::make_shared<DamageEffect>("Zap", 30, "zap"));
    manager.attach_effect("source", "zap");
    CardID in_hand = give_card(started.game, "bob", "pikachu", "hand");

    auto results = manager.trigger_card_effects(started.game, "source", EffectTrigger(TriggerType::ON_ATTACK),
                                                context_for("alice", EffectTarget::card(in_hand)));
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT_EQ(std::string("Zap cannot apply"), results[0].error->message);
    TEST_ASSERT_EQ(0, started.bob().get_damage(in_hand));
}

TEST(BuiltinEffects, DamageCanKnockOut) {
    StartedGame started;
    DamageEffect blast("Blast", 60, "blast");

    TEST_ASSERT_TRUE(blast.apply(started.game, context_for("alice", EffectTarget::card(started.bob_active))).success);
    TEST_ASSERT_FALSE(started.bob().active_pokemon.has_value());
    TEST_ASSERT_EQ(5, started.alice().prize_cards);
}

TEST(BuiltinEffects, HealReportsAmountHealed) {
    StartedGame started;
    started.alice().add_damage(started.alice_active, 20);
    HealEffect potion("Potion", 30, "potion");

    EffectResult result = potion.apply(started.game, context_for("alice", EffectTarget::card(started.alice_active)));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQ(20, result.outcomes[0].amount);
    TEST_ASSERT_EQ(0, started.alice().get_damage(started.alice_active));
}

TEST(BuiltinEffects, HealWithoutTarget) {
    StartedGame started;
    HealEffect potion("Potion", 30, "potion");

    EffectResult result = potion.apply(started.game, context_for("alice", EffectTarget::none()));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT(result.error->type == EffectErrorType::INVALID_TARGET);
}

TEST(BuiltinEffects, DrawForController) {
    StartedGame started;
    DrawCardsEffect draw("Professor", 3, "professor");
    size_t hand = started.alice().hand.size();

    EffectResult result = draw.apply(started.game, context_for("alice", EffectTarget::self()));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQ(hand + 3, started.alice().hand.size());
    TEST_ASSERT_EQ(3, result.outcomes[0].amount);
    TEST_ASSERT_EQ(std::string("alice"), result.outcomes[0].player);
}

TEST(BuiltinEffects, SpecialConditionWithDuration) {
    StartedGame started;
    SpecialConditionEffect stun("Stun", SpecialCondition::paralyzed(), 1, "stun");

    EffectResult result = stun.apply(started.game, context_for("alice", EffectTarget::active_pokemon("bob")));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_FALSE(started.bob().can_pokemon_attack(started.bob_active));
    TEST_ASSERT_EQ(1, started.bob().get_special_conditions(started.bob_active)[0].duration);
    TEST_ASSERT_EQ(std::string("Applies Paralyzed"), stun.description());
}

// ============================================================================
// REQUIREMENT AND TARGET TESTS
// ============================================================================

TEST(EffectTargets, RequirementKinds) {
    StartedGame started;
    Game& game = started.game;
    CardID energy = give_card(game, "alice", "lightning", "e");
    game.get_player("alice")->attach_energy(energy, started.alice_active);
    game.get_player("alice")->add_damage(started.alice_active, 20);

    TEST_ASSERT_TRUE(meets_requirements(game, started.alice_active,
        {TargetRequirement::owned_by("alice"), TargetRequirement::min_hp(60),
         TargetRequirement::has_energy_type(EnergyType::LIGHTNING), TargetRequirement::min_damage(20),
         TargetRequirement::custom("anything goes")}));
    TEST_ASSERT_FALSE(meets_requirements(game, started.alice_active, {TargetRequirement::owned_by("bob")}));
    TEST_ASSERT_FALSE(meets_requirements(game, started.alice_active, {TargetRequirement::min_hp(70)}));
    TEST_ASSERT_FALSE(meets_requirements(game, started.alice_active,
                                         {TargetRequirement::has_energy_type(EnergyType::FIRE)}));
    TEST_ASSERT_FALSE(meets_requirements(game, "unknown-card", {}));

    CardID potion = give_card(game, "alice", "potion", "p");
    TEST_ASSERT_TRUE(meets_requirements(game, potion,
        {TargetRequirement::of(RequirementType::TRAINER), TargetRequirement::of(RequirementType::IN_HAND)}));
    TEST_ASSERT_FALSE(meets_requirements(game, potion, {TargetRequirement::of(RequirementType::IN_PLAY)}));
}

TEST(EffectTargets, ResolveTargets) {
    StartedGame started;
    CardID bench = give_card(started.game, "bob", "pikachu", "bench");
    started.bob().bench_pokemon(bench);

    EffectContext context = context_for("alice", EffectTarget::all_pokemon());
    TEST_ASSERT_EQ(3u, resolve_target_cards(started.game, context).size());

    context.target = EffectTarget::all_player_pokemon("bob");
    TEST_ASSERT_EQ(2u, resolve_target_cards(started.game, context).size());

    context.target = EffectTarget::active_pokemon("bob");
    auto active = resolve_target_cards(started.game, context);
    TEST_ASSERT_EQ(1u, active.size());
    TEST_ASSERT_EQ(started.bob_active, active[0]);

    context.target = EffectTarget::choice({bench});
    TEST_ASSERT_TRUE(resolve_target_cards(started.game, context).empty());
}

// ============================================================================
// GAME TRIGGER TESTS
// ============================================================================

TEST(GameTriggers, TurnStartFiresForInPlayPokemon) {
    StartedGame started;
    EffectManager manager;
    int bob_turns = 0;
    manager.register_effect(counting_effect("upkeep", TriggerType::ON_TURN_START, bob_turns));
    manager.attach_effect(started.bob_active, "upkeep");
    started.game.set_effect_manager(&manager);

    started.game.end_turn();
    TEST_ASSERT_EQ(1, bob_turns);
    started.game.end_turn();
    TEST_ASSERT_EQ(1, bob_turns);
    started.game.end_turn();
    TEST_ASSERT_EQ(2, bob_turns);
}

TEST(GameTriggers, TurnEndFires) {
    StartedGame started;
    EffectManager manager;
    int alice_ends = 0;
    manager.register_effect(counting_effect("cleanup", TriggerType::ON_TURN_END, alice_ends));
    manager.attach_effect(started.alice_active, "cleanup");
    started.game.set_effect_manager(&manager);

    started.game.end_turn();
    TEST_ASSERT_EQ(1, alice_ends);
}

TEST(GameTriggers, PlayingTrainerFiresOnPlay) {
    StartedGame started;
    RuleEngine engine = StandardRules::create_full_engine();
    EffectManager manager;
    CardID professor = give_card(started.game, "alice", "potion", "professor");
    manager.register_effect(std::make_shared<DrawCardsEffect>("Draw Two", 2, "draw-two"));
    manager.attach_effect(professor, "draw-two");
    started.game.set_effect_manager(&manager);
    size_t hand = started.alice().hand.size();

    TEST_ASSERT_TRUE(started.game.execute_action(engine, GameAction::play_card("alice", professor)).success);
    TEST_ASSERT_EQ(hand - 1 + 2, started.alice().hand.size());
}

TEST(GameTriggers, AttackFiresOnAttackAgainstDefender) {
    StartedGame started;
    RuleEngine engine = StandardRules::create_full_engine();
    EffectManager manager;
    manager.register_effect(std::make_shared<SpecialConditionEffect>("Static", SpecialCondition::paralyzed(),
                                                                     -1, "static"));
    manager.attach_effect(started.alice_active, "static");
    started.game.set_effect_manager(&manager);
    CardID energy = give_card(started.game, "alice", "lightning", "e");
    started.game.execute_action(engine, GameAction::attach_energy("alice", energy, started.alice_active));

    TEST_ASSERT_TRUE(started.game.execute_action(
        engine, GameAction::use_attack("alice", started.alice_active, 0)).success);
    TEST_ASSERT_TRUE(started.bob().has_special_condition_type(started.bob_active, ConditionKind::PARALYZED));
    TEST_ASSERT_FALSE(started.alice().has_special_condition_type(started.alice_active, ConditionKind::PARALYZED));
}

TEST(GameTriggers, EnergyAttachFiresOnPokemon) {
    StartedGame started;
    RuleEngine engine = StandardRules::create_full_engine();
    EffectManager manager;
    CardID seen_target;
    manager.register_effect(std::make_shared<CallbackEffect>(
        "Charge", "Watches energy", std::vector<EffectTrigger>{EffectTrigger(TriggerType::ON_ENERGY_ATTACH)},
        [&seen_target](Game&, const EffectContext& context) {
            seen_target = context.target.id;
            return EffectResult::ok({});
        },
        nullptr, "charge"));
    manager.attach_effect(started.alice_active, "charge");
    started.game.set_effect_manager(&manager);
    CardID energy = give_card(started.game, "alice", "lightning", "e");

    started.game.execute_action(engine, GameAction::attach_energy("alice", energy, started.alice_active));
    TEST_ASSERT_EQ(energy, seen_target);
}

TEST(GameTriggers, KnockOutFiresAndClearsEffects) {
    StartedGame started;
    EffectManager manager;
    int last_words = 0;
    manager.register_effect(counting_effect("last-words", TriggerType::ON_KNOCK_OUT, last_words));
    manager.attach_effect(started.bob_active, "last-words");
    started.game.set_effect_manager(&manager);
    started.bob().add_damage(started.bob_active, 60);

    TEST_ASSERT_TRUE(started.game.resolve_knockout("bob", started.bob_active));
    TEST_ASSERT_EQ(1, last_words);
    TEST_ASSERT_FALSE(manager.has_effects(started.bob_active));
}
