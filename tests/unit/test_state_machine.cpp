#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <vecanim/error.hpp>
#include <vecanim/scene.hpp>
#include <vecanim/state_machine.hpp>

using namespace vecanim;

namespace
{

std::unique_ptr<Timeline> make_timeline(float duration)
{
    return std::make_unique<Timeline>(duration, 60.0f);
}

// idle, walk and run states with one-second timelines.
struct Fixture
{
    StateMachine sm;

    Fixture()
    {
        sm.add_state("idle", "Idle", make_timeline(1.0f));
        sm.add_state("walk", "Walk", make_timeline(1.0f));
        sm.add_state("run", "Run", make_timeline(1.0f));
        sm.change_state("idle");
    }
};

ErrorCode code_of(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const Error& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected vecanim::Error";
    return ErrorCode::InvalidOperation;
}

}  // namespace

// ─── Conditions ──────────────────────────────────────────────────────────────

TEST(TransitionCondition, EventMatchesWhilePending)
{
    StateMachineContext ctx;
    TransitionCondition cond = EventCondition{"jump"};
    EXPECT_FALSE(evaluate_condition(cond, ctx));
    ctx.events.insert("jump");
    EXPECT_TRUE(evaluate_condition(cond, ctx));
}

TEST(TransitionCondition, BooleanRequiresSetInput)
{
    StateMachineContext ctx;
    EXPECT_FALSE(evaluate_condition(BooleanCondition{"on", false}, ctx));
    ctx.booleans["on"] = false;
    EXPECT_TRUE(evaluate_condition(BooleanCondition{"on", false}, ctx));
    EXPECT_FALSE(evaluate_condition(BooleanCondition{"on", true}, ctx));
}

TEST(TransitionCondition, NumberComparisons)
{
    StateMachineContext ctx;
    ctx.numbers["speed"] = 5.0f;

    EXPECT_TRUE(evaluate_condition(NumberCondition{"speed", CompareOp::Equals, 5.0f}, ctx));
    EXPECT_FALSE(evaluate_condition(NumberCondition{"speed", CompareOp::NotEquals, 5.0f}, ctx));
    EXPECT_TRUE(evaluate_condition(NumberCondition{"speed", CompareOp::GreaterThan, 4.0f}, ctx));
    EXPECT_FALSE(evaluate_condition(NumberCondition{"speed", CompareOp::GreaterThan, 5.0f}, ctx));
    EXPECT_TRUE(
        evaluate_condition(NumberCondition{"speed", CompareOp::GreaterThanOrEqual, 5.0f}, ctx));
    EXPECT_TRUE(evaluate_condition(NumberCondition{"speed", CompareOp::LessThan, 6.0f}, ctx));
    EXPECT_TRUE(evaluate_condition(NumberCondition{"speed", CompareOp::LessThanOrEqual, 5.0f}, ctx));

    EXPECT_FALSE(evaluate_condition(NumberCondition{"missing", CompareOp::LessThan, 1.0f}, ctx));
}

TEST(TransitionCondition, NumberEqualsUsesEpsilon)
{
    StateMachineContext ctx;
    ctx.numbers["x"] = 1.05f;
    EXPECT_FALSE(evaluate_condition(NumberCondition{"x", CompareOp::Equals, 1.0f}, ctx));
    EXPECT_TRUE(evaluate_condition(NumberCondition{"x", CompareOp::Equals, 1.0f, 0.1f}, ctx));
}

TEST(TransitionCondition, TimeCondition)
{
    StateMachineContext ctx;
    ctx.state_time = 0.4f;
    EXPECT_FALSE(evaluate_condition(TimeCondition(0.5f), ctx));
    ctx.state_time = 0.5f;
    EXPECT_TRUE(evaluate_condition(TimeCondition(0.5f), ctx));

    EXPECT_EQ(code_of([] { TimeCondition(-1.0f); }), ErrorCode::InvalidArgument);
}

TEST(CompareOp, Names)
{
    EXPECT_STREQ(compare_op_name(CompareOp::GreaterThanOrEqual), "greaterThanOrEqual");
    EXPECT_STREQ(compare_op_name(CompareOp::NotEquals), "notEquals");
}

// ─── StateTransition ─────────────────────────────────────────────────────────

TEST(StateTransition, AllConditionsMustPass)
{
    StateTransition t("a", "b");
    StateMachineContext ctx;
    EXPECT_TRUE(t.can_transition(ctx));

    t.add_condition(EventCondition{"go"}).add_condition(BooleanCondition{"ready", true});
    ctx.events.insert("go");
    EXPECT_FALSE(t.can_transition(ctx));
    ctx.booleans["ready"] = true;
    EXPECT_TRUE(t.can_transition(ctx));
}

TEST(StateTransition, NegativeDurationThrows)
{
    EXPECT_EQ(code_of([] { StateTransition("a", "b", {}, -0.1f); }), ErrorCode::InvalidArgument);
    StateTransition t("a", "b");
    EXPECT_EQ(code_of([&t] { t.set_duration(-1.0f); }), ErrorCode::InvalidArgument);
    t.set_duration(0.25f);
    EXPECT_FLOAT_EQ(t.duration(), 0.25f);
}

// ─── AnimationState ──────────────────────────────────────────────────────────

TEST(AnimationState, SpeedIsClamped)
{
    AnimationState s("a", "A", make_timeline(1.0f), 50.0f);
    EXPECT_FLOAT_EQ(s.speed(), 10.0f);
    s.set_speed(0.0f);
    EXPECT_FLOAT_EQ(s.speed(), 0.1f);
}

TEST(AnimationState, NullTimelineThrows)
{
    EXPECT_EQ(code_of([] { AnimationState("a", "A", nullptr); }), ErrorCode::InvalidArgument);
}

// ─── StateMachine ────────────────────────────────────────────────────────────

TEST(StateMachine, AddStateRejectsDuplicates)
{
    Fixture f;
    EXPECT_EQ(f.sm.state_count(), 3u);
    EXPECT_EQ(code_of([&f] { f.sm.add_state("walk", "Again", make_timeline(1.0f)); }),
              ErrorCode::StateMachineError);
    EXPECT_EQ(code_of([&f] { f.sm.add_state(nullptr); }), ErrorCode::InvalidArgument);
    EXPECT_EQ(f.sm.state_ids(), (std::vector<std::string>{"idle", "walk", "run"}));
}

TEST(StateMachine, TransitionEndpointsMustExist)
{
    Fixture f;
    EXPECT_EQ(code_of([&f] { f.sm.add_transition(StateTransition("idle", "fly")); }),
              ErrorCode::StateMachineError);
    EXPECT_EQ(code_of([&f] { f.sm.add_transition(StateTransition("fly", "idle")); }),
              ErrorCode::StateMachineError);
    EXPECT_EQ(f.sm.transition_count(), 0u);
}

TEST(StateMachine, ChangeStateUnknownThrows)
{
    Fixture f;
    EXPECT_EQ(code_of([&f] { f.sm.change_state("nope"); }), ErrorCode::StateMachineError);
    EXPECT_EQ(f.sm.current_state_id(), "idle");
}

TEST(StateMachine, ChangeStateActivatesAndRewinds)
{
    Fixture f;
    f.sm.update(0.5f);
    EXPECT_FLOAT_EQ(f.sm.current_time(), 0.5f);

    f.sm.change_state("walk");
    EXPECT_FALSE(f.sm.state("idle")->is_active());
    EXPECT_TRUE(f.sm.state("walk")->is_active());
    EXPECT_FLOAT_EQ(f.sm.current_time(), 0.0f);
    EXPECT_FLOAT_EQ(f.sm.context().state_time, 0.0f);
}

TEST(StateMachine, HigherPriorityWins)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle", "walk", {}, 0.0f, 1));
    f.sm.add_transition(StateTransition("idle", "run", {}, 0.0f, 10));

    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "run");
}

TEST(StateMachine, EqualPriorityKeepsFirstDeclared)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle", "walk", {}, 0.0f, 5));
    f.sm.add_transition(StateTransition("idle", "run", {}, 0.0f, 5));

    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "walk");
}

TEST(StateMachine, EventsLastOneUpdate)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle", "walk", {EventCondition{"go"}}));
    f.sm.add_transition(StateTransition("walk", "run", {EventCondition{"go"}}));

    f.sm.trigger("go");
    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "walk");
    EXPECT_TRUE(f.sm.context().events.empty());

    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "walk");
}

TEST(StateMachine, UpdateWithoutStateClearsEvents)
{
    StateMachine sm;
    sm.trigger("go");
    sm.update(0.1f);
    EXPECT_TRUE(sm.context().events.empty());
}

TEST(StateMachine, InputsDriveTransitions)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle",
                                        "walk",
                                        {NumberCondition{"speed", CompareOp::GreaterThan, 0.5f}}));
    f.sm.add_transition(StateTransition("walk", "idle", {BooleanCondition{"stop", true}}));

    f.sm.set_input("speed", 0.2f);
    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "idle");

    f.sm.set_input("speed", 2.0f);
    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "walk");

    f.sm.set_input("stop", true);
    f.sm.update(0.016f);
    EXPECT_EQ(f.sm.current_state_id(), "idle");

    EXPECT_EQ(f.sm.boolean_input("stop"), std::optional<bool>(true));
    EXPECT_EQ(f.sm.number_input("speed"), std::optional<float>(2.0f));
    EXPECT_FALSE(f.sm.number_input("missing").has_value());
}

TEST(StateMachine, TimeConditionUsesStateTime)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle", "walk", {TimeCondition(0.5f)}));

    f.sm.update(0.3f);
    EXPECT_EQ(f.sm.current_state_id(), "idle");
    f.sm.update(0.3f);
    EXPECT_EQ(f.sm.current_state_id(), "walk");
    EXPECT_FLOAT_EQ(f.sm.current_time(), 0.0f);
}

TEST(StateMachine, StateSpeedScalesTime)
{
    StateMachine sm;
    sm.add_state("fast", "Fast", make_timeline(10.0f), 2.0f);
    sm.change_state("fast");
    sm.update(1.0f);
    EXPECT_FLOAT_EQ(sm.current_time(), 2.0f);
}

TEST(StateMachine, LoopingStateWraps)
{
    StateMachine sm;
    sm.add_state("spin", "Spin", make_timeline(1.0f), 1.0f, true);
    sm.add_state("once", "Once", make_timeline(1.0f));

    sm.change_state("spin");
    sm.update(1.25f);
    EXPECT_NEAR(sm.current_time(), 0.25f, 1e-5f);

    sm.change_state("once");
    sm.update(1.25f);
    EXPECT_FLOAT_EQ(sm.current_time(), 1.0f);
}

TEST(StateMachine, UpdateEvaluatesActiveTimeline)
{
    SceneGraph g;
    NodeId     sh = g.create_shape();

    auto tl = make_timeline(1.0f);
    tl->add_track(g, sh, "opacity").add_keyframe(0.0f, 0.0f).add_keyframe(1.0f, 1.0f);

    StateMachine sm;
    sm.add_state("fade", "Fade", std::move(tl));
    sm.change_state("fade");
    sm.update(0.25f);
    EXPECT_NEAR(g.opacity(sh), 0.25f, 1e-6f);
}

TEST(StateMachine, RemoveStateDropsTransitions)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle", "walk"));
    f.sm.add_transition(StateTransition("walk", "run"));
    f.sm.add_transition(StateTransition("run", "idle"));

    EXPECT_TRUE(f.sm.remove_state("walk"));
    EXPECT_FALSE(f.sm.remove_state("walk"));
    EXPECT_EQ(f.sm.transition_count(), 1u);
    EXPECT_EQ(f.sm.state_ids(), (std::vector<std::string>{"idle", "run"}));

    EXPECT_TRUE(f.sm.remove_state("idle"));
    EXPECT_EQ(f.sm.current_state(), nullptr);
    EXPECT_EQ(f.sm.current_state_id(), "");
}

TEST(StateMachine, RemoveTransitions)
{
    Fixture f;
    auto& a = f.sm.add_transition(StateTransition("idle", "walk"));
    f.sm.add_transition(StateTransition("idle", "run"));
    f.sm.add_transition(StateTransition("walk", "run"));

    EXPECT_TRUE(f.sm.remove_transition(&a));
    EXPECT_FALSE(f.sm.remove_transition(&a));
    EXPECT_EQ(f.sm.remove_transitions_from("idle"), 1u);
    EXPECT_EQ(f.sm.transition_count(), 1u);
}

TEST(StateMachine, StateChangeCallback)
{
    Fixture f;
    std::vector<std::pair<std::string, std::string>> changes;
    f.sm.set_on_state_change([&changes](const std::string& from, const std::string& to)
                             { changes.emplace_back(from, to); });

    f.sm.add_transition(StateTransition("idle", "walk", {EventCondition{"go"}}));
    f.sm.trigger("go");
    f.sm.update(0.016f);
    f.sm.change_state("run");

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0], std::make_pair(std::string("idle"), std::string("walk")));
    EXPECT_EQ(changes[1], std::make_pair(std::string("walk"), std::string("run")));
}

TEST(StateMachine, StateChangeReportedAfterUpdateFinishes)
{
    SceneGraph scene;
    NodeId     node = scene.create_shape();

    StateMachine sm;
    sm.add_state("idle", "Idle", make_timeline(1.0f));
    auto walk = make_timeline(1.0f);
    walk->add_track(scene, node, "opacity").add_keyframe(0.0f, 0.25f).add_keyframe(1.0f, 0.75f);
    sm.add_state("walk", "Walk", std::move(walk));
    sm.change_state("idle");
    sm.add_transition(StateTransition("idle", "walk", {EventCondition{"go"}}));

    float opacity_seen  = -1.0f;
    bool  event_pending = true;
    sm.set_on_state_change(
        [&](const std::string&, const std::string&)
        {
            opacity_seen  = scene.opacity(node);
            event_pending = sm.context().events.count("go") != 0;
        });

    sm.trigger("go");
    sm.update(0.5f);

    EXPECT_FLOAT_EQ(opacity_seen, 0.25f);
    EXPECT_FALSE(event_pending);
}

TEST(StateMachine, StateChangeCallbackMayDestroyMachine)
{
    auto sm = std::make_unique<StateMachine>();
    sm->add_state("idle", "Idle", make_timeline(1.0f));
    sm->add_state("walk", "Walk", make_timeline(1.0f));
    sm->change_state("idle");
    sm->add_transition(StateTransition("idle", "walk", {EventCondition{"go"}}));

    std::vector<std::string> entered;
    sm->set_on_state_change(
        [&sm, &entered](const std::string&, const std::string& to)
        {
            entered.push_back(to);
            sm.reset();
        });

    sm->trigger("go");
    sm->update(0.016f);

    EXPECT_EQ(sm.get(), nullptr);
    EXPECT_EQ(entered, (std::vector<std::string>{"walk"}));
}

TEST(StateMachine, SetCurrentTimeClamps)
{
    Fixture f;
    f.sm.set_current_time(5.0f);
    EXPECT_FLOAT_EQ(f.sm.current_time(), 1.0f);
    f.sm.set_current_time(-1.0f);
    EXPECT_FLOAT_EQ(f.sm.current_time(), 0.0f);
}

TEST(StateMachine, ResetKeepsGraph)
{
    Fixture f;
    f.sm.add_transition(StateTransition("idle", "walk", {EventCondition{"go"}}));
    f.sm.set_input("flag", true);
    f.sm.update(0.5f);

    f.sm.reset();
    EXPECT_EQ(f.sm.current_state(), nullptr);
    EXPECT_FLOAT_EQ(f.sm.current_time(), 0.0f);
    EXPECT_EQ(f.sm.state_count(), 3u);
    EXPECT_EQ(f.sm.transition_count(), 1u);
    EXPECT_TRUE(f.sm.boolean_input("flag").value_or(false));
}
