#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vecanim/timeline.hpp>

using namespace vecanim;

namespace
{

float position_x(const SceneGraph& g, NodeId id)
{
    return g.transform(id).position.x;
}

}  // namespace

// ─── AnimationTrack ──────────────────────────────────────────────────────────

TEST(AnimationTrack, KeyframesStaySorted)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "opacity");
    track.add_keyframe(2.0f, 1.0f).add_keyframe(0.0f, 0.0f).add_keyframe(1.0f, 0.5f);

    ASSERT_EQ(track.keyframe_count(), 3u);
    EXPECT_FLOAT_EQ(track.keyframes()[0].time, 0.0f);
    EXPECT_FLOAT_EQ(track.keyframes()[1].time, 1.0f);
    EXPECT_FLOAT_EQ(track.keyframes()[2].time, 2.0f);
    EXPECT_FLOAT_EQ(track.start_time(), 0.0f);
    EXPECT_FLOAT_EQ(track.end_time(), 2.0f);
}

TEST(AnimationTrack, EqualTimesKeepInsertionOrder)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "opacity");
    track.add_keyframe(1.0f, 0.1f).add_keyframe(1.0f, 0.2f).add_keyframe(1.0f, 0.3f);
    EXPECT_FLOAT_EQ(std::get<float>(track.keyframes()[0].value), 0.1f);
    EXPECT_FLOAT_EQ(std::get<float>(track.keyframes()[2].value), 0.3f);
}

TEST(AnimationTrack, RejectsMismatchedValueType)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "transform.position");
    EXPECT_THROW(track.add_keyframe(0.0f, 1.0f), std::invalid_argument);
    EXPECT_NO_THROW(track.add_keyframe(0.0f, Vec2{1.0f, 2.0f}));
}

TEST(AnimationTrack, UnknownPathThrowsAtBind)
{
    SceneGraph g;
    NodeId     sh = g.create_shape();
    EXPECT_THROW(AnimationTrack(g, sh, "transform.position.z"), std::invalid_argument);
}

TEST(AnimationTrack, EmptyTrackIsNoOp)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "opacity");
    g.set_opacity(sh, 0.3f);
    EXPECT_FALSE(track.evaluate(1.0f).has_value());
    EXPECT_FLOAT_EQ(g.opacity(sh), 0.3f);
}

TEST(AnimationTrack, ClampsOutsideKeyframeRange)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "transform.position.x");
    track.add_keyframe(1.0f, 10.0f).add_keyframe(3.0f, 30.0f);

    track.evaluate(0.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 10.0f);
    track.evaluate(1.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 10.0f);
    track.evaluate(3.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 30.0f);
    track.evaluate(99.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 30.0f);
}

TEST(AnimationTrack, LinearInterpolationIsExact)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "opacity");
    track.add_keyframe(0.0f, 0.0f).add_keyframe(2.0f, 1.0f);

    track.evaluate(1.0f);
    EXPECT_NEAR(g.opacity(sh), 0.5f, 1e-6f);
}

TEST(AnimationTrack, StepHoldsFromValue)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "transform.position.x");
    track.add_keyframe(0.0f, 0.0f, Interpolation::Step).add_keyframe(1.0f, 100.0f);

    track.evaluate(0.99f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 0.0f);
    track.evaluate(1.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 100.0f);
}

TEST(AnimationTrack, CubicAndBezierFallBackToLinear)
{
    SceneGraph g;
    NodeId     sh = g.create_shape();

    for (auto interp : {Interpolation::Cubic, Interpolation::Bezier})
    {
        AnimationTrack track(g, sh, "transform.position.x");
        track.add_keyframe(0.0f, 0.0f, interp).add_keyframe(4.0f, 100.0f);
        auto v = track.sample(1.0f);
        ASSERT_TRUE(v.has_value());
        EXPECT_FLOAT_EQ(std::get<float>(*v), 25.0f) << interpolation_name(interp);
    }
}

TEST(AnimationTrack, EasingFromOutgoingKeyframe)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "transform.position.x");
    track.add_keyframe(0.0f, 0.0f, Interpolation::Linear, ease::in_quad)
        .add_keyframe(1.0f, 100.0f);

    EXPECT_FLOAT_EQ(std::get<float>(*track.sample(0.5f)), 25.0f);
}

TEST(AnimationTrack, NonNumericValuesStepAtHalf)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "transform.position");
    track.add_keyframe(0.0f, Vec2{0.0f, 0.0f}).add_keyframe(1.0f, Vec2{10.0f, 10.0f});

    EXPECT_EQ(std::get<Vec2>(*track.sample(0.49f)), Vec2(0.0f, 0.0f));
    EXPECT_EQ(std::get<Vec2>(*track.sample(0.5f)), Vec2(10.0f, 10.0f));
}

TEST(AnimationTrack, SampleDoesNotWrite)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "opacity");
    track.add_keyframe(0.0f, 0.0f).add_keyframe(1.0f, 0.0f);
    EXPECT_TRUE(track.sample(0.5f).has_value());
    EXPECT_FLOAT_EQ(g.opacity(sh), 1.0f);
}

TEST(AnimationTrack, RemoveKeyframe)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "opacity");
    track.add_keyframe(0.0f, 0.0f).add_keyframe(1.0f, 1.0f);
    EXPECT_TRUE(track.remove_keyframe(0));
    EXPECT_FALSE(track.remove_keyframe(5));
    EXPECT_EQ(track.keyframe_count(), 1u);
    track.clear_keyframes();
    EXPECT_TRUE(track.empty());
}

TEST(AnimationTrack, BindingAccessors)
{
    SceneGraph     g;
    NodeId         sh = g.create_shape();
    AnimationTrack track(g, sh, "stroke.color");
    EXPECT_EQ(track.target(), sh);
    EXPECT_EQ(track.property(), PropertyKey::StrokeColor);
    EXPECT_STREQ(track.property_path(), "stroke.color");
    EXPECT_EQ(track.value_type(), ValueType::Color);
}

// ─── Timeline ────────────────────────────────────────────────────────────────

TEST(Timeline, ClampsDurationAndFps)
{
    Timeline tl(-1.0f, 0.0f);
    EXPECT_FLOAT_EQ(tl.duration(), 0.0f);
    EXPECT_FLOAT_EQ(tl.fps(), 1.0f);

    tl.set_duration(5.0f);
    tl.set_fps(30.0f);
    EXPECT_FLOAT_EQ(tl.duration(), 5.0f);
    EXPECT_FLOAT_EQ(tl.fps(), 30.0f);
}

TEST(Timeline, FrameConversions)
{
    Timeline tl(2.5f, 24.0f);
    EXPECT_EQ(tl.frame_count(), 60);
    EXPECT_FLOAT_EQ(tl.frame_to_time(12), 0.5f);
    EXPECT_EQ(tl.time_to_frame(0.51f), 12);

    Timeline odd(1.01f, 10.0f);
    EXPECT_EQ(odd.frame_count(), 11);
}

TEST(Timeline, EvaluateClampsTime)
{
    SceneGraph g;
    NodeId     sh = g.create_shape();
    Timeline   tl(5.0f, 60.0f);
    tl.add_track(g, sh, "transform.position.x").add_keyframe(0.0f, 0.0f).add_keyframe(10.0f, 100.0f);

    tl.evaluate(20.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 50.0f);
    tl.evaluate(-3.0f);
    EXPECT_FLOAT_EQ(position_x(g, sh), 0.0f);
}

TEST(Timeline, EvaluatesEveryTrack)
{
    SceneGraph g;
    NodeId     a = g.create_shape();
    NodeId     b = g.create_shape();
    Timeline   tl(1.0f);
    tl.add_track(g, a, "opacity").add_keyframe(0.0f, 1.0f).add_keyframe(1.0f, 0.0f);
    tl.add_track(g, b, "transform.rotation").add_keyframe(0.0f, 0.0f).add_keyframe(1.0f, 2.0f);

    tl.evaluate(0.5f);
    EXPECT_FLOAT_EQ(g.opacity(a), 0.5f);
    EXPECT_FLOAT_EQ(g.transform(b).rotation, 1.0f);
}

TEST(Timeline, AddRemoveTracks)
{
    SceneGraph g;
    NodeId     sh = g.create_shape();
    Timeline   tl(1.0f);

    auto& first = tl.add_track(std::make_unique<AnimationTrack>(g, sh, "opacity"));
    tl.add_track(g, sh, "visible");
    EXPECT_EQ(tl.track_count(), 2u);

    EXPECT_TRUE(tl.remove_track(&first));
    EXPECT_FALSE(tl.remove_track(&first));
    EXPECT_EQ(tl.track_count(), 1u);

    EXPECT_THROW(tl.add_track(std::unique_ptr<AnimationTrack>()), std::invalid_argument);

    tl.clear_tracks();
    EXPECT_EQ(tl.track_count(), 0u);
}
