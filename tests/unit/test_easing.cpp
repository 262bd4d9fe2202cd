#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <vecanim/easing.hpp>

using namespace vecanim;

// All easing functions must satisfy: f(0) == 0, f(1) == 1

namespace
{

struct NamedEasing
{
    const char* name;
    float (*fn)(float);
};

const NamedEasing ALL_EASINGS[] = {
    {"linear", ease::linear},
    {"quadratic", ease::quadratic},
    {"cubic", ease::cubic},
    {"in_quad", ease::in_quad},
    {"out_quad", ease::out_quad},
    {"in_out_quad", ease::in_out_quad},
    {"in_cubic", ease::in_cubic},
    {"out_cubic", ease::out_cubic},
    {"in_out_cubic", ease::in_out_cubic},
    {"in_quart", ease::in_quart},
    {"out_quart", ease::out_quart},
    {"in_out_quart", ease::in_out_quart},
    {"in_quint", ease::in_quint},
    {"out_quint", ease::out_quint},
    {"in_out_quint", ease::in_out_quint},
    {"in_sine", ease::in_sine},
    {"out_sine", ease::out_sine},
    {"in_out_sine", ease::in_out_sine},
    {"in_expo", ease::in_expo},
    {"out_expo", ease::out_expo},
    {"in_out_expo", ease::in_out_expo},
    {"in_circ", ease::in_circ},
    {"out_circ", ease::out_circ},
    {"in_out_circ", ease::in_out_circ},
    {"bounce", ease::bounce},
    {"elastic", ease::elastic},
    {"spring", ease::spring},
    {"decelerate", ease::decelerate},
};

}  // namespace

TEST(Easing, AllEndpoints)
{
    for (const auto& e : ALL_EASINGS)
    {
        EXPECT_NEAR(e.fn(0.0f), 0.0f, 1e-5f) << e.name;
        EXPECT_NEAR(e.fn(1.0f), 1.0f, 1e-5f) << e.name;
    }
}

TEST(Easing, LinearMidpoint)
{
    EXPECT_FLOAT_EQ(ease::linear(0.5f), 0.5f);
}

TEST(Easing, QuadAliases)
{
    EXPECT_FLOAT_EQ(ease::ease_in(0.5f), 0.25f);
    EXPECT_FLOAT_EQ(ease::ease_out(0.5f), 0.75f);
    EXPECT_FLOAT_EQ(ease::ease_in_out(0.5f), 0.5f);
}

TEST(Easing, InOutSymmetry)
{
    // in_out curves satisfy f(t) + f(1-t) == 1
    for (float t = 0.0f; t <= 1.0f; t += 0.1f)
    {
        EXPECT_NEAR(ease::in_out_quad(t) + ease::in_out_quad(1.0f - t), 1.0f, 1e-5f);
        EXPECT_NEAR(ease::in_out_cubic(t) + ease::in_out_cubic(1.0f - t), 1.0f, 1e-5f);
        EXPECT_NEAR(ease::in_out_sine(t) + ease::in_out_sine(1.0f - t), 1.0f, 1e-5f);
    }
}

TEST(Easing, InStartsSlowOutStartsFast)
{
    EXPECT_LT(ease::in_cubic(0.3f), 0.3f);
    EXPECT_GT(ease::out_cubic(0.3f), 0.3f);
    EXPECT_LT(ease::in_expo(0.3f), 0.3f);
    EXPECT_GT(ease::out_circ(0.3f), 0.3f);
}

TEST(Easing, ElasticAndSpringOvershoot)
{
    float max_elastic = 0.0f;
    float max_spring  = 0.0f;
    for (float t = 0.0f; t <= 1.0f; t += 0.01f)
    {
        max_elastic = std::max(max_elastic, ease::elastic(t));
        max_spring  = std::max(max_spring, ease::spring(t));
    }
    EXPECT_GT(max_elastic, 1.0f);
    EXPECT_GT(max_spring, 1.0f);
}

TEST(Easing, BounceStaysInRange)
{
    for (float t = 0.0f; t <= 1.0f; t += 0.01f)
    {
        float v = ease::bounce(t);
        EXPECT_GE(v, 0.0f);
        EXPECT_LE(v, 1.0f + 1e-5f);
    }
}

// ─── Cubic bezier ────────────────────────────────────────────────────────────

TEST(CubicBezier, Endpoints)
{
    EXPECT_FLOAT_EQ(ease::css_ease(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(ease::css_ease(1.0f), 1.0f);
    EXPECT_FLOAT_EQ(ease::css_ease_in_out(-0.5f), 0.0f);
    EXPECT_FLOAT_EQ(ease::css_ease_in_out(1.5f), 1.0f);
}

TEST(CubicBezier, LinearControlPointsAreIdentity)
{
    ease::CubicBezier lin{1.0f / 3.0f, 1.0f / 3.0f, 2.0f / 3.0f, 2.0f / 3.0f};
    for (float t = 0.1f; t < 1.0f; t += 0.1f)
        EXPECT_NEAR(lin(t), t, 1e-3f);
}

TEST(CubicBezier, EaseInOutSymmetricMidpoint)
{
    EXPECT_NEAR(ease::css_ease_in_out(0.5f), 0.5f, 1e-3f);
    EXPECT_LT(ease::css_ease_in(0.25f), 0.25f);
    EXPECT_GT(ease::css_ease_out(0.25f), 0.25f);
}

TEST(CubicBezier, UsableAsEasingFunc)
{
    EasingFunc fn = ease::css_ease;
    EXPECT_FLOAT_EQ(fn(1.0f), 1.0f);
}
