#pragma once

#include <functional>

namespace vecanim
{

// Maps normalized progress t in [0, 1] to eased progress. Every function here
// returns 0 at t = 0 and 1 at t = 1.
using EasingFunc = std::function<float(float)>;

namespace ease
{
float linear(float t);

// Polynomial presets tuned for keyframe tweening
float quadratic(float t);
float cubic(float t);

float in_quad(float t);
float out_quad(float t);
float in_out_quad(float t);
float in_cubic(float t);
float out_cubic(float t);
float in_out_cubic(float t);
float in_quart(float t);
float out_quart(float t);
float in_out_quart(float t);
float in_quint(float t);
float out_quint(float t);
float in_out_quint(float t);
float in_sine(float t);
float out_sine(float t);
float in_out_sine(float t);
float in_expo(float t);
float out_expo(float t);
float in_out_expo(float t);
float in_circ(float t);
float out_circ(float t);
float in_out_circ(float t);

// Quadratic aliases
inline float ease_in(float t)
{
    return in_quad(t);
}
inline float ease_out(float t)
{
    return out_quad(t);
}
inline float ease_in_out(float t)
{
    return in_out_quad(t);
}

float bounce(float t);
float elastic(float t);
float spring(float t);
float decelerate(float t);

// Cubic-bezier easing factory (returns a stateless function object)
struct CubicBezier
{
    float x1, y1, x2, y2;
    float operator()(float t) const;
};

// CSS presets
inline constexpr CubicBezier css_ease{0.25f, 0.1f, 0.25f, 1.0f};
inline constexpr CubicBezier css_ease_in{0.42f, 0.0f, 1.0f, 1.0f};
inline constexpr CubicBezier css_ease_out{0.0f, 0.0f, 0.58f, 1.0f};
inline constexpr CubicBezier css_ease_in_out{0.42f, 0.0f, 0.58f, 1.0f};
}  // namespace ease

}  // namespace vecanim
