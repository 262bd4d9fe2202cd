#include <algorithm>
#include <cmath>
#include <vecanim/easing.hpp>

namespace vecanim::ease
{

namespace
{
constexpr float PI = 3.14159265358979323846f;
}  // anonymous namespace

float linear(float t)
{
    return t;
}

float quadratic(float t)
{
    return t * (-(t * t) * t + 4.0f * t * t - 6.0f * t + 4.0f);
}

float cubic(float t)
{
    return t * (4.0f * t * t - 9.0f * t + 6.0f);
}

float in_quad(float t)
{
    return t * t;
}

float out_quad(float t)
{
    return t * (2.0f - t);
}

float in_out_quad(float t)
{
    return t < 0.5f ? 2.0f * t * t : -1.0f + (4.0f - 2.0f * t) * t;
}

float in_cubic(float t)
{
    return t * t * t;
}

float out_cubic(float t)
{
    float u = t - 1.0f;
    return u * u * u + 1.0f;
}

float in_out_cubic(float t)
{
    if (t < 0.5f)
        return 4.0f * t * t * t;
    float u = 2.0f * t - 2.0f;
    return (t - 1.0f) * u * u + 1.0f;
}

float in_quart(float t)
{
    return t * t * t * t;
}

float out_quart(float t)
{
    float u = t - 1.0f;
    return 1.0f - u * u * u * u;
}

float in_out_quart(float t)
{
    if (t < 0.5f)
        return 8.0f * t * t * t * t;
    float u = t - 1.0f;
    return 1.0f - 8.0f * u * u * u * u;
}

float in_quint(float t)
{
    return t * t * t * t * t;
}

float out_quint(float t)
{
    float u = t - 1.0f;
    return 1.0f + u * u * u * u * u;
}

float in_out_quint(float t)
{
    if (t < 0.5f)
        return 16.0f * t * t * t * t * t;
    float u = t - 1.0f;
    return 1.0f + 16.0f * u * u * u * u * u;
}

float in_sine(float t)
{
    return 1.0f - std::cos(t * (PI / 2.0f));
}

float out_sine(float t)
{
    return std::sin(t * (PI / 2.0f));
}

float in_out_sine(float t)
{
    return -(std::cos(PI * t) - 1.0f) / 2.0f;
}

// The exponential curves never quite reach their end points, so pin them.
float in_expo(float t)
{
    if (t <= 0.0f)
        return 0.0f;
    return std::pow(2.0f, 10.0f * (t - 1.0f));
}

float out_expo(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    return 1.0f - std::pow(2.0f, -10.0f * t);
}

float in_out_expo(float t)
{
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;
    float u = t * 2.0f;
    if (u < 1.0f)
        return std::pow(2.0f, 10.0f * (u - 1.0f)) / 2.0f;
    return (2.0f - std::pow(2.0f, -10.0f * (u - 1.0f))) / 2.0f;
}

float in_circ(float t)
{
    return 1.0f - std::sqrt(std::max(0.0f, 1.0f - t * t));
}

float out_circ(float t)
{
    float u = t - 1.0f;
    return std::sqrt(std::max(0.0f, 1.0f - u * u));
}

float in_out_circ(float t)
{
    float u = t * 2.0f;
    if (u < 1.0f)
        return -(std::sqrt(std::max(0.0f, 1.0f - u * u)) - 1.0f) / 2.0f;
    u -= 2.0f;
    return (std::sqrt(std::max(0.0f, 1.0f - u * u)) + 1.0f) / 2.0f;
}

float bounce(float t)
{
    // Bounce ease-out
    constexpr float n1 = 7.5625f;
    constexpr float d1 = 2.75f;

    if (t < 1.0f / d1)
    {
        return n1 * t * t;
    }
    else if (t < 2.0f / d1)
    {
        t -= 1.5f / d1;
        return n1 * t * t + 0.75f;
    }
    else if (t < 2.5f / d1)
    {
        t -= 2.25f / d1;
        return n1 * t * t + 0.9375f;
    }
    else
    {
        t -= 2.625f / d1;
        return n1 * t * t + 0.984375f;
    }
}

float elastic(float t)
{
    // Elastic ease-out
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    constexpr float c4 = (2.0f * PI) / 3.0f;
    return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * c4) + 1.0f;
}

float spring(float t)
{
    // Damped spring: overshoots slightly then settles
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    constexpr float damping = 6.0f;
    constexpr float freq    = 4.5f;
    return 1.0f - std::exp(-damping * t) * std::cos(freq * PI * t);
}

float decelerate(float t)
{
    return 1.0f - (1.0f - t) * (1.0f - t);
}

float CubicBezier::operator()(float t) const
{
    // Newton-Raphson on x(u) = t, then evaluate y(u)
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    float u = t;
    for (int i = 0; i < 8; ++i)
    {
        float u2   = u * u;
        float inv  = 1.0f - u;
        float inv2 = inv * inv;

        float bx = 3.0f * inv2 * u * x1 + 3.0f * inv * u2 * x2 + u2 * u;
        float err = bx - t;
        if (std::abs(err) < 1e-4f)
            break;

        float dx = 3.0f * inv2 * x1 + 6.0f * inv * u * (x2 - x1) + 3.0f * u2 * (1.0f - x2);
        if (std::abs(dx) < 1e-7f)
            break;
        u -= err / dx;
        u = std::clamp(u, 0.0f, 1.0f);
    }

    float inv  = 1.0f - u;
    float inv2 = inv * inv;
    float u2   = u * u;
    return 3.0f * inv2 * u * y1 + 3.0f * inv * u2 * y2 + u2 * u;
}

}  // namespace vecanim::ease
