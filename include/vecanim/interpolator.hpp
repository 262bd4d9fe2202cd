#pragma once

#include <functional>
#include <map>
#include <vecanim/easing.hpp>
#include <vecanim/property.hpp>

namespace vecanim
{

// Blends two values of the same alternative at progress t.
using InterpolateFunc = std::function<AnimValue(const AnimValue& from, const AnimValue& to, float t)>;

// Per-value-type interpolators for procedural blending outside of tracks.
// Each registry is an independent instance; a new one starts with float, Vec2
// and Color interpolators installed.
class InterpolatorRegistry
{
   public:
    InterpolatorRegistry();

    // Replaces any interpolator already registered for `type`.
    void register_interpolator(ValueType type, InterpolateFunc func);
    bool has(ValueType type) const;
    bool unregister(ValueType type);
    void clear() { interpolators_.clear(); }
    void reset_defaults();

    // Easing is applied to t first. Throws std::invalid_argument when the two
    // values differ in type or no interpolator handles the type.
    AnimValue interpolate(const AnimValue&  from,
                          const AnimValue&  to,
                          float             t,
                          const EasingFunc& easing = {}) const;

    static float lerp(float from, float to, float t) { return from + (to - from) * t; }
    static Vec2  lerp(Vec2 from, Vec2 to, float t) { return vec2_lerp(from, to, t); }
    static Color lerp(const Color& from, const Color& to, float t)
    {
        return color_lerp(from, to, t);
    }

   private:
    std::map<ValueType, InterpolateFunc> interpolators_;
};

}  // namespace vecanim
