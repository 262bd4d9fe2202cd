#pragma once

#include <optional>
#include <string_view>
#include <vector>
#include <vecanim/color.hpp>
#include <vecanim/math2d.hpp>

namespace vecanim
{

enum class BlendMode
{
    Normal,
    Multiply,
    Screen,
    Overlay,
    Darken,
    Lighten,
    ColorDodge,
    ColorBurn,
    HardLight,
    SoftLight,
    Difference,
    Exclusion,
};

const char* blend_mode_name(BlendMode mode);

struct GradientStop
{
    float offset = 0.0f;  // [0, 1]
    Color color;
};

enum class PaintType
{
    Solid,
    LinearGradient,
    RadialGradient,
};

// Fill or stroke source. Gradients always hold at least two stops, sorted by
// offset with offsets clamped to [0, 1].
class Paint
{
   public:
    Paint() = default;

    static Paint solid(const Color& color, BlendMode mode = BlendMode::Normal);

    // Throws std::invalid_argument with fewer than two stops.
    static Paint linear_gradient(Vec2                      start,
                                 Vec2                      end,
                                 std::vector<GradientStop> stops,
                                 BlendMode                 mode = BlendMode::Normal);
    static Paint radial_gradient(Vec2                      center,
                                 float                     radius,
                                 std::vector<GradientStop> stops,
                                 std::optional<Vec2>       focal = std::nullopt,
                                 BlendMode                 mode  = BlendMode::Normal);

    PaintType type() const { return type_; }
    bool      is_gradient() const { return type_ != PaintType::Solid; }

    const Color& color() const { return color_; }
    void         set_color(const Color& c) { color_ = c; }

    BlendMode blend_mode() const { return blend_mode_; }
    void      set_blend_mode(BlendMode mode) { blend_mode_ = mode; }

    const std::vector<GradientStop>& stops() const { return stops_; }
    Vec2                             start() const { return start_; }
    Vec2                             end() const { return end_; }
    Vec2                             center() const { return start_; }
    float                            radius() const { return radius_; }
    std::optional<Vec2>              focal() const { return focal_; }

    // Gradient color at offset t in [0, 1]; the solid color for solid paints.
    Color color_at(float t) const;

   private:
    PaintType                 type_       = PaintType::Solid;
    Color                     color_      = colors::black;
    BlendMode                 blend_mode_ = BlendMode::Normal;
    std::vector<GradientStop> stops_;
    Vec2                      start_;
    Vec2                      end_;
    float                     radius_ = 0.0f;
    std::optional<Vec2>       focal_;
};

}  // namespace vecanim
