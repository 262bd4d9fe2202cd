#include <algorithm>
#include <stdexcept>
#include <vecanim/paint.hpp>

namespace vecanim
{

namespace
{

std::vector<GradientStop> normalized_stops(std::vector<GradientStop> stops)
{
    if (stops.size() < 2)
        throw std::invalid_argument("Gradient must have at least 2 color stops");

    std::stable_sort(stops.begin(),
                     stops.end(),
                     [](const GradientStop& a, const GradientStop& b)
                     { return a.offset < b.offset; });
    for (auto& stop : stops)
        stop.offset = std::clamp(stop.offset, 0.0f, 1.0f);
    return stops;
}

}  // anonymous namespace

const char* blend_mode_name(BlendMode mode)
{
    switch (mode)
    {
        case BlendMode::Normal:
            return "normal";
        case BlendMode::Multiply:
            return "multiply";
        case BlendMode::Screen:
            return "screen";
        case BlendMode::Overlay:
            return "overlay";
        case BlendMode::Darken:
            return "darken";
        case BlendMode::Lighten:
            return "lighten";
        case BlendMode::ColorDodge:
            return "color-dodge";
        case BlendMode::ColorBurn:
            return "color-burn";
        case BlendMode::HardLight:
            return "hard-light";
        case BlendMode::SoftLight:
            return "soft-light";
        case BlendMode::Difference:
            return "difference";
        case BlendMode::Exclusion:
            return "exclusion";
    }
    return "unknown";
}

Paint Paint::solid(const Color& color, BlendMode mode)
{
    Paint p;
    p.type_       = PaintType::Solid;
    p.color_      = color;
    p.blend_mode_ = mode;
    return p;
}

Paint Paint::linear_gradient(Vec2 start, Vec2 end, std::vector<GradientStop> stops, BlendMode mode)
{
    Paint p;
    p.type_       = PaintType::LinearGradient;
    p.stops_      = normalized_stops(std::move(stops));
    p.start_      = start;
    p.end_        = end;
    p.blend_mode_ = mode;
    p.color_      = p.stops_.front().color;
    return p;
}

Paint Paint::radial_gradient(Vec2                      center,
                             float                     radius,
                             std::vector<GradientStop> stops,
                             std::optional<Vec2>       focal,
                             BlendMode                 mode)
{
    Paint p;
    p.type_       = PaintType::RadialGradient;
    p.stops_      = normalized_stops(std::move(stops));
    p.start_      = center;
    p.radius_     = std::max(0.0f, radius);
    p.focal_      = focal;
    p.blend_mode_ = mode;
    p.color_      = p.stops_.front().color;
    return p;
}

Color Paint::color_at(float t) const
{
    if (type_ == PaintType::Solid || stops_.empty())
        return color_;

    t = std::clamp(t, 0.0f, 1.0f);
    if (t <= stops_.front().offset)
        return stops_.front().color;
    if (t >= stops_.back().offset)
        return stops_.back().color;

    for (size_t i = 0; i + 1 < stops_.size(); ++i)
    {
        const auto& a = stops_[i];
        const auto& b = stops_[i + 1];
        if (t >= a.offset && t <= b.offset)
        {
            float span = b.offset - a.offset;
            float u    = span > 0.0f ? (t - a.offset) / span : 0.0f;
            return color_lerp(a.color, b.color, u);
        }
    }
    return stops_.back().color;
}

}  // namespace vecanim
