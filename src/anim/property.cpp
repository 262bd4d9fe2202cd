#include <stdexcept>
#include <string>
#include <vecanim/property.hpp>

namespace vecanim
{

namespace detail
{

using KindMask = unsigned;

constexpr KindMask kind_bit(NodeKind kind)
{
    return 1u << static_cast<unsigned>(kind);
}

constexpr KindMask ALL_KINDS = kind_bit(NodeKind::Artboard) | kind_bit(NodeKind::Group)
                               | kind_bit(NodeKind::Shape) | kind_bit(NodeKind::Image);

struct PropertyAccessor
{
    PropertyKey key;
    const char* path;
    ValueType   type;
    KindMask    kinds;
    AnimValue (*get)(const SceneGraph&, NodeId);
    void (*set)(SceneGraph&, NodeId, const AnimValue&);
};

}  // namespace detail

namespace
{

using detail::ALL_KINDS;
using detail::kind_bit;
using detail::PropertyAccessor;

// Setters receive a value whose alternative was checked against the entry.
const PropertyAccessor ACCESSORS[] = {
    {PropertyKey::Position,
     "transform.position",
     ValueType::Vec2,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).position; },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_position(n, std::get<Vec2>(v)); }},
    {PropertyKey::PositionX,
     "transform.position.x",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).position.x; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     {
         Vec2 p = s.transform(n).position;
         p.x    = std::get<float>(v);
         s.set_position(n, p);
     }},
    {PropertyKey::PositionY,
     "transform.position.y",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).position.y; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     {
         Vec2 p = s.transform(n).position;
         p.y    = std::get<float>(v);
         s.set_position(n, p);
     }},
    {PropertyKey::Rotation,
     "transform.rotation",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).rotation; },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_rotation(n, std::get<float>(v)); }},
    {PropertyKey::Scale,
     "transform.scale",
     ValueType::Vec2,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).scale; },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_scale(n, std::get<Vec2>(v)); }},
    {PropertyKey::ScaleX,
     "transform.scale.x",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).scale.x; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     {
         Vec2 sc = s.transform(n).scale;
         sc.x    = std::get<float>(v);
         s.set_scale(n, sc);
     }},
    {PropertyKey::ScaleY,
     "transform.scale.y",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).scale.y; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     {
         Vec2 sc = s.transform(n).scale;
         sc.y    = std::get<float>(v);
         s.set_scale(n, sc);
     }},
    {PropertyKey::Pivot,
     "transform.pivot",
     ValueType::Vec2,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).pivot; },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_pivot(n, std::get<Vec2>(v)); }},
    {PropertyKey::PivotX,
     "transform.pivot.x",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).pivot.x; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     {
         Vec2 p = s.transform(n).pivot;
         p.x    = std::get<float>(v);
         s.set_pivot(n, p);
     }},
    {PropertyKey::PivotY,
     "transform.pivot.y",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.transform(n).pivot.y; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     {
         Vec2 p = s.transform(n).pivot;
         p.y    = std::get<float>(v);
         s.set_pivot(n, p);
     }},
    {PropertyKey::Opacity,
     "opacity",
     ValueType::Float,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.opacity(n); },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_opacity(n, std::get<float>(v)); }},
    {PropertyKey::Visible,
     "visible",
     ValueType::Bool,
     ALL_KINDS,
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.visible(n); },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_visible(n, std::get<bool>(v)); }},
    {PropertyKey::Width,
     "width",
     ValueType::Float,
     kind_bit(NodeKind::Artboard),
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.artboard(n).width; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     { s.set_artboard_width(n, std::get<float>(v)); }},
    {PropertyKey::Height,
     "height",
     ValueType::Float,
     kind_bit(NodeKind::Artboard),
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.artboard(n).height; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     { s.set_artboard_height(n, std::get<float>(v)); }},
    {PropertyKey::BackgroundColor,
     "backgroundColor",
     ValueType::Color,
     kind_bit(NodeKind::Artboard),
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.artboard(n).background_color; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     { s.set_background_color(n, std::get<Color>(v)); }},
    {PropertyKey::StrokeWidth,
     "strokeWidth",
     ValueType::Float,
     kind_bit(NodeKind::Shape),
     [](const SceneGraph& s, NodeId n) -> AnimValue { return s.shape(n).stroke_width; },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     { s.set_stroke_width(n, std::get<float>(v)); }},
    {PropertyKey::FillColor,
     "fill.color",
     ValueType::Color,
     kind_bit(NodeKind::Shape),
     [](const SceneGraph& s, NodeId n) -> AnimValue
     {
         const auto& fill = s.shape(n).fill;
         return fill ? fill->color() : colors::transparent;
     },
     [](SceneGraph& s, NodeId n, const AnimValue& v) { s.set_fill_color(n, std::get<Color>(v)); }},
    {PropertyKey::StrokeColor,
     "stroke.color",
     ValueType::Color,
     kind_bit(NodeKind::Shape),
     [](const SceneGraph& s, NodeId n) -> AnimValue
     {
         const auto& stroke = s.shape(n).stroke;
         return stroke ? stroke->color() : colors::transparent;
     },
     [](SceneGraph& s, NodeId n, const AnimValue& v)
     { s.set_stroke_color(n, std::get<Color>(v)); }},
};

const PropertyAccessor* find_accessor(PropertyKey key)
{
    for (const auto& acc : ACCESSORS)
    {
        if (acc.key == key)
            return &acc;
    }
    return nullptr;
}

}  // anonymous namespace

const char* value_type_name(ValueType type)
{
    switch (type)
    {
        case ValueType::Float:
            return "float";
        case ValueType::Vec2:
            return "vec2";
        case ValueType::Color:
            return "color";
        case ValueType::Bool:
            return "bool";
    }
    return "unknown";
}

ValueType value_type_of(const AnimValue& value)
{
    return static_cast<ValueType>(value.index());
}

std::optional<PropertyKey> parse_property_path(std::string_view path)
{
    for (const auto& acc : ACCESSORS)
    {
        if (path == acc.path)
            return acc.key;
    }
    return std::nullopt;
}

const char* property_path(PropertyKey key)
{
    const auto* acc = find_accessor(key);
    return acc ? acc->path : "";
}

ValueType property_value_type(PropertyKey key)
{
    const auto* acc = find_accessor(key);
    return acc ? acc->type : ValueType::Float;
}

bool property_supported(NodeKind kind, PropertyKey key)
{
    const auto* acc = find_accessor(key);
    return acc && (acc->kinds & kind_bit(kind)) != 0;
}

// ─── PropertyBinding ─────────────────────────────────────────────────────────

PropertyBinding PropertyBinding::bind(SceneGraph& scene, NodeId node, std::string_view path)
{
    auto key = parse_property_path(path);
    if (!key)
        throw std::invalid_argument("Unknown property path \"" + std::string(path) + "\"");
    return bind(scene, node, *key);
}

PropertyBinding PropertyBinding::bind(SceneGraph& scene, NodeId node, PropertyKey key)
{
    NodeKind kind = scene.kind(node);
    if (!property_supported(kind, key))
    {
        throw std::invalid_argument(std::string("Property \"") + property_path(key)
                                    + "\" is not supported on " + node_kind_name(kind)
                                    + " nodes");
    }
    return PropertyBinding(&scene, node, key, find_accessor(key));
}

ValueType PropertyBinding::value_type() const
{
    return accessor_->type;
}

AnimValue PropertyBinding::get() const
{
    return accessor_->get(*scene_, node_);
}

void PropertyBinding::set(const AnimValue& value) const
{
    if (value_type_of(value) != accessor_->type)
    {
        throw std::invalid_argument(std::string("Property \"") + accessor_->path + "\" expects "
                                    + value_type_name(accessor_->type) + ", got "
                                    + value_type_name(value_type_of(value)));
    }
    accessor_->set(*scene_, node_, value);
}

}  // namespace vecanim
