#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <vecanim/color.hpp>
#include <vecanim/math2d.hpp>
#include <vecanim/scene.hpp>

namespace vecanim
{

namespace detail
{
struct PropertyAccessor;
}  // namespace detail

// Animatable value. Only float blends continuously; the others step at t = 0.5.
using AnimValue = std::variant<float, Vec2, Color, bool>;

enum class ValueType
{
    Float = 0,
    Vec2,
    Color,
    Bool,
};

const char* value_type_name(ValueType type);
ValueType   value_type_of(const AnimValue& value);

// Node properties that tracks can drive. Parsed once from a dotted path.
enum class PropertyKey
{
    Position,
    PositionX,
    PositionY,
    Rotation,
    Scale,
    ScaleX,
    ScaleY,
    Pivot,
    PivotX,
    PivotY,
    Opacity,
    Visible,
    Width,
    Height,
    BackgroundColor,
    StrokeWidth,
    FillColor,
    StrokeColor,
};

std::optional<PropertyKey> parse_property_path(std::string_view path);
const char*                property_path(PropertyKey key);
ValueType                  property_value_type(PropertyKey key);
bool                       property_supported(NodeKind kind, PropertyKey key);

// Typed accessor for one property on one node. bind() resolves the path and
// checks it against the node kind up front, so evaluation never fails lookup.
class PropertyBinding
{
   public:
    // Throws std::invalid_argument for an unknown path or a property the
    // node's kind does not have, std::out_of_range for an unknown node.
    static PropertyBinding bind(SceneGraph& scene, NodeId node, std::string_view path);
    static PropertyBinding bind(SceneGraph& scene, NodeId node, PropertyKey key);

    AnimValue get() const;
    // Throws std::invalid_argument when the value type does not match.
    void set(const AnimValue& value) const;

    SceneGraph* scene() const { return scene_; }
    NodeId      node() const { return node_; }
    PropertyKey key() const { return key_; }
    ValueType   value_type() const;
    const char* path() const { return property_path(key_); }

   private:
    using Accessor = detail::PropertyAccessor;

    PropertyBinding(SceneGraph* scene, NodeId node, PropertyKey key, const Accessor* accessor)
        : scene_(scene), node_(node), key_(key), accessor_(accessor)
    {
    }

    SceneGraph*     scene_    = nullptr;
    NodeId          node_     = INVALID_NODE_ID;
    PropertyKey     key_      = PropertyKey::Opacity;
    const Accessor* accessor_ = nullptr;
};

}  // namespace vecanim
