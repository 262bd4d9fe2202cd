#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <vecanim/color.hpp>
#include <vecanim/math2d.hpp>
#include <vecanim/paint.hpp>
#include <vecanim/path.hpp>

namespace vecanim
{

using NodeId                           = uint32_t;
inline constexpr NodeId INVALID_NODE_ID = static_cast<NodeId>(-1);

enum class NodeKind
{
    Artboard = 0,
    Group,
    Shape,
    Image,
};

const char* node_kind_name(NodeKind kind);

// Already-resolved image handle. Decoding and fetching happen elsewhere.
struct ImageAsset
{
    std::string id;
    float       width  = 0.0f;
    float       height = 0.0f;
};

struct ArtboardData
{
    float width            = 0.0f;
    float height           = 0.0f;
    Color background_color = colors::white;
};

struct GroupData
{
};

struct ShapeData
{
    Path                 path;
    std::optional<Paint> fill;
    std::optional<Paint> stroke;
    float                stroke_width = 1.0f;
};

struct ImageData
{
    ImageAsset          image;
    std::optional<Rect> source_rect;
};

// Alternative order matches NodeKind.
using NodePayload = std::variant<ArtboardData, GroupData, ShapeData, ImageData>;

// Arena of scene nodes addressed by NodeId. A node owns its ordered child list;
// the parent link is a plain back-reference. Destroyed slots are never reused,
// and any accessor given an unknown or destroyed id throws std::out_of_range.
//
// Each node caches its world transform and world bounds. Transform, visibility
// and opacity changes invalidate the world transform of the node's subtree;
// bounds invalidation walks from the node up to the root. The dirty flag is
// separate: setting it propagates to the root, and only clear_dirty() resets it.
class SceneGraph
{
   public:
    SceneGraph() = default;

    SceneGraph(const SceneGraph&)            = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;
    SceneGraph(SceneGraph&&)                 = default;
    SceneGraph& operator=(SceneGraph&&)      = default;

    // ─── Creation / destruction ─────────────────────────────────────────

    NodeId create_artboard(float              width,
                           float              height,
                           const Color&       background = colors::white,
                           std::string        name       = {});
    NodeId create_group(std::string name = {});
    NodeId create_shape(Path path = {}, std::string name = {});
    NodeId create_image(ImageAsset image, std::string name = {});

    // Detaches the node and destroys it together with its whole subtree.
    void destroy(NodeId id);

    bool   contains(NodeId id) const;
    size_t size() const { return live_count_; }

    NodeKind           kind(NodeId id) const;
    const std::string& name(NodeId id) const;
    void               set_name(NodeId id, std::string name);
    NodeId             find_by_name(std::string_view name) const;

    // ─── Hierarchy ──────────────────────────────────────────────────────

    // Throws std::invalid_argument on self-attach or when child is an ancestor
    // of parent. Re-adding an existing child is a no-op.
    void add_child(NodeId parent, NodeId child);
    bool remove_child(NodeId parent, NodeId child);
    void remove_from_parent(NodeId id);
    void remove_all_children(NodeId id);

    NodeId                     parent(NodeId id) const;
    const std::vector<NodeId>& children(NodeId id) const;
    bool                       is_descendant_of(NodeId id, NodeId ancestor) const;
    int                        depth(NodeId id) const;
    NodeId                     root_of(NodeId id) const;

    // ─── Common properties ──────────────────────────────────────────────

    const Transform& transform(NodeId id) const;
    void             set_transform(NodeId id, const Transform& t);
    void             set_position(NodeId id, Vec2 position);
    void             set_rotation(NodeId id, float radians);
    void             set_scale(NodeId id, Vec2 scale);
    void             set_pivot(NodeId id, Vec2 pivot);

    bool  visible(NodeId id) const;
    void  set_visible(NodeId id, bool visible);
    float opacity(NodeId id) const;
    void  set_opacity(NodeId id, float opacity);

    // ─── Kind-specific payloads ─────────────────────────────────────────
    // Getters throw std::invalid_argument when the node is of another kind.

    const ArtboardData& artboard(NodeId id) const;
    void                set_artboard_size(NodeId id, float width, float height);
    void                set_artboard_width(NodeId id, float width);
    void                set_artboard_height(NodeId id, float height);
    void                set_background_color(NodeId id, const Color& color);

    const ShapeData& shape(NodeId id) const;
    void             set_path(NodeId id, Path path);
    void             set_fill(NodeId id, std::optional<Paint> fill);
    void             set_stroke(NodeId id, std::optional<Paint> stroke);
    void             set_stroke_width(NodeId id, float width);
    // Replace the paint color, creating a solid paint when none is set.
    void set_fill_color(NodeId id, const Color& color);
    void set_stroke_color(NodeId id, const Color& color);

    const ImageData& image(NodeId id) const;
    void             set_image(NodeId id, ImageAsset image);
    void             set_source_rect(NodeId id, std::optional<Rect> rect);

    // ─── Derived state ──────────────────────────────────────────────────

    Mat2D local_matrix(NodeId id) const;
    Mat2D world_transform(NodeId id) const;
    bool  world_visible(NodeId id) const;
    float world_opacity(NodeId id) const;

    std::optional<Rect> local_bounds(NodeId id) const;
    std::optional<Rect> world_bounds(NodeId id) const;

    // ─── Dirty tracking ─────────────────────────────────────────────────

    bool is_dirty(NodeId id) const;
    void mark_dirty(NodeId id);
    void clear_dirty(NodeId id);

    // Depth-first; appends the world bounds of every dirty node under root,
    // skipping clean subtrees. The stack overload reuses caller storage.
    void collect_dirty_regions(NodeId root, std::vector<Rect>& out) const;
    void collect_dirty_regions(NodeId               root,
                               std::vector<Rect>&   out,
                               std::vector<NodeId>& stack) const;

    // ─── Hit testing ────────────────────────────────────────────────────

    bool   hit_test(NodeId id, Vec2 world_point) const;
    NodeId hit_test_recursive(NodeId root, Vec2 world_point) const;

   private:
    struct Node
    {
        bool                alive = true;
        std::string         name;
        NodePayload         payload;
        Transform           transform;
        bool                visible = true;
        float               opacity = 1.0f;
        NodeId              parent  = INVALID_NODE_ID;
        std::vector<NodeId> children;

        // Cached derived state
        mutable Mat2D               world;
        mutable bool                world_dirty = true;
        mutable std::optional<Rect> bounds;
        mutable bool                bounds_dirty = true;
        bool                        dirty        = true;
    };

    NodeId      create(NodePayload payload, std::string name);
    Node&       node(NodeId id);
    const Node& node(NodeId id) const;

    ArtboardData& artboard_payload(NodeId id);
    ShapeData&    shape_payload(NodeId id);
    ImageData&    image_payload(NodeId id);

    void invalidate_world(NodeId id);
    void invalidate_bounds(NodeId id);
    void transform_changed(NodeId id);
    void bounds_changed(NodeId id);

    std::vector<Node> nodes_;
    size_t            live_count_ = 0;
};

}  // namespace vecanim
