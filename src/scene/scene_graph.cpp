#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vecanim/scene.hpp>

namespace vecanim
{

const char* node_kind_name(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::Artboard:
            return "Artboard";
        case NodeKind::Group:
            return "Group";
        case NodeKind::Shape:
            return "Shape";
        case NodeKind::Image:
            return "Image";
    }
    return "Unknown";
}

// ─── Creation / destruction ──────────────────────────────────────────────────

NodeId SceneGraph::create(NodePayload payload, std::string name)
{
    NodeId id = static_cast<NodeId>(nodes_.size());
    if (id == INVALID_NODE_ID)
        throw std::length_error("SceneGraph: node arena exhausted");

    Node n;
    n.payload = std::move(payload);
    n.name    = std::move(name);
    nodes_.push_back(std::move(n));
    ++live_count_;
    return id;
}

NodeId SceneGraph::create_artboard(float width, float height, const Color& background, std::string name)
{
    ArtboardData data;
    data.width            = std::max(0.0f, width);
    data.height           = std::max(0.0f, height);
    data.background_color = background;
    return create(std::move(data), std::move(name));
}

NodeId SceneGraph::create_group(std::string name)
{
    return create(GroupData{}, std::move(name));
}

NodeId SceneGraph::create_shape(Path path, std::string name)
{
    ShapeData data;
    data.path = std::move(path);
    return create(std::move(data), std::move(name));
}

NodeId SceneGraph::create_image(ImageAsset image, std::string name)
{
    ImageData data;
    data.image = std::move(image);
    return create(std::move(data), std::move(name));
}

void SceneGraph::destroy(NodeId id)
{
    node(id);  // validate
    remove_from_parent(id);

    std::vector<NodeId> stack{id};
    while (!stack.empty())
    {
        NodeId cur = stack.back();
        stack.pop_back();
        Node& n = nodes_[cur];
        for (NodeId child : n.children)
            stack.push_back(child);
        n.children.clear();
        n.alive  = false;
        n.parent = INVALID_NODE_ID;
        n.payload = GroupData{};
        --live_count_;
    }
}

bool SceneGraph::contains(NodeId id) const
{
    return id < nodes_.size() && nodes_[id].alive;
}

SceneGraph::Node& SceneGraph::node(NodeId id)
{
    if (!contains(id))
        throw std::out_of_range("SceneGraph: unknown node id " + std::to_string(id));
    return nodes_[id];
}

const SceneGraph::Node& SceneGraph::node(NodeId id) const
{
    if (!contains(id))
        throw std::out_of_range("SceneGraph: unknown node id " + std::to_string(id));
    return nodes_[id];
}

NodeKind SceneGraph::kind(NodeId id) const
{
    return static_cast<NodeKind>(node(id).payload.index());
}

const std::string& SceneGraph::name(NodeId id) const
{
    return node(id).name;
}

void SceneGraph::set_name(NodeId id, std::string name)
{
    node(id).name = std::move(name);
}

NodeId SceneGraph::find_by_name(std::string_view name) const
{
    for (size_t i = 0; i < nodes_.size(); ++i)
    {
        if (nodes_[i].alive && nodes_[i].name == name)
            return static_cast<NodeId>(i);
    }
    return INVALID_NODE_ID;
}

// ─── Hierarchy ───────────────────────────────────────────────────────────────

void SceneGraph::add_child(NodeId parent, NodeId child)
{
    Node& p = node(parent);
    Node& c = node(child);

    if (parent == child)
        throw std::invalid_argument("Cannot add a node as a child of itself");
    if (is_descendant_of(parent, child))
        throw std::invalid_argument("Cannot add an ancestor as a child (circular dependency)");
    if (c.parent == parent)
        return;

    if (c.parent != INVALID_NODE_ID)
        remove_child(c.parent, child);

    c.parent = parent;
    p.children.push_back(child);

    invalidate_world(child);
    invalidate_bounds(parent);

    // A dirty child keeps its ancestors dirty; a clean one gets marked here.
    if (c.dirty)
        mark_dirty(parent);
    else
        mark_dirty(child);
}

bool SceneGraph::remove_child(NodeId parent, NodeId child)
{
    Node& p  = node(parent);
    Node& c  = node(child);
    auto  it = std::find(p.children.begin(), p.children.end(), child);
    if (it == p.children.end())
        return false;

    p.children.erase(it);
    c.parent = INVALID_NODE_ID;

    invalidate_world(child);
    invalidate_bounds(parent);
    mark_dirty(parent);
    return true;
}

void SceneGraph::remove_from_parent(NodeId id)
{
    NodeId p = node(id).parent;
    if (p != INVALID_NODE_ID)
        remove_child(p, id);
}

void SceneGraph::remove_all_children(NodeId id)
{
    // remove_child mutates the list, so walk a copy.
    std::vector<NodeId> kids = node(id).children;
    for (NodeId child : kids)
        remove_child(id, child);
}

NodeId SceneGraph::parent(NodeId id) const
{
    return node(id).parent;
}

const std::vector<NodeId>& SceneGraph::children(NodeId id) const
{
    return node(id).children;
}

bool SceneGraph::is_descendant_of(NodeId id, NodeId ancestor) const
{
    node(ancestor);
    NodeId cur = node(id).parent;
    while (cur != INVALID_NODE_ID)
    {
        if (cur == ancestor)
            return true;
        cur = nodes_[cur].parent;
    }
    return false;
}

int SceneGraph::depth(NodeId id) const
{
    int    d   = 0;
    NodeId cur = node(id).parent;
    while (cur != INVALID_NODE_ID)
    {
        ++d;
        cur = nodes_[cur].parent;
    }
    return d;
}

NodeId SceneGraph::root_of(NodeId id) const
{
    NodeId cur = id;
    NodeId p   = node(id).parent;
    while (p != INVALID_NODE_ID)
    {
        cur = p;
        p   = nodes_[p].parent;
    }
    return cur;
}

// ─── Invalidation ────────────────────────────────────────────────────────────

void SceneGraph::invalidate_world(NodeId id)
{
    std::vector<NodeId> stack{id};
    while (!stack.empty())
    {
        NodeId cur = stack.back();
        stack.pop_back();
        const Node& n = nodes_[cur];
        // A subtree whose root is already fully invalid is invalid below too.
        if (n.world_dirty && n.bounds_dirty && cur != id)
            continue;
        n.world_dirty  = true;
        n.bounds_dirty = true;
        for (NodeId child : n.children)
            stack.push_back(child);
    }
}

void SceneGraph::invalidate_bounds(NodeId id)
{
    // No early exit: an invisible child's bounds can stay dirty while its
    // parent's are clean.
    NodeId cur = id;
    while (cur != INVALID_NODE_ID)
    {
        nodes_[cur].bounds_dirty = true;
        cur                      = nodes_[cur].parent;
    }
}

void SceneGraph::transform_changed(NodeId id)
{
    invalidate_world(id);
    invalidate_bounds(id);
    mark_dirty(id);
}

void SceneGraph::bounds_changed(NodeId id)
{
    invalidate_bounds(id);
    mark_dirty(id);
}

// ─── Common properties ───────────────────────────────────────────────────────

const Transform& SceneGraph::transform(NodeId id) const
{
    return node(id).transform;
}

void SceneGraph::set_transform(NodeId id, const Transform& t)
{
    node(id).transform = t;
    transform_changed(id);
}

void SceneGraph::set_position(NodeId id, Vec2 position)
{
    node(id).transform.position = position;
    transform_changed(id);
}

void SceneGraph::set_rotation(NodeId id, float radians)
{
    node(id).transform.rotation = radians;
    transform_changed(id);
}

void SceneGraph::set_scale(NodeId id, Vec2 scale)
{
    node(id).transform.scale = scale;
    transform_changed(id);
}

void SceneGraph::set_pivot(NodeId id, Vec2 pivot)
{
    node(id).transform.pivot = pivot;
    transform_changed(id);
}

bool SceneGraph::visible(NodeId id) const
{
    return node(id).visible;
}

void SceneGraph::set_visible(NodeId id, bool visible)
{
    Node& n = node(id);
    if (n.visible == visible)
        return;
    n.visible = visible;
    transform_changed(id);
}

float SceneGraph::opacity(NodeId id) const
{
    return node(id).opacity;
}

void SceneGraph::set_opacity(NodeId id, float opacity)
{
    Node& n       = node(id);
    float clamped = std::clamp(opacity, 0.0f, 1.0f);
    if (n.opacity == clamped)
        return;
    n.opacity = clamped;
    transform_changed(id);
}

// ─── Kind-specific payloads ──────────────────────────────────────────────────

ArtboardData& SceneGraph::artboard_payload(NodeId id)
{
    auto* data = std::get_if<ArtboardData>(&node(id).payload);
    if (!data)
        throw std::invalid_argument("SceneGraph: node " + std::to_string(id) + " is not an Artboard");
    return *data;
}

ShapeData& SceneGraph::shape_payload(NodeId id)
{
    auto* data = std::get_if<ShapeData>(&node(id).payload);
    if (!data)
        throw std::invalid_argument("SceneGraph: node " + std::to_string(id) + " is not a Shape");
    return *data;
}

ImageData& SceneGraph::image_payload(NodeId id)
{
    auto* data = std::get_if<ImageData>(&node(id).payload);
    if (!data)
        throw std::invalid_argument("SceneGraph: node " + std::to_string(id) + " is not an Image");
    return *data;
}

const ArtboardData& SceneGraph::artboard(NodeId id) const
{
    return const_cast<SceneGraph*>(this)->artboard_payload(id);
}

void SceneGraph::set_artboard_size(NodeId id, float width, float height)
{
    auto& data  = artboard_payload(id);
    data.width  = std::max(0.0f, width);
    data.height = std::max(0.0f, height);
    bounds_changed(id);
}

void SceneGraph::set_artboard_width(NodeId id, float width)
{
    artboard_payload(id).width = std::max(0.0f, width);
    bounds_changed(id);
}

void SceneGraph::set_artboard_height(NodeId id, float height)
{
    artboard_payload(id).height = std::max(0.0f, height);
    bounds_changed(id);
}

void SceneGraph::set_background_color(NodeId id, const Color& color)
{
    artboard_payload(id).background_color = color;
    mark_dirty(id);
}

const ShapeData& SceneGraph::shape(NodeId id) const
{
    return const_cast<SceneGraph*>(this)->shape_payload(id);
}

void SceneGraph::set_path(NodeId id, Path path)
{
    shape_payload(id).path = std::move(path);
    bounds_changed(id);
}

void SceneGraph::set_fill(NodeId id, std::optional<Paint> fill)
{
    shape_payload(id).fill = std::move(fill);
    mark_dirty(id);
}

void SceneGraph::set_stroke(NodeId id, std::optional<Paint> stroke)
{
    shape_payload(id).stroke = std::move(stroke);
    bounds_changed(id);
}

void SceneGraph::set_stroke_width(NodeId id, float width)
{
    shape_payload(id).stroke_width = std::max(0.0f, width);
    bounds_changed(id);
}

void SceneGraph::set_fill_color(NodeId id, const Color& color)
{
    auto& data = shape_payload(id);
    if (data.fill)
        data.fill->set_color(color);
    else
        data.fill = Paint::solid(color);
    mark_dirty(id);
}

void SceneGraph::set_stroke_color(NodeId id, const Color& color)
{
    auto& data = shape_payload(id);
    if (data.stroke)
    {
        data.stroke->set_color(color);
        mark_dirty(id);
        return;
    }
    data.stroke = Paint::solid(color);
    bounds_changed(id);
}

const ImageData& SceneGraph::image(NodeId id) const
{
    return const_cast<SceneGraph*>(this)->image_payload(id);
}

void SceneGraph::set_image(NodeId id, ImageAsset image)
{
    image_payload(id).image = std::move(image);
    bounds_changed(id);
}

void SceneGraph::set_source_rect(NodeId id, std::optional<Rect> rect)
{
    image_payload(id).source_rect = rect;
    bounds_changed(id);
}

// ─── Derived state ───────────────────────────────────────────────────────────

Mat2D SceneGraph::local_matrix(NodeId id) const
{
    return node(id).transform.to_matrix();
}

Mat2D SceneGraph::world_transform(NodeId id) const
{
    const Node& n = node(id);
    if (!n.world_dirty)
        return n.world;

    Mat2D local = n.transform.to_matrix();
    n.world     = n.parent != INVALID_NODE_ID ? world_transform(n.parent) * local : local;
    n.world_dirty = false;
    return n.world;
}

bool SceneGraph::world_visible(NodeId id) const
{
    NodeId cur = id;
    while (cur != INVALID_NODE_ID)
    {
        const Node& n = node(cur);
        if (!n.visible)
            return false;
        cur = n.parent;
    }
    return true;
}

float SceneGraph::world_opacity(NodeId id) const
{
    float  result = 1.0f;
    NodeId cur    = id;
    while (cur != INVALID_NODE_ID)
    {
        const Node& n = node(cur);
        result *= n.opacity;
        cur = n.parent;
    }
    return result;
}

std::optional<Rect> SceneGraph::local_bounds(NodeId id) const
{
    const Node& n = node(id);
    return std::visit(
        [](const auto& data) -> std::optional<Rect>
        {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, ArtboardData>)
            {
                return Rect{0.0f, 0.0f, data.width, data.height};
            }
            else if constexpr (std::is_same_v<T, ShapeData>)
            {
                Rect r = data.path.bounds();
                if (data.stroke)
                    r = r.expanded(data.stroke_width * 0.5f);
                return r;
            }
            else if constexpr (std::is_same_v<T, ImageData>)
            {
                if (data.source_rect)
                    return Rect{0.0f, 0.0f, data.source_rect->w, data.source_rect->h};
                return Rect{0.0f, 0.0f, data.image.width, data.image.height};
            }
            else
            {
                return std::nullopt;
            }
        },
        n.payload);
}

std::optional<Rect> SceneGraph::world_bounds(NodeId id) const
{
    const Node& n = node(id);
    if (!n.bounds_dirty)
        return n.bounds;

    std::optional<Rect> result;
    if (auto local = local_bounds(id))
        result = local->transformed(world_transform(id));

    for (NodeId child : n.children)
    {
        if (!nodes_[child].visible)
            continue;
        auto child_bounds = world_bounds(child);
        if (!child_bounds)
            continue;
        result = result ? result->united(*child_bounds) : *child_bounds;
    }

    n.bounds       = result;
    n.bounds_dirty = false;
    return result;
}

// ─── Dirty tracking ──────────────────────────────────────────────────────────

bool SceneGraph::is_dirty(NodeId id) const
{
    return node(id).dirty;
}

void SceneGraph::mark_dirty(NodeId id)
{
    node(id);
    NodeId cur = id;
    while (cur != INVALID_NODE_ID)
    {
        Node& n = nodes_[cur];
        if (n.dirty)
            break;
        n.dirty = true;
        cur     = n.parent;
    }
}

void SceneGraph::clear_dirty(NodeId id)
{
    std::vector<NodeId> stack{id};
    node(id);
    while (!stack.empty())
    {
        NodeId cur = stack.back();
        stack.pop_back();
        Node& n = nodes_[cur];
        n.dirty = false;
        for (NodeId child : n.children)
            stack.push_back(child);
    }
}

void SceneGraph::collect_dirty_regions(NodeId root, std::vector<Rect>& out) const
{
    std::vector<NodeId> stack;
    collect_dirty_regions(root, out, stack);
}

void SceneGraph::collect_dirty_regions(NodeId               root,
                                       std::vector<Rect>&   out,
                                       std::vector<NodeId>& stack) const
{
    node(root);
    stack.clear();
    stack.push_back(root);
    while (!stack.empty())
    {
        NodeId cur = stack.back();
        stack.pop_back();
        const Node& n = nodes_[cur];
        if (!n.dirty)
            continue;

        if (auto bounds = world_bounds(cur))
            out.push_back(*bounds);

        // Reverse push keeps children in declaration order.
        for (auto it = n.children.rbegin(); it != n.children.rend(); ++it)
            stack.push_back(*it);
    }
}

// ─── Hit testing ─────────────────────────────────────────────────────────────

bool SceneGraph::hit_test(NodeId id, Vec2 world_point) const
{
    const Node& n = node(id);
    if (std::holds_alternative<GroupData>(n.payload))
        return false;

    Vec2 local = world_transform(id).inverted().apply(world_point);
    if (const auto* data = std::get_if<ShapeData>(&n.payload))
        return data->path.contains(local);

    auto bounds = local_bounds(id);
    return bounds && bounds->contains(local);
}

NodeId SceneGraph::hit_test_recursive(NodeId root, Vec2 world_point) const
{
    const Node& n = node(root);
    if (!n.visible)
        return INVALID_NODE_ID;

    for (auto it = n.children.rbegin(); it != n.children.rend(); ++it)
    {
        NodeId hit = hit_test_recursive(*it, world_point);
        if (hit != INVALID_NODE_ID)
            return hit;
    }

    return hit_test(root, world_point) ? root : INVALID_NODE_ID;
}

}  // namespace vecanim
