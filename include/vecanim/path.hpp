#pragma once

#include <optional>
#include <vector>
#include <vecanim/math2d.hpp>

namespace vecanim
{

enum class PathCommandType
{
    MoveTo,
    LineTo,
    CubicTo,
    QuadTo,
    Close,
};

// MoveTo/LineTo use `to`; QuadTo uses c1 + to; CubicTo uses c1, c2 + to.
struct PathCommand
{
    PathCommandType type = PathCommandType::MoveTo;
    Vec2            c1;
    Vec2            c2;
    Vec2            to;
};

class Path
{
   public:
    Path() = default;

    Path& move_to(Vec2 p);
    Path& line_to(Vec2 p);
    Path& cubic_to(Vec2 c1, Vec2 c2, Vec2 to);
    Path& quad_to(Vec2 c, Vec2 to);
    Path& close();
    void  clear();

    const std::vector<PathCommand>& commands() const { return commands_; }
    bool                            empty() const { return commands_.empty(); }
    size_t                          size() const { return commands_.size(); }

    // Min/max over every end point and control point. {0,0,0,0} for an empty path.
    Rect bounds() const;

    // Flattens into closed polygons, one per subpath. Curves are split into
    // `curve_segments` line segments.
    std::vector<std::vector<Vec2>> flatten(int curve_segments = 10) const;

    // Even-odd fill rule against the flattened outline.
    bool contains(Vec2 p) const;

    static Path rectangle(float x, float y, float w, float h);
    static Path ellipse(Vec2 center, float rx, float ry);

   private:
    std::vector<PathCommand>    commands_;
    mutable std::optional<Rect> cached_bounds_;
};

}  // namespace vecanim
