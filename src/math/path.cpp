#include <algorithm>
#include <vecanim/path.hpp>

namespace vecanim
{

namespace
{

Vec2 quad_point(Vec2 p0, Vec2 c, Vec2 p1, float t)
{
    float mt = 1.0f - t;
    return p0 * (mt * mt) + c * (2.0f * mt * t) + p1 * (t * t);
}

Vec2 cubic_point(Vec2 p0, Vec2 c1, Vec2 c2, Vec2 p1, float t)
{
    float mt = 1.0f - t;
    return p0 * (mt * mt * mt) + c1 * (3.0f * mt * mt * t) + c2 * (3.0f * mt * t * t)
           + p1 * (t * t * t);
}

// Magic constant for approximating a quarter ellipse with one cubic.
constexpr float KAPPA = 0.5522847498f;

}  // anonymous namespace

Path& Path::move_to(Vec2 p)
{
    commands_.push_back({PathCommandType::MoveTo, {}, {}, p});
    cached_bounds_.reset();
    return *this;
}

Path& Path::line_to(Vec2 p)
{
    commands_.push_back({PathCommandType::LineTo, {}, {}, p});
    cached_bounds_.reset();
    return *this;
}

Path& Path::cubic_to(Vec2 c1, Vec2 c2, Vec2 to)
{
    commands_.push_back({PathCommandType::CubicTo, c1, c2, to});
    cached_bounds_.reset();
    return *this;
}

Path& Path::quad_to(Vec2 c, Vec2 to)
{
    commands_.push_back({PathCommandType::QuadTo, c, {}, to});
    cached_bounds_.reset();
    return *this;
}

Path& Path::close()
{
    commands_.push_back({PathCommandType::Close, {}, {}, {}});
    return *this;
}

void Path::clear()
{
    commands_.clear();
    cached_bounds_.reset();
}

Rect Path::bounds() const
{
    if (cached_bounds_)
        return *cached_bounds_;

    bool  any   = false;
    float min_x = 0.0f, min_y = 0.0f, max_x = 0.0f, max_y = 0.0f;
    auto  add   = [&](Vec2 p)
    {
        if (!any)
        {
            min_x = max_x = p.x;
            min_y = max_y = p.y;
            any           = true;
            return;
        }
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    };

    for (const auto& cmd : commands_)
    {
        switch (cmd.type)
        {
            case PathCommandType::MoveTo:
            case PathCommandType::LineTo:
                add(cmd.to);
                break;
            case PathCommandType::QuadTo:
                add(cmd.c1);
                add(cmd.to);
                break;
            case PathCommandType::CubicTo:
                add(cmd.c1);
                add(cmd.c2);
                add(cmd.to);
                break;
            case PathCommandType::Close:
                break;
        }
    }

    cached_bounds_ = any ? Rect{min_x, min_y, max_x - min_x, max_y - min_y} : Rect{};
    return *cached_bounds_;
}

std::vector<std::vector<Vec2>> Path::flatten(int curve_segments) const
{
    std::vector<std::vector<Vec2>> polygons;
    std::vector<Vec2>              current;
    Vec2                           cursor;
    Vec2                           subpath_start;
    int                            segments = std::max(1, curve_segments);

    auto flush = [&]()
    {
        if (current.size() >= 2)
            polygons.push_back(std::move(current));
        current.clear();
    };

    for (const auto& cmd : commands_)
    {
        switch (cmd.type)
        {
            case PathCommandType::MoveTo:
                flush();
                cursor = subpath_start = cmd.to;
                current.push_back(cursor);
                break;
            case PathCommandType::LineTo:
                if (current.empty())
                    current.push_back(cursor);
                cursor = cmd.to;
                current.push_back(cursor);
                break;
            case PathCommandType::QuadTo:
                if (current.empty())
                    current.push_back(cursor);
                for (int i = 1; i <= segments; ++i)
                {
                    float t = static_cast<float>(i) / static_cast<float>(segments);
                    current.push_back(quad_point(cursor, cmd.c1, cmd.to, t));
                }
                cursor = cmd.to;
                break;
            case PathCommandType::CubicTo:
                if (current.empty())
                    current.push_back(cursor);
                for (int i = 1; i <= segments; ++i)
                {
                    float t = static_cast<float>(i) / static_cast<float>(segments);
                    current.push_back(cubic_point(cursor, cmd.c1, cmd.c2, cmd.to, t));
                }
                cursor = cmd.to;
                break;
            case PathCommandType::Close:
                flush();
                cursor = subpath_start;
                break;
        }
    }
    flush();
    return polygons;
}

bool Path::contains(Vec2 p) const
{
    if (commands_.empty() || !bounds().contains(p))
        return false;

    bool inside = false;
    for (const auto& poly : flatten(10))
    {
        size_t n = poly.size();
        for (size_t i = 0, j = n - 1; i < n; j = i++)
        {
            const Vec2& pi = poly[i];
            const Vec2& pj = poly[j];
            if ((pi.y > p.y) != (pj.y > p.y)
                && p.x < (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y) + pi.x)
            {
                inside = !inside;
            }
        }
    }
    return inside;
}

Path Path::rectangle(float x, float y, float w, float h)
{
    Path path;
    path.move_to({x, y}).line_to({x + w, y}).line_to({x + w, y + h}).line_to({x, y + h}).close();
    return path;
}

Path Path::ellipse(Vec2 center, float rx, float ry)
{
    float ox = rx * KAPPA;
    float oy = ry * KAPPA;
    float cx = center.x;
    float cy = center.y;

    Path path;
    path.move_to({cx + rx, cy})
        .cubic_to({cx + rx, cy + oy}, {cx + ox, cy + ry}, {cx, cy + ry})
        .cubic_to({cx - ox, cy + ry}, {cx - rx, cy + oy}, {cx - rx, cy})
        .cubic_to({cx - rx, cy - oy}, {cx - ox, cy - ry}, {cx, cy - ry})
        .cubic_to({cx + ox, cy - ry}, {cx + rx, cy - oy}, {cx + rx, cy})
        .close();
    return path;
}

}  // namespace vecanim
