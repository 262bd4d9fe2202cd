#pragma once

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace vecanim
{

// ─── Vec2 ────────────────────────────────────────────────────────────────────

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    constexpr Vec2  operator+(Vec2 o) const { return {x + o.x, y + o.y}; }
    constexpr Vec2  operator-(Vec2 o) const { return {x - o.x, y - o.y}; }
    constexpr Vec2  operator*(float s) const { return {x * s, y * s}; }
    constexpr Vec2  operator/(float s) const { return {x / s, y / s}; }
    constexpr Vec2  operator-() const { return {-x, -y}; }
    constexpr Vec2& operator+=(Vec2 o)
    {
        x += o.x;
        y += o.y;
        return *this;
    }
    constexpr Vec2& operator-=(Vec2 o)
    {
        x -= o.x;
        y -= o.y;
        return *this;
    }
    constexpr bool operator==(Vec2 o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(Vec2 o) const { return !(*this == o); }
};

inline constexpr float vec2_dot(Vec2 a, Vec2 b)
{
    return a.x * b.x + a.y * b.y;
}

inline float vec2_length(Vec2 v)
{
    return std::sqrt(vec2_dot(v, v));
}

inline float vec2_distance(Vec2 a, Vec2 b)
{
    return vec2_length(b - a);
}

inline constexpr Vec2 vec2_lerp(Vec2 a, Vec2 b, float t)
{
    return a + (b - a) * t;
}

// ─── Mat2D ───────────────────────────────────────────────────────────────────
// Affine 2D transform laid out as
//   | a  c  tx |
//   | b  d  ty |
//   | 0  0  1  |

struct Mat2D
{
    float a  = 1.0f;
    float b  = 0.0f;
    float c  = 0.0f;
    float d  = 1.0f;
    float tx = 0.0f;
    float ty = 0.0f;

    constexpr Mat2D() = default;
    constexpr Mat2D(float a_, float b_, float c_, float d_, float tx_, float ty_)
        : a(a_), b(b_), c(c_), d(d_), tx(tx_), ty(ty_)
    {
    }

    static constexpr Mat2D identity() { return {}; }
    static constexpr Mat2D translation(float x, float y) { return {1, 0, 0, 1, x, y}; }
    static constexpr Mat2D scaling(float sx, float sy) { return {sx, 0, 0, sy, 0, 0}; }
    static Mat2D           rotation(float radians)
    {
        float cs = std::cos(radians);
        float sn = std::sin(radians);
        return {cs, sn, -sn, cs, 0, 0};
    }

    // this * o: o is applied first.
    constexpr Mat2D operator*(const Mat2D& o) const
    {
        return {a * o.a + c * o.b,
                b * o.a + d * o.b,
                a * o.c + c * o.d,
                b * o.c + d * o.d,
                a * o.tx + c * o.ty + tx,
                b * o.tx + d * o.ty + ty};
    }

    constexpr Vec2 apply(Vec2 p) const { return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty}; }

    constexpr float determinant() const { return a * d - b * c; }

    // Singular matrices (|det| < 1e-10) invert to identity.
    Mat2D inverted() const
    {
        float det = determinant();
        if (std::fabs(det) < 1e-10f)
            return identity();
        float inv = 1.0f / det;
        return {d * inv,
                -b * inv,
                -c * inv,
                a * inv,
                (c * ty - d * tx) * inv,
                (b * tx - a * ty) * inv};
    }

    bool is_identity() const { return *this == identity(); }

    bool approx_equal(const Mat2D& o, float eps = 1e-4f) const
    {
        return std::fabs(a - o.a) < eps && std::fabs(b - o.b) < eps && std::fabs(c - o.c) < eps
               && std::fabs(d - o.d) < eps && std::fabs(tx - o.tx) < eps
               && std::fabs(ty - o.ty) < eps;
    }

    constexpr bool operator==(const Mat2D& o) const
    {
        return a == o.a && b == o.b && c == o.c && d == o.d && tx == o.tx && ty == o.ty;
    }
    constexpr bool operator!=(const Mat2D& o) const { return !(*this == o); }
};

// ─── Rect ────────────────────────────────────────────────────────────────────

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w_, float h_) : x(x_), y(y_), w(w_), h(h_) {}

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + w; }
    constexpr float bottom() const { return y + h; }
    constexpr Vec2  center() const { return {x + w * 0.5f, y + h * 0.5f}; }
    constexpr float area() const { return w * h; }
    constexpr bool  is_empty() const { return w <= 0.0f || h <= 0.0f; }

    // Edges are inclusive.
    constexpr bool contains(Vec2 p) const
    {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    // Strict overlap: rectangles that only touch do not intersect.
    constexpr bool intersects(const Rect& o) const
    {
        return x < o.right() && right() > o.x && y < o.bottom() && bottom() > o.y;
    }

    // Overlapping area, or an empty rect at the origin when disjoint.
    Rect intersection(const Rect& o) const
    {
        float l = std::max(x, o.x);
        float t = std::max(y, o.y);
        float r = std::min(right(), o.right());
        float bt = std::min(bottom(), o.bottom());
        if (r <= l || bt <= t)
            return {};
        return {l, t, r - l, bt - t};
    }

    Rect united(const Rect& o) const
    {
        float l = std::min(x, o.x);
        float t = std::min(y, o.y);
        float r = std::max(right(), o.right());
        float bt = std::max(bottom(), o.bottom());
        return {l, t, r - l, bt - t};
    }

    constexpr Rect expanded(float margin) const
    {
        return {x - margin, y - margin, w + margin * 2.0f, h + margin * 2.0f};
    }

    // Axis-aligned bounds of the four transformed corners.
    Rect transformed(const Mat2D& m) const
    {
        return from_points({m.apply({x, y}),
                            m.apply({right(), y}),
                            m.apply({right(), bottom()}),
                            m.apply({x, bottom()})});
    }

    bool approx_equal(const Rect& o, float eps = 1e-4f) const
    {
        return std::fabs(x - o.x) < eps && std::fabs(y - o.y) < eps && std::fabs(w - o.w) < eps
               && std::fabs(h - o.h) < eps;
    }

    constexpr bool operator==(const Rect& o) const
    {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }

    static Rect from_points(std::initializer_list<Vec2> points)
    {
        if (points.size() == 0)
            return {};
        auto  it    = points.begin();
        float min_x = it->x, max_x = it->x;
        float min_y = it->y, max_y = it->y;
        for (++it; it != points.end(); ++it)
        {
            min_x = std::min(min_x, it->x);
            max_x = std::max(max_x, it->x);
            min_y = std::min(min_y, it->y);
            max_y = std::max(max_y, it->y);
        }
        return {min_x, min_y, max_x - min_x, max_y - min_y};
    }

    static constexpr Rect from_center(Vec2 center, float w, float h)
    {
        return {center.x - w * 0.5f, center.y - h * 0.5f, w, h};
    }
};

// ─── Transform ───────────────────────────────────────────────────────────────

struct Transform
{
    Vec2  position;
    float rotation = 0.0f;  // radians
    Vec2  scale{1.0f, 1.0f};
    Vec2  pivot;

    // translate(position) * rotate * scale * translate(-pivot)
    Mat2D to_matrix() const
    {
        return Mat2D::translation(position.x, position.y) * Mat2D::rotation(rotation)
               * Mat2D::scaling(scale.x, scale.y) * Mat2D::translation(-pivot.x, -pivot.y);
    }

    bool operator==(const Transform& o) const
    {
        return position == o.position && rotation == o.rotation && scale == o.scale
               && pivot == o.pivot;
    }
    bool operator!=(const Transform& o) const { return !(*this == o); }
};

}  // namespace vecanim
