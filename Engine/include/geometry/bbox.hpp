#pragma once

#include <geometry/geo_point.hpp>
#include <limits>

namespace Cadis::Geometry {

struct BBox2 {
    Vec2 min;
    Vec2 max;
};

inline BBox2 bbox_empty() noexcept
{
    const double inf = std::numeric_limits<double>::infinity();
    return BBox2{Vec2(inf, inf), Vec2(-inf, -inf)};
}

inline bool bbox_is_empty(const BBox2& b) noexcept
{
    return b.min.x() > b.max.x() || b.min.y() > b.max.y();
}

inline void bbox_expand(BBox2& b, const Vec2& p) noexcept
{
    for (int i = 0; i < 2; ++i)
    {
        if (p[i] < b.min[i]) b.min[i] = p[i];
        if (p[i] > b.max[i]) b.max[i] = p[i];
    }
}

inline BBox2 bbox_union(const BBox2& a, const BBox2& b) noexcept
{
    if (bbox_is_empty(a)) return b;
    if (bbox_is_empty(b)) return a;
    BBox2 r = a;
    bbox_expand(r, b.min);
    bbox_expand(r, b.max);
    return r;
}

/// Boundary-inclusive, widened by eps on every side.
inline bool bbox_contains(const BBox2& b, const Vec2& p, double eps = 0.0) noexcept
{
    return p.x() >= b.min.x() - eps && p.x() <= b.max.x() + eps &&
           p.y() >= b.min.y() - eps && p.y() <= b.max.y() + eps;
}

inline bool bbox_intersects(const BBox2& a, const BBox2& b) noexcept
{
    return !(a.max.x() < b.min.x() || a.min.x() > b.max.x() ||
             a.max.y() < b.min.y() || a.min.y() > b.max.y());
}

inline BBox2 bbox_around(const Vec2& p, double half_extent) noexcept
{
    return BBox2{Vec2(p.x() - half_extent, p.y() - half_extent),
                 Vec2(p.x() + half_extent, p.y() + half_extent)};
}

} // namespace Cadis::Geometry
