#include <geometry/polygon.hpp>
#include <algorithm>
#include <cmath>

namespace Cadis::Geometry {

bool point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b, double eps) noexcept
{
    if (p.x() < std::min(a.x(), b.x()) - eps || p.x() > std::max(a.x(), b.x()) + eps) return false;
    if (p.y() < std::min(a.y(), b.y()) - eps || p.y() > std::max(a.y(), b.y()) + eps) return false;

    const Vec2 ab = b - a;
    const Vec2 ap = p - a;
    const double len = ab.norm();
    if (len == 0.0) return ap.norm() <= eps;

    const double cross = ab.x() * ap.y() - ab.y() * ap.x();
    return std::abs(cross) <= eps * len;
}

bool ring_boundary_contains(const Ring& ring, const Vec2& p, double eps) noexcept
{
    const size_t n = ring.size();
    if (n < 2) return false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        if (point_on_segment(p, ring[j], ring[i], eps)) return true;
    }
    return false;
}

bool ring_contains(const Ring& ring, const Vec2& p, double eps) noexcept
{
    const size_t n = ring.size();
    if (n < 3) return false;

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Vec2& a = ring[j];
        const Vec2& b = ring[i];

        if (point_on_segment(p, a, b, eps)) return true;

        if ((b.y() > p.y()) != (a.y() > p.y())) {
            const double x_cross = (a.x() - b.x()) * (p.y() - b.y()) / (a.y() - b.y()) + b.x();
            if (p.x() < x_cross) inside = !inside;
        }
    }
    return inside;
}

bool polygon_contains(const Polygon& poly, const Vec2& p, double eps) noexcept
{
    if (!ring_contains(poly.outer, p, eps)) return false;

    for (const auto& hole : poly.holes) {
        // A hole edge is still polygon boundary.
        if (ring_boundary_contains(hole, p, eps)) return true;
        if (ring_contains(hole, p, 0.0)) return false;
    }
    return true;
}

bool multipolygon_contains(const MultiPolygon& mp, const Vec2& p, double eps) noexcept
{
    for (const auto& poly : mp) {
        if (polygon_contains(poly, p, eps)) return true;
    }
    return false;
}

double ring_signed_area(const Ring& ring) noexcept
{
    const size_t n = ring.size();
    if (n < 3) return 0.0;

    double acc = 0.0;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        acc += ring[j].x() * ring[i].y() - ring[i].x() * ring[j].y();
    }
    return 0.5 * acc;
}

double polygon_area(const Polygon& poly) noexcept
{
    double area = std::abs(ring_signed_area(poly.outer));
    for (const auto& hole : poly.holes) {
        area -= std::abs(ring_signed_area(hole));
    }
    return std::max(area, 0.0);
}

double multipolygon_area(const MultiPolygon& mp) noexcept
{
    double area = 0.0;
    for (const auto& poly : mp) area += polygon_area(poly);
    return area;
}

namespace {

// Returns signed area; accumulates first moments into cx, cy.
double ring_moments(const Ring& ring, double& cx, double& cy) noexcept
{
    const size_t n = ring.size();
    cx = cy = 0.0;
    if (n < 3) return 0.0;

    double a2 = 0.0;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const double cross = ring[j].x() * ring[i].y() - ring[i].x() * ring[j].y();
        a2 += cross;
        cx += (ring[j].x() + ring[i].x()) * cross;
        cy += (ring[j].y() + ring[i].y()) * cross;
    }
    return 0.5 * a2;
}

} // namespace

Vec2 multipolygon_centroid(const MultiPolygon& mp) noexcept
{
    double sum_w = 0.0;
    double sum_x = 0.0;
    double sum_y = 0.0;

    auto accumulate = [&](const Ring& ring, double sign) {
        double mx = 0.0, my = 0.0;
        const double a = ring_moments(ring, mx, my);
        if (a == 0.0) return;
        // (mx, my) / (6a) is the ring centroid regardless of orientation.
        const double w = sign * std::abs(a);
        sum_x += w * mx / (6.0 * a);
        sum_y += w * my / (6.0 * a);
        sum_w += w;
    };

    for (const auto& poly : mp) {
        accumulate(poly.outer, 1.0);
        for (const auto& hole : poly.holes) accumulate(hole, -1.0);
    }

    if (std::abs(sum_w) > 1e-18) {
        return Vec2(sum_x / sum_w, sum_y / sum_w);
    }

    Vec2 mean = Vec2::Zero();
    size_t count = 0;
    for (const auto& poly : mp) {
        for (const auto& v : poly.outer) {
            mean += v;
            ++count;
        }
    }
    return count > 0 ? Vec2(mean / static_cast<double>(count)) : mean;
}

BBox2 multipolygon_bbox(const MultiPolygon& mp) noexcept
{
    BBox2 box = bbox_empty();
    for (const auto& poly : mp) {
        for (const auto& v : poly.outer) bbox_expand(box, v);
    }
    return box;
}

} // namespace Cadis::Geometry
