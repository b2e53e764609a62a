/**
 * @file polygon.hpp
 * @brief Planar polygon primitives over lon/lat degrees.
 *
 * Rings may be given open or closed (first vertex repeated); both are handled.
 * Containment is boundary-inclusive: a point within `eps` of any edge of the
 * outer ring or of a hole counts as inside the polygon.
 */

#pragma once

#include <geometry/bbox.hpp>
#include <geometry/geo_point.hpp>
#include <export.hpp>
#include <vector>

namespace Cadis::Geometry {

using Ring = std::vector<Vec2>;

struct Polygon {
    Ring outer;
    std::vector<Ring> holes;
};

using MultiPolygon = std::vector<Polygon>;

CADIS_API bool point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b, double eps) noexcept;

/**
 * @brief Even-odd ray casting against a single ring, boundary-inclusive.
 */
CADIS_API bool ring_contains(const Ring& ring, const Vec2& p, double eps) noexcept;

CADIS_API bool ring_boundary_contains(const Ring& ring, const Vec2& p, double eps) noexcept;

/**
 * @brief Inside the outer ring and not strictly inside any hole.
 */
CADIS_API bool polygon_contains(const Polygon& poly, const Vec2& p, double eps) noexcept;

CADIS_API bool multipolygon_contains(const MultiPolygon& mp, const Vec2& p, double eps) noexcept;

/// Shoelace area; positive for counter-clockwise rings.
CADIS_API double ring_signed_area(const Ring& ring) noexcept;

/// |outer| minus the holes, in square degrees.
CADIS_API double polygon_area(const Polygon& poly) noexcept;
CADIS_API double multipolygon_area(const MultiPolygon& mp) noexcept;

/**
 * @brief Area-weighted centroid (holes subtract).
 *
 * Degenerate input (zero total area) falls back to the mean of outer ring vertices.
 */
CADIS_API Vec2 multipolygon_centroid(const MultiPolygon& mp) noexcept;

CADIS_API BBox2 multipolygon_bbox(const MultiPolygon& mp) noexcept;

} // namespace Cadis::Geometry
