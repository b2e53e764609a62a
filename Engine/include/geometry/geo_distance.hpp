#pragma once

#include <geometry/polygon.hpp>
#include <export.hpp>

namespace Cadis::Geometry {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kPi = 3.14159265358979323846;

/// Rough degrees-per-km used to turn a km cap into a bbox search window.
constexpr double kKmPerDegree = 111.0;

CADIS_API double haversine_km(const Vec2& a, const Vec2& b) noexcept;

/// Planar projection of p onto segment ab, clamped to the segment.
CADIS_API Vec2 nearest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b) noexcept;

CADIS_API double distance_km_to_ring(const Vec2& p, const Ring& ring) noexcept;

/**
 * @brief Great-circle distance from p to the nearest edge of any ring.
 *
 * Returns +inf for geometry without edges.
 */
CADIS_API double distance_km_to_boundary(const Vec2& p, const MultiPolygon& mp) noexcept;

} // namespace Cadis::Geometry
