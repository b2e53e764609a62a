#include <geometry/geo_distance.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace Cadis::Geometry {

namespace {
constexpr double kDegToRad = kPi / 180.0;
}

double haversine_km(const Vec2& a, const Vec2& b) noexcept
{
    const double lat1 = a.y() * kDegToRad;
    const double lat2 = b.y() * kDegToRad;
    const double dlat = lat2 - lat1;
    const double dlon = (b.x() - a.x()) * kDegToRad;

    const double s_lat = std::sin(dlat / 2.0);
    const double s_lon = std::sin(dlon / 2.0);
    double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
    if (h > 1.0) h = 1.0;
    return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

Vec2 nearest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b) noexcept
{
    const Vec2 d = b - a;
    const double len2 = d.squaredNorm();
    if (len2 == 0.0) return a;

    const double t = (p - a).dot(d) / len2;
    if (t <= 0.0) return a;
    if (t >= 1.0) return b;
    return a + t * d;
}

double distance_km_to_ring(const Vec2& p, const Ring& ring) noexcept
{
    const size_t n = ring.size();
    double best = std::numeric_limits<double>::infinity();
    if (n < 2) return best;

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const double d = haversine_km(p, nearest_point_on_segment(p, ring[j], ring[i]));
        if (d < best) best = d;
    }
    return best;
}

double distance_km_to_boundary(const Vec2& p, const MultiPolygon& mp) noexcept
{
    double best = std::numeric_limits<double>::infinity();
    for (const auto& poly : mp) {
        best = std::min(best, distance_km_to_ring(p, poly.outer));
        for (const auto& hole : poly.holes) {
            best = std::min(best, distance_km_to_ring(p, hole));
        }
    }
    return best;
}

} // namespace Cadis::Geometry
