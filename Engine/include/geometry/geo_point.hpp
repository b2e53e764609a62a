#pragma once

#include <Eigen/Core>

namespace Cadis::Geometry {

/// Planar lon/lat vector in degrees: x = longitude, y = latitude.
using Vec2 = Eigen::Vector2d;

inline Vec2 from_lat_lon(double lat, double lon) {
    return Vec2(lon, lat);
}

} // namespace Cadis::Geometry
