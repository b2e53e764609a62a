#pragma once

#include <geometry/bbox.hpp>
#include <geometry/polygon.hpp>
#include <map>
#include <string>
#include <vector>

namespace Cadis {

/**
 * @brief One administrative boundary at one level.
 *
 * Loaded from a level's GeoJSON file; bbox, area and centroid are filled in
 * when the spatial index is built and never change afterwards.
 */
struct AdminFeature {
    std::string id;                                   // stable identifier (osm_id)
    int level = 0;
    std::string name;
    std::string parent_id;                            // parent-id hint, empty when absent
    std::map<std::string, std::string> localized_names; // e.g. "name:en" -> "Taipei"
    Geometry::MultiPolygon geometry;

    Geometry::BBox2 bbox = Geometry::bbox_empty();
    double area = 0.0;                                // square degrees
    Geometry::Vec2 centroid = Geometry::Vec2::Zero();

    bool has_parent_hint() const { return !parent_id.empty(); }

    /**
     * @brief First non-empty display name among the given property keys.
     *
     * "name" resolves to the primary name. Returns nullptr when none match.
     */
    const std::string* localized(const std::vector<std::string>& fields) const {
        for (const auto& field : fields) {
            if (field == "name") {
                if (!name.empty()) return &name;
                continue;
            }
            auto it = localized_names.find(field);
            if (it != localized_names.end() && !it->second.empty()) return &it->second;
        }
        return nullptr;
    }
};

} // namespace Cadis
