/**
 * @file feature_builders.hpp
 * @brief In-memory features and manifests for tests that skip the filesystem.
 */

#pragma once

#include <dataset/admin_feature.hpp>
#include <dataset/manifest.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CadisTest {

inline Cadis::AdminFeature square_feature(const std::string& id, int level,
                                          double x0, double y0, double x1, double y1,
                                          const std::string& parent = "",
                                          const std::string& name = "") {
    using Cadis::Geometry::Vec2;
    Cadis::AdminFeature f;
    f.id = id;
    f.level = level;
    f.name = name.empty() ? id : name;
    f.parent_id = parent;
    f.geometry = {Cadis::Geometry::Polygon{{Vec2(x0, y0), Vec2(x1, y0), Vec2(x1, y1), Vec2(x0, y1)}, {}}};
    return f;
}

/// Levels as (level, parent_level) pairs, coarsest first.
inline Cadis::DatasetManifest manifest_with_levels(const std::vector<std::pair<int, std::optional<int>>>& levels) {
    Cadis::DatasetManifest m;
    m.dataset_id = "test";
    m.version = "1";
    m.checksum = "none";
    m.country_iso2 = "TW";
    m.country_name = "Taiwan";
    for (const auto& [level, parent] : levels) {
        Cadis::LevelSpec spec;
        spec.level = level;
        spec.label = "level_" + std::to_string(level);
        spec.geometry = "level_" + std::to_string(level) + ".geojson";
        spec.parent_level = parent;
        m.levels.push_back(spec);
    }
    return m;
}

} // namespace CadisTest
