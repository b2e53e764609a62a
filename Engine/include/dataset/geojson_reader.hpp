#pragma once

#include <dataset/admin_feature.hpp>
#include <export.hpp>
#include <filesystem>
#include <vector>

namespace Cadis {

/**
 * @brief Reads one level's GeoJSON FeatureCollection into AdminFeatures.
 *
 * Accepts Polygon and MultiPolygon geometry with [lon, lat] positions.
 * Derived fields (bbox, area, centroid) are left for the spatial index.
 */
class GeoJsonReader {
public:
    /**
     * @throws DatasetLoadError on I/O failure, malformed JSON or geometry,
     *         a missing id/name, or a level property that disagrees with `level`
     */
    CADIS_API static std::vector<AdminFeature> read_level(const std::filesystem::path& dataset_dir,
                                                          const std::string& relative_path,
                                                          int level);
};

} // namespace Cadis
