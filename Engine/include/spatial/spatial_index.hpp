/**
 * @file spatial_index.hpp
 * @brief Per-level point-in-polygon index over administrative boundaries.
 *
 * Lookup is two-phase: a LevelGrid narrows the level to features whose bbox
 * covers the point, then an exact boundary-inclusive ray-casting test filters
 * them. Results are ordered most-specific first: smaller area wins, equal
 * areas fall back to lexicographic id. The index is immutable once built.
 */

#pragma once

#include <core/cancel_token.hpp>
#include <dataset/admin_feature.hpp>
#include <dataset/manifest.hpp>
#include <spatial/level_grid.hpp>
#include <export.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Cadis::Spatial {

struct IndexOptions {
    double boundary_epsilon = 1e-9;   // degrees
    size_t grid_target_per_cell = 4;
};

struct DistanceHit {
    const AdminFeature* feature = nullptr;
    double distance_km = 0.0;
};

/// Tie-break order for overlapping candidates at one level.
inline bool more_specific(const AdminFeature& a, const AdminFeature& b) {
    if (a.area != b.area) return a.area < b.area;
    return a.id < b.id;
}

class SpatialIndex {
public:
    /**
     * @brief Load every declared level's geometry and index it.
     *
     * Returns nullopt if `cancel` fires between levels.
     * @throws DatasetLoadError
     */
    CADIS_API static std::optional<SpatialIndex> build(const DatasetManifest& manifest,
                                                       const IndexOptions& options,
                                                       const CancelToken* cancel = nullptr);

    /**
     * @brief Index already-loaded features. Every feature's level must be in `levels`.
     *
     * @throws std::invalid_argument on duplicate ids or undeclared levels
     */
    CADIS_API static SpatialIndex from_features(std::vector<AdminFeature> features,
                                                const std::vector<int>& levels,
                                                const IndexOptions& options);

    /**
     * @brief Features at `level` containing `p`, most specific first.
     */
    CADIS_API std::vector<const AdminFeature*> query(int level, const Geometry::Vec2& p) const;

    /**
     * @brief Features at `level` within `max_km` of `p` by bbox window (all of them when unset), id order.
     */
    CADIS_API std::vector<const AdminFeature*> candidates_near(int level, const Geometry::Vec2& p,
                                                               std::optional<double> max_km) const;

    /**
     * @brief Feature at `level` whose boundary is nearest to `p`, within `max_km`.
     */
    CADIS_API std::optional<DistanceHit> nearest_boundary(int level, const Geometry::Vec2& p,
                                                          double max_km) const;

    CADIS_API bool contains(const AdminFeature& feature, const Geometry::Vec2& p) const;

    CADIS_API const AdminFeature* find(const std::string& id) const;

    bool has_level(int level) const { return members_.count(level) > 0; }
    size_t size() const { return features_.size(); }
    size_t level_size(int level) const;
    const Geometry::BBox2& coverage() const { return coverage_; }
    double boundary_epsilon() const { return options_.boundary_epsilon; }

private:
    SpatialIndex() = default;

    Geometry::BBox2 window_km(const Geometry::Vec2& p, double km) const;

    std::vector<AdminFeature> features_;
    std::map<int, std::vector<uint32_t>> members_;
    std::map<int, LevelGrid> grids_;
    std::unordered_map<std::string, uint32_t> by_id_;
    Geometry::BBox2 coverage_ = Geometry::bbox_empty();
    IndexOptions options_;
};

} // namespace Cadis::Spatial
