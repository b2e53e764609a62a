#include <spatial/spatial_index.hpp>
#include <core/errors.hpp>
#include <dataset/geojson_reader.hpp>
#include <geometry/geo_distance.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace Cadis::Spatial {

using Geometry::BBox2;
using Geometry::Vec2;

std::optional<SpatialIndex> SpatialIndex::build(const DatasetManifest& manifest,
                                                const IndexOptions& options,
                                                const CancelToken* cancel) {
    const std::string dir = manifest.dataset_dir.string();
    Timer timer;

    std::vector<AdminFeature> features;
    for (const auto& level : manifest.levels) {
        if (is_cancelled(cancel)) return std::nullopt;

        auto loaded = GeoJsonReader::read_level(manifest.dataset_dir, level.geometry, level.level);
        Logger::step("Level " + std::to_string(level.level) + " (" + level.label + "): " +
                     std::to_string(loaded.size()) + " features from " + level.geometry);
        if (loaded.empty()) {
            Logger::warn("Level " + std::to_string(level.level) + " has no features; it will always be a hole");
        }
        features.insert(features.end(),
                        std::make_move_iterator(loaded.begin()),
                        std::make_move_iterator(loaded.end()));
    }
    if (is_cancelled(cancel)) return std::nullopt;

    try {
        SpatialIndex index = from_features(std::move(features), manifest.level_numbers(), options);
        Logger::success("Spatial index built: " + std::to_string(index.size()) + " features in " +
                        std::to_string(timer.elapsed_ms()) + " ms");
        return index;
    } catch (const std::invalid_argument& e) {
        throw DatasetLoadError(dir, e.what());
    }
}

SpatialIndex SpatialIndex::from_features(std::vector<AdminFeature> features,
                                         const std::vector<int>& levels,
                                         const IndexOptions& options) {
    SpatialIndex index;
    index.options_ = options;
    index.features_ = std::move(features);

    const std::set<int> declared(levels.begin(), levels.end());
    for (int level : declared) index.members_[level];

    for (size_t i = 0; i < index.features_.size(); ++i) {
        const AdminFeature& f = index.features_[i];
        if (!declared.count(f.level)) {
            throw std::invalid_argument("feature " + f.id + " has undeclared level " + std::to_string(f.level));
        }
        if (!index.by_id_.emplace(f.id, static_cast<uint32_t>(i)).second) {
            throw std::invalid_argument("duplicate feature id " + f.id);
        }
        index.members_[f.level].push_back(static_cast<uint32_t>(i));
    }

    // Derived metrics are independent per feature.
    const long count = static_cast<long>(index.features_.size());
    #pragma omp parallel for schedule(dynamic, 64)
    for (long i = 0; i < count; ++i) {
        AdminFeature& f = index.features_[static_cast<size_t>(i)];
        f.bbox = Geometry::multipolygon_bbox(f.geometry);
        f.area = Geometry::multipolygon_area(f.geometry);
        f.centroid = Geometry::multipolygon_centroid(f.geometry);
    }

    for (const auto& [level, members] : index.members_) {
        index.grids_[level].build(index.features_, members, options.grid_target_per_cell);
        index.coverage_ = Geometry::bbox_union(index.coverage_, index.grids_[level].extent());
    }
    return index;
}

size_t SpatialIndex::level_size(int level) const {
    auto it = members_.find(level);
    return it == members_.end() ? 0 : it->second.size();
}

bool SpatialIndex::contains(const AdminFeature& feature, const Vec2& p) const {
    if (!Geometry::bbox_contains(feature.bbox, p, options_.boundary_epsilon)) return false;
    return Geometry::multipolygon_contains(feature.geometry, p, options_.boundary_epsilon);
}

std::vector<const AdminFeature*> SpatialIndex::query(int level, const Vec2& p) const {
    std::vector<const AdminFeature*> hits;
    auto grid = grids_.find(level);
    if (grid == grids_.end()) return hits;

    std::vector<uint32_t> candidates;
    grid->second.candidates_in(Geometry::bbox_around(p, options_.boundary_epsilon), candidates);

    for (uint32_t idx : candidates) {
        const AdminFeature& f = features_[idx];
        if (contains(f, p)) hits.push_back(&f);
    }

    std::sort(hits.begin(), hits.end(),
              [](const AdminFeature* a, const AdminFeature* b) { return more_specific(*a, *b); });
    return hits;
}

BBox2 SpatialIndex::window_km(const Vec2& p, double km) const {
    const double dlat = km / Geometry::kKmPerDegree;
    // Longitude degrees shrink toward the poles.
    const double cos_lat = std::max(std::cos(p.y() * Geometry::kPi / 180.0), 0.01);
    const double dlon = std::min(dlat / cos_lat, 360.0);
    return BBox2{Vec2(p.x() - dlon, p.y() - dlat), Vec2(p.x() + dlon, p.y() + dlat)};
}

std::vector<const AdminFeature*> SpatialIndex::candidates_near(int level, const Vec2& p,
                                                               std::optional<double> max_km) const {
    std::vector<const AdminFeature*> out;
    auto members = members_.find(level);
    if (members == members_.end()) return out;

    if (!max_km) {
        for (uint32_t idx : members->second) out.push_back(&features_[idx]);
    } else {
        const BBox2 window = window_km(p, *max_km);
        std::vector<uint32_t> candidates;
        grids_.at(level).candidates_in(window, candidates);
        // Grid cells are coarser than the window; keep only overlapping bboxes.
        for (uint32_t idx : candidates) {
            if (Geometry::bbox_intersects(features_[idx].bbox, window)) out.push_back(&features_[idx]);
        }
    }

    std::sort(out.begin(), out.end(),
              [](const AdminFeature* a, const AdminFeature* b) { return a->id < b->id; });
    return out;
}

std::optional<DistanceHit> SpatialIndex::nearest_boundary(int level, const Vec2& p, double max_km) const {
    if (!(max_km > 0.0)) return std::nullopt;

    std::optional<DistanceHit> best;
    for (const AdminFeature* f : candidates_near(level, p, max_km)) {
        const double d = Geometry::distance_km_to_boundary(p, f->geometry);
        if (d > max_km) continue;
        // Candidates arrive in id order, so strict < keeps the smallest id on ties.
        if (!best || d < best->distance_km) best = DistanceHit{f, d};
    }
    return best;
}

const AdminFeature* SpatialIndex::find(const std::string& id) const {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : &features_[it->second];
}

} // namespace Cadis::Spatial
