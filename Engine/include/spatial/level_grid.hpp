#pragma once

#include <dataset/admin_feature.hpp>
#include <geometry/bbox.hpp>
#include <export.hpp>
#include <cstdint>
#include <vector>

namespace Cadis::Spatial {

/**
 * @brief Uniform bucket grid over one level's feature bounding boxes.
 *
 * Each cell lists (ascending) the indices of features whose bbox overlaps it.
 * Cell count scales with feature count, so a point probe touches a handful of
 * candidates instead of the whole level.
 */
class LevelGrid {
public:
    static constexpr int kMaxCellsPerSide = 1024;

    CADIS_API void build(const std::vector<AdminFeature>& features,
                         const std::vector<uint32_t>& members,
                         size_t target_per_cell);

    /**
     * @brief Append (sorted, unique) indices of features whose bbox may overlap `window`.
     */
    CADIS_API void candidates_in(const Geometry::BBox2& window, std::vector<uint32_t>& out) const;

    const Geometry::BBox2& extent() const { return extent_; }
    size_t cell_count() const { return cells_.size(); }

private:
    int col_of(double x) const;
    int row_of(double y) const;

    Geometry::BBox2 extent_ = Geometry::bbox_empty();
    int cols_ = 0;
    int rows_ = 0;
    double cell_w_ = 1.0;
    double cell_h_ = 1.0;
    std::vector<std::vector<uint32_t>> cells_;
};

} // namespace Cadis::Spatial
