#include <spatial/level_grid.hpp>
#include <algorithm>
#include <cmath>

namespace Cadis::Spatial {

using Geometry::BBox2;

void LevelGrid::build(const std::vector<AdminFeature>& features,
                      const std::vector<uint32_t>& members,
                      size_t target_per_cell) {
    cells_.clear();
    extent_ = Geometry::bbox_empty();
    cols_ = rows_ = 0;

    for (uint32_t idx : members) {
        extent_ = Geometry::bbox_union(extent_, features[idx].bbox);
    }
    if (members.empty() || Geometry::bbox_is_empty(extent_)) return;

    const double width = extent_.max.x() - extent_.min.x();
    const double height = extent_.max.y() - extent_.min.y();
    const double wanted = std::max(1.0, std::ceil(static_cast<double>(members.size()) /
                                                  static_cast<double>(std::max<size_t>(target_per_cell, 1))));

    // Keep cells roughly square.
    double aspect = (width > 0.0 && height > 0.0) ? width / height : 1.0;
    cols_ = (width > 0.0) ? static_cast<int>(std::ceil(std::sqrt(wanted * aspect))) : 1;
    cols_ = std::clamp(cols_, 1, kMaxCellsPerSide);
    rows_ = (height > 0.0) ? static_cast<int>(std::ceil(wanted / cols_)) : 1;
    rows_ = std::clamp(rows_, 1, kMaxCellsPerSide);

    cell_w_ = (width > 0.0) ? width / cols_ : 1.0;
    cell_h_ = (height > 0.0) ? height / rows_ : 1.0;

    cells_.assign(static_cast<size_t>(cols_) * rows_, {});
    for (uint32_t idx : members) {
        const BBox2& b = features[idx].bbox;
        const int c0 = col_of(b.min.x()), c1 = col_of(b.max.x());
        const int r0 = row_of(b.min.y()), r1 = row_of(b.max.y());
        for (int r = r0; r <= r1; ++r) {
            for (int c = c0; c <= c1; ++c) {
                cells_[static_cast<size_t>(r) * cols_ + c].push_back(idx);
            }
        }
    }
}

int LevelGrid::col_of(double x) const {
    // Clamp before the cast; a tiny cell size can push the quotient past int range.
    const double c = std::floor((x - extent_.min.x()) / cell_w_);
    return static_cast<int>(std::clamp(c, 0.0, static_cast<double>(cols_ - 1)));
}

int LevelGrid::row_of(double y) const {
    const double r = std::floor((y - extent_.min.y()) / cell_h_);
    return static_cast<int>(std::clamp(r, 0.0, static_cast<double>(rows_ - 1)));
}

void LevelGrid::candidates_in(const BBox2& window, std::vector<uint32_t>& out) const {
    if (cells_.empty() || !Geometry::bbox_intersects(extent_, window)) return;

    const size_t start = out.size();
    const int c0 = col_of(window.min.x()), c1 = col_of(window.max.x());
    const int r0 = row_of(window.min.y()), r1 = row_of(window.max.y());
    for (int r = r0; r <= r1; ++r) {
        for (int c = c0; c <= c1; ++c) {
            const auto& cell = cells_[static_cast<size_t>(r) * cols_ + c];
            out.insert(out.end(), cell.begin(), cell.end());
        }
    }

    // A feature spanning several cells shows up once per cell.
    std::sort(out.begin() + start, out.end());
    out.erase(std::unique(out.begin() + start, out.end()), out.end());
}

} // namespace Cadis::Spatial
