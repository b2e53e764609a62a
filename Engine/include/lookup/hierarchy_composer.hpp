#pragma once

#include <dataset/manifest.hpp>
#include <lookup/hierarchy.hpp>
#include <spatial/spatial_index.hpp>
#include <export.hpp>

namespace Cadis {

/**
 * @brief Resolves the draft hierarchy for a point, one level at a time.
 *
 * Levels are walked coarsest first. At each level the spatial candidates are
 * narrowed to those whose parent hint names the expected parent (the level's
 * declared parent_level when resolved, else the nearest resolved level above);
 * without a hint match the most specific candidate wins. A level with no
 * containing feature is left as a hole and resolution continues below it.
 */
class HierarchyComposer {
public:
    HierarchyComposer(const DatasetManifest& manifest, const Spatial::SpatialIndex& index)
        : manifest_(manifest), index_(index) {}

    CADIS_API DraftHierarchy resolve(const Geometry::Vec2& point) const;

private:
    const HierarchyNode* expected_parent(const DraftHierarchy& draft, size_t slot) const;

    const DatasetManifest& manifest_;
    const Spatial::SpatialIndex& index_;
};

} // namespace Cadis
