/**
 * @file supplementation_pipeline.hpp
 * @brief Ordered chain of policies applied to a draft hierarchy.
 *
 * Policies run in manifest order. A policy may fill holes or rename nodes,
 * but never drop, replace, or move a node that was resolved before it ran;
 * output that would do so is discarded and the chain continues with the
 * previous draft. Finalization assigns ranks and the lookup status.
 */

#pragma once

#include <dataset/manifest.hpp>
#include <lookup/hierarchy.hpp>
#include <spatial/spatial_index.hpp>
#include <supplement/policy_catalog.hpp>
#include <export.hpp>
#include <vector>

namespace Cadis {

struct CompiledPolicy {
    const PolicyDescriptor* descriptor = nullptr;
    PolicySpec spec;
    PolicyResource resource;
};

class SupplementationPipeline {
public:
    SupplementationPipeline() = default;

    /**
     * @brief Load every policy resource the manifest names.
     * @throws DatasetLoadError
     */
    CADIS_API static SupplementationPipeline compile(const DatasetManifest& manifest);

    /// Run the chain. Never throws for data-quality reasons.
    CADIS_API DraftHierarchy run(DraftHierarchy draft, const Spatial::SpatialIndex& index,
                                 const DatasetManifest& manifest) const;

    /// run() followed by finalize().
    CADIS_API HierarchyResult apply(DraftHierarchy draft, const Spatial::SpatialIndex& index,
                                    const DatasetManifest& manifest) const;

    /// Ranks 0..n-1 in ascending level; not_found, partial or ok by holes.
    CADIS_API static HierarchyResult finalize(const DraftHierarchy& draft);

    /// True when every node resolved in `before` is unchanged in id, level and position in `after`.
    CADIS_API static bool preserves_resolved(const DraftHierarchy& before, const DraftHierarchy& after);

    const std::vector<CompiledPolicy>& policies() const { return chain_; }
    size_t size() const { return chain_.size(); }

private:
    std::vector<CompiledPolicy> chain_;
};

} // namespace Cadis
