/**
 * @file dataset_snapshot.hpp
 * @brief Immutable, fully built dataset: manifest, spatial index and compiled policies.
 *
 * A snapshot is built completely before anyone can see it and is shared
 * read-only afterwards, so lookups against it need no locking.
 */

#pragma once

#include <core/cancel_token.hpp>
#include <core/engine_config.hpp>
#include <dataset/manifest.hpp>
#include <lookup/hierarchy.hpp>
#include <spatial/spatial_index.hpp>
#include <supplement/supplementation_pipeline.hpp>
#include <export.hpp>
#include <filesystem>
#include <memory>

namespace Cadis {

class DatasetSnapshot;
using SnapshotHandle = std::shared_ptr<const DatasetSnapshot>;

class DatasetSnapshot {
public:
    /**
     * @brief Manifest -> geometry -> index -> policy resources.
     *
     * Returns nullptr if `cancel` fires before the build completes.
     * @throws ManifestError, UnknownPolicyError, DatasetLoadError
     */
    CADIS_API static SnapshotHandle build(const std::filesystem::path& dataset_dir,
                                          const EngineConfig& config = EngineConfig{},
                                          const CancelToken* cancel = nullptr);

    /**
     * @brief Resolve the administrative hierarchy for a coordinate.
     * @throws InvalidCoordinateError
     */
    CADIS_API HierarchyResult lookup(double lat, double lon) const;

    /// Composer output before supplementation. Coordinates are not validated.
    CADIS_API DraftHierarchy draft(double lat, double lon) const;

    const DatasetManifest& manifest() const { return manifest_; }
    const Spatial::SpatialIndex& index() const { return index_; }
    const SupplementationPipeline& pipeline() const { return pipeline_; }
    const std::string& dataset_id() const { return manifest_.dataset_id; }
    const std::string& version() const { return manifest_.version; }

private:
    DatasetSnapshot(DatasetManifest manifest, Spatial::SpatialIndex index, SupplementationPipeline pipeline)
        : manifest_(std::move(manifest)), index_(std::move(index)), pipeline_(std::move(pipeline)) {}

    std::string summary_of(const std::vector<HierarchyNode>& nodes) const;

    DatasetManifest manifest_;
    Spatial::SpatialIndex index_;
    SupplementationPipeline pipeline_;
};

/// @throws InvalidCoordinateError for NaN or out-of-range values
CADIS_API void validate_coordinate(double lat, double lon);

/**
 * @brief Build a snapshot for `dataset_dir` with configuration from the environment.
 */
CADIS_API SnapshotHandle initialize(const std::filesystem::path& dataset_dir);

/**
 * @brief Lookup against a specific snapshot.
 * @throws DatasetLoadError for a null handle, InvalidCoordinateError for bad input
 */
CADIS_API HierarchyResult lookup(const SnapshotHandle& snapshot, double lat, double lon);

} // namespace Cadis
