/**
 * @file lookup_engine.hpp
 * @brief One region's lookup engine: exactly one active snapshot, swapped atomically.
 *
 * Loads are serialized; lookups never block on a load and always see one
 * complete snapshot. A failed or cancelled load leaves the active snapshot
 * untouched.
 */

#pragma once

#include <core/cancel_token.hpp>
#include <core/engine_config.hpp>
#include <lookup/dataset_snapshot.hpp>
#include <export.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>

namespace Cadis {

class LookupEngine {
public:
    CADIS_API explicit LookupEngine(EngineConfig config = EngineConfig{});

    LookupEngine(const LookupEngine&) = delete;
    LookupEngine& operator=(const LookupEngine&) = delete;

    /**
     * @brief Build a snapshot from `dataset_dir` and make it active.
     *
     * Returns false if cancelled before the swap. Load errors propagate and
     * the previous snapshot stays active.
     */
    CADIS_API bool load(const std::filesystem::path& dataset_dir, const CancelToken* cancel = nullptr);

    /// Active snapshot, or nullptr before the first successful load.
    CADIS_API SnapshotHandle snapshot() const;

    /// @throws DatasetLoadError before any load, InvalidCoordinateError for bad input
    CADIS_API HierarchyResult lookup(double lat, double lon) const;

    /// Number of committed swaps.
    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::mutex load_mutex_;
    SnapshotHandle active_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace Cadis
