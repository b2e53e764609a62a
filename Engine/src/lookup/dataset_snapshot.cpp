#include <lookup/dataset_snapshot.hpp>
#include <core/errors.hpp>
#include <lookup/hierarchy_composer.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <new>

namespace Cadis {

namespace fs = std::filesystem;

void validate_coordinate(double lat, double lon) {
    if (!std::isfinite(lat) || !std::isfinite(lon) ||
        lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
        throw InvalidCoordinateError(lat, lon);
    }
}

SnapshotHandle DatasetSnapshot::build(const fs::path& dataset_dir, const EngineConfig& config,
                                      const CancelToken* cancel) {
    Timer timer;
    try {
        DatasetManifest manifest = ManifestLoader::parse(dataset_dir);
        if (is_cancelled(cancel)) return nullptr;

        Spatial::IndexOptions options;
        options.boundary_epsilon = config.boundary_epsilon;
        options.grid_target_per_cell = config.grid_target_per_cell;

        auto index = Spatial::SpatialIndex::build(manifest, options, cancel);
        if (!index || is_cancelled(cancel)) return nullptr;

        SupplementationPipeline pipeline = SupplementationPipeline::compile(manifest);
        if (is_cancelled(cancel)) return nullptr;

        Logger::success("Snapshot " + manifest.dataset_id + "@" + manifest.version + " built: " +
                        std::to_string(index->size()) + " features, " +
                        std::to_string(pipeline.size()) + " policies in " +
                        std::to_string(timer.elapsed_ms()) + " ms");

        return SnapshotHandle(new DatasetSnapshot(std::move(manifest), std::move(*index), std::move(pipeline)));
    } catch (const CadisError&) {
        throw;
    } catch (const fs::filesystem_error& e) {
        throw DatasetLoadError(dataset_dir.string(), e.what());
    } catch (const nlohmann::json::exception& e) {
        throw DatasetLoadError(dataset_dir.string(), e.what());
    } catch (const std::bad_alloc&) {
        throw DatasetLoadError(dataset_dir.string(), "out of memory");
    }
}

DraftHierarchy DatasetSnapshot::draft(double lat, double lon) const {
    HierarchyComposer composer(manifest_, index_);
    return composer.resolve(Geometry::from_lat_lon(lat, lon));
}

std::string DatasetSnapshot::summary_of(const std::vector<HierarchyNode>& nodes) const {
    const auto& locale = manifest_.locale;
    std::string out;
    auto append = [&](const HierarchyNode& n) {
        if (n.name.empty()) return;
        if (!out.empty()) out += locale.summary_separator;
        out += n.name;
    };

    if (locale.summary_order == SummaryOrder::FineToCoarse) {
        for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) append(*it);
    } else {
        for (const auto& n : nodes) append(n);
    }
    return out;
}

HierarchyResult DatasetSnapshot::lookup(double lat, double lon) const {
    validate_coordinate(lat, lon);

    HierarchyResult result = pipeline_.apply(draft(lat, lon), index_, manifest_);
    result.summary_text = summary_of(result.nodes);
    result.iso_context = IsoContext{manifest_.country_iso2, manifest_.country_name};
    result.dataset_id = manifest_.dataset_id;
    result.version = manifest_.version;

    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("lookup(" + std::to_string(lat) + ", " + std::to_string(lon) + ") -> " +
                      to_string(result.status) + " [" + result.summary_text + "]");
    }
    return result;
}

SnapshotHandle initialize(const fs::path& dataset_dir) {
    EngineConfig config = EngineConfig::from_env();
    config.apply_logging();
    SnapshotHandle snapshot = DatasetSnapshot::build(dataset_dir, config);
    if (!snapshot) {
        throw DatasetLoadError(dataset_dir.string(), "load cancelled");
    }
    return snapshot;
}

HierarchyResult lookup(const SnapshotHandle& snapshot, double lat, double lon) {
    if (!snapshot) {
        throw DatasetLoadError("", "no dataset snapshot loaded");
    }
    return snapshot->lookup(lat, lon);
}

} // namespace Cadis
