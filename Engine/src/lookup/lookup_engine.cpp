#include <lookup/lookup_engine.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Cadis {

LookupEngine::LookupEngine(EngineConfig config) : config_(std::move(config)) {}

bool LookupEngine::load(const std::filesystem::path& dataset_dir, const CancelToken* cancel) {
    std::lock_guard<std::mutex> lock(load_mutex_);
    Logger::step("Loading dataset from " + dataset_dir.string());

    SnapshotHandle next;
    try {
        next = DatasetSnapshot::build(dataset_dir, config_, cancel);
    } catch (const std::exception& e) {
        Logger::error(std::string("Load failed, keeping generation ") +
                      std::to_string(generation()) + ": " + e.what());
        throw;
    }

    if (!next || is_cancelled(cancel)) {
        Logger::warn("Load of " + dataset_dir.string() + " cancelled before swap");
        return false;
    }

    std::atomic_store_explicit(&active_, next, std::memory_order_release);
    const uint64_t gen = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    Logger::success("Snapshot " + next->dataset_id() + "@" + next->version() +
                    " active (generation " + std::to_string(gen) + ")");
    return true;
}

SnapshotHandle LookupEngine::snapshot() const {
    return std::atomic_load_explicit(&active_, std::memory_order_acquire);
}

HierarchyResult LookupEngine::lookup(double lat, double lon) const {
    SnapshotHandle current = snapshot();
    if (!current) {
        throw DatasetLoadError(config_.dataset_dir, "lookup before any dataset was loaded");
    }
    return current->lookup(lat, lon);
}

} // namespace Cadis
