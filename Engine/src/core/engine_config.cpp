#include <core/engine_config.hpp>
#include <cstdlib>
#include <stdexcept>

namespace Cadis {

EngineConfig EngineConfig::from_env() {
    EngineConfig cfg;

    const char* dataset_dir = std::getenv("CADIS_DATASET_DIR");
    const char* log_level = std::getenv("CADIS_LOG_LEVEL");
    const char* epsilon = std::getenv("CADIS_BOUNDARY_EPSILON");
    const char* per_cell = std::getenv("CADIS_GRID_TARGET_PER_CELL");

    if (dataset_dir) cfg.dataset_dir = dataset_dir;
    if (log_level) cfg.log_level = Logger::parse_level(log_level);

    if (epsilon) {
        try {
            double v = std::stod(epsilon);
            if (v >= 0.0) cfg.boundary_epsilon = v;
            else Logger::warn("CADIS_BOUNDARY_EPSILON must be >= 0, keeping default");
        } catch (const std::exception&) {
            Logger::warn(std::string("Ignoring unparsable CADIS_BOUNDARY_EPSILON=") + epsilon);
        }
    }

    if (per_cell) {
        try {
            long v = std::stol(per_cell);
            if (v > 0) cfg.grid_target_per_cell = static_cast<size_t>(v);
            else Logger::warn("CADIS_GRID_TARGET_PER_CELL must be > 0, keeping default");
        } catch (const std::exception&) {
            Logger::warn(std::string("Ignoring unparsable CADIS_GRID_TARGET_PER_CELL=") + per_cell);
        }
    }

    return cfg;
}

} // namespace Cadis
