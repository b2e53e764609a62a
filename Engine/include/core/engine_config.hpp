#pragma once

#include <utils/logger.hpp>
#include <export.hpp>
#include <cstddef>
#include <string>

namespace Cadis {

/**
 * @brief Process-level knobs. Dataset behavior lives in the manifest, not here.
 */
struct EngineConfig {
    std::string dataset_dir;                       // CADIS_DATASET_DIR
    Logger::Level log_level = Logger::Level::Info; // CADIS_LOG_LEVEL
    double boundary_epsilon = 1e-9;                // CADIS_BOUNDARY_EPSILON (degrees)
    size_t grid_target_per_cell = 4;               // CADIS_GRID_TARGET_PER_CELL

    /**
     * @brief Build a config from CADIS_* environment variables, keeping defaults
     *        for unset or unparsable values.
     */
    CADIS_API static EngineConfig from_env();

    /**
     * @brief Push the log threshold to the global logger.
     */
    void apply_logging() const { Logger::set_threshold(log_level); }
};

} // namespace Cadis
