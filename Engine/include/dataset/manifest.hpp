#pragma once

#include <supplement/policy_catalog.hpp>
#include <export.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Cadis {

struct LevelSpec {
    int level = 0;
    std::string label;
    std::string geometry;               // dataset-relative GeoJSON path
    std::optional<int> parent_level;    // expected parent, always a lower declared level
};

enum class SummaryOrder {
    CoarseToFine,
    FineToCoarse
};

struct LocaleSpec {
    std::vector<std::string> name_fields{"name"};
    SummaryOrder summary_order = SummaryOrder::CoarseToFine;
    std::string summary_separator = ", ";
};

/**
 * @brief Declared structure of one regional dataset.
 *
 * Levels are unique and strictly increasing (coarsest first).
 */
struct DatasetManifest {
    std::filesystem::path dataset_dir;
    std::string dataset_id;
    std::string version;
    std::string checksum;
    std::string country_iso2;
    std::string country_name;
    LocaleSpec locale;
    std::vector<LevelSpec> levels;
    std::vector<PolicySpec> policies;

    const LevelSpec* find_level(int level) const {
        for (const auto& spec : levels) {
            if (spec.level == level) return &spec;
        }
        return nullptr;
    }

    std::vector<int> level_numbers() const {
        std::vector<int> out;
        out.reserve(levels.size());
        for (const auto& spec : levels) out.push_back(spec.level);
        return out;
    }
};

class ManifestLoader {
public:
    static constexpr const char* kManifestFile = "dataset_manifest.json";

    /**
     * @brief Parse and validate `<dataset_dir>/dataset_manifest.json`.
     *
     * Checks field types, level ordering, the policy catalog, and that every
     * declared geometry and policy resource file exists and is readable.
     *
     * @throws ManifestError, UnknownPolicyError
     */
    CADIS_API static DatasetManifest parse(const std::filesystem::path& dataset_dir);

    /// Relative, non-empty, and free of "..".
    CADIS_API static bool is_safe_relative_path(const std::string& path);
};

} // namespace Cadis
