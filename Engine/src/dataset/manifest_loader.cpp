#include <dataset/manifest.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace Cadis {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trimmed(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string require_string(const json& obj, const char* field, const std::string& dir) {
    auto it = obj.find(field);
    if (it == obj.end() || !it->is_string()) {
        throw ManifestError(dir, std::string(field) + " is required and must be a string");
    }
    std::string value = trimmed(it->get<std::string>());
    if (value.empty()) {
        throw ManifestError(dir, std::string(field) + " must not be empty");
    }
    return value;
}

std::string optional_string(const json& obj, const char* field, const std::string& dir) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw ManifestError(dir, std::string(field) + " must be a string when present");
    }
    return trimmed(it->get<std::string>());
}

void require_readable(const fs::path& root, const std::string& rel, const std::string& what,
                      const std::string& dir) {
    if (!ManifestLoader::is_safe_relative_path(rel)) {
        throw ManifestError(dir, what + " '" + rel + "' must be a relative path within the dataset root");
    }
    const fs::path path = root / rel;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ManifestError(dir, what + " '" + rel + "' does not exist");
    }
    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        throw ManifestError(dir, what + " '" + rel + "' is not readable");
    }
}

LevelSpec parse_level(const json& entry, size_t idx, const std::string& dir) {
    const std::string where = "levels[" + std::to_string(idx) + "]";
    if (!entry.is_object()) {
        throw ManifestError(dir, where + " must be an object");
    }

    LevelSpec spec;
    auto level = entry.find("level");
    if (level == entry.end() || !level->is_number_integer()) {
        throw ManifestError(dir, where + ".level must be an integer");
    }
    spec.level = level->get<int>();

    spec.label = optional_string(entry, "label", dir);
    if (spec.label.empty()) spec.label = "level_" + std::to_string(spec.level);

    auto geometry = entry.find("geometry");
    if (geometry == entry.end() || !geometry->is_string() || trimmed(geometry->get<std::string>()).empty()) {
        throw ManifestError(dir, where + ".geometry must be a non-empty string");
    }
    spec.geometry = trimmed(geometry->get<std::string>());

    auto parent = entry.find("parent_level");
    if (parent != entry.end() && !parent->is_null()) {
        if (!parent->is_number_integer()) {
            throw ManifestError(dir, where + ".parent_level must be an integer when present");
        }
        spec.parent_level = parent->get<int>();
    }
    return spec;
}

LocaleSpec parse_locale(const json& raw, const std::string& dir) {
    LocaleSpec locale;
    auto it = raw.find("locale");
    if (it == raw.end() || it->is_null()) return locale;
    if (!it->is_object()) {
        throw ManifestError(dir, "locale must be an object when present");
    }

    auto fields = it->find("name_fields");
    if (fields != it->end()) {
        if (!fields->is_array() || fields->empty()) {
            throw ManifestError(dir, "locale.name_fields must be a non-empty list");
        }
        locale.name_fields.clear();
        for (const auto& f : *fields) {
            if (!f.is_string() || f.get<std::string>().empty()) {
                throw ManifestError(dir, "locale.name_fields entries must be non-empty strings");
            }
            locale.name_fields.push_back(f.get<std::string>());
        }
    }

    std::string order = optional_string(*it, "summary_order", dir);
    if (order == "fine_to_coarse") {
        locale.summary_order = SummaryOrder::FineToCoarse;
    } else if (!order.empty() && order != "coarse_to_fine") {
        throw ManifestError(dir, "locale.summary_order must be coarse_to_fine or fine_to_coarse");
    }

    auto sep = it->find("summary_separator");
    if (sep != it->end()) {
        if (!sep->is_string()) {
            throw ManifestError(dir, "locale.summary_separator must be a string");
        }
        // Not trimmed: an empty separator is legitimate for CJK addresses.
        locale.summary_separator = sep->get<std::string>();
    }
    return locale;
}

void validate_policy_levels(const DatasetManifest& manifest, const std::string& dir) {
    for (const auto& policy : manifest.policies) {
        const auto* fill = std::get_if<ParentFillParams>(&policy.params);
        if (!fill) continue;

        if (!manifest.find_level(fill->parent_level)) {
            throw ManifestError(dir, policy.name + ".parent_level " + std::to_string(fill->parent_level) +
                                " is not a declared level");
        }
        for (int child : fill->child_levels) {
            if (!manifest.find_level(child)) {
                throw ManifestError(dir, policy.name + ".child_levels contains undeclared level " +
                                    std::to_string(child));
            }
            if (child <= fill->parent_level) {
                throw ManifestError(dir, policy.name + ".child_levels must be below parent_level");
            }
        }
    }
}

} // namespace

bool ManifestLoader::is_safe_relative_path(const std::string& path) {
    if (path.empty()) return false;
    const fs::path p(path);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

DatasetManifest ManifestLoader::parse(const fs::path& dataset_dir) {
    const std::string dir = dataset_dir.string();
    const fs::path path = dataset_dir / kManifestFile;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ManifestError(dir, std::string(kManifestFile) + " is missing");
    }

    std::ifstream file(path);
    if (!file) {
        throw ManifestError(dir, std::string(kManifestFile) + " is not readable");
    }

    json raw;
    try {
        raw = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ManifestError(dir, std::string(kManifestFile) + " is malformed JSON: " + e.what());
    }
    if (!raw.is_object()) {
        throw ManifestError(dir, std::string(kManifestFile) + " must be a JSON object");
    }

    DatasetManifest manifest;
    manifest.dataset_dir = dataset_dir;
    manifest.dataset_id = require_string(raw, "dataset_id", dir);
    manifest.version = require_string(raw, "version", dir);
    manifest.checksum = require_string(raw, "checksum", dir);

    manifest.country_iso2 = optional_string(raw, "country_iso2", dir);
    std::transform(manifest.country_iso2.begin(), manifest.country_iso2.end(),
                   manifest.country_iso2.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    manifest.country_name = optional_string(raw, "country_name", dir);
    if (manifest.country_name.empty()) {
        manifest.country_name = !manifest.country_iso2.empty() ? manifest.country_iso2 : manifest.dataset_id;
    }

    manifest.locale = parse_locale(raw, dir);

    // Levels
    auto levels = raw.find("levels");
    if (levels == raw.end() || !levels->is_array() || levels->empty()) {
        throw ManifestError(dir, "levels must be a non-empty list");
    }
    for (size_t i = 0; i < levels->size(); ++i) {
        LevelSpec spec = parse_level((*levels)[i], i, dir);
        if (!manifest.levels.empty() && spec.level <= manifest.levels.back().level) {
            throw ManifestError(dir, "level numbers must be unique and strictly increasing (level " +
                                std::to_string(spec.level) + " follows " +
                                std::to_string(manifest.levels.back().level) + ")");
        }
        if (spec.parent_level) {
            if (*spec.parent_level >= spec.level || !manifest.find_level(*spec.parent_level)) {
                throw ManifestError(dir, "levels[" + std::to_string(i) + "].parent_level must name a declared level above it");
            }
        }
        manifest.levels.push_back(std::move(spec));
    }

    std::set<std::string> geometry_files;
    for (const auto& spec : manifest.levels) {
        require_readable(dataset_dir, spec.geometry, "geometry for level " + std::to_string(spec.level), dir);
        if (!geometry_files.insert(spec.geometry).second) {
            throw ManifestError(dir, "geometry file '" + spec.geometry + "' is declared by more than one level");
        }
    }

    // Policies
    auto policies = raw.find("policies");
    if (policies != raw.end() && !policies->is_null()) {
        if (!policies->is_array()) {
            throw ManifestError(dir, "policies must be a list when present");
        }
        for (const auto& entry : *policies) {
            manifest.policies.push_back(parse_policy(entry, dir));
        }
    }
    validate_policy_levels(manifest, dir);

    for (const auto& policy : manifest.policies) {
        if (auto file = policy.resource_file()) {
            require_readable(dataset_dir, *file, "resource for policy " + policy.name, dir);
        }
    }

    Logger::info("Manifest " + manifest.dataset_id + "@" + manifest.version + ": " +
                 std::to_string(manifest.levels.size()) + " levels, " +
                 std::to_string(manifest.policies.size()) + " policies");
    return manifest;
}

} // namespace Cadis
