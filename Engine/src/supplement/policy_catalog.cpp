#include <supplement/policy_catalog.hpp>
#include <supplement/policies.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace Cadis {

using json = nlohmann::json;

namespace {

void check_keys(const json& entry, std::initializer_list<const char*> allowed,
                const std::string& policy, const std::string& dir) {
    for (auto& [key, value] : entry.items()) {
        (void)value;
        bool ok = false;
        for (const char* a : allowed) ok = ok || key == a;
        if (!ok) {
            throw ManifestError(dir, "policy " + policy + " has unsupported parameter '" + key + "'");
        }
    }
}

std::string policy_name(const json& entry) {
    return entry.value("name", "");
}

std::optional<double> positive_km(const json& entry, const char* field, const std::string& dir) {
    auto it = entry.find(field);
    if (it == entry.end() || it->is_null()) return std::nullopt;
    if (!it->is_number() || !(it->get<double>() > 0.0)) {
        throw ManifestError(dir, "policy " + policy_name(entry) + "." + field + " must be a number > 0");
    }
    return it->get<double>();
}

PolicyParams parse_link_repair(const json& entry, const std::string& dir) {
    check_keys(entry, {"name"}, policy_name(entry), dir);
    return ParentLinkRepairParams{};
}

PolicyParams parse_normalize(const json& entry, const std::string& dir) {
    check_keys(entry, {"name"}, policy_name(entry), dir);
    return NameNormalizeParams{};
}

PolicyParams parse_parent_fill(const json& entry, const std::string& dir) {
    const std::string name = policy_name(entry);
    check_keys(entry, {"name", "file", "parent_level", "child_levels"}, name, dir);

    ParentFillParams p;
    auto file = entry.find("file");
    if (file == entry.end() || !file->is_string() || file->get<std::string>().empty()) {
        throw ManifestError(dir, "policy " + name + ".file must be a non-empty string");
    }
    p.file = file->get<std::string>();

    auto parent = entry.find("parent_level");
    if (parent == entry.end() || !parent->is_number_integer()) {
        throw ManifestError(dir, "policy " + name + ".parent_level must be an integer");
    }
    p.parent_level = parent->get<int>();

    auto children = entry.find("child_levels");
    if (children == entry.end() || !children->is_array() || children->empty()) {
        throw ManifestError(dir, "policy " + name + ".child_levels must be a non-empty list");
    }
    for (const auto& c : *children) {
        if (!c.is_number_integer()) {
            throw ManifestError(dir, "policy " + name + ".child_levels entries must be integers");
        }
        p.child_levels.push_back(c.get<int>());
    }
    std::sort(p.child_levels.begin(), p.child_levels.end());
    p.child_levels.erase(std::unique(p.child_levels.begin(), p.child_levels.end()), p.child_levels.end());
    return p;
}

PolicyParams parse_nearest_centroid(const json& entry, const std::string& dir) {
    check_keys(entry, {"name", "max_distance_km", "within_parent"}, policy_name(entry), dir);

    NearestCentroidParams p;
    p.max_distance_km = positive_km(entry, "max_distance_km", dir);
    auto within = entry.find("within_parent");
    if (within != entry.end()) {
        if (!within->is_boolean()) {
            throw ManifestError(dir, "policy nearest_centroid_fill.within_parent must be boolean");
        }
        p.within_parent = within->get<bool>();
    }
    return p;
}

PolicyParams parse_nearby(const json& entry, const std::string& dir) {
    check_keys(entry, {"name", "max_distance_km"}, policy_name(entry), dir);

    NearbyFallbackParams p;
    if (auto km = positive_km(entry, "max_distance_km", dir)) p.max_distance_km = *km;
    return p;
}

PolicyParams parse_localize(const json& entry, const std::string& dir) {
    check_keys(entry, {"name", "name_fields"}, policy_name(entry), dir);

    LocalizeNamesParams p;
    auto fields = entry.find("name_fields");
    if (fields != entry.end()) {
        if (!fields->is_array() || fields->empty()) {
            throw ManifestError(dir, "policy localize_names.name_fields must be a non-empty list");
        }
        for (const auto& f : *fields) {
            if (!f.is_string() || f.get<std::string>().empty()) {
                throw ManifestError(dir, "policy localize_names.name_fields entries must be non-empty strings");
            }
            p.name_fields.push_back(f.get<std::string>());
        }
    }
    return p;
}

PolicyParams parse_override(const json& entry, const std::string& dir) {
    check_keys(entry, {"name", "file"}, policy_name(entry), dir);

    auto file = entry.find("file");
    if (file == entry.end() || !file->is_string() || file->get<std::string>().empty()) {
        throw ManifestError(dir, "policy name_override.file must be a non-empty string");
    }
    return NameOverrideParams{file->get<std::string>()};
}

} // namespace

const std::vector<PolicyDescriptor>& policy_catalog() {
    static const std::vector<PolicyDescriptor> catalog = {
        {"parent_link_repair",    PolicyKind::ParentLinkRepair,    parse_link_repair,      Policies::compile_none,           Policies::parent_link_repair},
        {"hierarchy_parent_fill", PolicyKind::HierarchyParentFill, parse_parent_fill,      Policies::compile_admin_tree,     Policies::parent_fill},
        {"anchor_repair",         PolicyKind::AnchorRepair,        parse_parent_fill,      Policies::compile_anchor_map,     Policies::parent_fill},
        {"nearest_centroid_fill", PolicyKind::NearestCentroidFill, parse_nearest_centroid, Policies::compile_none,           Policies::nearest_centroid_fill},
        {"nearby_fallback",       PolicyKind::NearbyFallback,      parse_nearby,           Policies::compile_none,           Policies::nearby_fallback},
        {"name_normalize",        PolicyKind::NameNormalize,       parse_normalize,        Policies::compile_none,           Policies::name_normalize},
        {"localize_names",        PolicyKind::LocalizeNames,       parse_localize,         Policies::compile_none,           Policies::localize_names},
        {"name_override",         PolicyKind::NameOverride,        parse_override,         Policies::compile_name_overrides, Policies::name_override},
    };
    return catalog;
}

const PolicyDescriptor* find_policy(const std::string& name) {
    for (const auto& d : policy_catalog()) {
        if (name == d.name) return &d;
    }
    return nullptr;
}

const PolicyDescriptor& descriptor_for(PolicyKind kind) {
    for (const auto& d : policy_catalog()) {
        if (d.kind == kind) return d;
    }
    // Every enumerator has a catalog row.
    throw std::logic_error("policy kind missing from catalog");
}

std::optional<std::string> PolicySpec::resource_file() const {
    if (const auto* fill = std::get_if<ParentFillParams>(&params)) return fill->file;
    if (const auto* overlay = std::get_if<NameOverrideParams>(&params)) return overlay->file;
    return std::nullopt;
}

PolicySpec parse_policy(const json& raw, const std::string& dataset_dir) {
    json entry;
    if (raw.is_string()) {
        entry = json{{"name", raw.get<std::string>()}};
    } else if (raw.is_object()) {
        entry = raw;
    } else {
        throw ManifestError(dataset_dir, "policies entries must be objects or names");
    }

    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string() || name->get<std::string>().empty()) {
        throw ManifestError(dataset_dir, "policy entry has no name");
    }

    const PolicyDescriptor* descriptor = find_policy(name->get<std::string>());
    if (!descriptor) {
        throw UnknownPolicyError(dataset_dir, name->get<std::string>());
    }

    PolicySpec spec;
    spec.kind = descriptor->kind;
    spec.name = descriptor->name;
    spec.params = descriptor->parse(entry, dataset_dir);
    return spec;
}

} // namespace Cadis
