/**
 * @file policy_catalog.hpp
 * @brief Closed catalog of supplementation policies.
 *
 * A manifest names its policy chain by catalog name. Every catalog entry binds
 * a name to its kind, its parameter parser, its resource compiler and its
 * apply function; adding a policy means adding one row to that table.
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Cadis {

enum class PolicyKind {
    ParentLinkRepair,
    HierarchyParentFill,
    AnchorRepair,
    NearestCentroidFill,
    NearbyFallback,
    NameNormalize,
    LocalizeNames,
    NameOverride
};

struct ParentLinkRepairParams {};

/// Shared by hierarchy_parent_fill and anchor_repair: fill `parent_level` by child name.
struct ParentFillParams {
    std::string file;
    int parent_level = 0;
    std::vector<int> child_levels;   // ascending, deduplicated
};

struct NearestCentroidParams {
    std::optional<double> max_distance_km;
    bool within_parent = true;
};

struct NearbyFallbackParams {
    double max_distance_km = 2.0;
};

struct NameNormalizeParams {};

struct LocalizeNamesParams {
    std::vector<std::string> name_fields;   // empty: use the manifest locale
};

struct NameOverrideParams {
    std::string file;
};

using PolicyParams = std::variant<
    ParentLinkRepairParams,
    ParentFillParams,
    NearestCentroidParams,
    NearbyFallbackParams,
    NameNormalizeParams,
    LocalizeNamesParams,
    NameOverrideParams>;

struct PolicySpec {
    PolicyKind kind = PolicyKind::NameNormalize;
    std::string name;
    PolicyParams params;

    /// Dataset-relative resource file this policy reads, if any.
    CADIS_API std::optional<std::string> resource_file() const;
};

// ---------------------------------------------------------------------------
// Compiled resources, loaded once per snapshot
// ---------------------------------------------------------------------------

struct NameAnchor {
    std::string id;
    std::string name;
};

/// child display name -> parent anchor
using NameAnchorTable = std::unordered_map<std::string, NameAnchor>;

/// feature id -> display name
using NameOverrideTable = std::unordered_map<std::string, std::string>;

using PolicyResource = std::variant<std::monostate, NameAnchorTable, NameOverrideTable>;

struct DraftHierarchy;
struct PolicyContext;

using PolicyParseFn = PolicyParams (*)(const nlohmann::json& entry, const std::string& dataset_dir);
using PolicyCompileFn = PolicyResource (*)(const PolicySpec& spec, const std::filesystem::path& dataset_dir);
using PolicyApplyFn = DraftHierarchy (*)(DraftHierarchy draft, const PolicyContext& ctx);

struct PolicyDescriptor {
    const char* name;
    PolicyKind kind;
    PolicyParseFn parse;
    PolicyCompileFn compile;
    PolicyApplyFn apply;
};

/**
 * @brief Every recognized policy, in catalog order.
 */
CADIS_API const std::vector<PolicyDescriptor>& policy_catalog();

/// nullptr when `name` is not in the catalog.
CADIS_API const PolicyDescriptor* find_policy(const std::string& name);

CADIS_API const PolicyDescriptor& descriptor_for(PolicyKind kind);

/**
 * @brief Parse one manifest policy entry.
 *
 * @throws ManifestError for a missing name or malformed parameters
 * @throws UnknownPolicyError for a name outside the catalog
 */
CADIS_API PolicySpec parse_policy(const nlohmann::json& entry, const std::string& dataset_dir);

} // namespace Cadis
