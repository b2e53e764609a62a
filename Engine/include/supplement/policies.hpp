#pragma once

#include <dataset/manifest.hpp>
#include <lookup/hierarchy.hpp>
#include <spatial/spatial_index.hpp>
#include <supplement/policy_catalog.hpp>
#include <export.hpp>
#include <filesystem>

namespace Cadis {

/**
 * @brief Read-only inputs handed to one policy application.
 */
struct PolicyContext {
    const PolicySpec& spec;
    const PolicyResource& resource;
    const Spatial::SpatialIndex& index;
    const DatasetManifest& manifest;
};

/**
 * Policy implementations. Each takes the draft by value and returns the
 * transformed draft; none keeps state between calls.
 */
namespace Policies {

CADIS_API DraftHierarchy parent_link_repair(DraftHierarchy draft, const PolicyContext& ctx);
CADIS_API DraftHierarchy parent_fill(DraftHierarchy draft, const PolicyContext& ctx);
CADIS_API DraftHierarchy nearest_centroid_fill(DraftHierarchy draft, const PolicyContext& ctx);
CADIS_API DraftHierarchy nearby_fallback(DraftHierarchy draft, const PolicyContext& ctx);
CADIS_API DraftHierarchy name_normalize(DraftHierarchy draft, const PolicyContext& ctx);
CADIS_API DraftHierarchy localize_names(DraftHierarchy draft, const PolicyContext& ctx);
CADIS_API DraftHierarchy name_override(DraftHierarchy draft, const PolicyContext& ctx);

CADIS_API PolicyResource compile_none(const PolicySpec& spec, const std::filesystem::path& dataset_dir);
CADIS_API PolicyResource compile_admin_tree(const PolicySpec& spec, const std::filesystem::path& dataset_dir);
CADIS_API PolicyResource compile_anchor_map(const PolicySpec& spec, const std::filesystem::path& dataset_dir);
CADIS_API PolicyResource compile_name_overrides(const PolicySpec& spec, const std::filesystem::path& dataset_dir);

/// Trim and collapse runs of whitespace to a single space.
CADIS_API std::string normalize_display_name(const std::string& name);

} // namespace Policies
} // namespace Cadis
