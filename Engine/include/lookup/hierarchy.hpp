#pragma once

#include <geometry/geo_point.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cadis {

/// Where a node in the hierarchy came from.
namespace Source {
    constexpr const char* Polygon = "polygon";
    constexpr const char* ParentHint = "parent_hint";
    constexpr const char* AdminTree = "admin_tree_name";
    constexpr const char* SemanticAnchor = "semantic_anchor";
    constexpr const char* NearestCentroid = "nearest_centroid";
    constexpr const char* Nearby = "nearby";
}

struct HierarchyNode {
    int level = 0;
    std::string name;
    std::string id;          // osm_id
    int rank = -1;           // assigned once the hierarchy is final
    std::string source;
    std::string parent_id;   // parent-id hint after link repair, may be empty

    bool operator==(const HierarchyNode& o) const {
        return level == o.level && name == o.name && id == o.id && rank == o.rank &&
               source == o.source && parent_id == o.parent_id;
    }
    bool operator!=(const HierarchyNode& o) const { return !(*this == o); }
};

/**
 * @brief One slot per declared level, coarsest first. An empty slot is a hole.
 */
struct DraftEntry {
    int level = 0;
    std::optional<HierarchyNode> node;

    bool is_hole() const { return !node.has_value(); }

    bool operator==(const DraftEntry& o) const { return level == o.level && node == o.node; }
};

struct DraftHierarchy {
    Geometry::Vec2 point = Geometry::Vec2::Zero();   // (lon, lat)
    std::vector<DraftEntry> entries;

    DraftEntry* find(int level) {
        for (auto& e : entries) if (e.level == level) return &e;
        return nullptr;
    }
    const DraftEntry* find(int level) const {
        for (const auto& e : entries) if (e.level == level) return &e;
        return nullptr;
    }

    /// Closest resolved entry above slot `index`, or nullptr.
    const HierarchyNode* nearest_resolved_above(size_t index) const {
        for (size_t i = index; i-- > 0;) {
            if (entries[i].node) return &*entries[i].node;
        }
        return nullptr;
    }

    size_t hole_count() const {
        size_t n = 0;
        for (const auto& e : entries) n += e.is_hole() ? 1 : 0;
        return n;
    }
    size_t resolved_count() const { return entries.size() - hole_count(); }
    bool complete() const { return hole_count() == 0; }

    bool operator==(const DraftHierarchy& o) const { return point == o.point && entries == o.entries; }
};

enum class LookupStatus {
    Ok,
    Partial,
    NotFound
};

inline const char* to_string(LookupStatus status) {
    switch (status) {
        case LookupStatus::Ok:       return "ok";
        case LookupStatus::Partial:  return "partial";
        case LookupStatus::NotFound: return "not_found";
    }
    return "not_found";
}

struct IsoContext {
    std::string iso2;
    std::string name;

    bool operator==(const IsoContext& o) const { return iso2 == o.iso2 && name == o.name; }
};

struct HierarchyResult {
    std::vector<HierarchyNode> nodes;   // ascending level, rank 0..n-1
    LookupStatus status = LookupStatus::NotFound;
    IsoContext iso_context;
    std::string summary_text;
    std::string engine = "cadis";
    std::string dataset_id;
    std::string version;

    bool operator==(const HierarchyResult& o) const {
        return nodes == o.nodes && status == o.status && iso_context == o.iso_context &&
               summary_text == o.summary_text && engine == o.engine &&
               dataset_id == o.dataset_id && version == o.version;
    }
    bool operator!=(const HierarchyResult& o) const { return !(*this == o); }
};

} // namespace Cadis
