#include <supplement/policies.hpp>
#include <core/errors.hpp>
#include <geometry/geo_distance.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <limits>

namespace Cadis::Policies {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json read_resource(const PolicySpec& spec, const fs::path& dataset_dir) {
    const std::string rel = spec.resource_file().value_or("");
    std::ifstream file(dataset_dir / rel);
    if (!file) {
        throw DatasetLoadError(dataset_dir.string(), spec.name + " resource '" + rel + "' cannot be opened");
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw DatasetLoadError(dataset_dir.string(),
                               spec.name + " resource '" + rel + "' is not valid JSON: " + e.what());
    }
}

HierarchyNode node_from_feature(const AdminFeature& f, const char* source) {
    HierarchyNode node;
    node.level = f.level;
    node.name = f.name;
    node.id = f.id;
    node.source = source;
    node.parent_id = f.parent_id;
    return node;
}

std::string json_id(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return {};
}

} // namespace

std::string normalize_display_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool pending_space = false;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Resource compilers
// ---------------------------------------------------------------------------

PolicyResource compile_none(const PolicySpec&, const fs::path&) {
    return std::monostate{};
}

/**
 * Admin tree: {"nodes": [{"id", "level", "name", "parent_id"}, ...]}.
 * Produces child name -> ancestor at parent_level, for children at child_levels.
 */
PolicyResource compile_admin_tree(const PolicySpec& spec, const fs::path& dataset_dir) {
    const auto& params = std::get<ParentFillParams>(spec.params);
    const json raw = read_resource(spec, dataset_dir);

    auto nodes = raw.find("nodes");
    if (nodes == raw.end() || !nodes->is_array()) {
        throw DatasetLoadError(dataset_dir.string(), spec.name + " resource needs a 'nodes' list");
    }

    struct TreeNode {
        int level;
        std::string name;
        std::string parent_id;
    };
    std::unordered_map<std::string, TreeNode> tree;
    std::vector<std::string> order;
    for (const auto& n : *nodes) {
        if (!n.is_object()) continue;
        std::string id = json_id(n.value("id", json()));
        auto level = n.find("level");
        if (id.empty() || level == n.end() || !level->is_number_integer()) continue;
        TreeNode node{level->get<int>(), n.value("name", ""), json_id(n.value("parent_id", json()))};
        if (tree.emplace(id, node).second) order.push_back(id);
    }

    auto is_child_level = [&](int level) {
        for (int c : params.child_levels) if (c == level) return true;
        return false;
    };

    NameAnchorTable table;
    for (const auto& id : order) {
        const TreeNode& child = tree.at(id);
        if (!is_child_level(child.level) || child.name.empty()) continue;

        // Walk up until the parent level is reached or the chain ends.
        std::string cursor = child.parent_id;
        for (size_t hops = 0; !cursor.empty() && hops < tree.size(); ++hops) {
            auto it = tree.find(cursor);
            if (it == tree.end() || it->second.level < params.parent_level) break;
            if (it->second.level == params.parent_level) {
                if (!it->second.name.empty()) table[child.name] = NameAnchor{cursor, it->second.name};
                break;
            }
            cursor = it->second.parent_id;
        }
    }

    Logger::debug(spec.name + ": " + std::to_string(table.size()) + " child names mapped");
    return table;
}

/**
 * Anchor map: {"anchors": {child_name: id | {"id", "name"}}, "canonical": {id: name}}.
 * Entries whose anchor name cannot be resolved are skipped.
 */
PolicyResource compile_anchor_map(const PolicySpec& spec, const fs::path& dataset_dir) {
    const json raw = read_resource(spec, dataset_dir);

    auto anchors = raw.find("anchors");
    if (anchors == raw.end() || !anchors->is_object()) {
        throw DatasetLoadError(dataset_dir.string(), spec.name + " resource needs an 'anchors' object");
    }

    std::unordered_map<std::string, std::string> canonical;
    auto canon = raw.find("canonical");
    if (canon != raw.end()) {
        if (!canon->is_object()) {
            throw DatasetLoadError(dataset_dir.string(), spec.name + " 'canonical' must be an object");
        }
        for (auto& [id, name] : canon->items()) {
            if (name.is_string() && !name.get<std::string>().empty()) canonical[id] = name.get<std::string>();
        }
    }

    NameAnchorTable table;
    size_t skipped = 0;
    for (auto& [child, anchor] : anchors->items()) {
        NameAnchor a;
        if (anchor.is_object()) {
            a.id = json_id(anchor.value("id", json()));
            a.name = anchor.value("name", "");
        } else {
            a.id = json_id(anchor);
        }
        if (a.name.empty()) {
            auto it = canonical.find(a.id);
            if (it != canonical.end()) a.name = it->second;
        }
        if (child.empty() || a.id.empty() || a.name.empty()) {
            ++skipped;
            continue;
        }
        table[child] = std::move(a);
    }

    if (skipped > 0) {
        Logger::warn(spec.name + ": skipped " + std::to_string(skipped) + " anchors without a resolvable name");
    }
    return table;
}

/**
 * Overlay: {"overlay_version": "...", "name_overrides_by_osm_id": {id: name}}.
 */
PolicyResource compile_name_overrides(const PolicySpec& spec, const fs::path& dataset_dir) {
    const json raw = read_resource(spec, dataset_dir);
    if (!raw.is_object()) {
        throw DatasetLoadError(dataset_dir.string(), spec.name + " resource must be an object");
    }
    for (auto& [key, value] : raw.items()) {
        (void)value;
        if (key != "overlay_version" && key != "name_overrides_by_osm_id") {
            throw DatasetLoadError(dataset_dir.string(), spec.name + " resource has unsupported key '" + key + "'");
        }
    }

    auto overrides = raw.find("name_overrides_by_osm_id");
    if (overrides == raw.end() || !overrides->is_object()) {
        throw DatasetLoadError(dataset_dir.string(), spec.name + " resource needs 'name_overrides_by_osm_id'");
    }

    NameOverrideTable table;
    for (auto& [id, name] : overrides->items()) {
        if (!name.is_string()) {
            throw DatasetLoadError(dataset_dir.string(), spec.name + " override for '" + id + "' must be a string");
        }
        std::string clean = normalize_display_name(name.get<std::string>());
        if (id.empty() || clean.empty()) {
            throw DatasetLoadError(dataset_dir.string(), spec.name + " overrides need non-empty ids and names");
        }
        table[id] = std::move(clean);
    }

    Logger::debug(spec.name + ": overlay " + raw.value("overlay_version", std::string("unversioned")) +
                  " with " + std::to_string(table.size()) + " overrides");
    return table;
}

// ---------------------------------------------------------------------------
// Hierarchy policies
// ---------------------------------------------------------------------------

DraftHierarchy parent_link_repair(DraftHierarchy draft, const PolicyContext& ctx) {
    // Finest first, so a parent filled from a hint can pass its own hint upward.
    for (size_t i = draft.entries.size(); i-- > 0;) {
        if (!draft.entries[i].node) continue;
        const HierarchyNode& child = *draft.entries[i].node;
        if (child.parent_id.empty()) continue;

        const AdminFeature* parent = ctx.index.find(child.parent_id);
        if (!parent || parent->level >= child.level) continue;

        DraftEntry* slot = draft.find(parent->level);
        if (slot && slot->is_hole()) {
            slot->node = node_from_feature(*parent, Source::ParentHint);
        }
    }

    for (size_t i = 0; i < draft.entries.size(); ++i) {
        if (!draft.entries[i].node) continue;
        HierarchyNode& child = *draft.entries[i].node;
        if (child.parent_id.empty()) continue;

        const HierarchyNode* expected = nullptr;
        if (const LevelSpec* spec = ctx.manifest.find_level(child.level); spec && spec->parent_level) {
            if (const DraftEntry* p = draft.find(*spec->parent_level); p && p->node) expected = &*p->node;
        }
        if (!expected) expected = draft.nearest_resolved_above(i);

        if (expected && expected->id != child.parent_id) {
            Logger::debug("link repair: " + child.id + " parent " + child.parent_id + " -> " + expected->id);
            child.parent_id = expected->id;
        }
    }
    return draft;
}

DraftHierarchy parent_fill(DraftHierarchy draft, const PolicyContext& ctx) {
    const auto& params = std::get<ParentFillParams>(ctx.spec.params);
    const auto* table = std::get_if<NameAnchorTable>(&ctx.resource);
    if (!table) return draft;

    DraftEntry* target = draft.find(params.parent_level);
    if (!target || !target->is_hole()) return draft;

    const char* source = ctx.spec.kind == PolicyKind::AnchorRepair ? Source::SemanticAnchor : Source::AdminTree;
    for (int level : params.child_levels) {
        const DraftEntry* child = draft.find(level);
        if (!child || !child->node || child->node->name.empty()) continue;

        auto it = table->find(child->node->name);
        if (it == table->end()) continue;

        HierarchyNode node;
        node.level = params.parent_level;
        node.name = it->second.name;
        node.id = it->second.id;
        node.source = source;
        target->node = std::move(node);
        break;
    }
    return draft;
}

DraftHierarchy nearest_centroid_fill(DraftHierarchy draft, const PolicyContext& ctx) {
    const auto& params = std::get<NearestCentroidParams>(ctx.spec.params);

    for (size_t i = 0; i < draft.entries.size(); ++i) {
        DraftEntry& entry = draft.entries[i];
        if (!entry.is_hole()) continue;

        const HierarchyNode* ancestor = draft.nearest_resolved_above(i);
        const AdminFeature* boundary = ancestor ? ctx.index.find(ancestor->id) : nullptr;
        if (params.within_parent && !boundary) continue;

        const AdminFeature* best = nullptr;
        double best_km = std::numeric_limits<double>::infinity();
        for (const AdminFeature* f : ctx.index.candidates_near(entry.level, draft.point, params.max_distance_km)) {
            if (boundary && !ctx.index.contains(*boundary, f->centroid)) continue;
            const double km = Geometry::haversine_km(draft.point, f->centroid);
            if (params.max_distance_km && km > *params.max_distance_km) continue;
            // Candidates arrive in id order, so strict < keeps the smaller id on ties.
            if (km < best_km) {
                best = f;
                best_km = km;
            }
        }
        if (best) entry.node = node_from_feature(*best, Source::NearestCentroid);
    }
    return draft;
}

DraftHierarchy nearby_fallback(DraftHierarchy draft, const PolicyContext& ctx) {
    const auto& params = std::get<NearbyFallbackParams>(ctx.spec.params);

    for (auto& entry : draft.entries) {
        if (!entry.is_hole()) continue;
        if (auto hit = ctx.index.nearest_boundary(entry.level, draft.point, params.max_distance_km)) {
            entry.node = node_from_feature(*hit->feature, Source::Nearby);
        }
    }
    return draft;
}

DraftHierarchy name_normalize(DraftHierarchy draft, const PolicyContext&) {
    for (auto& entry : draft.entries) {
        if (!entry.node) continue;
        std::string clean = normalize_display_name(entry.node->name);
        if (!clean.empty()) entry.node->name = std::move(clean);
    }
    return draft;
}

DraftHierarchy localize_names(DraftHierarchy draft, const PolicyContext& ctx) {
    const auto& params = std::get<LocalizeNamesParams>(ctx.spec.params);
    const auto& fields = params.name_fields.empty() ? ctx.manifest.locale.name_fields : params.name_fields;

    for (auto& entry : draft.entries) {
        if (!entry.node) continue;
        const AdminFeature* f = ctx.index.find(entry.node->id);
        if (!f) continue;
        if (const std::string* name = f->localized(fields)) entry.node->name = *name;
    }
    return draft;
}

DraftHierarchy name_override(DraftHierarchy draft, const PolicyContext& ctx) {
    const auto* table = std::get_if<NameOverrideTable>(&ctx.resource);
    if (!table) return draft;

    for (auto& entry : draft.entries) {
        if (!entry.node) continue;
        auto it = table->find(entry.node->id);
        if (it != table->end()) entry.node->name = it->second;
    }
    return draft;
}

} // namespace Cadis::Policies
