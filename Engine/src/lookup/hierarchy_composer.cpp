#include <lookup/hierarchy_composer.hpp>
#include <utils/logger.hpp>

namespace Cadis {

const HierarchyNode* HierarchyComposer::expected_parent(const DraftHierarchy& draft, size_t slot) const {
    const LevelSpec& spec = manifest_.levels[slot];
    if (spec.parent_level) {
        if (const DraftEntry* parent = draft.find(*spec.parent_level); parent && parent->node) {
            return &*parent->node;
        }
    }
    return draft.nearest_resolved_above(slot);
}

DraftHierarchy HierarchyComposer::resolve(const Geometry::Vec2& point) const {
    DraftHierarchy draft;
    draft.point = point;
    draft.entries.reserve(manifest_.levels.size());

    for (size_t slot = 0; slot < manifest_.levels.size(); ++slot) {
        const int level = manifest_.levels[slot].level;
        DraftEntry entry;
        entry.level = level;

        const auto candidates = index_.query(level, point);
        if (!candidates.empty()) {
            const AdminFeature* chosen = candidates.front();

            if (const HierarchyNode* parent = expected_parent(draft, slot)) {
                for (const AdminFeature* c : candidates) {
                    if (c->parent_id == parent->id) {
                        chosen = c;
                        break;
                    }
                }
            }

            if (candidates.size() > 1) {
                Logger::debug("Level " + std::to_string(level) + ": " + std::to_string(candidates.size()) +
                              " overlapping candidates, chose " + chosen->id);
            }

            HierarchyNode node;
            node.level = level;
            node.name = chosen->name;
            node.id = chosen->id;
            node.source = Source::Polygon;
            node.parent_id = chosen->parent_id;
            entry.node = std::move(node);
        }

        draft.entries.push_back(std::move(entry));
    }
    return draft;
}

} // namespace Cadis
