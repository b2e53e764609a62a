#include <supplement/supplementation_pipeline.hpp>
#include <supplement/policies.hpp>
#include <utils/logger.hpp>

namespace Cadis {

SupplementationPipeline SupplementationPipeline::compile(const DatasetManifest& manifest) {
    SupplementationPipeline pipeline;
    pipeline.chain_.reserve(manifest.policies.size());

    for (const auto& spec : manifest.policies) {
        CompiledPolicy compiled;
        compiled.descriptor = &descriptor_for(spec.kind);
        compiled.spec = spec;
        compiled.resource = compiled.descriptor->compile(spec, manifest.dataset_dir);
        pipeline.chain_.push_back(std::move(compiled));
    }
    return pipeline;
}

bool SupplementationPipeline::preserves_resolved(const DraftHierarchy& before, const DraftHierarchy& after) {
    if (before.entries.size() != after.entries.size()) return false;

    for (size_t i = 0; i < before.entries.size(); ++i) {
        const DraftEntry& b = before.entries[i];
        const DraftEntry& a = after.entries[i];
        if (a.level != b.level) return false;
        if (a.node && a.node->level != a.level) return false;
        if (!b.node) continue;
        if (!a.node || a.node->id != b.node->id || a.node->source != b.node->source) return false;
    }
    return true;
}

DraftHierarchy SupplementationPipeline::run(DraftHierarchy draft, const Spatial::SpatialIndex& index,
                                            const DatasetManifest& manifest) const {
    for (const auto& policy : chain_) {
        PolicyContext ctx{policy.spec, policy.resource, index, manifest};
        DraftHierarchy next = policy.descriptor->apply(draft, ctx);

        if (!preserves_resolved(draft, next)) {
            Logger::error("Policy " + policy.spec.name + " altered resolved nodes; output discarded");
            continue;
        }
        draft = std::move(next);
    }
    return draft;
}

HierarchyResult SupplementationPipeline::finalize(const DraftHierarchy& draft) {
    HierarchyResult result;
    for (const auto& entry : draft.entries) {
        if (!entry.node) continue;
        HierarchyNode node = *entry.node;
        node.rank = static_cast<int>(result.nodes.size());
        result.nodes.push_back(std::move(node));
    }

    if (result.nodes.empty()) {
        result.status = LookupStatus::NotFound;
    } else if (!draft.complete()) {
        result.status = LookupStatus::Partial;
    } else {
        result.status = LookupStatus::Ok;
    }
    return result;
}

HierarchyResult SupplementationPipeline::apply(DraftHierarchy draft, const Spatial::SpatialIndex& index,
                                               const DatasetManifest& manifest) const {
    return finalize(run(std::move(draft), index, manifest));
}

} // namespace Cadis
