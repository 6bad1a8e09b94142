/*******************************************************
 * hook.cpp
 *
 * Sorts rendered manifests into hooks (indexed by the
 * phases they are bound to) and ordinary resources.
 *******************************************************/

#include "hook.hpp"
#include "utils.hpp"

namespace Hookstage {

namespace
{
    const std::vector<Hook> noHooks;
} // end anonymous namespace

/**
 * ==============================================================================
 * HookSet::assemble
 *
 * 1) Extract the phase set of every manifest.
 * 2) Empty set: ordinary resource, kept in input order.
 * 3) Otherwise: build a Hook and index it under each declared phase.
 *
 * Sub-package manifests arrive in the same sequence as the parent's and are
 * treated identically; a parent cannot opt them out.
 * ==============================================================================
 */
HookSet::Assembly HookSet::assemble(const std::vector<Manifest>& manifests,
                                    const AnnotationExtractor& extractor)
{
    Assembly assembly;

    for (const auto& manifest : manifests)
    {
        std::set<Phase> phases = extractor.extract(manifest);
        if (phases.empty())
        {
            assembly.resources.push_back(manifest);
            continue;
        }

        Hook hook;
        hook.manifest = manifest;
        hook.resourceKind = manifest.kind;
        hook.phases = phases;

        log_message("Found hook " + hook.name() + " (" + manifest.source + ") for phases: " +
                    AnnotationExtractor::format(phases));
        assembly.hooks.add(hook);
    }

    return assembly;
}

void HookSet::add(const Hook& hook)
{
    if (hook.phases.empty())
    {
        return;
    }

    // One independent copy per bucket
    for (Phase phase : hook.phases)
    {
        buckets_[phase].push_back(hook);
    }
    hookCount_++;
}

const std::vector<Hook>& HookSet::hooksFor(Phase phase) const
{
    auto it = buckets_.find(phase);
    if (it == buckets_.end())
    {
        return noHooks;
    }
    return it->second;
}

} // namespace Hookstage
