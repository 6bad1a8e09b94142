#ifndef HOOK_HPP
#define HOOK_HPP

#include <map>
#include <set>
#include <string>
#include <vector>
#include "annotation.hpp"
#include "manifest.hpp"
#include "phase.hpp"

namespace Hookstage {

/**
 * @struct Hook
 * @brief A rendered manifest bound to one or more lifecycle phases. Hooks are
 *        never part of the release's tracked resource set.
 */
struct Hook
{
    Manifest manifest;        // Source document, passed through to the applier
    std::string resourceKind; // e.g. "Job", "ConfigMap"
    std::set<Phase> phases;   // Every phase this manifest is bound to

    const std::string& rawManifest() const { return manifest.raw; }
    std::string name() const { return manifest.displayName(); }
};

/**
 * @class HookSet
 * @brief Hooks indexed by phase.
 *
 * Within a bucket hooks keep the order in which their manifests were
 * discovered. That order is what the executor follows, but it is not a
 * guarantee offered to package authors.
 */
class HookSet
{
public:
    /**
     * @brief Result of partitioning a manifest sequence.
     */
    struct Assembly;

    /**
     * @brief Partitions the flattened manifests of a package and all of its
     *        sub-packages into hooks and ordinary resources.
     *
     * Manifests with a non-empty phase set become hooks and are indexed under
     * every phase they declare. All other manifests are returned, in their
     * original order, as ordinary resources.
     *
     * @param manifests The rendered manifests, already flattened.
     * @param extractor Reads the phase annotation.
     * @throws HookError (UnrecognizedPhase) when the extractor is strict and a
     *         manifest declares an unknown phase.
     */
    static Assembly assemble(const std::vector<Manifest>& manifests,
                             const AnnotationExtractor& extractor);

    /**
     * @brief Indexes a hook under each of its phases.
     */
    void add(const Hook& hook);

    /**
     * @brief Returns the hooks bound to a phase (empty if none).
     */
    const std::vector<Hook>& hooksFor(Phase phase) const;

    /** Number of distinct hooks added (a hook in two phases counts once). */
    size_t size() const { return hookCount_; }

    bool empty() const { return hookCount_ == 0; }

private:
    std::map<Phase, std::vector<Hook>> buckets_;
    size_t hookCount_ = 0;
};

struct HookSet::Assembly
{
    HookSet hooks;
    std::vector<Manifest> resources; // Ordinary, tracked release resources
};

} // namespace Hookstage

#endif // HOOK_HPP
