#ifndef ANNOTATION_HPP
#define ANNOTATION_HPP

#include <set>
#include <string>
#include "manifest.hpp"
#include "phase.hpp"

namespace Hookstage {

/**
 * @brief Default metadata annotation that binds a manifest to phases.
 */
extern const char* const defaultHookAnnotation;

/**
 * @brief How an annotation entry outside the closed phase set is handled.
 */
enum class PhasePolicy
{
    Permissive, // warn, skip the entry, keep the valid ones
    Strict      // fail extraction with UnrecognizedPhase
};

/**
 * @brief Parses "permissive" or "strict".
 * @throws HookError (ConfigError) for any other value.
 */
PhasePolicy parsePhasePolicy(const std::string& value);

/**
 * @brief Returns "permissive" or "strict".
 */
std::string phasePolicyName(PhasePolicy policy);

/**
 * @class AnnotationExtractor
 * @brief Reads the phase annotation of rendered manifests.
 */
class AnnotationExtractor
{
public:
    explicit AnnotationExtractor(std::string annotationKey = defaultHookAnnotation,
                                 PhasePolicy policy = PhasePolicy::Permissive);

    /**
     * @brief Returns the phases a manifest is bound to.
     *
     * Reads metadata.annotations[<key>], splits it on commas, trims each entry
     * and matches it case-sensitively. A missing or empty annotation yields an
     * empty set.
     *
     * @throws HookError (UnrecognizedPhase) under the strict policy when an
     *         entry is not a known phase.
     */
    std::set<Phase> extract(const Manifest& manifest) const;

    /**
     * @brief Same as extract(), applied to a bare annotation value.
     *
     * @param value   The comma-separated annotation value.
     * @param subject Name used in warnings and errors.
     */
    std::set<Phase> parseValue(const std::string& value, const std::string& subject) const;

    /**
     * @brief Renders a phase set as a canonical annotation value,
     *        e.g. "pre-install,post-upgrade".
     */
    static std::string format(const std::set<Phase>& phases);

    const std::string& annotationKey() const { return annotationKey_; }
    PhasePolicy policy() const { return policy_; }

private:
    std::string annotationKey_;
    PhasePolicy policy_;
};

} // namespace Hookstage

#endif // ANNOTATION_HPP
