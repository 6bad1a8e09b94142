/*******************************************************
 * annotation.cpp
 *
 * Extracts lifecycle-phase bindings from the metadata
 * annotations of rendered manifests.
 *******************************************************/

#include "annotation.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace Hookstage {

const char* const defaultHookAnnotation = "hookstage.io/hook";

PhasePolicy parsePhasePolicy(const std::string& value)
{
    if (value == "permissive") {
        return PhasePolicy::Permissive;
    }
    if (value == "strict") {
        return PhasePolicy::Strict;
    }
    throw HookError(HookErrorKind::ConfigError,
                    "Unknown phase policy '" + value + "' (expected 'permissive' or 'strict')");
}

std::string phasePolicyName(PhasePolicy policy)
{
    return policy == PhasePolicy::Strict ? "strict" : "permissive";
}

AnnotationExtractor::AnnotationExtractor(std::string annotationKey, PhasePolicy policy)
    : annotationKey_(std::move(annotationKey)), policy_(policy)
{
}

std::set<Phase> AnnotationExtractor::extract(const Manifest& manifest) const
{
    const YAML::Node& root = manifest.node;
    if (!root.IsMap()) {
        return {};
    }

    const YAML::Node metadata = root["metadata"];
    if (!metadata || !metadata.IsMap()) {
        return {};
    }
    const YAML::Node annotations = metadata["annotations"];
    if (!annotations || !annotations.IsMap()) {
        return {};
    }
    const YAML::Node value = annotations[annotationKey_];
    if (!value || !value.IsScalar()) {
        return {};
    }

    return parseValue(value.Scalar(), manifest.displayName());
}

std::set<Phase> AnnotationExtractor::parseValue(const std::string& value,
                                                const std::string& subject) const
{
    std::set<Phase> phases;

    for (const auto& entry : splitAndTrim(value, ',')) {
        std::optional<Phase> phase = PhaseRegistry::parsePhase(entry);
        if (phase) {
            phases.insert(*phase);
            continue;
        }

        if (policy_ == PhasePolicy::Strict) {
            throw HookError(HookErrorKind::UnrecognizedPhase,
                            "Manifest " + subject + " declares unrecognized phase '" +
                            entry + "' in " + annotationKey_);
        }
        log_warning("Ignoring unrecognized phase '" + entry + "' on " + subject);
    }

    return phases;
}

std::string AnnotationExtractor::format(const std::set<Phase>& phases)
{
    std::vector<std::string> names;
    for (Phase phase : phases) {
        names.push_back(PhaseRegistry::phaseName(phase));
    }
    return join(names, ",");
}

} // namespace Hookstage
