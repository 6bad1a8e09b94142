#ifndef READINESS_HPP
#define READINESS_HPP

#include <string>
#include <variant>
#include <yaml-cpp/yaml.h>

namespace Hookstage {

/**
 * @brief Readiness of one hook resource. Ready and Failed are terminal.
 */
enum class ReadinessState
{
    Pending,
    Ready,
    Failed
};

/**
 * @brief Returns "Pending", "Ready" or "Failed".
 */
const char* readinessStateName(ReadinessState state);

/**
 * @brief A readiness verdict plus the reason behind a failure.
 */
struct Readiness
{
    ReadinessState state = ReadinessState::Pending;
    std::string reason;
};

/**
 * @brief Kinds that run to completion (Job). Ready only once the observed
 *        status reports a Complete condition, Failed on a Failed condition.
 */
struct RunToCompletionKind
{
    std::string name;

    static constexpr bool polled = true;
    Readiness evaluate(const YAML::Node& observedState) const;
};

/**
 * @brief Every other kind. Ready as soon as the submission was accepted.
 */
struct GenericKind
{
    std::string name;

    static constexpr bool polled = false;
    Readiness evaluate(const YAML::Node& observedState) const;
};

using ResourceKind = std::variant<RunToCompletionKind, GenericKind>;

/**
 * @class ReadinessEvaluator
 * @brief Decides, per resource kind, whether a hook resource is ready.
 */
class ReadinessEvaluator
{
public:
    /**
     * @brief Maps a manifest kind string onto the closed set of kind variants.
     *        Matching is case-sensitive; unknown kinds fall back to GenericKind.
     */
    static ResourceKind classify(const std::string& kind);

    /**
     * @brief True if readiness of this kind must be observed by polling.
     */
    static bool requiresPolling(const ResourceKind& kind);

    /**
     * @brief Evaluates an accepted resource against its observed state.
     *
     * @param kind          The classified resource kind.
     * @param observedState The status node reported by the applier; may be
     *                      null or undefined before the resource reports one.
     */
    static Readiness evaluate(const ResourceKind& kind, const YAML::Node& observedState);

    static Readiness evaluate(const std::string& kind, const YAML::Node& observedState);

    /**
     * @brief Verdict for a submission the applier rejected, whatever the kind.
     */
    static Readiness rejected(const std::string& error);
};

} // namespace Hookstage

#endif // READINESS_HPP
