#ifndef LIFECYCLE_HPP
#define LIFECYCLE_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "annotation.hpp"
#include "applier.hpp"
#include "errors.hpp"
#include "hook.hpp"
#include "manifest.hpp"
#include "phase.hpp"
#include "phase_executor.hpp"

namespace Hookstage {

/**
 * @brief Outcome of the caller's non-hook step.
 */
struct StepResult
{
    bool success = true;
    std::string reason;

    static StepResult ok() { return {true, ""}; }
    static StepResult failure(const std::string& reason) { return {false, reason}; }
};

/**
 * @brief Outcome of one release operation.
 */
struct OperationResult
{
    Operation operation = Operation::Install;
    bool success = true;
    std::optional<Phase> failedPhase;          // Set when a hook phase failed
    std::string failedHook;                    // Set when a hook failed
    HookErrorKind error = HookErrorKind::None; // PhaseAborted, MainActionFailed, ...
    HookErrorKind cause = HookErrorKind::None; // Underlying hook error, if any
    std::string reason;

    /**
     * @brief Single-line summary naming operation, phase and hook, e.g.
     *        "install failed: phase pre-install aborted: hook 'Job/migrate' ...".
     */
    std::string describe() const;
};

/**
 * @class LifecycleCoordinator
 * @brief Drives one release operation: pre-phase hooks, then the caller's
 *        main step, then post-phase hooks. Any failure stops everything
 *        downstream of it.
 */
class LifecycleCoordinator
{
public:
    using PhaseAction = std::function<PhaseResult(Phase)>;
    using MainAction = std::function<StepResult()>;
    using ResourceAction = std::function<StepResult(const std::vector<Manifest>&)>;

    LifecycleCoordinator(Applier& applier,
                         AnnotationExtractor extractor = AnnotationExtractor(),
                         ExecutorOptions options = ExecutorOptions());

    /**
     * @brief Runs `pre → main → post` for an operation.
     *
     * The pre and post actions are handed the operation's phases from
     * PhaseRegistry. If the pre action fails, neither `main` nor `post` is
     * invoked; if `main` fails, `post` is not invoked.
     */
    static OperationResult perform(Operation operation,
                                   const PhaseAction& prePhaseAction,
                                   const MainAction& mainAction,
                                   const PhaseAction& postPhaseAction);

    /**
     * @brief Runs a release operation over a flattened manifest sequence.
     *
     * Assembles the HookSet, runs the operation's pre-phase hooks, hands the
     * ordinary (non-hook) manifests to `mainAction`, then runs the post-phase
     * hooks.
     */
    OperationResult perform(Operation operation,
                            const std::vector<Manifest>& manifests,
                            const ResourceAction& mainAction);

    const AnnotationExtractor& extractor() const { return extractor_; }

private:
    Applier& applier_;
    AnnotationExtractor extractor_;
    ExecutorOptions options_;
};

} // namespace Hookstage

#endif // LIFECYCLE_HPP
