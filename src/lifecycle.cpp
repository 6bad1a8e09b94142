/*******************************************************
 * lifecycle.cpp
 *
 * Sequences one release operation:
 *   pre-phase hooks -> main step -> post-phase hooks
 * and turns the first failure into the operation result.
 *******************************************************/

#include "lifecycle.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>

namespace Hookstage {

namespace {
    OperationResult phaseFailure(Operation operation, const PhaseResult& phase)
    {
        OperationResult result;
        result.operation = operation;
        result.success = false;
        result.failedPhase = phase.phase;
        result.failedHook = phase.failedHook;
        result.error = HookErrorKind::PhaseAborted;
        result.cause = phase.error;
        result.reason = phase.reason;
        return result;
    }

    // Phase actions are caller-supplied; an escaping exception aborts the phase
    PhaseResult runPhaseAction(const LifecycleCoordinator::PhaseAction& action, Phase phase)
    {
        try {
            PhaseResult result = action(phase);
            result.phase = phase;
            return result;
        } catch (const std::exception& e) {
            PhaseResult result;
            result.phase = phase;
            result.success = false;
            result.error = HookErrorKind::PhaseAborted;
            result.reason = e.what();
            return result;
        }
    }
} // end anonymous namespace

std::string OperationResult::describe() const
{
    const std::string opName = PhaseRegistry::operationName(operation);
    if (success) {
        return opName + " succeeded";
    }

    std::string message = opName + " failed: ";
    if (failedPhase) {
        message += "phase " + PhaseRegistry::phaseName(*failedPhase) + " aborted: ";
        if (!failedHook.empty()) {
            message += "hook '" + failedHook + "' ";
        }
        message += std::string("failed [") + errorKindName(cause) + "]";
        if (!reason.empty()) {
            message += ": " + reason;
        }
        return message;
    }

    if (error == HookErrorKind::MainActionFailed) {
        message += "main step failed";
        if (!reason.empty()) {
            message += ": " + reason;
        }
        return message;
    }

    message += std::string("[") + errorKindName(error) + "] " + reason;
    return message;
}

LifecycleCoordinator::LifecycleCoordinator(Applier& applier,
                                           AnnotationExtractor extractor,
                                           ExecutorOptions options)
    : applier_(applier), extractor_(std::move(extractor)), options_(options)
{
}

OperationResult LifecycleCoordinator::perform(Operation operation,
                                              const PhaseAction& prePhaseAction,
                                              const MainAction& mainAction,
                                              const PhaseAction& postPhaseAction)
{
    const std::pair<Phase, Phase> phases = PhaseRegistry::phasesFor(operation);
    const std::string opName = PhaseRegistry::operationName(operation);

    OperationResult result;
    result.operation = operation;

    // -----------------------------------------------------------
    // Stage 1: pre-phase hooks
    // -----------------------------------------------------------
    PhaseResult pre = runPhaseAction(prePhaseAction, phases.first);
    if (!pre.success) {
        result = phaseFailure(operation, pre);
        log_error(result.describe());
        return result;
    }

    // -----------------------------------------------------------
    // Stage 2: the caller's own step
    // -----------------------------------------------------------
    StepResult mainStep;
    try {
        mainStep = mainAction();
    } catch (const std::exception& e) {
        mainStep = StepResult::failure(e.what());
    }
    if (!mainStep.success) {
        result.success = false;
        result.error = HookErrorKind::MainActionFailed;
        result.reason = mainStep.reason;
        log_error(result.describe());
        return result;
    }

    // -----------------------------------------------------------
    // Stage 3: post-phase hooks
    // -----------------------------------------------------------
    PhaseResult post = runPhaseAction(postPhaseAction, phases.second);
    if (!post.success) {
        result = phaseFailure(operation, post);
        log_error(result.describe());
        return result;
    }

    log_message(opName + " completed");
    return result;
}

OperationResult LifecycleCoordinator::perform(Operation operation,
                                              const std::vector<Manifest>& manifests,
                                              const ResourceAction& mainAction)
{
    HookSet::Assembly assembly;
    try {
        assembly = HookSet::assemble(manifests, extractor_);
    } catch (const HookError& e) {
        OperationResult result;
        result.operation = operation;
        result.success = false;
        result.error = e.kind();
        result.reason = e.what();
        log_error(result.describe());
        return result;
    }

    log_message(PhaseRegistry::operationName(operation) + ": " +
                std::to_string(assembly.hooks.size()) + " hook(s), " +
                std::to_string(assembly.resources.size()) + " resource(s)");

    // Hooks live only for the duration of this call
    PhaseExecutor executor(applier_, options_);
    const HookSet& hooks = assembly.hooks;
    const std::vector<Manifest>& resources = assembly.resources;

    auto runPhase = [&executor, &hooks](Phase phase) {
        return executor.run(phase, hooks);
    };
    auto runMain = [&mainAction, &resources]() {
        return mainAction(resources);
    };

    return perform(operation, runPhase, runMain, runPhase);
}

} // namespace Hookstage
