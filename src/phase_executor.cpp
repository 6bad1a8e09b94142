/*******************************************************
 * phase_executor.cpp
 *
 * Submits the hooks of one lifecycle phase, serially,
 * and waits for each to become ready before moving on.
 *******************************************************/

#include "phase_executor.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace Hookstage {

using Clock = std::chrono::steady_clock;

namespace
{
    // Longest single sleep between two polls
    const std::chrono::milliseconds maxPollWait = std::chrono::hours(1);

    // now + timeout, clamped to the clock's range
    Clock::time_point deadlineAfter(Clock::time_point now, std::chrono::milliseconds timeout)
    {
        const auto headroom =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
        if (timeout >= headroom)
        {
            return Clock::time_point::max();
        }
        return now + std::chrono::duration_cast<Clock::duration>(timeout);
    }
} // end anonymous namespace

PhaseExecutor::PhaseExecutor(Applier& applier, ExecutorOptions options)
    : applier_(applier), options_(options)
{
}

bool PhaseExecutor::isCancelled() const
{
    return options_.cancellation && options_.cancellation->isCancelled();
}

/**
 * ==============================================================================
 * PhaseExecutor::run
 *
 * 1) Look up the hooks bound to the phase; none means success.
 * 2) Submit each hook and wait for a terminal readiness state.
 * 3) Stop at the first Failed hook and report it; later hooks are skipped.
 *
 * Hooks run in HookSet order, which is discovery order and nothing more.
 * ==============================================================================
 */
PhaseResult PhaseExecutor::run(Phase phase, const HookSet& hookSet)
{
    PhaseResult result;
    result.phase = phase;

    const std::string phaseName = PhaseRegistry::phaseName(phase);
    const std::vector<Hook>& hooks = hookSet.hooksFor(phase);
    if (hooks.empty())
    {
        return result;
    }

    log_message("Running " + phaseName + " hooks (" + std::to_string(hooks.size()) + " found)");

    for (size_t i = 0; i < hooks.size(); ++i)
    {
        const Hook& hook = hooks[i];
        log_message("  -> Executing hook (" + std::to_string(i + 1) + "/" +
                    std::to_string(hooks.size()) + "): " + hook.name());

        HookOutcome outcome = executeHook(hook);
        result.executed++;

        if (outcome.readiness.state == ReadinessState::Failed)
        {
            result.success = false;
            result.failedHook = hook.name();
            result.failedKind = hook.resourceKind;
            result.error = outcome.error;
            result.reason = outcome.readiness.reason;
            result.skipped = hooks.size() - (i + 1);

            log_error("Hook " + hook.name() + " failed in " + phaseName + " (" +
                      errorKindName(outcome.error) + "): " + outcome.readiness.reason);
            if (result.skipped > 0)
            {
                log_warning("Skipping " + std::to_string(result.skipped) +
                            " remaining " + phaseName + " hook(s)");
            }
            return result;
        }
    }

    log_message("Finished " + phaseName + " hooks");
    return result;
}

PhaseExecutor::HookOutcome PhaseExecutor::executeHook(const Hook& hook)
{
    HookOutcome outcome;

    if (isCancelled())
    {
        outcome.readiness = {ReadinessState::Failed, "operation cancelled before submission"};
        outcome.error = HookErrorKind::Cancelled;
        return outcome;
    }

    SubmitResult submission;
    try
    {
        submission = applier_.submit(hook.manifest);
    }
    catch (const std::exception& e)
    {
        submission.accepted = false;
        submission.error = e.what();
    }

    if (!submission.accepted)
    {
        std::string reason = submission.error.empty() ? "submission rejected" : submission.error;
        outcome.readiness = ReadinessEvaluator::rejected(reason);
        outcome.error = HookErrorKind::SubmissionFailed;
        return outcome;
    }

    // Accepted: Pending until the kind's readiness rule says otherwise
    ResourceKind kind = ReadinessEvaluator::classify(hook.resourceKind);
    if (!ReadinessEvaluator::requiresPolling(kind))
    {
        outcome.readiness = ReadinessEvaluator::evaluate(kind, YAML::Node());
        log_message("     " + hook.name() + " is " + readinessStateName(outcome.readiness.state));
        return outcome;
    }

    outcome = awaitReadiness(hook, kind, submission.handle);
    if (outcome.readiness.state == ReadinessState::Ready)
    {
        log_message("     " + hook.name() + " completed");
    }
    return outcome;
}

PhaseExecutor::HookOutcome PhaseExecutor::awaitReadiness(const Hook& hook,
                                                         const ResourceKind& kind,
                                                         const std::string& handle)
{
    HookOutcome outcome;
    const Clock::time_point deadline = deadlineAfter(Clock::now(), options_.timeout);
    std::string lastPollError;

    log_message("     Waiting for " + hook.name() + " to complete");

    while (true)
    {
        if (isCancelled())
        {
            outcome.readiness = {ReadinessState::Failed, "cancelled while waiting for " + hook.name()};
            outcome.error = HookErrorKind::Cancelled;
            return outcome;
        }

        try
        {
            Readiness readiness = ReadinessEvaluator::evaluate(kind, applier_.poll(handle));
            if (readiness.state == ReadinessState::Ready)
            {
                outcome.readiness = readiness;
                return outcome;
            }
            if (readiness.state == ReadinessState::Failed)
            {
                outcome.readiness = readiness;
                outcome.error = HookErrorKind::HookFailed;
                return outcome;
            }
        }
        catch (const std::exception& e)
        {
            // Status reads are retried until the deadline; the hook itself is not
            lastPollError = e.what();
            log_warning("     Could not read status of " + hook.name() + ": " + lastPollError);
        }

        Clock::time_point now = Clock::now();
        if (now >= deadline)
        {
            std::string reason = "timed out after " + std::to_string(options_.timeout.count()) +
                                 "ms waiting for " + hook.name();
            if (!lastPollError.empty())
            {
                reason += " (last status error: " + lastPollError + ")";
            }
            outcome.readiness = {ReadinessState::Failed, reason};
            outcome.error = HookErrorKind::ReadinessTimeout;
            return outcome;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto wait = std::min({options_.pollInterval, remaining, maxPollWait});
        if (options_.cancellation)
        {
            options_.cancellation->waitFor(wait);
        }
        else
        {
            std::this_thread::sleep_for(wait);
        }
    }
}

} // namespace Hookstage
