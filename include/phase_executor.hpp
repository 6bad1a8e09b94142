#ifndef PHASE_EXECUTOR_HPP
#define PHASE_EXECUTOR_HPP

#include <chrono>
#include <string>
#include "applier.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "hook.hpp"
#include "phase.hpp"
#include "readiness.hpp"

namespace Hookstage {

/**
 * @brief Tunables for one PhaseExecutor.
 */
struct ExecutorOptions
{
    /** Per-hook readiness deadline, measured from acceptance. */
    std::chrono::milliseconds timeout = std::chrono::seconds(300);
    /** Delay between two status polls of a run-to-completion hook. */
    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(1000);
    /** Optional; when cancelled, the hook being waited on fails with Cancelled. */
    const CancellationToken* cancellation = nullptr;
};

/**
 * @brief Outcome of one phase.
 */
struct PhaseResult
{
    Phase phase = Phase::PreInstall;
    bool success = true;
    std::string failedHook;                     // Name of the first failed hook
    std::string failedKind;                     // Its resource kind
    HookErrorKind error = HookErrorKind::None;  // Why that hook failed
    std::string reason;
    size_t executed = 0;                        // Hooks submitted, including the failed one
    size_t skipped = 0;                         // Hooks never submitted after the failure
};

/**
 * @class PhaseExecutor
 * @brief Runs the hooks of one phase, one at a time, against an Applier.
 *
 * Each hook is submitted and then waited on until its readiness is terminal.
 * The phase stops at the first failed hook; hooks already submitted stay in
 * the target system.
 */
class PhaseExecutor
{
public:
    explicit PhaseExecutor(Applier& applier, ExecutorOptions options = ExecutorOptions());

    /**
     * @brief Executes every hook bound to `phase`.
     *
     * A phase without hooks succeeds without touching the applier.
     */
    PhaseResult run(Phase phase, const HookSet& hookSet);

    const ExecutorOptions& options() const { return options_; }

private:
    struct HookOutcome
    {
        Readiness readiness;
        HookErrorKind error = HookErrorKind::None;
    };

    HookOutcome executeHook(const Hook& hook);

    /**
     * @brief Polls a submitted resource until its readiness is terminal, its
     *        deadline passes or the cancellation token fires.
     */
    HookOutcome awaitReadiness(const Hook& hook,
                               const ResourceKind& kind,
                               const std::string& handle);

    bool isCancelled() const;

    Applier& applier_;
    ExecutorOptions options_;
};

} // namespace Hookstage

#endif // PHASE_EXECUTOR_HPP
