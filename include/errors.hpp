#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Hookstage {

/**
 * @brief Classifies every failure the orchestrator can report.
 */
enum class HookErrorKind
{
    None,
    UnrecognizedPhase, // annotation value outside the closed phase set
    UnknownOperation,  // operation outside install/upgrade/delete/rollback
    InvalidManifest,   // document is not a parseable YAML map
    SubmissionFailed,  // applier rejected a hook resource
    ReadinessTimeout,  // run-to-completion hook missed its deadline
    HookFailed,        // run-to-completion hook reached terminal failure
    Cancelled,         // cancellation token fired while waiting
    PhaseAborted,      // a hook in the phase failed; the rest were skipped
    MainActionFailed,  // caller's non-hook step failed
    ConfigError        // configuration file is malformed
};

/**
 * @brief Returns the stable display name of an error kind (e.g. "HookFailed").
 */
const char* errorKindName(HookErrorKind kind);

/**
 * @class HookError
 * @brief Exception thrown for parse-time and lookup failures. Run-time phase
 *        and operation outcomes are reported through result structs instead.
 */
class HookError : public std::runtime_error
{
public:
    HookError(HookErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    HookErrorKind kind() const noexcept { return kind_; }

private:
    HookErrorKind kind_;
};

} // namespace Hookstage

#endif // ERRORS_HPP
