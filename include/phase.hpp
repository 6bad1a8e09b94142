#ifndef PHASE_HPP
#define PHASE_HPP

#include <array>
#include <optional>
#include <string>
#include <utility>

namespace Hookstage {

/**
 * @brief The eight lifecycle moments a hook can be bound to.
 */
enum class Phase
{
    PreInstall,
    PostInstall,
    PreDelete,
    PostDelete,
    PreUpgrade,
    PostUpgrade,
    PreRollback,
    PostRollback
};

/**
 * @brief A caller-initiated release action.
 */
enum class Operation
{
    Install,
    Upgrade,
    Delete,
    Rollback
};

/**
 * @class PhaseRegistry
 * @brief Fixed mapping between operations and their (pre, post) phase pairs,
 *        plus conversion between phases/operations and their identifiers.
 */
class PhaseRegistry
{
public:
    /** Every phase, in declaration order. */
    static const std::array<Phase, 8>& allPhases();

    /** Every operation, in declaration order. */
    static const std::array<Operation, 4>& allOperations();

    /**
     * @brief Returns the ordered (prePhase, postPhase) pair for an operation.
     *
     * @throws HookError (UnknownOperation) for a value outside the enumeration.
     */
    static std::pair<Phase, Phase> phasesFor(Operation operation);

    /**
     * @brief Returns the identifier of a phase, e.g. "pre-install".
     */
    static std::string phaseName(Phase phase);

    /**
     * @brief Matches an identifier case-sensitively against the closed set.
     * @return The phase, or std::nullopt if the identifier is not recognized.
     */
    static std::optional<Phase> parsePhase(const std::string& name);

    /**
     * @brief Returns the name of an operation, e.g. "upgrade".
     */
    static std::string operationName(Operation operation);

    /**
     * @brief Parses an operation name.
     * @throws HookError (UnknownOperation) if the name is not recognized.
     */
    static Operation parseOperation(const std::string& name);
};

} // namespace Hookstage

#endif // PHASE_HPP
