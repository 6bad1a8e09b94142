#include "phase.hpp"
#include "errors.hpp"

#include <string>

namespace Hookstage {

namespace {
    // Identifier table; index matches the Phase enumerator order.
    const std::array<const char*, 8> phaseNames = {
        "pre-install", "post-install",
        "pre-delete",  "post-delete",
        "pre-upgrade", "post-upgrade",
        "pre-rollback", "post-rollback"
    };

    const std::array<const char*, 4> operationNames = {
        "install", "upgrade", "delete", "rollback"
    };
} // end anonymous namespace

const std::array<Phase, 8>& PhaseRegistry::allPhases()
{
    static const std::array<Phase, 8> phases = {
        Phase::PreInstall, Phase::PostInstall,
        Phase::PreDelete,  Phase::PostDelete,
        Phase::PreUpgrade, Phase::PostUpgrade,
        Phase::PreRollback, Phase::PostRollback
    };
    return phases;
}

const std::array<Operation, 4>& PhaseRegistry::allOperations()
{
    static const std::array<Operation, 4> operations = {
        Operation::Install, Operation::Upgrade, Operation::Delete, Operation::Rollback
    };
    return operations;
}

std::pair<Phase, Phase> PhaseRegistry::phasesFor(Operation operation)
{
    switch (operation) {
        case Operation::Install:  return {Phase::PreInstall, Phase::PostInstall};
        case Operation::Upgrade:  return {Phase::PreUpgrade, Phase::PostUpgrade};
        case Operation::Delete:   return {Phase::PreDelete, Phase::PostDelete};
        case Operation::Rollback: return {Phase::PreRollback, Phase::PostRollback};
    }
    throw HookError(HookErrorKind::UnknownOperation,
                    "Unknown operation value: " + std::to_string(static_cast<int>(operation)));
}

std::string PhaseRegistry::phaseName(Phase phase)
{
    return phaseNames.at(static_cast<size_t>(phase));
}

std::optional<Phase> PhaseRegistry::parsePhase(const std::string& name)
{
    for (Phase phase : allPhases()) {
        if (name == phaseNames[static_cast<size_t>(phase)]) {
            return phase;
        }
    }
    return std::nullopt;
}

std::string PhaseRegistry::operationName(Operation operation)
{
    size_t index = static_cast<size_t>(operation);
    if (index >= operationNames.size()) {
        throw HookError(HookErrorKind::UnknownOperation,
                        "Unknown operation value: " + std::to_string(index));
    }
    return operationNames[index];
}

Operation PhaseRegistry::parseOperation(const std::string& name)
{
    for (Operation operation : allOperations()) {
        if (name == operationNames[static_cast<size_t>(operation)]) {
            return operation;
        }
    }
    throw HookError(HookErrorKind::UnknownOperation, "Unknown operation: '" + name + "'");
}

} // namespace Hookstage
