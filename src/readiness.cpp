#include "readiness.hpp"

#include <initializer_list>

namespace Hookstage {

namespace {
    const char* const runToCompletionKind = "Job";

    // Returns the first condition of the given type whose status is "True".
    YAML::Node findTrueCondition(const YAML::Node& status, const std::string& type)
    {
        const YAML::Node conditions = status["conditions"];
        if (!conditions || !conditions.IsSequence()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }

        for (const auto& condition : conditions) {
            if (!condition.IsMap()) {
                continue;
            }
            const YAML::Node conditionType = condition["type"];
            const YAML::Node conditionStatus = condition["status"];
            if (conditionType && conditionType.IsScalar() && conditionType.Scalar() == type &&
                conditionStatus && conditionStatus.IsScalar() && conditionStatus.Scalar() == "True") {
                return condition;
            }
        }
        return YAML::Node(YAML::NodeType::Undefined);
    }

    std::string conditionReason(const YAML::Node& condition)
    {
        for (const char* field : {"message", "reason"}) {
            const YAML::Node value = condition[field];
            if (value && value.IsScalar() && !value.Scalar().empty()) {
                return value.Scalar();
            }
        }
        return "job reported a Failed condition";
    }
} // end anonymous namespace

const char* readinessStateName(ReadinessState state)
{
    switch (state) {
        case ReadinessState::Pending: return "Pending";
        case ReadinessState::Ready:   return "Ready";
        case ReadinessState::Failed:  return "Failed";
    }
    return "Unknown";
}

Readiness RunToCompletionKind::evaluate(const YAML::Node& observedState) const
{
    if (!observedState || !observedState.IsMap()) {
        return {ReadinessState::Pending, ""};
    }

    // A Failed condition wins over a stale Complete one
    YAML::Node failed = findTrueCondition(observedState, "Failed");
    if (failed) {
        return {ReadinessState::Failed, conditionReason(failed)};
    }
    if (findTrueCondition(observedState, "Complete")) {
        return {ReadinessState::Ready, ""};
    }
    return {ReadinessState::Pending, ""};
}

Readiness GenericKind::evaluate(const YAML::Node&) const
{
    return {ReadinessState::Ready, ""};
}

ResourceKind ReadinessEvaluator::classify(const std::string& kind)
{
    if (kind == runToCompletionKind) {
        return RunToCompletionKind{kind};
    }
    return GenericKind{kind};
}

bool ReadinessEvaluator::requiresPolling(const ResourceKind& kind)
{
    return std::visit([](const auto& k) { return k.polled; }, kind);
}

Readiness ReadinessEvaluator::evaluate(const ResourceKind& kind, const YAML::Node& observedState)
{
    return std::visit([&observedState](const auto& k) { return k.evaluate(observedState); }, kind);
}

Readiness ReadinessEvaluator::evaluate(const std::string& kind, const YAML::Node& observedState)
{
    return evaluate(classify(kind), observedState);
}

Readiness ReadinessEvaluator::rejected(const std::string& error)
{
    return {ReadinessState::Failed, error};
}

} // namespace Hookstage
