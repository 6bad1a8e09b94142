#include "lifecycle.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace Hookstage;
using namespace Hookstage::Testing;

namespace {

// Records the order in which the three stages of an operation are invoked.
struct StageRecorder {
    std::vector<std::string> calls;
    bool failPre = false;
    bool failMain = false;
    bool failPost = false;

    LifecycleCoordinator::PhaseAction phaseAction(bool& fail) {
        return [this, &fail](Phase phase) {
            calls.push_back(PhaseRegistry::phaseName(phase));
            PhaseResult result;
            if (fail) {
                result.success = false;
                result.failedHook = "Job/hook";
                result.error = HookErrorKind::HookFailed;
                result.reason = "boom";
            }
            return result;
        };
    }

    LifecycleCoordinator::MainAction mainAction() {
        return [this]() {
            calls.push_back("main");
            return failMain ? StepResult::failure("apply rejected") : StepResult::ok();
        };
    }

    OperationResult perform(Operation operation) {
        return LifecycleCoordinator::perform(operation, phaseAction(failPre), mainAction(),
                                             phaseAction(failPost));
    }
};

ExecutorOptions fastOptions() {
    ExecutorOptions options;
    options.timeout = std::chrono::milliseconds(2000);
    options.pollInterval = std::chrono::milliseconds(5);
    return options;
}

} // namespace

TEST(LifecycleCoordinatorTest, RunsPreMainPostInOrder) {
    StageRecorder recorder;
    OperationResult result = recorder.perform(Operation::Upgrade);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(recorder.calls, std::vector<std::string>({"pre-upgrade", "main", "post-upgrade"}));
    EXPECT_EQ(result.describe(), "upgrade succeeded");
}

TEST(LifecycleCoordinatorTest, PreFailureSkipsMainAndPost) {
    StageRecorder recorder;
    recorder.failPre = true;
    OperationResult result = recorder.perform(Operation::Install);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(recorder.calls, std::vector<std::string>({"pre-install"}));
    ASSERT_TRUE(result.failedPhase.has_value());
    EXPECT_EQ(*result.failedPhase, Phase::PreInstall);
    EXPECT_EQ(result.error, HookErrorKind::PhaseAborted);
    EXPECT_EQ(result.cause, HookErrorKind::HookFailed);
    EXPECT_EQ(result.failedHook, "Job/hook");
}

TEST(LifecycleCoordinatorTest, MainFailureSkipsPost) {
    StageRecorder recorder;
    recorder.failMain = true;
    OperationResult result = recorder.perform(Operation::Delete);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(recorder.calls, std::vector<std::string>({"pre-delete", "main"}));
    EXPECT_EQ(result.error, HookErrorKind::MainActionFailed);
    EXPECT_FALSE(result.failedPhase.has_value());
    EXPECT_EQ(result.describe(), "delete failed: main step failed: apply rejected");
}

TEST(LifecycleCoordinatorTest, PostFailureIsReported) {
    StageRecorder recorder;
    recorder.failPost = true;
    OperationResult result = recorder.perform(Operation::Rollback);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(recorder.calls, std::vector<std::string>({"pre-rollback", "main", "post-rollback"}));
    ASSERT_TRUE(result.failedPhase.has_value());
    EXPECT_EQ(*result.failedPhase, Phase::PostRollback);
}

TEST(LifecycleCoordinatorTest, ThrowingMainActionFailsTheOperation) {
    int postCalls = 0;
    OperationResult result = LifecycleCoordinator::perform(
        Operation::Install,
        [](Phase) { return PhaseResult(); },
        []() -> StepResult { throw std::runtime_error("disk full"); },
        [&postCalls](Phase) { postCalls++; return PhaseResult(); });

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, HookErrorKind::MainActionFailed);
    EXPECT_EQ(result.reason, "disk full");
    EXPECT_EQ(postCalls, 0);
}

TEST(LifecycleCoordinatorTest, ThrowingPhaseActionAbortsThePhase) {
    int mainCalls = 0;
    OperationResult result = LifecycleCoordinator::perform(
        Operation::Upgrade,
        [](Phase) -> PhaseResult { throw std::runtime_error("lost connection"); },
        [&mainCalls]() { mainCalls++; return StepResult::ok(); },
        [](Phase) { return PhaseResult(); });

    EXPECT_FALSE(result.success);
    EXPECT_EQ(mainCalls, 0);
    ASSERT_TRUE(result.failedPhase.has_value());
    EXPECT_EQ(*result.failedPhase, Phase::PreUpgrade);
    EXPECT_EQ(result.reason, "lost connection");
}

TEST(LifecycleCoordinatorTest, DescribeNamesPhaseHookAndCause) {
    OperationResult result;
    result.operation = Operation::Install;
    result.success = false;
    result.failedPhase = Phase::PreInstall;
    result.failedHook = "Job/db-migrate";
    result.error = HookErrorKind::PhaseAborted;
    result.cause = HookErrorKind::HookFailed;
    result.reason = "BackoffLimitExceeded";

    EXPECT_EQ(result.describe(),
              "install failed: phase pre-install aborted: hook 'Job/db-migrate' failed "
              "[HookFailed]: BackoffLimitExceeded");
}

TEST(LifecycleCoordinatorTest, AppliesResourcesBetweenHookPhases) {
    FakeApplier applier;
    applier.statuses["migrate"] = {pendingStatus(), completeStatus()};
    applier.statuses["smoke"] = {completeStatus()};
    LifecycleCoordinator coordinator(applier, AnnotationExtractor(), fastOptions());

    std::vector<Manifest> manifests = {
        makeManifest("Job", "migrate", "pre-install"),
        makeManifest("Deployment", "web"),
        makeManifest("Service", "web-svc"),
        makeManifest("Job", "smoke", "post-install"),
    };

    std::vector<std::string> applied;
    OperationResult result = coordinator.perform(
        Operation::Install, manifests,
        [&applier, &applied](const std::vector<Manifest>& resources) {
            for (const auto& resource : resources) {
                applied.push_back(resource.name);
                applier.events.push_back("apply:" + resource.name);
            }
            return StepResult::ok();
        });

    EXPECT_TRUE(result.success) << result.describe();
    EXPECT_EQ(applied, std::vector<std::string>({"web", "web-svc"}));
    EXPECT_EQ(applier.events, std::vector<std::string>({
        "submit:migrate", "poll:migrate", "poll:migrate",
        "apply:web", "apply:web-svc",
        "submit:smoke", "poll:smoke",
    }));
}

TEST(LifecycleCoordinatorTest, FailedPreHookLeavesResourcesUntouched) {
    FakeApplier applier;
    applier.statuses["migrate"] = {failedStatus("BackoffLimitExceeded")};
    LifecycleCoordinator coordinator(applier, AnnotationExtractor(), fastOptions());

    bool mainCalled = false;
    OperationResult result = coordinator.perform(
        Operation::Install,
        {makeManifest("Job", "migrate", "pre-install"), makeManifest("Deployment", "web"),
         makeManifest("Job", "smoke", "post-install")},
        [&mainCalled](const std::vector<Manifest>&) {
            mainCalled = true;
            return StepResult::ok();
        });

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(mainCalled);
    EXPECT_EQ(applier.submitted, std::vector<std::string>({"migrate"}));
    EXPECT_EQ(result.describe(),
              "install failed: phase pre-install aborted: hook 'Job/migrate' failed "
              "[HookFailed]: BackoffLimitExceeded");
}

TEST(LifecycleCoordinatorTest, StrictAssemblyFailureStopsBeforeAnyHook) {
    FakeApplier applier;
    LifecycleCoordinator coordinator(applier,
                                     AnnotationExtractor("hookstage.io/hook", PhasePolicy::Strict),
                                     fastOptions());

    bool mainCalled = false;
    OperationResult result = coordinator.perform(
        Operation::Install,
        {makeManifest("Job", "migrate", "pre-install"), makeManifest("Job", "typo", "pre-instal")},
        [&mainCalled](const std::vector<Manifest>&) {
            mainCalled = true;
            return StepResult::ok();
        });

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, HookErrorKind::UnrecognizedPhase);
    EXPECT_FALSE(mainCalled);
    EXPECT_EQ(applier.callCount(), 0u);
}

TEST(LifecycleCoordinatorTest, DeleteRunsDeletePhases) {
    FakeApplier applier;
    LifecycleCoordinator coordinator(applier, AnnotationExtractor(), fastOptions());

    OperationResult result = coordinator.perform(
        Operation::Delete,
        {makeManifest("ConfigMap", "backup", "pre-delete"),
         makeManifest("ConfigMap", "install-only", "pre-install"),
         makeManifest("ConfigMap", "notify", "post-delete")},
        [](const std::vector<Manifest>& resources) {
            return resources.empty() ? StepResult::ok() : StepResult::failure("unexpected resources");
        });

    EXPECT_TRUE(result.success) << result.describe();
    EXPECT_EQ(applier.submitted, std::vector<std::string>({"backup", "notify"}));
}
