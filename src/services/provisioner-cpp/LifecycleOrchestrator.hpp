#pragma once

#include "HealthChecker.hpp"
#include "ProvisionTypes.hpp"
#include "RetryPolicy.hpp"
#include "RuntimeClient.hpp"
#include "ServiceInstaller.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct OrchestratorSettings {
    RetryPolicy healthPolicy{12, std::chrono::seconds(10)};
    RetryPolicy shutdownPolicy = RetryPolicy::FromTimeout(std::chrono::seconds(60), std::chrono::seconds(3));
    RetryPolicy startPolicy = RetryPolicy::FromTimeout(std::chrono::seconds(60), std::chrono::seconds(3));
    Sleeper sleeper;
};

// Drives one target container through the provisioning stages. Every stage
// checks its postcondition against the runtime first, so a rerun resumes at
// the first unmet one and a completed run performs no mutations.
class LifecycleOrchestrator {
public:
    LifecycleOrchestrator(
        RuntimeClient& runtime,
        TargetConfig config,
        std::unique_ptr<ServiceInstaller> installer,
        HealthChecker healthChecker = HealthChecker(),
        OrchestratorSettings settings = OrchestratorSettings());

    StageResult Clone(const SourceRef& source);
    StageResult Setup();
    StageResult Finalize(const std::string& snapshotName);
    StageResult Provision();

    ProvisionState DetectState(const std::optional<std::string>& finalSnapshot = std::nullopt);
    ProvisionState State() const;
    const TargetConfig& Config() const;

private:
    StageResult RunStage(const std::string& stage, const std::function<StageResult()>& body);

    StageResult CloneStage(const SourceRef& source);
    StageResult NetworkStage();
    StageResult WorkloadStage();
    StageResult VerifyStage();
    StageResult SnapshotStage(const std::string& snapshotName);

    StageResult RequireTarget(const std::string& stage);
    StageResult EnsureRunning(const std::string& stage);
    StageResult WaitForRunning(bool running, const RetryPolicy& policy, ErrorKind failureKind, const std::string& stage);
    ProvisionState DetectStateUpTo(ProvisionState required, const std::optional<std::string>& finalSnapshot);
    bool AlreadyComplete(ProvisionState required, const std::optional<std::string>& finalSnapshot);

    bool NetworkApplied();
    bool WorkloadReady();
    void Advance(ProvisionState next);

    RuntimeClient& runtime_;
    const TargetConfig config_;
    std::unique_ptr<ServiceInstaller> installer_;
    HealthChecker healthChecker_;
    OrchestratorSettings settings_;
    ProvisionState state_ = ProvisionState::ABSENT;
};
