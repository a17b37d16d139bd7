#include "LifecycleOrchestrator.hpp"

#include "CommandBuilder.hpp"
#include "Tracing.hpp"

#include <iostream>
#include <utility>

namespace {
constexpr const char* kCloneStage = "clone";
constexpr const char* kNetworkStage = "network";
constexpr const char* kWorkloadStage = "workload";
constexpr const char* kVerifyStage = "verify";
constexpr const char* kSnapshotStage = "snapshot";

long long IntervalSeconds(const RetryPolicy& policy) {
    return std::chrono::duration_cast<std::chrono::seconds>(policy.interval).count();
}
} // namespace

LifecycleOrchestrator::LifecycleOrchestrator(
    RuntimeClient& runtime,
    TargetConfig config,
    std::unique_ptr<ServiceInstaller> installer,
    HealthChecker healthChecker,
    OrchestratorSettings settings)
    : runtime_(runtime),
      config_(std::move(config)),
      installer_(std::move(installer)),
      healthChecker_(std::move(healthChecker)),
      settings_(std::move(settings)) {}

StageResult LifecycleOrchestrator::Clone(const SourceRef& source) {
    if (source.sourceCtid == config_.ctid) {
        return StageResult::Failure(
            ErrorKind::CONFIG_INVALID,
            kCloneStage,
            "target CTID " + std::to_string(config_.ctid) + " must differ from source CTID");
    }

    if (AlreadyComplete(ProvisionState::NETWORK_CONFIGURED, std::nullopt)) {
        return StageResult::Success(kCloneStage);
    }

    StageResult result = RunStage(kCloneStage, [&] { return CloneStage(source); });
    if (!result.Ok()) {
        return result;
    }
    return RunStage(kNetworkStage, [&] { return NetworkStage(); });
}

StageResult LifecycleOrchestrator::Setup() {
    StageResult result = RequireTarget(kWorkloadStage);
    if (!result.Ok()) {
        return result;
    }

    if (AlreadyComplete(ProvisionState::WORKLOAD_INSTALLED, std::nullopt)) {
        return StageResult::Success(kWorkloadStage);
    }

    result = RunStage(kWorkloadStage, [&] { return WorkloadStage(); });
    if (!result.Ok()) {
        return result;
    }
    return RunStage(kVerifyStage, [&] { return VerifyStage(); });
}

StageResult LifecycleOrchestrator::Finalize(const std::string& snapshotName) {
    if (snapshotName.empty()) {
        return StageResult::Failure(ErrorKind::INVALID_ARGUMENTS, kSnapshotStage, "snapshot name is required");
    }

    StageResult result = RequireTarget(kSnapshotStage);
    if (!result.Ok()) {
        return result;
    }

    if (AlreadyComplete(ProvisionState::SNAPSHOTTED, snapshotName)) {
        return StageResult::Success(kSnapshotStage);
    }
    return RunStage(kSnapshotStage, [&] { return SnapshotStage(snapshotName); });
}

StageResult LifecycleOrchestrator::Provision() {
    const std::optional<std::string>& finalSnapshot = config_.templateSnapshot;
    const ProvisionState required = finalSnapshot ? ProvisionState::SNAPSHOTTED : ProvisionState::WORKLOAD_INSTALLED;
    if (AlreadyComplete(required, finalSnapshot)) {
        return StageResult::Success(finalSnapshot ? kSnapshotStage : kWorkloadStage);
    }

    StageResult result;
    if (state_ == ProvisionState::ABSENT) {
        if (!config_.source) {
            return StageResult::Failure(
                ErrorKind::CONFIG_INVALID,
                kCloneStage,
                "field 'clone_from_ctid' is required while CTID " + std::to_string(config_.ctid) + " does not exist");
        }
        if (config_.source->sourceCtid == config_.ctid) {
            return StageResult::Failure(ErrorKind::CONFIG_INVALID, kCloneStage, "target CTID must differ from source CTID");
        }
        result = RunStage(kCloneStage, [&] { return CloneStage(*config_.source); });
        if (!result.Ok()) {
            return result;
        }
    } else {
        Advance(ProvisionState::CLONED);
    }

    result = RunStage(kNetworkStage, [&] { return NetworkStage(); });
    if (!result.Ok()) {
        return result;
    }
    result = RunStage(kWorkloadStage, [&] { return WorkloadStage(); });
    if (!result.Ok()) {
        return result;
    }
    result = RunStage(kVerifyStage, [&] { return VerifyStage(); });
    if (!result.Ok() || !finalSnapshot) {
        return result;
    }
    return RunStage(kSnapshotStage, [&] { return SnapshotStage(*finalSnapshot); });
}

ProvisionState LifecycleOrchestrator::DetectState(const std::optional<std::string>& finalSnapshot) {
    return DetectStateUpTo(ProvisionState::SNAPSHOTTED, finalSnapshot);
}

// Probes stop at the network when the caller needs nothing beyond it; the
// workload probes exec into the container, which may still be stopped.
ProvisionState LifecycleOrchestrator::DetectStateUpTo(
    ProvisionState required,
    const std::optional<std::string>& finalSnapshot) {
    if (!runtime_.Status(config_.ctid).exists) {
        return ProvisionState::ABSENT;
    }
    if (finalSnapshot && runtime_.SnapshotList(config_.ctid).count(*finalSnapshot) > 0) {
        return ProvisionState::SNAPSHOTTED;
    }
    if (!NetworkApplied()) {
        return ProvisionState::CLONED;
    }
    if (static_cast<int>(required) <= static_cast<int>(ProvisionState::NETWORK_CONFIGURED) || !WorkloadReady()) {
        return ProvisionState::NETWORK_CONFIGURED;
    }
    return ProvisionState::WORKLOAD_INSTALLED;
}

ProvisionState LifecycleOrchestrator::State() const {
    return state_;
}

const TargetConfig& LifecycleOrchestrator::Config() const {
    return config_;
}

StageResult LifecycleOrchestrator::RunStage(const std::string& stage, const std::function<StageResult()>& body) {
    auto span = Tracer::Instance().StartStageSpan(stage, config_.ctid);
    std::cout << "[Orchestrator] CTID " << config_.ctid << " stage " << stage << " started" << std::endl;

    StageResult result = body();

    Tracer::Instance().SetAttribute(span, "provisioner.state", ToString(state_));
    if (result.Ok()) {
        std::cout << "[Orchestrator] CTID " << config_.ctid << " stage " << stage << " done (state "
                  << ToString(state_) << ")" << std::endl;
    } else {
        Tracer::Instance().SetAttribute(span, "provisioner.error_kind", ToString(result.kind));
        std::cerr << "[Orchestrator] CTID " << config_.ctid << " stage " << stage << " failed: "
                  << result.message << std::endl;
    }
    Tracer::Instance().EndSpan(span, result.Ok(), result.message);
    return result;
}

StageResult LifecycleOrchestrator::CloneStage(const SourceRef& source) {
    if (runtime_.Status(config_.ctid).exists) {
        std::cout << "[Orchestrator] CTID " << config_.ctid << " already exists. Skipping clone." << std::endl;
        Advance(ProvisionState::CLONED);
        return StageResult::Success(kCloneStage);
    }

    if (!runtime_.Status(source.sourceCtid).exists) {
        return StageResult::Failure(
            ErrorKind::SOURCE_NOT_FOUND,
            kCloneStage,
            "source CTID " + std::to_string(source.sourceCtid) + " does not exist");
    }
    if (runtime_.SnapshotList(source.sourceCtid).count(source.snapshotName) == 0) {
        return StageResult::Failure(
            ErrorKind::SOURCE_NOT_FOUND,
            kCloneStage,
            "snapshot '" + source.snapshotName + "' not found on source CTID " + std::to_string(source.sourceCtid));
    }

    const CloneSpec spec = CommandBuilder::BuildCloneSpec(config_, source);
    std::cout << "[Orchestrator] Cloning CTID " << spec.sourceCtid << "@" << spec.snapshotName
              << " to CTID " << spec.targetCtid << " (" << spec.hostname << ")" << std::endl;

    const RuntimeResult cloned = runtime_.Clone(spec);
    if (!cloned.Ok()) {
        return StageResult::Failure(ErrorKind::CLONE_FAILED, kCloneStage, "pct clone failed", cloned.exitCode);
    }
    if (!runtime_.Status(config_.ctid).exists) {
        return StageResult::Failure(
            ErrorKind::CLONE_FAILED,
            kCloneStage,
            "CTID " + std::to_string(config_.ctid) + " missing after clone reported success");
    }

    Advance(ProvisionState::CLONED);
    return StageResult::Success(kCloneStage);
}

StageResult LifecycleOrchestrator::NetworkStage() {
    const auto spec = CommandBuilder::BuildNetworkSpec(config_);
    if (!spec) {
        std::cout << "[Orchestrator] No network configured for CTID " << config_.ctid << ". Skipping." << std::endl;
        Advance(ProvisionState::NETWORK_CONFIGURED);
        return StageResult::Success(kNetworkStage);
    }

    const std::string desired = CommandBuilder::FormatNetworkValue(*spec);
    const auto current = runtime_.GetProperty(config_.ctid, "net0");
    if (current && CommandBuilder::NetworkValueMatches(*current, desired)) {
        std::cout << "[Orchestrator] net0 already set on CTID " << config_.ctid << ". Skipping." << std::endl;
        Advance(ProvisionState::NETWORK_CONFIGURED);
        return StageResult::Success(kNetworkStage);
    }

    const RuntimeResult applied = runtime_.SetProperty(config_.ctid, "net0", desired);
    if (!applied.Ok()) {
        return StageResult::Failure(
            ErrorKind::POST_CLONE_CONFIG_FAILED,
            kNetworkStage,
            "unable to set net0 on CTID " + std::to_string(config_.ctid),
            applied.exitCode);
    }

    Advance(ProvisionState::NETWORK_CONFIGURED);
    return StageResult::Success(kNetworkStage);
}

StageResult LifecycleOrchestrator::WorkloadStage() {
    if (!installer_) {
        std::cout << "[Orchestrator] No workload configured for CTID " << config_.ctid << ". Skipping." << std::endl;
        Advance(ProvisionState::WORKLOAD_INSTALLED);
        return StageResult::Success(kWorkloadStage);
    }

    StageResult result = EnsureRunning(kWorkloadStage);
    if (!result.Ok()) {
        return result;
    }

    const int ctid = config_.ctid;
    if (installer_->IsInstalled(ctid, config_)) {
        std::cout << "[Orchestrator] " << installer_->Name() << " already installed in CTID " << ctid << std::endl;
        if (!installer_->IsServiceActive(ctid)) {
            result = installer_->ManageService(ctid);
            if (!result.Ok()) {
                return result;
            }
        }
        Advance(ProvisionState::WORKLOAD_INSTALLED);
        return StageResult::Success(kWorkloadStage);
    }

    result = installer_->Install(ctid, config_);
    if (!result.Ok()) {
        return result;
    }
    result = installer_->Configure(ctid, config_);
    if (!result.Ok()) {
        return result;
    }
    result = installer_->ManageService(ctid);
    if (!result.Ok()) {
        return result;
    }

    Advance(ProvisionState::WORKLOAD_INSTALLED);
    return StageResult::Success(kWorkloadStage);
}

StageResult LifecycleOrchestrator::VerifyStage() {
    const auto target = installer_ ? installer_->HealthEndpoint(config_) : std::nullopt;
    if (!target) {
        std::cout << "[Orchestrator] No health endpoint for CTID " << config_.ctid << ". Skipping verification." << std::endl;
        Advance(ProvisionState::VERIFIED);
        return StageResult::Success(kVerifyStage);
    }

    const std::string url = HealthChecker::BuildUrl(target->host, target->port, target->path);
    const int ctid = config_.ctid;
    const StageResult result = healthChecker_.Probe(
        url,
        settings_.healthPolicy,
        [this, ctid] { return installer_->RecentServiceLogs(ctid); });
    if (!result.Ok()) {
        return result;
    }

    Advance(ProvisionState::VERIFIED);
    return result;
}

StageResult LifecycleOrchestrator::SnapshotStage(const std::string& snapshotName) {
    const int ctid = config_.ctid;
    if (runtime_.SnapshotList(ctid).count(snapshotName) > 0) {
        std::cout << "[Orchestrator] Snapshot '" << snapshotName << "' already exists on CTID " << ctid << std::endl;
        Advance(ProvisionState::SNAPSHOTTED);
        return StageResult::Success(kSnapshotStage);
    }

    if (runtime_.Status(ctid).running) {
        std::cout << "[Orchestrator] Shutting down CTID " << ctid << " for snapshot" << std::endl;
        const RuntimeResult stopped = runtime_.Shutdown(ctid);
        if (!stopped.Ok()) {
            return StageResult::Failure(
                ErrorKind::SHUTDOWN_TIMEOUT,
                kSnapshotStage,
                "pct shutdown failed for CTID " + std::to_string(ctid),
                stopped.exitCode);
        }
        StageResult waited = WaitForRunning(false, settings_.shutdownPolicy, ErrorKind::SHUTDOWN_TIMEOUT, kSnapshotStage);
        if (!waited.Ok()) {
            return waited;
        }
    }

    std::cout << "[Orchestrator] Creating snapshot '" << snapshotName << "' of CTID " << ctid << std::endl;
    const RuntimeResult created = runtime_.SnapshotCreate(ctid, snapshotName);
    if (!created.Ok()) {
        return StageResult::Failure(
            ErrorKind::SNAPSHOT_FAILED,
            kSnapshotStage,
            "pct snapshot '" + snapshotName + "' failed for CTID " + std::to_string(ctid),
            created.exitCode);
    }
    Advance(ProvisionState::SNAPSHOTTED);

    const RuntimeResult started = runtime_.Start(ctid);
    if (!started.Ok()) {
        return StageResult::Failure(
            ErrorKind::START_TIMEOUT,
            kSnapshotStage,
            "pct start failed for CTID " + std::to_string(ctid),
            started.exitCode);
    }
    return WaitForRunning(true, settings_.startPolicy, ErrorKind::START_TIMEOUT, kSnapshotStage);
}

StageResult LifecycleOrchestrator::RequireTarget(const std::string& stage) {
    if (!runtime_.Status(config_.ctid).exists) {
        return StageResult::Failure(
            ErrorKind::SOURCE_NOT_FOUND,
            stage,
            "target CTID " + std::to_string(config_.ctid) + " does not exist");
    }
    Advance(ProvisionState::CLONED);
    return StageResult::Success(stage);
}

StageResult LifecycleOrchestrator::EnsureRunning(const std::string& stage) {
    const ContainerStatus status = runtime_.Status(config_.ctid);
    if (!status.exists) {
        return StageResult::Failure(
            ErrorKind::SOURCE_NOT_FOUND,
            stage,
            "target CTID " + std::to_string(config_.ctid) + " does not exist");
    }
    if (status.running) {
        return StageResult::Success(stage);
    }

    std::cout << "[Orchestrator] Starting CTID " << config_.ctid << std::endl;
    const RuntimeResult started = runtime_.Start(config_.ctid);
    if (!started.Ok()) {
        return StageResult::Failure(
            ErrorKind::START_TIMEOUT,
            stage,
            "pct start failed for CTID " + std::to_string(config_.ctid),
            started.exitCode);
    }
    return WaitForRunning(true, settings_.startPolicy, ErrorKind::START_TIMEOUT, stage);
}

StageResult LifecycleOrchestrator::WaitForRunning(
    bool running,
    const RetryPolicy& policy,
    ErrorKind failureKind,
    const std::string& stage) {
    const char* wanted = running ? "running" : "stopped";
    const RetryOutcome outcome = RunWithRetry(
        policy,
        [&](int attempt) {
            if (runtime_.Status(config_.ctid).running == running) {
                return AttemptVerdict::SUCCESS;
            }
            std::cout << "[Orchestrator] Waiting for CTID " << config_.ctid << " to be " << wanted << " ("
                      << attempt << "/" << policy.maxAttempts << ")" << std::endl;
            return AttemptVerdict::RETRY;
        },
        settings_.sleeper);

    if (!outcome.succeeded) {
        return StageResult::Failure(
            failureKind,
            stage,
            "CTID " + std::to_string(config_.ctid) + " not " + wanted + " after "
                + std::to_string(outcome.attempts) + " checks at " + std::to_string(IntervalSeconds(policy)) + "s");
    }
    std::cout << "[Orchestrator] CTID " << config_.ctid << " is " << wanted << std::endl;
    return StageResult::Success(stage);
}

bool LifecycleOrchestrator::AlreadyComplete(ProvisionState required, const std::optional<std::string>& finalSnapshot) {
    const ProvisionState detected = DetectStateUpTo(required, finalSnapshot);
    if (detected == ProvisionState::ABSENT) {
        return false;
    }

    Advance(ProvisionState::CLONED);
    if (static_cast<int>(detected) < static_cast<int>(required)) {
        std::cout << "[Orchestrator] CTID " << config_.ctid << " detected at " << ToString(detected)
                  << ". Resuming." << std::endl;
        return false;
    }

    std::cout << "[Orchestrator] CTID " << config_.ctid << " already " << ToString(detected)
              << ". Nothing to do." << std::endl;
    Advance(detected);
    return true;
}

bool LifecycleOrchestrator::NetworkApplied() {
    const auto spec = CommandBuilder::BuildNetworkSpec(config_);
    if (!spec) {
        return true;
    }
    const auto current = runtime_.GetProperty(config_.ctid, "net0");
    return current && CommandBuilder::NetworkValueMatches(*current, CommandBuilder::FormatNetworkValue(*spec));
}

bool LifecycleOrchestrator::WorkloadReady() {
    if (!installer_) {
        return true;
    }
    return installer_->IsInstalled(config_.ctid, config_) && installer_->IsServiceActive(config_.ctid);
}

void LifecycleOrchestrator::Advance(ProvisionState next) {
    if (static_cast<int>(next) <= static_cast<int>(state_)) {
        return;
    }
    std::cout << "[Orchestrator] CTID " << config_.ctid << " " << ToString(state_) << " -> " << ToString(next) << std::endl;
    state_ = next;
}
