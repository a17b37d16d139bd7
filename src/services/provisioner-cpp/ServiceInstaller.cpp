#include "ServiceInstaller.hpp"

#include "NginxProxyInstaller.hpp"
#include "ProcessRunner.hpp"
#include "VllmInstaller.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace {
constexpr const char* kServiceStage = "manage-service";
constexpr const char* kConfigureStage = "configure";

std::filesystem::path StagingPath() {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() / "lxc-provisioner"
        / ("push-" + std::to_string(getpid()) + "-" + std::to_string(counter++));
}
} // namespace

ServiceInstaller::ServiceInstaller(RuntimeClient& runtime)
    : runtime_(runtime) {}

StageResult ServiceInstaller::ManageService(int ctid) {
    const std::string service = ServiceName();
    std::cout << "[Installer] Managing service " << service << " in CTID " << ctid << std::endl;

    const StageResult prepared = RunSteps(
        ctid,
        {{"systemctl", "daemon-reload"}, {"systemctl", "enable", service}},
        ErrorKind::POST_CLONE_CONFIG_FAILED,
        kServiceStage);
    if (!prepared.Ok()) {
        return prepared;
    }

    const RuntimeResult restart = runtime_.Exec(ctid, {"systemctl", "restart", service});
    if (!restart.Ok()) {
        std::cerr << "[Installer] " << service << " failed to start. Recent logs:" << std::endl;
        std::cerr << RecentServiceLogs(ctid) << std::endl;
        return StageResult::Failure(
            ErrorKind::POST_CLONE_CONFIG_FAILED,
            kServiceStage,
            "systemctl restart " + service + " failed",
            restart.exitCode);
    }

    std::cout << "[Installer] Service " << service << " restarted in CTID " << ctid << std::endl;
    return StageResult::Success(kServiceStage);
}

bool ServiceInstaller::IsServiceActive(int ctid) {
    return Succeeds(ctid, {"systemctl", "is-active", "--quiet", ServiceName()});
}

std::string ServiceInstaller::RecentServiceLogs(int ctid, int lines) {
    const RuntimeResult result = runtime_.Exec(
        ctid,
        {"journalctl", "-u", ServiceName(), "--no-pager", "-n", std::to_string(lines)});
    if (!result.Ok()) {
        return "(journalctl exited with " + std::to_string(result.exitCode) + ")";
    }
    return result.stdoutText;
}

StageResult ServiceInstaller::RunSteps(
    int ctid,
    const std::vector<std::vector<std::string>>& steps,
    ErrorKind failureKind,
    const std::string& stage) {
    for (const auto& step : steps) {
        const RuntimeResult result = runtime_.Exec(ctid, step);
        if (!result.Ok()) {
            return StageResult::Failure(failureKind, stage, "'" + JoinArgs(step) + "' failed in CTID " + std::to_string(ctid), result.exitCode);
        }
    }
    return StageResult::Success(stage);
}

StageResult ServiceInstaller::WriteFile(int ctid, const std::string& content, const std::string& remotePath) {
    std::filesystem::path staging;
    try {
        staging = StagingPath();
        std::filesystem::create_directories(staging.parent_path());
    } catch (const std::filesystem::filesystem_error& ex) {
        return StageResult::Failure(ErrorKind::POST_CLONE_CONFIG_FAILED, kConfigureStage, std::string("staging path error: ") + ex.what());
    }

    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            return StageResult::Failure(ErrorKind::POST_CLONE_CONFIG_FAILED, kConfigureStage, "unable to write " + staging.string());
        }
        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!output.good()) {
            return StageResult::Failure(ErrorKind::POST_CLONE_CONFIG_FAILED, kConfigureStage, "unable to write " + staging.string());
        }
    }

    const RuntimeResult pushed = runtime_.Push(ctid, staging.string(), remotePath);
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);

    if (!pushed.Ok()) {
        return StageResult::Failure(
            ErrorKind::POST_CLONE_CONFIG_FAILED,
            kConfigureStage,
            "unable to push " + remotePath + " into CTID " + std::to_string(ctid),
            pushed.exitCode);
    }
    return StageResult::Success(kConfigureStage);
}

bool ServiceInstaller::Succeeds(int ctid, const std::vector<std::string>& command) {
    return runtime_.Exec(ctid, command).Ok();
}

std::optional<std::string> ServiceInstaller::ContainerAddress(const TargetConfig& config) {
    if (!config.network) {
        return std::nullopt;
    }
    const auto slash = config.network->ip.find('/');
    return config.network->ip.substr(0, slash);
}

std::unique_ptr<ServiceInstaller> CreateInstaller(WorkloadKind kind, RuntimeClient& runtime) {
    switch (kind) {
    case WorkloadKind::NGINX_PROXY:
        return std::make_unique<NginxProxyInstaller>(runtime);
    case WorkloadKind::VLLM_SOURCE:
        return std::make_unique<VllmSourceInstaller>(runtime);
    case WorkloadKind::VLLM_PACKAGE:
        return std::make_unique<VllmPackageInstaller>(runtime);
    }
    return nullptr;
}
