#pragma once

#include "ServiceInstaller.hpp"

#include <string>
#include <vector>

// Shared systemd unit and health endpoint for both vLLM install procedures.
class VllmInstaller : public ServiceInstaller {
public:
    static constexpr const char* kUnitPath = "/etc/systemd/system/vllm.service";

    std::string ServiceName() const override;
    StageResult Configure(int ctid, const TargetConfig& config) override;
    std::optional<HealthTarget> HealthEndpoint(const TargetConfig& config) const override;

    static std::string RenderUnit(const std::string& vllmBinary, const WorkloadConfig& workload);

protected:
    explicit VllmInstaller(RuntimeClient& runtime);

    virtual std::string VllmBinary() const = 0;
    bool UnitPresent(int ctid);
};

class VllmSourceInstaller : public VllmInstaller {
public:
    static constexpr const char* kVenvDir = "/opt/vllm";
    static constexpr const char* kRepoDir = "/opt/vllm_repo";
    static constexpr const char* kRepoUrl = "https://github.com/vllm-project/vllm.git";
    static constexpr const char* kTorchIndex = "https://download.pytorch.org/whl/nightly/cu128";

    explicit VllmSourceInstaller(RuntimeClient& runtime);

    std::string Name() const override;
    bool IsInstalled(int ctid, const TargetConfig& config) override;
    StageResult Install(int ctid, const TargetConfig& config) override;

    static std::vector<std::vector<std::string>> BuildInstallSteps(bool repoPresent);

protected:
    std::string VllmBinary() const override;
};

class VllmPackageInstaller : public VllmInstaller {
public:
    explicit VllmPackageInstaller(RuntimeClient& runtime);

    std::string Name() const override;
    bool IsInstalled(int ctid, const TargetConfig& config) override;
    StageResult Install(int ctid, const TargetConfig& config) override;

    static std::string PackageRequirement(const std::string& version);
    static std::string InstalledVersion(const std::string& pipShowOutput);

protected:
    std::string VllmBinary() const override;
};
