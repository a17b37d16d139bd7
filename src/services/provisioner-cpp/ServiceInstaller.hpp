#pragma once

#include "ProvisionTypes.hpp"
#include "RuntimeClient.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct HealthTarget {
    std::string host;
    int port = 80;
    std::string path = "/";
};

// One workload variant. IsInstalled holds only once every artifact Configure
// produces is in place, so an interrupted Configure is redone on the next run.
class ServiceInstaller {
public:
    virtual ~ServiceInstaller() = default;

    virtual std::string Name() const = 0;
    virtual std::string ServiceName() const = 0;

    virtual bool IsInstalled(int ctid, const TargetConfig& config) = 0;
    virtual StageResult Install(int ctid, const TargetConfig& config) = 0;
    virtual StageResult Configure(int ctid, const TargetConfig& config) = 0;
    virtual StageResult ManageService(int ctid);
    virtual std::optional<HealthTarget> HealthEndpoint(const TargetConfig& config) const = 0;

    bool IsServiceActive(int ctid);
    std::string RecentServiceLogs(int ctid, int lines = 50);

protected:
    explicit ServiceInstaller(RuntimeClient& runtime);

    StageResult RunSteps(
        int ctid,
        const std::vector<std::vector<std::string>>& steps,
        ErrorKind failureKind,
        const std::string& stage);
    StageResult WriteFile(int ctid, const std::string& content, const std::string& remotePath);
    bool Succeeds(int ctid, const std::vector<std::string>& command);

    static std::optional<std::string> ContainerAddress(const TargetConfig& config);

    RuntimeClient& runtime_;
};

std::unique_ptr<ServiceInstaller> CreateInstaller(WorkloadKind kind, RuntimeClient& runtime);
