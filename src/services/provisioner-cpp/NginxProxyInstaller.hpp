#pragma once

#include "ServiceInstaller.hpp"

#include <string>

class NginxProxyInstaller : public ServiceInstaller {
public:
    static constexpr const char* kSitePath = "/etc/nginx/sites-available/provisioner-proxy";
    static constexpr const char* kEnabledPath = "/etc/nginx/sites-enabled/provisioner-proxy";
    static constexpr const char* kDefaultSitePath = "/etc/nginx/sites-enabled/default";

    explicit NginxProxyInstaller(RuntimeClient& runtime);

    std::string Name() const override;
    std::string ServiceName() const override;

    bool IsInstalled(int ctid, const TargetConfig& config) override;
    StageResult Install(int ctid, const TargetConfig& config) override;
    StageResult Configure(int ctid, const TargetConfig& config) override;
    std::optional<HealthTarget> HealthEndpoint(const TargetConfig& config) const override;

    static std::string RenderServerBlock(const std::string& backendIp, int backendPort);
};
