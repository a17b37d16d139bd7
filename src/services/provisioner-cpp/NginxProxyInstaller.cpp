#include "NginxProxyInstaller.hpp"

#include <iostream>
#include <sstream>

namespace {
constexpr const char* kInstallStage = "install";
constexpr const char* kConfigureStage = "configure";
} // namespace

NginxProxyInstaller::NginxProxyInstaller(RuntimeClient& runtime)
    : ServiceInstaller(runtime) {}

std::string NginxProxyInstaller::Name() const {
    return "nginx-proxy";
}

std::string NginxProxyInstaller::ServiceName() const {
    return "nginx";
}

bool NginxProxyInstaller::IsInstalled(int ctid, const TargetConfig& config) {
    (void)config;
    const RuntimeResult package = runtime_.Exec(ctid, {"dpkg-query", "-W", "-f=${Status}", "nginx"});
    if (!package.Ok() || package.stdoutText.find("install ok installed") == std::string::npos) {
        return false;
    }
    if (!Succeeds(ctid, {"test", "-f", kSitePath}) || !Succeeds(ctid, {"test", "-L", kEnabledPath})) {
        return false;
    }
    return !Succeeds(ctid, {"test", "-e", kDefaultSitePath});
}

StageResult NginxProxyInstaller::Install(int ctid, const TargetConfig& config) {
    (void)config;
    std::cout << "[Installer] Installing nginx in CTID " << ctid << std::endl;
    return RunSteps(
        ctid,
        {
            {"apt-get", "update"},
            {"env", "DEBIAN_FRONTEND=noninteractive", "apt-get", "install", "-y", "nginx"},
        },
        ErrorKind::INSTALL_FAILED,
        kInstallStage);
}

StageResult NginxProxyInstaller::Configure(int ctid, const TargetConfig& config) {
    if (!config.workload || config.workload->backendIp.empty()) {
        return StageResult::Failure(
            ErrorKind::CONFIG_INVALID,
            kConfigureStage,
            "field 'workload.backend_ip' is required for nginx-proxy");
    }

    std::cout << "[Installer] Writing nginx site " << kSitePath << " in CTID " << ctid
              << " (backend " << config.workload->backendIp << ":" << config.workload->backendPort << ")"
              << std::endl;

    const StageResult written = WriteFile(
        ctid,
        RenderServerBlock(config.workload->backendIp, config.workload->backendPort),
        kSitePath);
    if (!written.Ok()) {
        return written;
    }

    const StageResult linked = RunSteps(
        ctid,
        {{"ln", "-sf", kSitePath, kEnabledPath}},
        ErrorKind::POST_CLONE_CONFIG_FAILED,
        kConfigureStage);
    if (!linked.Ok()) {
        return linked;
    }

    if (Succeeds(ctid, {"test", "-e", kDefaultSitePath})) {
        std::cout << "[Installer] Removing default nginx site in CTID " << ctid << std::endl;
        const StageResult removed = RunSteps(
            ctid,
            {{"rm", "-f", kDefaultSitePath}},
            ErrorKind::POST_CLONE_CONFIG_FAILED,
            kConfigureStage);
        if (!removed.Ok()) {
            return removed;
        }
    }

    const RuntimeResult syntax = runtime_.Exec(ctid, {"nginx", "-t"});
    if (!syntax.Ok()) {
        std::cerr << "[Installer] nginx -t rejected the configuration: " << syntax.stderrText << std::endl;
        const RuntimeResult unlinked = runtime_.Exec(ctid, {"rm", "-f", kEnabledPath});
        if (!unlinked.Ok()) {
            std::cerr << "[Installer] Unable to disable " << kEnabledPath << " in CTID " << ctid << std::endl;
        }
        return StageResult::Failure(
            ErrorKind::POST_CLONE_CONFIG_FAILED,
            kConfigureStage,
            "nginx configuration test failed",
            syntax.exitCode);
    }
    return StageResult::Success(kConfigureStage);
}

std::optional<HealthTarget> NginxProxyInstaller::HealthEndpoint(const TargetConfig& config) const {
    const auto host = ContainerAddress(config);
    if (!host) {
        return std::nullopt;
    }

    HealthTarget target;
    target.host = *host;
    target.port = 80;
    target.path = "/";
    if (config.workload) {
        if (config.workload->healthPort > 0) {
            target.port = config.workload->healthPort;
        }
        if (!config.workload->healthPath.empty()) {
            target.path = config.workload->healthPath;
        }
    }
    return target;
}

std::string NginxProxyInstaller::RenderServerBlock(const std::string& backendIp, int backendPort) {
    std::ostringstream block;
    block << "server {\n"
          << "    listen 80 default_server;\n"
          << "    listen [::]:80 default_server;\n"
          << "\n"
          << "    root /var/www/html;\n"
          << "    index index.html index.htm index.nginx-debian.html;\n"
          << "\n"
          << "    server_name _;\n"
          << "\n"
          << "    location / {\n"
          << "        proxy_pass http://" << backendIp << ":" << backendPort << ";\n"
          << "        proxy_set_header Host $host;\n"
          << "        proxy_set_header X-Real-IP $remote_addr;\n"
          << "        proxy_set_header X-Forwarded-For $proxy_add_x_forwarded_for;\n"
          << "        proxy_set_header X-Forwarded-Proto $scheme;\n"
          << "    }\n"
          << "}\n";
    return block.str();
}
