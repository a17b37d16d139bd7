#include "FakeRuntimeClient.hpp"
#include "NginxProxyInstaller.hpp"
#include "ProcessRunner.hpp"
#include "VllmInstaller.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

bool Ran(const FakeRuntimeClient& runtime, const std::string& joined) {
    for (const auto& command : runtime.execs) {
        if (JoinArgs(command) == joined) {
            return true;
        }
    }
    return false;
}

TargetConfig NginxConfig() {
    TargetConfig config;
    config.ctid = 953;
    config.name = "Nginx-VscodeRag";
    NetworkConfig network;
    network.ifName = "eth0";
    network.ip = "10.0.0.153/24";
    network.gateway = "10.0.0.1";
    config.network = network;

    WorkloadConfig workload;
    workload.kind = WorkloadKind::NGINX_PROXY;
    workload.backendIp = "10.0.0.151";
    workload.backendPort = 8000;
    config.workload = workload;
    return config;
}

TargetConfig VllmConfig(WorkloadKind kind) {
    TargetConfig config;
    config.ctid = 950;
    config.name = "vllm-qwen";
    NetworkConfig network;
    network.ifName = "eth0";
    network.ip = "10.0.0.150/24";
    network.gateway = "10.0.0.1";
    config.network = network;

    WorkloadConfig workload;
    workload.kind = kind;
    workload.model = "Qwen/Qwen2.5-7B-Instruct";
    workload.tensorParallelSize = 2;
    workload.servePort = 8000;
    config.workload = workload;
    return config;
}
} // namespace

int main() {
    const std::string block = NginxProxyInstaller::RenderServerBlock("10.0.0.151", 8000);
    if (block.find("proxy_pass http://10.0.0.151:8000;") == std::string::npos
        || block.find("listen 80 default_server;") == std::string::npos
        || block.find("proxy_set_header X-Forwarded-For $proxy_add_x_forwarded_for;") == std::string::npos) {
        return Fail("Unexpected nginx server block:\n" + block);
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"dpkg-query"}, 1);
        NginxProxyInstaller installer(runtime);
        const TargetConfig config = NginxConfig();

        if (installer.IsInstalled(953, config)) {
            return Fail("nginx must not be reported installed when dpkg-query fails.");
        }
        if (!installer.Install(953, config).Ok()) {
            return Fail("nginx install failed.");
        }
        if (!Ran(runtime, "env DEBIAN_FRONTEND=noninteractive apt-get install -y nginx")) {
            return Fail("nginx package install not issued.");
        }

        if (!installer.Configure(953, config).Ok()) {
            return Fail("nginx configure failed.");
        }
        const auto pushed = runtime.pushedContent.find(NginxProxyInstaller::kSitePath);
        if (pushed == runtime.pushedContent.end() || pushed->second != block) {
            return Fail("Site file not pushed with the rendered server block.");
        }
        if (!Ran(runtime, "ln -sf /etc/nginx/sites-available/provisioner-proxy /etc/nginx/sites-enabled/provisioner-proxy")) {
            return Fail("Site not linked into sites-enabled.");
        }
        if (!Ran(runtime, "rm -f /etc/nginx/sites-enabled/default")) {
            return Fail("Default site symlink not removed.");
        }
        if (!Ran(runtime, "nginx -t")) {
            return Fail("nginx configuration not tested.");
        }

        if (!installer.ManageService(953).Ok()) {
            return Fail("nginx service management failed.");
        }
        if (!Ran(runtime, "systemctl daemon-reload") || !Ran(runtime, "systemctl enable nginx")
            || !Ran(runtime, "systemctl restart nginx")) {
            return Fail("systemd reload, enable and restart expected.");
        }

        const auto health = installer.HealthEndpoint(config);
        if (!health || health->host != "10.0.0.153" || health->port != 80 || health->path != "/") {
            return Fail("nginx health endpoint incorrect.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"dpkg-query"}, 0, "install ok installed");
        runtime.ScriptExec({"test", "-f"}, 1);
        NginxProxyInstaller installer(runtime);
        if (installer.IsInstalled(953, NginxConfig())) {
            return Fail("Package without the generated site must not count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"dpkg-query"}, 0, "install ok installed");
        runtime.ScriptExec({"test", "-L"}, 1);
        runtime.ScriptExec({"test", "-e"}, 1);
        NginxProxyInstaller installer(runtime);
        if (installer.IsInstalled(953, NginxConfig())) {
            return Fail("Site file that is not linked into sites-enabled must not count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"dpkg-query"}, 0, "install ok installed");
        NginxProxyInstaller installer(runtime);
        if (installer.IsInstalled(953, NginxConfig())) {
            return Fail("Default site still enabled must not count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"dpkg-query"}, 0, "install ok installed");
        runtime.ScriptExec({"test", "-e"}, 1);
        NginxProxyInstaller installer(runtime);
        if (!installer.IsInstalled(953, NginxConfig())) {
            return Fail("Package, linked site and no default site must count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"nginx", "-t"}, 1);
        NginxProxyInstaller installer(runtime);
        const StageResult result = installer.Configure(953, NginxConfig());
        if (result.kind != ErrorKind::POST_CLONE_CONFIG_FAILED) {
            return Fail("Rejected nginx configuration must report PostCloneConfigFailed.");
        }
        if (!Ran(runtime, "rm -f /etc/nginx/sites-enabled/provisioner-proxy")) {
            return Fail("Rejected site must be unlinked from sites-enabled.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"env", "DEBIAN_FRONTEND=noninteractive", "apt-get"}, 100);
        NginxProxyInstaller installer(runtime);
        const StageResult result = installer.Install(953, NginxConfig());
        if (result.kind != ErrorKind::INSTALL_FAILED || result.toolExitCode != 100) {
            return Fail("apt-get failure must report InstallFailed with its exit code.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(953, true);
        runtime.ScriptExec({"systemctl", "restart"}, 1);
        runtime.ScriptExec({"journalctl"}, 0, "nginx: [emerg] bind() to 0.0.0.0:80 failed");
        NginxProxyInstaller installer(runtime);
        const StageResult result = installer.ManageService(953);
        if (result.kind != ErrorKind::POST_CLONE_CONFIG_FAILED) {
            return Fail("Failed restart must report PostCloneConfigFailed.");
        }
        if (!Ran(runtime, "journalctl -u nginx --no-pager -n 50")) {
            return Fail("Failed restart must fetch the last 50 journal lines.");
        }
    }

    const std::string unit = VllmInstaller::RenderUnit("/opt/vllm/bin/vllm", VllmConfig(WorkloadKind::VLLM_SOURCE).workload.value());
    if (unit.find("ExecStart=/opt/vllm/bin/vllm serve Qwen/Qwen2.5-7B-Instruct --host 0.0.0.0 --port 8000 --tensor-parallel-size 2")
        == std::string::npos) {
        return Fail("Unexpected vllm unit:\n" + unit);
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(950, true);
        VllmSourceInstaller installer(runtime);
        const TargetConfig config = VllmConfig(WorkloadKind::VLLM_SOURCE);
        if (!installer.Install(950, config).Ok()) {
            return Fail("vLLM source install failed.");
        }
        if (!Ran(runtime, "nvidia-smi") || !Ran(runtime, "python3.11 -m venv /opt/vllm")
            || !Ran(runtime, "/opt/vllm/bin/pip install -e /opt/vllm_repo")) {
            return Fail("vLLM source install steps missing.");
        }
        if (!Ran(runtime, "git -C /opt/vllm_repo pull --ff-only")) {
            return Fail("Existing checkout must be updated instead of cloned.");
        }

        if (!installer.Configure(950, config).Ok()
            || runtime.pushedContent[VllmInstaller::kUnitPath].find("--tensor-parallel-size 2") == std::string::npos) {
            return Fail("vLLM unit not written.");
        }

        const auto health = installer.HealthEndpoint(config);
        if (!health || health->host != "10.0.0.150" || health->port != 8000 || health->path != "/health") {
            return Fail("vLLM health endpoint incorrect.");
        }
    }

    {
        const auto fresh = VllmSourceInstaller::BuildInstallSteps(false);
        bool clones = false;
        for (const auto& step : fresh) {
            if (JoinArgs(step) == "git clone https://github.com/vllm-project/vllm.git /opt/vllm_repo") {
                clones = true;
            }
        }
        if (!clones) {
            return Fail("Fresh install must clone the vLLM repository.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(950, true);
        runtime.ScriptExec({"nvidia-smi"}, 9);
        VllmSourceInstaller installer(runtime);
        const StageResult result = installer.Install(950, VllmConfig(WorkloadKind::VLLM_SOURCE));
        if (result.kind != ErrorKind::INSTALL_FAILED || runtime.execs.size() != 1) {
            return Fail("Missing GPU must fail before any install step.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(950, true);
        runtime.ScriptExec({"/opt/vllm/bin/pip", "show"}, 0, "Name: vllm\nLocation: /opt/vllm/lib/python3.11/site-packages\n");
        VllmSourceInstaller installer(runtime);
        if (installer.IsInstalled(950, VllmConfig(WorkloadKind::VLLM_SOURCE))) {
            return Fail("vLLM not installed from the checkout must not count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(950, true);
        runtime.ScriptExec({"/opt/vllm/bin/pip", "show"}, 0, "Name: vllm\nEditable project location: /opt/vllm_repo\n");
        VllmSourceInstaller installer(runtime);
        if (!installer.IsInstalled(950, VllmConfig(WorkloadKind::VLLM_SOURCE))) {
            return Fail("Editable vLLM from the checkout must count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(950, true);
        runtime.ScriptExec({"pip3", "show"}, 0, "Name: vllm\nVersion: 0.6.3\nLocation: /usr/local/lib/python3.10/dist-packages\n");
        VllmPackageInstaller installer(runtime);
        TargetConfig config = VllmConfig(WorkloadKind::VLLM_PACKAGE);
        config.workload->packageVersion = "0.6.3";
        if (!installer.Install(950, config).Ok() || !Ran(runtime, "pip3 install vllm==0.6.3")) {
            return Fail("Pinned vLLM package not installed.");
        }
        if (!Ran(runtime, "python3 -m vllm.entrypoints.api_server --help")) {
            return Fail("vLLM package entrypoint not verified.");
        }
        if (VllmPackageInstaller::PackageRequirement("") != "vllm") {
            return Fail("Unpinned requirement must be plain vllm.");
        }
        if (!installer.IsInstalled(950, config)) {
            return Fail("Pinned version with unit present must count as installed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        runtime.AddContainer(950, true);
        runtime.ScriptExec({"pip3", "show"}, 0, "Name: vllm\nVersion: 0.4.0\n");
        VllmPackageInstaller installer(runtime);
        TargetConfig config = VllmConfig(WorkloadKind::VLLM_PACKAGE);
        config.workload->packageVersion = "0.5.3";
        if (installer.IsInstalled(950, config)) {
            return Fail("vllm 0.4.0 must not satisfy a 0.5.3 pin.");
        }

        config.workload->packageVersion.clear();
        if (!installer.IsInstalled(950, config)) {
            return Fail("Any installed vllm must satisfy an unpinned workload.");
        }
        if (VllmPackageInstaller::InstalledVersion("Name: vllm\nVersion:  0.4.0\r\nSummary: x\n") != "0.4.0"
            || !VllmPackageInstaller::InstalledVersion("Name: vllm\n").empty()) {
            return Fail("Version line of pip show not parsed.");
        }
    }

    {
        FakeRuntimeClient runtime;
        if (CreateInstaller(WorkloadKind::NGINX_PROXY, runtime)->ServiceName() != "nginx"
            || CreateInstaller(WorkloadKind::VLLM_SOURCE, runtime)->Name() != "vllm-source"
            || CreateInstaller(WorkloadKind::VLLM_PACKAGE, runtime)->Name() != "vllm-package") {
            return Fail("Installer factory returned the wrong variant.");
        }
    }

    return 0;
}
