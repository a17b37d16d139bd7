#include "VllmInstaller.hpp"

#include <iostream>
#include <sstream>

namespace {
constexpr const char* kInstallStage = "install";
constexpr const char* kConfigureStage = "configure";
} // namespace

VllmInstaller::VllmInstaller(RuntimeClient& runtime)
    : ServiceInstaller(runtime) {}

std::string VllmInstaller::ServiceName() const {
    return "vllm";
}

StageResult VllmInstaller::Configure(int ctid, const TargetConfig& config) {
    if (!config.workload || config.workload->model.empty()) {
        return StageResult::Failure(
            ErrorKind::CONFIG_INVALID,
            kConfigureStage,
            "field 'workload.model' is required for " + Name());
    }

    std::cout << "[Installer] Writing " << kUnitPath << " for model " << config.workload->model
              << " in CTID " << ctid << std::endl;
    return WriteFile(ctid, RenderUnit(VllmBinary(), *config.workload), kUnitPath);
}

std::optional<HealthTarget> VllmInstaller::HealthEndpoint(const TargetConfig& config) const {
    const auto host = ContainerAddress(config);
    if (!host) {
        return std::nullopt;
    }

    HealthTarget target;
    target.host = *host;
    target.port = 8000;
    target.path = "/health";
    if (config.workload) {
        target.port = config.workload->servePort;
        if (config.workload->healthPort > 0) {
            target.port = config.workload->healthPort;
        }
        if (!config.workload->healthPath.empty()) {
            target.path = config.workload->healthPath;
        }
    }
    return target;
}

std::string VllmInstaller::RenderUnit(const std::string& vllmBinary, const WorkloadConfig& workload) {
    std::ostringstream unit;
    unit << "[Unit]\n"
         << "Description=vLLM OpenAI-compatible server (" << workload.model << ")\n"
         << "After=network-online.target\n"
         << "Wants=network-online.target\n"
         << "\n"
         << "[Service]\n"
         << "Type=simple\n"
         << "User=root\n"
         << "ExecStart=" << vllmBinary << " serve " << workload.model
         << " --host 0.0.0.0"
         << " --port " << workload.servePort
         << " --tensor-parallel-size " << workload.tensorParallelSize << "\n"
         << "Restart=always\n"
         << "RestartSec=10\n"
         << "Environment=PYTHONUNBUFFERED=1\n"
         << "\n"
         << "[Install]\n"
         << "WantedBy=multi-user.target\n";
    return unit.str();
}

bool VllmInstaller::UnitPresent(int ctid) {
    return Succeeds(ctid, {"test", "-f", kUnitPath});
}

VllmSourceInstaller::VllmSourceInstaller(RuntimeClient& runtime)
    : VllmInstaller(runtime) {}

std::string VllmSourceInstaller::Name() const {
    return "vllm-source";
}

std::string VllmSourceInstaller::VllmBinary() const {
    return std::string(kVenvDir) + "/bin/vllm";
}

bool VllmSourceInstaller::IsInstalled(int ctid, const TargetConfig& config) {
    (void)config;
    if (!Succeeds(ctid, {"test", "-x", std::string(kVenvDir) + "/bin/python"})) {
        return false;
    }
    const RuntimeResult show = runtime_.Exec(ctid, {std::string(kVenvDir) + "/bin/pip", "show", "vllm"});
    if (!show.Ok() || show.stdoutText.find(kRepoDir) == std::string::npos) {
        return false;
    }
    return UnitPresent(ctid);
}

StageResult VllmSourceInstaller::Install(int ctid, const TargetConfig& config) {
    (void)config;
    std::cout << "[Installer] Checking GPU access in CTID " << ctid << std::endl;
    const RuntimeResult gpu = runtime_.Exec(ctid, {"nvidia-smi"});
    if (!gpu.Ok()) {
        return StageResult::Failure(
            ErrorKind::INSTALL_FAILED,
            kInstallStage,
            "nvidia-smi failed in CTID " + std::to_string(ctid) + "; GPU passthrough is required",
            gpu.exitCode);
    }

    const bool repoPresent = Succeeds(ctid, {"test", "-d", std::string(kRepoDir) + "/.git"});
    std::cout << "[Installer] Building vLLM from source in CTID " << ctid
              << (repoPresent ? " (updating existing checkout)" : "") << std::endl;

    const StageResult built = RunSteps(ctid, BuildInstallSteps(repoPresent), ErrorKind::INSTALL_FAILED, kInstallStage);
    if (!built.Ok()) {
        return built;
    }

    const RuntimeResult verify = runtime_.Exec(
        ctid,
        {std::string(kVenvDir) + "/bin/python", "-c", "import vllm; print(vllm.__version__)"});
    if (!verify.Ok()) {
        return StageResult::Failure(ErrorKind::INSTALL_FAILED, kInstallStage, "vllm import check failed", verify.exitCode);
    }
    std::cout << "[Installer] vLLM " << verify.stdoutText << " installed in CTID " << ctid << std::endl;
    return StageResult::Success(kInstallStage);
}

std::vector<std::vector<std::string>> VllmSourceInstaller::BuildInstallSteps(bool repoPresent) {
    const std::string pip = std::string(kVenvDir) + "/bin/pip";
    std::vector<std::vector<std::string>> steps = {
        {"apt-get", "update"},
        {"env", "DEBIAN_FRONTEND=noninteractive", "apt-get", "install", "-y", "software-properties-common"},
        {"add-apt-repository", "-y", "ppa:deadsnakes/ppa"},
        {"apt-get", "update"},
        {"env", "DEBIAN_FRONTEND=noninteractive", "apt-get", "install", "-y",
         "python3.11-full", "python3.11-dev", "python3.11-venv", "python3-pip",
         "build-essential", "cmake", "git", "ninja-build"},
        {"python3.11", "-m", "venv", kVenvDir},
        {pip, "install", "--upgrade", "pip"},
        {pip, "install", "--pre", "torch", "torchvision", "torchaudio", "--index-url", kTorchIndex},
    };

    if (repoPresent) {
        steps.push_back({"git", "-C", kRepoDir, "pull", "--ff-only"});
    } else {
        steps.push_back({"git", "clone", kRepoUrl, kRepoDir});
    }
    steps.push_back({pip, "install", "-e", kRepoDir});
    steps.push_back({"rm", "-rf", "/root/.cache/pip"});
    return steps;
}

VllmPackageInstaller::VllmPackageInstaller(RuntimeClient& runtime)
    : VllmInstaller(runtime) {}

std::string VllmPackageInstaller::Name() const {
    return "vllm-package";
}

std::string VllmPackageInstaller::VllmBinary() const {
    return "/usr/local/bin/vllm";
}

bool VllmPackageInstaller::IsInstalled(int ctid, const TargetConfig& config) {
    const RuntimeResult show = runtime_.Exec(ctid, {"pip3", "show", "vllm"});
    if (!show.Ok()) {
        return false;
    }

    const std::string pinned = config.workload ? config.workload->packageVersion : std::string();
    if (!pinned.empty()) {
        const std::string installed = InstalledVersion(show.stdoutText);
        if (installed != pinned) {
            std::cout << "[Installer] CTID " << ctid << " has vllm " << (installed.empty() ? "(unknown)" : installed)
                      << ", pinned " << pinned << std::endl;
            return false;
        }
    }
    return UnitPresent(ctid);
}

StageResult VllmPackageInstaller::Install(int ctid, const TargetConfig& config) {
    const std::string requirement = PackageRequirement(config.workload ? config.workload->packageVersion : std::string());
    std::cout << "[Installer] Installing " << requirement << " with pip3 in CTID " << ctid << std::endl;

    const StageResult installed = RunSteps(
        ctid,
        {
            {"apt-get", "update"},
            {"env", "DEBIAN_FRONTEND=noninteractive", "apt-get", "install", "-y", "python3-pip"},
            {"pip3", "install", requirement},
        },
        ErrorKind::INSTALL_FAILED,
        kInstallStage);
    if (!installed.Ok()) {
        return installed;
    }

    const RuntimeResult verify = runtime_.Exec(ctid, {"python3", "-m", "vllm.entrypoints.api_server", "--help"});
    if (!verify.Ok()) {
        return StageResult::Failure(ErrorKind::INSTALL_FAILED, kInstallStage, "vllm entrypoint check failed", verify.exitCode);
    }
    return StageResult::Success(kInstallStage);
}

std::string VllmPackageInstaller::InstalledVersion(const std::string& pipShowOutput) {
    std::istringstream lines(pipShowOutput);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Version:", 0) != 0) {
            continue;
        }
        const auto begin = line.find_first_not_of(" \t", 8);
        const auto end = line.find_last_not_of(" \t\r");
        if (begin == std::string::npos) {
            return {};
        }
        return line.substr(begin, end - begin + 1);
    }
    return {};
}

std::string VllmPackageInstaller::PackageRequirement(const std::string& version) {
    if (version.empty()) {
        return "vllm";
    }
    return "vllm==" + version;
}
