#include "ConfigResolver.hpp"
#include "ExitCoordinator.hpp"
#include "HealthChecker.hpp"
#include "LifecycleOrchestrator.hpp"
#include "PctRuntimeClient.hpp"
#include "ServiceInstaller.hpp"
#include "Tracing.hpp"

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {
constexpr const char* kDefaultCatalogPath = "/usr/local/phoenix_hypervisor/etc/phoenix_lxc_configs.json";

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

int GetEnvInt(const char* name, int defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::logic_error& ex) {
        std::cerr << "[WARN] " << name << "=" << value << " is not a number (" << ex.what() << "); using "
                  << defaultValue << std::endl;
        return defaultValue;
    }

    if (parsed <= 0) {
        std::cerr << "[WARN] " << name << " must be positive; using " << defaultValue << std::endl;
        return defaultValue;
    }
    return parsed;
}

OrchestratorSettings LoadSettings() {
    OrchestratorSettings settings;
    settings.healthPolicy.maxAttempts = GetEnvInt("PROVISIONER_HEALTH_MAX_ATTEMPTS", 12);
    settings.healthPolicy.interval = std::chrono::seconds(GetEnvInt("PROVISIONER_HEALTH_INTERVAL_SECONDS", 10));

    const std::chrono::seconds waitTimeout(GetEnvInt("PROVISIONER_WAIT_TIMEOUT_SECONDS", 60));
    const std::chrono::seconds waitInterval(GetEnvInt("PROVISIONER_WAIT_INTERVAL_SECONDS", 3));
    settings.shutdownPolicy = RetryPolicy::FromTimeout(waitTimeout, waitInterval);
    settings.startPolicy = RetryPolicy::FromTimeout(waitTimeout, waitInterval);
    return settings;
}

std::unique_ptr<ServiceInstaller> InstallerFor(const TargetConfig& config, RuntimeClient& runtime) {
    if (!config.workload) {
        return nullptr;
    }
    return CreateInstaller(config.workload->kind, runtime);
}

StageResult ResolveTarget(const std::string& catalogPath, int ctid, TargetConfig& outConfig) {
    nlohmann::json catalog;
    const StageResult loaded = ConfigResolver::LoadCatalog(catalogPath, catalog);
    if (!loaded.Ok()) {
        return loaded;
    }
    return ConfigResolver::ResolveFromCatalog(catalog, ctid, outConfig);
}

// Finalize only needs the ctid and a snapshot name, so a missing catalog entry
// is tolerated when --snapshot is given.
StageResult ResolveFinalizeTarget(
    const std::string& catalogPath,
    int ctid,
    const std::optional<std::string>& snapshotArg,
    TargetConfig& outConfig) {
    nlohmann::json catalog;
    const StageResult loaded = ConfigResolver::LoadCatalog(catalogPath, catalog);
    const bool hasEntry = loaded.Ok()
        && catalog.contains("lxc_configs")
        && catalog["lxc_configs"].is_object()
        && catalog["lxc_configs"].contains(std::to_string(ctid));

    if (hasEntry) {
        const StageResult resolved = ConfigResolver::ResolveFromCatalog(catalog, ctid, outConfig);
        if (!resolved.Ok()) {
            return resolved;
        }
    } else if (snapshotArg) {
        std::cout << "[INFO] No catalog entry for CTID " << ctid << "; finalizing with --snapshot only." << std::endl;
        outConfig = TargetConfig();
        outConfig.ctid = ctid;
    } else if (!loaded.Ok()) {
        return loaded;
    } else {
        return StageResult::Failure(
            ErrorKind::CONFIG_INVALID,
            "resolve-config",
            "no catalog entry for CTID " + std::to_string(ctid) + " and no --snapshot given");
    }

    if (snapshotArg) {
        outConfig.templateSnapshot = *snapshotArg;
    }
    if (!outConfig.templateSnapshot || outConfig.templateSnapshot->empty()) {
        return StageResult::Failure(
            ErrorKind::INVALID_ARGUMENTS,
            "resolve-config",
            "snapshot name not given and 'template_snapshot_name' not set for CTID " + std::to_string(ctid));
    }
    return StageResult::Success("resolve-config");
}

int RunWorkflow(
    const std::string& workflow,
    int ctid,
    const std::function<StageResult()>& run) {
    auto span = Tracer::Instance().StartSpan("provisioner." + workflow);
    Tracer::Instance().SetAttribute(span, "container.id", static_cast<int64_t>(ctid));

    StageResult result;
    try {
        result = run();
    } catch (const std::exception& ex) {
        result = StageResult::Failure(ErrorKind::UNCLASSIFIED, workflow, ex.what());
    }

    Tracer::Instance().SetAttribute(span, "provisioner.error_kind", ToString(result.kind));
    Tracer::Instance().EndSpan(span, result.Ok(), result.message);
    return ExitCoordinator::Finish(result, workflow, ctid);
}
} // namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("lxc-provisioner", "1.0.0");
    program.add_description("Idempotent LXC provisioning: clone, configure, install, verify and snapshot.");

    argparse::ArgumentParser cloneCmd("clone");
    cloneCmd.add_description("Clone a container from a source snapshot and apply its network configuration.");
    cloneCmd.add_argument("source_ctid").help("source container ID").scan<'i', int>();
    cloneCmd.add_argument("snapshot").help("snapshot on the source container");
    cloneCmd.add_argument("target_ctid").help("new container ID").scan<'i', int>();
    cloneCmd.add_argument("config_file").help("path to the catalog JSON file");
    cloneCmd.add_argument("target_json").help("JSON configuration block of the target container");

    argparse::ArgumentParser setupCmd("setup");
    setupCmd.add_description("Install, configure and verify the workload of an existing container.");
    setupCmd.add_argument("ctid").help("container ID").scan<'i', int>();
    setupCmd.add_argument("--config").help("path to the catalog JSON file");

    argparse::ArgumentParser finalizeCmd("finalize");
    finalizeCmd.add_description("Shut down, snapshot and restart a container.");
    finalizeCmd.add_argument("ctid").help("container ID").scan<'i', int>();
    finalizeCmd.add_argument("--snapshot").help("snapshot name (defaults to template_snapshot_name)");
    finalizeCmd.add_argument("--config").help("path to the catalog JSON file");

    argparse::ArgumentParser provisionCmd("provision");
    provisionCmd.add_description("Run the full pipeline for a catalog entry.");
    provisionCmd.add_argument("ctid").help("container ID").scan<'i', int>();
    provisionCmd.add_argument("--config").help("path to the catalog JSON file");

    program.add_subparser(cloneCmd);
    program.add_subparser(setupCmd);
    program.add_subparser(finalizeCmd);
    program.add_subparser(provisionCmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << "[ERROR] " << err.what() << std::endl;
        std::cerr << program;
        return ExitCoordinator::ExitCodeFor(ErrorKind::INVALID_ARGUMENTS);
    }

    const std::string defaultCatalog = GetEnvOrDefault("PROVISIONER_CONFIG_FILE", kDefaultCatalogPath);
    const std::string pctBinary = GetEnvOrDefault("PROVISIONER_PCT_BINARY", "pct");

    TraceConfig traceConfig;
    traceConfig.enabled = GetEnvBool("PROVISIONER_OTEL_ENABLED", false);
    traceConfig.endpoint = GetEnvOrDefault("PROVISIONER_OTEL_ENDPOINT", "");
    traceConfig.serviceName = "lxc-provisioner";
    Tracer::Instance().Configure(traceConfig);

    PctRuntimeClient runtime(pctBinary);
    const OrchestratorSettings settings = LoadSettings();
    std::cout << "[INFO] Health policy " << settings.healthPolicy.maxAttempts << " attempts; wait policy "
              << settings.startPolicy.maxAttempts << " checks" << std::endl;

    int exitCode = ExitCoordinator::ExitCodeFor(ErrorKind::INVALID_ARGUMENTS);
    if (program.is_subcommand_used("clone")) {
        const int targetCtid = cloneCmd.get<int>("target_ctid");
        exitCode = RunWorkflow("clone", targetCtid, [&] {
            nlohmann::json catalog;
            StageResult result = ConfigResolver::LoadCatalog(cloneCmd.get<std::string>("config_file"), catalog);
            if (!result.Ok()) {
                return result;
            }

            TargetConfig config;
            result = ConfigResolver::ResolveBlockText(cloneCmd.get<std::string>("target_json"), targetCtid, config);
            if (!result.Ok()) {
                return result;
            }

            SourceRef source;
            source.sourceCtid = cloneCmd.get<int>("source_ctid");
            source.snapshotName = cloneCmd.get<std::string>("snapshot");
            if (source.sourceCtid <= 0 || source.snapshotName.empty()) {
                return StageResult::Failure(ErrorKind::INVALID_ARGUMENTS, "clone", "source CTID and snapshot are required");
            }

            auto installer = InstallerFor(config, runtime);
            LifecycleOrchestrator orchestrator(runtime, config, std::move(installer), HealthChecker(), settings);
            return orchestrator.Clone(source);
        });
    } else if (program.is_subcommand_used("setup")) {
        const int ctid = setupCmd.get<int>("ctid");
        const std::string catalogPath = setupCmd.present("--config").value_or(defaultCatalog);
        exitCode = RunWorkflow("setup", ctid, [&] {
            TargetConfig config;
            const StageResult resolved = ResolveTarget(catalogPath, ctid, config);
            if (!resolved.Ok()) {
                return resolved;
            }
            auto installer = InstallerFor(config, runtime);
            LifecycleOrchestrator orchestrator(runtime, config, std::move(installer), HealthChecker(), settings);
            return orchestrator.Setup();
        });
    } else if (program.is_subcommand_used("finalize")) {
        const int ctid = finalizeCmd.get<int>("ctid");
        const std::string catalogPath = finalizeCmd.present("--config").value_or(defaultCatalog);
        const std::optional<std::string> snapshotArg = finalizeCmd.present("--snapshot");
        exitCode = RunWorkflow("finalize", ctid, [&] {
            TargetConfig config;
            const StageResult resolved = ResolveFinalizeTarget(catalogPath, ctid, snapshotArg, config);
            if (!resolved.Ok()) {
                return resolved;
            }
            const std::string snapshotName = *config.templateSnapshot;
            LifecycleOrchestrator orchestrator(runtime, config, nullptr, HealthChecker(), settings);
            return orchestrator.Finalize(snapshotName);
        });
    } else if (program.is_subcommand_used("provision")) {
        const int ctid = provisionCmd.get<int>("ctid");
        const std::string catalogPath = provisionCmd.present("--config").value_or(defaultCatalog);
        exitCode = RunWorkflow("provision", ctid, [&] {
            TargetConfig config;
            const StageResult resolved = ResolveTarget(catalogPath, ctid, config);
            if (!resolved.Ok()) {
                return resolved;
            }
            auto installer = InstallerFor(config, runtime);
            LifecycleOrchestrator orchestrator(runtime, config, std::move(installer), HealthChecker(), settings);
            return orchestrator.Provision();
        });
    } else {
        std::cerr << program;
    }

    Tracer::Instance().Shutdown();
    return exitCode;
}
