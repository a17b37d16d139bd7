#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ProvisionState {
    ABSENT,
    CLONED,
    NETWORK_CONFIGURED,
    WORKLOAD_INSTALLED,
    VERIFIED,
    SNAPSHOTTED
};

enum class ErrorKind {
    OK,
    UNCLASSIFIED,
    INVALID_ARGUMENTS,
    CONFIG_INVALID,
    SOURCE_NOT_FOUND,
    CLONE_FAILED,
    POST_CLONE_CONFIG_FAILED,
    INSTALL_FAILED,
    HEALTH_CHECK_FAILED,
    SHUTDOWN_TIMEOUT,
    START_TIMEOUT,
    SNAPSHOT_FAILED
};

enum class WorkloadKind {
    NGINX_PROXY,
    VLLM_SOURCE,
    VLLM_PACKAGE
};

struct NetworkConfig {
    std::string ifName;
    std::string bridge = "vmbr0";
    std::string ip;
    std::string gateway;
};

struct WorkloadConfig {
    WorkloadKind kind = WorkloadKind::NGINX_PROXY;
    std::string backendIp;
    int backendPort = 8000;
    std::string model;
    int tensorParallelSize = 1;
    int servePort = 8000;
    std::string packageVersion;
    std::string healthPath;
    int healthPort = 0;
};

struct SourceRef {
    int sourceCtid = 0;
    std::string snapshotName;
};

// Resolved once from the catalog and never mutated afterwards.
struct TargetConfig {
    int ctid = 0;
    std::string name;
    int memoryMB = 0;
    int cores = 0;
    std::string storagePool;
    std::optional<int> storageSizeGB;
    std::vector<std::string> features;
    bool unprivileged = false;
    std::optional<NetworkConfig> network;
    std::optional<std::string> macAddress;
    std::optional<WorkloadConfig> workload;
    std::optional<SourceRef> source;
    std::optional<std::string> templateSnapshot;
};

struct CloneSpec {
    int sourceCtid = 0;
    int targetCtid = 0;
    std::string snapshotName;
    std::string hostname;
    int memoryMB = 0;
    int cores = 0;
    std::string storage;
    std::string features;
    std::string unprivileged;

    bool operator==(const CloneSpec& other) const {
        return sourceCtid == other.sourceCtid
            && targetCtid == other.targetCtid
            && snapshotName == other.snapshotName
            && hostname == other.hostname
            && memoryMB == other.memoryMB
            && cores == other.cores
            && storage == other.storage
            && features == other.features
            && unprivileged == other.unprivileged;
    }
};

struct NetworkSpec {
    std::string ifName;
    std::string bridge;
    std::string ip;
    std::string gateway;
    std::optional<std::string> macAddress;
};

struct HealthCheckOutcome {
    int attempt = 0;
    std::optional<int> httpStatus;
    bool connectionFailed = false;
};

struct StageResult {
    ErrorKind kind = ErrorKind::OK;
    std::string stage;
    int toolExitCode = 0;
    std::string message;

    bool Ok() const {
        return kind == ErrorKind::OK;
    }

    static StageResult Success(std::string stage = {}) {
        StageResult result;
        result.stage = std::move(stage);
        return result;
    }

    static StageResult Failure(ErrorKind kind, std::string stage, std::string message, int toolExitCode = 0) {
        StageResult result;
        result.kind = kind;
        result.stage = std::move(stage);
        result.message = std::move(message);
        result.toolExitCode = toolExitCode;
        return result;
    }
};

const char* ToString(ProvisionState state);
const char* ToString(ErrorKind kind);
const char* ToString(WorkloadKind kind);
bool ParseWorkloadKind(const std::string& value, WorkloadKind& outKind);
