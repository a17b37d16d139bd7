#include "ProvisionTypes.hpp"

const char* ToString(ProvisionState state) {
    switch (state) {
    case ProvisionState::ABSENT:
        return "Absent";
    case ProvisionState::CLONED:
        return "Cloned";
    case ProvisionState::NETWORK_CONFIGURED:
        return "NetworkConfigured";
    case ProvisionState::WORKLOAD_INSTALLED:
        return "WorkloadInstalled";
    case ProvisionState::VERIFIED:
        return "Verified";
    case ProvisionState::SNAPSHOTTED:
        return "Snapshotted";
    }
    return "Unknown";
}

const char* ToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::OK:
        return "Ok";
    case ErrorKind::UNCLASSIFIED:
        return "Unclassified";
    case ErrorKind::INVALID_ARGUMENTS:
        return "InvalidArguments";
    case ErrorKind::CONFIG_INVALID:
        return "ConfigInvalid";
    case ErrorKind::SOURCE_NOT_FOUND:
        return "SourceNotFound";
    case ErrorKind::CLONE_FAILED:
        return "CloneFailed";
    case ErrorKind::POST_CLONE_CONFIG_FAILED:
        return "PostCloneConfigFailed";
    case ErrorKind::INSTALL_FAILED:
        return "InstallFailed";
    case ErrorKind::HEALTH_CHECK_FAILED:
        return "HealthCheckFailed";
    case ErrorKind::SHUTDOWN_TIMEOUT:
        return "ShutdownTimeout";
    case ErrorKind::START_TIMEOUT:
        return "StartTimeout";
    case ErrorKind::SNAPSHOT_FAILED:
        return "SnapshotFailed";
    }
    return "Unknown";
}

const char* ToString(WorkloadKind kind) {
    switch (kind) {
    case WorkloadKind::NGINX_PROXY:
        return "nginx-proxy";
    case WorkloadKind::VLLM_SOURCE:
        return "vllm-source";
    case WorkloadKind::VLLM_PACKAGE:
        return "vllm-package";
    }
    return "unknown";
}

bool ParseWorkloadKind(const std::string& value, WorkloadKind& outKind) {
    if (value == "nginx-proxy") {
        outKind = WorkloadKind::NGINX_PROXY;
        return true;
    }
    if (value == "vllm-source") {
        outKind = WorkloadKind::VLLM_SOURCE;
        return true;
    }
    if (value == "vllm-package") {
        outKind = WorkloadKind::VLLM_PACKAGE;
        return true;
    }
    return false;
}
