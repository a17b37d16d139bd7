#include "ConfigResolver.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <climits>
#include <fstream>
#include <sstream>
#include <utility>

namespace {
constexpr const char* kStage = "resolve-config";

StageResult Invalid(const std::string& field, const std::string& reason) {
    return StageResult::Failure(ErrorKind::CONFIG_INVALID, kStage, "field '" + field + "' " + reason);
}

bool IsAllDigits(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (const char ch : value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

StageResult ReadPositiveInt(const nlohmann::json& block, const std::string& key, int& out) {
    if (!block.contains(key) || block[key].is_null()) {
        return Invalid(key, "is required");
    }

    const auto& value = block[key];
    if (!value.is_number_integer()) {
        return Invalid(key, "must be an integer");
    }

    const long long number = value.get<long long>();
    if (number <= 0 || number > INT_MAX) {
        return Invalid(key, "must be a positive integer");
    }

    out = static_cast<int>(number);
    return StageResult::Success(kStage);
}

StageResult ReadPort(const nlohmann::json& block, const std::string& key, int& out) {
    if (!block.contains(key)) {
        return StageResult::Success(kStage);
    }

    const StageResult result = ReadPositiveInt(block, key, out);
    if (!result.Ok()) {
        return result;
    }
    if (out > 65535) {
        return Invalid(key, "must be a TCP port between 1 and 65535");
    }
    return result;
}

StageResult ReadString(const nlohmann::json& block, const std::string& key, bool required, std::string& out) {
    if (!block.contains(key) || block[key].is_null()) {
        return required ? Invalid(key, "is required") : StageResult::Success(kStage);
    }

    if (!block[key].is_string()) {
        return Invalid(key, "must be a string");
    }

    out = Trim(block[key].get<std::string>());
    if (out.empty()) {
        return Invalid(key, "must not be empty");
    }
    return StageResult::Success(kStage);
}

StageResult ReadFeatures(const nlohmann::json& block, std::vector<std::string>& out) {
    out.clear();
    if (!block.contains("features") || block["features"].is_null()) {
        return StageResult::Success(kStage);
    }

    const auto& features = block["features"];
    if (features.is_string()) {
        std::istringstream stream(features.get<std::string>());
        std::string item;
        while (std::getline(stream, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return StageResult::Success(kStage);
    }

    if (!features.is_array()) {
        return Invalid("features", "must be an array of strings");
    }

    for (const auto& item : features) {
        if (!item.is_string() || Trim(item.get<std::string>()).empty()) {
            return Invalid("features", "must contain only non-empty strings");
        }
        out.push_back(Trim(item.get<std::string>()));
    }
    return StageResult::Success(kStage);
}

StageResult ReadNetwork(const nlohmann::json& block, std::optional<NetworkConfig>& out) {
    if (!block.contains("network_config") || block["network_config"].is_null()) {
        return StageResult::Success(kStage);
    }

    const auto& network = block["network_config"];
    if (!network.is_object()) {
        return Invalid("network_config", "must be an object");
    }

    NetworkConfig config;
    StageResult result = ReadString(network, "name", true, config.ifName);
    if (!result.Ok()) {
        return Invalid("network_config.name", "is required");
    }

    std::string bridge;
    result = ReadString(network, "bridge", false, bridge);
    if (!result.Ok()) {
        return Invalid("network_config.bridge", "must be a non-empty string");
    }
    if (!bridge.empty()) {
        config.bridge = bridge;
    }

    result = ReadString(network, "ip", true, config.ip);
    if (!result.Ok() || !ConfigResolver::IsValidCidr(config.ip)) {
        return Invalid("network_config.ip", "must be an IPv4 CIDR such as 10.0.0.110/24");
    }

    result = ReadString(network, "gw", true, config.gateway);
    if (!result.Ok() || !ConfigResolver::IsValidIpv4(config.gateway)) {
        return Invalid("network_config.gw", "must be an IPv4 address");
    }

    out = std::move(config);
    return StageResult::Success(kStage);
}

StageResult ReadWorkload(const nlohmann::json& block, std::optional<WorkloadConfig>& out) {
    if (!block.contains("workload") || block["workload"].is_null()) {
        return StageResult::Success(kStage);
    }

    const auto& workload = block["workload"];
    if (!workload.is_object()) {
        return Invalid("workload", "must be an object");
    }

    std::string type;
    StageResult result = ReadString(workload, "type", true, type);
    if (!result.Ok()) {
        return Invalid("workload.type", "is required");
    }

    WorkloadConfig config;
    if (!ParseWorkloadKind(type, config.kind)) {
        return Invalid("workload.type", "must be one of nginx-proxy, vllm-source, vllm-package");
    }

    if (config.kind == WorkloadKind::NGINX_PROXY) {
        result = ReadString(workload, "backend_ip", true, config.backendIp);
        if (!result.Ok() || !ConfigResolver::IsValidIpv4(config.backendIp)) {
            return Invalid("workload.backend_ip", "must be an IPv4 address");
        }
        result = ReadPort(workload, "backend_port", config.backendPort);
        if (!result.Ok()) {
            return Invalid("workload.backend_port", "must be a TCP port between 1 and 65535");
        }
    } else {
        result = ReadString(workload, "model", true, config.model);
        if (!result.Ok()) {
            return Invalid("workload.model", "is required for vLLM workloads");
        }
        if (workload.contains("tensor_parallel_size")) {
            result = ReadPositiveInt(workload, "tensor_parallel_size", config.tensorParallelSize);
            if (!result.Ok()) {
                return Invalid("workload.tensor_parallel_size", "must be a positive integer");
            }
        }
        result = ReadPort(workload, "port", config.servePort);
        if (!result.Ok()) {
            return Invalid("workload.port", "must be a TCP port between 1 and 65535");
        }
        result = ReadString(workload, "version", false, config.packageVersion);
        if (!result.Ok()) {
            return Invalid("workload.version", "must be a non-empty string");
        }
    }

    result = ReadString(workload, "health_path", false, config.healthPath);
    if (!result.Ok() || (!config.healthPath.empty() && config.healthPath.front() != '/')) {
        return Invalid("workload.health_path", "must start with '/'");
    }
    result = ReadPort(workload, "health_port", config.healthPort);
    if (!result.Ok()) {
        return Invalid("workload.health_port", "must be a TCP port between 1 and 65535");
    }

    out = std::move(config);
    return StageResult::Success(kStage);
}
} // namespace

StageResult ConfigResolver::LoadCatalog(const std::string& path, nlohmann::json& outCatalog) {
    if (path.empty()) {
        return StageResult::Failure(ErrorKind::CONFIG_INVALID, kStage, "configuration file path is empty");
    }

    std::ifstream input(path);
    if (!input) {
        return StageResult::Failure(ErrorKind::CONFIG_INVALID, kStage, "unable to read configuration file " + path);
    }

    auto parsed = nlohmann::json::parse(input, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return StageResult::Failure(ErrorKind::CONFIG_INVALID, kStage, "configuration file " + path + " is not a JSON object");
    }

    outCatalog = std::move(parsed);
    return StageResult::Success(kStage);
}

StageResult ConfigResolver::ResolveFromCatalog(const nlohmann::json& catalog, int ctid, TargetConfig& outConfig) {
    if (!catalog.contains("lxc_configs") || !catalog["lxc_configs"].is_object()) {
        return Invalid("lxc_configs", "is required and must be an object keyed by ctid");
    }

    const std::string key = std::to_string(ctid);
    const auto& configs = catalog["lxc_configs"];
    if (!configs.contains(key)) {
        return Invalid("lxc_configs." + key, "is not defined in the catalog");
    }

    return ResolveBlock(configs[key], ctid, outConfig);
}

StageResult ConfigResolver::ResolveBlockText(const std::string& blockText, int ctid, TargetConfig& outConfig) {
    auto parsed = nlohmann::json::parse(blockText, nullptr, false);
    if (parsed.is_discarded()) {
        return StageResult::Failure(ErrorKind::CONFIG_INVALID, kStage, "target configuration block is not valid JSON");
    }
    return ResolveBlock(parsed, ctid, outConfig);
}

StageResult ConfigResolver::ResolveBlock(const nlohmann::json& block, int ctid, TargetConfig& outConfig) {
    if (!block.is_object()) {
        return StageResult::Failure(ErrorKind::CONFIG_INVALID, kStage, "target configuration block must be a JSON object");
    }

    TargetConfig config;
    if (block.contains("ctid")) {
        StageResult result = ReadPositiveInt(block, "ctid", config.ctid);
        if (!result.Ok()) {
            return result;
        }
        if (ctid > 0 && config.ctid != ctid) {
            return Invalid("ctid", "is " + std::to_string(config.ctid) + " but the target is " + std::to_string(ctid));
        }
    } else if (ctid > 0) {
        config.ctid = ctid;
    } else {
        return Invalid("ctid", "is required");
    }

    StageResult result = ReadString(block, "name", true, config.name);
    if (!result.Ok()) {
        return result;
    }
    result = ReadPositiveInt(block, "memory_mb", config.memoryMB);
    if (!result.Ok()) {
        return result;
    }
    result = ReadPositiveInt(block, "cores", config.cores);
    if (!result.Ok()) {
        return result;
    }
    result = ReadString(block, "storage_pool", true, config.storagePool);
    if (!result.Ok()) {
        return result;
    }

    if (block.contains("storage_size_gb") && !block["storage_size_gb"].is_null()) {
        int sizeGb = 0;
        result = ReadPositiveInt(block, "storage_size_gb", sizeGb);
        if (!result.Ok()) {
            return result;
        }
        config.storageSizeGB = sizeGb;
    }

    result = ReadFeatures(block, config.features);
    if (!result.Ok()) {
        return result;
    }

    if (block.contains("unprivileged") && !block["unprivileged"].is_null()) {
        if (!block["unprivileged"].is_boolean()) {
            return Invalid("unprivileged", "must be a boolean");
        }
        config.unprivileged = block["unprivileged"].get<bool>();
    }

    result = ReadNetwork(block, config.network);
    if (!result.Ok()) {
        return result;
    }

    std::string mac;
    result = ReadString(block, "mac_address", false, mac);
    if (!result.Ok()) {
        return result;
    }
    if (!mac.empty()) {
        if (!IsValidMac(mac)) {
            return Invalid("mac_address", "must be six colon-separated hex octets");
        }
        config.macAddress = mac;
    }

    result = ReadWorkload(block, config.workload);
    if (!result.Ok()) {
        return result;
    }

    if (block.contains("clone_from_ctid") && !block["clone_from_ctid"].is_null()) {
        SourceRef source;
        result = ReadPositiveInt(block, "clone_from_ctid", source.sourceCtid);
        if (!result.Ok()) {
            return result;
        }
        if (source.sourceCtid == config.ctid) {
            return Invalid("clone_from_ctid", "must differ from the target ctid");
        }
        result = ReadString(block, "clone_snapshot", true, source.snapshotName);
        if (!result.Ok()) {
            return result;
        }
        config.source = std::move(source);
    }

    std::string templateSnapshot;
    result = ReadString(block, "template_snapshot_name", false, templateSnapshot);
    if (!result.Ok()) {
        return result;
    }
    if (!templateSnapshot.empty()) {
        config.templateSnapshot = templateSnapshot;
    }

    outConfig = std::move(config);
    return StageResult::Success(kStage);
}

bool ConfigResolver::IsValidIpv4(const std::string& value) {
    std::istringstream stream(value);
    std::string octet;
    int count = 0;
    while (std::getline(stream, octet, '.')) {
        if (octet.size() > 3 || !IsAllDigits(octet) || std::stoi(octet) > 255) {
            return false;
        }
        ++count;
    }
    return count == 4 && !value.empty() && value.back() != '.';
}

bool ConfigResolver::IsValidCidr(const std::string& value) {
    const auto slash = value.find('/');
    if (slash == std::string::npos) {
        return false;
    }

    const std::string prefix = value.substr(slash + 1);
    if (prefix.size() > 2 || !IsAllDigits(prefix) || std::stoi(prefix) > 32) {
        return false;
    }

    return IsValidIpv4(value.substr(0, slash));
}

bool ConfigResolver::IsValidMac(const std::string& value) {
    if (value.size() != 17) {
        return false;
    }

    for (size_t i = 0; i < value.size(); ++i) {
        if (i % 3 == 2) {
            if (value[i] != ':') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}
