#include "CommandBuilder.hpp"

#include <cctype>
#include <sstream>

namespace {
std::string ToLower(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}
} // namespace

CloneSpec CommandBuilder::BuildCloneSpec(const TargetConfig& config, const SourceRef& source) {
    CloneSpec spec;
    spec.sourceCtid = source.sourceCtid;
    spec.targetCtid = config.ctid;
    spec.snapshotName = source.snapshotName;
    spec.hostname = config.name;
    spec.memoryMB = config.memoryMB;
    spec.cores = config.cores;
    spec.storage = FormatStorage(config);
    spec.features = JoinFeatures(config.features);
    spec.unprivileged = config.unprivileged ? "1" : "0";
    return spec;
}

std::optional<NetworkSpec> CommandBuilder::BuildNetworkSpec(const TargetConfig& config) {
    if (!config.network) {
        return std::nullopt;
    }

    NetworkSpec spec;
    spec.ifName = config.network->ifName;
    spec.bridge = config.network->bridge;
    spec.ip = config.network->ip;
    spec.gateway = config.network->gateway;
    spec.macAddress = config.macAddress;
    return spec;
}

std::string CommandBuilder::FormatStorage(const TargetConfig& config) {
    if (!config.storageSizeGB) {
        return config.storagePool;
    }
    return config.storagePool + ":" + std::to_string(*config.storageSizeGB);
}

std::string CommandBuilder::JoinFeatures(const std::vector<std::string>& features) {
    std::string joined;
    for (const auto& feature : features) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined += feature;
    }
    return joined;
}

std::string CommandBuilder::FormatNetworkValue(const NetworkSpec& spec) {
    std::ostringstream value;
    value << "name=" << spec.ifName
          << ",bridge=" << spec.bridge
          << ",ip=" << spec.ip
          << ",gw=" << spec.gateway;
    if (spec.macAddress) {
        value << ",hwaddr=" << *spec.macAddress;
    }
    return value.str();
}

std::map<std::string, std::string> CommandBuilder::ParseNetworkValue(const std::string& value) {
    std::map<std::string, std::string> fields;
    std::istringstream stream(value);
    std::string pair;
    while (std::getline(stream, pair, ',')) {
        const auto equals = pair.find('=');
        if (equals == std::string::npos || equals == 0) {
            continue;
        }
        fields[pair.substr(0, equals)] = pair.substr(equals + 1);
    }
    return fields;
}

// The runtime adds keys of its own (type=veth, firewall) and may upper-case the
// MAC, so only the keys we asked for are compared.
bool CommandBuilder::NetworkValueMatches(const std::string& current, const std::string& desired) {
    if (current.empty()) {
        return false;
    }

    const auto currentFields = ParseNetworkValue(current);
    for (const auto& [key, expected] : ParseNetworkValue(desired)) {
        const auto it = currentFields.find(key);
        if (it == currentFields.end()) {
            return false;
        }
        if (ToLower(it->second) != ToLower(expected)) {
            return false;
        }
    }
    return true;
}
