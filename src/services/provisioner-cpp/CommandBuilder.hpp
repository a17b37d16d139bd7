#pragma once

#include "ProvisionTypes.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

// Pure translation from resolved configuration to runtime operation values.
// CloneSpec never carries network settings; net0 is applied after the clone.
class CommandBuilder {
public:
    static CloneSpec BuildCloneSpec(const TargetConfig& config, const SourceRef& source);
    static std::optional<NetworkSpec> BuildNetworkSpec(const TargetConfig& config);

    static std::string FormatStorage(const TargetConfig& config);
    static std::string JoinFeatures(const std::vector<std::string>& features);
    static std::string FormatNetworkValue(const NetworkSpec& spec);

    static std::map<std::string, std::string> ParseNetworkValue(const std::string& value);
    static bool NetworkValueMatches(const std::string& current, const std::string& desired);
};
