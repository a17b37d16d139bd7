#pragma once

#include "ProvisionTypes.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

class ConfigResolver {
public:
    static StageResult LoadCatalog(const std::string& path, nlohmann::json& outCatalog);
    static StageResult ResolveFromCatalog(const nlohmann::json& catalog, int ctid, TargetConfig& outConfig);
    static StageResult ResolveBlockText(const std::string& blockText, int ctid, TargetConfig& outConfig);

    // ctid <= 0 means the block must carry its own "ctid" field.
    static StageResult ResolveBlock(const nlohmann::json& block, int ctid, TargetConfig& outConfig);

    static bool IsValidIpv4(const std::string& value);
    static bool IsValidCidr(const std::string& value);
    static bool IsValidMac(const std::string& value);
};
