#pragma once

#include "ProvisionTypes.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

struct ContainerStatus {
    bool exists = false;
    bool running = false;
};

struct RuntimeResult {
    int exitCode = 0;
    std::string stdoutText;
    std::string stderrText;

    bool Ok() const {
        return exitCode == 0;
    }
};

// Capability surface of the host container runtime.
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    virtual ContainerStatus Status(int ctid) = 0;
    virtual RuntimeResult Clone(const CloneSpec& spec) = 0;
    virtual RuntimeResult SetProperty(int ctid, const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> GetProperty(int ctid, const std::string& key) = 0;
    virtual std::set<std::string> SnapshotList(int ctid) = 0;
    virtual RuntimeResult SnapshotCreate(int ctid, const std::string& name) = 0;
    virtual RuntimeResult Shutdown(int ctid) = 0;
    virtual RuntimeResult Start(int ctid) = 0;
    virtual RuntimeResult Exec(int ctid, const std::vector<std::string>& command) = 0;
    virtual RuntimeResult Push(int ctid, const std::string& localPath, const std::string& remotePath) = 0;
};
