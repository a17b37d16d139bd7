#pragma once

#include "RuntimeClient.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// In-memory runtime. Exec results come from execHandler when it answers,
// then from the prefix script; unmatched commands succeed with empty output.
class FakeRuntimeClient : public RuntimeClient {
public:
    struct Container {
        bool running = false;
        std::map<std::string, std::string> properties;
        std::set<std::string> snapshots;
    };

    std::map<int, Container> containers;
    std::vector<CloneSpec> clones;
    std::vector<std::string> calls;
    std::vector<std::vector<std::string>> execs;
    std::vector<std::pair<std::string, std::string>> pushes;
    std::map<std::string, std::string> pushedContent;
    std::vector<std::pair<std::vector<std::string>, RuntimeResult>> execScript;
    std::function<void(const std::vector<std::string>&)> onExec;
    std::function<std::optional<RuntimeResult>(const std::vector<std::string>&)> execHandler;

    int cloneExitCode = 0;
    int setExitCode = 0;
    int snapshotExitCode = 0;
    int shutdownExitCode = 0;
    int startExitCode = 0;
    bool shutdownStops = true;
    bool startRuns = true;

    void AddContainer(int ctid, bool running, std::set<std::string> snapshots = {}) {
        Container container;
        container.running = running;
        container.snapshots = std::move(snapshots);
        containers[ctid] = container;
    }

    void ScriptExec(std::vector<std::string> prefix, int exitCode, std::string stdoutText = {}) {
        RuntimeResult result;
        result.exitCode = exitCode;
        result.stdoutText = std::move(stdoutText);
        execScript.emplace_back(std::move(prefix), result);
    }

    int CountCalls(const std::string& name) const {
        int count = 0;
        for (const auto& call : calls) {
            if (call == name) {
                ++count;
            }
        }
        return count;
    }

    int MutatingCalls() const {
        return CountCalls("clone") + CountCalls("set") + CountCalls("snapshot") + CountCalls("shutdown")
            + CountCalls("start") + CountCalls("push");
    }

    ContainerStatus Status(int ctid) override {
        calls.push_back("status");
        ContainerStatus status;
        const auto it = containers.find(ctid);
        if (it != containers.end()) {
            status.exists = true;
            status.running = it->second.running;
        }
        return status;
    }

    RuntimeResult Clone(const CloneSpec& spec) override {
        calls.push_back("clone");
        clones.push_back(spec);
        RuntimeResult result;
        result.exitCode = cloneExitCode;
        if (cloneExitCode == 0) {
            AddContainer(spec.targetCtid, false);
        }
        return result;
    }

    RuntimeResult SetProperty(int ctid, const std::string& key, const std::string& value) override {
        calls.push_back("set");
        RuntimeResult result;
        result.exitCode = setExitCode;
        if (setExitCode == 0) {
            containers[ctid].properties[key] = value;
        }
        return result;
    }

    std::optional<std::string> GetProperty(int ctid, const std::string& key) override {
        calls.push_back("get");
        const auto it = containers.find(ctid);
        if (it == containers.end()) {
            return std::nullopt;
        }
        const auto prop = it->second.properties.find(key);
        if (prop == it->second.properties.end()) {
            return std::nullopt;
        }
        return prop->second;
    }

    std::set<std::string> SnapshotList(int ctid) override {
        calls.push_back("listsnapshot");
        const auto it = containers.find(ctid);
        return it == containers.end() ? std::set<std::string>() : it->second.snapshots;
    }

    RuntimeResult SnapshotCreate(int ctid, const std::string& name) override {
        calls.push_back("snapshot");
        RuntimeResult result;
        result.exitCode = snapshotExitCode;
        if (snapshotExitCode == 0) {
            containers[ctid].snapshots.insert(name);
        }
        return result;
    }

    RuntimeResult Shutdown(int ctid) override {
        calls.push_back("shutdown");
        RuntimeResult result;
        result.exitCode = shutdownExitCode;
        if (shutdownExitCode == 0 && shutdownStops) {
            containers[ctid].running = false;
        }
        return result;
    }

    RuntimeResult Start(int ctid) override {
        calls.push_back("start");
        RuntimeResult result;
        result.exitCode = startExitCode;
        if (startExitCode == 0 && startRuns) {
            containers[ctid].running = true;
        }
        return result;
    }

    RuntimeResult Exec(int ctid, const std::vector<std::string>& command) override {
        (void)ctid;
        calls.push_back("exec");
        execs.push_back(command);
        if (onExec) {
            onExec(command);
        }
        if (execHandler) {
            if (auto handled = execHandler(command)) {
                return *handled;
            }
        }
        for (const auto& entry : execScript) {
            const auto& prefix = entry.first;
            if (prefix.size() <= command.size() && std::equal(prefix.begin(), prefix.end(), command.begin())) {
                return entry.second;
            }
        }
        return RuntimeResult();
    }

    RuntimeResult Push(int ctid, const std::string& localPath, const std::string& remotePath) override {
        (void)ctid;
        calls.push_back("push");
        pushes.emplace_back(localPath, remotePath);
        std::ifstream input(localPath, std::ios::binary);
        pushedContent[remotePath] = std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
        return RuntimeResult();
    }
};
