#pragma once

#include "ProcessRunner.hpp"
#include "RuntimeClient.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

class PctRuntimeClient : public RuntimeClient {
public:
    using CommandRunner = std::function<ProcessResult(const std::vector<std::string>&, std::chrono::seconds)>;

    explicit PctRuntimeClient(std::string pctBinary = "pct", CommandRunner runner = CommandRunner());

    ContainerStatus Status(int ctid) override;
    RuntimeResult Clone(const CloneSpec& spec) override;
    RuntimeResult SetProperty(int ctid, const std::string& key, const std::string& value) override;
    std::optional<std::string> GetProperty(int ctid, const std::string& key) override;
    std::set<std::string> SnapshotList(int ctid) override;
    RuntimeResult SnapshotCreate(int ctid, const std::string& name) override;
    RuntimeResult Shutdown(int ctid) override;
    RuntimeResult Start(int ctid) override;
    RuntimeResult Exec(int ctid, const std::vector<std::string>& command) override;
    RuntimeResult Push(int ctid, const std::string& localPath, const std::string& remotePath) override;

    static std::vector<std::string> BuildCloneCommand(const std::string& pct, const CloneSpec& spec);
    static std::vector<std::string> BuildSetCommand(const std::string& pct, int ctid, const std::string& key, const std::string& value);
    static std::vector<std::string> BuildExecCommand(const std::string& pct, int ctid, const std::vector<std::string>& command);

    static ContainerStatus ParseStatus(const ProcessResult& result);
    static std::set<std::string> ParseSnapshotList(const std::string& output);
    static std::optional<std::string> ParseConfigValue(const std::string& output, const std::string& key);

private:
    RuntimeResult Run(const std::vector<std::string>& command, std::chrono::seconds timeout, bool quiet = false) const;

    std::string pct_;
    CommandRunner runner_;
};
