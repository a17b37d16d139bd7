#include "PctRuntimeClient.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace {
constexpr auto kQueryTimeout = std::chrono::seconds(120);
constexpr auto kLifecycleTimeout = std::chrono::seconds(600);
constexpr auto kExecTimeout = std::chrono::seconds(3600);

std::string TrimLeft(const std::string& value, const char* characters) {
    const auto first = value.find_first_not_of(characters);
    return first == std::string::npos ? std::string() : value.substr(first);
}
} // namespace

PctRuntimeClient::PctRuntimeClient(std::string pctBinary, CommandRunner runner)
    : pct_(std::move(pctBinary)),
      runner_(std::move(runner)) {}

ContainerStatus PctRuntimeClient::Status(int ctid) {
    const std::vector<std::string> command{pct_, "status", std::to_string(ctid)};
    ProcessResult result = runner_ ? runner_(command, kQueryTimeout) : RunProcess(command, kQueryTimeout);
    return ParseStatus(result);
}

RuntimeResult PctRuntimeClient::Clone(const CloneSpec& spec) {
    return Run(BuildCloneCommand(pct_, spec), kExecTimeout);
}

RuntimeResult PctRuntimeClient::SetProperty(int ctid, const std::string& key, const std::string& value) {
    return Run(BuildSetCommand(pct_, ctid, key, value), kQueryTimeout);
}

std::optional<std::string> PctRuntimeClient::GetProperty(int ctid, const std::string& key) {
    const RuntimeResult result = Run({pct_, "config", std::to_string(ctid)}, kQueryTimeout, true);
    if (!result.Ok()) {
        return std::nullopt;
    }
    return ParseConfigValue(result.stdoutText, key);
}

std::set<std::string> PctRuntimeClient::SnapshotList(int ctid) {
    const RuntimeResult result = Run({pct_, "listsnapshot", std::to_string(ctid)}, kQueryTimeout, true);
    if (!result.Ok()) {
        return {};
    }
    return ParseSnapshotList(result.stdoutText);
}

RuntimeResult PctRuntimeClient::SnapshotCreate(int ctid, const std::string& name) {
    return Run({pct_, "snapshot", std::to_string(ctid), name}, kLifecycleTimeout);
}

RuntimeResult PctRuntimeClient::Shutdown(int ctid) {
    return Run({pct_, "shutdown", std::to_string(ctid)}, kLifecycleTimeout);
}

RuntimeResult PctRuntimeClient::Start(int ctid) {
    return Run({pct_, "start", std::to_string(ctid)}, kLifecycleTimeout);
}

RuntimeResult PctRuntimeClient::Exec(int ctid, const std::vector<std::string>& command) {
    if (command.empty()) {
        RuntimeResult result;
        result.exitCode = -1;
        result.stderrText = "empty command";
        return result;
    }
    return Run(BuildExecCommand(pct_, ctid, command), kExecTimeout);
}

RuntimeResult PctRuntimeClient::Push(int ctid, const std::string& localPath, const std::string& remotePath) {
    return Run({pct_, "push", std::to_string(ctid), localPath, remotePath}, kQueryTimeout);
}

std::vector<std::string> PctRuntimeClient::BuildCloneCommand(const std::string& pct, const CloneSpec& spec) {
    std::vector<std::string> command{
        pct, "clone", std::to_string(spec.sourceCtid), std::to_string(spec.targetCtid),
        "--snapshot", spec.snapshotName,
        "--hostname", spec.hostname,
        "--memory", std::to_string(spec.memoryMB),
        "--cores", std::to_string(spec.cores),
        "--storage", spec.storage};
    if (!spec.features.empty()) {
        command.push_back("--features");
        command.push_back(spec.features);
    }
    command.push_back("--unprivileged");
    command.push_back(spec.unprivileged);
    return command;
}

std::vector<std::string> PctRuntimeClient::BuildSetCommand(
    const std::string& pct,
    int ctid,
    const std::string& key,
    const std::string& value) {
    return {pct, "set", std::to_string(ctid), "--" + key, value};
}

std::vector<std::string> PctRuntimeClient::BuildExecCommand(
    const std::string& pct,
    int ctid,
    const std::vector<std::string>& command) {
    std::vector<std::string> full{pct, "exec", std::to_string(ctid), "--"};
    full.insert(full.end(), command.begin(), command.end());
    return full;
}

ContainerStatus PctRuntimeClient::ParseStatus(const ProcessResult& result) {
    ContainerStatus status;
    if (result.timedOut || result.exitCode != 0) {
        return status;
    }

    status.exists = true;
    status.running = result.stdoutText.find("status: running") != std::string::npos;
    return status;
}

// Lines look like "`-> docker-snapshot  2024-05-01 10:00:00  description",
// nested one level deeper per parent; "current" marks the live state.
std::set<std::string> PctRuntimeClient::ParseSnapshotList(const std::string& output) {
    std::set<std::string> names;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const std::string stripped = TrimLeft(line, " \t`->|");
        std::istringstream fields(stripped);
        std::string name;
        if (!(fields >> name) || name == "current") {
            continue;
        }
        names.insert(name);
    }
    return names;
}

std::optional<std::string> PctRuntimeClient::ParseConfigValue(const std::string& output, const std::string& key) {
    const std::string prefix = key + ":";
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind(prefix, 0) == 0) {
            return TrimLeft(line.substr(prefix.size()), " \t");
        }
    }
    return std::nullopt;
}

RuntimeResult PctRuntimeClient::Run(
    const std::vector<std::string>& command,
    std::chrono::seconds timeout,
    bool quiet) const {
    if (!quiet) {
        std::cout << "[Runtime] Executing: " << JoinArgs(command) << std::endl;
    }

    ProcessResult process = runner_ ? runner_(command, timeout) : RunProcess(command, timeout);

    RuntimeResult result;
    result.exitCode = process.exitCode;
    result.stdoutText = std::move(process.stdoutText);
    result.stderrText = std::move(process.stderrText);

    if (process.timedOut) {
        std::cerr << "[Runtime] Command timed out after " << timeout.count() << "s: " << JoinArgs(command) << std::endl;
    } else if (!result.Ok() && !quiet) {
        std::cerr << "[Runtime] Command failed with exit code " << result.exitCode << ": " << JoinArgs(command) << std::endl;
        if (!result.stderrText.empty()) {
            std::cerr << result.stderrText << std::endl;
        }
    }
    return result;
}
