#include "PctRuntimeClient.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

ProcessResult Exited(int code, const std::string& out = {}) {
    ProcessResult result;
    result.exitCode = code;
    result.stdoutText = out;
    return result;
}
} // namespace

int main() {
    CloneSpec spec;
    spec.sourceCtid = 902;
    spec.targetCtid = 910;
    spec.snapshotName = "docker-snapshot";
    spec.hostname = "Portainer";
    spec.memoryMB = 2048;
    spec.cores = 2;
    spec.storage = "local-lvm:16";
    spec.features = "nesting=1,keyctl=1";
    spec.unprivileged = "1";

    const auto cloneCommand = PctRuntimeClient::BuildCloneCommand("pct", spec);
    const std::string cloneJoined = JoinArgs(cloneCommand);
    if (cloneJoined != "pct clone 902 910 --snapshot docker-snapshot --hostname Portainer --memory 2048 --cores 2 "
                       "--storage local-lvm:16 --features nesting=1,keyctl=1 --unprivileged 1") {
        return Fail("Unexpected clone command: " + cloneJoined);
    }

    spec.features.clear();
    spec.unprivileged = "0";
    const std::string noFeatures = JoinArgs(PctRuntimeClient::BuildCloneCommand("/usr/sbin/pct", spec));
    if (noFeatures.find("--features") != std::string::npos) {
        return Fail("Empty features must not be passed: " + noFeatures);
    }
    if (noFeatures.rfind("/usr/sbin/pct clone", 0) != 0 || noFeatures.find("--unprivileged 0") == std::string::npos) {
        return Fail("Unexpected clone command without features: " + noFeatures);
    }

    const auto setCommand = PctRuntimeClient::BuildSetCommand("pct", 910, "net0", "name=eth0,bridge=vmbr0,ip=10.0.0.99/24,gw=10.0.0.1");
    if (setCommand.size() != 5 || setCommand[3] != "--net0" || setCommand[4] != "name=eth0,bridge=vmbr0,ip=10.0.0.99/24,gw=10.0.0.1") {
        return Fail("Unexpected set command: " + JoinArgs(setCommand));
    }

    const auto execCommand = PctRuntimeClient::BuildExecCommand("pct", 953, {"systemctl", "restart", "nginx"});
    if (JoinArgs(execCommand) != "pct exec 953 -- systemctl restart nginx") {
        return Fail("Unexpected exec command: " + JoinArgs(execCommand));
    }

    const ContainerStatus running = PctRuntimeClient::ParseStatus(Exited(0, "status: running\n"));
    if (!running.exists || !running.running) {
        return Fail("Running status not parsed.");
    }
    const ContainerStatus stopped = PctRuntimeClient::ParseStatus(Exited(0, "status: stopped\n"));
    if (!stopped.exists || stopped.running) {
        return Fail("Stopped status not parsed.");
    }
    const ContainerStatus missing = PctRuntimeClient::ParseStatus(Exited(2));
    if (missing.exists) {
        return Fail("Nonzero pct status must mean the container does not exist.");
    }
    ProcessResult timedOut = Exited(-1);
    timedOut.timedOut = true;
    if (PctRuntimeClient::ParseStatus(timedOut).exists) {
        return Fail("Timed out pct status must not report existence.");
    }

    const std::string listing =
        "`-> base-snapshot               2024-05-01 10:00:00     base\n"
        "    `-> docker-snapshot         2024-05-02 11:00:00     docker\n"
        "        `-> current                                     You are here!\n";
    const auto snapshots = PctRuntimeClient::ParseSnapshotList(listing);
    if (snapshots.size() != 2 || snapshots.count("base-snapshot") != 1 || snapshots.count("docker-snapshot") != 1) {
        return Fail("Unexpected snapshot list parse result.");
    }

    const std::string config = "arch: amd64\ncores: 2\nnet0: name=eth0,bridge=vmbr0,hwaddr=52:54:00:12:34:56,ip=10.0.0.99/24\n";
    const auto net0 = PctRuntimeClient::ParseConfigValue(config, "net0");
    if (!net0 || *net0 != "name=eth0,bridge=vmbr0,hwaddr=52:54:00:12:34:56,ip=10.0.0.99/24") {
        return Fail("net0 not parsed from pct config.");
    }
    if (PctRuntimeClient::ParseConfigValue(config, "net1")) {
        return Fail("Absent key must not be returned.");
    }

    std::vector<std::vector<std::string>> captured;
    PctRuntimeClient client("pct", [&](const std::vector<std::string>& command, std::chrono::seconds) {
        captured.push_back(command);
        if (command[1] == "status") {
            return Exited(0, "status: stopped\n");
        }
        if (command[1] == "listsnapshot") {
            return Exited(0, "`-> docker-snapshot 2024-05-02 11:00:00 no-description\n`-> current\n");
        }
        if (command[1] == "snapshot") {
            return Exited(255);
        }
        return Exited(0);
    });

    if (!client.Status(910).exists) {
        return Fail("Status should report an existing container.");
    }
    if (client.SnapshotList(902).count("docker-snapshot") != 1) {
        return Fail("SnapshotList should use the injected runner.");
    }
    const RuntimeResult snapshot = client.SnapshotCreate(910, "final");
    if (snapshot.Ok() || snapshot.exitCode != 255) {
        return Fail("SnapshotCreate should surface the tool exit code.");
    }
    if (client.Exec(910, {}).Ok()) {
        return Fail("Exec with an empty command must fail.");
    }
    if (captured.size() != 3) {
        return Fail("Runner invoked for an empty exec command.");
    }

    const RuntimeResult pushed = client.Push(953, "/tmp/site", "/etc/nginx/sites-available/provisioner-proxy");
    if (!pushed.Ok() || JoinArgs(captured.back()) != "pct push 953 /tmp/site /etc/nginx/sites-available/provisioner-proxy") {
        return Fail("Unexpected push command: " + JoinArgs(captured.back()));
    }

    return 0;
}
