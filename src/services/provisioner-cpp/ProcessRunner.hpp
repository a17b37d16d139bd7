#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
};

// Runs argv directly (no shell), capturing both output streams. The child is
// killed once the timeout elapses.
ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::seconds timeout);

std::string JoinArgs(const std::vector<std::string>& argv);
