#include "HealthChecker.hpp"
#include "RetryPolicy.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

HealthCheckOutcome Status(int code) {
    HealthCheckOutcome outcome;
    outcome.httpStatus = code;
    return outcome;
}

HealthCheckOutcome Refused() {
    HealthCheckOutcome outcome;
    outcome.connectionFailed = true;
    return outcome;
}
} // namespace

int main() {
    std::vector<std::chrono::milliseconds> sleeps;
    const Sleeper recordSleep = [&](std::chrono::milliseconds duration) { sleeps.push_back(duration); };

    int calls = 0;
    HealthChecker eventuallyHealthy(
        [&](const std::string& url) {
            if (url != "http://10.0.0.99/") {
                return Status(404);
            }
            ++calls;
            if (calls <= 5) {
                return Refused();
            }
            return calls <= 11 ? Status(502) : Status(200);
        },
        recordSleep);

    StageResult result = eventuallyHealthy.Probe("http://10.0.0.99/", 12, std::chrono::seconds(10));
    if (!result.Ok()) {
        return Fail("Probe should succeed on the 12th attempt: " + result.message);
    }
    if (calls != 12 || eventuallyHealthy.Outcomes().size() != 12) {
        return Fail("Expected exactly 12 attempts, got " + std::to_string(calls));
    }
    if (sleeps.size() != 11) {
        return Fail("Expected 11 sleeps, got " + std::to_string(sleeps.size()));
    }
    for (const auto& sleep : sleeps) {
        if (sleep != std::chrono::seconds(10)) {
            return Fail("Sleep interval must match the configured interval.");
        }
    }
    if (!eventuallyHealthy.Outcomes().front().connectionFailed || eventuallyHealthy.Outcomes().back().attempt != 12) {
        return Fail("Outcomes must record each attempt.");
    }

    sleeps.clear();
    calls = 0;
    bool logsFetched = false;
    HealthChecker neverHealthy(
        [&](const std::string&) {
            ++calls;
            return Status(503);
        },
        recordSleep);
    result = neverHealthy.Probe("http://10.0.0.151:8000/health", 12, std::chrono::seconds(10), [&] {
        logsFetched = true;
        return std::string("vllm.service: Main process exited");
    });
    if (result.kind != ErrorKind::HEALTH_CHECK_FAILED) {
        return Fail("Exhausted probe must report HealthCheckFailed.");
    }
    if (calls != 12 || sleeps.size() != 11) {
        return Fail("Exhausted probe must make 12 attempts with 11 sleeps.");
    }
    if (result.toolExitCode != 503 || !logsFetched) {
        return Fail("Failure must carry the last HTTP status and fetch service logs.");
    }

    {
        HealthChecker refusing([](const std::string&) { return Refused(); }, recordSleep);
        std::ostringstream captured;
        std::streambuf* original = std::cout.rdbuf(captured.rdbuf());
        refusing.Probe("http://10.0.0.153/", 3, std::chrono::seconds(10));
        std::cout.rdbuf(original);

        const std::string log = captured.str();
        size_t retryNotes = 0;
        for (size_t at = log.find("Retrying in"); at != std::string::npos; at = log.find("Retrying in", at + 1)) {
            ++retryNotes;
        }
        if (retryNotes != 2) {
            return Fail("Only attempts followed by another attempt may announce a retry:\n" + log);
        }
    }

    sleeps.clear();
    calls = 0;
    HealthChecker immediate(
        [&](const std::string&) {
            ++calls;
            return Status(200);
        },
        recordSleep);
    RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.interval = std::chrono::seconds(1);
    if (!immediate.Probe("http://10.0.0.99/", policy).Ok() || calls != 1 || !sleeps.empty()) {
        return Fail("A 200 on the first attempt must not sleep.");
    }

    if (HealthChecker::BuildUrl("10.0.0.99", 80, "/") != "http://10.0.0.99/") {
        return Fail("Port 80 must be omitted from the URL.");
    }
    if (HealthChecker::BuildUrl("10.0.0.151", 8000, "health") != "http://10.0.0.151:8000/health") {
        return Fail("Path without a leading slash must be normalized.");
    }

    const RetryPolicy wait = RetryPolicy::FromTimeout(std::chrono::seconds(60), std::chrono::seconds(3));
    if (wait.maxAttempts != 20) {
        return Fail("60s polled every 3s must give 20 attempts.");
    }
    if (RetryPolicy::FromTimeout(std::chrono::seconds(1), std::chrono::seconds(3)).maxAttempts != 1) {
        return Fail("Timeout shorter than the interval must still allow one attempt.");
    }

    return 0;
}
