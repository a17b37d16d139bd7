#pragma once

#include <chrono>
#include <functional>

enum class AttemptVerdict {
    SUCCESS,
    RETRY
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct RetryPolicy {
    int maxAttempts = 1;
    std::chrono::milliseconds interval{0};

    // 60s polled every 3s gives 20 attempts; never fewer than one.
    static RetryPolicy FromTimeout(std::chrono::seconds timeout, std::chrono::seconds interval);
};

struct RetryOutcome {
    bool succeeded = false;
    int attempts = 0;
};

// Calls attempt(1..maxAttempts) until it reports SUCCESS, sleeping the policy
// interval between attempts (never after the last one).
RetryOutcome RunWithRetry(
    const RetryPolicy& policy,
    const std::function<AttemptVerdict(int attempt)>& attempt,
    const Sleeper& sleeper = Sleeper());
