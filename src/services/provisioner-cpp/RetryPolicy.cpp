#include "RetryPolicy.hpp"

#include <thread>

RetryPolicy RetryPolicy::FromTimeout(std::chrono::seconds timeout, std::chrono::seconds interval) {
    RetryPolicy policy;
    policy.interval = interval;
    if (interval.count() <= 0) {
        policy.maxAttempts = 1;
        return policy;
    }

    const auto attempts = timeout.count() / interval.count();
    policy.maxAttempts = attempts > 0 ? static_cast<int>(attempts) : 1;
    return policy;
}

RetryOutcome RunWithRetry(
    const RetryPolicy& policy,
    const std::function<AttemptVerdict(int attempt)>& attempt,
    const Sleeper& sleeper) {
    RetryOutcome outcome;
    const int maxAttempts = policy.maxAttempts > 0 ? policy.maxAttempts : 1;

    for (int current = 1; current <= maxAttempts; ++current) {
        outcome.attempts = current;
        if (attempt(current) == AttemptVerdict::SUCCESS) {
            outcome.succeeded = true;
            return outcome;
        }

        if (current < maxAttempts) {
            if (sleeper) {
                sleeper(policy.interval);
            } else {
                std::this_thread::sleep_for(policy.interval);
            }
        }
    }

    return outcome;
}
