#pragma once

#include "ProvisionTypes.hpp"
#include "RetryPolicy.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

class HealthChecker {
public:
    using HttpGet = std::function<HealthCheckOutcome(const std::string& url)>;
    using LogFetcher = std::function<std::string()>;

    explicit HealthChecker(HttpGet httpGet = HttpGet(), Sleeper sleeper = Sleeper());

    StageResult Probe(
        const std::string& url,
        int maxAttempts,
        std::chrono::seconds interval,
        const LogFetcher& diagnostics = LogFetcher());
    StageResult Probe(const std::string& url, const RetryPolicy& policy, const LogFetcher& diagnostics = LogFetcher());

    const std::vector<HealthCheckOutcome>& Outcomes() const;

    static HealthCheckOutcome HttpGetOnce(const std::string& url);
    static std::string BuildUrl(const std::string& host, int port, const std::string& path);

private:
    HttpGet httpGet_;
    Sleeper sleeper_;
    std::vector<HealthCheckOutcome> outcomes_;
};
