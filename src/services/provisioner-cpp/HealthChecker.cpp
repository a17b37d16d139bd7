#include "HealthChecker.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>

#include <iostream>
#include <sstream>
#include <utility>

namespace {
constexpr const char* kStage = "verify";
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr auto kRequestTimeout = std::chrono::seconds(5);
} // namespace

HealthChecker::HealthChecker(HttpGet httpGet, Sleeper sleeper)
    : httpGet_(std::move(httpGet)),
      sleeper_(std::move(sleeper)) {}

StageResult HealthChecker::Probe(
    const std::string& url,
    int maxAttempts,
    std::chrono::seconds interval,
    const LogFetcher& diagnostics) {
    RetryPolicy policy;
    policy.maxAttempts = maxAttempts;
    policy.interval = interval;
    return Probe(url, policy, diagnostics);
}

StageResult HealthChecker::Probe(const std::string& url, const RetryPolicy& policy, const LogFetcher& diagnostics) {
    outcomes_.clear();
    const int maxAttempts = policy.maxAttempts > 0 ? policy.maxAttempts : 1;
    const auto intervalSeconds = std::chrono::duration_cast<std::chrono::seconds>(policy.interval).count();

    const RetryOutcome outcome = RunWithRetry(
        policy,
        [&](int attempt) {
            std::cout << "[Health] Attempt " << attempt << "/" << maxAttempts << " GET " << url << std::endl;

            HealthCheckOutcome result = httpGet_ ? httpGet_(url) : HttpGetOnce(url);
            result.attempt = attempt;
            outcomes_.push_back(result);

            const std::string retryNote =
                attempt < maxAttempts ? " Retrying in " + std::to_string(intervalSeconds) + "s..." : std::string();
            if (result.connectionFailed) {
                std::cout << "[Health] Not ready yet (connection failed)." << retryNote << std::endl;
                return AttemptVerdict::RETRY;
            }
            if (result.httpStatus && *result.httpStatus == 200) {
                std::cout << "[Health] Service responded with HTTP 200." << std::endl;
                return AttemptVerdict::SUCCESS;
            }

            std::cout << "[Health] Service returned HTTP " << result.httpStatus.value_or(0) << "." << retryNote
                      << std::endl;
            return AttemptVerdict::RETRY;
        },
        sleeper_);

    if (outcome.succeeded) {
        return StageResult::Success(kStage);
    }

    std::cerr << "[Health] Service not healthy after " << outcome.attempts << " attempts: " << url << std::endl;
    if (diagnostics) {
        const std::string logs = diagnostics();
        std::cerr << "[Health] Recent service logs:" << std::endl;
        std::cerr << (logs.empty() ? "(no log output)" : logs) << std::endl;
    }

    int lastStatus = 0;
    if (!outcomes_.empty() && outcomes_.back().httpStatus) {
        lastStatus = *outcomes_.back().httpStatus;
    }

    std::ostringstream message;
    message << "no HTTP 200 from " << url << " after " << outcome.attempts << " attempts";
    return StageResult::Failure(ErrorKind::HEALTH_CHECK_FAILED, kStage, message.str(), lastStatus);
}

const std::vector<HealthCheckOutcome>& HealthChecker::Outcomes() const {
    return outcomes_;
}

HealthCheckOutcome HealthChecker::HttpGetOnce(const std::string& url) {
    auto span = Tracer::Instance().StartSpan("provisioner.health.probe");
    Tracer::Instance().SetAttribute(span, "http.method", "GET");
    Tracer::Instance().SetAttribute(span, "http.url", url);

    cpr::Response response = cpr::Get(
        cpr::Url{url},
        cpr::Header{{"traceparent", span.traceparent}},
        cpr::ConnectTimeout{kConnectTimeout},
        cpr::Timeout{kRequestTimeout});

    HealthCheckOutcome outcome;
    if (response.error.code != cpr::ErrorCode::OK) {
        outcome.connectionFailed = true;
        Tracer::Instance().EndSpan(span, false, response.error.message);
        return outcome;
    }

    outcome.httpStatus = static_cast<int>(response.status_code);
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, response.status_code == 200);
    return outcome;
}

std::string HealthChecker::BuildUrl(const std::string& host, int port, const std::string& path) {
    std::ostringstream url;
    url << "http://" << host;
    if (port != 80) {
        url << ":" << port;
    }
    if (path.empty() || path.front() != '/') {
        url << "/";
    }
    url << path;
    return url.str();
}
