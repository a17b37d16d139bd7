#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if PROVISIONER_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct SpanHandle {
    std::string name;
    std::string traceparent;
#if PROVISIONER_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// One span per workflow, per stage and per health probe. Built without
// PROVISIONER_ENABLE_OTEL it only hands out detached traceparent values.
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    SpanHandle StartStageSpan(const std::string& stage, int ctid);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success, const std::string& error = {});
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if PROVISIONER_ENABLE_OTEL
    bool Recording(const SpanHandle& handle) const;

    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};
