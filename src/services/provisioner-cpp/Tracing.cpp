#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>

#if PROVISIONER_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>

namespace otlp = opentelemetry::exporter::otlp;
namespace sdktrace = opentelemetry::sdk::trace;
namespace trace_api = opentelemetry::trace;
#endif

namespace {
std::string HexBytes(size_t count) {
    static std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::ostringstream hex;
    hex << std::hex << std::nouppercase << std::setfill('0');
    for (size_t i = 0; i < count; ++i) {
        hex << std::setw(2) << byte(rng);
    }
    return hex.str();
}

// 16-byte trace id, 8-byte parent id, sampled.
std::string DetachedTraceparent() {
    return "00-" + HexBytes(16) + "-" + HexBytes(8) + "-01";
}

#if PROVISIONER_ENABLE_OTEL
std::string FormatTraceparent(const trace_api::SpanContext& context) {
    if (!context.IsValid()) {
        return DetachedTraceparent();
    }

    char traceId[2 * trace_api::TraceId::kSize];
    char spanId[2 * trace_api::SpanId::kSize];
    context.trace_id().ToLowerBase16(traceId);
    context.span_id().ToLowerBase16(spanId);
    const char* flags = context.trace_flags().IsSampled() ? "01" : "00";
    return "00-" + std::string(traceId, sizeof(traceId)) + "-" + std::string(spanId, sizeof(spanId)) + "-" + flags;
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    enabled_ = false;
#if PROVISIONER_ENABLE_OTEL
    if (!config.enabled) {
        return;
    }

    otlp::OtlpHttpExporterOptions exporterOptions;
    if (!config.endpoint.empty()) {
        exporterOptions.url = config.endpoint;
    }
    const std::string service = config.serviceName.empty() ? std::string("lxc-provisioner") : config.serviceName;

    auto processor = std::make_unique<sdktrace::BatchSpanProcessor>(
        std::make_unique<otlp::OtlpHttpExporter>(exporterOptions),
        sdktrace::BatchSpanProcessorOptions{});
    provider_ = std::make_shared<sdktrace::TracerProvider>(
        std::move(processor),
        opentelemetry::sdk::resource::Resource::Create({{"service.name", service}}));

    std::shared_ptr<trace_api::TracerProvider> global = provider_;
    trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(std::move(global)));
    tracer_ = provider_->GetTracer(service);
    enabled_ = true;
#else
    if (config.enabled) {
        std::cerr << "[WARN] Tracing requested but lxc-provisioner was built without OpenTelemetry." << std::endl;
    }
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
    handle.name = name;
#if PROVISIONER_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.traceparent = FormatTraceparent(handle.span->GetContext());
    }
#endif
    if (handle.traceparent.empty()) {
        handle.traceparent = DetachedTraceparent();
    }
    return handle;
}

SpanHandle Tracer::StartStageSpan(const std::string& stage, int ctid) {
    SpanHandle handle = StartSpan("provisioner.stage." + stage);
    SetAttribute(handle, "provisioner.stage", stage);
    SetAttribute(handle, "container.id", static_cast<int64_t>(ctid));
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if PROVISIONER_ENABLE_OTEL
    if (Recording(handle)) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle, (void)key, (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if PROVISIONER_ENABLE_OTEL
    if (Recording(handle)) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle, (void)key, (void)value;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success, const std::string& error) {
#if PROVISIONER_ENABLE_OTEL
    if (!Recording(handle)) {
        return;
    }
    handle.span->SetStatus(success ? trace_api::StatusCode::kOk : trace_api::StatusCode::kError,
                           success ? std::string() : error);
    handle.span->End();
#else
    (void)handle, (void)success, (void)error;
#endif
}

void Tracer::Shutdown() {
#if PROVISIONER_ENABLE_OTEL
    if (provider_) {
        provider_->ForceFlush();
        provider_->Shutdown();
        provider_.reset();
    }
    enabled_ = false;
#endif
}

#if PROVISIONER_ENABLE_OTEL
bool Tracer::Recording(const SpanHandle& handle) const {
    return enabled_ && handle.span;
}
#endif
