#include "Tracing.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#if FEEDWATCH_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_id.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/status_code.h>
#include <opentelemetry/trace/trace_id.h>
#endif

namespace {
constexpr const char* kInstrumentationName = "feedwatch";

std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

std::string BuildTraceParentFromIds(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + "-" + (sampled ? "01" : "00");
}

#if FEEDWATCH_ENABLE_OTEL
std::string TraceIdHex(const opentelemetry::trace::TraceId& id) {
    char buffer[2 * opentelemetry::trace::TraceId::kSize];
    id.ToLowerBase16(buffer);
    return std::string(buffer, sizeof(buffer));
}

std::string SpanIdHex(const opentelemetry::trace::SpanId& id) {
    char buffer[2 * opentelemetry::trace::SpanId::kSize];
    id.ToLowerBase16(buffer);
    return std::string(buffer, sizeof(buffer));
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if FEEDWATCH_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create(
        {{"service.name", config.serviceName.empty() ? kInstrumentationName : config.serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(
        std::move(processor),
        resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(kInstrumentationName);
    enabled_ = true;
    std::cout << "[Trace] Exporting spans to " << (options.url.empty() ? "default OTLP endpoint" : options.url) << std::endl;
#else
    std::cerr << "[Trace] Tracing requested but this build has no OpenTelemetry support." << std::endl;
    (void)config;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartFetchSpan(const FetchSpanInfo& info, const SpanHandle* previousPage) {
    const bool feedRequest = !info.resource.empty();
    SpanHandle handle = StartSpan(feedRequest ? "feed.fetch" : "feed.api", previousPage);
    SetAttribute(handle, "http.method", "GET");
    SetAttribute(handle, "http.url", info.url);
    if (feedRequest) {
        SetAttribute(handle, "feed.resource", info.resource);
        SetAttribute(handle, "feed.page", static_cast<int64_t>(info.page));
    }
    return handle;
}

void Tracer::EndFetchSpan(SpanHandle& handle, long statusCode, bool transportOk) {
    const bool success = transportOk && statusCode < 400;
#if FEEDWATCH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute("http.status_code", static_cast<int64_t>(statusCode));
        // 304 is the expected answer for an idle feed, not an error.
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
    handle.valid = false;
}

SpanHandle Tracer::StartSpan(const std::string& name, const SpanHandle* parent) {
    SpanHandle handle;
#if FEEDWATCH_ENABLE_OTEL
    if (enabled_ && tracer_) {
        opentelemetry::trace::StartSpanOptions options;
        if (parent && parent->span) {
            options.parent = parent->span->GetContext();
        }
        handle.span = tracer_->StartSpan(name, options);
        const auto context = handle.span->GetContext();
        if (context.IsValid()) {
            handle.traceId = TraceIdHex(context.trace_id());
            handle.traceparent = BuildTraceParentFromIds(
                handle.traceId, SpanIdHex(context.span_id()), context.trace_flags().IsSampled());
            handle.valid = true;
            return handle;
        }
    }
#else
    (void)name;
#endif

    handle.traceId = parent && !parent->traceId.empty() ? parent->traceId : RandomHex(16);
    handle.traceparent = BuildTraceParentFromIds(handle.traceId, RandomHex(8), true);
    handle.valid = true;
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if FEEDWATCH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if FEEDWATCH_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::Shutdown() {
#if FEEDWATCH_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
}
