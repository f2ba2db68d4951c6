#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if FEEDWATCH_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName = "feedwatch";
};

// One outgoing GET. resource is empty for API calls that do not belong to a
// feed, such as the rate limit request.
struct FetchSpanInfo {
    std::string url;
    std::string resource;
    int page = 1;
};

struct SpanHandle {
    std::string traceparent;
    std::string traceId;
    bool valid = false;
#if FEEDWATCH_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// Process-wide factory for request spans. Follow-up pages of one poll join the
// trace of the page before them, so a whole paginated read shows up as one
// trace. Without FEEDWATCH_ENABLE_OTEL spans only carry a traceparent header.
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartFetchSpan(const FetchSpanInfo& info, const SpanHandle* previousPage = nullptr);
    void EndFetchSpan(SpanHandle& handle, long statusCode, bool transportOk);
    void Shutdown();

private:
    Tracer() = default;

    SpanHandle StartSpan(const std::string& name, const SpanHandle* parent);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);

    bool enabled_ = false;
#if FEEDWATCH_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};
