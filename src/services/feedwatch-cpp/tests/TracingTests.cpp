#include "Tracing.hpp"

#include <cctype>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

bool IsLowerHex(const std::string& text) {
    for (const char ch : text) {
        if (!std::isxdigit(static_cast<unsigned char>(ch)) || std::isupper(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return !text.empty();
}

// Splits "00-<trace>-<span>-<flags>"; false when the header is malformed.
bool SplitTraceparent(const std::string& header, std::string& traceId, std::string& spanId) {
    if (header.size() != 55 || header.compare(0, 3, "00-") != 0 || header[35] != '-' || header[52] != '-') {
        return false;
    }
    traceId = header.substr(3, 32);
    spanId = header.substr(36, 16);
    return IsLowerHex(traceId) && IsLowerHex(spanId) && header.substr(53) == "01";
}

int TestFetchSpanCarriesTraceparent() {
    SpanHandle span = Tracer::Instance().StartFetchSpan({"https://api.example.test/repos/org/a/events", "org/a", 1});
    std::string traceId;
    std::string spanId;
    if (!span.valid || !SplitTraceparent(span.traceparent, traceId, spanId)) {
        return Fail("Unexpected traceparent: " + span.traceparent);
    }
    if (traceId != span.traceId) {
        return Fail("Handle should expose the trace id of its traceparent.");
    }

    Tracer::Instance().EndFetchSpan(span, 304, true);
    if (span.valid) {
        return Fail("An ended span should no longer be valid.");
    }
    return 0;
}

int TestFollowUpPagesShareTrace() {
    SpanHandle first = Tracer::Instance().StartFetchSpan({"https://api.example.test/p1", "org/a", 1});
    Tracer::Instance().EndFetchSpan(first, 200, true);
    SpanHandle second = Tracer::Instance().StartFetchSpan({"https://api.example.test/p2", "org/a", 2}, &first);
    Tracer::Instance().EndFetchSpan(second, 200, true);
    SpanHandle unrelated = Tracer::Instance().StartFetchSpan({"https://api.example.test/p1", "org/b", 1});
    Tracer::Instance().EndFetchSpan(unrelated, 500, true);

    std::string firstTrace;
    std::string firstSpan;
    std::string secondTrace;
    std::string secondSpan;
    if (!SplitTraceparent(first.traceparent, firstTrace, firstSpan)
        || !SplitTraceparent(second.traceparent, secondTrace, secondSpan)) {
        return Fail("Malformed traceparent on a paginated read.");
    }
    if (firstTrace != secondTrace || firstSpan == secondSpan) {
        return Fail("Follow-up pages should join the trace with their own span.");
    }
    if (unrelated.traceId == firstTrace) {
        return Fail("Independent fetches should start their own trace.");
    }
    return 0;
}

int TestTracingRequestedWithoutSupport() {
#if !FEEDWATCH_ENABLE_OTEL
    TraceConfig config;
    config.enabled = true;
    Tracer::Instance().Configure(config);
    if (Tracer::Instance().Enabled()) {
        return Fail("Tracing cannot be enabled in a build without OpenTelemetry.");
    }
#endif
    return 0;
}
} // namespace

int main() {
    int failures = 0;
    failures += TestFetchSpanCarriesTraceparent();
    failures += TestFollowUpPagesShareTrace();
    failures += TestTracingRequestedWithoutSupport();
    return failures == 0 ? 0 : 1;
}
