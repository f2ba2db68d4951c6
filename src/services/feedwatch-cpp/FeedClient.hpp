#pragma once

#include "FeedTypes.hpp"
#include "PageFetcher.hpp"
#include "RateBudget.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

struct TlsSettings {
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = true;
};

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    bool transportOk = false;
    std::string transportError;
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; // lowercase keys
};

struct FeedClientConfig {
    std::string apiUrl = "https://api.github.com";
    std::string token;
    std::string userAgent = "feedwatch";
    int pageSize = 100;
    int maxPages = 10;
    std::chrono::seconds timeout{15};
    TlsSettings tls;
};

// Reads repository event feeds over the GitHub REST API. Uses entity tags so
// an unchanged feed costs a 304 instead of a full page.
class FeedClient : public PageFetcher {
public:
    using Transport = std::function<HttpResponse(const HttpRequest&)>;

    explicit FeedClient(FeedClientConfig config, Transport transport = Transport());

    FetchStatus Fetch(
        const WatchedResource& resource,
        const FeedCursor& cursor,
        RateBudget& budget,
        Page& outPage,
        std::string& outError) override;

    // Seeds the budget from the /rate_limit endpoint, which is not itself
    // counted against the budget.
    bool RefreshRateLimit(RateBudget& budget);

    static bool ParseEvents(const std::string& body, std::vector<FeedItem>& outItems, std::string& outError);
    static std::string ParseNextLink(const std::string& linkHeader);
    static FetchStatus ClassifyStatus(const HttpResponse& response, std::string& outError);
    static void ObserveRateLimit(const HttpResponse& response, RateBudget& budget);

private:
    // Traces the request as a continuation of previousPage when given and
    // leaves the finished span in outSpan.
    HttpResponse Get(
        const FetchSpanInfo& info,
        const std::string& etag,
        const SpanHandle* previousPage,
        SpanHandle& outSpan);
    HttpResponse Perform(const HttpRequest& request) const;
    std::string BuildEventsUrl(const WatchedResource& resource) const;

    FeedClientConfig config_;
    Transport transport_;
};
