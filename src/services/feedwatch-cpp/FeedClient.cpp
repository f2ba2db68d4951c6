#include "FeedClient.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iostream>
#include <set>
#include <string>
#include <utility>

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(5);
constexpr int kMaxPageSize = 100;

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    if (baseUrl.back() == '/') {
        return baseUrl.substr(0, baseUrl.size() - 1) + path;
    }

    return baseUrl + path;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string HeaderValue(const HttpResponse& response, const std::string& lowerName) {
    const auto it = response.headers.find(lowerName);
    return it == response.headers.end() ? std::string() : it->second;
}

bool ParseLong(const std::string& text, long long& outValue) {
    if (text.empty()) {
        return false;
    }

    try {
        size_t index = 0;
        const long long value = std::stoll(text, &index);
        if (index == text.size()) {
            outValue = value;
            return true;
        }
    } catch (const std::exception&) {
    }

    return false;
}

std::string JsonId(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return {};
}

// Secondary rate limits answer 403 with budget left and only say so in the
// error message.
bool MentionsRateLimit(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("message") || !json["message"].is_string()) {
        return false;
    }
    return ToLower(json["message"].get<std::string>()).find("rate limit") != std::string::npos;
}

cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    cpr::SslOptions options = cpr::Ssl(
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
    if (!settings.caPath.empty()) {
        options.SetOption(cpr::ssl::CaInfo{settings.caPath});
    }
    return options;
}

HttpResponse PerformGet(const HttpRequest& request, const FeedClientConfig& config) {
    cpr::Header headers;
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }

    cpr::Response response = cpr::Get(
        cpr::Url{request.url},
        headers,
        cpr::ConnectTimeout{kConnectTimeout},
        cpr::Timeout{config.timeout},
        BuildSslOptions(config.tls));

    HttpResponse result;
    result.transportOk = response.error.code == cpr::ErrorCode::OK;
    result.transportError = response.error.message;
    result.status = response.status_code;
    result.body = std::move(response.text);
    for (const auto& [name, value] : response.header) {
        result.headers[ToLower(name)] = value;
    }
    return result;
}
} // namespace

FeedClient::FeedClient(FeedClientConfig config, Transport transport)
    : config_(std::move(config)),
      transport_(std::move(transport)) {}

FetchStatus FeedClient::Fetch(
    const WatchedResource& resource,
    const FeedCursor& cursor,
    RateBudget& budget,
    Page& outPage,
    std::string& outError) {
    outPage = Page();
    outError.clear();

    if (resource.owner.empty() || resource.name.empty()) {
        outError = "malformed resource name '" + resource.FullName() + "'";
        return FetchStatus::Fatal;
    }

    const bool seeding = cursor.lastSequence == 0;
    const int maxPages = std::max(1, config_.maxPages);

    std::string url = BuildEventsUrl(resource);
    std::vector<FeedItem> collected;
    std::set<std::string> seenIds;
    FeedCursor next = cursor;
    bool reachedBoundary = false;
    SpanHandle previousSpan;

    for (int page = 1; page <= maxPages && !url.empty(); ++page) {
        SpanHandle span;
        const HttpResponse response = Get(
            {url, resource.FullName(), page},
            page == 1 ? cursor.etag : std::string(),
            page == 1 ? nullptr : &previousSpan,
            span);
        previousSpan = std::move(span);
        if (!response.transportOk) {
            outError = resource.FullName() + ": request failed: " + response.transportError;
            return FetchStatus::Transient;
        }

        ObserveRateLimit(response, budget);

        const FetchStatus status = ClassifyStatus(response, outError);
        if (status != FetchStatus::Ok) {
            outError = resource.FullName() + ": " + outError;
            return status;
        }

        if (page == 1) {
            long long pollSeconds = 0;
            if (ParseLong(HeaderValue(response, "x-poll-interval"), pollSeconds) && pollSeconds > 0) {
                outPage.pollInterval = std::chrono::seconds(pollSeconds);
            }

            if (response.status == 304) {
                outPage.kind = PageKind::Unchanged;
                return FetchStatus::Ok;
            }

            next.etag = HeaderValue(response, "etag");
        } else if (response.status == 304) {
            url.clear();
            break;
        }

        std::vector<FeedItem> items;
        if (!ParseEvents(response.body, items, outError)) {
            outError = resource.FullName() + ": " + outError;
            return FetchStatus::Transient;
        }

        for (auto& item : items) {
            if (cursor.Covers(item)) {
                reachedBoundary = true;
                continue;
            }
            if (seenIds.insert(item.id).second) {
                collected.push_back(std::move(item));
            }
        }

        if (seeding || reachedBoundary || items.empty()) {
            url.clear();
            break;
        }

        url = ParseNextLink(HeaderValue(response, "link"));
    }

    if (!url.empty()) {
        std::cerr << "[Network] " << resource.FullName() << " has more than " << maxPages
                  << " page(s) of new events; older ones were not read." << std::endl;
    }

    if (collected.empty()) {
        // Same boundary, but keep the fresh entity tag so the next poll can
        // be answered with a 304.
        outPage.kind = PageKind::Unchanged;
        outPage.cursor = std::move(next);
        return FetchStatus::Ok;
    }

    std::stable_sort(collected.begin(), collected.end(), [](const FeedItem& lhs, const FeedItem& rhs) {
        return lhs.sequence < rhs.sequence;
    });

    next.lastSequence = collected.back().sequence;
    next.lastItemId = collected.back().id;

    outPage.kind = PageKind::NewData;
    outPage.items = std::move(collected);
    outPage.cursor = std::move(next);
    return FetchStatus::Ok;
}

bool FeedClient::RefreshRateLimit(RateBudget& budget) {
    SpanHandle span;
    const HttpResponse response = Get({BuildUrl(config_.apiUrl, "/rate_limit"), {}, 1}, {}, nullptr, span);
    if (!response.transportOk) {
        std::cerr << "[Network] rate limit request failed: " << response.transportError << std::endl;
        return false;
    }

    if (response.status != 200) {
        std::cerr << "[Network] rate limit request failed with HTTP " << response.status << std::endl;
        return false;
    }

    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        std::cerr << "[Network] rate limit request returned an unreadable body" << std::endl;
        return false;
    }

    nlohmann::json core;
    if (json.contains("resources") && json["resources"].is_object() && json["resources"].contains("core")) {
        core = json["resources"]["core"];
    } else if (json.contains("rate")) {
        core = json["rate"];
    }

    if (!core.is_object() || !core.contains("remaining") || !core["remaining"].is_number()) {
        std::cerr << "[Network] rate limit request response missing remaining count" << std::endl;
        return false;
    }

    const int remaining = core["remaining"].get<int>();
    if (core.contains("reset") && core["reset"].is_number()) {
        budget.Update(remaining, static_cast<std::time_t>(core["reset"].get<long long>()));
    } else {
        budget.Update(remaining);
    }

    std::cout << "[Network] " << remaining << " request(s) remaining in the current window." << std::endl;
    return true;
}

bool FeedClient::ParseEvents(const std::string& body, std::vector<FeedItem>& outItems, std::string& outError) {
    outItems.clear();

    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        outError = "event list is not a JSON array";
        return false;
    }

    try {
        for (const auto& event : json) {
            if (!event.is_object() || !event.contains("id")) {
                continue;
            }

            FeedItem item;
            item.id = JsonId(event["id"]);
            item.sequence = ParseSequence(item.id);
            if (item.sequence == 0) {
                std::cerr << "[Network] skipping event with unusable id '" << item.id << "'" << std::endl;
                continue;
            }

            item.type = event.value("type", "");
            item.createdAt = event.value("created_at", "");
            if (event.contains("actor") && event["actor"].is_object()) {
                item.actor = event["actor"].value("login", "");
            }
            if (event.contains("repo") && event["repo"].is_object()) {
                item.repository = event["repo"].value("name", "");
            }
            if (event.contains("payload")) {
                item.payload = event["payload"].dump();
            }

            outItems.push_back(std::move(item));
        }
    } catch (const nlohmann::json::exception& ex) {
        outItems.clear();
        outError = std::string("malformed event: ") + ex.what();
        return false;
    }

    return true;
}

std::string FeedClient::ParseNextLink(const std::string& linkHeader) {
    size_t start = 0;
    while (start < linkHeader.size()) {
        size_t end = linkHeader.find(',', start);
        if (end == std::string::npos) {
            end = linkHeader.size();
        }

        const std::string part = Trim(linkHeader.substr(start, end - start));
        const auto open = part.find('<');
        const auto close = part.find('>', open == std::string::npos ? 0 : open);
        if (open != std::string::npos && close != std::string::npos
            && part.find("rel=\"next\"", close) != std::string::npos) {
            return part.substr(open + 1, close - open - 1);
        }

        start = end + 1;
    }

    return {};
}

FetchStatus FeedClient::ClassifyStatus(const HttpResponse& response, std::string& outError) {
    const long status = response.status;
    if (status == 200 || status == 304) {
        return FetchStatus::Ok;
    }

    if (status == 401) {
        outError = "authentication rejected (HTTP 401)";
        return FetchStatus::Fatal;
    }

    if (status == 403 || status == 429) {
        const bool exhausted = HeaderValue(response, "x-ratelimit-remaining") == "0";
        const bool throttled = !HeaderValue(response, "retry-after").empty();
        if (status == 429 || exhausted || throttled || MentionsRateLimit(response.body)) {
            outError = "rate limit exceeded (HTTP " + std::to_string(status) + ")";
            return FetchStatus::RateLimited;
        }
        outError = "access forbidden (HTTP 403)";
        return FetchStatus::Fatal;
    }

    if (status == 404 || status == 410) {
        outError = "feed not found (HTTP " + std::to_string(status) + ")";
        return FetchStatus::Fatal;
    }

    if (status >= 500) {
        outError = "server error (HTTP " + std::to_string(status) + ")";
        return FetchStatus::Transient;
    }

    if (status >= 400) {
        outError = "request rejected (HTTP " + std::to_string(status) + ")";
        return FetchStatus::Fatal;
    }

    outError = "unexpected HTTP " + std::to_string(status);
    return FetchStatus::Transient;
}

void FeedClient::ObserveRateLimit(const HttpResponse& response, RateBudget& budget) {
    long long remaining = 0;
    if (ParseLong(HeaderValue(response, "x-ratelimit-remaining"), remaining)) {
        long long resetAt = 0;
        if (ParseLong(HeaderValue(response, "x-ratelimit-reset"), resetAt)) {
            budget.Update(static_cast<int>(remaining), static_cast<std::time_t>(resetAt));
        } else {
            budget.Update(static_cast<int>(remaining));
        }
    }

    long long retryAfter = 0;
    if (ParseLong(HeaderValue(response, "retry-after"), retryAfter) && retryAfter > 0) {
        budget.DeferUntil(std::time(nullptr) + static_cast<std::time_t>(retryAfter));
    }
}

HttpResponse FeedClient::Get(
    const FetchSpanInfo& info,
    const std::string& etag,
    const SpanHandle* previousPage,
    SpanHandle& outSpan) {
    outSpan = Tracer::Instance().StartFetchSpan(info, previousPage);

    HttpRequest request;
    request.url = info.url;
    request.headers["Accept"] = "application/vnd.github+json";
    request.headers["User-Agent"] = config_.userAgent;
    request.headers["traceparent"] = outSpan.traceparent;
    if (!config_.token.empty()) {
        request.headers["Authorization"] = "token " + config_.token;
    }
    if (!etag.empty()) {
        request.headers["If-None-Match"] = etag;
    }

    HttpResponse response = Perform(request);

    Tracer::Instance().EndFetchSpan(outSpan, response.status, response.transportOk);
    return response;
}

HttpResponse FeedClient::Perform(const HttpRequest& request) const {
    if (transport_) {
        return transport_(request);
    }

    return PerformGet(request, config_);
}

std::string FeedClient::BuildEventsUrl(const WatchedResource& resource) const {
    const int pageSize = std::clamp(config_.pageSize, 1, kMaxPageSize);
    return BuildUrl(config_.apiUrl, "/repos/" + resource.owner + "/" + resource.name + "/events")
        + "?per_page=" + std::to_string(pageSize);
}
