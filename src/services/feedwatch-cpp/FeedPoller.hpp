#pragma once

#include "EventSink.hpp"
#include "FeedTypes.hpp"
#include "PageFetcher.hpp"
#include "RateBudget.hpp"
#include "StopSignal.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <unordered_set>

enum class PollerState {
    Idle,
    Polling,
    Stopped
};

struct PollerSettings {
    std::chrono::milliseconds baseInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds retryDelay{std::chrono::seconds(2)};
    std::chrono::milliseconds maxBackoff{std::chrono::seconds(900)};
    int maxTransientRetries = 5;
};

class FeedPoller {
public:
    using StoppedCallback = std::function<void(FeedPoller&)>;

    FeedPoller(
        PageFetcher& fetcher,
        EventSink& sink,
        RateBudget& budget,
        StopSignal& stop,
        WatchedResource resource,
        PollerSettings settings = {},
        FeedCursor cursor = {},
        bool seeded = false);
    ~FeedPoller();

    FeedPoller(const FeedPoller&) = delete;
    FeedPoller& operator=(const FeedPoller&) = delete;

    // One fetch that establishes the starting cursor without emitting the
    // backlog. Returns true once the feed is seeded.
    bool Seed();

    // Runs one fetch and returns the delay before the next one.
    std::chrono::milliseconds PollOnce();

    void Start(StoppedCallback onStopped = StoppedCallback());
    void Join();

    PollerState State() const;
    bool Seeded() const;
    bool Failed() const;
    const FeedCursor& Cursor() const;
    const WatchedResource& Resource() const;
    const std::string& FailureReason() const;

private:
    void Run();
    std::chrono::milliseconds HandleNewData(const Page& page);
    std::chrono::milliseconds HandleUnchanged(const Page& page);
    std::chrono::milliseconds HandleRateLimited(const std::string& error);
    std::chrono::milliseconds HandleTransient(const std::string& error);
    std::chrono::milliseconds PacingDelay(std::chrono::seconds serverHint) const;
    bool DeliverItem(const FeedItem& item, std::string& outError);
    void Fail(const std::string& reason);
    void Notify(NoticeKind kind, std::size_t itemCount, const std::string& detail = {});
    void ResetFailureCounters();

    PageFetcher& fetcher_;
    EventSink& sink_;
    RateBudget& budget_;
    StopSignal& stop_;
    WatchedResource resource_;
    PollerSettings settings_;

    FeedCursor cursor_;
    bool seeded_;
    std::atomic<PollerState> state_{PollerState::Idle};
    std::atomic<bool> failed_{false};
    std::string failureReason_;

    int transientFailures_ = 0;
    int rateLimitedAttempts_ = 0;
    std::chrono::milliseconds lastRateLimitDelay_{0};
    std::chrono::milliseconds nextDelay_{0};
    // Items already accepted by the sink whose batch has not been committed.
    std::unordered_set<std::string> uncommittedIds_;

    StoppedCallback onStopped_;
    std::thread worker_;
};
