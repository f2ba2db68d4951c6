#pragma once

#include "EventSink.hpp"
#include "FeedPoller.hpp"
#include "FeedTypes.hpp"
#include "PageFetcher.hpp"
#include "RateBudget.hpp"
#include "StopSignal.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct FeedFailure {
    WatchedResource resource;
    std::string reason;
};

class WatchSupervisor {
public:
    WatchSupervisor(PageFetcher& fetcher, EventSink& sink, RateBudget& budget, PollerSettings settings = {});

    // Seeds every feed, runs one poller thread per feed and blocks until stop
    // is requested or every feed has stopped. Returns false when every feed
    // failed.
    bool Run(const std::vector<WatchedResource>& resources, StopSignal& stop);

    std::size_t ActiveFeeds() const;
    std::vector<FeedFailure> Failures() const;

private:
    void OnPollerStopped(FeedPoller& poller);
    void RecordFailure(const FeedPoller& poller);

    PageFetcher& fetcher_;
    EventSink& sink_;
    RateBudget& budget_;
    PollerSettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t active_ = 0;
    std::vector<FeedFailure> failures_;
};
