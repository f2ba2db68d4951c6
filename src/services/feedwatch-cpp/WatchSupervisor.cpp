#include "WatchSupervisor.hpp"

#include <chrono>
#include <iostream>
#include <set>
#include <utility>

namespace {
constexpr auto kStopCheckInterval = std::chrono::milliseconds(200);
} // namespace

WatchSupervisor::WatchSupervisor(PageFetcher& fetcher, EventSink& sink, RateBudget& budget, PollerSettings settings)
    : fetcher_(fetcher),
      sink_(sink),
      budget_(budget),
      settings_(settings) {}

bool WatchSupervisor::Run(const std::vector<WatchedResource>& resources, StopSignal& stop) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = 0;
        failures_.clear();
    }

    std::set<WatchedResource> unique;
    std::vector<WatchedResource> feeds;
    for (const auto& resource : resources) {
        if (unique.insert(resource).second) {
            feeds.push_back(resource);
        }
    }

    if (feeds.empty()) {
        std::cerr << "[Watch] No feeds to watch." << std::endl;
        return false;
    }

    std::vector<std::unique_ptr<FeedPoller>> pollers;
    pollers.reserve(feeds.size());

    for (const auto& resource : feeds) {
        if (stop.Requested()) {
            break;
        }

        auto poller = std::make_unique<FeedPoller>(fetcher_, sink_, budget_, stop, resource, settings_);
        if (!poller->Seed() && poller->Failed()) {
            RecordFailure(*poller);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++active_;
        }
        poller->Start([this](FeedPoller& stopped) { OnPollerStopped(stopped); });
        pollers.push_back(std::move(poller));
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (active_ > 0 && !stop.Requested()) {
            cv_.wait_for(lock, kStopCheckInterval);
        }
    }

    if (stop.Requested()) {
        std::cout << "[Watch] Stop requested. Waiting for " << ActiveFeeds() << " feed(s) to finish." << std::endl;
    }

    for (auto& poller : pollers) {
        poller->Join();
    }

    const std::vector<FeedFailure> failures = Failures();
    if (failures.size() == feeds.size()) {
        std::cerr << "[Watch] All " << feeds.size() << " feed(s) stopped with errors." << std::endl;
        return false;
    }

    if (!failures.empty()) {
        std::cerr << "[Watch] " << failures.size() << " of " << feeds.size() << " feed(s) stopped with errors." << std::endl;
    }
    return true;
}

std::size_t WatchSupervisor::ActiveFeeds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::vector<FeedFailure> WatchSupervisor::Failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void WatchSupervisor::OnPollerStopped(FeedPoller& poller) {
    if (poller.Failed()) {
        RecordFailure(poller);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) {
            --active_;
        }
    }
    cv_.notify_all();
}

void WatchSupervisor::RecordFailure(const FeedPoller& poller) {
    std::cerr << "[Watch] Feed " << poller.Resource().FullName() << " failed: " << poller.FailureReason() << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back({poller.Resource(), poller.FailureReason()});
}
