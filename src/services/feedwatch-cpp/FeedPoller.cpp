#include "FeedPoller.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <iostream>
#include <utility>

namespace {
constexpr int kMaxRetryShift = 20;

std::chrono::milliseconds RetryDelay(std::chrono::milliseconds base, int attempt, std::chrono::milliseconds cap) {
    const int shift = std::min(std::max(attempt, 0), kMaxRetryShift);
    return std::min<std::chrono::milliseconds>(base * (1LL << shift), cap);
}
} // namespace

FeedPoller::FeedPoller(
    PageFetcher& fetcher,
    EventSink& sink,
    RateBudget& budget,
    StopSignal& stop,
    WatchedResource resource,
    PollerSettings settings,
    FeedCursor cursor,
    bool seeded)
    : fetcher_(fetcher),
      sink_(sink),
      budget_(budget),
      stop_(stop),
      resource_(std::move(resource)),
      settings_(settings),
      cursor_(std::move(cursor)),
      seeded_(seeded) {}

FeedPoller::~FeedPoller() {
    Join();
}

bool FeedPoller::Seed() {
    if (seeded_) {
        return true;
    }

    if (stop_.Requested() || state_ == PollerState::Stopped) {
        return false;
    }

    Notify(NoticeKind::Listening, 0);
    nextDelay_ = PollOnce();
    return seeded_;
}

std::chrono::milliseconds FeedPoller::PollOnce() {
    if (state_ == PollerState::Stopped) {
        return std::chrono::milliseconds(0);
    }

    state_ = PollerState::Polling;

    Page page;
    std::string error;
    const FetchStatus status = fetcher_.Fetch(resource_, cursor_, budget_, page, error);

    switch (status) {
    case FetchStatus::Ok:
        rateLimitedAttempts_ = 0;
        lastRateLimitDelay_ = std::chrono::milliseconds(0);
        nextDelay_ = page.kind == PageKind::NewData && !page.items.empty()
            ? HandleNewData(page)
            : HandleUnchanged(page);
        break;
    case FetchStatus::RateLimited:
        nextDelay_ = HandleRateLimited(error);
        break;
    case FetchStatus::Transient:
        nextDelay_ = HandleTransient(error);
        break;
    case FetchStatus::Fatal:
        Fail(error.empty() ? "fatal fetch error" : error);
        nextDelay_ = std::chrono::milliseconds(0);
        break;
    }

    if (state_ == PollerState::Polling) {
        state_ = PollerState::Idle;
    }
    return nextDelay_;
}

void FeedPoller::Start(StoppedCallback onStopped) {
    if (worker_.joinable()) {
        return;
    }

    onStopped_ = std::move(onStopped);
    worker_ = std::thread(&FeedPoller::Run, this);
}

void FeedPoller::Join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void FeedPoller::Run() {
    std::chrono::milliseconds delay = nextDelay_;
    while (state_ != PollerState::Stopped) {
        if (stop_.WaitFor(delay)) {
            break;
        }

        delay = PollOnce();
    }

    if (!failed_) {
        state_ = PollerState::Stopped;
        Notify(NoticeKind::Stopped, 0, "cancelled");
    }

    if (onStopped_) {
        onStopped_(*this);
    }
}

std::chrono::milliseconds FeedPoller::HandleNewData(const Page& page) {
    if (!seeded_) {
        // The first page only marks the backlog as seen.
        cursor_ = page.cursor;
        seeded_ = true;
        ResetFailureCounters();
        std::cout << "[Feed] " << resource_.FullName() << " seeded at #" << cursor_.lastItemId
                  << " (" << page.items.size() << " earlier event(s) skipped)" << std::endl;
        return PacingDelay(page.pollInterval);
    }

    std::size_t delivered = 0;
    for (const auto& item : page.items) {
        if (cursor_.Covers(item) || uncommittedIds_.count(item.id) > 0) {
            continue;
        }

        std::string sinkError;
        if (!DeliverItem(item, sinkError)) {
            return HandleTransient("sink rejected event " + item.id + ": " + sinkError);
        }

        uncommittedIds_.insert(item.id);
        ++delivered;
    }

    if (page.cursor.IsAtOrAfter(cursor_)) {
        cursor_ = page.cursor;
    } else {
        std::cerr << "[Feed] " << resource_.FullName() << " ignored a cursor older than #"
                  << cursor_.lastItemId << std::endl;
    }
    uncommittedIds_.clear();
    ResetFailureCounters();

    Notify(delivered > 0 ? NoticeKind::NewEvents : NoticeKind::NoNewEvents, delivered);
    return PacingDelay(page.pollInterval);
}

std::chrono::milliseconds FeedPoller::HandleUnchanged(const Page& page) {
    if (!page.cursor.etag.empty() && page.cursor.lastSequence == cursor_.lastSequence) {
        cursor_.etag = page.cursor.etag;
    }

    if (!seeded_) {
        seeded_ = true;
        std::cout << "[Feed] " << resource_.FullName() << " seeded with no earlier events" << std::endl;
    }

    ResetFailureCounters();
    Notify(NoticeKind::NoNewEvents, 0);
    return PacingDelay(page.pollInterval);
}

std::chrono::milliseconds FeedPoller::HandleRateLimited(const std::string& error) {
    const std::time_t now = std::time(nullptr);
    std::chrono::milliseconds delay = budget_.BackoffDelay(
        rateLimitedAttempts_, settings_.retryDelay, settings_.maxBackoff, now);
    delay = std::min(std::max(delay, lastRateLimitDelay_), settings_.maxBackoff);

    lastRateLimitDelay_ = delay;
    ++rateLimitedAttempts_;

    std::cerr << "[Feed] " << resource_.FullName() << " rate limited"
              << (error.empty() ? "" : " (" + error + ")")
              << ". Pausing for " << delay.count() << "ms" << std::endl;
    return delay;
}

std::chrono::milliseconds FeedPoller::HandleTransient(const std::string& error) {
    ++transientFailures_;
    if (transientFailures_ > settings_.maxTransientRetries) {
        Fail("giving up after " + std::to_string(transientFailures_) + " consecutive failures: " + error);
        return std::chrono::milliseconds(0);
    }

    const std::chrono::milliseconds delay = RetryDelay(
        settings_.retryDelay, transientFailures_ - 1, settings_.maxBackoff);

    std::cerr << "[Feed] " << resource_.FullName() << " poll failed (Attempt " << transientFailures_
              << "/" << settings_.maxTransientRetries << "): " << error
              << ". Retrying in " << delay.count() << "ms" << std::endl;
    return delay;
}

std::chrono::milliseconds FeedPoller::PacingDelay(std::chrono::seconds serverHint) const {
    std::chrono::milliseconds delay = budget_.PacingDelay(settings_.baseInterval, std::time(nullptr));
    delay = std::min(delay, std::max(settings_.maxBackoff, settings_.baseInterval));
    return std::max<std::chrono::milliseconds>(delay, serverHint);
}

bool FeedPoller::DeliverItem(const FeedItem& item, std::string& outError) {
    try {
        if (sink_.Deliver(resource_, item)) {
            return true;
        }
        outError = "delivery refused";
    } catch (const std::exception& ex) {
        outError = ex.what();
    }
    return false;
}

void FeedPoller::Fail(const std::string& reason) {
    failureReason_ = reason;
    failed_ = true;
    state_ = PollerState::Stopped;
    std::cerr << "[Feed] " << resource_.FullName() << " stopped: " << reason << std::endl;
    Notify(NoticeKind::Stopped, 0, reason);
}

void FeedPoller::Notify(NoticeKind kind, std::size_t itemCount, const std::string& detail) {
    FeedNotice notice;
    notice.kind = kind;
    notice.resource = resource_;
    notice.itemCount = itemCount;
    notice.remainingKnown = budget_.Known();
    notice.remaining = budget_.Remaining();
    notice.timestamp = std::time(nullptr);
    notice.detail = detail;

    try {
        sink_.Notify(notice);
    } catch (const std::exception& ex) {
        std::cerr << "[Feed] " << resource_.FullName() << " notice dropped: " << ex.what() << std::endl;
    }
}

void FeedPoller::ResetFailureCounters() {
    transientFailures_ = 0;
}

PollerState FeedPoller::State() const {
    return state_;
}

bool FeedPoller::Seeded() const {
    return seeded_;
}

bool FeedPoller::Failed() const {
    return failed_;
}

const FeedCursor& FeedPoller::Cursor() const {
    return cursor_;
}

const WatchedResource& FeedPoller::Resource() const {
    return resource_;
}

const std::string& FeedPoller::FailureReason() const {
    return failureReason_;
}
