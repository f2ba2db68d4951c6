#pragma once

#include "EventSink.hpp"
#include "FeedTypes.hpp"
#include "PageFetcher.hpp"
#include "RateBudget.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

inline int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

inline FeedItem MakeItem(std::uint64_t sequence) {
    FeedItem item;
    item.id = std::to_string(sequence);
    item.sequence = sequence;
    item.type = "PushEvent";
    item.actor = "octocat";
    return item;
}

inline FeedCursor MakeCursor(std::uint64_t sequence) {
    FeedCursor cursor;
    cursor.lastSequence = sequence;
    cursor.lastItemId = std::to_string(sequence);
    cursor.etag = "\"etag-" + std::to_string(sequence) + "\"";
    return cursor;
}

struct ScriptedResponse {
    FetchStatus status = FetchStatus::Ok;
    Page page;
    std::string error;
    int remaining = -1;
    std::time_t resetAt = 0;
};

inline ScriptedResponse Unchanged() {
    return ScriptedResponse();
}

// Nothing new, but the boundary at sequence came back with another entity tag.
inline ScriptedResponse UnchangedWithTag(std::uint64_t sequence, const std::string& etag) {
    ScriptedResponse response;
    response.page.cursor = MakeCursor(sequence);
    response.page.cursor.etag = etag;
    return response;
}

// New data covering sequences [first, last], oldest first.
inline ScriptedResponse NewData(std::uint64_t first, std::uint64_t last) {
    ScriptedResponse response;
    response.page.kind = PageKind::NewData;
    for (std::uint64_t sequence = first; sequence <= last; ++sequence) {
        response.page.items.push_back(MakeItem(sequence));
    }
    response.page.cursor = MakeCursor(last);
    return response;
}

inline ScriptedResponse Error(FetchStatus status, const std::string& error) {
    ScriptedResponse response;
    response.status = status;
    response.error = error;
    return response;
}

// Replays a fixed list of responses; once exhausted every fetch is Unchanged.
class ScriptedFetcher : public PageFetcher {
public:
    explicit ScriptedFetcher(std::vector<ScriptedResponse> script = {})
        : script_(script.begin(), script.end()) {}

    void Push(ScriptedResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(response));
    }

    FetchStatus Fetch(
        const WatchedResource&,
        const FeedCursor& cursor,
        RateBudget& budget,
        Page& outPage,
        std::string& outError) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cursors_.push_back(cursor);

        ScriptedResponse response;
        if (!script_.empty()) {
            response = script_.front();
            script_.pop_front();
        }

        if (response.remaining >= 0) {
            budget.Update(response.remaining, response.resetAt);
        }
        outPage = response.page;
        outError = response.error;
        return response.status;
    }

    std::vector<FeedCursor> Cursors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cursors_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<ScriptedResponse> script_;
    std::vector<FeedCursor> cursors_;
};

class RecordingSink : public EventSink {
public:
    // Number of further deliveries accepted before the sink starts refusing;
    // negative means unlimited.
    void FailAfter(int accepted, bool throwOnFailure = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        acceptBudget_ = accepted;
        throwOnFailure_ = throwOnFailure;
    }

    bool Deliver(const WatchedResource& resource, const FeedItem& item) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (acceptBudget_ == 0) {
            if (throwOnFailure_) {
                throw std::runtime_error("sink unavailable");
            }
            return false;
        }
        if (acceptBudget_ > 0) {
            --acceptBudget_;
        }
        delivered_[resource.FullName()].push_back(item.id);
        return true;
    }

    void Notify(const FeedNotice& notice) override {
        std::lock_guard<std::mutex> lock(mutex_);
        notices_[notice.resource.FullName()].push_back(notice.kind);
    }

    std::vector<std::string> Delivered(const std::string& resource) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = delivered_.find(resource);
        return it == delivered_.end() ? std::vector<std::string>() : it->second;
    }

    std::size_t CountNotices(const std::string& resource, NoticeKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = notices_.find(resource);
        if (it == notices_.end()) {
            return 0;
        }
        std::size_t count = 0;
        for (const auto noticeKind : it->second) {
            if (noticeKind == kind) {
                ++count;
            }
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    int acceptBudget_ = -1;
    bool throwOnFailure_ = false;
    std::map<std::string, std::vector<std::string>> delivered_;
    std::map<std::string, std::vector<NoticeKind>> notices_;
};
