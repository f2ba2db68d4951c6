#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

struct WatchedResource {
    std::string owner;
    std::string name;

    std::string FullName() const;

    // Accepts exactly "owner/name" with both parts non-empty.
    static bool Parse(const std::string& text, WatchedResource& outResource);
};

bool operator==(const WatchedResource& lhs, const WatchedResource& rhs);
bool operator!=(const WatchedResource& lhs, const WatchedResource& rhs);
bool operator<(const WatchedResource& lhs, const WatchedResource& rhs);

struct FeedItem {
    std::string id;
    std::uint64_t sequence = 0;
    std::string type;
    std::string actor;
    std::string repository;
    std::string createdAt;
    std::string payload;
};

// Boundary of everything already delivered for one feed. Sequences only move
// forward; the entity tag belongs to the response that produced the boundary.
struct FeedCursor {
    std::uint64_t lastSequence = 0;
    std::string lastItemId;
    std::string etag;

    bool Empty() const;
    bool Covers(const FeedItem& item) const;
    bool IsAtOrAfter(const FeedCursor& other) const;
};

bool operator==(const FeedCursor& lhs, const FeedCursor& rhs);
bool operator!=(const FeedCursor& lhs, const FeedCursor& rhs);

enum class PageKind {
    Unchanged,
    NewData
};

// For Unchanged pages cursor is either empty or the caller's boundary with a
// refreshed entity tag.
struct Page {
    PageKind kind = PageKind::Unchanged;
    std::vector<FeedItem> items;
    FeedCursor cursor;
    std::chrono::seconds pollInterval{0};
};

enum class FetchStatus {
    Ok,
    RateLimited,
    Transient,
    Fatal
};

const char* ToString(FetchStatus status);

enum class NoticeKind {
    Listening,
    NoNewEvents,
    NewEvents,
    Stopped
};

struct FeedNotice {
    NoticeKind kind = NoticeKind::Listening;
    WatchedResource resource;
    std::size_t itemCount = 0;
    bool remainingKnown = false;
    int remaining = 0;
    std::time_t timestamp = 0;
    std::string detail;
};

std::uint64_t ParseSequence(const std::string& id);
