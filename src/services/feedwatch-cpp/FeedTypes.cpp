#include "FeedTypes.hpp"

#include <cctype>
#include <exception>
#include <tuple>

std::string WatchedResource::FullName() const {
    return owner + "/" + name;
}

bool WatchedResource::Parse(const std::string& text, WatchedResource& outResource) {
    const auto slashPos = text.find('/');
    if (slashPos == std::string::npos || slashPos == 0 || slashPos + 1 >= text.size()) {
        return false;
    }

    if (text.find('/', slashPos + 1) != std::string::npos) {
        return false;
    }

    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            return false;
        }
    }

    outResource.owner = text.substr(0, slashPos);
    outResource.name = text.substr(slashPos + 1);
    return true;
}

bool operator==(const WatchedResource& lhs, const WatchedResource& rhs) {
    return lhs.owner == rhs.owner && lhs.name == rhs.name;
}

bool operator!=(const WatchedResource& lhs, const WatchedResource& rhs) {
    return !(lhs == rhs);
}

bool operator<(const WatchedResource& lhs, const WatchedResource& rhs) {
    return std::tie(lhs.owner, lhs.name) < std::tie(rhs.owner, rhs.name);
}

bool FeedCursor::Empty() const {
    return lastSequence == 0 && lastItemId.empty() && etag.empty();
}

bool FeedCursor::Covers(const FeedItem& item) const {
    if (lastSequence == 0) {
        return false;
    }
    return item.sequence <= lastSequence;
}

bool FeedCursor::IsAtOrAfter(const FeedCursor& other) const {
    return lastSequence >= other.lastSequence;
}

bool operator==(const FeedCursor& lhs, const FeedCursor& rhs) {
    return lhs.lastSequence == rhs.lastSequence
        && lhs.lastItemId == rhs.lastItemId
        && lhs.etag == rhs.etag;
}

bool operator!=(const FeedCursor& lhs, const FeedCursor& rhs) {
    return !(lhs == rhs);
}

const char* ToString(FetchStatus status) {
    switch (status) {
    case FetchStatus::Ok:
        return "ok";
    case FetchStatus::RateLimited:
        return "rate-limited";
    case FetchStatus::Transient:
        return "transient";
    case FetchStatus::Fatal:
        return "fatal";
    }
    return "unknown";
}

std::uint64_t ParseSequence(const std::string& id) {
    if (id.empty()) {
        return 0;
    }

    for (const char ch : id) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return 0;
        }
    }

    try {
        return std::stoull(id);
    } catch (const std::exception&) {
    }

    return 0;
}
