#pragma once

#include "FeedTypes.hpp"
#include "RateBudget.hpp"

#include <string>

class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    // Performs one conditional fetch of the feed newer than cursor. Refreshes
    // budget from response metadata whenever the response carries it. On Ok,
    // outPage is either Unchanged or NewData with oldest-first items.
    virtual FetchStatus Fetch(
        const WatchedResource& resource,
        const FeedCursor& cursor,
        RateBudget& budget,
        Page& outPage,
        std::string& outError) = 0;
};
