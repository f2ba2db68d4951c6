#pragma once

#include "FeedTypes.hpp"

class EventSink {
public:
    virtual ~EventSink() = default;

    // Returns false (or throws) when the item could not be accepted.
    virtual bool Deliver(const WatchedResource& resource, const FeedItem& item) = 0;
    virtual void Notify(const FeedNotice& notice) = 0;
};
