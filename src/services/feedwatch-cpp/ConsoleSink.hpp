#pragma once

#include "EventSink.hpp"

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

class ConsoleSink : public EventSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cout);

    bool Deliver(const WatchedResource& resource, const FeedItem& item) override;
    void Notify(const FeedNotice& notice) override;

    static std::string FormatItem(const WatchedResource& resource, const FeedItem& item);
    static std::string FormatNotice(const FeedNotice& notice);

private:
    std::ostream& out_;
    std::mutex mutex_;
};
