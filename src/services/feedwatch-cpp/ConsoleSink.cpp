#include "ConsoleSink.hpp"

#include <sstream>

namespace {
std::string FormatRemaining(const FeedNotice& notice) {
    return notice.remainingKnown ? std::to_string(notice.remaining) : "?";
}
} // namespace

ConsoleSink::ConsoleSink(std::ostream& out)
    : out_(out) {}

bool ConsoleSink::Deliver(const WatchedResource& resource, const FeedItem& item) {
    const std::string line = FormatItem(resource, item);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
    return out_.good();
}

void ConsoleSink::Notify(const FeedNotice& notice) {
    const std::string line = FormatNotice(notice);
    if (line.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

std::string ConsoleSink::FormatItem(const WatchedResource& resource, const FeedItem& item) {
    std::ostringstream line;
    line << "#" << item.id << "--> " << (item.actor.empty() ? "(unknown)" : item.actor) << ": "
         << (item.type.empty() ? "Event" : item.type) << " on "
         << (item.repository.empty() ? resource.FullName() : item.repository);
    return line.str();
}

std::string ConsoleSink::FormatNotice(const FeedNotice& notice) {
    const std::string target = notice.resource.FullName();
    std::ostringstream line;
    switch (notice.kind) {
    case NoticeKind::Listening:
        line << "listening for events on " << target;
        break;
    case NoticeKind::NoNewEvents:
        line << notice.timestamp << " no new events on " << target << " (" << FormatRemaining(notice) << ")";
        break;
    case NoticeKind::NewEvents:
        line << notice.timestamp << " new events on " << target << " (" << FormatRemaining(notice) << ")";
        break;
    case NoticeKind::Stopped:
        line << "stopped watching " << target;
        if (!notice.detail.empty()) {
            line << ": " << notice.detail;
        }
        break;
    }
    return line.str();
}
