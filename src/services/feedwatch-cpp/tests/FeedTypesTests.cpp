#include "FeedTypes.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

int TestParseAcceptsOwnerAndName() {
    WatchedResource resource;
    if (!WatchedResource::Parse("torvalds/linux", resource)) {
        return Fail("Expected owner/name to parse.");
    }
    if (resource.owner != "torvalds" || resource.name != "linux") {
        return Fail("Parsed owner or name mismatch.");
    }
    if (resource.FullName() != "torvalds/linux") {
        return Fail("FullName should rebuild the original text.");
    }
    return 0;
}

int TestParseRejectsMalformedNames() {
    const char* invalid[] = {"", "linux", "/linux", "torvalds/", "a/b/c", "tor valds/linux", "torvalds/linux\n", "/"};
    for (const char* text : invalid) {
        WatchedResource resource;
        resource.owner = "unchanged";
        if (WatchedResource::Parse(text, resource)) {
            return Fail(std::string("Expected parse failure for '") + text + "'");
        }
        if (resource.owner != "unchanged") {
            return Fail("A failed parse must leave the output untouched.");
        }
    }
    return 0;
}

int TestResourceOrdering() {
    const WatchedResource a{"org", "a"};
    const WatchedResource b{"org", "b"};
    if (!(a < b) || b < a || a == b || !(a != b)) {
        return Fail("Resources should order by owner then name.");
    }
    if (!(a == WatchedResource{"org", "a"})) {
        return Fail("Equal resources should compare equal.");
    }
    return 0;
}

int TestCursorCovers() {
    FeedCursor empty;
    FeedItem item;
    item.id = "7";
    item.sequence = 7;
    if (!empty.Empty() || empty.Covers(item)) {
        return Fail("An empty cursor covers nothing.");
    }

    FeedCursor cursor;
    cursor.lastSequence = 7;
    cursor.lastItemId = "7";
    if (cursor.Empty() || !cursor.Covers(item)) {
        return Fail("The boundary item itself is already delivered.");
    }
    item.sequence = 8;
    if (cursor.Covers(item)) {
        return Fail("Newer items must not be covered.");
    }
    item.sequence = 3;
    if (!cursor.Covers(item)) {
        return Fail("Older items must be covered.");
    }
    return 0;
}

int TestCursorComparison() {
    FeedCursor older;
    older.lastSequence = 4;
    FeedCursor newer;
    newer.lastSequence = 9;
    newer.etag = "\"abc\"";
    if (!newer.IsAtOrAfter(older) || older.IsAtOrAfter(newer) || !older.IsAtOrAfter(older)) {
        return Fail("IsAtOrAfter should compare sequences.");
    }

    FeedCursor sameSequence = newer;
    sameSequence.etag = "\"def\"";
    if (sameSequence == newer || !(sameSequence != newer)) {
        return Fail("Cursors with different entity tags are different.");
    }
    return 0;
}

int TestParseSequence() {
    if (ParseSequence("2489651045") != 2489651045ULL) {
        return Fail("Numeric ids should parse.");
    }
    if (ParseSequence("") != 0 || ParseSequence("abc") != 0 || ParseSequence("12a") != 0 || ParseSequence("-5") != 0) {
        return Fail("Non-numeric ids have no sequence.");
    }
    if (ParseSequence("99999999999999999999999") != 0) {
        return Fail("Out of range ids have no sequence.");
    }
    return 0;
}

int TestStatusNames() {
    if (std::string(ToString(FetchStatus::RateLimited)) != "rate-limited"
        || std::string(ToString(FetchStatus::Fatal)) != "fatal") {
        return Fail("Unexpected status names.");
    }
    return 0;
}
} // namespace

int main() {
    int failures = 0;
    failures += TestParseAcceptsOwnerAndName();
    failures += TestParseRejectsMalformedNames();
    failures += TestResourceOrdering();
    failures += TestCursorCovers();
    failures += TestCursorComparison();
    failures += TestParseSequence();
    failures += TestStatusNames();
    return failures == 0 ? 0 : 1;
}
