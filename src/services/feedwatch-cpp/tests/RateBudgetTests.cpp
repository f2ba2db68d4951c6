#include "RateBudget.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <string>

namespace {
using std::chrono::milliseconds;
using std::chrono::seconds;

constexpr std::time_t kNow = 1700000000;

int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

int TestUnknownUntilReported() {
    RateBudget budget(10);
    if (budget.Known() || budget.IsLow()) {
        return Fail("A fresh budget is unknown and never low.");
    }
    budget.Update(-3);
    if (!budget.Known() || budget.Remaining() != 0) {
        return Fail("Negative remaining counts clamp to zero.");
    }
    budget.Update(4999, kNow + 60);
    if (budget.Remaining() != 4999 || budget.ResetAt() != kNow + 60) {
        return Fail("Update should overwrite remaining and reset time.");
    }
    budget.Update(4998);
    if (budget.ResetAt() != kNow + 60) {
        return Fail("Updating remaining alone keeps the reset time.");
    }
    return 0;
}

int TestFloor() {
    RateBudget budget(10);
    budget.Update(11);
    if (budget.IsLow()) {
        return Fail("Above the floor is not low.");
    }
    budget.Update(10);
    if (!budget.IsLow()) {
        return Fail("At the floor is low.");
    }
    if (RateBudget(-4).Floor() != 0) {
        return Fail("Negative floors clamp to zero.");
    }
    return 0;
}

int TestPacingDelay() {
    RateBudget budget(50);
    const milliseconds base(1000);
    if (budget.PacingDelay(base, kNow) != base) {
        return Fail("Unknown budget keeps the base interval.");
    }

    budget.Update(4000, kNow + 600);
    if (budget.PacingDelay(base, kNow) != base) {
        return Fail("Plenty of budget keeps the base interval.");
    }

    budget.Update(9, kNow + 600);
    if (budget.PacingDelay(base, kNow) != milliseconds(60000)) {
        return Fail("Low budget should spread the remaining requests until reset.");
    }

    budget.Update(9, kNow - 5);
    if (budget.PacingDelay(base, kNow) != milliseconds(2000)) {
        return Fail("Low budget with a past reset should double the interval.");
    }
    return 0;
}

int TestBackoffGrowsAndCaps() {
    RateBudget budget;
    const milliseconds base(100);
    const milliseconds cap(1000);
    if (budget.BackoffDelay(0, base, cap, kNow) != milliseconds(100)
        || budget.BackoffDelay(2, base, cap, kNow) != milliseconds(400)
        || budget.BackoffDelay(4, base, cap, kNow) != cap
        || budget.BackoffDelay(200, base, cap, kNow) != cap) {
        return Fail("Backoff should double per attempt up to the cap.");
    }
    return 0;
}

int TestBackoffWaitsForReset() {
    RateBudget budget;
    budget.Update(0, kNow + 30);
    const milliseconds delay = budget.BackoffDelay(0, milliseconds(100), seconds(900), kNow);
    if (delay != seconds(31)) {
        return Fail("Backoff should wait until just past the reset time.");
    }
    const milliseconds capped = budget.BackoffDelay(0, milliseconds(100), seconds(10), kNow);
    if (capped != seconds(10)) {
        return Fail("The cap bounds waits for a distant reset.");
    }
    return 0;
}

int TestDeferOnlyMovesForward() {
    RateBudget budget;
    budget.DeferUntil(kNow + 20);
    if (budget.ResetAt() != kNow + 20) {
        return Fail("DeferUntil should push the reset time.");
    }
    budget.DeferUntil(kNow + 5);
    if (budget.ResetAt() != kNow + 20) {
        return Fail("DeferUntil must not move the reset time back.");
    }
    if (budget.Known()) {
        return Fail("Deferring does not make the remaining count known.");
    }
    return 0;
}
} // namespace

int main() {
    int failures = 0;
    failures += TestUnknownUntilReported();
    failures += TestFloor();
    failures += TestPacingDelay();
    failures += TestBackoffGrowsAndCaps();
    failures += TestBackoffWaitsForReset();
    failures += TestDeferOnlyMovesForward();
    return failures == 0 ? 0 : 1;
}
