#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>

// Request allowance shared by every feed polled under one credential. The
// remote service is the source of truth, so each report simply overwrites the
// previous one.
class RateBudget {
public:
    explicit RateBudget(int floor = 50);

    void Update(int remaining);
    void Update(int remaining, std::time_t resetAt);
    void DeferUntil(std::time_t resumeAt);

    bool Known() const;
    int Remaining() const;
    std::time_t ResetAt() const;
    int Floor() const;
    bool IsLow() const;

    // Delay between two successful polls. Lengthened once the budget is at or
    // below the floor so the remaining requests last until the reset time.
    std::chrono::milliseconds PacingDelay(std::chrono::milliseconds base, std::time_t now) const;

    // Wait after a refused request: until the reset time when one is known,
    // never less than base * 2^attempt, never more than cap.
    std::chrono::milliseconds BackoffDelay(
        int attempt,
        std::chrono::milliseconds base,
        std::chrono::milliseconds cap,
        std::time_t now) const;

private:
    std::atomic<bool> known_{false};
    std::atomic<int> remaining_{0};
    std::atomic<std::int64_t> resetAt_{0};
    int floor_;
};
