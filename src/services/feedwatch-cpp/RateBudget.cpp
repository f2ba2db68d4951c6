#include "RateBudget.hpp"

#include <algorithm>

namespace {
constexpr int kMaxBackoffShift = 20;

std::chrono::milliseconds Exponential(std::chrono::milliseconds base, int attempt, std::chrono::milliseconds cap) {
    const int shift = std::clamp(attempt, 0, kMaxBackoffShift);
    const auto scaled = base * (1LL << shift);
    return std::min<std::chrono::milliseconds>(scaled, cap);
}
} // namespace

RateBudget::RateBudget(int floor)
    : floor_(std::max(0, floor)) {}

void RateBudget::Update(int remaining) {
    remaining_.store(std::max(0, remaining));
    known_.store(true);
}

void RateBudget::Update(int remaining, std::time_t resetAt) {
    Update(remaining);
    resetAt_.store(static_cast<std::int64_t>(resetAt));
}

void RateBudget::DeferUntil(std::time_t resumeAt) {
    std::int64_t current = resetAt_.load();
    const auto target = static_cast<std::int64_t>(resumeAt);
    while (current < target && !resetAt_.compare_exchange_weak(current, target)) {
    }
}

bool RateBudget::Known() const {
    return known_.load();
}

int RateBudget::Remaining() const {
    return remaining_.load();
}

std::time_t RateBudget::ResetAt() const {
    return static_cast<std::time_t>(resetAt_.load());
}

int RateBudget::Floor() const {
    return floor_;
}

bool RateBudget::IsLow() const {
    return Known() && Remaining() <= floor_;
}

std::chrono::milliseconds RateBudget::PacingDelay(std::chrono::milliseconds base, std::time_t now) const {
    if (!IsLow()) {
        return base;
    }

    const std::chrono::milliseconds lengthened = base * 2;
    const std::time_t resetAt = ResetAt();
    if (resetAt <= now) {
        return lengthened;
    }

    const std::chrono::milliseconds untilReset = std::chrono::seconds(resetAt - now);
    const std::chrono::milliseconds spread = untilReset / (Remaining() + 1);
    return std::max(lengthened, spread);
}

std::chrono::milliseconds RateBudget::BackoffDelay(
    int attempt,
    std::chrono::milliseconds base,
    std::chrono::milliseconds cap,
    std::time_t now) const {
    std::chrono::milliseconds delay = Exponential(base, attempt, cap);

    const std::time_t resetAt = ResetAt();
    if (resetAt > now) {
        const std::chrono::milliseconds untilReset = std::chrono::seconds(resetAt - now + 1);
        delay = std::max(delay, untilReset);
    }

    return std::min(delay, cap);
}
