#pragma once
#include <chrono>
#include <cstddef>
#include <functional>

// Per-block retry rules. The default retries forever without backoff.
struct RetryPolicy {
    using Backoff = std::function<std::chrono::milliseconds(std::size_t attempt)>;

    // Total fetch attempts per block and round, 0 = unlimited
    std::size_t maxAttempts = 0;
    // Consecutive sink failures after which a block gives up, 0 = unlimited
    std::size_t maxWriteFailures = 3;
    Backoff backoff;

    bool allowsAttempt(std::size_t attemptsSoFar) const;
    bool writeFailuresExhausted(std::size_t consecutiveWriteFailures) const;
    std::chrono::milliseconds delayBefore(std::size_t attempt) const;

    static RetryPolicy unlimited();
    static RetryPolicy bounded(std::size_t attempts, std::chrono::milliseconds delay = std::chrono::milliseconds(0));
    static Backoff exponential(std::chrono::milliseconds base, std::chrono::milliseconds cap);
};
