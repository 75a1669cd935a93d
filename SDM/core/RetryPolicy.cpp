#include "RetryPolicy.h"

#include <algorithm>

bool RetryPolicy::allowsAttempt(std::size_t attemptsSoFar) const {
    return maxAttempts == 0 || attemptsSoFar < maxAttempts;
}

bool RetryPolicy::writeFailuresExhausted(std::size_t consecutiveWriteFailures) const {
    return maxWriteFailures != 0 && consecutiveWriteFailures >= maxWriteFailures;
}

std::chrono::milliseconds RetryPolicy::delayBefore(std::size_t attempt) const {
    if (!backoff || attempt == 0)
        return std::chrono::milliseconds(0);
    return std::max(std::chrono::milliseconds(0), backoff(attempt));
}

RetryPolicy RetryPolicy::unlimited() {
    return RetryPolicy{};
}

RetryPolicy RetryPolicy::bounded(std::size_t attempts, std::chrono::milliseconds delay) {
    RetryPolicy policy;
    policy.maxAttempts = attempts;
    if (delay.count() > 0) {
        policy.backoff = [delay](std::size_t) { return delay; };
    }
    return policy;
}

RetryPolicy::Backoff RetryPolicy::exponential(std::chrono::milliseconds base, std::chrono::milliseconds cap) {
    return [base, cap](std::size_t attempt) {
        // attempt 1 waits base, each later attempt doubles up to cap
        std::chrono::milliseconds delay = base;
        for (std::size_t i = 1; i < attempt && delay < cap; ++i)
            delay *= 2;
        return std::min(delay, cap);
    };
}
