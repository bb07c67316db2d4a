#pragma once

#include <vector>
#include <cstdint>
#include <atomic>

// Backoff schedule for transient transport errors.
struct RetryPolicy
{
    unsigned int MaxRetries = 3;
    std::vector<uint32_t> DelaysMs = { 1000, 3000, 5000 };

    static RetryPolicy FromConfig();
    static RetryPolicy NoDelay(unsigned int Retries);

    static bool IsTransientError(int ErrorCode);

    uint32_t DelayForAttempt(unsigned int Attempt) const;

    // Sleeps for the attempt's delay. Returns early (false) if Cancelled becomes set.
    bool WaitBeforeRetry(unsigned int Attempt, const std::atomic<bool>* Cancelled) const;
};
