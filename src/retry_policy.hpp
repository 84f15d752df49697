#pragma once

#include <chrono>

namespace kube_auth_proxy {

/// Exponential backoff for proxy restarts.
/// Pure: the caller owns the attempt counter.
class RetryPolicy {
public:
    static constexpr int kMaxRetryAttempts = 3;
    static constexpr std::chrono::milliseconds kInitialDelay{1000};
    static constexpr std::chrono::milliseconds kMaxDelay{30000};

    RetryPolicy() = default;
    RetryPolicy(int maxAttempts,
                std::chrono::milliseconds initialDelay,
                std::chrono::milliseconds maxDelay);

    /// True while @p retryCount is below the attempt limit.
    bool shouldRetry(int retryCount) const;

    /// min(initialDelay * 2^retryCount, maxDelay). No jitter.
    std::chrono::milliseconds delay(int retryCount) const;

    /// Counter value after a successful start.
    static int reset() { return 0; }

    int maxAttempts() const { return mMaxAttempts; }
    std::chrono::milliseconds initialDelay() const { return mInitialDelay; }
    std::chrono::milliseconds maxDelay() const { return mMaxDelay; }

private:
    int                       mMaxAttempts  = kMaxRetryAttempts;
    std::chrono::milliseconds mInitialDelay = kInitialDelay;
    std::chrono::milliseconds mMaxDelay     = kMaxDelay;
};

} // namespace kube_auth_proxy
