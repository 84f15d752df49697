#include "retry_policy.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace kube_auth_proxy {

RetryPolicy::RetryPolicy(int maxAttempts,
                         std::chrono::milliseconds initialDelay,
                         std::chrono::milliseconds maxDelay)
    : mMaxAttempts(maxAttempts)
    , mInitialDelay(initialDelay)
    , mMaxDelay(maxDelay)
{
    if (maxAttempts < 0) {
        throw std::invalid_argument("maxAttempts must not be negative");
    }
    if (initialDelay.count() < 0 || maxDelay.count() < 0) {
        throw std::invalid_argument("retry delays must not be negative");
    }
}

bool RetryPolicy::shouldRetry(int retryCount) const {
    return retryCount < mMaxAttempts;
}

std::chrono::milliseconds RetryPolicy::delay(int retryCount) const {
    const int64_t cap = mMaxDelay.count();
    int64_t backoff   = mInitialDelay.count();

    // Doubling stops at the cap, so large counts cannot overflow.
    for (int i = 0; i < retryCount && backoff < cap; ++i) {
        backoff *= 2;
    }
    return std::chrono::milliseconds(std::min(backoff, cap));
}

} // namespace kube_auth_proxy
