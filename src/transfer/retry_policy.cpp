#include "chatvault/transfer/retry_policy.hpp"
#include "chatvault/core/logger.hpp"
#include <algorithm>
#include <thread>

namespace chatvault::transfer {

using core::VaultError;
using core::VaultResult;

RetryPolicy::RetryPolicy(uint32_t max_retries,
                         std::chrono::milliseconds retry_delay,
                         std::chrono::milliseconds max_backoff)
    : max_retries_(max_retries)
    , retry_delay_(retry_delay)
    , max_backoff_(max_backoff)
    , sleeper_([](std::chrono::milliseconds wait) { std::this_thread::sleep_for(wait); }) {
}

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t attempt) const {
    auto backoff = retry_delay_;
    for (uint32_t i = 0; i < attempt && backoff < max_backoff_; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, max_backoff_);
}

VaultResult RetryPolicy::run(const std::string& description,
                             const Operation& operation,
                             const CancellationToken* cancel) const {
    for (uint32_t attempt = 0;; ++attempt) {
        if (cancel && cancel->is_cancelled()) {
            return VaultResult(VaultError::CANCELLED, description + " cancelled");
        }

        auto result = operation();
        if (result.error != VaultError::RATE_LIMITED) {
            return result;
        }

        if (attempt >= max_retries_) {
            LOG_ERROR("{}: still rate limited after {} retries", description, max_retries_);
            return VaultResult(VaultError::RETRIES_EXHAUSTED,
                               description + " rate limited after " + std::to_string(max_retries_) +
                               " retries: " + result.message);
        }

        auto wait = std::max(result.retry_after, backoff_for(attempt));
        LOG_WARN("{}: rate limited, waiting {} ms (retry {}/{})",
                 description, wait.count(), attempt + 1, max_retries_);
        sleeper_(wait);
    }
}

}
