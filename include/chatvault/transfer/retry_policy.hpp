#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/transfer/cancellation.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace chatvault::transfer {

/**
 * Bounded retry of rate-limited remote calls.
 *
 * Only RATE_LIMITED is retried. The wait before attempt n+1 is
 * max(server wait, retry_delay * 2^n) with the backoff capped at max_backoff.
 * After max_retries retries the call fails with RETRIES_EXHAUSTED.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Operation = std::function<core::VaultResult()>;

    RetryPolicy(uint32_t max_retries = 5,
                std::chrono::milliseconds retry_delay = std::chrono::milliseconds(1000),
                std::chrono::milliseconds max_backoff = std::chrono::milliseconds(60000));

    core::VaultResult run(const std::string& description,
                          const Operation& operation,
                          const CancellationToken* cancel = nullptr) const;

    std::chrono::milliseconds backoff_for(uint32_t attempt) const;

    // Replaces the blocking sleep, e.g. with a recorder in tests.
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    uint32_t max_retries() const { return max_retries_; }

private:
    uint32_t max_retries_;
    std::chrono::milliseconds retry_delay_;
    std::chrono::milliseconds max_backoff_;
    Sleeper sleeper_;
};

}
