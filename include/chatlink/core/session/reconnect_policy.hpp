/**
 * @file reconnect_policy.hpp
 * @brief Bounded reconnect schedule.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "chatlink/core/interfaces/IBackoffStrategy.hpp"

namespace chatlink {

    /**
     * @class ReconnectPolicy
     * @brief Pure mapping attempt -> delay, capped on attempt count.
     *
     * Attempts are numbered from 1. Past maxAttempts no delay is produced and
     * the caller must give up.
     */
    class ReconnectPolicy {
    public:
        ReconnectPolicy(std::shared_ptr<IBackoffStrategy> backoff, uint32_t maxAttempts)
            : backoff_(std::move(backoff)), maxAttempts_(maxAttempts) {}

        std::optional<std::chrono::milliseconds> delayFor(uint32_t attempt) const {
            if (attempt == 0 || attempt > maxAttempts_)
                return std::nullopt;
            return backoff_->nextDelay(attempt);
        }

        uint32_t maxAttempts() const { return maxAttempts_; }

    private:
        std::shared_ptr<IBackoffStrategy> backoff_;
        uint32_t maxAttempts_;
    };

}
