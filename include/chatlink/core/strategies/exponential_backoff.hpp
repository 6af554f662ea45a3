/**
 * @file exponential_backoff.hpp
 * @brief Exponential backoff used between reconnect attempts.
 */
#pragma once
#include "../interfaces/IBackoffStrategy.hpp"
#include <algorithm>

namespace chatlink {

    /**
     * @class ExponentialBackoff
     * @brief delay(n) = min(base * 2^(n-1), max).
     *
     * Attempt 0 is treated as attempt 1. The product is range-checked
     * against max before it is formed, so large bases or attempt numbers
     * saturate at max instead of overflowing.
     */
    class ExponentialBackoff : public IBackoffStrategy {
    public:
        ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
            : base_(base), max_(max) {}

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override {
            uint32_t shift = attempt == 0 ? 0 : std::min<uint32_t>(attempt - 1, 32);
            long long base = base_.count();
            if (base < 0 || base > (max_.count() >> shift))
                return max_;
            return std::chrono::milliseconds(base * (1LL << shift));
        }

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_;
    };

}
