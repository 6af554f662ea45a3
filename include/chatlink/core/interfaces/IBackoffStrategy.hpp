/**
 * @file IBackoffStrategy.hpp
 * @brief Interface for reconnect backoff strategies in chatlink.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace chatlink {

    /**
     * @class IBackoffStrategy
     * @brief Maps a reconnect attempt number to the delay that precedes it.
     *
     * Implementations must be pure: the same attempt always yields the same delay.
     */
    class IBackoffStrategy {
    public:
        virtual ~IBackoffStrategy() = default;

        /**
         * @brief Delay before the given attempt.
         * @param attempt Reconnect attempt (starting from 1)
         */
        virtual std::chrono::milliseconds nextDelay(uint32_t attempt) const = 0;
    };

}
