/**
 * @file typing_debouncer.hpp
 * @brief Turns compose-buffer edits into start/stop typing signals.
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

namespace chatlink {

    /**
     * @class TypingDebouncer
     * @brief Trailing-edge debouncer for typing indicators.
     *
     * A non-empty edit emits true on the transition to typing and restarts the
     * quiet-period timer. The timer expiring, or the buffer becoming empty,
     * emits false. At most one timer is live; emissions are delivered in order
     * and never while the internal lock is held.
     */
    class TypingDebouncer {
    public:
        using Emit = std::function<void(bool isTyping)>;

        TypingDebouncer(std::chrono::milliseconds quietPeriod, Emit emit);

        /**
         * @brief Stops the timer without emitting.
         */
        ~TypingDebouncer();

        TypingDebouncer(const TypingDebouncer&) = delete;
        TypingDebouncer& operator=(const TypingDebouncer&) = delete;

        /**
         * @brief Report the current content of the compose buffer.
         */
        void textChanged(std::string_view text);

        /**
         * @brief Stop typing now (emits false when typing) and cancel the timer.
         */
        void clear();

        bool isTyping() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
