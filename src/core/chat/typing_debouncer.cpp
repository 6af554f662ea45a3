#include "chatlink/core/chat/typing_debouncer.hpp"
#include "chatlink/core/util/logger.hpp"
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace chatlink {

    using Clock = std::chrono::steady_clock;

    struct TypingDebouncer::Impl {
        std::chrono::milliseconds quiet;
        Emit emit;

        std::mutex emitMx;                      ///< taken before mx; orders emissions
        mutable std::mutex mx;
        std::condition_variable_any cv;
        bool typing{ false };
        std::optional<Clock::time_point> deadline;
        std::jthread worker;

        void fire(bool on) {
            try {
                emit(on);
            } catch (const std::exception& ex) {
                LOG_WARN(std::format("typing emission failed: {}", ex.what()));
            }
        }

        void run(std::stop_token st) {
            std::unique_lock lk(mx);
            while (!st.stop_requested()) {
                if (!deadline) {
                    cv.wait(lk, st, [this] { return deadline.has_value(); });
                    continue;
                }
                auto due = *deadline;
                if (cv.wait_until(lk, st, due, [&] { return deadline != due; }))
                    continue;
                if (st.stop_requested()) break;

                lk.unlock();
                {
                    std::scoped_lock order(emitMx);
                    bool expire;
                    {
                        std::scoped_lock again(mx);
                        expire = deadline == due && typing;
                        if (deadline == due) deadline.reset();
                        if (expire) typing = false;
                    }
                    if (expire) fire(false);
                }
                lk.lock();
            }
        }
    };

    TypingDebouncer::TypingDebouncer(std::chrono::milliseconds quietPeriod, Emit emit)
        : pImpl_(std::make_unique<Impl>())
    {
        pImpl_->quiet = quietPeriod;
        pImpl_->emit = std::move(emit);
        pImpl_->worker = std::jthread([impl = pImpl_.get()](std::stop_token st) { impl->run(st); });
    }

    TypingDebouncer::~TypingDebouncer() {
        pImpl_->worker.request_stop();
        if (pImpl_->worker.joinable()) pImpl_->worker.join();
    }

    void TypingDebouncer::textChanged(std::string_view text) {
        auto& I = *pImpl_;
        std::scoped_lock order(I.emitMx);
        std::optional<bool> out;
        {
            std::scoped_lock lk(I.mx);
            if (text.empty()) {
                I.deadline.reset();
                if (I.typing) { I.typing = false; out = false; }
            } else {
                if (!I.typing) { I.typing = true; out = true; }
                I.deadline = Clock::now() + I.quiet;
            }
        }
        I.cv.notify_all();
        if (out) I.fire(*out);
    }

    void TypingDebouncer::clear() {
        textChanged({});
    }

    bool TypingDebouncer::isTyping() const {
        std::scoped_lock lk(pImpl_->mx);
        return pImpl_->typing;
    }

}
