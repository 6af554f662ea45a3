/**
 * @file observable.hpp
 * @brief Subscriber tables for event fan-out and latest-value streams.
 *
 * EventHub delivers each emitted value to the subscribers registered at that
 * moment; late subscribers miss past values. LatestValue additionally replays
 * the current value to every new subscriber.
 *
 * Callbacks always run outside the table lock, so a callback may subscribe,
 * unsubscribe or emit again.
 */
#pragma once
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <ankerl/unordered_dense.h>

#include "chatlink/core/util/logger.hpp"

namespace chatlink {

    /**
     * @class Subscription
     * @brief RAII handle; destroying or resetting it removes the subscriber.
     *
     * Safe to outlive the hub it came from.
     */
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& o) noexcept : cancel_(std::exchange(o.cancel_, nullptr)) {}
        Subscription& operator=(Subscription&& o) noexcept {
            if (this != &o) {
                reset();
                cancel_ = std::exchange(o.cancel_, nullptr);
            }
            return *this;
        }

        void reset() {
            if (auto c = std::exchange(cancel_, nullptr)) c();
        }

        explicit operator bool() const { return static_cast<bool>(cancel_); }

    private:
        std::function<void()> cancel_;
    };

    /**
     * @class EventHub
     * @brief Thread-safe observer list.
     */
    template<class T>
    class EventHub {
    public:
        using Callback = std::function<void(const T&)>;

        [[nodiscard]] Subscription subscribe(Callback cb) {
            uint64_t id;
            {
                std::scoped_lock lk(st_->mx);
                id = st_->nextId++;
                st_->subs.emplace(id, std::make_shared<Callback>(std::move(cb)));
            }
            std::weak_ptr<State> weak = st_;
            return Subscription([weak, id] {
                if (auto s = weak.lock()) {
                    std::scoped_lock lk(s->mx);
                    s->subs.erase(id);
                }
            });
        }

        /**
         * @brief Deliver a value to every current subscriber.
         *
         * A subscriber that throws is logged and skipped.
         */
        void emit(const T& value) const {
            std::vector<std::shared_ptr<Callback>> snapshot;
            {
                std::scoped_lock lk(st_->mx);
                snapshot.reserve(st_->subs.size());
                for (const auto& [id, cb] : st_->subs)
                    snapshot.push_back(cb);
            }
            for (const auto& cb : snapshot) {
                try {
                    (*cb)(value);
                } catch (const std::exception& ex) {
                    LOG_ERROR(std::format("subscriber threw: {}", ex.what()));
                }
            }
        }

        size_t size() const {
            std::scoped_lock lk(st_->mx);
            return st_->subs.size();
        }

    private:
        struct State {
            std::mutex mx;
            uint64_t nextId{ 1 };
            ankerl::unordered_dense::map<uint64_t, std::shared_ptr<Callback>> subs;
        };
        std::shared_ptr<State> st_ = std::make_shared<State>();
    };

    /**
     * @class LatestValue
     * @brief Holds one current value and publishes every change.
     *
     * Publication is serialized: subscribers observe changes in the order they
     * were made, and a new subscriber gets the current value before any later
     * change. Callbacks must not wait on another thread that publishes here.
     */
    template<class T>
    class LatestValue {
    public:
        using Callback = std::function<void(const T&)>;

        explicit LatestValue(T initial = T{}) : value_(std::move(initial)) {}

        T get() const {
            std::scoped_lock lk(valueMx_);
            return value_;
        }

        /**
         * @brief Replace the value and publish it to all subscribers.
         */
        void set(T v) {
            std::scoped_lock order(publishMx_);
            {
                std::scoped_lock lk(valueMx_);
                value_ = v;
            }
            hub_.emit(v);
        }

        /**
         * @brief Register a callback and invoke it at once with the current value.
         */
        [[nodiscard]] Subscription subscribe(Callback cb) {
            std::scoped_lock order(publishMx_);
            auto shared = std::make_shared<Callback>(std::move(cb));
            Subscription sub = hub_.subscribe([shared](const T& v) { (*shared)(v); });
            T current = get();
            try {
                (*shared)(current);
            } catch (const std::exception& ex) {
                LOG_ERROR(std::format("subscriber threw: {}", ex.what()));
            }
            return sub;
        }

    private:
        mutable std::mutex valueMx_;
        std::recursive_mutex publishMx_;
        T value_;
        EventHub<T> hub_;
    };

}
