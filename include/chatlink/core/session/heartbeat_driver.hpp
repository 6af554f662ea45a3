/**
 * @file heartbeat_driver.hpp
 * @brief Periodic keepalive for an authenticated connection.
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace chatlink {

    /**
     * @class HeartbeatDriver
     * @brief Calls a beat function every interval on its own thread.
     *
     * The first beat happens one interval after start(). If a beat throws,
     * the failure handler is called once with the error text and the driver
     * stops by itself. stop() may be called from the failure handler.
     */
    class HeartbeatDriver {
    public:
        using Beat = std::function<void()>;
        using FailureHandler = std::function<void(const std::string&)>;

        HeartbeatDriver(std::chrono::milliseconds interval, Beat beat, FailureHandler onFailure);
        ~HeartbeatDriver();

        HeartbeatDriver(const HeartbeatDriver&) = delete;
        HeartbeatDriver& operator=(const HeartbeatDriver&) = delete;

        void start();

        /**
         * @brief Cancel the pending wait and join the worker.
         *
         * Called from the worker itself, the worker is detached instead and
         * finishes on return.
         */
        void stop();

        bool running() const { return worker_.joinable(); }

    private:
        struct Shared;
        std::chrono::milliseconds interval_;
        std::shared_ptr<Shared> shared_;
        std::jthread worker_;
    };

}
