/**
 * @file thread_pool.hpp
 * @brief Worker pool used for outbound chat traffic.
 *
 * Delivery sends and typing intents are posted here so that UI-facing calls
 * never block on the socket. With a single worker, tasks run in submission
 * order, which keeps the wire order equal to the submit order.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "chatlink/core/util/error_types.hpp"

namespace chatlink {

    /**
     * @class ThreadPool
     * @brief Fixed-size FIFO worker pool.
     *
     * Exceptions escaping a fire-and-forget task are logged and do not stop
     * the worker. The future-returning add() captures them in the future
     * instead, so callers that drop the future must go through the
     * std::function overload.
     */
    class ThreadPool {
    public:
        /**
         * @param thread_count Number of workers. 0 selects hardware concurrency.
         */
        explicit ThreadPool(size_t thread_count = 1);

        /**
         * @brief Stops accepting work, drains the queue and joins the workers.
         */
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a callable and obtain its result through a future.
         * @throws ChatError(Internal) if the pool has been stopped
         */
        template<typename F, typename... Args>
        auto add(F&& task, Args&&... args) -> std::future<decltype(task(args...))>;

        /**
         * @brief Queue a fire-and-forget task.
         * @throws ChatError(Internal) if the pool has been stopped
         */
        void add(std::function<void()> task);

        /**
         * @brief Block until the queue is empty and no task is running.
         */
        void waitIdle();

        /**
         * @brief Stop accepting tasks, run what is queued and join the workers.
         */
        void join();

        size_t getThreadCount() const { return threads_.size(); }

    private:
        void workerFunction();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex queue_mutex_;
        std::condition_variable condition_;
        std::condition_variable idle_;
        std::atomic<bool> stop_;
        size_t active_{ 0 };
    };

    template<typename F, typename... Args>
    auto ThreadPool::add(F&& task, Args&&... args) -> std::future<decltype(task(args...))> {
        using return_type = decltype(task(args...));

        auto packaged_task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(task), std::forward<Args>(args)...)
        );
        std::future<return_type> result = packaged_task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_)
                throw ChatError(ChatErr::Internal, "ThreadPool is stopped");
            tasks_.emplace([packaged_task]() { (*packaged_task)(); });
        }
        condition_.notify_one();
        return result;
    }

}
