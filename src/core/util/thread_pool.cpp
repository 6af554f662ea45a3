/**
 * @file thread_pool.cpp
 * @brief Implementation of the ThreadPool class.
 */
#include "chatlink/core/util/thread_pool.hpp"
#include "chatlink/core/util/logger.hpp"
#include <format>

namespace chatlink {

    ThreadPool::ThreadPool(size_t thread_count)
        : stop_(false) {

        if (thread_count == 0) {
            thread_count = std::thread::hardware_concurrency();
            if (thread_count == 0)
                thread_count = 2;
        }

        for (size_t i = 0; i < thread_count; ++i)
            threads_.emplace_back(&ThreadPool::workerFunction, this);
    }

    ThreadPool::~ThreadPool() {
        join();
    }

    void ThreadPool::add(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_)
                throw ChatError(ChatErr::Internal, "ThreadPool is stopped");
            tasks_.emplace(std::move(task));
        }
        condition_.notify_one();
    }

    void ThreadPool::waitIdle() {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
    }

    void ThreadPool::join() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable() && thread.get_id() != std::this_thread::get_id())
                thread.join();
            else if (thread.joinable())
                thread.detach();
        }
        threads_.clear();
    }

    void ThreadPool::workerFunction() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this] {
                    return stop_ || !tasks_.empty();
                });
                if (stop_ && tasks_.empty())
                    return;

                task = std::move(tasks_.front());
                tasks_.pop();
                ++active_;
            }

            try {
                task();
            } catch (const std::exception& ex) {
                LOG_ERROR(std::format("worker task threw: {}", ex.what()));
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                --active_;
                if (tasks_.empty() && active_ == 0)
                    idle_.notify_all();
            }
        }
    }

}
