#pragma once

// ============================================================
// thread_pool.hpp -- Header-only C++17 thread pool
//
// Used for connection fan-out, per-round part requests, chained
// upload sends and admitted transfer tasks. A task runs under the
// log tag of the thread that enqueued it.
// ============================================================

#include "logger.hpp"

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, std::string name = "pool")
        : name_(std::move(name)) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
            worker_ids_.push_back(workers_.back().get_id());
        }
    }

    ~ThreadPool() { shutdown(); }

    // Enqueue a callable and return a future for its result
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using RetType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<RetType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<RetType> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool " + name_ + " is stopped");
            tasks_.emplace([task, tag = Logger::thread_tag()]() {
                LogTag scope(tag);
                (*task)();
            });
        }
        cv_.notify_one();
        return res;
    }

    // Drain queued work, then join every worker. Idempotent. Throws
    // std::logic_error when called from one of the pool's own tasks.
    void shutdown() {
        if (owns_current_thread()) {
            throw std::logic_error("ThreadPool " + name_ + " cannot be shut down from its own worker");
        }
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_ && workers_.empty()) return;
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        workers_.clear();
    }

    // True on a thread that runs this pool's tasks
    bool owns_current_thread() const {
        auto self = std::this_thread::get_id();
        for (const auto& id : worker_ids_) {
            if (id == self) return true;
        }
        return false;
    }

    size_t size() const { return workers_.size(); }

    // Tasks queued or running right now
    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size() + busy_;
    }

    const std::string& name() const { return name_; }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
                ++busy_;
            }
            task();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --busy_;
            }
        }
    }

    std::string                       name_;
    std::vector<std::thread>          workers_;
    std::vector<std::thread::id>      worker_ids_;   // fixed after construction
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex                mutex_;
    std::condition_variable           cv_;
    size_t                            busy_{0};
    bool                              stop_{false};
};
