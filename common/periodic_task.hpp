#pragma once

// ============================================================
// periodic_task.hpp -- Background thread running a callback on
//   a fixed interval (idle-session reaping, stale-state sweeps)
// ============================================================

#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

class PeriodicTask {
public:
    PeriodicTask(std::string name,
                 std::chrono::milliseconds interval,
                 std::function<void()> fn)
        : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        thread_ = std::thread([this] { loop(); });
        LOG_INFO("Started periodic " + name_ + " (every " +
                 std::to_string(interval_.count() / 1000) + "s)");
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (!running_.load()) return;
            running_.store(false);
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool running() const { return running_.load(); }

private:
    // First run happens one interval after start()
    void loop() {
        for (;;) {
            {
                std::unique_lock<std::mutex> lk(mutex_);
                if (cv_.wait_for(lk, interval_, [this] { return !running_.load(); })) {
                    return;
                }
            }
            try {
                fn_();
            } catch (const std::exception& e) {
                LOG_ERROR("Error in periodic " + name_ + ": " + e.what());
            }
        }
    }

    std::string               name_;
    std::chrono::milliseconds interval_;
    std::function<void()>     fn_;
    std::atomic<bool>         running_{false};
    std::thread               thread_;
    std::mutex                mutex_;
    std::condition_variable   cv_;
};
