#pragma once

// ============================================================
// cancel_token.hpp -- Cooperative cancellation for transfers
//
// Every blocking point of a job (request, retry backoff, batch
// delay) takes the token. Sleeps wake as soon as cancel() fires.
// ============================================================

#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(); }

    void throw_if_cancelled() const {
        if (cancelled_.load()) throw TransferCancelled();
    }

    // Sleep for d unless cancelled first. Returns true if the full
    // duration elapsed, false if woken by cancel().
    template<typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> d) {
        std::unique_lock<std::mutex> lk(mutex_);
        return !cv_.wait_for(lk, d, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool>       cancelled_{false};
    std::mutex              mutex_;
    std::condition_variable cv_;
};
