#pragma once

// ============================================================
// admission_controller.hpp -- Who may start a transfer, and when
//
// Per owner: Idle -> Active -> Cooling -> Idle. An owner is Active
// while its reference count is positive. start() admits one
// top-level transfer per owner under a global ceiling and runs it
// on the controller's pool; add_active/remove_active let a running
// batch hold the owner Active across its inner items. Every
// completed transfer gets its tier's cooldown: at completion when
// the count drops to zero there, otherwise when the last hold
// outliving the transfer is removed.
// ============================================================

#include "session_pool.hpp"
#include "../common/cancel_token.hpp"
#include "../common/clock.hpp"
#include "../common/thread_pool.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

enum class Tier {
    STANDARD,
    PRIVILEGED,
};

inline const char* tier_str(Tier t) {
    return t == Tier::PRIVILEGED ? "privileged" : "standard";
}

enum class AdmissionError {
    NONE,
    COOLDOWN_ACTIVE,
    ALREADY_ACTIVE,
    CAPACITY_EXCEEDED,
    SHUTTING_DOWN,
};

const char* admission_error_str(AdmissionError e);

struct Admission {
    AdmissionError error{AdmissionError::NONE};
    u64            cooldown_remaining_s{0};   // set for COOLDOWN_ACTIVE
    size_t         active{0};
    size_t         capacity{0};

    bool accepted() const { return error == AdmissionError::NONE; }
    std::string message() const;
};

enum class OwnerState {
    IDLE,
    ACTIVE,
    COOLING,
};

const char* owner_state_str(OwnerState s);

struct TransferStatus {
    OwnerState state{OwnerState::IDLE};
    u64        cooldown_remaining_s{0};
    int        references{0};
};

struct SweepResult {
    size_t orphaned_tasks{0};
    size_t expired_cooldowns{0};
};

// The admitted unit of work. Must poll or sleep on the token.
using TransferTask = std::function<void(CancelToken&)>;

// Called after a top-level transfer's reference is released
using ReleaseHook = std::function<void(OwnerId)>;

class AdmissionController : public ActiveOwners {
public:
    AdmissionController(size_t max_concurrent,
                        std::chrono::milliseconds privileged_cooldown,
                        std::chrono::milliseconds standard_cooldown,
                        ClockFn clock = steady_clock_fn());
    ~AdmissionController() override;

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // Usually SessionPool::release. Invoked without the admission lock held.
    void set_release_hook(ReleaseHook hook);

    // Checks in order: cooldown, already active, capacity. On acceptance
    // takes one reference and launches task; nothing changes on rejection.
    Admission start(OwnerId owner, TransferTask task, Tier tier);

    // Inner holds. remove_active starts a cooldown only when the owner's
    // transfer already completed while holds were outstanding.
    void add_active(OwnerId owner);
    void remove_active(OwnerId owner);

    // Drop one reference outside a tracked task; at zero the cooldown
    // starts and the release hook runs
    void release(OwnerId owner, Tier tier);

    // Signal the owner's task to stop. Its completion still releases the
    // reference and applies the cooldown. False if nothing is running.
    bool cancel(OwnerId owner);
    size_t cancel_all();

    // Drop task entries that finished without being cleared, and
    // cooldowns that have expired
    SweepResult sweep_stale();

    TransferStatus get_status(OwnerId owner) const;
    bool is_active(OwnerId owner) const override;
    bool has_task(OwnerId owner) const;
    size_t active_count() const;
    size_t capacity() const { return max_concurrent_; }

    // Block until no task is running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    // Refuse new starts, cancel everything and wait for tasks to finish.
    // From one of the controller's own tasks only the first two happen;
    // the workers are joined by a later call or the destructor, which
    // must not run on a task.
    void shutdown();

    // True on a thread running an admitted task
    bool on_task_thread() const;

    std::chrono::milliseconds cooldown_for(Tier tier) const {
        return tier == Tier::PRIVILEGED ? privileged_cooldown_ : standard_cooldown_;
    }

private:
    struct TaskHandle {
        u64                          id{0};
        Tier                         tier{Tier::STANDARD};
        std::shared_ptr<CancelToken> token;
        std::shared_future<void>     done;
    };

    void run_task(OwnerId owner, Tier tier, u64 id,
                  const std::shared_ptr<CancelToken>& token, const TransferTask& task);
    void on_complete(OwnerId owner, Tier tier, u64 id);
    // Returns true when the count reached zero; caller holds mutex_
    bool release_locked(OwnerId owner, Tier tier);
    // Drops a hold; true when it applied a deferred cooldown
    bool drop_hold_locked(OwnerId owner);
    bool decrement_locked(OwnerId owner);
    void start_cooldown_locked(OwnerId owner, Tier tier);
    void run_release_hook(OwnerId owner);
    size_t active_count_locked() const;

    size_t                    max_concurrent_;
    std::chrono::milliseconds privileged_cooldown_;
    std::chrono::milliseconds standard_cooldown_;
    ClockFn                   clock_;
    ReleaseHook               release_hook_;

    mutable std::mutex                          mutex_;
    std::condition_variable                     idle_cv_;
    std::unordered_map<OwnerId, int>            refs_;
    std::unordered_map<OwnerId, TaskHandle>     tasks_;
    std::unordered_map<OwnerId, TimePoint>      cooldown_until_;
    std::unordered_map<OwnerId, Tier>           pending_cooldown_;   // completed, holds remain
    size_t                                      running_{0};
    u64                                         next_id_{1};
    bool                                        shutting_down_{false};

    std::unique_ptr<ThreadPool> pool_;
};

// Holds an owner Active for one inner item of a batch
class ActiveHold {
public:
    ActiveHold(AdmissionController& ac, OwnerId owner) : ac_(ac), owner_(owner) {
        ac_.add_active(owner_);
    }
    ~ActiveHold() { ac_.remove_active(owner_); }

    ActiveHold(const ActiveHold&) = delete;
    ActiveHold& operator=(const ActiveHold&) = delete;

private:
    AdmissionController& ac_;
    OwnerId              owner_;
};
