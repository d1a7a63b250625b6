// ============================================================
// admission_controller.cpp
// ============================================================

#include "admission_controller.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <stdexcept>
#include <vector>

const char* admission_error_str(AdmissionError e) {
    switch (e) {
        case AdmissionError::NONE:              return "accepted";
        case AdmissionError::COOLDOWN_ACTIVE:   return "cooldown_active";
        case AdmissionError::ALREADY_ACTIVE:    return "already_active";
        case AdmissionError::CAPACITY_EXCEEDED: return "capacity_exceeded";
        case AdmissionError::SHUTTING_DOWN:     return "shutting_down";
    }
    return "unknown";
}

const char* owner_state_str(OwnerState s) {
    switch (s) {
        case OwnerState::IDLE:    return "idle";
        case OwnerState::ACTIVE:  return "active";
        case OwnerState::COOLING: return "cooling";
    }
    return "unknown";
}

std::string Admission::message() const {
    switch (error) {
        case AdmissionError::NONE:
            return "Transfer started";
        case AdmissionError::COOLDOWN_ACTIVE:
            return "Cooldown active, wait " + utils::format_duration_s(cooldown_remaining_s);
        case AdmissionError::ALREADY_ACTIVE:
            return "A transfer is already in progress for this owner";
        case AdmissionError::CAPACITY_EXCEEDED:
            return "Server is busy (" + std::to_string(active) + "/" +
                   std::to_string(capacity) + " active), try again later";
        case AdmissionError::SHUTTING_DOWN:
            return "Service is shutting down";
    }
    return "unknown";
}

AdmissionController::AdmissionController(size_t max_concurrent,
                                         std::chrono::milliseconds privileged_cooldown,
                                         std::chrono::milliseconds standard_cooldown,
                                         ClockFn clock)
    : max_concurrent_(max_concurrent)
    , privileged_cooldown_(privileged_cooldown)
    , standard_cooldown_(standard_cooldown)
    , clock_(clock ? std::move(clock) : steady_clock_fn())
{
    if (max_concurrent_ == 0) throw std::invalid_argument("max_concurrent must be >= 1");
    pool_ = std::make_unique<ThreadPool>(max_concurrent_, "admission");
    LOG_INFO("Admission controller: " + std::to_string(max_concurrent_) + " concurrent max");
}

AdmissionController::~AdmissionController() {
    shutdown();
}

void AdmissionController::set_release_hook(ReleaseHook hook) {
    std::lock_guard<std::mutex> lk(mutex_);
    release_hook_ = std::move(hook);
}

size_t AdmissionController::active_count_locked() const {
    return refs_.size();
}

Admission AdmissionController::start(OwnerId owner, TransferTask task, Tier tier) {
    std::lock_guard<std::mutex> lk(mutex_);
    Admission result;
    result.capacity = max_concurrent_;
    result.active   = active_count_locked();

    if (shutting_down_) {
        result.error = AdmissionError::SHUTTING_DOWN;
        return result;
    }

    auto cd = cooldown_until_.find(owner);
    if (cd != cooldown_until_.end()) {
        TimePoint now = clock_();
        if (now < cd->second) {
            result.error = AdmissionError::COOLDOWN_ACTIVE;
            result.cooldown_remaining_s = utils::seconds_until(cd->second, now);
            return result;
        }
        cooldown_until_.erase(cd);
    }

    if (refs_.count(owner)) {
        result.error = AdmissionError::ALREADY_ACTIVE;
        return result;
    }

    if (active_count_locked() >= max_concurrent_) {
        result.error = AdmissionError::CAPACITY_EXCEEDED;
        return result;
    }

    refs_[owner] = 1;
    TaskHandle handle;
    handle.id    = next_id_++;
    handle.tier  = tier;
    handle.token = std::make_shared<CancelToken>();

    // Stored before the task can run, so completion always finds it
    u64 id = handle.id;
    std::shared_ptr<CancelToken> token = handle.token;
    try {
        handle.done = pool_->enqueue([this, owner, tier, id, token, task = std::move(task)] {
            run_task(owner, tier, id, token, task);
        }).share();
    } catch (const std::exception& e) {
        refs_.erase(owner);
        LOG_ERROR("Cannot launch transfer for owner " + std::to_string(owner) + ": " + e.what());
        result.error = AdmissionError::SHUTTING_DOWN;
        return result;
    }
    tasks_[owner] = std::move(handle);
    ++running_;

    result.active = active_count_locked();
    LOG_INFO("Transfer admitted for owner " + std::to_string(owner) + " (" + tier_str(tier) +
             "). Active: " + std::to_string(result.active) + "/" + std::to_string(max_concurrent_));
    return result;
}

void AdmissionController::run_task(OwnerId owner, Tier tier, u64 id,
                                   const std::shared_ptr<CancelToken>& token,
                                   const TransferTask& task)
{
    LogTag tag("owner " + std::to_string(owner));
    try {
        task(*token);
    } catch (const TransferCancelled&) {
        LOG_INFO("Transfer cancelled for owner " + std::to_string(owner));
    } catch (const std::exception& e) {
        Logger::get().transfer_error(owner, e.what());
    }
    on_complete(owner, tier, id);
}

void AdmissionController::on_complete(OwnerId owner, Tier tier, u64 id) {
    bool released = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = tasks_.find(owner);
        if (it != tasks_.end() && it->second.id == id) tasks_.erase(it);
        released = release_locked(owner, tier);
        if (!released && refs_.count(owner)) {
            pending_cooldown_[owner] = tier;
            LOG_DEBUG("Cooldown for owner " + std::to_string(owner) +
                      " deferred until its remaining holds are removed");
        }
        --running_;
        LOG_INFO("Transfer finished for owner " + std::to_string(owner) + ". Active: " +
                 std::to_string(active_count_locked()) + "/" + std::to_string(max_concurrent_));
    }
    idle_cv_.notify_all();
    if (released) run_release_hook(owner);
}

bool AdmissionController::decrement_locked(OwnerId owner) {
    auto it = refs_.find(owner);
    if (it == refs_.end()) {
        LOG_DEBUG("Release for owner " + std::to_string(owner) + " with no references");
        return false;
    }
    if (--it->second > 0) {
        LOG_DEBUG("Reference dropped for owner " + std::to_string(owner) +
                  ": count=" + std::to_string(it->second));
        return false;
    }
    refs_.erase(it);
    return true;
}

void AdmissionController::start_cooldown_locked(OwnerId owner, Tier tier) {
    auto delay = cooldown_for(tier);
    cooldown_until_[owner] = clock_() + delay;
    LOG_INFO("Cooldown set for owner " + std::to_string(owner) + " (" + tier_str(tier) +
             "): " + std::to_string(delay.count() / 1000) + "s");
}

bool AdmissionController::release_locked(OwnerId owner, Tier tier) {
    if (!decrement_locked(owner)) return false;
    pending_cooldown_.erase(owner);
    start_cooldown_locked(owner, tier);
    return true;
}

bool AdmissionController::drop_hold_locked(OwnerId owner) {
    if (!decrement_locked(owner)) return false;
    auto p = pending_cooldown_.find(owner);
    if (p == pending_cooldown_.end()) return false;
    Tier tier = p->second;
    pending_cooldown_.erase(p);
    start_cooldown_locked(owner, tier);
    return true;
}

void AdmissionController::run_release_hook(OwnerId owner) {
    ReleaseHook hook;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        hook = release_hook_;
    }
    if (!hook) return;
    try {
        hook(owner);
    } catch (const std::exception& e) {
        LOG_WARN("Session release for owner " + std::to_string(owner) + " failed: " + e.what());
    }
}

void AdmissionController::add_active(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    int count = ++refs_[owner];
    LOG_DEBUG("Reference added for owner " + std::to_string(owner) +
              ": count=" + std::to_string(count));
}

void AdmissionController::remove_active(OwnerId owner) {
    bool released = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        released = drop_hold_locked(owner);
    }
    idle_cv_.notify_all();
    if (released) run_release_hook(owner);
}

void AdmissionController::release(OwnerId owner, Tier tier) {
    bool released = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        released = release_locked(owner, tier);
    }
    idle_cv_.notify_all();
    if (released) run_release_hook(owner);
}

bool AdmissionController::cancel(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tasks_.find(owner);
    if (it == tasks_.end()) return false;
    it->second.token->cancel();
    LOG_INFO("Cancel requested for owner " + std::to_string(owner));
    return true;
}

size_t AdmissionController::cancel_all() {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = 0;
    for (auto& kv : tasks_) {
        if (!kv.second.token->cancelled()) {
            kv.second.token->cancel();
            ++n;
        }
    }
    LOG_INFO("Cancelled all transfers: " + std::to_string(n) + " total");
    return n;
}

SweepResult AdmissionController::sweep_stale() {
    std::unique_lock<std::mutex> lk(mutex_);
    SweepResult r;
    std::vector<OwnerId> released;

    for (auto it = tasks_.begin(); it != tasks_.end(); ) {
        bool finished = it->second.done.valid() &&
            it->second.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        if (finished) {
            LOG_WARN("Cleaned up orphaned task for owner " + std::to_string(it->first));
            if (drop_hold_locked(it->first)) released.push_back(it->first);
            it = tasks_.erase(it);
            ++r.orphaned_tasks;
        } else {
            ++it;
        }
    }

    TimePoint now = clock_();
    for (auto it = cooldown_until_.begin(); it != cooldown_until_.end(); ) {
        if (now >= it->second) {
            it = cooldown_until_.erase(it);
            ++r.expired_cooldowns;
        } else {
            ++it;
        }
    }

    if (r.orphaned_tasks > 0 || r.expired_cooldowns > 0) {
        LOG_INFO("Sweep: cleaned " + std::to_string(r.orphaned_tasks) + " orphaned tasks, " +
                 std::to_string(r.expired_cooldowns) + " expired cooldowns");
    }
    lk.unlock();
    for (OwnerId owner : released) run_release_hook(owner);
    return r;
}

TransferStatus AdmissionController::get_status(OwnerId owner) const {
    std::lock_guard<std::mutex> lk(mutex_);
    TransferStatus st;
    auto r = refs_.find(owner);
    if (r != refs_.end()) {
        st.state      = OwnerState::ACTIVE;
        st.references = r->second;
        return st;
    }
    auto cd = cooldown_until_.find(owner);
    if (cd != cooldown_until_.end()) {
        TimePoint now = clock_();
        if (now < cd->second) {
            st.state = OwnerState::COOLING;
            st.cooldown_remaining_s = utils::seconds_until(cd->second, now);
        }
    }
    return st;
}

bool AdmissionController::is_active(OwnerId owner) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return refs_.count(owner) > 0;
}

bool AdmissionController::has_task(OwnerId owner) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return tasks_.count(owner) > 0;
}

size_t AdmissionController::active_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return active_count_locked();
}

bool AdmissionController::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return idle_cv_.wait_for(lk, timeout, [this] { return running_ == 0; });
}

bool AdmissionController::on_task_thread() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pool_ && pool_->owns_current_thread();
}

void AdmissionController::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutting_down_ && !pool_) return;
        shutting_down_ = true;
        for (auto& kv : tasks_) kv.second.token->cancel();
        if (pool_ && pool_->owns_current_thread()) {
            LOG_INFO("Shutdown requested from a transfer task; workers are joined later");
            return;
        }
    }
    // Drains queued tasks; each runs its completion path
    if (pool_) pool_->shutdown();
    std::lock_guard<std::mutex> lk(mutex_);
    pool_.reset();
}
