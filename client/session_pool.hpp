#pragma once

// ============================================================
// session_pool.hpp -- LRU cache of authorized sessions, one per owner
//
// Capacity is bounded. At capacity the least recently used owner
// that is not active is evicted; active owners are never evicted
// or reaped. Activity is tracked separately from the LRU order so
// orphaned timestamps can be purged.
//
// Lock order: the pool lock may be held while asking ActiveOwners;
// ActiveOwners never calls back into the pool under its own lock.
// ============================================================

#include "remote.hpp"
#include "../common/clock.hpp"
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class SessionError {
    NONE,
    NO_CREDENTIALS,
    INVALID_SESSION,   // connected, but the endpoint does not accept it
    CREATION_FAILED,
    SLOTS_FULL,        // at capacity and every pooled owner is active
};

const char* session_error_str(SessionError e);

struct SessionResult {
    std::shared_ptr<RemoteSession> session;
    SessionError                   error{SessionError::NONE};
    std::string                    detail;

    bool ok() const { return error == SessionError::NONE && session != nullptr; }
};

// Answers whether an owner currently has a transfer in flight
class ActiveOwners {
public:
    virtual ~ActiveOwners() = default;
    virtual bool is_active(OwnerId owner) const = 0;
};

// Told when pooled sessions are created and dropped. Called with the
// pool lock held; must not call back into the pool.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void on_session_created(OwnerId owner) = 0;
    virtual void on_session_dropped(OwnerId owner) = 0;
};

class SessionPool {
public:
    SessionPool(std::shared_ptr<SessionFactory> factory,
                size_t max_sessions,
                std::chrono::milliseconds idle_timeout,
                bool disconnect_after_transfer = false,
                ClockFn clock = steady_clock_fn());
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // Not owned. Without one every owner counts as inactive.
    void set_active_owners(const ActiveOwners* owners);
    // Not owned; must outlive the pool or be cleared first
    void set_observer(SessionObserver* observer);

    // Reuse the owner's session (moved to MRU) or create one. Failures come
    // back as SessionResult errors, never as exceptions.
    SessionResult get_or_create(OwnerId owner,
                                const std::optional<Credentials>& creds,
                                const std::string& session_string);

    // Existing session only; refreshes activity. nullptr when absent.
    std::shared_ptr<RemoteSession> get(OwnerId owner);

    void touch(OwnerId owner);

    // Unconditional disconnect + removal (logout). False if absent.
    bool remove(OwnerId owner);

    // Called when an owner's transfer completes. Keeps the session unless
    // configured to disconnect after each transfer.
    void release(OwnerId owner);

    // Disconnect owners idle past the timeout unless active; purge orphaned
    // activity entries. Returns the number of sessions removed.
    size_t idle_reap();

    void disconnect_all();

    size_t size() const;
    size_t capacity() const { return max_sessions_; }
    // Activity timestamps held, including orphans awaiting a reap
    size_t activity_count() const;
    bool contains(OwnerId owner) const;

    // Least recently used first
    std::vector<OwnerId> lru_order() const;

    // Test hook: seed an activity timestamp with no pool entry
    void record_activity(OwnerId owner);

private:
    struct Entry {
        std::shared_ptr<RemoteSession>  session;
        std::list<OwnerId>::iterator    lru_pos;
    };

    bool owner_active(OwnerId owner) const;
    void move_to_mru(OwnerId owner, Entry& e);
    // Disconnect and forget; caller holds mutex_
    void drop_locked(OwnerId owner, const char* reason);
    bool evict_one_locked();

    std::shared_ptr<SessionFactory> factory_;
    size_t                          max_sessions_;
    std::chrono::milliseconds       idle_timeout_;
    bool                            disconnect_after_transfer_;
    ClockFn                         clock_;
    const ActiveOwners*             active_{nullptr};
    SessionObserver*                observer_{nullptr};

    mutable std::mutex                     mutex_;
    std::list<OwnerId>                     lru_;         // front = LRU
    std::unordered_map<OwnerId, Entry>     entries_;
    std::unordered_map<OwnerId, TimePoint> last_activity_;
};
