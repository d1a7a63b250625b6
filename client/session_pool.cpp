// ============================================================
// session_pool.cpp
// ============================================================

#include "session_pool.hpp"
#include "../common/logger.hpp"
#include <stdexcept>

const char* session_error_str(SessionError e) {
    switch (e) {
        case SessionError::NONE:            return "none";
        case SessionError::NO_CREDENTIALS:  return "no_credentials";
        case SessionError::INVALID_SESSION: return "invalid_session";
        case SessionError::CREATION_FAILED: return "creation_failed";
        case SessionError::SLOTS_FULL:      return "slots_full";
    }
    return "unknown";
}

SessionPool::SessionPool(std::shared_ptr<SessionFactory> factory,
                         size_t max_sessions,
                         std::chrono::milliseconds idle_timeout,
                         bool disconnect_after_transfer,
                         ClockFn clock)
    : factory_(std::move(factory))
    , max_sessions_(max_sessions)
    , idle_timeout_(idle_timeout)
    , disconnect_after_transfer_(disconnect_after_transfer)
    , clock_(clock ? std::move(clock) : steady_clock_fn())
{
    if (!factory_) throw std::invalid_argument("SessionPool needs a session factory");
    if (max_sessions_ == 0) throw std::invalid_argument("max_sessions must be >= 1");
    LOG_INFO("Session pool: max " + std::to_string(max_sessions_) + " sessions, " +
             std::to_string(idle_timeout_.count() / 1000) + "s idle timeout");
}

SessionPool::~SessionPool() {
    disconnect_all();
}

void SessionPool::set_active_owners(const ActiveOwners* owners) {
    std::lock_guard<std::mutex> lk(mutex_);
    active_ = owners;
}

void SessionPool::set_observer(SessionObserver* observer) {
    std::lock_guard<std::mutex> lk(mutex_);
    observer_ = observer;
}

bool SessionPool::owner_active(OwnerId owner) const {
    return active_ && active_->is_active(owner);
}

void SessionPool::move_to_mru(OwnerId owner, Entry& e) {
    lru_.erase(e.lru_pos);
    e.lru_pos = lru_.insert(lru_.end(), owner);
    last_activity_[owner] = clock_();
}

void SessionPool::drop_locked(OwnerId owner, const char* reason) {
    auto it = entries_.find(owner);
    if (it == entries_.end()) return;
    std::shared_ptr<RemoteSession> session = it->second.session;
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
    last_activity_.erase(owner);
    try {
        session->disconnect();
    } catch (const std::exception& e) {
        LOG_ERROR("Error disconnecting session " + std::to_string(owner) + ": " + e.what());
    }
    LOG_INFO("Removed session for owner " + std::to_string(owner) + " (" + reason + "), " +
             std::to_string(entries_.size()) + "/" + std::to_string(max_sessions_) + " in use");
    if (observer_) observer_->on_session_dropped(owner);
}

bool SessionPool::evict_one_locked() {
    for (OwnerId candidate : lru_) {
        if (!owner_active(candidate)) {
            drop_locked(candidate, "evicted, least recently used idle owner");
            return true;
        }
    }
    return false;
}

SessionResult SessionPool::get_or_create(OwnerId owner,
                                         const std::optional<Credentials>& creds,
                                         const std::string& session_string)
{
    std::lock_guard<std::mutex> lk(mutex_);

    auto it = entries_.find(owner);
    if (it != entries_.end()) {
        move_to_mru(owner, it->second);
        LOG_DEBUG("Reusing session for owner " + std::to_string(owner));
        return {it->second.session, SessionError::NONE, ""};
    }

    if (!creds || creds->api_id == 0 || creds->api_hash.empty() || session_string.empty()) {
        LOG_ERROR("No credentials for owner " + std::to_string(owner));
        return {nullptr, SessionError::NO_CREDENTIALS, "no stored credentials or session"};
    }

    if (entries_.size() >= max_sessions_ && !evict_one_locked()) {
        LOG_WARN("Cannot create session for owner " + std::to_string(owner) + ": all " +
                 std::to_string(max_sessions_) + " sessions have active transfers");
        return {nullptr, SessionError::SLOTS_FULL, "all session slots are busy"};
    }

    std::shared_ptr<RemoteSession> session;
    try {
        session = factory_->create(*creds, session_string);
        session->connect();
        if (!session->is_authorized()) {
            LOG_ERROR("Session for owner " + std::to_string(owner) + " is not authorized");
            session->disconnect();
            return {nullptr, SessionError::INVALID_SESSION, "session is not authorized"};
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create session for owner " + std::to_string(owner) + ": " + e.what());
        if (session) {
            try {
                session->disconnect();
            } catch (const std::exception& de) {
                LOG_DEBUG(std::string("Disconnect after failed creation: ") + de.what());
            }
        }
        return {nullptr, SessionError::CREATION_FAILED, e.what()};
    }

    Entry entry;
    entry.session = session;
    entry.lru_pos = lru_.insert(lru_.end(), owner);
    entries_.emplace(owner, std::move(entry));
    last_activity_[owner] = clock_();
    LOG_INFO("Created session for owner " + std::to_string(owner) + " (" +
             std::to_string(entries_.size()) + "/" + std::to_string(max_sessions_) + ")");
    if (observer_) observer_->on_session_created(owner);
    return {session, SessionError::NONE, ""};
}

std::shared_ptr<RemoteSession> SessionPool::get(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(owner);
    if (it == entries_.end()) return nullptr;
    move_to_mru(owner, it->second);
    return it->second.session;
}

void SessionPool::touch(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(owner);
    if (it != entries_.end()) move_to_mru(owner, it->second);
}

bool SessionPool::remove(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (entries_.find(owner) == entries_.end()) return false;
    drop_locked(owner, "logout");
    return true;
}

void SessionPool::release(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(owner);
    if (it == entries_.end()) return;
    if (disconnect_after_transfer_ && !owner_active(owner)) {
        drop_locked(owner, "transfer finished");
        return;
    }
    last_activity_[owner] = clock_();
}

size_t SessionPool::idle_reap() {
    std::lock_guard<std::mutex> lk(mutex_);
    TimePoint now = clock_();
    size_t removed = 0, skipped = 0;

    std::vector<OwnerId> idle;
    for (const auto& kv : last_activity_) {
        if (now - kv.second >= idle_timeout_) idle.push_back(kv.first);
    }

    for (OwnerId owner : idle) {
        if (entries_.find(owner) == entries_.end()) {
            last_activity_.erase(owner);
            LOG_DEBUG("Purged orphaned activity entry for owner " + std::to_string(owner));
            continue;
        }
        auto idle_s = std::chrono::duration_cast<std::chrono::seconds>(
            now - last_activity_[owner]).count();
        if (owner_active(owner)) {
            LOG_INFO("Skipping idle cleanup for owner " + std::to_string(owner) +
                     " (idle " + std::to_string(idle_s) + "s but has an active transfer)");
            ++skipped;
            continue;
        }
        drop_locked(owner, ("idle " + std::to_string(idle_s) + "s").c_str());
        ++removed;
    }

    // Orphans that are not yet idle
    for (auto it = last_activity_.begin(); it != last_activity_.end(); ) {
        if (entries_.find(it->first) == entries_.end()) {
            it = last_activity_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0 || skipped > 0) {
        LOG_INFO("Session cleanup: disconnected " + std::to_string(removed) + ", skipped " +
                 std::to_string(skipped) + " (active). Sessions: " +
                 std::to_string(entries_.size()));
    }
    return removed;
}

void SessionPool::disconnect_all() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (entries_.empty()) {
        last_activity_.clear();
        return;
    }
    for (auto& kv : entries_) {
        try {
            kv.second.session->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("Error disconnecting session " + std::to_string(kv.first) + ": " + e.what());
        }
        if (observer_) observer_->on_session_dropped(kv.first);
    }
    entries_.clear();
    lru_.clear();
    last_activity_.clear();
    LOG_INFO("All sessions disconnected");
}

size_t SessionPool::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

size_t SessionPool::activity_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return last_activity_.size();
}

bool SessionPool::contains(OwnerId owner) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.count(owner) > 0;
}

std::vector<OwnerId> SessionPool::lru_order() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::vector<OwnerId>(lru_.begin(), lru_.end());
}

void SessionPool::record_activity(OwnerId owner) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_activity_[owner] = clock_();
}
