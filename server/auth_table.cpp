// ============================================================
// auth_table.cpp
// ============================================================

#include "auth_table.hpp"
#include "../common/utils.hpp"

namespace {

template<size_t N>
std::array<u8, N> random_bytes() {
    std::array<u8, N> out{};
    for (size_t i = 0; i < N; i += 8) {
        u64 r = utils::random_id();
        for (size_t j = 0; j < 8 && i + j < N; ++j) {
            out[i + j] = (u8)(r >> (8 * j));
        }
    }
    return out;
}

} // namespace

void AuthTable::allow_session(const std::string& session) {
    if (session.empty()) return;
    std::lock_guard<std::mutex> lk(mutex_);
    sessions_.insert(session);
}

size_t AuthTable::allowed_sessions() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sessions_.size();
}

bool AuthTable::session_ok(const std::string& session, u32 api_id,
                           const std::string& api_hash) const
{
    if (session.empty() || api_id == 0 || api_hash.empty()) return false;
    std::lock_guard<std::mutex> lk(mutex_);
    return sessions_.empty() || sessions_.count(session) > 0;
}

AuthTable::Key AuthTable::issue_key(u32 endpoint_id) {
    Key key = random_bytes<AUTH_KEY_LEN>();
    std::lock_guard<std::mutex> lk(mutex_);
    keys_.insert({endpoint_id, key});
    return key;
}

bool AuthTable::key_valid(u32 endpoint_id, const Key& key) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return keys_.count({endpoint_id, key}) > 0;
}

AuthTable::Export AuthTable::export_for(u32 target_endpoint) {
    Export ex;
    ex.bytes = random_bytes<16>();
    std::lock_guard<std::mutex> lk(mutex_);
    do {
        ex.id = utils::random_id();
    } while (exports_.count(ex.id));
    exports_[ex.id] = PendingExport{target_endpoint, ex.bytes};
    return ex;
}

std::optional<AuthTable::Key> AuthTable::import(u32 endpoint_id, u64 export_id,
                                                const Token& bytes)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = exports_.find(export_id);
        if (it == exports_.end()) return std::nullopt;
        if (it->second.target != endpoint_id || it->second.bytes != bytes) return std::nullopt;
        exports_.erase(it);
    }
    return issue_key(endpoint_id);
}

size_t AuthTable::outstanding_exports() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return exports_.size();
}
