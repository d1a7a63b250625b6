// ============================================================
// credential_store.cpp
// ============================================================

#include "credential_store.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

size_t FileCredentialStore::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open credentials file: " + path);

    size_t loaded = 0, line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        std::istringstream ss(line);
        std::string owner_s, api_id_s, api_hash, session, extra;
        ss >> owner_s >> api_id_s >> api_hash >> session;
        i64 owner = 0;
        u64 api_id = 0;
        if (session.empty() || (ss >> extra) ||
            !utils::parse_i64(owner_s, owner) ||
            !utils::parse_u64(api_id_s, api_id) || api_id > 0xFFFFFFFFull)
        {
            LOG_WARN(path + ":" + std::to_string(line_no) + ": malformed credentials line skipped");
            continue;
        }
        set(owner, Credentials{(u32)api_id, api_hash}, session);
        ++loaded;
    }
    LOG_INFO("Loaded credentials for " + std::to_string(loaded) + " owners from " + path);
    return loaded;
}

void FileCredentialStore::set(OwnerId owner, const Credentials& creds,
                              const std::string& session_string)
{
    std::lock_guard<std::mutex> lk(mutex_);
    records_[owner] = Record{creds, session_string};
}

void FileCredentialStore::set_default(const Credentials& creds, const std::string& session_string) {
    std::lock_guard<std::mutex> lk(mutex_);
    default_ = Record{creds, session_string};
}

std::optional<Credentials> FileCredentialStore::get_credentials(OwnerId owner) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(owner);
    if (it != records_.end()) return it->second.creds;
    if (default_ && default_->creds.api_id != 0) return default_->creds;
    return std::nullopt;
}

std::optional<std::string> FileCredentialStore::get_session_string(OwnerId owner) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(owner);
    if (it != records_.end()) return it->second.session;
    if (default_ && !default_->session.empty()) return default_->session;
    return std::nullopt;
}

size_t FileCredentialStore::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_.size();
}
