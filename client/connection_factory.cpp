// ============================================================
// connection_factory.cpp
// ============================================================

#include "connection_factory.hpp"
#include "../common/logger.hpp"
#include <stdexcept>

ConnectionFactory::ConnectionFactory(std::shared_ptr<RemoteSession> session, u32 target_endpoint)
    : session_(std::move(session)), target_(target_endpoint)
{
    if (!session_) throw std::invalid_argument("ConnectionFactory needs a session");
}

std::unique_ptr<RemoteConnection> ConnectionFactory::create() {
    std::optional<AuthKey> key;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!key_) {
            if (target_ == session_->home_endpoint()) {
                key_ = session_->auth_key();
            } else {
                // Handshake: the home endpoint mints a token, the target
                // endpoint trades it for a key on this first connection
                LOG_DEBUG("Exporting authorization to endpoint " + std::to_string(target_));
                ExportedAuthorization auth = session_->export_authorization(target_);
                auto conn = session_->open_connection(target_, std::nullopt);
                try {
                    key_ = conn->import_authorization(auth);
                } catch (const std::exception&) {
                    try {
                        conn->disconnect();
                    } catch (const std::exception& e) {
                        LOG_WARN(std::string("Disconnect after failed import: ") + e.what());
                    }
                    throw;
                }
                return conn;
            }
        }
        key = key_;
    }
    return session_->open_connection(target_, key);
}
