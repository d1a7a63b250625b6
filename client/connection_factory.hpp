#pragma once

// ============================================================
// connection_factory.hpp -- Authenticated connections for one job
//
// The first create() resolves the shared credential. On the home
// endpoint that is the session's own key. On any other endpoint it
// runs export (home) / import (target) once and caches the result,
// so sibling connections authorize directly with the cached key.
// ============================================================

#include "remote.hpp"
#include <memory>
#include <mutex>
#include <optional>

class ConnectionFactory {
public:
    ConnectionFactory(std::shared_ptr<RemoteSession> session, u32 target_endpoint);

    // Thread-safe once the first call has returned
    std::unique_ptr<RemoteConnection> create();

    u32 target_endpoint() const { return target_; }

private:
    std::shared_ptr<RemoteSession> session_;
    u32                            target_;
    std::mutex                     mutex_;
    std::optional<AuthKey>         key_;
};
