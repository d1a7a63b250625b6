#pragma once

// ============================================================
// auth_table.hpp -- Sessions, per-endpoint keys and exported
//   authorizations, shared by every endpoint of one server
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <array>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

class AuthTable {
public:
    using Key   = std::array<u8, AUTH_KEY_LEN>;
    using Token = std::array<u8, 16>;

    struct Export {
        u64   id{0};
        Token bytes{};
    };

    // Restrict accepted session strings. With none registered any
    // non-empty session string is accepted.
    void allow_session(const std::string& session);
    size_t allowed_sessions() const;

    bool session_ok(const std::string& session, u32 api_id, const std::string& api_hash) const;

    // Fresh key valid on endpoint_id only
    Key issue_key(u32 endpoint_id);
    bool key_valid(u32 endpoint_id, const Key& key) const;

    // Single-use authorization for target_endpoint
    Export export_for(u32 target_endpoint);

    // Consumes the export. nullopt if unknown, already used, or minted
    // for another endpoint.
    std::optional<Key> import(u32 endpoint_id, u64 export_id, const Token& bytes);

    size_t outstanding_exports() const;

private:
    struct PendingExport {
        u32   target{0};
        Token bytes{};
    };

    mutable std::mutex            mutex_;
    std::set<std::string>         sessions_;
    std::set<std::pair<u32, Key>> keys_;
    std::map<u64, PendingExport>  exports_;
};
