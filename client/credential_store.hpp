#pragma once

// ============================================================
// credential_store.hpp -- Owner credentials and stored sessions
// ============================================================

#include "remote.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual std::optional<Credentials> get_credentials(OwnerId owner) const = 0;
    virtual std::optional<std::string> get_session_string(OwnerId owner) const = 0;
};

// Text file, one owner per line: "owner api_id api_hash session_string".
// Blank lines and lines starting with '#' are skipped. Owners missing from
// the file fall back to the default credentials, if any were set.
class FileCredentialStore : public CredentialStore {
public:
    FileCredentialStore() = default;

    // Throws std::runtime_error if the file cannot be read; malformed lines
    // are logged and skipped. Returns the number of owners loaded.
    size_t load(const std::string& path);

    void set(OwnerId owner, const Credentials& creds, const std::string& session_string);
    void set_default(const Credentials& creds, const std::string& session_string);

    std::optional<Credentials> get_credentials(OwnerId owner) const override;
    std::optional<std::string> get_session_string(OwnerId owner) const override;

    size_t size() const;

private:
    struct Record {
        Credentials creds;
        std::string session;
    };

    mutable std::mutex                  mutex_;
    std::unordered_map<OwnerId, Record> records_;
    std::optional<Record>               default_;
};
