#pragma once

// ============================================================
// remote.hpp -- Remote endpoint primitives used by the engine
//
// RemoteSession is an owner's long-lived authorized client on its
// home endpoint. RemoteConnection is one extra connection used by a
// transfer worker. TcpSession/TcpConnection speak the framed wire
// protocol; tests substitute in-memory fakes.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/hash.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct Credentials {
    u32         api_id{0};
    std::string api_hash;
};

using AuthKey = std::array<u8, AUTH_KEY_LEN>;

// Where a stored object lives and how big it is
struct FileLocation {
    u32 endpoint_id{0};
    u64 location_id{0};
    u64 size{0};
};

// Single-use token minted by the home endpoint for another endpoint
struct ExportedAuthorization {
    u64                     id{0};
    std::array<u8, 16>      bytes{};
};

// Parts sent under file_id, ready to be committed
struct UploadedFile {
    u64                          file_id{0};
    u32                          part_count{0};
    bool                         big{false};
    std::string                  name;
    u64                          size{0};
    std::optional<hash::Hash128> checksum;   // absent for big files
};

class RemoteConnection {
public:
    virtual ~RemoteConnection() = default;

    virtual u32 endpoint_id() const = 0;

    // Empty result means the endpoint has no bytes at offset
    virtual std::vector<u8> get_file_chunk(const FileLocation& loc, u64 offset, u32 limit) = 0;

    virtual void save_file_part(u64 file_id, u32 part_index,
                                const u8* data, size_t len) = 0;

    virtual void save_big_file_part(u64 file_id, u32 part_index, u32 total_parts,
                                    const u8* data, size_t len) = 0;

    // Authorize this connection with a token exported by the home endpoint.
    // Returns the key that sibling connections reuse.
    virtual AuthKey import_authorization(const ExportedAuthorization& auth) = 0;

    virtual void disconnect() = 0;
};

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Connect to the home endpoint and present the stored session string
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    // Round-trip check that the endpoint still accepts this session
    virtual bool is_authorized() = 0;

    virtual u32 home_endpoint() const = 0;

    // Key issued by the home endpoint at connect()
    virtual AuthKey auth_key() const = 0;

    virtual ExportedAuthorization export_authorization(u32 endpoint_id) = 0;

    // New connection to endpoint_id. With a key it is authorized with it,
    // without one the caller must run import_authorization().
    virtual std::unique_ptr<RemoteConnection>
    open_connection(u32 endpoint_id, const std::optional<AuthKey>& key) = 0;

    virtual FileLocation commit_file(const UploadedFile& file) = 0;
};

// Builds an unconnected session for an owner
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual std::shared_ptr<RemoteSession>
    create(const Credentials& creds, const std::string& session_string) = 0;
};
