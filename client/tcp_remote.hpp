#pragma once

// ============================================================
// tcp_remote.hpp -- RemoteSession / RemoteConnection over TcpSocket
// ============================================================

#include "remote.hpp"
#include "../common/config.hpp"
#include "../common/socket.hpp"
#include <map>
#include <mutex>

// Endpoint id -> address. The first endpoint added is the home endpoint.
class EndpointTable {
public:
    EndpointTable() = default;
    explicit EndpointTable(const std::vector<EndpointAddress>& eps);

    void add(const EndpointAddress& ep);

    // Throws if unknown
    const EndpointAddress& lookup(u32 id) const;

    u32 home() const;
    bool empty() const { return by_id_.empty(); }
    size_t size() const { return by_id_.size(); }

private:
    std::map<u32, EndpointAddress> by_id_;
    std::optional<u32>             home_;
};

class TcpConnection : public RemoteConnection {
public:
    TcpConnection(TcpSocket sock, u32 endpoint_id);

    // Connect and, when key is set, authorize with AUTH_KEY
    static std::unique_ptr<TcpConnection> open(const EndpointAddress& ep,
                                               const std::optional<AuthKey>& key,
                                               int io_timeout_ms);

    u32 endpoint_id() const override { return endpoint_id_; }

    std::vector<u8> get_file_chunk(const FileLocation& loc, u64 offset, u32 limit) override;
    void save_file_part(u64 file_id, u32 part_index, const u8* data, size_t len) override;
    void save_big_file_part(u64 file_id, u32 part_index, u32 total_parts,
                            const u8* data, size_t len) override;
    AuthKey import_authorization(const ExportedAuthorization& auth) override;
    void disconnect() override;

private:
    void send_part(u64 file_id, u32 part_index, u32 total_parts, bool big,
                   const u8* data, size_t len);

    TcpSocket sock_;
    u32       endpoint_id_;
};

class TcpSession : public RemoteSession {
public:
    TcpSession(EndpointTable endpoints, Credentials creds, std::string session_string,
               int connect_timeout_ms, int io_timeout_ms);
    ~TcpSession() override;

    void connect() override;
    void disconnect() override;
    bool is_connected() const override;
    bool is_authorized() override;
    u32 home_endpoint() const override { return endpoints_.home(); }
    AuthKey auth_key() const override;
    ExportedAuthorization export_authorization(u32 endpoint_id) override;
    std::unique_ptr<RemoteConnection>
    open_connection(u32 endpoint_id, const std::optional<AuthKey>& key) override;
    FileLocation commit_file(const UploadedFile& file) override;

private:
    EndpointTable   endpoints_;
    Credentials     creds_;
    std::string     session_string_;
    int             connect_timeout_ms_;
    int             io_timeout_ms_;

    mutable std::mutex         mutex_;   // guards control_ and auth state
    std::unique_ptr<TcpSocket> control_;
    bool                       authorized_{false};
    AuthKey                    auth_key_{};
};

class TcpSessionFactory : public SessionFactory {
public:
    TcpSessionFactory(EndpointTable endpoints, const ServiceConfig& cfg);

    std::shared_ptr<RemoteSession>
    create(const Credentials& creds, const std::string& session_string) override;

private:
    EndpointTable endpoints_;
    int           connect_timeout_ms_;
    int           io_timeout_ms_;
};
