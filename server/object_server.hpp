#pragma once

// ============================================================
// object_server.hpp -- parxfer object endpoints: persistent daemon
//
// Hosts N endpoints (ids 1..N) on consecutive ports, all backed by
// one ObjectStore and one AuthTable. Endpoint 1 is where sessions
// usually log in; the others are reached through exported
// authorizations.
//
// Concurrency model:
//   one accept thread per endpoint, one handler thread per
//   accepted connection. A handler serves requests strictly in
//   order, which is what gives per-connection part ordering.
// ============================================================

#include "auth_table.hpp"
#include "object_store.hpp"
#include "../common/config.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <chrono>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct ServerConfig {
    std::string store_dir;
    std::string listen_ip{"0.0.0.0"};
    u16         base_port{7700};       // 0 = ephemeral port per endpoint
    int         endpoints{1};
    std::string advertise_host{"127.0.0.1"};

    // Every Nth chunk or part request is answered with FLOOD_WAIT
    u32 flood_every{0};
    u32 flood_wait_s{0};

    // Uploads with no new part for this long are dropped
    std::chrono::seconds pending_upload_ttl{600};
};

class ObjectServer {
public:
    explicit ObjectServer(ServerConfig cfg);
    ~ObjectServer();

    ObjectServer(const ObjectServer&) = delete;
    ObjectServer& operator=(const ObjectServer&) = delete;

    // Bind every endpoint and start accepting; returns immediately
    void start();

    // start(), then block until stop(). Returns exit code.
    int run();

    // Close listeners and live connections, join all threads. Idempotent.
    void stop();

    // Ask run() to return; safe to call from a signal handler
    void request_stop() { stop_requested_.store(true); }

    // Bound addresses, in endpoint id order (valid after start)
    std::vector<EndpointAddress> endpoints() const;

    AuthTable& auth() { return auth_; }
    ObjectStore& store() { return store_; }

private:
    struct Endpoint {
        u32         id{0};
        TcpSocket   listen;
        u16         port{0};
        std::thread accept_thread;
    };

    struct Handler {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Per-connection state
    struct Conn {
        u32                 endpoint_id{0};
        bool                authorized{false};
        std::map<u64, u32>  last_part;   // file_id -> highest index seen
    };

    void accept_loop(Endpoint& ep);
    void serve(u32 endpoint_id, TcpSocket sock);

    struct Reply {
        MsgType         type{MsgType::MT_OK};
        std::vector<u8> payload;
    };

    // Throws RemoteError for anything the client should see as ERROR
    Reply dispatch(Conn& c, MsgType type, const std::vector<u8>& payload);
    void require_auth(const Conn& c) const;
    void maybe_flood();
    void reap_handlers(bool all);

    Reply on_auth_session(Conn& c, const std::vector<u8>& payload);
    Reply on_auth_key(Conn& c, const std::vector<u8>& payload);
    Reply on_export_auth(Conn& c, const std::vector<u8>& payload);
    Reply on_import_auth(Conn& c, const std::vector<u8>& payload);
    Reply on_get_file(Conn& c, const std::vector<u8>& payload);
    Reply on_save_part(Conn& c, const std::vector<u8>& payload);
    Reply on_commit_file(Conn& c, const std::vector<u8>& payload);

    ServerConfig cfg_;
    ObjectStore  store_;
    AuthTable    auth_;

    std::vector<std::unique_ptr<Endpoint>> endpoints_;
    std::atomic<bool>                      running_{false};
    std::atomic<bool>                      stop_requested_{false};
    std::atomic<u64>                       request_counter_{0};

    std::mutex          handlers_mutex_;
    std::list<Handler>  handlers_;
    std::set<TcpSocket*> live_;       // guarded by handlers_mutex_
};
