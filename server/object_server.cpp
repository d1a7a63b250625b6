// ============================================================
// object_server.cpp -- Endpoint listeners and request handling
// ============================================================

#include "object_server.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>

namespace {

// Fixed request struct; a short payload is the client's fault
template<typename T>
T request(const std::vector<u8>& payload) {
    if (payload.size() < sizeof(T)) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "short request");
    }
    return proto::unpack<T>(payload);
}

std::string request_tail(const std::vector<u8>& payload, size_t offset, size_t len) {
    if (payload.size() < offset + len) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "short request tail");
    }
    return proto::tail_string(payload, offset, len);
}

void check_magic(const u8 magic[4], u8 version) {
    if (!valid_magic(magic) || version != PARXFER_VERSION) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "bad magic or version");
    }
}

std::vector<u8> error_payload(ErrorCode code, u32 value, const std::string& text) {
    std::string msg = text.substr(0, 1024);
    ErrorMsg em{};
    em.code    = (u32)code;
    em.value   = value;
    em.msg_len = (u16)msg.size();
    proto::encode_error_msg(em);
    return proto::pack(em, msg.data(), msg.size());
}

std::vector<u8> auth_ok_payload(u32 endpoint_id, bool authorized, const AuthTable::Key& key) {
    AuthOk ok{};
    ok.endpoint_id = endpoint_id;
    ok.authorized  = authorized ? 1 : 0;
    std::copy(key.begin(), key.end(), ok.auth_key);
    proto::encode_auth_ok(ok);
    return proto::pack(ok);
}

} // namespace

ObjectServer::ObjectServer(ServerConfig cfg)
    : cfg_(std::move(cfg))
    , store_(cfg_.store_dir)
{
    if (cfg_.endpoints < 1) throw std::invalid_argument("at least one endpoint is required");
}

ObjectServer::~ObjectServer() {
    stop();
}

// ---------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------

void ObjectServer::start() {
    for (int i = 0; i < cfg_.endpoints; ++i) {
        auto ep = std::make_unique<Endpoint>();
        ep->id = (u32)(i + 1);
        u16 port = cfg_.base_port == 0 ? 0 : (u16)(cfg_.base_port + i);
        ep->listen = TcpSocket::listen_on(cfg_.listen_ip, port);
        ep->port = ep->listen.local_port();
        LOG_INFO("Endpoint " + std::to_string(ep->id) + " listening on " +
                 cfg_.listen_ip + ":" + std::to_string(ep->port));
        endpoints_.push_back(std::move(ep));
    }

    running_.store(true);
    for (auto& ep : endpoints_) {
        Endpoint* e = ep.get();
        ep->accept_thread = std::thread([this, e] { accept_loop(*e); });
    }
    LOG_INFO("Object store: " + store_.root() + " (" +
             std::to_string(store_.object_count()) + " objects)");
    if (cfg_.flood_every > 0) {
        LOG_INFO("Rate-limit injection: every " + std::to_string(cfg_.flood_every) +
                 " requests, wait " + std::to_string(cfg_.flood_wait_s) + "s");
    }
}

int ObjectServer::run() {
    start();
    while (running_.load() && !stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    stop();
    return 0;
}

void ObjectServer::stop() {
    if (!running_.exchange(false)) return;
    LOG_INFO("Stopping object server...");

    for (auto& ep : endpoints_) ep->listen.shutdown_both();
    for (auto& ep : endpoints_) {
        if (ep->accept_thread.joinable()) ep->accept_thread.join();
        ep->listen.close();
    }
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        for (TcpSocket* s : live_) s->shutdown_both();
    }
    reap_handlers(true);
    LOG_INFO("Object server stopped");
}

std::vector<EndpointAddress> ObjectServer::endpoints() const {
    std::vector<EndpointAddress> out;
    for (const auto& ep : endpoints_) {
        out.push_back(EndpointAddress{ep->id, cfg_.advertise_host, ep->port});
    }
    return out;
}

// ---------------------------------------------------------------
// accept_loop
// ---------------------------------------------------------------

void ObjectServer::accept_loop(Endpoint& ep) {
    while (running_.load()) {
        try {
            TcpSocket sock = ep.listen.accept();
            LOG_DEBUG("Endpoint " + std::to_string(ep.id) + " accepted " + sock.peer_addr());

            auto done = std::make_shared<std::atomic<bool>>(false);
            {
                std::lock_guard<std::mutex> lk(handlers_mutex_);
                Handler h;
                h.done   = done;
                h.thread = std::thread([this, id = ep.id, s = std::move(sock), done]() mutable {
                    serve(id, std::move(s));
                    done->store(true);
                });
                handlers_.push_back(std::move(h));
            }

            // Join finished handlers and drop abandoned uploads
            reap_handlers(false);
            store_.expire_pending(cfg_.pending_upload_ttl);

        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

void ObjectServer::reap_handlers(bool all) {
    std::list<Handler> finished;
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ) {
            auto next = std::next(it);
            if (all || it->done->load()) finished.splice(finished.end(), handlers_, it);
            it = next;
        }
    }
    for (auto& h : finished) {
        if (h.thread.joinable()) h.thread.join();
    }
}

// ---------------------------------------------------------------
// Per-connection loop
// ---------------------------------------------------------------

void ObjectServer::serve(u32 endpoint_id, TcpSocket sock) {
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        live_.insert(&sock);
    }
    std::string peer = sock.peer_addr();
    Conn c;
    c.endpoint_id = endpoint_id;

    try {
        FrameHeader hdr{};
        std::vector<u8> payload;
        while (running_.load() && sock.read_frame(hdr, payload) == ReadStatus::FRAME) {
            Reply reply;
            try {
                reply = dispatch(c, static_cast<MsgType>(hdr.msg_type), payload);
            } catch (const RemoteError& e) {
                if (e.code() != ErrorCode::FLOOD_WAIT) {
                    LOG_DEBUG("Endpoint " + std::to_string(endpoint_id) + " " + peer + ": " + e.what());
                }
                reply = Reply{MsgType::MT_ERROR, error_payload(e.code(), e.value(), e.what())};
            } catch (const std::exception& e) {
                LOG_ERROR("Endpoint " + std::to_string(endpoint_id) + " " + peer + ": " + e.what());
                reply = Reply{MsgType::MT_ERROR, error_payload(ErrorCode::INTERNAL, 0, e.what())};
            }
            sock.write_frame(reply.type, reply.payload);
        }
    } catch (const std::exception& e) {
        if (running_.load()) {
            LOG_WARN("Connection " + peer + " dropped: " + e.what());
        }
    }

    LOG_DEBUG("Endpoint " + std::to_string(endpoint_id) + " closed " + peer);
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    live_.erase(&sock);
}

ObjectServer::Reply ObjectServer::dispatch(Conn& c, MsgType type, const std::vector<u8>& payload) {
    switch (type) {
        case MsgType::MT_AUTH_SESSION: return on_auth_session(c, payload);
        case MsgType::MT_AUTH_KEY:     return on_auth_key(c, payload);
        case MsgType::MT_EXPORT_AUTH:  return on_export_auth(c, payload);
        case MsgType::MT_IMPORT_AUTH:  return on_import_auth(c, payload);
        case MsgType::MT_GET_FILE:     return on_get_file(c, payload);
        case MsgType::MT_SAVE_PART:    return on_save_part(c, payload);
        case MsgType::MT_COMMIT_FILE:  return on_commit_file(c, payload);
        case MsgType::MT_PING:
            require_auth(c);
            return Reply{MsgType::MT_PONG, {}};
        default:
            break;
    }
    throw RemoteError(ErrorCode::BAD_REQUEST, 0,
                      "unexpected message type " + std::to_string((u16)type));
}

void ObjectServer::require_auth(const Conn& c) const {
    if (!c.authorized) throw RemoteError(ErrorCode::AUTH_REQUIRED, 0, "connection not authorized");
}

void ObjectServer::maybe_flood() {
    if (cfg_.flood_every == 0) return;
    u64 n = ++request_counter_;
    if (n % cfg_.flood_every == 0) {
        throw RateLimitError(cfg_.flood_wait_s, "slow down");
    }
}

// ---------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------

ObjectServer::Reply ObjectServer::on_auth_session(Conn& c, const std::vector<u8>& payload) {
    AuthSessionReq req = request<AuthSessionReq>(payload);
    check_magic(req.magic, req.version);
    proto::decode_auth_session_req(req);

    std::string session  = request_tail(payload, sizeof(req), req.session_len);
    std::string api_hash = request_tail(payload, sizeof(req) + req.session_len, req.api_hash_len);

    AuthTable::Key key{};
    c.authorized = auth_.session_ok(session, req.api_id, api_hash);
    if (c.authorized) key = auth_.issue_key(c.endpoint_id);
    LOG_INFO("Endpoint " + std::to_string(c.endpoint_id) + ": session for api_id " +
             std::to_string(req.api_id) + (c.authorized ? " authorized" : " rejected"));
    return Reply{MsgType::MT_AUTH_OK, auth_ok_payload(c.endpoint_id, c.authorized, key)};
}

ObjectServer::Reply ObjectServer::on_auth_key(Conn& c, const std::vector<u8>& payload) {
    AuthKeyReq req = request<AuthKeyReq>(payload);
    check_magic(req.magic, req.version);

    AuthTable::Key key{};
    std::copy(req.auth_key, req.auth_key + AUTH_KEY_LEN, key.begin());
    c.authorized = auth_.key_valid(c.endpoint_id, key);
    if (!c.authorized) key.fill(0);
    return Reply{MsgType::MT_AUTH_OK, auth_ok_payload(c.endpoint_id, c.authorized, key)};
}

ObjectServer::Reply ObjectServer::on_export_auth(Conn& c, const std::vector<u8>& payload) {
    require_auth(c);
    ExportAuthReq req = request<ExportAuthReq>(payload);
    proto::decode_export_auth_req(req);
    if (req.endpoint_id == 0 || req.endpoint_id > (u32)cfg_.endpoints) {
        throw RemoteError(ErrorCode::NOT_FOUND, 0, "no endpoint " + std::to_string(req.endpoint_id));
    }

    AuthTable::Export ex = auth_.export_for(req.endpoint_id);
    LOG_DEBUG("Endpoint " + std::to_string(c.endpoint_id) + " exported authorization " +
              std::to_string(ex.id) + " for endpoint " + std::to_string(req.endpoint_id));

    ExportedAuthMsg msg{};
    msg.auth_id = ex.id;
    std::copy(ex.bytes.begin(), ex.bytes.end(), msg.bytes);
    proto::encode_exported_auth(msg);
    return Reply{MsgType::MT_EXPORTED_AUTH, proto::pack(msg)};
}

ObjectServer::Reply ObjectServer::on_import_auth(Conn& c, const std::vector<u8>& payload) {
    ImportAuthReq req = request<ImportAuthReq>(payload);
    check_magic(req.magic, req.version);
    proto::decode_import_auth_req(req);

    AuthTable::Token bytes{};
    std::copy(req.bytes, req.bytes + 16, bytes.begin());
    std::optional<AuthTable::Key> key = auth_.import(c.endpoint_id, req.auth_id, bytes);
    if (!key) throw RemoteError(ErrorCode::AUTH_INVALID, 0, "unknown or used authorization");

    c.authorized = true;
    LOG_DEBUG("Endpoint " + std::to_string(c.endpoint_id) + " imported authorization " +
              std::to_string(req.auth_id));
    return Reply{MsgType::MT_AUTH_OK, auth_ok_payload(c.endpoint_id, true, *key)};
}

// ---------------------------------------------------------------
// Data
// ---------------------------------------------------------------

ObjectServer::Reply ObjectServer::on_get_file(Conn& c, const std::vector<u8>& payload) {
    require_auth(c);
    GetFileReq req = request<GetFileReq>(payload);
    proto::decode_get_file_req(req);
    if (req.limit == 0 || req.limit > MAX_PART_SIZE) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "limit must be 1-" + std::to_string(MAX_PART_SIZE));
    }
    maybe_flood();
    return Reply{MsgType::MT_FILE_BYTES, store_.read(req.location_id, req.offset, req.limit)};
}

ObjectServer::Reply ObjectServer::on_save_part(Conn& c, const std::vector<u8>& payload) {
    require_auth(c);
    SavePartReq req = request<SavePartReq>(payload);
    proto::decode_save_part_req(req);

    size_t len = payload.size() - sizeof(req);
    if (len == 0 || len > MAX_PART_SIZE) {
        throw RemoteError(ErrorCode::BAD_REQUEST, 0, "part size " + std::to_string(len));
    }
    auto last = c.last_part.find(req.file_id);
    if (last != c.last_part.end() && req.part_index < last->second) {
        throw RemoteError(ErrorCode::PART_ORDER, 0,
                          "part " + std::to_string(req.part_index) + " after " +
                          std::to_string(last->second));
    }
    maybe_flood();

    store_.put_part(req.file_id, req.part_index, req.total_parts, req.big != 0,
                    payload.data() + sizeof(req), len);
    c.last_part[req.file_id] = req.part_index;
    return Reply{MsgType::MT_OK, {}};
}

ObjectServer::Reply ObjectServer::on_commit_file(Conn& c, const std::vector<u8>& payload) {
    require_auth(c);
    CommitFileReq req = request<CommitFileReq>(payload);
    proto::decode_commit_file_req(req);
    std::string name = request_tail(payload, sizeof(req), req.name_len);

    std::optional<hash::Hash128> checksum;
    if (req.has_checksum) checksum = hash::from_bytes(req.checksum);

    StoredObject obj = store_.commit(c.endpoint_id, req.file_id, req.part_count, req.big != 0,
                                     checksum, name);
    c.last_part.erase(req.file_id);

    FileLocationMsg msg{};
    msg.location_id = obj.location_id;
    msg.size        = obj.size;
    msg.endpoint_id = c.endpoint_id;
    proto::encode_file_location(msg);
    return Reply{MsgType::MT_FILE_LOCATION, proto::pack(msg)};
}
