// ============================================================
// tcp_remote.cpp -- Framed-protocol client for object endpoints
// ============================================================

#include "tcp_remote.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

[[noreturn]] void raise_error_frame(const std::vector<u8>& payload) {
    ErrorMsg em = proto::unpack<ErrorMsg>(payload);
    proto::decode_error_msg(em);
    std::string msg = proto::tail_string(payload, sizeof(ErrorMsg), em.msg_len);
    throw_remote_error(static_cast<ErrorCode>(em.code), em.value, msg);
}

// Send one request and read its reply. MT_ERROR becomes an exception.
std::vector<u8> roundtrip(TcpSocket& sock, MsgType req,
                          const std::vector<u8>& payload, MsgType expect)
{
    sock.write_frame(req, payload);
    FrameHeader hdr{};
    std::vector<u8> reply;
    ReadStatus st = sock.read_frame(hdr, reply);
    if (st == ReadStatus::TIMED_OUT) {
        throw std::runtime_error("Endpoint did not reply in time");
    }
    if (st == ReadStatus::CLOSED) {
        throw std::runtime_error("Endpoint closed the connection");
    }
    auto type = static_cast<MsgType>(hdr.msg_type);
    if (type == MsgType::MT_ERROR) raise_error_frame(reply);
    if (type != expect) {
        throw std::runtime_error("Unexpected reply type " + std::to_string(hdr.msg_type));
    }
    return reply;
}

AuthKey key_from(const u8 raw[AUTH_KEY_LEN]) {
    AuthKey key;
    std::copy(raw, raw + AUTH_KEY_LEN, key.begin());
    return key;
}

} // namespace

// ---------------------------------------------------------------
// EndpointTable
// ---------------------------------------------------------------

EndpointTable::EndpointTable(const std::vector<EndpointAddress>& eps) {
    for (const auto& ep : eps) add(ep);
}

void EndpointTable::add(const EndpointAddress& ep) {
    by_id_[ep.id] = ep;
    if (!home_) home_ = ep.id;
}

const EndpointAddress& EndpointTable::lookup(u32 id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        throw std::runtime_error("Unknown endpoint " + std::to_string(id));
    }
    return it->second;
}

u32 EndpointTable::home() const {
    if (!home_) throw std::runtime_error("No endpoints configured");
    return *home_;
}

// ---------------------------------------------------------------
// TcpConnection
// ---------------------------------------------------------------

TcpConnection::TcpConnection(TcpSocket sock, u32 endpoint_id)
    : sock_(std::move(sock)), endpoint_id_(endpoint_id) {}

std::unique_ptr<TcpConnection> TcpConnection::open(const EndpointAddress& ep,
                                                   const std::optional<AuthKey>& key,
                                                   int io_timeout_ms)
{
    TcpSocket sock = TcpSocket::connect_to(ep.host, ep.port, io_timeout_ms);
    sock.set_timeouts(io_timeout_ms, io_timeout_ms);

    if (key) {
        AuthKeyReq req{};
        stamp_magic(req.magic);
        req.version = PARXFER_VERSION;
        std::copy(key->begin(), key->end(), req.auth_key);
        auto reply = roundtrip(sock, MsgType::MT_AUTH_KEY, proto::pack(req), MsgType::MT_AUTH_OK);
        AuthOk ok = proto::unpack<AuthOk>(reply);
        proto::decode_auth_ok(ok);
        if (!ok.authorized) {
            throw RemoteError(ErrorCode::AUTH_INVALID, 0,
                              "endpoint " + std::to_string(ep.id) + " rejected auth key");
        }
    }
    LOG_DEBUG("Opened connection to endpoint " + ep.to_string());
    return std::make_unique<TcpConnection>(std::move(sock), ep.id);
}

std::vector<u8> TcpConnection::get_file_chunk(const FileLocation& loc, u64 offset, u32 limit) {
    GetFileReq req{};
    req.location_id = loc.location_id;
    req.offset      = offset;
    req.limit       = limit;
    proto::encode_get_file_req(req);
    return roundtrip(sock_, MsgType::MT_GET_FILE, proto::pack(req), MsgType::MT_FILE_BYTES);
}

void TcpConnection::send_part(u64 file_id, u32 part_index, u32 total_parts, bool big,
                              const u8* data, size_t len)
{
    SavePartReq req{};
    req.file_id     = file_id;
    req.part_index  = part_index;
    req.total_parts = total_parts;
    req.big         = big ? 1 : 0;
    proto::encode_save_part_req(req);
    roundtrip(sock_, MsgType::MT_SAVE_PART, proto::pack(req, data, len), MsgType::MT_OK);
}

void TcpConnection::save_file_part(u64 file_id, u32 part_index, const u8* data, size_t len) {
    send_part(file_id, part_index, 0, false, data, len);
}

void TcpConnection::save_big_file_part(u64 file_id, u32 part_index, u32 total_parts,
                                       const u8* data, size_t len)
{
    send_part(file_id, part_index, total_parts, true, data, len);
}

AuthKey TcpConnection::import_authorization(const ExportedAuthorization& auth) {
    ImportAuthReq req{};
    stamp_magic(req.magic);
    req.version = PARXFER_VERSION;
    req.auth_id = auth.id;
    std::copy(auth.bytes.begin(), auth.bytes.end(), req.bytes);
    proto::encode_import_auth_req(req);

    auto reply = roundtrip(sock_, MsgType::MT_IMPORT_AUTH, proto::pack(req), MsgType::MT_AUTH_OK);
    AuthOk ok = proto::unpack<AuthOk>(reply);
    proto::decode_auth_ok(ok);
    if (!ok.authorized) {
        throw RemoteError(ErrorCode::AUTH_INVALID, 0, "authorization import rejected");
    }
    return key_from(ok.auth_key);
}

void TcpConnection::disconnect() {
    sock_.close();
}

// ---------------------------------------------------------------
// TcpSession
// ---------------------------------------------------------------

TcpSession::TcpSession(EndpointTable endpoints, Credentials creds, std::string session_string,
                       int connect_timeout_ms, int io_timeout_ms)
    : endpoints_(std::move(endpoints))
    , creds_(std::move(creds))
    , session_string_(std::move(session_string))
    , connect_timeout_ms_(connect_timeout_ms)
    , io_timeout_ms_(io_timeout_ms) {}

TcpSession::~TcpSession() {
    disconnect();
}

void TcpSession::connect() {
    std::lock_guard<std::mutex> lk(mutex_);
    const EndpointAddress& home = endpoints_.lookup(endpoints_.home());

    auto sock = std::make_unique<TcpSocket>(
        TcpSocket::connect_to(home.host, home.port, connect_timeout_ms_));
    sock->set_timeouts(connect_timeout_ms_, connect_timeout_ms_);

    AuthSessionReq req{};
    stamp_magic(req.magic);
    req.version      = PARXFER_VERSION;
    req.session_len  = (u16)session_string_.size();
    req.api_id       = creds_.api_id;
    req.api_hash_len = (u16)creds_.api_hash.size();
    proto::encode_auth_session_req(req);

    std::string tail = session_string_ + creds_.api_hash;
    auto reply = roundtrip(*sock, MsgType::MT_AUTH_SESSION,
                           proto::pack(req, tail.data(), tail.size()), MsgType::MT_AUTH_OK);
    AuthOk ok = proto::unpack<AuthOk>(reply);
    proto::decode_auth_ok(ok);

    sock->set_timeouts(io_timeout_ms_, io_timeout_ms_);
    control_    = std::move(sock);
    authorized_ = ok.authorized != 0;
    auth_key_   = key_from(ok.auth_key);
    LOG_DEBUG("Session connected to " + home.to_string() +
              (authorized_ ? " (authorized)" : " (not authorized)"));
}

void TcpSession::disconnect() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (control_) {
        control_->close();
        control_.reset();
    }
    authorized_ = false;
}

bool TcpSession::is_connected() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return control_ != nullptr;
}

bool TcpSession::is_authorized() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!control_ || !authorized_) return false;
    try {
        roundtrip(*control_, MsgType::MT_PING, {}, MsgType::MT_PONG);
    } catch (const RemoteError& e) {
        if (e.code() == ErrorCode::AUTH_REQUIRED || e.code() == ErrorCode::AUTH_INVALID) {
            authorized_ = false;
            return false;
        }
        throw;
    }
    return true;
}

AuthKey TcpSession::auth_key() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return auth_key_;
}

ExportedAuthorization TcpSession::export_authorization(u32 endpoint_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!control_) throw std::runtime_error("Session is not connected");

    ExportAuthReq req{};
    req.endpoint_id = endpoint_id;
    proto::encode_export_auth_req(req);
    auto reply = roundtrip(*control_, MsgType::MT_EXPORT_AUTH, proto::pack(req),
                           MsgType::MT_EXPORTED_AUTH);
    ExportedAuthMsg msg = proto::unpack<ExportedAuthMsg>(reply);
    proto::decode_exported_auth(msg);

    ExportedAuthorization out;
    out.id = msg.auth_id;
    std::copy(msg.bytes, msg.bytes + 16, out.bytes.begin());
    return out;
}

std::unique_ptr<RemoteConnection>
TcpSession::open_connection(u32 endpoint_id, const std::optional<AuthKey>& key) {
    return TcpConnection::open(endpoints_.lookup(endpoint_id), key, io_timeout_ms_);
}

FileLocation TcpSession::commit_file(const UploadedFile& file) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!control_) throw std::runtime_error("Session is not connected");

    CommitFileReq req{};
    req.file_id      = file.file_id;
    req.part_count   = file.part_count;
    req.big          = file.big ? 1 : 0;
    req.has_checksum = file.checksum ? 1 : 0;
    req.name_len     = (u16)file.name.size();
    if (file.checksum) hash::to_bytes(*file.checksum, req.checksum);
    proto::encode_commit_file_req(req);

    auto reply = roundtrip(*control_, MsgType::MT_COMMIT_FILE,
                           proto::pack(req, file.name.data(), file.name.size()),
                           MsgType::MT_FILE_LOCATION);
    FileLocationMsg msg = proto::unpack<FileLocationMsg>(reply);
    proto::decode_file_location(msg);

    FileLocation loc;
    loc.endpoint_id = msg.endpoint_id;
    loc.location_id = msg.location_id;
    loc.size        = msg.size;
    return loc;
}

// ---------------------------------------------------------------
// TcpSessionFactory
// ---------------------------------------------------------------

TcpSessionFactory::TcpSessionFactory(EndpointTable endpoints, const ServiceConfig& cfg)
    : endpoints_(std::move(endpoints))
    , connect_timeout_ms_((int)cfg.connect_timeout.count())
    , io_timeout_ms_((int)cfg.io_timeout.count()) {}

std::shared_ptr<RemoteSession>
TcpSessionFactory::create(const Credentials& creds, const std::string& session_string) {
    return std::make_shared<TcpSession>(endpoints_, creds, session_string,
                                        connect_timeout_ms_, io_timeout_ms_);
}
