// ============================================================
// socket.cpp -- TcpSocket implementation (framed, blocking I/O)
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>

#ifndef _WIN32
#  include <sys/uio.h>
#endif

namespace {

// Parts are at most 512 KiB; one part in flight per direction
constexpr int STREAM_BUF_SIZE = 1024 * 1024;

#ifdef _WIN32
constexpr int SEND_FLAGS = 0;
#else
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#endif

template<typename T>
void set_opt(socket_t fd, int level, int name, const T& value) {
    setsockopt(fd, level, name, reinterpret_cast<const char*>(&value), sizeof(value));
}

std::runtime_error socket_failure(const std::string& what, int err) {
    return std::runtime_error(what + " failed: " + platform::error_string(err));
}

} // namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

TcpSocket TcpSocket::connect_to(const std::string& host, u16 port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw std::runtime_error("Cannot resolve " + host + ": " + gai_strerror(rc));
    }

    int err = 0;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        TcpSocket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.is_valid()) {
            err = platform::last_error();
            continue;
        }
        if (timeout_ms > 0) platform::set_nonblocking(sock.fd_, true);
        err = 0;
        if (::connect(sock.fd_, ai->ai_addr, (socklen_t)ai->ai_addrlen) == SOCKET_ERROR_VAL) {
            err = platform::last_error();
            if (timeout_ms > 0 && platform::is_in_progress(err)) {
                err = platform::wait_writable(sock.fd_, timeout_ms);
            }
        }
        if (err != 0) continue;

        if (timeout_ms > 0) platform::set_nonblocking(sock.fd_, false);
        sock.set_stream_opts();
        ::freeaddrinfo(res);
        return sock;
    }
    ::freeaddrinfo(res);
    throw socket_failure("connect(" + host + ":" + port_str + ")", err);
}

TcpSocket TcpSocket::listen_on(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + ip);
    }

    TcpSocket sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.is_valid()) throw socket_failure("socket()", platform::last_error());
    set_opt(sock.fd_, SOL_SOCKET, SO_REUSEADDR, 1);

    if (::bind(sock.fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw socket_failure("bind(" + ip + ":" + std::to_string(port) + ")", platform::last_error());
    }
    if (::listen(sock.fd_, backlog) == SOCKET_ERROR_VAL) {
        throw socket_failure("listen()", platform::last_error());
    }
    return sock;
}

TcpSocket TcpSocket::accept() {
    for (;;) {
        socket_t client = ::accept(fd_, nullptr, nullptr);
        if (client != INVALID_SOCKET_VAL) {
            TcpSocket sock(client);
            sock.set_stream_opts();
            return sock;
        }
        int err = platform::last_error();
        if (!platform::is_interrupted(err)) throw socket_failure("accept()", err);
    }
}

void TcpSocket::set_stream_opts() {
    set_opt(fd_, IPPROTO_TCP, TCP_NODELAY,  1);
    set_opt(fd_, SOL_SOCKET,  SO_KEEPALIVE, 1);
    set_opt(fd_, SOL_SOCKET,  SO_SNDBUF,    STREAM_BUF_SIZE);
    set_opt(fd_, SOL_SOCKET,  SO_RCVBUF,    STREAM_BUF_SIZE);
}

void TcpSocket::set_timeouts(int recv_ms, int send_ms) {
#ifdef _WIN32
    set_opt(fd_, SOL_SOCKET, SO_RCVTIMEO, (DWORD)recv_ms);
    set_opt(fd_, SOL_SOCKET, SO_SNDTIMEO, (DWORD)send_ms);
#else
    auto to_tv = [](int ms) {
        timeval tv{};
        tv.tv_sec  = ms / 1000;
        tv.tv_usec = (ms % 1000) * 1000;
        return tv;
    };
    set_opt(fd_, SOL_SOCKET, SO_RCVTIMEO, to_tv(recv_ms));
    set_opt(fd_, SOL_SOCKET, SO_SNDTIMEO, to_tv(send_ms));
#endif
}

void TcpSocket::send_all(const u8* buf, size_t len) {
    while (len > 0) {
        int chunk = (int)std::min(len, (size_t)INT_MAX);
        auto sent = ::send(fd_, reinterpret_cast<const char*>(buf), chunk, SEND_FLAGS);
        if (sent < 0) {
            int err = platform::last_error();
            if (platform::is_interrupted(err)) continue;
            if (platform::is_timeout(err)) throw std::runtime_error("send() timed out");
            throw socket_failure("send()", err);
        }
        buf += sent;
        len -= (size_t)sent;
    }
}

ReadStatus TcpSocket::recv_all(u8* buf, size_t len) {
    while (len > 0) {
        int chunk = (int)std::min(len, (size_t)INT_MAX);
        auto got = ::recv(fd_, reinterpret_cast<char*>(buf), chunk, 0);
        if (got == 0) return ReadStatus::CLOSED;
        if (got < 0) {
            int err = platform::last_error();
            if (platform::is_interrupted(err)) continue;
            if (platform::is_timeout(err)) return ReadStatus::TIMED_OUT;
            throw socket_failure("recv()", err);
        }
        buf += got;
        len -= (size_t)got;
    }
    return ReadStatus::FRAME;
}

void TcpSocket::write_frame(MsgType type, const std::vector<u8>& payload) {
    if (payload.size() > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Payload too large: " + std::to_string(payload.size()));
    }
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = 0;
    hdr.payload_len = (u32)payload.size();
    u8 hdr_buf[8];
    proto::encode_header(hdr, hdr_buf);

#ifdef _WIN32
    send_all(hdr_buf, sizeof(hdr_buf));
    if (!payload.empty()) send_all(payload.data(), payload.size());
#else
    if (payload.empty()) {
        send_all(hdr_buf, sizeof(hdr_buf));
        return;
    }
    size_t total = sizeof(hdr_buf) + payload.size();
    size_t done  = 0;
    while (done < total) {
        iovec iov[2];
        int n = 0;
        if (done < sizeof(hdr_buf)) {
            iov[n].iov_base = hdr_buf + done;
            iov[n].iov_len  = sizeof(hdr_buf) - done;
            ++n;
        }
        size_t body_off = done > sizeof(hdr_buf) ? done - sizeof(hdr_buf) : 0;
        iov[n].iov_base = const_cast<u8*>(payload.data()) + body_off;
        iov[n].iov_len  = payload.size() - body_off;
        ++n;

        ssize_t w = ::writev(fd_, iov, n);
        if (w < 0) {
            int err = errno;
            if (err == EINTR) continue;
            if (platform::is_timeout(err)) throw std::runtime_error("writev() timed out");
            throw socket_failure("writev()", err);
        }
        done += (size_t)w;
    }
#endif
}

ReadStatus TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload) {
    u8 hdr_buf[8];
    ReadStatus st = recv_all(hdr_buf, sizeof(hdr_buf));
    if (st != ReadStatus::FRAME) return st;

    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Payload too large: " + std::to_string(hdr.payload_len));
    }
    payload.resize(hdr.payload_len);
    if (hdr.payload_len == 0) return ReadStatus::FRAME;
    return recv_all(payload.data(), payload.size());
}

void TcpSocket::shutdown_both() {
    if (is_valid()) platform::shutdown_socket(fd_);
}

void TcpSocket::close() {
    if (is_valid()) {
        platform::close_socket(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    char buf[INET_ADDRSTRLEN] = {0};
    if (getpeername(fd_, (sockaddr*)&peer, &len) != 0 ||
        !inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
        return "unknown";
    }
    return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw socket_failure("getsockname()", platform::last_error());
    }
    return ntohs(local.sin_port);
}
