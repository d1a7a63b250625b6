#pragma once

// ============================================================
// platform.hpp -- Portable types and the socket/OS shims the
// transport needs (Winsock on Windows, BSD sockets elsewhere)
// ============================================================

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// Logical principal a session or transfer belongs to
using OwnerId = i64;

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef _WIN32_WINNT
#    define _WIN32_WINNT 0x0601
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#  include <windows.h>

   using socket_t  = SOCKET;
   using socklen_t = int;
#  define INVALID_SOCKET_VAL INVALID_SOCKET
#  define SOCKET_ERROR_VAL   SOCKET_ERROR
#else
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <poll.h>
#  include <fcntl.h>
#  include <unistd.h>
#  include <csignal>
#  include <cerrno>
#  include <cstring>

   using socket_t = int;
#  define INVALID_SOCKET_VAL (-1)
#  define SOCKET_ERROR_VAL   (-1)
#endif

namespace platform {

inline int last_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

inline std::string error_string(int err) {
#ifdef _WIN32
    char buf[256] = {0};
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, err, 0, buf, sizeof(buf), nullptr);
    std::string s = buf;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
    return s + " (err=" + std::to_string(err) + ")";
#else
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
#endif
}

// SO_RCVTIMEO / SO_SNDTIMEO expiry
inline bool is_timeout(int err) {
#ifdef _WIN32
    return err == WSAETIMEDOUT || err == WSAEWOULDBLOCK;
#else
    return err == EAGAIN || err == EWOULDBLOCK;
#endif
}

inline bool is_interrupted(int err) {
#ifdef _WIN32
    return err == WSAEINTR;
#else
    return err == EINTR;
#endif
}

// Non-blocking connect() still in progress
inline bool is_in_progress(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
    return err == EINPROGRESS;
#endif
}

inline void close_socket(socket_t s) {
#ifdef _WIN32
    closesocket(s);
#else
    ::close(s);
#endif
}

inline void shutdown_socket(socket_t s) {
#ifdef _WIN32
    ::shutdown(s, SD_BOTH);
#else
    ::shutdown(s, SHUT_RDWR);
#endif
}

inline void set_nonblocking(socket_t s, bool on) {
#ifdef _WIN32
    u_long mode = on ? 1 : 0;
    ioctlsocket(s, FIONBIO, &mode);
#else
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) return;
    ::fcntl(s, F_SETFL, on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
#endif
}

// Wait until s is writable. Returns 0 when ready, otherwise an error code
// (a timeout reports as ETIMEDOUT / WSAETIMEDOUT).
inline int wait_writable(socket_t s, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd     = s;
    pfd.events = POLLWRNORM;
    int rc = WSAPoll(&pfd, 1, timeout_ms);
    if (rc == 0) return WSAETIMEDOUT;
#else
    pollfd pfd{};
    pfd.fd     = s;
    pfd.events = POLLOUT;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) return ETIMEDOUT;
#endif
    if (rc < 0) return last_error();

    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len) != 0) {
        return last_error();
    }
    return err;
}

// Writes to a socket the peer already closed must fail with EPIPE
// instead of killing the process
inline void ignore_sigpipe() {
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

// Winsock lifetime; a no-op elsewhere
class NetworkScope {
public:
    NetworkScope() {
#ifdef _WIN32
        WSADATA wsa;
        int rc = WSAStartup(MAKEWORD(2, 2), &wsa);
        if (rc != 0) {
            throw std::runtime_error("WSAStartup failed: " + std::to_string(rc));
        }
#endif
    }
    ~NetworkScope() {
#ifdef _WIN32
        WSACleanup();
#endif
    }

    NetworkScope(const NetworkScope&) = delete;
    NetworkScope& operator=(const NetworkScope&) = delete;
};

} // namespace platform
