#pragma once

// ============================================================
// socket.hpp -- Blocking TCP socket carrying framed messages
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <vector>

enum class ReadStatus {
    FRAME,       // header and payload received
    CLOSED,      // peer closed the connection
    TIMED_OUT,   // receive timeout expired
};

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(socket_t fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Resolve host and connect, trying each address in turn. Each attempt
    // is bounded by timeout_ms (0 = wait for the OS).
    static TcpSocket connect_to(const std::string& host, u16 port, int timeout_ms);

    // Bind and listen. Port 0 picks an ephemeral port (see local_port).
    static TcpSocket listen_on(const std::string& ip, u16 port, int backlog = 128);

    // Blocks until a peer connects or the socket is shut down
    TcpSocket accept();

    // Bound every blocking recv/send (0 = no limit)
    void set_timeouts(int recv_ms, int send_ms);

    // Header and payload go out in one writev() where possible
    void write_frame(MsgType type, const std::vector<u8>& payload);

    ReadStatus read_frame(FrameHeader& hdr, std::vector<u8>& payload);

    // Wakes threads blocked in recv/accept on this socket
    void shutdown_both();
    void close();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }

    std::string peer_addr() const;
    u16 local_port() const;

private:
    void send_all(const u8* buf, size_t len);
    ReadStatus recv_all(u8* buf, size_t len);
    void set_stream_opts();

    socket_t fd_{INVALID_SOCKET_VAL};
};
