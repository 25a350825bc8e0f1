#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
//
// Carries two framings:
//   - length-prefixed frames (FrameHeader) for the peer stream
//   - newline-delimited text lines for the relay protocol
// One thread may read while another writes; shutdown() may be
// called from any thread to unblock both.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote (IPv4 literal or host name).
    // timeout_ms > 0 bounds the handshake; 0 waits as long as the OS does.
    void connect(const std::string& host, u16 port, int timeout_ms = 0);

    // Server: bind + listen; port 0 picks an ephemeral port
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 16);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload
    // Returns false on clean close (peer disconnected)
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // Send 'line' followed by '\n'
    void write_line(const std::string& line);

    // Read up to the next '\n' (stripped, along with a trailing '\r').
    // Returns false on clean close. Throws if a line exceeds max_len.
    bool read_line(std::string& line, size_t max_len = 1024 * 1024);

    // Disable Nagle, enable keepalive
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    // Unblock pending accept/recv/send in other threads; fd stays owned
    void shutdown();

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Local port after bind (useful with port 0)
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

    // Set send timeout in milliseconds (0 = infinite)
    void set_send_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};
    std::string line_buf_;   // bytes read past the last returned line

    void apply_socket_opts();
    void set_blocking(bool blocking);
};
