#pragma once

// ============================================================
// tcp_peer_transport.hpp -- PeerConnection over one direct TCP stream
//
// Negotiation:
//   offerer  : set_local(offer)  -> listen on an ephemeral port,
//              emit candidate "tcp <advertise-host> <port>"
//   answerer : set_remote(offer) + set_local(answer) + candidate
//              -> connect, send HELLO(token)
//   offerer  : accept, verify token, stream is up
// Session description sdp: "v=peerdrop-tcp/1\na=token:<16 hex>\n";
// the answer echoes the offer's token.
//
// Stream frames (8-byte FrameHeader, see protocol.hpp):
//   MT_CHANNEL_OPEN   payload = label
//   MT_CHANNEL_TEXT   payload = UTF-8 text
//   MT_CHANNEL_BINARY payload = bytes
//   MT_CHANNEL_CLOSE  no payload
// FrameHeader.flags carries the channel id; CHANNEL_ID_PEER_BIT is set
// when the frame comes from the side that did not create the channel.
//
// Threads: accept (offerer), connect (answerer), reader, writer.
// They only post to the Executor; all state lives on it.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/event_loop.hpp"
#include "peer_transport.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static constexpr u16 CHANNEL_ID_PEER_BIT       = 0x8000;
static constexpr int PEER_CONNECT_TIMEOUT_MS   = 5000;
static constexpr int PEER_HELLO_TIMEOUT_MS     = 5000;
static constexpr u32 PEER_ESTABLISH_TIMEOUT_MS = 30000;
static constexpr int PEER_DRAIN_TIMEOUT_MS     = 5000;

class TcpPeerConnection;

class TcpDataChannel : public DataChannel {
public:
    TcpDataChannel(std::weak_ptr<TcpPeerConnection> conn, std::string label,
                   u16 id, bool locally_created);

    const std::string& label() const override { return label_; }
    ChannelState state() const override { return state_; }
    bool send_text(const std::string& text) override;
    bool send_binary(std::vector<u8> data) override;
    u64 buffered_amount() const override { return *buffered_; }
    void close() override;

    // ---- Called by TcpPeerConnection on the executor ----
    u16  id() const { return id_; }
    bool locally_created() const { return local_; }
    u16  wire_flags() const { return local_ ? id_ : (u16)(id_ | CHANNEL_ID_PEER_BIT); }
    void mark_open();
    void mark_closed();
    void mark_closed_quietly() { state_ = ChannelState::CLOSED; }
    void deliver(const ChannelMessage& msg) { emit_message(msg); }
    void report_error(const std::string& what) { emit_error(what); }

private:
    std::weak_ptr<TcpPeerConnection>   conn_;
    std::string                        label_;
    u16                                id_;
    bool                               local_;
    std::atomic<ChannelState>          state_{ChannelState::OPENING};
    std::shared_ptr<std::atomic<u64>>  buffered_{std::make_shared<std::atomic<u64>>(0)};

    bool send_frame(MsgType type, std::vector<u8> payload);
};

class TcpPeerConnection : public PeerConnection,
                          public std::enable_shared_from_this<TcpPeerConnection> {
public:
    // 'advertise_host' is what goes into our local candidate
    TcpPeerConnection(Executor& exec, std::string advertise_host);
    ~TcpPeerConnection() override;

    SessionDescription create_offer() override;
    SessionDescription create_answer() override;
    void set_local_description(const SessionDescription& desc) override;
    void set_remote_description(const SessionDescription& desc) override;
    void add_ice_candidate(const IceCandidate& candidate) override;

    SignalingState signaling_state() const override { return signaling_state_; }
    ConnectionState connection_state() const override { return connection_state_; }

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;
    void close() override;

    // Queue one frame for the writer thread. 'buffered' is charged now and
    // credited when the frame reaches the socket. False if no stream.
    bool enqueue(MsgType type, u16 flags, std::vector<u8> payload,
                 std::shared_ptr<std::atomic<u64>> buffered);

private:
    struct Stream;
    struct Outgoing {
        MsgType                           type;
        u16                               flags;
        std::vector<u8>                   payload;
        std::shared_ptr<std::atomic<u64>> buffered;
    };

    Executor&       exec_;
    std::string     advertise_host_;
    bool            closed_{false};

    SignalingState  signaling_state_{SignalingState::STABLE};
    ConnectionState connection_state_{ConnectionState::NEW};
    std::string     local_type_;          // "offer" / "answer" once applied
    std::string     local_token_;
    std::string     remote_type_;
    std::string     remote_token_;

    struct Endpoint { std::string host; u16 port; };
    std::vector<Endpoint> remote_endpoints_;
    size_t                next_endpoint_{0};

    // Offerer: listener + accept thread
    std::shared_ptr<TcpSocket>           listener_;
    std::shared_ptr<std::atomic<bool>>   accept_stop_;
    std::thread                          accept_thread_;

    // Answerer: in-flight connect
    bool                                 connecting_{false};
    std::thread                          connect_thread_;

    std::shared_ptr<Stream>              stream_;

    u16 next_channel_id_{0};
    std::map<u16, std::shared_ptr<TcpDataChannel>> local_channels_;
    std::map<u16, std::shared_ptr<TcpDataChannel>> remote_channels_;

    // Run fn(*this) on the executor unless the connection is gone/closed
    static void post_event(Executor* exec, std::weak_ptr<TcpPeerConnection> weak,
                           std::function<void(TcpPeerConnection&)> fn);
    void post_self(std::function<void(TcpPeerConnection&)> fn);

    void start_listener();
    void arm_establish_timeout();
    void stop_listener();
    void maybe_connect();
    void join_connect_thread();
    void set_connection_state(ConnectionState s);

    void on_stream_ready(std::shared_ptr<TcpSocket> sock);
    void on_connect_failed(const std::string& why);
    void on_frame(MsgType type, u16 flags, std::vector<u8> payload);
    void on_stream_lost(bool failed, const std::string& why);
    void stop_stream(bool drain);

    static std::string make_sdp(const std::string& token);
    static std::string token_from_sdp(const std::string& sdp);
};

class TcpPeerConnectionFactory : public PeerConnectionFactory {
public:
    TcpPeerConnectionFactory(Executor& exec, std::string advertise_host)
        : exec_(exec), advertise_host_(std::move(advertise_host)) {}

    std::shared_ptr<PeerConnection> create() override {
        return std::make_shared<TcpPeerConnection>(exec_, advertise_host_);
    }

private:
    Executor&   exec_;
    std::string advertise_host_;
};
