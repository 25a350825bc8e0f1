// ============================================================
// tcp_peer_transport.cpp -- Direct TCP PeerConnection
// ============================================================

#include "tcp_peer_transport.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

struct TcpPeerConnection::Stream {
    std::shared_ptr<TcpSocket> sock;
    std::mutex                 mutex;
    std::condition_variable    cv;
    std::deque<Outgoing>       queue;
    bool                       stopping{false};
    bool                       drain{false};
    std::thread                reader;
    std::thread                writer;
};

// ============================================================
// TcpDataChannel
// ============================================================

TcpDataChannel::TcpDataChannel(std::weak_ptr<TcpPeerConnection> conn, std::string label,
                               u16 id, bool locally_created)
    : conn_(std::move(conn))
    , label_(std::move(label))
    , id_(id)
    , local_(locally_created)
{}

bool TcpDataChannel::send_frame(MsgType type, std::vector<u8> payload) {
    if (state_ != ChannelState::OPEN) return false;
    auto conn = conn_.lock();
    if (!conn) return false;
    return conn->enqueue(type, wire_flags(), std::move(payload), buffered_);
}

bool TcpDataChannel::send_text(const std::string& text) {
    return send_frame(MsgType::MT_CHANNEL_TEXT, std::vector<u8>(text.begin(), text.end()));
}

bool TcpDataChannel::send_binary(std::vector<u8> data) {
    return send_frame(MsgType::MT_CHANNEL_BINARY, std::move(data));
}

void TcpDataChannel::close() {
    if (state_ == ChannelState::CLOSED) return;
    if (state_ == ChannelState::OPEN) {
        if (auto conn = conn_.lock()) {
            conn->enqueue(MsgType::MT_CHANNEL_CLOSE, wire_flags(), {}, nullptr);
        }
    }
    mark_closed();
}

void TcpDataChannel::mark_open() {
    if (state_ == ChannelState::OPEN) return;
    state_ = ChannelState::OPEN;
    emit_open();
}

void TcpDataChannel::mark_closed() {
    if (state_ == ChannelState::CLOSED) return;
    state_ = ChannelState::CLOSED;
    emit_close();
}

// ============================================================
// TcpPeerConnection
// ============================================================

TcpPeerConnection::TcpPeerConnection(Executor& exec, std::string advertise_host)
    : exec_(exec)
    , advertise_host_(std::move(advertise_host))
{}

TcpPeerConnection::~TcpPeerConnection() {
    close();
}

void TcpPeerConnection::post_event(Executor* exec, std::weak_ptr<TcpPeerConnection> weak,
                                   std::function<void(TcpPeerConnection&)> fn) {
    exec->post([weak, fn] {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        fn(*self);
    });
}

void TcpPeerConnection::post_self(std::function<void(TcpPeerConnection&)> fn) {
    post_event(&exec_, weak_from_this(), std::move(fn));
}

std::string TcpPeerConnection::make_sdp(const std::string& token) {
    return std::string("v=") + TRANSPORT_SDP_VERSION + "\na=token:" + token + "\n";
}

std::string TcpPeerConnection::token_from_sdp(const std::string& sdp) {
    std::istringstream in(sdp);
    std::string line;
    bool version_ok = false;
    std::string token;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == std::string("v=") + TRANSPORT_SDP_VERSION) version_ok = true;
        else if (line.rfind("a=token:", 0) == 0) token = line.substr(8);
    }
    if (!version_ok) {
        throw TransportError("Unsupported session description (expected v=" +
                             std::string(TRANSPORT_SDP_VERSION) + ")");
    }
    if (token.size() != 16 || token.find_first_not_of("0123456789abcdef") != std::string::npos) {
        throw TransportError("Session description without a valid token");
    }
    return token;
}

// ---- Offer / answer ----

SessionDescription TcpPeerConnection::create_offer() {
    if (closed_) throw TransportError("create_offer on a closed connection");
    return SessionDescription{"offer", make_sdp(utils::generate_token())};
}

SessionDescription TcpPeerConnection::create_answer() {
    if (closed_) throw TransportError("create_answer on a closed connection");
    if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
        throw TransportError(std::string("create_answer in state ") +
                             signaling_state_name(signaling_state_));
    }
    return SessionDescription{"answer", make_sdp(remote_token_)};
}

void TcpPeerConnection::set_local_description(const SessionDescription& desc) {
    if (closed_) throw TransportError("set_local_description on a closed connection");

    if (desc.type == "offer") {
        if (signaling_state_ != SignalingState::STABLE &&
            signaling_state_ != SignalingState::HAVE_LOCAL_OFFER) {
            throw TransportError(std::string("local offer in state ") +
                                 signaling_state_name(signaling_state_));
        }
        std::string token = token_from_sdp(desc.sdp);
        stop_listener();
        local_type_  = "offer";
        local_token_ = token;
        start_listener();
        signaling_state_ = SignalingState::HAVE_LOCAL_OFFER;
    } else if (desc.type == "answer") {
        if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
            throw TransportError(std::string("local answer in state ") +
                                 signaling_state_name(signaling_state_));
        }
        std::string token = token_from_sdp(desc.sdp);
        if (token != remote_token_) {
            throw TransportError("Answer token does not match the offer");
        }
        local_type_      = "answer";
        local_token_     = token;
        signaling_state_ = SignalingState::STABLE;
        set_connection_state(ConnectionState::CONNECTING);
        maybe_connect();
    } else if (desc.type == "rollback") {
        if (signaling_state_ != SignalingState::HAVE_LOCAL_OFFER) {
            throw TransportError(std::string("rollback in state ") +
                                 signaling_state_name(signaling_state_));
        }
        stop_listener();
        local_type_.clear();
        local_token_.clear();
        signaling_state_ = SignalingState::STABLE;
        LOG_DEBUG("Local offer rolled back");
    } else {
        throw TransportError("Unsupported local description type: " + desc.type);
    }
}

void TcpPeerConnection::set_remote_description(const SessionDescription& desc) {
    if (closed_) throw TransportError("set_remote_description on a closed connection");

    if (desc.type == "offer") {
        if (signaling_state_ != SignalingState::STABLE) {
            throw TransportError(std::string("remote offer in state ") +
                                 signaling_state_name(signaling_state_));
        }
        if (connection_state_ != ConnectionState::NEW) {
            throw TransportError("Renegotiation is not supported");
        }
        remote_token_    = token_from_sdp(desc.sdp);
        remote_type_     = "offer";
        remote_endpoints_.clear();
        next_endpoint_   = 0;
        signaling_state_ = SignalingState::HAVE_REMOTE_OFFER;
    } else if (desc.type == "answer") {
        if (signaling_state_ != SignalingState::HAVE_LOCAL_OFFER) {
            throw TransportError(std::string("remote answer in state ") +
                                 signaling_state_name(signaling_state_));
        }
        std::string token = token_from_sdp(desc.sdp);
        if (token != local_token_) {
            throw TransportError("Answer token does not match our offer");
        }
        remote_token_    = token;
        remote_type_     = "answer";
        signaling_state_ = SignalingState::STABLE;
        set_connection_state(ConnectionState::CONNECTING);
    } else if (desc.type == "rollback") {
        if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
            throw TransportError(std::string("remote rollback in state ") +
                                 signaling_state_name(signaling_state_));
        }
        remote_type_.clear();
        remote_token_.clear();
        signaling_state_ = SignalingState::STABLE;
    } else {
        throw TransportError("Unsupported remote description type: " + desc.type);
    }
}

void TcpPeerConnection::add_ice_candidate(const IceCandidate& candidate) {
    if (closed_) throw TransportError("add_ice_candidate on a closed connection");
    if (remote_type_.empty()) throw CandidateBeforeRemoteDescription();
    if (candidate.candidate.empty()) return;   // end of candidates

    std::istringstream in(candidate.candidate);
    std::string kind, host;
    int port = 0;
    if (!(in >> kind >> host >> port) || kind != "tcp" || !utils::validate_port(port)) {
        throw TransportError("Unsupported candidate: " + candidate.candidate);
    }
    remote_endpoints_.push_back(Endpoint{host, (u16)port});
    LOG_DEBUG("Remote candidate " + host + ":" + std::to_string(port));
    maybe_connect();
}

// ---- Connection establishment ----

void TcpPeerConnection::start_listener() {
    auto lst = std::make_shared<TcpSocket>();
    try {
        lst->bind_and_listen("0.0.0.0", 0, 4);
    } catch (const std::exception& e) {
        throw TransportError(std::string("Cannot listen for the peer: ") + e.what());
    }
    u16 port = lst->local_port();
    auto stop = std::make_shared<std::atomic<bool>>(false);
    listener_    = lst;
    accept_stop_ = stop;

    Executor* exec = &exec_;
    std::weak_ptr<TcpPeerConnection> weak = weak_from_this();
    std::string token = local_token_;

    accept_thread_ = std::thread([exec, weak, lst, stop, token] {
        while (!*stop) {
            std::shared_ptr<TcpSocket> peer;
            try {
                peer = std::make_shared<TcpSocket>(lst->accept());
            } catch (const std::exception& e) {
                if (!*stop) LOG_WARN(std::string("Peer listener stopped: ") + e.what());
                return;
            }
            try {
                peer->set_recv_timeout_ms(PEER_HELLO_TIMEOUT_MS);
                FrameHeader hdr;
                std::vector<u8> payload;
                bool ok = peer->read_frame(hdr, payload) &&
                          hdr.msg_type == (u16)MsgType::MT_HELLO &&
                          std::string(payload.begin(), payload.end()) == token;
                if (!ok) {
                    LOG_WARN("Rejected peer connection from " + peer->peer_addr() + ": bad hello");
                    continue;
                }
                peer->set_recv_timeout_ms(0);
            } catch (const std::exception& e) {
                LOG_WARN(std::string("Rejected peer connection: ") + e.what());
                continue;
            }
            post_event(exec, weak, [peer](TcpPeerConnection& c) { c.on_stream_ready(peer); });
            return;
        }
    });

    IceCandidate cand;
    cand.candidate       = "tcp " + advertise_host_ + " " + std::to_string(port);
    cand.sdp_mid         = "0";
    cand.sdp_mline_index = 0;
    LOG_DEBUG("Listening for the peer on port " + std::to_string(port));
    post_self([cand](TcpPeerConnection& c) { c.emit_local_candidate(cand); });
}

void TcpPeerConnection::stop_listener() {
    if (accept_stop_) *accept_stop_ = true;
    if (listener_) listener_->shutdown();
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.reset();
    accept_stop_.reset();
}

void TcpPeerConnection::maybe_connect() {
    if (closed_ || stream_ || connecting_) return;
    if (local_type_ != "answer" || remote_type_ != "offer") return;
    if (next_endpoint_ >= remote_endpoints_.size()) return;

    Endpoint ep = remote_endpoints_[next_endpoint_++];
    join_connect_thread();
    connecting_ = true;

    Executor* exec = &exec_;
    std::weak_ptr<TcpPeerConnection> weak = weak_from_this();
    std::string token = local_token_;
    LOG_INFO("Connecting to peer at " + ep.host + ":" + std::to_string(ep.port));

    connect_thread_ = std::thread([exec, weak, ep, token] {
        std::shared_ptr<TcpSocket> sock;
        try {
            sock = std::make_shared<TcpSocket>();
            sock->connect(ep.host, ep.port, PEER_CONNECT_TIMEOUT_MS);
            sock->write_frame(MsgType::MT_HELLO, 0, token.data(), (u32)token.size());
        } catch (const std::exception& e) {
            std::string why = e.what();
            post_event(exec, weak, [why](TcpPeerConnection& c) { c.on_connect_failed(why); });
            return;
        }
        post_event(exec, weak, [sock](TcpPeerConnection& c) { c.on_stream_ready(sock); });
    });
}

void TcpPeerConnection::join_connect_thread() {
    if (connect_thread_.joinable()) connect_thread_.join();
}

void TcpPeerConnection::on_connect_failed(const std::string& why) {
    connecting_ = false;
    LOG_WARN("Peer connect failed: " + why);
    if (next_endpoint_ < remote_endpoints_.size()) {
        maybe_connect();
    } else {
        set_connection_state(ConnectionState::FAILED);
    }
}

void TcpPeerConnection::arm_establish_timeout() {
    std::weak_ptr<TcpPeerConnection> weak = weak_from_this();
    exec_.post_delayed(PEER_ESTABLISH_TIMEOUT_MS, [weak] {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        if (self->connection_state_ != ConnectionState::CONNECTING) return;
        LOG_WARN("Peer connection not established within " +
                 std::to_string(PEER_ESTABLISH_TIMEOUT_MS / 1000) + " s");
        self->stop_listener();
        self->set_connection_state(ConnectionState::FAILED);
    });
}

void TcpPeerConnection::set_connection_state(ConnectionState s) {
    if (connection_state_ == s) return;
    connection_state_ = s;
    LOG_DEBUG(std::string("Transport state: ") + connection_state_name(s));
    if (s == ConnectionState::CONNECTING) arm_establish_timeout();
    post_self([s](TcpPeerConnection& c) { c.emit_state_change(s); });
}

void TcpPeerConnection::on_stream_ready(std::shared_ptr<TcpSocket> sock) {
    connecting_ = false;
    if (stream_) {
        sock->shutdown();
        return;
    }
    stop_listener();
    join_connect_thread();

    auto st = std::make_shared<Stream>();
    st->sock = sock;
    stream_  = st;

    Executor* exec = &exec_;
    std::weak_ptr<TcpPeerConnection> weak = weak_from_this();
    Stream* raw = st.get();

    st->reader = std::thread([exec, weak, sock] {
        FrameHeader hdr;
        std::vector<u8> payload;
        try {
            while (sock->read_frame(hdr, payload)) {
                MsgType type = (MsgType)hdr.msg_type;
                u16 flags    = hdr.flags;
                std::vector<u8> data = std::move(payload);
                payload.clear();
                post_event(exec, weak, [type, flags, data](TcpPeerConnection& c) {
                    c.on_frame(type, flags, data);
                });
            }
            post_event(exec, weak, [](TcpPeerConnection& c) {
                c.on_stream_lost(false, "peer closed the connection");
            });
        } catch (const std::exception& e) {
            std::string why = e.what();
            post_event(exec, weak, [why](TcpPeerConnection& c) { c.on_stream_lost(true, why); });
        }
    });

    st->writer = std::thread([exec, weak, sock, raw] {
        for (;;) {
            Outgoing out;
            {
                std::unique_lock<std::mutex> lk(raw->mutex);
                raw->cv.wait(lk, [raw] { return raw->stopping || !raw->queue.empty(); });
                if (raw->stopping && (!raw->drain || raw->queue.empty())) return;
                out = std::move(raw->queue.front());
                raw->queue.pop_front();
            }
            try {
                sock->write_frame(out.type, out.flags, out.payload.data(), (u32)out.payload.size());
            } catch (const std::exception& e) {
                std::string why = e.what();
                post_event(exec, weak, [why](TcpPeerConnection& c) { c.on_stream_lost(true, why); });
                return;
            }
            if (out.buffered) *out.buffered -= out.payload.size();
        }
    });

    LOG_INFO("Peer stream established with " + sock->peer_addr());
    set_connection_state(ConnectionState::CONNECTED);

    // Announce our channels; their open events follow the state change
    for (auto& [id, ch] : local_channels_) {
        if (ch->state() != ChannelState::OPENING) continue;
        enqueue(MsgType::MT_CHANNEL_OPEN, ch->wire_flags(),
                std::vector<u8>(ch->label().begin(), ch->label().end()), nullptr);
        auto chan = ch;
        post_self([chan](TcpPeerConnection&) { chan->mark_open(); });
    }
}

bool TcpPeerConnection::enqueue(MsgType type, u16 flags, std::vector<u8> payload,
                                std::shared_ptr<std::atomic<u64>> buffered) {
    if (closed_ || !stream_) return false;
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        LOG_ERROR("Channel message too large: " + std::to_string(payload.size()));
        return false;
    }
    if (buffered) *buffered += payload.size();
    {
        std::lock_guard<std::mutex> lk(stream_->mutex);
        stream_->queue.push_back(Outgoing{type, flags, std::move(payload), std::move(buffered)});
    }
    stream_->cv.notify_one();
    return true;
}

void TcpPeerConnection::on_frame(MsgType type, u16 flags, std::vector<u8> payload) {
    bool ours = (flags & CHANNEL_ID_PEER_BIT) != 0;
    u16  id   = (u16)(flags & ~CHANNEL_ID_PEER_BIT);
    auto& table = ours ? local_channels_ : remote_channels_;
    auto it = table.find(id);
    std::shared_ptr<TcpDataChannel> ch = it == table.end() ? nullptr : it->second;

    switch (type) {
        case MsgType::MT_CHANNEL_OPEN: {
            if (ours || ch) {
                LOG_WARN("Duplicate channel open for id " + std::to_string(id));
                return;
            }
            std::string label(payload.begin(), payload.end());
            auto chan = std::make_shared<TcpDataChannel>(weak_from_this(), label, id, false);
            remote_channels_[id] = chan;
            LOG_DEBUG("Inbound data channel: " + label);
            emit_data_channel(chan);
            chan->mark_open();
            return;
        }
        case MsgType::MT_CHANNEL_TEXT:
        case MsgType::MT_CHANNEL_BINARY: {
            if (!ch || ch->state() != ChannelState::OPEN) {
                LOG_DEBUG("Dropping message for channel " + std::to_string(id) + " (not open)");
                return;
            }
            ChannelMessage msg;
            msg.binary = (type == MsgType::MT_CHANNEL_BINARY);
            if (msg.binary) msg.data = std::move(payload);
            else            msg.text.assign(payload.begin(), payload.end());
            ch->deliver(msg);
            return;
        }
        case MsgType::MT_CHANNEL_CLOSE:
            if (ch) {
                table.erase(id);
                ch->mark_closed();
            }
            return;
        default:
            LOG_WARN("Unexpected stream frame type " + std::to_string((u16)type));
            return;
    }
}

void TcpPeerConnection::on_stream_lost(bool failed, const std::string& why) {
    if (!stream_) return;
    if (failed) LOG_WARN("Peer stream failed: " + why);
    else        LOG_INFO("Peer stream closed: " + why);
    stop_stream(false);

    auto local  = std::move(local_channels_);
    auto remote = std::move(remote_channels_);
    local_channels_.clear();
    remote_channels_.clear();
    for (auto& [id, ch] : local)  ch->mark_closed();
    for (auto& [id, ch] : remote) ch->mark_closed();

    set_connection_state(failed ? ConnectionState::FAILED : ConnectionState::DISCONNECTED);
}

void TcpPeerConnection::stop_stream(bool drain) {
    auto st = std::move(stream_);
    stream_.reset();
    if (!st) return;
    // A peer that stopped reading must not hold up teardown forever
    if (drain) st->sock->set_send_timeout_ms(PEER_DRAIN_TIMEOUT_MS);
    {
        std::lock_guard<std::mutex> lk(st->mutex);
        st->stopping = true;
        st->drain    = drain;
    }
    st->cv.notify_all();
    if (!drain) st->sock->shutdown();
    if (st->writer.joinable()) st->writer.join();
    st->sock->shutdown();
    if (st->reader.joinable()) st->reader.join();
}

// ---- Channels / teardown ----

std::shared_ptr<DataChannel> TcpPeerConnection::create_data_channel(const std::string& label) {
    if (closed_) throw TransportError("create_data_channel on a closed connection");
    u16 id = (u16)(next_channel_id_++ & ~CHANNEL_ID_PEER_BIT);
    auto ch = std::make_shared<TcpDataChannel>(weak_from_this(), label, id, true);
    local_channels_[id] = ch;
    if (stream_) {
        enqueue(MsgType::MT_CHANNEL_OPEN, ch->wire_flags(),
                std::vector<u8>(label.begin(), label.end()), nullptr);
        post_self([ch](TcpPeerConnection&) { ch->mark_open(); });
    }
    return ch;
}

void TcpPeerConnection::close() {
    if (closed_) return;

    // Tell the peer about open channels before the stream goes away
    for (auto* table : {&local_channels_, &remote_channels_}) {
        for (auto& [id, ch] : *table) {
            if (ch->state() == ChannelState::OPEN) {
                enqueue(MsgType::MT_CHANNEL_CLOSE, ch->wire_flags(), {}, nullptr);
            }
            ch->mark_closed_quietly();
        }
        table->clear();
    }

    closed_           = true;
    signaling_state_  = SignalingState::CLOSED;
    connection_state_ = ConnectionState::CLOSED;

    stop_listener();
    stop_stream(true);
    join_connect_thread();
}
