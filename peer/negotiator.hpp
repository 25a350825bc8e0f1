#pragma once

// ============================================================
// negotiator.hpp -- Session negotiation state machine
//
// Brings up exactly one peer data channel per session from relay
// traffic (peer-connected / offer / answer / candidate /
// peer-disconnected).
//
//   idle -> connecting -> negotiating -> connected
//        -> failed | disconnected | closed -> idle (on reset)
//
// Glare: when both sides hold a local offer, the initiator keeps its
// own and ignores the incoming one; the responder rolls back and
// answers. offer_sent guards against a second outstanding offer and is
// reset only by initialize(), teardown(), accepting an offer, a failed
// offer attempt, or the connection dropping.
//
// Runs entirely on the session executor; every event source posts there.
// ============================================================

#include "../common/platform.hpp"
#include "../common/dispatcher.hpp"
#include "peer_transport.hpp"
#include "signaling.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

static constexpr const char* DATA_CHANNEL_LABEL = "fileTransferChannel";

enum class PeerRole {
    UNKNOWN,
    INITIATOR,
    RESPONDER,
};

enum class NegotiationPhase {
    IDLE,           // no peer connection
    CONNECTING,     // connection exists, nothing exchanged yet
    NEGOTIATING,    // offer/answer in flight
    CONNECTED,
    FAILED,
    DISCONNECTED,
    CLOSED,
};

const char* peer_role_name(PeerRole r);
const char* negotiation_phase_name(NegotiationPhase p);

// One peer-connection attempt. Owned by the Negotiator; replaced on
// initialize() and reset on teardown.
struct Session {
    PeerRole        role{PeerRole::UNKNOWN};
    ConnectionState connection_state{ConnectionState::NEW};
    ChannelState    channel_state{ChannelState::CLOSED};
    bool            offer_sent{false};
    bool            auto_offer_fired{false};   // per connection instance
    bool            peer_connected{false};

    std::shared_ptr<PeerConnection> connection;
    std::shared_ptr<DataChannel>    channel;

    std::vector<Subscription> connection_subs;
    std::vector<Subscription> channel_subs;
};

class Negotiator {
public:
    using ChannelHandler   = std::function<void(std::shared_ptr<DataChannel>)>;
    using ClosedHandler    = std::function<void()>;
    using ConnectedHandler = std::function<void(bool)>;

    Negotiator(SignalingChannel& signaling, PeerConnectionFactory& factory);
    ~Negotiator();

    Negotiator(const Negotiator&) = delete;
    Negotiator& operator=(const Negotiator&) = delete;

    // Subscribe to relay traffic
    void start();

    // Close any current connection and build a fresh one for the current role
    void initialize();

    void create_offer();
    void handle_offer(const SessionDescription& offer);
    void handle_answer(const SessionDescription& answer);
    void handle_candidate(const IceCandidate& candidate);

    // Drop connection and channel, role back to unknown
    void teardown(const std::string& reason);

    // Role assignment from the relay (peer-connected)
    void assign_role(bool is_initiator);

    const Session& session() const { return session_; }
    NegotiationPhase phase() const;
    bool is_peer_connected() const { return session_.peer_connected; }
    std::shared_ptr<DataChannel> channel() const { return session_.channel; }

    // Channel became usable / went away
    Subscription subscribe_channel_open(ChannelHandler h)  { return channel_open_.subscribe(0, std::move(h)); }
    Subscription subscribe_channel_closed(ClosedHandler h) { return channel_closed_.subscribe(0, std::move(h)); }
    Subscription subscribe_connected(ConnectedHandler h)   { return connected_.subscribe(0, std::move(h)); }

private:
    SignalingChannel&      signaling_;
    PeerConnectionFactory& factory_;
    Session                session_;
    std::vector<Subscription> relay_subs_;

    Dispatcher<int, std::shared_ptr<DataChannel>> channel_open_;
    Dispatcher<int>                               channel_closed_;
    Dispatcher<int, bool>                         connected_;

    void close_connection();
    void attach_channel(std::shared_ptr<DataChannel> ch);
    void maybe_auto_offer();
    void on_connection_state(ConnectionState s);
    void set_peer_connected(bool connected);
    void on_relay_lost();
    bool send_signal(const char* type, nlohmann::json payload);
};
