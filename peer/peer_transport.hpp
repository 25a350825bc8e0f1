#pragma once

// ============================================================
// peer_transport.hpp -- Peer connection / data channel interfaces
//
// The negotiator drives a PeerConnection through offer/answer and
// candidate exchange; once connected, files move over a DataChannel.
// Implementations deliver every event on the Executor that owns the
// session, never on their own threads.
//
// Events are exposed as subscriptions: the returned Subscription
// unregisters the handler when destroyed.
// ============================================================

#include "../common/platform.hpp"
#include "../common/dispatcher.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

enum class SignalingState {
    STABLE,
    HAVE_LOCAL_OFFER,
    HAVE_REMOTE_OFFER,
    HAVE_LOCAL_PRANSWER,
    HAVE_REMOTE_PRANSWER,
    CLOSED,
};

enum class ConnectionState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED,
};

enum class ChannelState {
    CLOSED,
    OPENING,
    OPEN,
};

inline const char* signaling_state_name(SignalingState s) {
    switch (s) {
        case SignalingState::STABLE:               return "stable";
        case SignalingState::HAVE_LOCAL_OFFER:     return "have-local-offer";
        case SignalingState::HAVE_REMOTE_OFFER:    return "have-remote-offer";
        case SignalingState::HAVE_LOCAL_PRANSWER:  return "have-local-pranswer";
        case SignalingState::HAVE_REMOTE_PRANSWER: return "have-remote-pranswer";
        case SignalingState::CLOSED:               return "closed";
    }
    return "?";
}

inline const char* connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::NEW:          return "new";
        case ConnectionState::CONNECTING:   return "connecting";
        case ConnectionState::CONNECTED:    return "connected";
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::FAILED:       return "failed";
        case ConnectionState::CLOSED:       return "closed";
    }
    return "?";
}

inline const char* channel_state_name(ChannelState s) {
    switch (s) {
        case ChannelState::CLOSED:  return "closed";
        case ChannelState::OPENING: return "opening";
        case ChannelState::OPEN:    return "open";
    }
    return "?";
}

// {type: "offer" | "answer" | "rollback", sdp}
struct SessionDescription {
    std::string type;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;      // empty = end of candidates
    std::string sdp_mid;
    int         sdp_mline_index{0};
};

// ---- Errors ----

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Candidates may arrive before the offer/answer they belong to
class CandidateBeforeRemoteDescription : public TransportError {
public:
    CandidateBeforeRemoteDescription()
        : TransportError("Cannot add ICE candidate before setting remote description") {}
};

// ---- DataChannel ----

struct ChannelMessage {
    bool            binary{false};
    std::string     text;       // !binary
    std::vector<u8> data;       // binary
};

class DataChannel {
public:
    using OpenHandler    = std::function<void()>;
    using CloseHandler   = std::function<void()>;
    using MessageHandler = std::function<void(const ChannelMessage&)>;
    using ErrorHandler   = std::function<void(const std::string&)>;

    virtual ~DataChannel() = default;

    virtual const std::string& label() const = 0;
    virtual ChannelState state() const = 0;

    // false when the channel is not open
    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_binary(std::vector<u8> data) = 0;

    // Bytes accepted by send_* but not yet handed to the network
    virtual u64 buffered_amount() const = 0;

    virtual void close() = 0;

    Subscription subscribe_open(OpenHandler h)       { return open_.subscribe(0, std::move(h)); }
    Subscription subscribe_close(CloseHandler h)     { return close_.subscribe(0, std::move(h)); }
    Subscription subscribe_message(MessageHandler h) { return message_.subscribe(0, std::move(h)); }
    Subscription subscribe_error(ErrorHandler h)     { return error_.subscribe(0, std::move(h)); }

protected:
    void emit_open()                             { open_.dispatch(0); }
    void emit_close()                            { close_.dispatch(0); }
    void emit_message(const ChannelMessage& msg) { message_.dispatch(0, msg); }
    void emit_error(const std::string& what)     { error_.dispatch(0, what); }

private:
    Dispatcher<int>                        open_;
    Dispatcher<int>                        close_;
    Dispatcher<int, const ChannelMessage&> message_;
    Dispatcher<int, const std::string&>    error_;
};

// ---- PeerConnection ----

class PeerConnection {
public:
    using CandidateHandler   = std::function<void(const IceCandidate&)>;
    using StateHandler       = std::function<void(ConnectionState)>;
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;

    virtual ~PeerConnection() = default;

    // All of these throw TransportError when the call is not valid in the
    // current signaling state.
    virtual SessionDescription create_offer() = 0;
    virtual SessionDescription create_answer() = 0;
    virtual void set_local_description(const SessionDescription& desc) = 0;
    virtual void set_remote_description(const SessionDescription& desc) = 0;

    // Throws CandidateBeforeRemoteDescription if no remote description yet
    virtual void add_ice_candidate(const IceCandidate& candidate) = 0;

    virtual SignalingState signaling_state() const = 0;
    virtual ConnectionState connection_state() const = 0;

    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;

    // Idempotent; emits no further events
    virtual void close() = 0;

    Subscription subscribe_local_candidate(CandidateHandler h) { return candidate_.subscribe(0, std::move(h)); }
    Subscription subscribe_state_change(StateHandler h)        { return state_.subscribe(0, std::move(h)); }
    Subscription subscribe_data_channel(DataChannelHandler h)  { return channel_.subscribe(0, std::move(h)); }

protected:
    void emit_local_candidate(const IceCandidate& c)       { candidate_.dispatch(0, c); }
    void emit_state_change(ConnectionState s)              { state_.dispatch(0, s); }
    void emit_data_channel(std::shared_ptr<DataChannel> ch) { channel_.dispatch(0, std::move(ch)); }

private:
    Dispatcher<int, const IceCandidate&>          candidate_;
    Dispatcher<int, ConnectionState>              state_;
    Dispatcher<int, std::shared_ptr<DataChannel>> channel_;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;
    virtual std::shared_ptr<PeerConnection> create() = 0;
};
