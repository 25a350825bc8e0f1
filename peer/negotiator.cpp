// ============================================================
// negotiator.cpp -- Session negotiation state machine
// ============================================================

#include "negotiator.hpp"
#include "../common/logger.hpp"
#include <stdexcept>
#include <string>

using json = nlohmann::json;

const char* peer_role_name(PeerRole r) {
    switch (r) {
        case PeerRole::UNKNOWN:   return "unknown";
        case PeerRole::INITIATOR: return "initiator";
        case PeerRole::RESPONDER: return "responder";
    }
    return "?";
}

const char* negotiation_phase_name(NegotiationPhase p) {
    switch (p) {
        case NegotiationPhase::IDLE:         return "idle";
        case NegotiationPhase::CONNECTING:   return "connecting";
        case NegotiationPhase::NEGOTIATING:  return "negotiating";
        case NegotiationPhase::CONNECTED:    return "connected";
        case NegotiationPhase::FAILED:       return "failed";
        case NegotiationPhase::DISCONNECTED: return "disconnected";
        case NegotiationPhase::CLOSED:       return "closed";
    }
    return "?";
}

Negotiator::Negotiator(SignalingChannel& signaling, PeerConnectionFactory& factory)
    : signaling_(signaling)
    , factory_(factory)
{}

Negotiator::~Negotiator() {
    relay_subs_.clear();
    close_connection();
}

void Negotiator::start() {
    relay_subs_.clear();

    relay_subs_.push_back(signaling_.subscribe(sigtype::PEER_CONNECTED,
        [this](const SignalingEnvelope& env) {
            if (!env.payload.is_object() || !env.payload.contains("isInitiator") ||
                !env.payload["isInitiator"].is_boolean()) {
                LOG_WARN("peer-connected without isInitiator flag");
                return;
            }
            assign_role(env.payload["isInitiator"].get<bool>());
        }));

    relay_subs_.push_back(signaling_.subscribe(sigtype::OFFER,
        [this](const SignalingEnvelope& env) {
            try {
                handle_offer(proto::description_from_json(env.payload));
            } catch (const std::runtime_error& e) {
                LOG_WARN(std::string("Malformed offer: ") + e.what());
            }
        }));

    relay_subs_.push_back(signaling_.subscribe(sigtype::ANSWER,
        [this](const SignalingEnvelope& env) {
            try {
                handle_answer(proto::description_from_json(env.payload));
            } catch (const std::runtime_error& e) {
                LOG_WARN(std::string("Malformed answer: ") + e.what());
            }
        }));

    relay_subs_.push_back(signaling_.subscribe(sigtype::CANDIDATE,
        [this](const SignalingEnvelope& env) {
            try {
                handle_candidate(proto::candidate_from_json(env.payload));
            } catch (const std::runtime_error& e) {
                LOG_WARN(std::string("Malformed candidate: ") + e.what());
            }
        }));

    relay_subs_.push_back(signaling_.subscribe(sigtype::PEER_DISCONNECTED,
        [this](const SignalingEnvelope&) {
            teardown("peer disconnected");
        }));

    relay_subs_.push_back(signaling_.subscribe(sigtype::CLOSE,
        [this](const SignalingEnvelope&) {
            on_relay_lost();
        }));
}

void Negotiator::assign_role(bool is_initiator) {
    session_.role = is_initiator ? PeerRole::INITIATOR : PeerRole::RESPONDER;
    LOG_INFO(std::string("Peer connected; role: ") + peer_role_name(session_.role));
    initialize();
    maybe_auto_offer();
}

// ---- Connection lifecycle ----

void Negotiator::close_connection() {
    // Unregister first: a closing connection must not reach this session
    session_.connection_subs.clear();
    session_.channel_subs.clear();
    if (session_.connection) {
        session_.connection->close();
        LOG_DEBUG("Closed existing peer connection");
    }
    session_.connection.reset();
    session_.channel.reset();
}

void Negotiator::initialize() {
    bool had_channel = session_.channel_state == ChannelState::OPEN;
    close_connection();

    session_.offer_sent       = false;
    session_.auto_offer_fired = false;
    session_.connection_state = ConnectionState::NEW;
    session_.channel_state    = ChannelState::CLOSED;
    if (had_channel) channel_closed_.dispatch(0);
    set_peer_connected(false);

    LOG_INFO("Initializing peer connection");
    auto conn = factory_.create();
    session_.connection = conn;

    session_.connection_subs.push_back(conn->subscribe_local_candidate(
        [this](const IceCandidate& c) {
            LOG_DEBUG("Local candidate, relaying to peer");
            send_signal(sigtype::CANDIDATE, proto::candidate_to_json(c));
        }));
    session_.connection_subs.push_back(conn->subscribe_state_change(
        [this](ConnectionState s) { on_connection_state(s); }));
    session_.connection_subs.push_back(conn->subscribe_data_channel(
        [this](std::shared_ptr<DataChannel> ch) {
            LOG_INFO("Data channel received: " + ch->label());
            attach_channel(std::move(ch));
        }));

    if (session_.role == PeerRole::INITIATOR) {
        LOG_DEBUG("Initiator creating data channel");
        try {
            attach_channel(conn->create_data_channel(DATA_CHANNEL_LABEL));
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Cannot create data channel: ") + e.what());
        }
    }
}

void Negotiator::attach_channel(std::shared_ptr<DataChannel> ch) {
    session_.channel_subs.clear();
    session_.channel       = ch;
    session_.channel_state = ch->state();

    session_.channel_subs.push_back(ch->subscribe_open([this] {
        LOG_INFO("Data channel open");
        session_.channel_state = ChannelState::OPEN;
        set_peer_connected(true);
        channel_open_.dispatch(0, session_.channel);
    }));
    session_.channel_subs.push_back(ch->subscribe_close([this] {
        LOG_INFO("Data channel closed");
        session_.channel_state = ChannelState::CLOSED;
        set_peer_connected(false);
        channel_closed_.dispatch(0);
    }));
    session_.channel_subs.push_back(ch->subscribe_error([](const std::string& what) {
        LOG_ERROR("Data channel error: " + what);
    }));
}

void Negotiator::maybe_auto_offer() {
    auto& s = session_;
    if (s.role != PeerRole::INITIATOR || !s.connection || s.offer_sent || s.auto_offer_fired) return;
    if (s.connection->signaling_state() != SignalingState::STABLE) {
        LOG_DEBUG(std::string("Initiator ready but connection not stable (") +
                  signaling_state_name(s.connection->signaling_state()) + ")");
        return;
    }
    s.auto_offer_fired = true;
    LOG_INFO("Initiator ready, creating initial offer");
    create_offer();
}

void Negotiator::teardown(const std::string& reason) {
    LOG_INFO("Tearing down peer session: " + reason);
    bool had_channel = session_.channel_state == ChannelState::OPEN;
    close_connection();
    session_.role             = PeerRole::UNKNOWN;
    session_.offer_sent       = false;
    session_.auto_offer_fired = false;
    session_.connection_state = ConnectionState::NEW;
    session_.channel_state    = ChannelState::CLOSED;
    if (had_channel) channel_closed_.dispatch(0);
    set_peer_connected(false);
}

void Negotiator::on_relay_lost() {
    if (!session_.connection) return;
    // An established channel does not depend on the relay any more
    if (session_.channel_state == ChannelState::OPEN) {
        LOG_INFO("Relay lost; keeping the established peer channel");
        return;
    }
    teardown("relay connection lost during negotiation");
}

// ---- Offer / answer / candidate ----

void Negotiator::create_offer() {
    auto& s = session_;
    if (!s.connection || s.role != PeerRole::INITIATOR || s.offer_sent) {
        LOG_DEBUG("Skipping offer creation (no connection, not initiator, or offer already sent)");
        return;
    }
    auto conn = s.connection;

    if (!s.channel) {
        LOG_DEBUG("Creating data channel before offer");
        try {
            attach_channel(conn->create_data_channel(DATA_CHANNEL_LABEL));
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Cannot create data channel: ") + e.what());
            return;
        }
    }

    if (conn->signaling_state() != SignalingState::STABLE) {
        LOG_WARN(std::string("Attempted to create offer in non-stable state: ") +
                 signaling_state_name(conn->signaling_state()));
        return;
    }

    try {
        SessionDescription offer = conn->create_offer();
        conn->set_local_description(offer);
        s.offer_sent = true;
        LOG_INFO("Offer created, sending to peer");
        if (!send_signal(sigtype::OFFER, proto::description_to_json(offer))) {
            LOG_ERROR("Could not relay offer; rolling back");
            conn->set_local_description(SessionDescription{"rollback", ""});
            s.offer_sent = false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error creating offer: ") + e.what());
        s.offer_sent = false;
    }
}

void Negotiator::handle_offer(const SessionDescription& offer) {
    if (!session_.connection) {
        LOG_INFO("Received offer but no peer connection, initializing");
        initialize();
    }
    auto conn = session_.connection;

    SignalingState state = conn->signaling_state();
    if (state == SignalingState::HAVE_REMOTE_OFFER || state == SignalingState::HAVE_LOCAL_PRANSWER) {
        LOG_INFO("Already have a remote offer; ignoring duplicate offer");
        return;
    }
    if (state != SignalingState::STABLE && state != SignalingState::HAVE_LOCAL_OFFER) {
        LOG_INFO(std::string("Cannot handle offer in state ") + signaling_state_name(state));
        return;
    }

    if (state == SignalingState::HAVE_LOCAL_OFFER) {
        if (session_.role == PeerRole::INITIATOR) {
            LOG_INFO("Glare: keeping our own offer as initiator, ignoring incoming offer");
            return;
        }
        try {
            LOG_INFO("Glare: rolling back local offer to accept the incoming one");
            conn->set_local_description(SessionDescription{"rollback", ""});
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Error rolling back local description: ") + e.what());
            return;
        }
    }

    try {
        conn->set_remote_description(offer);
        SessionDescription answer = conn->create_answer();
        conn->set_local_description(answer);
        LOG_INFO("Answer created, sending to peer");
        send_signal(sigtype::ANSWER, proto::description_to_json(answer));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error handling offer: ") + e.what());
    }
    // Answering voids any offer intent of ours
    session_.offer_sent = false;
}

void Negotiator::handle_answer(const SessionDescription& answer) {
    auto conn = session_.connection;
    if (!conn || session_.role != PeerRole::INITIATOR) {
        LOG_DEBUG("Skipping answer (no connection or not initiator)");
        return;
    }
    SignalingState state = conn->signaling_state();
    if (state != SignalingState::HAVE_LOCAL_OFFER) {
        LOG_INFO(std::string("Cannot handle answer in state ") + signaling_state_name(state));
        return;
    }
    try {
        conn->set_remote_description(answer);
        LOG_INFO("Remote answer applied");
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error handling answer: ") + e.what());
    }
}

void Negotiator::handle_candidate(const IceCandidate& candidate) {
    auto conn = session_.connection;
    if (!conn) return;
    if (candidate.candidate.empty()) {
        LOG_DEBUG("Empty candidate, skipping");
        return;
    }
    try {
        conn->add_ice_candidate(candidate);
        LOG_DEBUG("Remote candidate added");
    } catch (const CandidateBeforeRemoteDescription&) {
        // Expected race: the candidate overtook its description
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error adding remote candidate: ") + e.what());
    }
}

// ---- State tracking ----

void Negotiator::on_connection_state(ConnectionState s) {
    session_.connection_state = s;
    LOG_INFO(std::string("Peer connection state: ") + connection_state_name(s));
    if (s == ConnectionState::CONNECTED) {
        set_peer_connected(true);
    } else if (s == ConnectionState::FAILED || s == ConnectionState::DISCONNECTED ||
               s == ConnectionState::CLOSED) {
        set_peer_connected(false);
        session_.offer_sent = false;
    }
}

void Negotiator::set_peer_connected(bool connected) {
    if (session_.peer_connected == connected) return;
    session_.peer_connected = connected;
    connected_.dispatch(0, connected);
}

NegotiationPhase Negotiator::phase() const {
    const auto& s = session_;
    if (!s.connection) return NegotiationPhase::IDLE;
    switch (s.connection_state) {
        case ConnectionState::CONNECTED:    return NegotiationPhase::CONNECTED;
        case ConnectionState::FAILED:       return NegotiationPhase::FAILED;
        case ConnectionState::DISCONNECTED: return NegotiationPhase::DISCONNECTED;
        case ConnectionState::CLOSED:       return NegotiationPhase::CLOSED;
        default: break;
    }
    if (s.connection->signaling_state() != SignalingState::STABLE || s.offer_sent ||
        s.connection_state == ConnectionState::CONNECTING) {
        return NegotiationPhase::NEGOTIATING;
    }
    return NegotiationPhase::CONNECTING;
}

bool Negotiator::send_signal(const char* type, json payload) {
    SignalingEnvelope env;
    env.type    = type;
    env.payload = std::move(payload);
    return signaling_.send(env);
}
