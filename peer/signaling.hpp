#pragma once

// ============================================================
// signaling.hpp -- Relay envelopes and the signaling interface
//
// Wire form (one JSON object per line):
//   {"type": "...", "payload": ..., "roomCode": "...", "senderId": N}
// payload, roomCode and senderId are optional.
// ============================================================

#include "../common/platform.hpp"
#include "../common/dispatcher.hpp"
#include "peer_transport.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>

namespace sigtype {
// Negotiation traffic relayed between the two peers
static constexpr const char* OFFER             = "offer";
static constexpr const char* ANSWER            = "answer";
static constexpr const char* CANDIDATE         = "candidate";
// Relay -> peer
static constexpr const char* PEER_CONNECTED    = "peer-connected";
static constexpr const char* PEER_DISCONNECTED = "peer-disconnected";
static constexpr const char* YOUR_ID           = "your-id";
static constexpr const char* ERROR_MSG         = "error";
// Peer -> relay
static constexpr const char* JOIN_ROOM         = "join-room";
static constexpr const char* LEAVE_ROOM        = "leave-room";
// Local events raised by the relay client itself, never on the wire
static constexpr const char* OPEN              = "open";
static constexpr const char* CLOSE             = "close";
static constexpr const char* MAX_RECONNECT_FAILED = "max-reconnect-failed";
// Subscribes to every inbound envelope
static constexpr const char* ANY               = "*";
}

struct SignalingEnvelope {
    std::string        type;
    nlohmann::json     payload;     // null when absent
    std::string        room_code;   // empty when absent
    std::optional<u64> sender_id;
};

using SignalingHandler = std::function<void(const SignalingEnvelope&)>;

class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;

    // false when the relay is not reachable right now
    virtual bool send(const SignalingEnvelope& env) = 0;

    virtual Subscription subscribe(const std::string& type, SignalingHandler handler) = 0;
};

namespace proto {

std::string encode_envelope(const SignalingEnvelope& env);

// Throws std::runtime_error unless 'line' is a JSON object with a string type
SignalingEnvelope decode_envelope(const std::string& line);

nlohmann::json description_to_json(const SessionDescription& desc);
// Throws std::runtime_error on a payload without type/sdp strings
SessionDescription description_from_json(const nlohmann::json& j);

nlohmann::json candidate_to_json(const IceCandidate& c);
// Missing fields decode as empty; non-objects throw std::runtime_error
IceCandidate candidate_from_json(const nlohmann::json& j);

} // namespace proto
