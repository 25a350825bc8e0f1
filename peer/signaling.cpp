// ============================================================
// signaling.cpp -- Relay envelope codec
// ============================================================

#include "signaling.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace proto {

std::string encode_envelope(const SignalingEnvelope& env) {
    json j;
    j["type"] = env.type;
    if (!env.payload.is_null()) j["payload"] = env.payload;
    if (!env.room_code.empty()) j["roomCode"] = env.room_code;
    if (env.sender_id) j["senderId"] = *env.sender_id;
    return j.dump();
}

SignalingEnvelope decode_envelope(const std::string& line) {
    json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error("envelope is not a JSON object");
    }
    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        throw std::runtime_error("envelope without type");
    }

    SignalingEnvelope env;
    env.type = type_it->get<std::string>();
    auto it = j.find("payload");
    if (it != j.end()) env.payload = *it;
    it = j.find("roomCode");
    if (it != j.end() && it->is_string()) env.room_code = it->get<std::string>();
    it = j.find("senderId");
    if (it != j.end() && it->is_number_unsigned()) env.sender_id = it->get<u64>();
    return env;
}

json description_to_json(const SessionDescription& desc) {
    return json{{"type", desc.type}, {"sdp", desc.sdp}};
}

SessionDescription description_from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("session description is not an object");
    auto t = j.find("type");
    auto s = j.find("sdp");
    if (t == j.end() || !t->is_string()) throw std::runtime_error("session description without type");
    SessionDescription desc;
    desc.type = t->get<std::string>();
    if (s != j.end() && s->is_string()) desc.sdp = s->get<std::string>();
    else if (desc.type != "rollback") throw std::runtime_error("session description without sdp");
    return desc;
}

json candidate_to_json(const IceCandidate& c) {
    return json{{"candidate", c.candidate}, {"sdpMid", c.sdp_mid}, {"sdpMLineIndex", c.sdp_mline_index}};
}

IceCandidate candidate_from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("candidate is not an object");
    IceCandidate c;
    auto it = j.find("candidate");
    if (it != j.end() && it->is_string()) c.candidate = it->get<std::string>();
    it = j.find("sdpMid");
    if (it != j.end() && it->is_string()) c.sdp_mid = it->get<std::string>();
    it = j.find("sdpMLineIndex");
    if (it != j.end() && it->is_number_integer()) c.sdp_mline_index = it->get<int>();
    return c;
}

} // namespace proto
