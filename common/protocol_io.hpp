#pragma once

// ============================================================
// protocol_io.hpp -- Frame and chunk encode/decode
//
//   Stream frames: 8-byte header, big-endian (TCP transport)
//   Chunk frames : 36-byte space-padded file id + payload
//   Control msgs : JSON {type, payload} (see protocol_io.cpp)
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <string>
#include <optional>
#include <stdexcept>

// Linux: htobe16/32 and be16/32toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Chunk framing ----

// Left-justify and space-pad to exactly FILE_ID_FIELD_LEN bytes.
// Throws std::invalid_argument if the id does not fit.
inline std::string pad_file_id(const std::string& id) {
    if (id.size() > FILE_ID_FIELD_LEN) {
        throw std::invalid_argument("file id longer than " +
                                    std::to_string(FILE_ID_FIELD_LEN) + " bytes: " + id);
    }
    std::string out = id;
    out.resize(FILE_ID_FIELD_LEN, ' ');
    return out;
}

// Strip surrounding whitespace from a decoded id field
inline std::string trim_file_id(const std::string& field) {
    const char* ws = " \t\r\n";
    size_t b = field.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = field.find_last_not_of(ws);
    return field.substr(b, e - b + 1);
}

// Build one chunk frame: padded id followed by the payload bytes
inline std::vector<u8> encode_chunk(const std::string& file_id, const u8* data, size_t len) {
    std::string field = pad_file_id(file_id);
    std::vector<u8> frame(FILE_ID_FIELD_LEN + len);
    std::memcpy(frame.data(), field.data(), FILE_ID_FIELD_LEN);
    if (len > 0) std::memcpy(frame.data() + FILE_ID_FIELD_LEN, data, len);
    return frame;
}

// Points into the frame it was decoded from
struct ChunkView {
    std::string file_id;
    const u8*   data{nullptr};
    size_t      len{0};
};

// A frame of FILE_ID_FIELD_LEN bytes or fewer cannot carry a chunk;
// neither can a blank id field. Both decode to nullopt.
inline std::optional<ChunkView> decode_chunk(const u8* frame, size_t len) {
    if (len <= FILE_ID_FIELD_LEN) return std::nullopt;
    ChunkView v;
    v.file_id = trim_file_id(std::string(reinterpret_cast<const char*>(frame),
                                         FILE_ID_FIELD_LEN));
    if (v.file_id.empty()) return std::nullopt;
    v.data = frame + FILE_ID_FIELD_LEN;
    v.len  = len - FILE_ID_FIELD_LEN;
    return v;
}

// ---- Control messages (JSON text frames) ----

std::string encode_control(const ControlMessage& msg);

// Throws std::runtime_error if the text is not a JSON object with a
// string "type"; unknown types decode as ControlType::UNKNOWN.
ControlMessage decode_control(const std::string& text);

// Convenience builders
ControlMessage make_metadata_msg(const FileMetadata& meta);
ControlMessage make_complete_msg(const std::string& file_id, const std::string& digest_hex);
ControlMessage make_simple_msg(ControlType type);
ControlMessage make_request_msg(const std::vector<RequestedFile>& files);

} // namespace proto
