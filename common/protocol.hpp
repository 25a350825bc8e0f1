#pragma once

// ============================================================
// protocol.hpp -- Wire protocol definitions for peerdrop
//
// Two wire layers live here:
//   1. The data-channel protocol: binary chunk frames
//      ([0..36) space-padded file id, [36..) payload) and JSON text
//      control messages {type, payload}.
//   2. The stream framing used by the direct TCP transport underneath
//      the data channel (8-byte big-endian frame header).
// ============================================================

#include "platform.hpp"
#include <cstring>
#include <string>
#include <vector>

// ---- Chunked transfer constants ----
static constexpr u32 CHUNK_SIZE          = 64u * 1024u;
static constexpr u32 FILE_ID_FIELD_LEN   = 36u;
// Sender defers while the channel holds more than this many chunks unsent
static constexpr u32 BACKPRESSURE_CHUNKS = 8u;
static constexpr u64 BACKPRESSURE_LIMIT  = (u64)CHUNK_SIZE * BACKPRESSURE_CHUNKS;
static constexpr u32 BACKPRESSURE_RETRY_MS = 100u;
static constexpr u32 NEXT_FILE_DELAY_MS    = 100u;

static constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

// ---- Control message types (JSON "type" field on the data channel) ----
enum class ControlType {
    FILE_METADATA,
    FILE_TRANSFER_COMPLETE,
    ALL_FILES_COMPLETE,
    FILE_TRANSFER_CANCEL,
    FILE_REQUEST,
    FILE_REQUEST_ACCEPTED,
    FILE_REQUEST_REJECTED,
    UNKNOWN,
};

inline const char* control_type_name(ControlType t) {
    switch (t) {
        case ControlType::FILE_METADATA:          return "file-metadata";
        case ControlType::FILE_TRANSFER_COMPLETE: return "file-transfer-complete";
        case ControlType::ALL_FILES_COMPLETE:     return "all-files-complete";
        case ControlType::FILE_TRANSFER_CANCEL:   return "file-transfer-cancel";
        case ControlType::FILE_REQUEST:           return "file-request";
        case ControlType::FILE_REQUEST_ACCEPTED:  return "file-request-accepted";
        case ControlType::FILE_REQUEST_REJECTED:  return "file-request-rejected";
        case ControlType::UNKNOWN:                break;
    }
    return "unknown";
}

inline ControlType control_type_from_name(const std::string& s) {
    static const ControlType all[] = {
        ControlType::FILE_METADATA, ControlType::FILE_TRANSFER_COMPLETE,
        ControlType::ALL_FILES_COMPLETE, ControlType::FILE_TRANSFER_CANCEL,
        ControlType::FILE_REQUEST, ControlType::FILE_REQUEST_ACCEPTED,
        ControlType::FILE_REQUEST_REJECTED,
    };
    for (ControlType t : all) {
        if (s == control_type_name(t)) return t;
    }
    return ControlType::UNKNOWN;
}

// ---- Data model carried by control messages ----

// Announced by the sender before the first chunk of a file
struct FileMetadata {
    std::string id;         // <= FILE_ID_FIELD_LEN bytes
    std::string name;
    u64         size{0};
    std::string mime_type;
};

// One entry of a file-request proposal
struct RequestedFile {
    std::string name;
    std::string mime_type;
    u64         size{0};
};

struct ControlMessage {
    ControlType  type{ControlType::UNKNOWN};
    std::string  raw_type;              // as received, for UNKNOWN
    FileMetadata metadata;              // FILE_METADATA
    std::string  file_id;               // FILE_TRANSFER_COMPLETE
    std::string  digest_hex;            // FILE_TRANSFER_COMPLETE, optional
    std::vector<RequestedFile> files;   // FILE_REQUEST
};

// ---- Direct TCP transport stream framing ----

static constexpr u32 MAX_FRAME_PAYLOAD = 16u * 1024u * 1024u;
static constexpr const char* TRANSPORT_SDP_VERSION = "peerdrop-tcp/1";

// All prefixed MT_ to avoid Windows macro collisions
enum class MsgType : u16 {
    MT_HELLO          = 0x0001,  // answerer -> offerer: session token
    MT_CHANNEL_OPEN   = 0x0010,  // payload: channel label
    MT_CHANNEL_TEXT   = 0x0011,
    MT_CHANNEL_BINARY = 0x0012,
    MT_CHANNEL_CLOSE  = 0x0013,
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");
