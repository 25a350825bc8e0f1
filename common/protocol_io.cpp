// ============================================================
// protocol_io.cpp -- JSON control message codec
// ============================================================

#include "protocol_io.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

namespace {

u64 json_size(const json& j) {
    if (j.is_number_unsigned()) return j.get<u64>();
    if (j.is_number_integer()) {
        i64 v = j.get<i64>();
        return v < 0 ? 0 : (u64)v;
    }
    if (j.is_number_float()) {
        double d = j.get<double>();
        // NaN and negatives read as 0; anything past the u64 range saturates
        if (!(d > 0)) return 0;
        if (d >= 18446744073709551616.0) return std::numeric_limits<u64>::max();
        return (u64)d;
    }
    return 0;
}

std::string json_string(const json& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

RequestedFile decode_requested_file(const json& j) {
    RequestedFile f;
    if (!j.is_object()) return f;
    f.name      = json_string(j, "name");
    f.mime_type = json_string(j, "type");
    if (j.contains("size")) f.size = json_size(j["size"]);
    return f;
}

} // namespace

namespace proto {

std::string encode_control(const ControlMessage& msg) {
    json j;
    j["type"] = msg.type == ControlType::UNKNOWN ? msg.raw_type
                                                 : std::string(control_type_name(msg.type));
    switch (msg.type) {
        case ControlType::FILE_METADATA:
            j["payload"] = {
                {"id",   msg.metadata.id},
                {"name", msg.metadata.name},
                {"size", msg.metadata.size},
                {"type", msg.metadata.mime_type},
            };
            break;
        case ControlType::FILE_TRANSFER_COMPLETE: {
            json p = {{"fileId", msg.file_id}};
            if (!msg.digest_hex.empty()) p["xxh3"] = msg.digest_hex;
            j["payload"] = p;
            break;
        }
        case ControlType::FILE_REQUEST: {
            json arr = json::array();
            for (const auto& f : msg.files) {
                arr.push_back({{"name", f.name}, {"type", f.mime_type}, {"size", f.size}});
            }
            j["payload"] = {{"files", arr}};
            break;
        }
        default:
            break;
    }
    return j.dump();
}

ControlMessage decode_control(const std::string& text) {
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error("control message is not a JSON object");
    }
    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        throw std::runtime_error("control message without type");
    }

    ControlMessage msg;
    msg.raw_type = type_it->get<std::string>();
    msg.type     = control_type_from_name(msg.raw_type);

    const json payload = j.contains("payload") ? j["payload"] : json();

    switch (msg.type) {
        case ControlType::FILE_METADATA: {
            if (!payload.is_object()) {
                throw std::runtime_error("file-metadata without payload object");
            }
            msg.metadata.id        = json_string(payload, "id");
            msg.metadata.name      = json_string(payload, "name", "unnamed");
            msg.metadata.mime_type = json_string(payload, "type");
            if (payload.contains("size")) msg.metadata.size = json_size(payload["size"]);
            // Older senders may omit the id; chunks then cannot be matched,
            // but the file still shows up as pending.
            if (msg.metadata.id.empty()) msg.metadata.id = utils::generate_file_id();
            break;
        }
        case ControlType::FILE_TRANSFER_COMPLETE:
            if (payload.is_object()) {
                msg.file_id    = json_string(payload, "fileId");
                msg.digest_hex = json_string(payload, "xxh3");
            }
            break;
        case ControlType::FILE_REQUEST:
            // Accept both {files:[...]} and a bare array
            if (payload.is_array()) {
                for (const auto& f : payload) msg.files.push_back(decode_requested_file(f));
            } else if (payload.is_object() && payload.contains("files") &&
                       payload["files"].is_array()) {
                for (const auto& f : payload["files"]) msg.files.push_back(decode_requested_file(f));
            }
            break;
        default:
            break;
    }
    return msg;
}

ControlMessage make_metadata_msg(const FileMetadata& meta) {
    ControlMessage m;
    m.type = ControlType::FILE_METADATA;
    m.metadata = meta;
    return m;
}

ControlMessage make_complete_msg(const std::string& file_id, const std::string& digest_hex) {
    ControlMessage m;
    m.type = ControlType::FILE_TRANSFER_COMPLETE;
    m.file_id = file_id;
    m.digest_hex = digest_hex;
    return m;
}

ControlMessage make_simple_msg(ControlType type) {
    ControlMessage m;
    m.type = type;
    return m;
}

ControlMessage make_request_msg(const std::vector<RequestedFile>& files) {
    ControlMessage m;
    m.type = ControlType::FILE_REQUEST;
    m.files = files;
    return m;
}

} // namespace proto
