#pragma once

// ============================================================
// config.hpp -- Runtime configuration for peerdrop programs
//
// Filled from the command line in peer/main.cpp and relay/main.cpp.
// validate() throws std::invalid_argument naming the bad field.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <algorithm>

static constexpr u16 DEFAULT_RELAY_PORT = 8080;
static constexpr const char* DEFAULT_ADVERTISE_HOST = "127.0.0.1";

// Relay reconnect: delay = min(base * 2^attempt, cap), at most max_attempts
struct ReconnectPolicy {
    u32 max_attempts{5};
    u32 base_delay_ms{1000};
    u32 max_delay_ms{10000};

    u32 delay_for(u32 attempt) const {
        u64 d = base_delay_ms;
        for (u32 i = 0; i < attempt && d < max_delay_ms; ++i) d *= 2;
        return (u32)std::min<u64>(d, max_delay_ms);
    }

    void validate() const {
        if (base_delay_ms == 0) throw std::invalid_argument("reconnect.base_delay_ms must be > 0");
        if (max_delay_ms < base_delay_ms) {
            throw std::invalid_argument("reconnect.max_delay_ms must be >= base_delay_ms");
        }
    }
};

// Sender pacing
struct TransferOptions {
    u32 chunk_size{CHUNK_SIZE};
    u64 backpressure_limit{BACKPRESSURE_LIMIT};
    u32 backpressure_retry_ms{BACKPRESSURE_RETRY_MS};
    u32 next_file_delay_ms{NEXT_FILE_DELAY_MS};

    void validate() const {
        if (chunk_size == 0 || chunk_size > CHUNK_SIZE) {
            throw std::invalid_argument("transfer.chunk_size must be 1-" + std::to_string(CHUNK_SIZE));
        }
        if (backpressure_limit < chunk_size) {
            throw std::invalid_argument("transfer.backpressure_limit must be >= chunk_size");
        }
    }
};

enum class PeerMode { SEND, RECEIVE };

struct PeerConfig {
    PeerMode    mode{PeerMode::SEND};
    std::string relay_host;
    u16         relay_port{DEFAULT_RELAY_PORT};
    std::string room_code;                 // empty in send mode = generate
    std::vector<std::string> files;        // send mode
    std::string dst_dir;                   // receive mode
    std::string advertise_host{DEFAULT_ADVERTISE_HOST};
    bool        auto_accept{false};        // --yes
    bool        streaming{true};           // --no-stream clears it
    bool        verbose{false};
    std::string log_file;

    ReconnectPolicy reconnect;
    TransferOptions transfer;

    void validate() const {
        if (relay_host.empty()) throw std::invalid_argument("relay_host is empty");
        if (relay_port == 0) throw std::invalid_argument("relay_port must be 1-65535");
        if (advertise_host.empty()) throw std::invalid_argument("advertise_host is empty");
        if (!room_code.empty() && !utils::validate_room_code(utils::normalize_room_code(room_code))) {
            throw std::invalid_argument("room_code must be " + std::to_string(utils::ROOM_CODE_LEN) +
                                        " characters from " + utils::ROOM_CODE_ALPHABET);
        }
        if (mode == PeerMode::SEND) {
            if (files.empty()) throw std::invalid_argument("files: nothing to send");
            for (const auto& f : files) {
                if (!utils::validate_path(f)) throw std::invalid_argument("files: invalid path");
            }
        } else {
            if (room_code.empty()) throw std::invalid_argument("room_code is required to receive");
            if (!utils::validate_path(dst_dir)) throw std::invalid_argument("dst_dir is invalid");
        }
        reconnect.validate();
        transfer.validate();
    }
};

struct RelayConfig {
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{DEFAULT_RELAY_PORT};   // 0 binds an ephemeral port
    bool        verbose{false};
    std::string log_file;

    void validate() const {
        if (listen_ip != "0.0.0.0" && !utils::validate_ip(listen_ip)) {
            throw std::invalid_argument("listen_ip is not an IPv4 address: " + listen_ip);
        }
    }
};
