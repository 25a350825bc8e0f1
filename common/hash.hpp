#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for peerdrop
//
// Files are fingerprinted with XXH3-128 while they stream through
// the sender and the receiver; the digest travels as 32 lower-case
// hex characters in the file-transfer-complete control message.
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

// 16-byte (128-bit) hash result, big-endian
using Hash128 = std::array<u8, 16>;

inline Hash128 from_xxh128(XXH128_hash_t h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// Compute xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    return from_xxh128(XXH3_128bits(data, len));
}

// Streaming hasher for xxh3_128
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return from_xxh128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (u8 b : h) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

// Parse 32 hex chars; returns false on malformed input
inline bool from_hex(const std::string& s, Hash128& out) {
    if (s.size() != 32) return false;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (size_t i = 0; i < 16; ++i) {
        int hi = nibble(s[2 * i]);
        int lo = nibble(s[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = (u8)((hi << 4) | lo);
    }
    return true;
}

} // namespace hash
