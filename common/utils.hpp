#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <random>
#include <mutex>
#include <cctype>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < 1024ULL * 1024) {
        ss << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Integer percentage, rounded to nearest; 0 when total is 0
inline int percent(u64 done, u64 total) {
    if (total == 0) return 0;
    return (int)(((double)done / (double)total) * 100.0 + 0.5);
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Shared PRNG for identifiers (not for anything security-relevant)
inline u64 random_u64() {
    static std::mutex mtx;
    static std::mt19937_64 rng([] {
        std::random_device rd;
        u64 seed = ((u64)rd() << 32) ^ (u64)rd();
        return seed ^ (u64)std::chrono::high_resolution_clock::now()
                          .time_since_epoch().count();
    }());
    std::lock_guard<std::mutex> lk(mtx);
    return rng();
}

inline std::string to_hex(u64 v, int width = 16) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(width) << v;
    return ss.str();
}

// Random token of 16 lower-case hex chars, never all zeros
inline std::string generate_token() {
    u64 t = random_u64();
    return to_hex(t == 0 ? 1 : t);
}

// "file-<ms>-<base36>": unique per transfer attempt, well under 36 bytes
inline std::string generate_file_id() {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    u64 r = random_u64();
    std::string suffix;
    for (int i = 0; i < 11; ++i) {
        suffix += digits[r % 36];
        r /= 36;
    }
    return "file-" + std::to_string(now_ms()) + "-" + suffix;
}

// ---- Room codes ----

// Similar-looking characters (0/O, 1/I) are excluded
static constexpr const char* ROOM_CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
static constexpr size_t      ROOM_CODE_LEN      = 6;

inline std::string generate_room_code() {
    std::string alphabet = ROOM_CODE_ALPHABET;
    std::string code;
    for (size_t i = 0; i < ROOM_CODE_LEN; ++i) {
        code += alphabet[(size_t)(random_u64() % alphabet.size())];
    }
    return code;
}

inline std::string normalize_room_code(const std::string& code) {
    std::string out;
    for (char c : code) {
        if (c == ' ' || c == '-') continue;
        out += (char)std::toupper((unsigned char)c);
    }
    return out;
}

inline bool validate_room_code(const std::string& code) {
    if (code.size() != ROOM_CODE_LEN) return false;
    std::string alphabet = ROOM_CODE_ALPHABET;
    for (char c : code) {
        if (alphabet.find(c) == std::string::npos) return false;
    }
    return true;
}

} // namespace utils
