#pragma once

// ============================================================
// file_io.hpp -- File reading/writing helpers
//
//   MmapReader   : whole-file read-only mapping, read in windows
//   AppendWriter : sequential writer used by streaming save targets
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const u8* data() const { return data_; }
    u64 size() const { return size_; }

    // Pointer to the window starting at 'offset', nullptr past the end
    const u8* window_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    // Window length, clamped to the bytes left after 'offset'
    u64 window_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const u8* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- AppendWriter: create/truncate, then append sequentially ----
class AppendWriter {
public:
    AppendWriter() = default;
    ~AppendWriter();

    AppendWriter(const AppendWriter&) = delete;
    AppendWriter& operator=(const AppendWriter&) = delete;

    // Throws std::runtime_error if the file cannot be created
    void open(const std::string& path);

    // Throws std::runtime_error on a short or failed write
    void append(const void* data, size_t len);

    void close();

    bool is_open() const;
    u64 written() const { return written_; }
    const std::string& path() const { return path_; }

private:
#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
#else
    int fd_{-1};
#endif
    std::string path_;
    u64 written_{0};
};

// ---- Utility functions ----

// Reduce an untrusted (peer-supplied) name to a single safe path
// component: directory parts dropped, control and reserved characters
// replaced by '_'. Never returns an empty name, "." or "..".
std::string safe_file_name(const std::string& name);

// dir/name if free, otherwise dir/"stem (1).ext", dir/"stem (2).ext", ...
// 'also_taken' marks paths that are reserved without existing yet.
fs::path unique_path(const fs::path& dir, const std::string& name,
                     const std::function<bool(const fs::path&)>& also_taken = nullptr);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Best-effort MIME type from the file extension
std::string guess_mime_type(const std::string& path);

} // namespace file_io
