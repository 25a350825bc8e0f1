// ============================================================
// file_io.cpp -- File reading/writing helpers
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <fstream>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <algorithm>
#include <cctype>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#  include <cerrno>
#endif

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;

    if (size_ == 0) return;

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }

    data_ = static_cast<const u8*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;

    // Empty file: no mapping needed
    if (size_ == 0) return;

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const u8*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// AppendWriter
// ============================================================

AppendWriter::~AppendWriter() {
    close();
}

bool AppendWriter::is_open() const {
#ifdef _WIN32
    return file_handle_ != INVALID_HANDLE_VALUE;
#else
    return fd_ >= 0;
#endif
}

void AppendWriter::open(const std::string& file_path) {
    close();
    path_ = file_path;
    written_ = 0;
    ensure_parent_dirs(file_path);

#ifdef _WIN32
    file_handle_ = CreateFileA(file_path.c_str(), GENERIC_WRITE, 0, nullptr,
                               CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot create file: " + file_path);
    }
#else
    fd_ = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + std::strerror(errno));
    }
#endif
}

void AppendWriter::append(const void* data, size_t len) {
    if (!is_open()) {
        throw std::runtime_error("AppendWriter: file not open");
    }
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        DWORD n = 0;
        DWORD want = (DWORD)std::min(remaining, (size_t)(1u << 30));
        if (!WriteFile(file_handle_, p, want, &n, nullptr) || n == 0) {
            throw std::runtime_error("Write failed: " + path_);
        }
#else
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("Write failed: " + path_ + ": " + std::strerror(errno));
        }
        if (n == 0) {
            throw std::runtime_error("Short write: " + path_);
        }
#endif
        p += n;
        remaining -= (size_t)n;
        written_ += (u64)n;
    }
}

void AppendWriter::close() {
#ifdef _WIN32
    if (file_handle_ != INVALID_HANDLE_VALUE) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
    }
#else
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
}

// ============================================================
// Utility functions
// ============================================================

std::string file_io::safe_file_name(const std::string& name) {
    // Keep only the last path component (either separator)
    std::string base = name;
    size_t sep = base.find_last_of("/\\");
    if (sep != std::string::npos) base = base.substr(sep + 1);

    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        unsigned char uc = (unsigned char)c;
        if (uc < 0x20 || uc == 0x7f ||
            c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|') {
            out += '_';
        } else {
            out += c;
        }
    }

    // Trim surrounding spaces and dots (Windows drops them silently)
    size_t b = out.find_first_not_of(" .");
    if (b == std::string::npos) return "unnamed";
    size_t e = out.find_last_not_of(" ");
    out = out.substr(b, e - b + 1);
    return out.empty() ? "unnamed" : out;
}

fs::path file_io::unique_path(const fs::path& dir, const std::string& name,
                              const std::function<bool(const fs::path&)>& also_taken) {
    std::error_code ec;
    auto is_free = [&](const fs::path& p) {
        return !fs::exists(p, ec) && !(also_taken && also_taken(p));
    };
    fs::path candidate = dir / name;
    if (is_free(candidate)) return candidate;

    fs::path as_path(name);
    std::string stem = as_path.stem().string();
    std::string ext  = as_path.extension().string();
    for (int i = 1; i < 100000; ++i) {
        candidate = dir / (stem + " (" + std::to_string(i) + ")" + ext);
        if (is_free(candidate)) return candidate;
    }
    throw std::runtime_error("No free file name for " + name + " in " + dir.string());
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

std::string file_io::guess_mime_type(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    static const struct { const char* ext; const char* mime; } table[] = {
        {".txt",  "text/plain"},
        {".md",   "text/markdown"},
        {".html", "text/html"},
        {".css",  "text/css"},
        {".csv",  "text/csv"},
        {".json", "application/json"},
        {".pdf",  "application/pdf"},
        {".zip",  "application/zip"},
        {".gz",   "application/gzip"},
        {".png",  "image/png"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif",  "image/gif"},
        {".svg",  "image/svg+xml"},
        {".mp3",  "audio/mpeg"},
        {".mp4",  "video/mp4"},
    };
    for (const auto& e : table) {
        if (ext == e.ext) return e.mime;
    }
    return "";
}
