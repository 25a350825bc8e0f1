#pragma once

// ============================================================
// storage.hpp -- Where received files end up
//
//   WriteTarget          : incremental destination for one file
//   SaveLocationProvider : picks a destination (the "save prompt")
//   DirectorySaveProvider: <dir>/<name>.part, renamed on finalize
//   BlobRegistry         : in-memory results behind blob: handles
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class WriteTarget {
public:
    virtual ~WriteTarget() = default;

    // false on a failed write; the target is then unusable
    virtual bool append(const u8* data, size_t len) = 0;

    // Throws StorageError if the file cannot be committed
    virtual void finalize() = 0;

    // Best-effort discard of everything written so far
    virtual void abort() = 0;

    virtual u64 written() const = 0;
    virtual std::string location() const = 0;
};

class SaveLocationProvider {
public:
    virtual ~SaveLocationProvider() = default;

    // Without incremental writes, received files are assembled in memory
    virtual bool supports_streaming() const = 0;

    // nullptr when the user declines the save.
    // Throws StorageError when the destination cannot be opened.
    virtual std::unique_ptr<WriteTarget> acquire_write_target(const std::string& suggested_name,
                                                              const std::string& mime_type) = 0;
};

// Asked once per save with the chosen destination; false = user cancelled
using SaveConfirm = std::function<bool(const std::string& name, const fs::path& dest)>;

class DirectorySaveProvider : public SaveLocationProvider {
public:
    explicit DirectorySaveProvider(fs::path dir, bool streaming = true);

    void set_confirm(SaveConfirm confirm) { confirm_ = std::move(confirm); }

    bool supports_streaming() const override { return streaming_; }

    std::unique_ptr<WriteTarget> acquire_write_target(const std::string& suggested_name,
                                                      const std::string& mime_type) override;

    const fs::path& dir() const { return dir_; }

private:
    fs::path    dir_;
    bool        streaming_;
    SaveConfirm confirm_;
    // Destinations handed out but not yet finalized or aborted
    std::shared_ptr<std::set<std::string>> reserved_{std::make_shared<std::set<std::string>>()};
};

// ---- In-memory results ----

struct Blob {
    std::vector<u8> data;
    std::string     mime_type;
};

class BlobRegistry {
public:
    // Returns "blob:peerdrop/<16 hex>"
    std::string create(std::shared_ptr<const Blob> blob);

    // nullptr for unknown or revoked handles
    std::shared_ptr<const Blob> resolve(const std::string& handle) const;

    bool revoke(const std::string& handle);
    void revoke_all();

    size_t size() const { return blobs_.size(); }

private:
    std::map<std::string, std::shared_ptr<const Blob>> blobs_;
};
