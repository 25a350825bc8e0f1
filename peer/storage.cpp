// ============================================================
// storage.cpp -- Directory save provider and blob registry
// ============================================================

#include "storage.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <system_error>

namespace {

// Streams into "<dest>.part"; finalize renames it to <dest>
class FileWriteTarget : public WriteTarget {
public:
    FileWriteTarget(fs::path dest, std::shared_ptr<std::set<std::string>> reserved)
        : dest_(std::move(dest))
        , part_(dest_.string() + ".part")
        , reserved_(std::move(reserved))
    {
        reserved_->insert(dest_.string());
        try {
            writer_.open(part_.string());
        } catch (const std::exception& e) {
            reserved_->erase(dest_.string());
            throw StorageError(e.what());
        }
    }

    ~FileWriteTarget() override {
        if (!done_) abort();
    }

    bool append(const u8* data, size_t len) override {
        if (done_ || failed_) return false;
        try {
            writer_.append(data, len);
            return true;
        } catch (const std::exception& e) {
            Logger::get().transfer_error(std::string("Write to ") + part_.string() + " failed: " + e.what());
            failed_ = true;
            return false;
        }
    }

    void finalize() override {
        if (done_) return;
        if (failed_) throw StorageError("Cannot finalize after a failed write: " + dest_.string());
        writer_.close();
        std::error_code ec;
        fs::rename(part_, dest_, ec);
        done_ = true;
        reserved_->erase(dest_.string());
        if (ec) {
            fs::remove(part_, ec);
            throw StorageError("Cannot move " + part_.string() + " into place: " + ec.message());
        }
        LOG_DEBUG("Saved " + dest_.string());
    }

    void abort() override {
        if (done_) return;
        done_ = true;
        writer_.close();
        std::error_code ec;
        fs::remove(part_, ec);
        reserved_->erase(dest_.string());
        LOG_DEBUG("Discarded partial file " + part_.string());
    }

    u64 written() const override { return writer_.written(); }
    std::string location() const override { return dest_.string(); }

private:
    fs::path                   dest_;
    fs::path                   part_;
    std::shared_ptr<std::set<std::string>> reserved_;
    file_io::AppendWriter      writer_;
    bool                       failed_{false};
    bool                       done_{false};
};

} // namespace

DirectorySaveProvider::DirectorySaveProvider(fs::path dir, bool streaming)
    : dir_(std::move(dir))
    , streaming_(streaming)
{}

std::unique_ptr<WriteTarget> DirectorySaveProvider::acquire_write_target(const std::string& suggested_name,
                                                                         const std::string& /*mime_type*/) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw StorageError("Cannot create directory " + dir_.string() + ": " + ec.message());

    std::string name = file_io::safe_file_name(suggested_name);
    auto reserved = reserved_;
    fs::path dest;
    try {
        dest = file_io::unique_path(dir_, name, [reserved](const fs::path& p) {
            return reserved->count(p.string()) > 0 || fs::exists(p.string() + ".part");
        });
    } catch (const std::runtime_error& e) {
        throw StorageError(e.what());
    }

    if (confirm_ && !confirm_(name, dest)) return nullptr;
    return std::make_unique<FileWriteTarget>(dest, reserved_);
}

// ---- BlobRegistry ----

std::string BlobRegistry::create(std::shared_ptr<const Blob> blob) {
    std::string handle;
    do {
        handle = "blob:peerdrop/" + utils::generate_token();
    } while (blobs_.count(handle));
    blobs_[handle] = std::move(blob);
    return handle;
}

std::shared_ptr<const Blob> BlobRegistry::resolve(const std::string& handle) const {
    auto it = blobs_.find(handle);
    return it == blobs_.end() ? nullptr : it->second;
}

bool BlobRegistry::revoke(const std::string& handle) {
    return blobs_.erase(handle) > 0;
}

void BlobRegistry::revoke_all() {
    blobs_.clear();
}
