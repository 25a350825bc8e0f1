// ============================================================
// transfer_manager.cpp -- ChunkedTransfer implementation
// ============================================================

#include "transfer_manager.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>

const char* transfer_status_name(TransferStatus s) {
    switch (s) {
        case TransferStatus::IDLE:      return "idle";
        case TransferStatus::SENDING:   return "sending";
        case TransferStatus::RECEIVING: return "receiving";
    }
    return "?";
}

ChunkedTransfer::ChunkedTransfer(Executor& exec, SaveLocationProvider& storage,
                                 TransferOptions opts)
    : exec_(exec)
    , storage_(storage)
    , opts_(opts)
{
    opts_.validate();

    control_subs_.push_back(control_.subscribe(ControlType::FILE_METADATA,
        [this](const ControlMessage& m) { on_metadata(m); }));
    control_subs_.push_back(control_.subscribe(ControlType::FILE_TRANSFER_COMPLETE,
        [this](const ControlMessage& m) { on_file_complete(m); }));
    control_subs_.push_back(control_.subscribe(ControlType::ALL_FILES_COMPLETE,
        [this](const ControlMessage& m) { on_all_files_complete(m); }));
    control_subs_.push_back(control_.subscribe(ControlType::FILE_TRANSFER_CANCEL,
        [this](const ControlMessage& m) { on_peer_cancel(m); }));
    control_subs_.push_back(control_.subscribe(ControlType::FILE_REQUEST,
        [this](const ControlMessage& m) { on_request(m); }));
    control_subs_.push_back(control_.subscribe(ControlType::FILE_REQUEST_ACCEPTED,
        [this](const ControlMessage&) { on_request_answer(true); }));
    control_subs_.push_back(control_.subscribe(ControlType::FILE_REQUEST_REJECTED,
        [this](const ControlMessage&) { on_request_answer(false); }));
}

ChunkedTransfer::~ChunkedTransfer() {
    life_.reset();
    channel_subs_.clear();
    for (auto& [id, f] : incoming_) {
        if (f.target) f.target->abort();
    }
}

void ChunkedTransfer::post_guarded(u32 delay_ms, Task task) {
    std::weak_ptr<int> life = life_;
    auto guarded = [life, task = std::move(task)] {
        if (!life.expired()) task();
    };
    if (delay_ms == 0) {
        exec_.post(std::move(guarded));
    } else {
        exec_.post_delayed(delay_ms, std::move(guarded));
    }
}

// ---- Channel binding ----

void ChunkedTransfer::attach(std::shared_ptr<DataChannel> channel) {
    channel_subs_.clear();
    channel_ = std::move(channel);
    if (!channel_) return;
    channel_subs_.push_back(channel_->subscribe_message(
        [this](const ChannelMessage& m) { on_message(m); }));
    LOG_DEBUG("Transfer bound to data channel " + channel_->label());
}

void ChunkedTransfer::detach() {
    channel_subs_.clear();
    channel_.reset();
}

bool ChunkedTransfer::channel_open() const {
    return channel_ && channel_->state() == ChannelState::OPEN;
}

// ---- Shared state ----

void ChunkedTransfer::set_status(TransferStatus s) {
    if (status_ == s) return;
    status_ = s;
    LOG_INFO(std::string("Transfer status: ") + transfer_status_name(s));
    status_ev_.dispatch(0, s);
}

void ChunkedTransfer::set_progress(int p) {
    if (progress_ == p) return;
    progress_ = p;
    progress_ev_.dispatch(0, p);
}

void ChunkedTransfer::set_error(const std::string& msg) {
    LOG_ERROR(msg);
    last_error_ = msg;
    error_ev_.dispatch(0, msg);
}

bool ChunkedTransfer::send_control(const ControlMessage& msg) {
    if (!channel_open()) return false;
    return channel_->send_text(proto::encode_control(msg));
}

bool ChunkedTransfer::send_text(const std::string& text) {
    if (channel_open() && channel_->send_text(text)) {
        LOG_INFO("Sent text: " + text);
        return true;
    }
    set_error("Cannot send message. Data channel not open.");
    return false;
}

// ============================================================
// Sender
// ============================================================

void ChunkedTransfer::send_files(const std::vector<std::string>& paths) {
    if (paths.empty()) return;
    if (status_ != TransferStatus::IDLE) {
        LOG_WARN("Another transfer is already in progress.");
        return;
    }
    if (!channel_open()) {
        set_error("Cannot send files. Data channel not open.");
        return;
    }

    auto s = std::make_shared<TransferSession>();
    for (const auto& path : paths) {
        TransferSession::Item item;
        item.path           = path;
        item.meta.id        = utils::generate_file_id();
        item.meta.name      = fs::path(path).filename().string();
        item.meta.size      = file_io::get_file_size(path);
        item.meta.mime_type = file_io::guess_mime_type(path);
        s->total_bytes += item.meta.size;
        s->queue.push_back(std::move(item));
    }
    session_ = s;
    set_progress(0);
    set_status(TransferStatus::SENDING);
    LOG_INFO("Sending " + std::to_string(s->queue.size()) + " file(s), " +
             utils::format_bytes(s->total_bytes));
    send_next_file(s);
}

void ChunkedTransfer::send_next_file(std::shared_ptr<TransferSession> s) {
    if (s->cancelled || s != session_) return;

    if (s->current + 1 >= (int)s->queue.size()) {
        send_control(proto::make_simple_msg(ControlType::ALL_FILES_COMPLETE));
        LOG_INFO("All files have been sent.");
        session_.reset();
        set_status(TransferStatus::IDLE);
        batch_done_ev_.dispatch(0);
        return;
    }
    ++s->current;
    start_file(s);
}

void ChunkedTransfer::start_file(std::shared_ptr<TransferSession> s) {
    if (!channel_open()) {
        abort_send("Cannot send file. Data channel not open.");
        return;
    }
    auto& item = s->queue[(size_t)s->current];

    try {
        s->reader = std::make_unique<file_io::MmapReader>(item.path);
    } catch (const std::exception& e) {
        Logger::get().transfer_error("Cannot read file " + item.path + ": " + e.what());
        abort_send("Error reading file " + item.meta.name + ": " + e.what());
        return;
    }
    // The file may have changed since the batch was built
    if (s->reader->size() != item.meta.size) {
        s->total_bytes = s->total_bytes - item.meta.size + s->reader->size();
        item.meta.size = s->reader->size();
    }
    s->offset = 0;
    s->hasher.reset();

    LOG_INFO("Sending file: " + item.meta.name + " (" + utils::format_bytes(item.meta.size) + ")");
    if (!send_control(proto::make_metadata_msg(item.meta))) {
        abort_send("Cannot send file metadata. Data channel not open.");
        return;
    }
    if (item.meta.size == 0) {
        finish_file(s);
        return;
    }
    post_guarded(0, [this, s] { send_next_chunk(s); });
}

void ChunkedTransfer::send_next_chunk(std::shared_ptr<TransferSession> s) {
    if (s->cancelled || s != session_) return;
    if (!channel_open()) {
        abort_send("Error during file send: data channel closed.");
        return;
    }

    // Backpressure: let the channel drain before queueing more
    if (channel_->buffered_amount() > opts_.backpressure_limit) {
        LOG_DEBUG("Channel buffer full (" + std::to_string(channel_->buffered_amount()) +
                  " bytes), retrying in " + std::to_string(opts_.backpressure_retry_ms) + " ms");
        post_guarded(opts_.backpressure_retry_ms, [this, s] { send_next_chunk(s); });
        return;
    }

    const auto& item = s->queue[(size_t)s->current];
    const u8* window = s->reader->window_ptr(s->offset);
    u64 len          = s->reader->window_len(s->offset, opts_.chunk_size);
    if (!window || len == 0) {
        finish_file(s);
        return;
    }

    s->hasher.update(window, (size_t)len);
    if (!channel_->send_binary(proto::encode_chunk(item.meta.id, window, (size_t)len))) {
        abort_send("Error sending file chunk: data channel refused the write.");
        return;
    }
    // A handler reached from send_binary may have cancelled the batch
    if (s->cancelled || s != session_) return;

    s->offset     += len;
    s->sent_bytes += len;
    LOG_DEBUG("Sent chunk of " + item.meta.name + " at offset " + std::to_string(s->offset - len) +
              " (" + std::to_string(len) + " bytes)");
    if (s->total_bytes > 0) set_progress(utils::percent(s->sent_bytes, s->total_bytes));

    if (s->offset < s->reader->size()) {
        post_guarded(0, [this, s] { send_next_chunk(s); });
    } else {
        finish_file(s);
    }
}

void ChunkedTransfer::finish_file(std::shared_ptr<TransferSession> s) {
    const auto& item = s->queue[(size_t)s->current];
    s->reader.reset();

    std::string digest = hash::to_hex(s->hasher.digest());
    if (!send_control(proto::make_complete_msg(item.meta.id, digest))) {
        abort_send("Cannot send completion for " + item.meta.name + ". Data channel not open.");
        return;
    }
    LOG_INFO("Finished sending \"" + item.meta.name + "\" (xxh3 " + digest + ")");
    if (s->total_bytes > 0) set_progress(utils::percent(s->sent_bytes, s->total_bytes));

    post_guarded(opts_.next_file_delay_ms, [this, s] { send_next_file(s); });
}

void ChunkedTransfer::abort_send(const std::string& why) {
    set_error(why);
    reset_sender();
    if (status_ == TransferStatus::SENDING) set_status(TransferStatus::IDLE);
}

void ChunkedTransfer::reset_sender() {
    if (session_) {
        session_->cancelled = true;
        session_->reader.reset();
        session_.reset();
        LOG_INFO("Sender state reset");
    }
    set_progress(0);
}

void ChunkedTransfer::cancel_transfer() {
    if (status_ == TransferStatus::IDLE) {
        LOG_WARN("No transfer in progress to cancel.");
        return;
    }
    LOG_WARN("Transfer cancellation requested...");

    TransferStatus before = status_;
    set_status(TransferStatus::IDLE);
    if (before == TransferStatus::SENDING) {
        reset_sender();
    } else {
        reset_receiver();
    }

    if (send_control(proto::make_simple_msg(ControlType::FILE_TRANSFER_CANCEL))) {
        LOG_INFO("Cancellation notification sent to peer.");
    } else {
        LOG_WARN("Failed to send cancellation notification (peer likely disconnected).");
    }
}

// ---- file-request workflow ----

bool ChunkedTransfer::request_send(const std::vector<std::string>& paths) {
    if (paths.empty()) return false;
    if (!channel_open()) {
        set_error("Cannot send file request. Data channel not open.");
        return false;
    }
    std::vector<RequestedFile> files;
    for (const auto& path : paths) {
        RequestedFile f;
        f.name      = fs::path(path).filename().string();
        f.mime_type = file_io::guess_mime_type(path);
        f.size      = file_io::get_file_size(path);
        files.push_back(f);
    }
    if (!send_control(proto::make_request_msg(files))) {
        set_error("Cannot send file request. Data channel not open.");
        return false;
    }
    proposed_paths_ = paths;
    LOG_INFO("File request sent for " + std::to_string(files.size()) + " file(s)");
    return true;
}

bool ChunkedTransfer::accept_request() {
    incoming_request_.clear();
    return send_control(proto::make_simple_msg(ControlType::FILE_REQUEST_ACCEPTED));
}

bool ChunkedTransfer::reject_request() {
    incoming_request_.clear();
    return send_control(proto::make_simple_msg(ControlType::FILE_REQUEST_REJECTED));
}

void ChunkedTransfer::on_request(const ControlMessage& msg) {
    incoming_request_ = msg.files;
    u64 total = 0;
    for (const auto& f : msg.files) total += f.size;
    LOG_INFO("Peer proposes " + std::to_string(msg.files.size()) + " file(s), " +
             utils::format_bytes(total));
    // Handlers may answer right away, which clears incoming_request_
    request_ev_.dispatch(0, msg.files);
}

void ChunkedTransfer::on_request_answer(bool accepted) {
    std::vector<std::string> paths;
    paths.swap(proposed_paths_);
    if (accepted) {
        LOG_INFO("File request accepted by the receiver");
        answer_ev_.dispatch(0, true);
        if (paths.empty()) {
            LOG_WARN("File request accepted but nothing was proposed");
            return;
        }
        send_files(paths);
    } else {
        set_error("File transfer request was rejected by the receiver");
        answer_ev_.dispatch(0, false);
    }
}

// ============================================================
// Receiver
// ============================================================

void ChunkedTransfer::on_message(const ChannelMessage& msg) {
    if (msg.binary) {
        on_chunk(msg.data.data(), msg.data.size());
    } else {
        on_text(msg.text);
    }
}

void ChunkedTransfer::on_text(const std::string& text) {
    ControlMessage msg;
    try {
        msg = proto::decode_control(text);
    } catch (const std::runtime_error&) {
        LOG_INFO("Received plain text: " + text);
        text_ev_.dispatch(0, text);
        return;
    }
    if (msg.type == ControlType::UNKNOWN) {
        LOG_INFO("Received text: " + text);
        text_ev_.dispatch(0, text);
        return;
    }
    LOG_DEBUG(std::string("Control message: ") + control_type_name(msg.type));
    control_.dispatch(msg.type, msg);
}

void ChunkedTransfer::on_chunk(const u8* frame, size_t len) {
    auto chunk = proto::decode_chunk(frame, len);
    if (!chunk) {
        LOG_WARN("Received invalid file chunk: too small (" + std::to_string(len) + " bytes)");
        return;
    }
    const std::string& id = chunk->file_id;
    if (discarded_.count(id)) {
        LOG_DEBUG("Dropping chunk for discarded file " + id);
        return;
    }

    auto it = incoming_.find(id);
    if (it == incoming_.end()) {
        LOG_INFO("Received chunk for file ID: " + id + " before metadata, storing temporarily");
        IncomingFile f;
        f.meta.id        = id;
        f.meta.name      = "pending-" + id;
        f.meta.mime_type = DEFAULT_MIME_TYPE;
        f.placeholder    = true;
        it = incoming_.emplace(id, std::move(f)).first;
    }
    IncomingFile& f = it->second;
    f.hasher->update(chunk->data, chunk->len);

    if (f.target) {
        write_to_target(id, f, chunk->data, chunk->len);
        return;
    }
    f.chunks.emplace_back(chunk->data, chunk->data + chunk->len);
    f.buffered_bytes += chunk->len;
}

void ChunkedTransfer::on_metadata(const ControlMessage& msg) {
    const FileMetadata& meta = msg.metadata;
    LOG_INFO("Receiving metadata: " + meta.name + " (" + utils::format_bytes(meta.size) + ")");
    // A new batch: everything sent before it has already arrived
    if (status_ == TransferStatus::IDLE) discarded_.clear();
    discarded_.erase(meta.id);

    IncomingFile& f = incoming_[meta.id];
    f.meta        = meta;
    f.placeholder = false;
    if (f.meta.mime_type.empty()) f.meta.mime_type = DEFAULT_MIME_TYPE;

    if (!f.target) {
        auto pit = std::find_if(pending_.begin(), pending_.end(),
                                [&](const FileMetadata& p) { return p.id == meta.id; });
        if (pit != pending_.end()) {
            *pit = f.meta;
        } else {
            pending_.push_back(f.meta);
        }
    }
    if (status_ == TransferStatus::IDLE) {
        all_files_announced_ = false;
        set_status(TransferStatus::RECEIVING);
    }
    if (!f.target) pending_ev_.dispatch(0, f.meta);
}

bool ChunkedTransfer::accept_and_save_file(std::string file_id) {
    auto pit = std::find_if(pending_.begin(), pending_.end(),
                            [&](const FileMetadata& p) { return p.id == file_id; });
    if (pit == pending_.end()) {
        LOG_WARN("Cannot find pending file info for ID: " + file_id);
        return false;
    }
    FileMetadata meta = *pit;

    if (!storage_.supports_streaming()) {
        LOG_WARN("Streaming save not supported; " + meta.name +
                 " will be assembled in memory when complete");
        remove_pending(file_id);
        maybe_finish_receiving();
        return true;
    }

    std::unique_ptr<WriteTarget> target;
    try {
        target = storage_.acquire_write_target(meta.name, meta.mime_type);
    } catch (const StorageError& e) {
        set_error("Failed to save file " + meta.name + ": " + e.what());
        return false;
    }
    if (!target) {
        LOG_WARN("Save cancelled by user for " + meta.name);
        return false;
    }

    IncomingFile& f = incoming_[file_id];
    if (f.meta.id.empty()) f.meta = meta;
    f.target = std::move(target);
    LOG_DEBUG("Stream created for " + meta.name + " -> " + f.target->location());
    remove_pending(file_id);

    // Chunks that arrived before the target existed go first, in order
    std::vector<std::vector<u8>> stored;
    stored.swap(f.chunks);
    f.buffered_bytes = 0;
    if (!stored.empty()) {
        LOG_DEBUG("Writing " + std::to_string(stored.size()) + " stored chunks for " + meta.name);
    }
    for (const auto& chunk : stored) {
        if (!write_to_target(file_id, f, chunk.data(), chunk.size())) {
            set_error("Failed writing stored chunk for " + meta.name + ". Aborting stream.");
            return false;
        }
    }
    update_receive_progress();
    return true;
}

bool ChunkedTransfer::write_to_target(const std::string& id, IncomingFile& f,
                                      const u8* data, size_t len) {
    if (!f.target->append(data, len)) {
        set_error("Error writing chunk to file " + f.meta.name);
        drop_stream(id, f);
        return false;
    }
    f.bytes_written += len;
    update_receive_progress();
    return true;
}

// Abort the target and forget the file; its remaining chunks are dropped
void ChunkedTransfer::drop_stream(const std::string& id, IncomingFile& f) {
    if (f.target) f.target->abort();
    discarded_.insert(id);
    incoming_.erase(id);
    maybe_finish_receiving();
}

void ChunkedTransfer::update_receive_progress() {
    u64 total = 0, written = 0;
    for (const auto& [id, f] : incoming_) {
        if (!f.target) continue;
        total   += f.meta.size;
        written += f.bytes_written;
    }
    if (total > 0) set_progress(std::min(100, utils::percent(written, total)));
}

std::optional<bool> ChunkedTransfer::check_digest(const IncomingFile& f, const std::string& digest_hex) {
    if (digest_hex.empty()) return std::nullopt;
    hash::Hash128 expected;
    if (!hash::from_hex(digest_hex, expected)) {
        LOG_WARN("Ignoring malformed digest for " + f.meta.name);
        return std::nullopt;
    }
    if (f.hasher->digest() == expected) return true;
    LOG_WARN("Digest mismatch for " + f.meta.name + ": expected " + digest_hex +
             ", got " + hash::to_hex(f.hasher->digest()));
    set_error("Checksum mismatch for " + f.meta.name + "; the file may be corrupted");
    return false;
}

void ChunkedTransfer::on_file_complete(const ControlMessage& msg) {
    const std::string& id = msg.file_id;
    if (id.empty()) {
        LOG_WARN("Received file completion message without file ID");
        return;
    }
    auto it = incoming_.find(id);
    if (it == incoming_.end() || discarded_.count(id)) {
        LOG_WARN("Transfer complete for unknown file ID: " + id);
        return;
    }
    IncomingFile& f = it->second;
    std::optional<bool> verified = check_digest(f, msg.digest_hex);

    if (f.target) {
        try {
            f.target->finalize();
        } catch (const StorageError& e) {
            set_error("Error closing stream for " + f.meta.name + ": " + e.what());
            drop_stream(id, f);
            return;
        }
        CompletedTransfer rec;
        rec.id             = id;
        rec.file_name      = f.meta.name;
        rec.file_size      = f.bytes_written;
        rec.mime_type      = f.meta.mime_type;
        rec.saved_directly = true;
        rec.location       = f.target->location();
        rec.verified       = verified;
        LOG_INFO("File \"" + rec.file_name + "\" saved successfully to " + rec.location);
        incoming_.erase(it);
        completed_.push_back(rec);
        completed_ev_.dispatch(0, completed_.back());
        update_receive_progress();
    } else if (f.placeholder) {
        LOG_WARN("Transfer complete for file ID " + id + " whose metadata never arrived");
        incoming_.erase(it);
    } else {
        LOG_INFO("Transfer complete (fallback) for file: " + f.meta.name);
        assemble_in_memory(id, f, verified);
    }
    maybe_finish_receiving();
}

void ChunkedTransfer::assemble_in_memory(const std::string& id, IncomingFile& f,
                                         std::optional<bool> verified) {
    FileMetadata meta = f.meta;
    auto blob = std::make_shared<Blob>();
    blob->mime_type = meta.mime_type;
    blob->data.reserve((size_t)f.buffered_bytes);
    for (const auto& chunk : f.chunks) {
        blob->data.insert(blob->data.end(), chunk.begin(), chunk.end());
    }
    incoming_.erase(id);
    remove_pending(id);

    if (blob->data.empty()) {
        LOG_WARN("Reconstructed file " + meta.name + " is empty (0 bytes). Skipping.");
        return;
    }
    if (meta.size > 0 && blob->data.size() != meta.size) {
        LOG_WARN("Reconstructed size (" + std::to_string(blob->data.size()) +
                 ") differs from metadata size (" + std::to_string(meta.size) +
                 ") for " + meta.name);
    }

    CompletedTransfer rec;
    rec.id              = id;
    rec.file_name       = meta.name;
    rec.file_size       = blob->data.size();
    rec.mime_type       = meta.mime_type;
    rec.saved_directly  = false;
    rec.blob            = blob;
    rec.download_handle = blobs_.create(blob);
    rec.verified        = verified;
    LOG_INFO("File \"" + meta.name + "\" received (fallback). Ready to save: " + rec.download_handle);
    completed_.push_back(rec);
    completed_ev_.dispatch(0, completed_.back());
}

void ChunkedTransfer::remove_pending(const std::string& id) {
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const FileMetadata& p) { return p.id == id; }),
                   pending_.end());
}

void ChunkedTransfer::on_all_files_complete(const ControlMessage&) {
    LOG_INFO("Sender indicated all files sent.");
    all_files_announced_ = true;
    maybe_finish_receiving();
    if (status_ == TransferStatus::RECEIVING) {
        LOG_INFO("Waiting for receiver to finish saving files...");
    }
    batch_done_ev_.dispatch(0);
}

// Idle once the sender is done and nothing is bound or awaiting a decision
void ChunkedTransfer::maybe_finish_receiving() {
    if (status_ != TransferStatus::RECEIVING || !all_files_announced_) return;
    if (!pending_.empty()) return;
    for (const auto& [id, f] : incoming_) {
        if (f.target) return;
    }
    all_files_announced_ = false;
    discarded_.clear();
    set_status(TransferStatus::IDLE);
}

void ChunkedTransfer::on_peer_cancel(const ControlMessage&) {
    LOG_WARN("Peer cancelled the transfer.");
    reset_receiver();
    reset_sender();
    set_status(TransferStatus::IDLE);
}

void ChunkedTransfer::reset_receiver() {
    LOG_INFO("Resetting receiver state...");
    for (auto& [id, f] : incoming_) {
        if (f.target) {
            f.target->abort();
            LOG_INFO("Closed file stream for " + f.meta.name);
        }
        discarded_.insert(id);
    }
    incoming_.clear();
    pending_.clear();
    all_files_announced_ = false;
    set_progress(0);
}

// ---- Completed results ----

bool ChunkedTransfer::save_received_file(std::string file_id) {
    auto it = std::find_if(completed_.begin(), completed_.end(),
                           [&](const CompletedTransfer& c) { return c.id == file_id; });
    if (it == completed_.end() || it->saved_directly || !it->blob) {
        LOG_WARN("No in-memory file to save for ID: " + file_id);
        return false;
    }

    std::unique_ptr<WriteTarget> target;
    try {
        target = storage_.acquire_write_target(it->file_name, it->mime_type);
    } catch (const StorageError& e) {
        set_error("Error saving file: " + std::string(e.what()));
        return false;
    }
    if (!target) {
        LOG_WARN("File save cancelled by user.");
        return false;
    }

    const auto& data = it->blob->data;
    if (!target->append(data.data(), data.size())) {
        target->abort();
        set_error("Error saving file: write to " + target->location() + " failed");
        return false;
    }
    try {
        target->finalize();
    } catch (const StorageError& e) {
        set_error("Error saving file: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("File \"" + it->file_name + "\" saved successfully to " + target->location());
    blobs_.revoke(it->download_handle);
    completed_.erase(it);
    return true;
}

void ChunkedTransfer::clear_completed() {
    for (const auto& c : completed_) {
        if (!c.download_handle.empty()) blobs_.revoke(c.download_handle);
    }
    completed_.clear();
    LOG_INFO("Cleared completed transfer list.");
}
