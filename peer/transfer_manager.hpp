#pragma once

// ============================================================
// transfer_manager.hpp -- Chunked file transfer over a data channel
//
// Sender: one file at a time.
//   file-metadata -> N x chunk (36-byte id + <=64 KiB) -> file-transfer-complete
//   -> short pause -> next file ... -> all-files-complete
// Before each chunk the channel's buffered amount is checked; above the
// backpressure limit the chunk is retried later instead of sent.
//
// Receiver: per file id the state is one of
//   metadata-known -> buffering -> streaming (after accept_and_save_file)
// Without streaming support, buffered chunks are assembled in memory at
// file-transfer-complete and exposed through a blob: handle.
//
// All methods run on the session executor.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/dispatcher.hpp"
#include "../common/event_loop.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/protocol.hpp"
#include "peer_transport.hpp"
#include "storage.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class TransferStatus {
    IDLE,
    SENDING,
    RECEIVING,
};

const char* transfer_status_name(TransferStatus s);

struct CompletedTransfer {
    std::string id;
    std::string file_name;
    u64         file_size{0};
    std::string mime_type;
    bool        saved_directly{false};
    std::string location;                 // saved_directly
    std::string download_handle;          // !saved_directly, see BlobRegistry
    std::shared_ptr<const Blob> blob;     // !saved_directly
    std::optional<bool> verified;         // unset when the sender sent no digest
};

// Sender side of one batch. Replaced for every batch.
struct TransferSession {
    struct Item {
        std::string  path;
        FileMetadata meta;
    };

    std::vector<Item> queue;
    int  current{-1};
    u64  total_bytes{0};
    u64  sent_bytes{0};
    bool cancelled{false};

    // File in flight
    std::unique_ptr<file_io::MmapReader> reader;
    u64                                  offset{0};
    hash::StreamHasher128                hasher;
};

class ChunkedTransfer {
public:
    using StatusHandler    = std::function<void(TransferStatus)>;
    using ProgressHandler  = std::function<void(int)>;
    using PendingHandler   = std::function<void(const FileMetadata&)>;
    using CompletedHandler = std::function<void(const CompletedTransfer&)>;
    using RequestHandler   = std::function<void(const std::vector<RequestedFile>&)>;
    using AnswerHandler    = std::function<void(bool accepted)>;
    using TextHandler      = std::function<void(const std::string&)>;
    using ErrorHandler     = std::function<void(const std::string&)>;

    ChunkedTransfer(Executor& exec, SaveLocationProvider& storage,
                    TransferOptions opts = TransferOptions());
    ~ChunkedTransfer();

    ChunkedTransfer(const ChunkedTransfer&) = delete;
    ChunkedTransfer& operator=(const ChunkedTransfer&) = delete;

    // Bind to an open channel; detach() drops it (state is kept)
    void attach(std::shared_ptr<DataChannel> channel);
    void detach();
    bool channel_open() const;

    // ---- Sending ----
    void send_files(const std::vector<std::string>& paths);
    bool send_text(const std::string& text);
    void cancel_transfer();

    // file-request workflow: propose, then send on acceptance
    bool request_send(const std::vector<std::string>& paths);
    bool accept_request();
    bool reject_request();

    // ---- Receiving ----
    // Must be called directly from the user's action: it may prompt.
    // file_id may refer into pending_save_files() or completed()
    bool accept_and_save_file(std::string file_id);
    bool save_received_file(std::string file_id);
    void clear_completed();

    // ---- State ----
    TransferStatus status() const { return status_; }
    int progress() const { return progress_; }
    const std::vector<FileMetadata>& pending_save_files() const { return pending_; }
    const std::vector<CompletedTransfer>& completed() const { return completed_; }
    const BlobRegistry& blobs() const { return blobs_; }
    const std::vector<RequestedFile>& incoming_request() const { return incoming_request_; }
    size_t discarded_count() const { return discarded_.size(); }

    // Most recent user-visible error; only clear_error() resets it
    const std::string& last_error() const { return last_error_; }
    void clear_error() { last_error_.clear(); }

    Subscription subscribe_status(StatusHandler h)       { return status_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_progress(ProgressHandler h)   { return progress_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_pending(PendingHandler h)     { return pending_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_completed(CompletedHandler h) { return completed_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_request(RequestHandler h)     { return request_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_answer(AnswerHandler h)       { return answer_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_text(TextHandler h)           { return text_ev_.subscribe(0, std::move(h)); }
    Subscription subscribe_error(ErrorHandler h)         { return error_ev_.subscribe(0, std::move(h)); }
    // Sender: all-files-complete sent. Receiver: all-files-complete received.
    Subscription subscribe_batch_done(std::function<void()> h) { return batch_done_ev_.subscribe(0, std::move(h)); }

private:
    // Receiver book-keeping for one file id
    struct IncomingFile {
        FileMetadata                   meta;
        bool                           placeholder{false};
        std::vector<std::vector<u8>>   chunks;      // buffering
        u64                            buffered_bytes{0};
        std::unique_ptr<WriteTarget>   target;      // streaming
        u64                            bytes_written{0};
        std::unique_ptr<hash::StreamHasher128> hasher{std::make_unique<hash::StreamHasher128>()};
    };

    Executor&             exec_;
    SaveLocationProvider& storage_;
    TransferOptions       opts_;
    std::shared_ptr<int>  life_{std::make_shared<int>(0)};

    std::shared_ptr<DataChannel> channel_;
    std::vector<Subscription>    channel_subs_;
    std::vector<Subscription>    control_subs_;

    TransferStatus status_{TransferStatus::IDLE};
    int            progress_{0};
    std::string    last_error_;

    // Sender
    std::shared_ptr<TransferSession> session_;
    std::vector<std::string>         proposed_paths_;

    // Receiver
    std::map<std::string, IncomingFile> incoming_;
    std::vector<FileMetadata>           pending_;
    std::set<std::string>               discarded_;   // late chunks are dropped
    bool                                all_files_announced_{false};
    std::vector<CompletedTransfer>      completed_;
    BlobRegistry                        blobs_;
    std::vector<RequestedFile>          incoming_request_;

    Dispatcher<ControlType, const ControlMessage&> control_;

    Dispatcher<int, TransferStatus>           status_ev_;
    Dispatcher<int, int>                      progress_ev_;
    Dispatcher<int, const FileMetadata&>      pending_ev_;
    Dispatcher<int, const CompletedTransfer&> completed_ev_;
    Dispatcher<int, const std::vector<RequestedFile>&> request_ev_;
    Dispatcher<int, bool>                     answer_ev_;
    Dispatcher<int, const std::string&>       text_ev_;
    Dispatcher<int, const std::string&>       error_ev_;
    Dispatcher<int>                           batch_done_ev_;

    void post_guarded(u32 delay_ms, Task task);

    void set_status(TransferStatus s);
    void set_progress(int p);
    void set_error(const std::string& msg);
    bool send_control(const ControlMessage& msg);

    // Sender
    void send_next_file(std::shared_ptr<TransferSession> s);
    void start_file(std::shared_ptr<TransferSession> s);
    void send_next_chunk(std::shared_ptr<TransferSession> s);
    void finish_file(std::shared_ptr<TransferSession> s);
    void abort_send(const std::string& why);
    void reset_sender();

    // Receiver
    void on_message(const ChannelMessage& msg);
    void on_text(const std::string& text);
    void on_chunk(const u8* frame, size_t len);
    void on_metadata(const ControlMessage& msg);
    void on_file_complete(const ControlMessage& msg);
    void on_all_files_complete(const ControlMessage& msg);
    void on_peer_cancel(const ControlMessage& msg);
    void on_request(const ControlMessage& msg);
    void on_request_answer(bool accepted);

    bool write_to_target(const std::string& id, IncomingFile& f, const u8* data, size_t len);
    void drop_stream(const std::string& id, IncomingFile& f);
    void assemble_in_memory(const std::string& id, IncomingFile& f, std::optional<bool> verified);
    std::optional<bool> check_digest(const IncomingFile& f, const std::string& digest_hex);
    void remove_pending(const std::string& id);
    void update_receive_progress();
    void maybe_finish_receiving();
    void reset_receiver();
};
