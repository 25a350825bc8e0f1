#pragma once

// ============================================================
// fakes.hpp -- In-process stand-ins for the executor, transport,
// signaling and storage seams
//
//   ManualExecutor     : virtual clock, runs tasks only when asked
//   FakeDataChannel    : scriptable buffered amount; linked pairs
//                        deliver through the executor
//   FakePeerConnection : signaling-state machine without sockets
//   FakeSignaling      : records sent envelopes, delivers on demand
//   MemorySaveProvider : write targets backed by byte vectors
// ============================================================

#include "../common/platform.hpp"
#include "../common/event_loop.hpp"
#include "../common/logger.hpp"
#include "../peer/peer_transport.hpp"
#include "../peer/signaling.hpp"
#include "../peer/storage.hpp"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace testing_fakes {

// ---- ManualExecutor ----

class ManualExecutor : public Executor {
public:
    void post(Task task) override { tasks_.push_back(Entry{now_, seq_++, std::move(task)}); }

    void post_delayed(u32 delay_ms, Task task) override {
        tasks_.push_back(Entry{now_ + delay_ms, seq_++, std::move(task)});
    }

    // Run every task due at the current virtual time, including tasks
    // those tasks post. Returns the number run.
    size_t run_ready() {
        size_t n = 0;
        while (run_one(now_)) ++n;
        return n;
    }

    // Move the clock forward step by step, running what falls due
    size_t advance(u64 ms) {
        size_t n = run_ready();
        u64 end = now_ + ms;
        for (;;) {
            u64 next = next_due();
            if (next == NONE || next > end) break;
            now_ = next;
            n += run_ready();
        }
        now_ = end;
        return n + run_ready();
    }

    // Run until nothing is queued; the clock jumps to each deadline.
    // Stops after max_tasks so a task that keeps rescheduling cannot hang a test.
    size_t run_all(size_t max_tasks = 100000) {
        size_t n = 0;
        while (n < max_tasks) {
            u64 next = next_due();
            if (next == NONE) break;
            if (next > now_) now_ = next;
            if (run_one(now_)) ++n;
        }
        return n;
    }

    u64 now() const { return now_; }
    size_t pending() const { return tasks_.size(); }

private:
    static constexpr u64 NONE = ~(u64)0;

    struct Entry {
        u64  due;
        u64  seq;
        Task task;
    };

    u64 next_due() const {
        u64 best = NONE;
        for (const auto& e : tasks_) best = std::min(best, e.due);
        return best;
    }

    bool run_one(u64 now) {
        auto best = tasks_.end();
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->due > now) continue;
            if (best == tasks_.end() || it->due < best->due ||
                (it->due == best->due && it->seq < best->seq)) {
                best = it;
            }
        }
        if (best == tasks_.end()) return false;
        Task t = std::move(best->task);
        tasks_.erase(best);
        t();
        return true;
    }

    std::vector<Entry> tasks_;
    u64 now_{0};
    u64 seq_{0};
};

// ---- FakeDataChannel ----

class FakeDataChannel : public DataChannel {
public:
    explicit FakeDataChannel(Executor& exec, std::string label = "fileTransferChannel")
        : exec_(exec), label_(std::move(label)) {}

    const std::string& label() const override { return label_; }
    ChannelState state() const override { return state_; }

    bool send_text(const std::string& text) override {
        ChannelMessage m;
        m.text = text;
        return record(std::move(m));
    }

    bool send_binary(std::vector<u8> data) override {
        ChannelMessage m;
        m.binary = true;
        m.data   = std::move(data);
        return record(std::move(m));
    }

    u64 buffered_amount() const override { return buffered; }

    void close() override {
        if (state_ == ChannelState::CLOSED) return;
        state_ = ChannelState::CLOSED;
        emit_close();
    }

    void open() {
        state_ = ChannelState::OPEN;
        emit_open();
    }

    // Deliver a message to whoever listens on this channel, right now
    void inject(const ChannelMessage& msg) { emit_message(msg); }
    void inject_text(const std::string& text) {
        ChannelMessage m;
        m.text = text;
        emit_message(m);
    }
    void inject_binary(std::vector<u8> data) {
        ChannelMessage m;
        m.binary = true;
        m.data   = std::move(data);
        emit_message(m);
    }
    void fail(const std::string& what) { emit_error(what); }

    // Messages sent on one side arrive on the other via the executor
    static void link(const std::shared_ptr<FakeDataChannel>& a,
                     const std::shared_ptr<FakeDataChannel>& b) {
        a->peer_ = b;
        b->peer_ = a;
    }

    std::vector<ChannelMessage> sent;
    u64  buffered{0};
    bool refuse_sends{false};
    // Called after a message is recorded (and queued for the peer)
    std::function<void(const ChannelMessage&)> on_send;

    std::vector<std::string> sent_texts() const {
        std::vector<std::string> out;
        for (const auto& m : sent) {
            if (!m.binary) out.push_back(m.text);
        }
        return out;
    }

    size_t binary_count() const {
        return (size_t)std::count_if(sent.begin(), sent.end(),
                                     [](const ChannelMessage& m) { return m.binary; });
    }

private:
    bool record(ChannelMessage m) {
        if (state_ != ChannelState::OPEN || refuse_sends) return false;
        sent.push_back(m);
        if (auto peer = peer_.lock()) {
            std::weak_ptr<FakeDataChannel> weak = peer;
            exec_.post([weak, m] {
                if (auto p = weak.lock()) {
                    if (p->state_ == ChannelState::OPEN) p->emit_message(m);
                }
            });
        }
        if (on_send) on_send(m);
        return true;
    }

    Executor&                      exec_;
    std::string                    label_;
    ChannelState                   state_{ChannelState::OPENING};
    std::weak_ptr<FakeDataChannel> peer_;
};

// ---- FakePeerConnection ----

class FakePeerConnection : public PeerConnection {
public:
    explicit FakePeerConnection(Executor& exec) : exec_(exec) {}

    SessionDescription create_offer() override {
        if (closed) throw TransportError("closed");
        if (fail_create_offer) throw TransportError("create_offer failed");
        ++offers_created;
        return SessionDescription{"offer", "fake-offer-" + std::to_string(offers_created)};
    }

    SessionDescription create_answer() override {
        if (closed) throw TransportError("closed");
        if (sig != SignalingState::HAVE_REMOTE_OFFER) throw TransportError("no remote offer");
        ++answers_created;
        return SessionDescription{"answer", "fake-answer-" + std::to_string(answers_created)};
    }

    void set_local_description(const SessionDescription& d) override {
        if (closed) throw TransportError("closed");
        if (d.type == "offer") {
            if (sig != SignalingState::STABLE && sig != SignalingState::HAVE_LOCAL_OFFER) {
                throw TransportError("local offer in wrong state");
            }
            sig = SignalingState::HAVE_LOCAL_OFFER;
        } else if (d.type == "answer") {
            if (sig != SignalingState::HAVE_REMOTE_OFFER) throw TransportError("local answer in wrong state");
            sig = SignalingState::STABLE;
        } else if (d.type == "rollback") {
            if (sig != SignalingState::HAVE_LOCAL_OFFER) throw TransportError("rollback in wrong state");
            ++rollbacks;
            sig = SignalingState::STABLE;
        } else {
            throw TransportError("bad type " + d.type);
        }
        local_applied.push_back(d);
    }

    void set_remote_description(const SessionDescription& d) override {
        if (closed) throw TransportError("closed");
        if (d.type == "offer") {
            if (sig != SignalingState::STABLE) throw TransportError("remote offer in wrong state");
            sig = SignalingState::HAVE_REMOTE_OFFER;
        } else if (d.type == "answer") {
            if (sig != SignalingState::HAVE_LOCAL_OFFER) throw TransportError("remote answer in wrong state");
            sig = SignalingState::STABLE;
        } else {
            throw TransportError("bad type " + d.type);
        }
        has_remote = true;
        remote_applied.push_back(d);
    }

    void add_ice_candidate(const IceCandidate& c) override {
        if (!has_remote) throw CandidateBeforeRemoteDescription();
        if (reject_candidates) throw TransportError("malformed candidate");
        candidates.push_back(c);
    }

    SignalingState signaling_state() const override { return sig; }
    ConnectionState connection_state() const override { return conn; }

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override {
        auto ch = std::make_shared<FakeDataChannel>(exec_, label);
        channels.push_back(ch);
        return ch;
    }

    void close() override {
        if (closed) return;
        closed = true;
        sig    = SignalingState::CLOSED;
    }

    // ---- Test controls ----
    void fire_state(ConnectionState s) {
        conn = s;
        emit_state_change(s);
    }
    void fire_candidate(const IceCandidate& c) { emit_local_candidate(c); }
    void fire_data_channel(std::shared_ptr<DataChannel> ch) { emit_data_channel(std::move(ch)); }

    SignalingState  sig{SignalingState::STABLE};
    ConnectionState conn{ConnectionState::NEW};
    bool has_remote{false};
    bool closed{false};
    bool fail_create_offer{false};
    bool reject_candidates{false};
    int  offers_created{0};
    int  answers_created{0};
    int  rollbacks{0};
    std::vector<SessionDescription> local_applied;
    std::vector<SessionDescription> remote_applied;
    std::vector<IceCandidate>       candidates;
    std::vector<std::shared_ptr<FakeDataChannel>> channels;

private:
    Executor& exec_;
};

class FakePeerConnectionFactory : public PeerConnectionFactory {
public:
    explicit FakePeerConnectionFactory(Executor& exec) : exec_(exec) {}

    std::shared_ptr<PeerConnection> create() override {
        auto pc = std::make_shared<FakePeerConnection>(exec_);
        created.push_back(pc);
        return pc;
    }

    std::shared_ptr<FakePeerConnection> last() const {
        return created.empty() ? nullptr : created.back();
    }

    std::vector<std::shared_ptr<FakePeerConnection>> created;

private:
    Executor& exec_;
};

// ---- FakeSignaling ----

class FakeSignaling : public SignalingChannel {
public:
    bool send(const SignalingEnvelope& env) override {
        if (!connected) return false;
        sent.push_back(env);
        return true;
    }

    Subscription subscribe(const std::string& type, SignalingHandler handler) override {
        return handlers_.subscribe(type, std::move(handler));
    }

    void deliver(const SignalingEnvelope& env) { handlers_.dispatch(env.type, env); }

    void deliver(const std::string& type, nlohmann::json payload = nullptr) {
        SignalingEnvelope env;
        env.type    = type;
        env.payload = std::move(payload);
        deliver(env);
    }

    std::vector<SignalingEnvelope> sent_of(const std::string& type) const {
        std::vector<SignalingEnvelope> out;
        for (const auto& e : sent) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    bool connected{true};
    std::vector<SignalingEnvelope> sent;

private:
    Dispatcher<std::string, const SignalingEnvelope&> handlers_;
};

// ---- MemorySaveProvider ----

struct MemoryFile {
    std::string     name;
    std::string     mime_type;
    std::vector<u8> data;
    bool            finalized{false};
    bool            aborted{false};
};

class MemoryWriteTarget : public WriteTarget {
public:
    MemoryWriteTarget(std::shared_ptr<MemoryFile> file, int fail_after)
        : file_(std::move(file)), fail_after_(fail_after) {}

    bool append(const u8* data, size_t len) override {
        if (fail_after_ >= 0 && appends_ >= fail_after_) return false;
        ++appends_;
        file_->data.insert(file_->data.end(), data, data + len);
        return true;
    }
    void finalize() override { file_->finalized = true; }
    void abort() override {
        file_->aborted = true;
        file_->data.clear();
    }
    u64 written() const override { return file_->data.size(); }
    std::string location() const override { return "memory:" + file_->name; }

private:
    std::shared_ptr<MemoryFile> file_;
    int fail_after_;
    int appends_{0};
};

class MemorySaveProvider : public SaveLocationProvider {
public:
    explicit MemorySaveProvider(bool streaming = true) : streaming(streaming) {}

    bool supports_streaming() const override { return streaming; }

    std::unique_ptr<WriteTarget> acquire_write_target(const std::string& name,
                                                      const std::string& mime) override {
        ++acquisitions;
        if (fail_acquire) throw StorageError("disk full");
        if (decline) return nullptr;
        auto f = std::make_shared<MemoryFile>();
        f->name      = name;
        f->mime_type = mime;
        files.push_back(f);
        return std::make_unique<MemoryWriteTarget>(f, fail_after_appends);
    }

    std::shared_ptr<MemoryFile> find(const std::string& name) const {
        for (const auto& f : files) {
            if (f->name == name) return f;
        }
        return nullptr;
    }

    bool streaming;
    bool decline{false};
    bool fail_acquire{false};
    int  fail_after_appends{-1};   // appends allowed per target, -1 = unlimited
    int  acquisitions{0};
    std::vector<std::shared_ptr<MemoryFile>> files;
};

// ---- Helpers ----

// Collects log lines at or above 'min' while alive
class LogCapture {
public:
    explicit LogCapture(LogLevel min = LogLevel::WARN) {
        auto lines = lines_;
        Logger::get().set_observer([lines, min](LogLevel lvl, const std::string& msg) {
            if (lvl >= min) lines->push_back(Entry{lvl, msg});
        });
    }
    ~LogCapture() { Logger::get().set_observer(nullptr); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    size_t count(LogLevel lvl) const {
        return (size_t)std::count_if(lines_->begin(), lines_->end(),
                                     [lvl](const Entry& e) { return e.level == lvl; });
    }

    bool contains(const std::string& needle) const {
        return std::any_of(lines_->begin(), lines_->end(),
                           [&](const Entry& e) { return e.msg.find(needle) != std::string::npos; });
    }

private:
    struct Entry {
        LogLevel    level;
        std::string msg;
    };
    std::shared_ptr<std::vector<Entry>> lines_{std::make_shared<std::vector<Entry>>()};
};

// Unique scratch directory, removed with everything in it
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("peerdrop_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Write 'size' pseudo-random bytes to dir/name; returns the contents
    std::vector<u8> write_file(const std::string& name, size_t size, u32 seed = 1) const {
        std::vector<u8> data(size);
        u32 x = seed * 2654435761u + 1;
        for (size_t i = 0; i < size; ++i) {
            x ^= x << 13;
            x ^= x >> 17;
            x ^= x << 5;
            data[i] = (u8)x;
        }
        std::ofstream out(path_ / name, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
        return data;
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::vector<u8> read_all(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::vector<u8>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace testing_fakes
