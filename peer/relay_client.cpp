// ============================================================
// relay_client.cpp -- RelayClient implementation
// ============================================================

#include "relay_client.hpp"
#include "../common/logger.hpp"
#include <stdexcept>
#include <string>

RelayClient::RelayClient(Executor& exec, std::string host, u16 port,
                         std::string room_code, ReconnectPolicy policy)
    : exec_(exec)
    , host_(std::move(host))
    , port_(port)
    , policy_(policy)
    , room_code_(std::move(room_code))
{}

RelayClient::~RelayClient() {
    life_.reset();
    stop();
}

void RelayClient::start() {
    post_guarded([this] { connect_now(); });
}

void RelayClient::stop() {
    stopping_ = true;
    close_link();
}

void RelayClient::post_guarded(Task task) {
    std::weak_ptr<int> life = life_;
    exec_.post([life, task = std::move(task)] {
        if (!life.expired()) task();
    });
}

// ---- Connection management (executor thread) ----

void RelayClient::connect_now() {
    if (stopping_) return;
    close_link();

    u64 gen = ++generation_;
    std::shared_ptr<TcpSocket> sock;
    try {
        sock = std::make_shared<TcpSocket>();
    } catch (const std::exception& e) {
        on_link_down(gen, e.what());
        return;
    }

    LOG_INFO("Connecting to relay " + host_ + ":" + std::to_string(port_) +
             (attempts_ > 0 ? " (attempt " + std::to_string(attempts_ + 1) + ")" : ""));
    std::lock_guard<std::mutex> lk(link_mutex_);
    sock_ = sock;
    io_thread_ = std::thread(&RelayClient::io_main, this, gen, sock);
}

// The I/O thread may sit in connect() for up to RELAY_CONNECT_TIMEOUT_MS;
// shutdown() unblocks a connected socket only.
void RelayClient::close_link() {
    std::shared_ptr<TcpSocket> sock;
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(link_mutex_);
        sock = std::move(sock_);
        t = std::move(io_thread_);
    }
    connected_ = false;
    if (sock) sock->shutdown();
    if (t.joinable()) t.join();
}

void RelayClient::io_main(u64 gen, std::shared_ptr<TcpSocket> sock) {
    std::string reason = "connection closed by relay";
    try {
        sock->connect(host_, port_, RELAY_CONNECT_TIMEOUT_MS);
    } catch (const std::exception& e) {
        reason = e.what();
        post_guarded([this, gen, reason] { on_link_down(gen, reason); });
        return;
    }
    post_guarded([this, gen] { on_link_up(gen); });

    try {
        std::string line;
        while (sock->read_line(line)) {
            if (line.empty()) continue;
            post_guarded([this, gen, line] { on_line(gen, line); });
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }
    post_guarded([this, gen, reason] { on_link_down(gen, reason); });
}

void RelayClient::on_link_up(u64 gen) {
    if (gen != generation_ || stopping_) return;
    connected_ = true;
    attempts_  = 0;
    LOG_INFO("Connected to relay " + host_ + ":" + std::to_string(port_));

    std::string code = room_code();
    if (!code.empty()) {
        LOG_INFO("Joining room: " + code);
        SignalingEnvelope join;
        join.type    = sigtype::JOIN_ROOM;
        join.payload = code;
        write_envelope(join);
    }
    emit_local(sigtype::OPEN);
}

void RelayClient::on_line(u64 gen, const std::string& line) {
    if (gen != generation_) return;

    SignalingEnvelope env;
    try {
        env = proto::decode_envelope(line);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Dropping unparseable relay message: ") + e.what());
        return;
    }
    LOG_DEBUG("Relay message received: " + env.type);

    if (env.type == sigtype::YOUR_ID && env.payload.is_number_unsigned()) {
        std::lock_guard<std::mutex> lk(state_mutex_);
        client_id_ = env.payload.get<u64>();
    }

    handlers_.dispatch(env.type, env);
    handlers_.dispatch(sigtype::ANY, env);
}

void RelayClient::on_link_down(u64 gen, const std::string& reason) {
    if (gen != generation_) return;

    bool was_connected = connected_.exchange(false);
    if (was_connected) {
        LOG_WARN("Relay connection lost: " + reason);
    } else {
        LOG_WARN("Relay connection failed: " + reason);
    }
    emit_local(sigtype::CLOSE);
    if (stopping_) return;

    if (attempts_ < policy_.max_attempts) {
        u32 delay = policy_.delay_for(attempts_);
        LOG_INFO("Reconnecting to relay in " + std::to_string(delay) + " ms (attempt " +
                 std::to_string(attempts_ + 1) + ")");
        std::weak_ptr<int> life = life_;
        exec_.post_delayed(delay, [this, life, gen] {
            if (life.expired()) return;
            // A manual reconnect() in the meantime supersedes this retry
            if (gen != generation_ || stopping_) return;
            ++attempts_;
            connect_now();
        });
    } else {
        LOG_ERROR("Max relay reconnection attempts reached");
        {
            std::lock_guard<std::mutex> lk(state_mutex_);
            client_id_.reset();
        }
        emit_local(sigtype::MAX_RECONNECT_FAILED);
    }
}

// ---- Public operations ----

bool RelayClient::send(const SignalingEnvelope& env) {
    if (!connected_) {
        LOG_ERROR("Relay is not connected; cannot send " + env.type);
        return false;
    }
    SignalingEnvelope out = env;
    out.room_code = room_code();
    return write_envelope(out);
}

Subscription RelayClient::subscribe(const std::string& type, SignalingHandler handler) {
    return handlers_.subscribe(type, std::move(handler));
}

void RelayClient::reconnect() {
    post_guarded([this] {
        attempts_ = 0;
        connect_now();
    });
}

void RelayClient::leave() {
    if (!connected_) return;
    SignalingEnvelope env;
    env.type = sigtype::LEAVE_ROOM;
    send(env);
}

void RelayClient::set_room_code(const std::string& code) {
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        room_code_ = code;
    }
    if (connected_ && !code.empty()) {
        SignalingEnvelope join;
        join.type    = sigtype::JOIN_ROOM;
        join.payload = code;
        write_envelope(join);
    }
}

std::optional<u64> RelayClient::client_id() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return client_id_;
}

std::string RelayClient::room_code() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return room_code_;
}

bool RelayClient::write_envelope(const SignalingEnvelope& env) {
    std::lock_guard<std::mutex> lk(link_mutex_);
    if (!sock_) return false;
    try {
        sock_->write_line(proto::encode_envelope(env));
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Relay send failed (" + env.type + "): " + e.what());
        return false;
    }
}

void RelayClient::emit_local(const char* type) {
    SignalingEnvelope env;
    env.type = type;
    handlers_.dispatch(type, env);
}
