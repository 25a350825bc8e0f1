// ============================================================
// relay_server.cpp -- Rendezvous relay implementation
// ============================================================

#include "relay_server.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

static constexpr size_t ROOM_CAPACITY = 2;

RelayServer::RelayServer(RelayConfig cfg)
    : cfg_(std::move(cfg))
{}

RelayServer::~RelayServer() {
    stop();
    cleanup_workers(true);
}

u16 RelayServer::start() {
    cfg_.validate();
    listen_sock_.bind_and_listen(cfg_.listen_ip, cfg_.listen_port);
    port_ = listen_sock_.local_port();
    running_ = true;
    LOG_INFO("Relay listening on " + cfg_.listen_ip + ":" + std::to_string(port_));
    return port_;
}

void RelayServer::stop() {
    if (!running_.exchange(false)) return;
    listen_sock_.shutdown();
}

int RelayServer::run() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            sock.tune();

            auto c  = std::make_shared<Client>();
            c->peer = sock.peer_addr();
            c->sock = std::make_shared<TcpSocket>(std::move(sock));
            {
                std::lock_guard<std::mutex> lk(mutex_);
                c->id = next_id_++;
                clients_[c->id] = c;
            }
            LOG_INFO("Client " + std::to_string(c->id) + " connected from " + c->peer);

            auto done = std::make_shared<std::atomic<bool>>(false);
            {
                std::lock_guard<std::mutex> lk(workers_mutex_);
                workers_.push_back(Worker{std::thread([this, c, done] {
                    client_thread(c);
                    *done = true;
                }), done});
            }
            cleanup_workers(false);
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }

    // Unblock every client reader, then wait for them
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& [id, c] : clients_) c->sock->shutdown();
    }
    cleanup_workers(true);
    listen_sock_.close();
    LOG_INFO("Relay stopped");
    return 0;
}

void RelayServer::cleanup_workers(bool join_all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        auto it = std::partition(workers_.begin(), workers_.end(),
                                 [join_all](const Worker& w) { return !join_all && !*w.done; });
        std::move(it, workers_.end(), std::back_inserter(finished));
        workers_.erase(it, workers_.end());
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

// ---- Per-client thread ----

void RelayServer::client_thread(std::shared_ptr<Client> c) {
    SignalingEnvelope hello;
    hello.type    = sigtype::YOUR_ID;
    hello.payload = c->id;
    send_to(*c, hello);

    try {
        std::string line;
        while (c->sock->read_line(line)) {
            if (line.empty()) continue;
            SignalingEnvelope env;
            try {
                env = proto::decode_envelope(line);
            } catch (const std::runtime_error& e) {
                LOG_WARN("Client " + std::to_string(c->id) + ": bad envelope: " + e.what());
                continue;
            }
            handle_envelope(c, env);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Client " + std::to_string(c->id) + ": " + e.what());
    }

    leave_room(c);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        clients_.erase(c->id);
    }
    // Other client threads may still be forwarding to us
    {
        std::lock_guard<std::mutex> lk(c->write_mutex);
        c->sock->close();
    }
    LOG_INFO("Client " + std::to_string(c->id) + " disconnected");
}

void RelayServer::handle_envelope(const std::shared_ptr<Client>& c, const SignalingEnvelope& env) {
    LOG_DEBUG("Client " + std::to_string(c->id) + " -> " + env.type);
    if (env.type == sigtype::JOIN_ROOM) {
        std::string code = env.payload.is_string() ? env.payload.get<std::string>() : env.room_code;
        join_room(c, code);
    } else if (env.type == sigtype::LEAVE_ROOM) {
        leave_room(c);
    } else if (env.type == sigtype::OFFER || env.type == sigtype::ANSWER ||
               env.type == sigtype::CANDIDATE) {
        forward(c, env);
    } else {
        LOG_DEBUG("Ignoring message type " + env.type + " from client " + std::to_string(c->id));
    }
}

// ---- Rooms ----

std::shared_ptr<RelayServer::Client> RelayServer::other_member(const Client& c) const {
    if (c.room.empty()) return nullptr;
    auto rit = rooms_.find(c.room);
    if (rit == rooms_.end()) return nullptr;
    for (u64 id : rit->second) {
        if (id == c.id) continue;
        auto cit = clients_.find(id);
        if (cit != clients_.end()) return cit->second;
    }
    return nullptr;
}

void RelayServer::join_room(const std::shared_ptr<Client>& c, const std::string& raw_code) {
    std::string code = utils::normalize_room_code(raw_code);
    if (!utils::validate_room_code(code)) {
        SignalingEnvelope err;
        err.type    = sigtype::ERROR_MSG;
        err.payload = "invalid room code";
        send_to(*c, err);
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (c->room == code) return;
    }
    leave_room(c);

    std::shared_ptr<Client> first;
    bool joined = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& members = rooms_[code];
        if (members.size() < ROOM_CAPACITY) {
            members.push_back(c->id);
            c->room = code;
            joined  = true;
            if (members.size() == ROOM_CAPACITY) first = other_member(*c);
        }
    }

    if (!joined) {
        LOG_WARN("Client " + std::to_string(c->id) + " refused: room " + code + " is full");
        SignalingEnvelope err;
        err.type    = sigtype::ERROR_MSG;
        err.payload = "room full";
        send_to(*c, err);
        return;
    }
    LOG_INFO("Client " + std::to_string(c->id) + " joined room " + code);
    if (!first) return;

    LOG_INFO("Room " + code + " paired: " + std::to_string(first->id) + " (initiator) <-> " +
             std::to_string(c->id));
    SignalingEnvelope to_first;
    to_first.type      = sigtype::PEER_CONNECTED;
    to_first.payload   = {{"isInitiator", true}};
    to_first.room_code = code;
    send_to(*first, to_first);

    SignalingEnvelope to_second;
    to_second.type      = sigtype::PEER_CONNECTED;
    to_second.payload   = {{"isInitiator", false}};
    to_second.room_code = code;
    send_to(*c, to_second);
}

void RelayServer::leave_room(const std::shared_ptr<Client>& c) {
    std::shared_ptr<Client> remaining;
    std::string code;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (c->room.empty()) return;
        code      = c->room;
        remaining = other_member(*c);
        auto rit = rooms_.find(code);
        if (rit != rooms_.end()) {
            auto& m = rit->second;
            m.erase(std::remove(m.begin(), m.end(), c->id), m.end());
            if (m.empty()) rooms_.erase(rit);
        }
        c->room.clear();
    }
    LOG_INFO("Client " + std::to_string(c->id) + " left room " + code);
    if (remaining) {
        SignalingEnvelope env;
        env.type      = sigtype::PEER_DISCONNECTED;
        env.room_code = code;
        env.sender_id = c->id;
        send_to(*remaining, env);
    }
}

void RelayServer::forward(const std::shared_ptr<Client>& c, const SignalingEnvelope& env) {
    std::shared_ptr<Client> target;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (c->room.empty()) {
            LOG_WARN("Dropping " + env.type + " from client " + std::to_string(c->id) +
                     ": not in a room");
            return;
        }
        target = other_member(*c);
    }
    if (!target) {
        LOG_WARN("Dropping " + env.type + " from client " + std::to_string(c->id) +
                 ": no peer in the room");
        return;
    }
    SignalingEnvelope out = env;
    out.sender_id = c->id;
    send_to(*target, out);
}

size_t RelayServer::client_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return clients_.size();
}

size_t RelayServer::room_size(const std::string& code) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = rooms_.find(utils::normalize_room_code(code));
    return it == rooms_.end() ? 0 : it->second.size();
}

bool RelayServer::send_to(Client& c, const SignalingEnvelope& env) {
    std::lock_guard<std::mutex> lk(c.write_mutex);
    try {
        c.sock->write_line(proto::encode_envelope(env));
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Send to client " + std::to_string(c.id) + " failed: " + e.what());
        return false;
    }
}
