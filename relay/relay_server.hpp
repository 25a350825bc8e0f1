#pragma once

// ============================================================
// relay_server.hpp -- Rendezvous relay: pairs two peers per room
//
// Concurrency model:
//   run()          -> accept loop, one thread per client socket
//   client threads -> read envelopes line by line, route them
// Rooms and the client table are guarded by one mutex; every
// client has its own write mutex so a slow reader only stalls
// writes to itself.
//
// Protocol (one JSON envelope per line, see peer/signaling.hpp):
//   -> your-id <n>                       on connect
//   <- join-room "<code>"                 at most two members per room
//   -> error "room full"
//   -> peer-connected {isInitiator}       when the second member joins;
//                                         the earlier member initiates
//   <- offer/answer/candidate            forwarded to the other member
//                                         with senderId set
//   <- leave-room / disconnect           -> peer-disconnected to the other
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/socket.hpp"
#include "../peer/signaling.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class RelayServer {
public:
    explicit RelayServer(RelayConfig cfg);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Bind and listen; throws std::runtime_error. Returns the bound port.
    u16 start();

    // Accept loop; returns after stop(). Closes every client on the way out.
    int run();

    // Safe from any thread
    void stop();

    u16 port() const { return port_; }
    size_t client_count() const;
    size_t room_size(const std::string& code) const;

private:
    struct Client {
        u64                        id{0};
        std::shared_ptr<TcpSocket> sock;
        std::string                peer;
        std::string                room;      // guarded by RelayServer::mutex_
        std::mutex                 write_mutex;
    };

    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    RelayConfig       cfg_;
    TcpSocket         listen_sock_;
    u16               port_{0};
    std::atomic<bool> running_{false};

    mutable std::mutex                          mutex_;
    u64                                         next_id_{1};
    std::map<u64, std::shared_ptr<Client>>      clients_;
    std::map<std::string, std::vector<u64>>     rooms_;    // members in join order

    std::mutex          workers_mutex_;
    std::vector<Worker> workers_;

    void client_thread(std::shared_ptr<Client> c);
    void handle_envelope(const std::shared_ptr<Client>& c, const SignalingEnvelope& env);
    void join_room(const std::shared_ptr<Client>& c, const std::string& raw_code);
    void leave_room(const std::shared_ptr<Client>& c);
    void forward(const std::shared_ptr<Client>& c, const SignalingEnvelope& env);

    // Caller must hold mutex_
    std::shared_ptr<Client> other_member(const Client& c) const;

    bool send_to(Client& c, const SignalingEnvelope& env);
    void cleanup_workers(bool join_all);
};
