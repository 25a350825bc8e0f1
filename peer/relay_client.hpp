#pragma once

// ============================================================
// relay_client.hpp -- Signaling over a TCP connection to the relay
//
// One background I/O thread per connection attempt connects and
// reads lines; everything else (dispatch, reconnect scheduling,
// room membership) happens on the Executor.
//
// Reconnect policy: after a lost or failed connection, wait
// min(base * 2^attempt, cap) ms and retry while attempt < max;
// after the last attempt the client id is forgotten and the local
// "max-reconnect-failed" event fires.
//
// Destroy on the executor thread or after the executor has stopped.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/config.hpp"
#include "../common/dispatcher.hpp"
#include "../common/event_loop.hpp"
#include "signaling.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

static constexpr int RELAY_CONNECT_TIMEOUT_MS = 5000;

class RelayClient : public SignalingChannel {
public:
    RelayClient(Executor& exec, std::string host, u16 port,
                std::string room_code, ReconnectPolicy policy = ReconnectPolicy());
    ~RelayClient() override;

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    // First connection attempt (asynchronous)
    void start();

    // No more reconnects; closes the connection and joins the I/O thread
    void stop();

    bool send(const SignalingEnvelope& env) override;
    Subscription subscribe(const std::string& type, SignalingHandler handler) override;

    // Reset the attempt counter and connect again right away
    void reconnect();

    // Tell the relay we are leaving the room (connection stays up)
    void leave();

    // Switch rooms; re-joins immediately when connected
    void set_room_code(const std::string& code);

    bool is_connected() const { return connected_; }
    std::optional<u64> client_id() const;
    std::string room_code() const;

private:
    Executor&       exec_;
    std::string     host_;
    u16             port_;
    ReconnectPolicy policy_;

    mutable std::mutex         state_mutex_;   // room_code_, client_id_
    std::string                room_code_;
    std::optional<u64>         client_id_;

    std::atomic<bool>          connected_{false};
    std::atomic<bool>          stopping_{false};
    u32                        attempts_{0};
    u64                        generation_{0};      // bumps per connection attempt

    std::mutex                 link_mutex_;         // sock_, io_thread_, writes
    std::shared_ptr<TcpSocket> sock_;
    std::thread                io_thread_;

    Dispatcher<std::string, const SignalingEnvelope&> handlers_;

    // Posted tasks hold a weak reference; it expires with the client
    std::shared_ptr<int>       life_{std::make_shared<int>(0)};

    void connect_now();
    void close_link();
    void post_guarded(Task task);
    void io_main(u64 gen, std::shared_ptr<TcpSocket> sock);

    void on_link_up(u64 gen);
    void on_line(u64 gen, const std::string& line);
    void on_link_down(u64 gen, const std::string& reason);

    bool write_envelope(const SignalingEnvelope& env);
    void emit_local(const char* type);
};
