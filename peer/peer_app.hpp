#pragma once

// ============================================================
// peer_app.hpp -- peerdrop peer: send or receive one batch
//
//   send    : create/join a room, wait for the data channel, propose
//             the batch (file-request), send it once accepted
//   receive : join a room, confirm the proposed batch, save each file
//             (streamed into dst_dir, or assembled in memory and written
//             out on completion with --no-stream)
//
// Everything except waiting runs on one EventLoop.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

class PeerApp {
public:
    explicit PeerApp(PeerConfig cfg);
    ~PeerApp();

    // Returns 0 when the batch went through, nonzero otherwise
    int run();

    // Cancel any active transfer and return from run(); signal-safe
    void stop();

    // Room code in use (generated in send mode when none was given)
    const std::string& room_code() const { return cfg_.room_code; }

private:
    PeerConfig        cfg_;
    std::atomic<bool> stop_{false};

    std::mutex              done_mutex_;
    std::condition_variable done_cv_;
    bool                    done_{false};
    int                     exit_code_{0};

    // First call wins
    void finish(int code, const std::string& why);
};
