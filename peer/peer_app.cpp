// ============================================================
// peer_app.cpp -- PeerApp implementation
// ============================================================

#include "peer_app.hpp"
#include "../common/event_loop.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "negotiator.hpp"
#include "relay_client.hpp"
#include "storage.hpp"
#include "tcp_peer_transport.hpp"
#include "transfer_manager.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

// Stdin prompt runs on its own thread (std::getline cannot be interrupted).
// It may outlive the loop, so it posts only while 'exec' is still set.
struct PromptState {
    std::mutex mutex;
    Executor*  exec{nullptr};
};

void ask_async(std::shared_ptr<PromptState> state, std::string question,
               std::function<void(bool)> on_answer) {
    std::thread([state, question, on_answer] {
        std::cout << question << " [y/N] " << std::flush;
        std::string line;
        bool yes = false;
        if (std::getline(std::cin, line)) {
            yes = !line.empty() && (line[0] == 'y' || line[0] == 'Y');
        }
        std::lock_guard<std::mutex> lk(state->mutex);
        if (state->exec) state->exec->post([on_answer, yes] { on_answer(yes); });
    }).detach();
}

} // namespace

PeerApp::PeerApp(PeerConfig cfg)
    : cfg_(std::move(cfg))
{
    if (cfg_.mode == PeerMode::SEND && cfg_.room_code.empty()) {
        cfg_.room_code = utils::generate_room_code();
    }
    cfg_.room_code = utils::normalize_room_code(cfg_.room_code);
    cfg_.validate();
}

PeerApp::~PeerApp() = default;

void PeerApp::stop() {
    stop_ = true;
}

void PeerApp::finish(int code, const std::string& why) {
    {
        std::lock_guard<std::mutex> lk(done_mutex_);
        if (done_) return;
        done_      = true;
        exit_code_ = code;
    }
    if (code == 0) {
        LOG_INFO(why);
    } else {
        LOG_ERROR(why);
    }
    done_cv_.notify_all();
}

int PeerApp::run() {
    const bool sending = cfg_.mode == PeerMode::SEND;

    EventLoop loop;
    DirectorySaveProvider storage(sending ? fs::path(".") : fs::path(cfg_.dst_dir), cfg_.streaming);
    RelayClient relay(loop, cfg_.relay_host, cfg_.relay_port, cfg_.room_code, cfg_.reconnect);
    TcpPeerConnectionFactory factory(loop, cfg_.advertise_host);
    Negotiator negotiator(relay, factory);
    ChunkedTransfer transfer(loop, storage, cfg_.transfer);

    auto prompt = std::make_shared<PromptState>();
    prompt->exec = &loop;

    std::vector<Subscription> subs;
    bool batch_done = false;
    int  last_logged_progress = -1;

    loop.call([&] {
        subs.push_back(negotiator.subscribe_channel_open([&](std::shared_ptr<DataChannel> ch) {
            transfer.attach(ch);
            LOG_INFO("Peer channel open");
            if (sending && !transfer.request_send(cfg_.files)) {
                finish(1, "Could not propose the files to the peer");
            }
        }));
        subs.push_back(negotiator.subscribe_channel_closed([&] {
            transfer.detach();
            if (!batch_done) finish(1, "Peer connection lost before the transfer finished");
        }));

        subs.push_back(relay.subscribe(sigtype::PEER_DISCONNECTED, [&](const SignalingEnvelope&) {
            if (!batch_done) finish(1, "Peer left the room");
        }));
        subs.push_back(relay.subscribe(sigtype::ERROR_MSG, [&](const SignalingEnvelope& env) {
            std::string what = env.payload.is_string() ? env.payload.get<std::string>() : env.payload.dump();
            finish(1, "Relay error: " + what);
        }));
        subs.push_back(relay.subscribe(sigtype::MAX_RECONNECT_FAILED, [&](const SignalingEnvelope&) {
            finish(1, "Could not reach the relay");
        }));

        subs.push_back(transfer.subscribe_progress([&](int p) {
            if (p / 10 != last_logged_progress / 10) {
                last_logged_progress = p;
                LOG_INFO("Progress: " + std::to_string(p) + "%");
            }
        }));
        subs.push_back(transfer.subscribe_text([](const std::string& text) {
            std::cout << "Peer: " << text << std::endl;
        }));

        if (sending) {
            subs.push_back(transfer.subscribe_answer([&](bool accepted) {
                if (!accepted) finish(1, "File transfer request was rejected by the receiver");
            }));
            subs.push_back(transfer.subscribe_batch_done([&] {
                batch_done = true;
                finish(0, "All files sent");
            }));
            subs.push_back(transfer.subscribe_status([&](TransferStatus s) {
                // A batch that ends without all-files-complete was aborted
                if (s == TransferStatus::IDLE && !batch_done && !transfer.last_error().empty()) {
                    finish(1, "Transfer aborted: " + transfer.last_error());
                }
            }));
        } else {
            subs.push_back(transfer.subscribe_request([&](const std::vector<RequestedFile>& files) {
                u64 total = 0;
                std::cout << "Peer wants to send " << files.size() << " file(s):\n";
                for (const auto& f : files) {
                    std::cout << "  " << f.name << "  " << utils::format_bytes(f.size) << "\n";
                    total += f.size;
                }
                std::cout << "Total: " << utils::format_bytes(total) << std::endl;
                auto answer = [&](bool yes) {
                    if (yes) {
                        transfer.accept_request();
                    } else {
                        transfer.reject_request();
                        finish(1, "Transfer declined");
                    }
                };
                if (cfg_.auto_accept) {
                    answer(true);
                } else {
                    ask_async(prompt, "Accept?", answer);
                }
            }));
            // The batch was confirmed as a whole: save every announced file
            subs.push_back(transfer.subscribe_pending([&](const FileMetadata& meta) {
                if (!transfer.accept_and_save_file(meta.id)) {
                    LOG_WARN("Not saving " + meta.name);
                }
            }));
            subs.push_back(transfer.subscribe_completed([&](const CompletedTransfer& rec) {
                if (rec.verified && !*rec.verified) {
                    LOG_WARN(rec.file_name + " failed verification");
                }
                if (!rec.saved_directly) {
                    std::string id = rec.id;
                    // Outside the dispatch: saving edits the completed list
                    loop.post([&transfer, id] { transfer.save_received_file(id); });
                }
            }));
            subs.push_back(transfer.subscribe_batch_done([&] {
                batch_done = true;
                if (transfer.status() == TransferStatus::IDLE) {
                    loop.post([this] { finish(0, "All files received"); });
                }
            }));
            subs.push_back(transfer.subscribe_status([&](TransferStatus s) {
                if (s != TransferStatus::IDLE) return;
                if (batch_done) {
                    loop.post([this] { finish(0, "All files received"); });
                } else if (!transfer.last_error().empty()) {
                    finish(1, "Transfer aborted: " + transfer.last_error());
                }
            }));
        }

        negotiator.start();
        relay.start();
    }).get();

    if (sending) {
        std::cout << "Room code: " << cfg_.room_code << std::endl;
        LOG_INFO("Waiting for the receiver to join room " + cfg_.room_code);
    } else {
        LOG_INFO("Joining room " + cfg_.room_code);
    }

    {
        std::unique_lock<std::mutex> lk(done_mutex_);
        while (!done_ && !stop_.load()) {
            done_cv_.wait_for(lk, std::chrono::milliseconds(200));
        }
    }

    if (stop_.load()) {
        loop.call([&] {
            if (transfer.status() != TransferStatus::IDLE) transfer.cancel_transfer();
        }).get();
        finish(1, "Interrupted");
    }

    {
        std::lock_guard<std::mutex> lk(prompt->mutex);
        prompt->exec = nullptr;
    }
    loop.call([&] {
        subs.clear();
        negotiator.teardown("exiting");
        transfer.detach();
        relay.leave();
        relay.stop();
    }).get();
    loop.stop();

    std::lock_guard<std::mutex> lk(done_mutex_);
    return exit_code_;
}
