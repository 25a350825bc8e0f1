// ============================================================
// peer/main.cpp -- peerdrop peer entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "peer_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <vector>

static PeerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " send <relay_ip> <relay_port> <file>... [options]\n"
        << "       " << prog << " receive <relay_ip> <relay_port> <code> <dst_dir> [options]\n"
        << "\n"
        << "  relay_ip            address of a running peerdrop_relay\n"
        << "  relay_port          its TCP port (e.g. " << DEFAULT_RELAY_PORT << ")\n"
        << "  code                six-character room code printed by the sender\n"
        << "  dst_dir             destination directory for received files\n"
        << "\nOptions:\n"
        << "  --code CODE         send: use this room code instead of a random one\n"
        << "  --advertise-host H  address the peer should connect to (default: "
        << DEFAULT_ADVERTISE_HOST << ")\n"
        << "  --yes               receive: accept the proposed files without asking\n"
        << "  --no-stream         receive: assemble files in memory, write on completion\n"
        << "  --verbose           enable debug logging\n"
        << "  --log-file PATH     also append log lines to PATH\n"
        << "\nExamples:\n"
        << "  " << prog << " send 192.168.1.1 " << DEFAULT_RELAY_PORT << " report.pdf photo.jpg\n"
        << "  " << prog << " receive 192.168.1.1 " << DEFAULT_RELAY_PORT << " K7QX2M ./incoming --yes\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 5) {
        print_usage(argv[0]);
        return 1;
    }

    PeerConfig cfg;
    if (std::strcmp(argv[1], "send") == 0) {
        cfg.mode = PeerMode::SEND;
    } else if (std::strcmp(argv[1], "receive") == 0) {
        cfg.mode = PeerMode::RECEIVE;
    } else {
        std::cerr << "Unknown mode: " << argv[1] << "\n";
        print_usage(argv[0]);
        return 1;
    }
    cfg.relay_host = argv[2];
    int port_int   = std::atoi(argv[3]);

    std::vector<std::string> positional;
    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--code") == 0 && i + 1 < argc) {
            cfg.room_code = argv[++i];
        } else if (std::strcmp(argv[i], "--advertise-host") == 0 && i + 1 < argc) {
            cfg.advertise_host = argv[++i];
        } else if (std::strcmp(argv[i], "--yes") == 0) {
            cfg.auto_accept = true;
        } else if (std::strcmp(argv[i], "--no-stream") == 0) {
            cfg.streaming = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            cfg.verbose = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.relay_port = (u16)port_int;

    if (cfg.mode == PeerMode::SEND) {
        cfg.files = positional;
    } else {
        if (positional.size() != 2) {
            std::cerr << "ERROR: receive needs <code> <dst_dir>\n";
            print_usage(argv[0]);
            return 1;
        }
        cfg.room_code = positional[0];
        cfg.dst_dir   = positional[1];
    }

    Logger::get().set_level(cfg.verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!cfg.log_file.empty()) Logger::get().set_log_file(cfg.log_file);

        PeerApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
