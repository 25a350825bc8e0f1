// ============================================================
// relay/main.cpp -- peerdrop relay entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "relay_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static RelayServer* g_relay = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_relay) g_relay->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <ip> <port> [options]\n"
        << "\n"
        << "  ip             IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port           TCP port (default relay port is " << DEFAULT_RELAY_PORT << ")\n"
        << "\nOptions:\n"
        << "  --verbose          enable debug logging\n"
        << "  --log-file PATH    also append log lines to PATH\n"
        << "\nPeers meet in rooms named by a six-character code; the relay pairs\n"
        << "the first two members of each room and forwards their negotiation.\n"
        << "\nExample:\n"
        << "  " << prog << " 0.0.0.0 " << DEFAULT_RELAY_PORT << "\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    RelayConfig cfg;
    cfg.listen_ip = argv[1];
    int port_int  = std::atoi(argv[2]);

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            cfg.verbose = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.listen_port = (u16)port_int;

    try {
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    Logger::get().set_level(cfg.verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!cfg.log_file.empty()) Logger::get().set_log_file(cfg.log_file);

        RelayServer relay(std::move(cfg));
        relay.start();
        g_relay = &relay;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = relay.run();
        g_relay = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
