#include "client/client_config.hpp"
#include "client/viewer.hpp"
#include <csignal>
#include <functional>
#include <iostream>
#include <string>

std::function<void()> shutdown_handler;

void signal_handler(int signal) {
    (void)signal;
    if (shutdown_handler) {
        shutdown_handler();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --host <host>     Server host (default: localhost)" << std::endl;
    std::cout << "  -p, --port <port>     Server port (default: " << racesync::protocol::DEFAULT_PORT << ")" << std::endl;
    std::cout << "  --room <id>           Room to join (default: any)" << std::endl;
    std::cout << "  --player <id>         Player id to claim" << std::endl;
    std::cout << "  --controller <token>  Join as controller with this session token" << std::endl;
    std::cout << "  --username <name>     Username to set once joined as controller" << std::endl;
    std::cout << "  --config <path>       Client config (default: data/client.json)" << std::endl;
    std::cout << "  --help                Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    racesync::client::ClientConfig config;
    std::string config_path = "data/client.json";

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }
    if (!config.load(config_path)) {
        std::cerr << "Using default client settings" << std::endl;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
                config.host = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--room" && i + 1 < argc) {
                config.room_id = argv[++i];
            } else if (arg == "--player" && i + 1 < argc) {
                config.player_id = argv[++i];
            } else if (arg == "--controller" && i + 1 < argc) {
                config.role = racesync::protocol::PlayerRole::Controller;
                config.session_token = argv[++i];
            } else if (arg == "--username" && i + 1 < argc) {
                config.username = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                ++i;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "=== Race Viewer ===" << std::endl;
    std::cout << "Server: " << config.host << ":" << config.port << std::endl;

    racesync::client::Viewer viewer(config);

    shutdown_handler = [&]() { viewer.request_stop(); };
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!viewer.init()) {
        std::cerr << "Failed to initialize viewer" << std::endl;
        return 1;
    }

    viewer.run();
    viewer.shutdown();

    return 0;
}
