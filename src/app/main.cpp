/*
 * LanChat entry point
 */

#include "chat_node.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <stdexcept>

using namespace lanchat;

namespace {
std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted = true;
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int usage() {
    std::cerr << "Usage: lanchat <display-name> [listen-port] [key=value;...]\n";
    return 1;
}
} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 4) {
        return usage();
    }

    NodeConfig config;
    config.display_name = argv[1];
    try {
        if (argc >= 3) {
            std::string port = argv[2];
            if (port.empty() || port.size() > 5 ||
                !std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch); }) ||
                std::stoul(port) > 65535) {
                std::cerr << "Invalid listen port: " << port << "\n";
                return usage();
            }
            config.listen_port = static_cast<uint16_t>(std::stoul(port));
        }
        if (argc == 4) {
            config.apply_overrides(argv[3]);
        }
        config.validate();
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        return usage();
    }

    install_signal_handlers();

    ChatNode node(config);
    try {
        node.start();
    } catch (const Error& ex) {
        std::cerr << "Failed to start: " << ex.what() << "\n";
        return 1;
    }

    Console console(node, g_interrupted);
    console.run();
    return 0;
}
