/*
 * LanChat - interactive console
 */

#pragma once

#include "chat_node.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanchat {

class Console {
public:
    // interrupted is polled between input lines; a signal handler sets it.
    Console(ChatNode& node, const std::atomic<bool>& interrupted);
    ~Console();

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    // Reads stdin until /quit, end of input or interruption.
    void run();

private:
    void printer_loop();
    void events_loop();
    void process_user_input(const std::string& line);
    void send_file(MessageKind kind, const std::string& path);
    void send_payload(MessageKind kind, std::vector<uint8_t> payload);
    void show_peers();
    void show_diagnostics();
    void print_line(const std::string& line);
    void show_prompt();

    ChatNode& node_;
    const std::atomic<bool>& interrupted_;
    std::atomic<bool> running_{false};
    std::mutex io_mutex_;
    std::thread printer_thread_;
    std::thread events_thread_;
};

} // namespace lanchat
