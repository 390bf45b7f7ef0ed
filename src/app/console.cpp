/*
 * LanChat - interactive console implementation
 */

#include "console.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace lanchat {

namespace {
constexpr int kInputPollMs = 250;

// Returns true once stdin has input (or hit end of file).
bool wait_for_input(const std::atomic<bool>& running, const std::atomic<bool>& interrupted) {
    while (running && !interrupted) {
        if (std::cin.rdbuf()->in_avail() > 0) {
            return true;
        }
        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, kInputPollMs);
        if (ready > 0) {
            return true;
        }
        if (ready < 0 && errno != EINTR) {
            return true;
        }
    }
    return false;
}

std::string timestamp() {
    return "[" + format_local_time(std::chrono::system_clock::now()) + "]";
}

std::string describe_media(const InboundMessage& message) {
    const auto& envelope = message.envelope;
    std::string noun = envelope.kind == MessageKind::Image ? "an image" : "a video";
    return message.peer.display_name + " sent " + noun + " (" + std::to_string(envelope.payload_length()) +
           " bytes)";
}
} // namespace

Console::Console(ChatNode& node, const std::atomic<bool>& interrupted) : node_(node), interrupted_(interrupted) {}

Console::~Console() {
    node_.shutdown();
    if (printer_thread_.joinable()) {
        printer_thread_.join();
    }
    if (events_thread_.joinable()) {
        events_thread_.join();
    }
}

void Console::run() {
    running_ = true;
    printer_thread_ = std::thread(&Console::printer_loop, this);
    events_thread_ = std::thread(&Console::events_loop, this);

    print_line("LanChat: you are " + node_.identity().display_name + " on port " +
               std::to_string(node_.listen_port()) + ". Type /help for commands.");
    show_prompt();

    std::string line;
    while (wait_for_input(running_, interrupted_) && std::getline(std::cin, line)) {
        process_user_input(line);
        if (!running_ || interrupted_) {
            break;
        }
        show_prompt();
    }
    running_ = false;

    node_.shutdown();
    if (printer_thread_.joinable()) {
        printer_thread_.join();
    }
    if (events_thread_.joinable()) {
        events_thread_.join();
    }
}

void Console::printer_loop() {
    auto& inbound = node_.inbound_stream();
    while (auto message = inbound.pop()) {
        const auto& envelope = message->envelope;
        if (envelope.kind == MessageKind::Text) {
            std::string text(envelope.payload.begin(), envelope.payload.end());
            print_line(timestamp() + " " + message->peer.display_name + ": " + text);
        } else {
            print_line(timestamp() + " " + describe_media(message.value()));
        }
    }
}

void Console::events_loop() {
    auto& events = node_.peer_events();
    while (auto event = events.pop()) {
        if (event->kind == PeerEventKind::Joined) {
            print_line(timestamp() + " * " + event->peer.display_name + " joined from " +
                       event->peer.network_address);
        } else {
            print_line(timestamp() + " * " + event->peer.display_name + " left (" + event->reason + ")");
        }
    }
}

void Console::process_user_input(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return;
    }
    if (trimmed == "/quit" || trimmed == "exit") {
        running_ = false;
        return;
    }
    if (trimmed == "/help") {
        print_line("Commands:\n"
                   "  /peers          - list connected peers\n"
                   "  /image <path>   - send an image file\n"
                   "  /video <path>   - send a video file\n"
                   "  /diag           - show recent diagnostics\n"
                   "  /quit, exit     - leave the chat\n"
                   "  <text>          - send a message to every peer");
        return;
    }
    if (trimmed == "/peers") {
        show_peers();
        return;
    }
    if (trimmed == "/diag") {
        show_diagnostics();
        return;
    }
    const std::string command = split(trimmed, ' ').front();
    if (command == "/image" || command == "/video") {
        const bool image = command == "/image";
        std::string path = trim(trimmed.substr(6));
        if (path.empty()) {
            print_line(image ? "Usage: /image <path>" : "Usage: /video <path>");
            return;
        }
        send_file(image ? MessageKind::Image : MessageKind::Video, path);
        return;
    }
    send_payload(MessageKind::Text, std::vector<uint8_t>(trimmed.begin(), trimmed.end()));
}

void Console::send_file(MessageKind kind, const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        print_line("Cannot open " + path);
        return;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        print_line("Failed to read " + path);
        return;
    }
    if (bytes.size() > node_.config().max_payload_bytes) {
        print_line(path + " is larger than the " + std::to_string(node_.config().max_payload_bytes) +
                   " byte limit");
        return;
    }
    const std::size_t size = bytes.size();
    send_payload(kind, std::move(bytes));
    log_info("sent " + std::string(to_string(kind)) + " " + path + " (" + std::to_string(size) + " bytes)");
}

void Console::send_payload(MessageKind kind, std::vector<uint8_t> payload) {
    std::vector<DeliveryOutcome> outcomes;
    try {
        outcomes = node_.send(kind, std::move(payload));
    } catch (const ProtocolError& ex) {
        print_line(std::string("Not sent: ") + ex.what());
        return;
    }

    if (outcomes.empty()) {
        print_line("No peers connected yet; message not delivered.");
        return;
    }
    for (const auto& outcome : outcomes) {
        if (outcome.status != DeliveryStatus::Delivered) {
            print_line("  not delivered to " + outcome.peer.display_name + " (" + to_string(outcome.status) + ": " +
                       outcome.detail + ")");
        }
    }
}

void Console::show_peers() {
    auto connections = node_.connections();
    if (connections.empty()) {
        print_line("No connected peers.");
        return;
    }
    std::ostringstream out;
    out << "Connected peers:";
    for (const auto& connection : connections) {
        out << "\n  " << connection.peer.display_name << " [" << connection.peer.instance_id.substr(0, 8) << "] "
            << connection.peer.network_address << ":" << connection.peer_listen_port << " ("
            << to_string(connection.role) << ")";
    }
    print_line(out.str());
}

void Console::show_diagnostics() {
    std::ostringstream out;
    out << "Known peers:";
    for (const auto& record : node_.peers()) {
        out << "\n  " << record.identity.display_name << " [" << record.identity.instance_id.substr(0, 8) << "] "
            << to_string(record.status);
        if (record.failed_attempts > 0) {
            out << ", " << record.failed_attempts << " failed attempts";
        }
    }
    const NodeCounters counters = node_.counters();
    out << "\nDiscovery errors: " << counters.discovery_send_errors << " send, "
        << counters.discovery_receive_errors << " receive";
    out << "\nInbound messages lost at disconnect: " << counters.inbound_dropped;
    out << "\nRecent diagnostics:";
    for (const auto& entry : recent_log_lines()) {
        out << "\n  " << entry;
    }
    print_line(out.str());
}

void Console::print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    std::cout << "\n" << line << std::endl;
}

void Console::show_prompt() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    std::cout << "[" << node_.identity().display_name << "]> " << std::flush;
}

} // namespace lanchat
