/*
 * LanChat - established peer connection
 *
 * One Connection per authenticated peer. It owns the socket, the secure
 * channel and two threads: a reader that opens frames and hands the
 * plaintext to the frame handler in arrival order, and a writer that seals
 * and sends whatever is queued on the bounded outbound queue. Only the
 * writer touches the send nonce counter.
 *
 * close() is idempotent; the close handler runs exactly once, on whichever
 * thread noticed the failure first.
 */

#pragma once

#include "blocking_queue.hpp"
#include "peer.hpp"
#include "secure_channel.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanchat {

struct OutboundFrame {
    std::shared_ptr<const std::vector<uint8_t>> plaintext;
    std::promise<bool> written;
};

struct Submission {
    PushResult queued = PushResult::Closed;
    // Valid only when queued == PushResult::Ok.
    std::future<bool> written;
};

class Connection {
public:
    using FrameHandler = std::function<void(Connection&, std::vector<uint8_t>)>;
    using CloseHandler = std::function<void(Connection&, const std::string&)>;

    Connection(int socket_fd,
               Role role,
               PeerIdentity peer,
               uint16_t peer_listen_port,
               std::unique_ptr<SecureChannel> channel,
               std::size_t queue_capacity,
               std::chrono::milliseconds send_timeout);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Does not spawn the threads if the connection was already closed.
    void start(FrameHandler on_frame, CloseHandler on_close);

    // Waits up to queue_wait for room on the outbound queue.
    Submission submit(std::shared_ptr<const std::vector<uint8_t>> plaintext,
                      std::chrono::milliseconds queue_wait);

    void close(const std::string& reason);

    // Must not be called from the connection's own threads.
    void join();

    const PeerIdentity& peer() const { return peer_; }
    uint16_t peer_listen_port() const { return peer_listen_port_; }
    Role role() const { return role_; }
    uint64_t established_at_ms() const { return established_at_ms_; }
    bool closed() const { return closed_.load(); }
    int native_handle() const { return socket_fd_; }
    uint64_t frames_sent() const { return channel_->frames_sent(); }
    uint64_t frames_received() const { return channel_->frames_received(); }

    // Id of the peer that initiated this connection.
    std::string initiator_id(const std::string& local_id) const;

private:
    void reader_loop();
    void writer_loop();

    int socket_fd_ = -1;
    const Role role_;
    const PeerIdentity peer_;
    const uint16_t peer_listen_port_;
    std::unique_ptr<SecureChannel> channel_;
    const std::chrono::milliseconds send_timeout_;
    const uint64_t established_at_ms_;

    BlockingQueue<OutboundFrame> outbound_;
    std::mutex handler_mutex_;
    FrameHandler on_frame_;
    CloseHandler on_close_;
    std::atomic<bool> closed_{false};
    std::thread reader_thread_;
    std::thread writer_thread_;
};

} // namespace lanchat
