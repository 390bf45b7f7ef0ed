/*
 * LanChat - established peer connection implementation
 */

#include "connection.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lanchat {

namespace {
std::string short_id(const PeerIdentity& peer) {
    return peer.display_name + " [" + peer.instance_id.substr(0, 8) + "]";
}
} // namespace

Connection::Connection(int socket_fd,
                       Role role,
                       PeerIdentity peer,
                       uint16_t peer_listen_port,
                       std::unique_ptr<SecureChannel> channel,
                       std::size_t queue_capacity,
                       std::chrono::milliseconds send_timeout)
    : socket_fd_(socket_fd),
      role_(role),
      peer_(std::move(peer)),
      peer_listen_port_(peer_listen_port),
      channel_(std::move(channel)),
      send_timeout_(send_timeout),
      established_at_ms_(monotonic_millis()),
      outbound_(queue_capacity) {}

Connection::~Connection() {
    close("connection released");
    if (reader_thread_.joinable()) {
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
    if (writer_thread_.joinable()) {
        if (writer_thread_.get_id() == std::this_thread::get_id()) {
            writer_thread_.detach();
        } else {
            writer_thread_.join();
        }
    }
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void Connection::start(FrameHandler on_frame, CloseHandler on_close) {
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        on_frame_ = std::move(on_frame);
        on_close_ = std::move(on_close);
    }
    if (closed_) {
        return;
    }

    // A peer that stops draining its socket fails our writes instead of
    // wedging the writer forever.
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(send_timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((send_timeout_.count() % 1000) * 1000);
    if (::setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        log_warn("SO_SNDTIMEO failed for " + short_id(peer_) + ": " + std::strerror(errno));
    }

    reader_thread_ = std::thread(&Connection::reader_loop, this);
    writer_thread_ = std::thread(&Connection::writer_loop, this);
}

Submission Connection::submit(std::shared_ptr<const std::vector<uint8_t>> plaintext,
                              std::chrono::milliseconds queue_wait) {
    Submission submission;
    if (closed_) {
        submission.queued = PushResult::Closed;
        return submission;
    }

    OutboundFrame frame;
    frame.plaintext = std::move(plaintext);
    std::future<bool> written = frame.written.get_future();

    submission.queued = outbound_.push_for(std::move(frame), queue_wait);
    if (submission.queued == PushResult::Ok) {
        submission.written = std::move(written);
    }
    return submission;
}

void Connection::close(const std::string& reason) {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }

    if (socket_fd_ >= 0) {
        ::shutdown(socket_fd_, SHUT_RDWR);
    }
    outbound_.close();
    for (auto& pending : outbound_.drain()) {
        pending.written.set_value(false);
    }

    log_info("connection to " + short_id(peer_) + " closed: " + reason);
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = on_close_;
    }
    if (handler) {
        handler(*this, reason);
    }
}

void Connection::join() {
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

std::string Connection::initiator_id(const std::string& local_id) const {
    return role_ == Role::Initiator ? local_id : peer_.instance_id;
}

void Connection::reader_loop() {
    while (!closed_) {
        std::optional<std::vector<uint8_t>> body;
        try {
            body = receive_frame(socket_fd_, channel_->max_frame_length());
        } catch (const ProtocolError& ex) {
            close(std::string("protocol error: ") + ex.what());
            return;
        }
        if (!body.has_value()) {
            close("peer closed the stream");
            return;
        }

        try {
            auto plaintext = channel_->open(body.value());
            if (on_frame_) {
                on_frame_(*this, std::move(plaintext));
            }
        } catch (const CryptoError& ex) {
            close(std::string("crypto error: ") + ex.what());
            return;
        } catch (const ProtocolError& ex) {
            close(std::string("protocol error: ") + ex.what());
            return;
        } catch (const std::exception& ex) {
            close(std::string("frame handling failed: ") + ex.what());
            return;
        }
    }
}

void Connection::writer_loop() {
    while (true) {
        auto frame = outbound_.pop();
        if (!frame.has_value()) {
            return;
        }
        if (closed_) {
            frame->written.set_value(false);
            continue;
        }

        bool sent = false;
        std::string failure;
        try {
            auto body = channel_->seal(*frame->plaintext);
            sent = send_frame(socket_fd_, body);
            if (!sent) {
                failure = errno == EAGAIN || errno == EWOULDBLOCK ? "send timed out (peer unresponsive)"
                                                                   : "send failed: " + std::string(std::strerror(errno));
            }
        } catch (const std::exception& ex) {
            failure = std::string("frame not sent: ") + ex.what();
        }
        frame->written.set_value(sent);
        if (!sent) {
            close(failure);
        }
    }
}

} // namespace lanchat
