#include "server/pipe_transport.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace connection_transport {

std::string describe(TransportCloseReason reason) {
    switch (reason) {
    case TransportCloseReason::kStreamEnded: return "stream ended";
    case TransportCloseReason::kReadFailed: return "read failed";
    case TransportCloseReason::kWriteFailed: return "write failed";
    case TransportCloseReason::kFramingError: return "framing error";
    case TransportCloseReason::kClosedLocally: return "closed locally";
    }
    return "unknown";
}

} // namespace connection_transport

namespace pipe_transport {

// Bytes requested per read() call.
static constexpr size_t READ_CHUNK_SIZE = 65536;

// Reads per service turn, so a chatty browser cannot starve the sockets.
static constexpr int MAX_READS_PER_SERVICE = 16;

bool FrameDecoder::feed(const char *data, size_t length, std::vector<std::string> &frames) {
    size_t start = 0;
    while (start < length) {
        const void *terminator = memchr(data + start, '\0', length - start);
        if (terminator == nullptr) {
            break;
        }
        size_t end = static_cast<size_t>(static_cast<const char *>(terminator) - data);
        buffer_.append(data + start, end - start);
        if (buffer_.size() > MAX_FRAME_SIZE) {
            return false;
        }
        frames.push_back(std::move(buffer_));
        buffer_.clear();
        start = end + 1;
    }
    buffer_.append(data + start, length - start);
    return buffer_.size() <= MAX_FRAME_SIZE;
}

std::string encode_frame(const json &message) {
    std::string frame = message.dump();
    frame.push_back('\0');
    return frame;
}

bool decode_frame(const std::string &frame, json &message, std::string &error_message) {
    if (frame.empty()) {
        error_message = "empty frame";
        return false;
    }
    try {
        message = json::parse(frame);
    } catch (const json::parse_error &parse_error) {
        error_message = "invalid JSON in frame: " + std::string(parse_error.what());
        return false;
    }
    if (!message.is_object()) {
        error_message = "frame is not a JSON object";
        return false;
    }
    return true;
}

PipeTransport::PipeTransport(int read_descriptor, int write_descriptor)
    : read_descriptor_(read_descriptor), write_descriptor_(write_descriptor) {
    if (!platform::set_non_blocking(read_descriptor_) || !platform::set_non_blocking(write_descriptor_)) {
        schedule_close(TransportCloseReason::kReadFailed,
                       "could not make pipe non-blocking: " + std::string(strerror(errno)));
    }
}

PipeTransport::~PipeTransport() {
    closed_ = true;
    close_descriptors();
}

void PipeTransport::send(const json &message) {
    if (closed_ || close_pending_) {
        debug_log::log("pipe transport: dropping outbound message on closed pipe");
        return;
    }
    std::string frame = encode_frame(message);
    debug_log::log("SEND ► " + frame.substr(0, frame.size() - 1));
    write_buffer_ += frame;
    flush_writes();
}

void PipeTransport::close() {
    finish_close(TransportCloseReason::kClosedLocally, "");
}

bool PipeTransport::service(int timeout_milliseconds) {
    if (closed_) {
        return false;
    }
    if (close_pending_) {
        finish_close(pending_close_reason_, error_);
        return false;
    }

    struct pollfd poll_descriptors[2];
    nfds_t descriptor_count = 1;
    poll_descriptors[0].fd = read_descriptor_;
    poll_descriptors[0].events = POLLIN;
    poll_descriptors[0].revents = 0;
    if (!write_buffer_.empty()) {
        poll_descriptors[1].fd = write_descriptor_;
        poll_descriptors[1].events = POLLOUT;
        poll_descriptors[1].revents = 0;
        descriptor_count = 2;
    }

    int ready_count = poll(poll_descriptors, descriptor_count, timeout_milliseconds);
    if (ready_count < 0) {
        if (errno == EINTR) {
            return true;
        }
        finish_close(TransportCloseReason::kReadFailed, "poll failed: " + std::string(strerror(errno)));
        return false;
    }

    if (descriptor_count == 2 && poll_descriptors[1].revents != 0) {
        flush_writes();
    }
    if (poll_descriptors[0].revents != 0) {
        read_available();
    }
    if (close_pending_ && !closed_) {
        finish_close(pending_close_reason_, error_);
    }
    return !closed_;
}

void PipeTransport::flush_writes() {
    while (!write_buffer_.empty()) {
        ssize_t bytes_written = write(write_descriptor_, write_buffer_.data(), write_buffer_.size());
        if (bytes_written > 0) {
            write_buffer_.erase(0, static_cast<size_t>(bytes_written));
            continue;
        }
        if (bytes_written < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Pipe is full; the rest goes out on a later service turn.
            return;
        }
        schedule_close(TransportCloseReason::kWriteFailed,
                       "write to browser pipe failed: " + std::string(strerror(errno)));
        return;
    }
}

void PipeTransport::read_available() {
    char read_buffer[READ_CHUNK_SIZE];
    for (int read_index = 0; read_index < MAX_READS_PER_SERVICE && !closed_; ++read_index) {
        ssize_t bytes_read = read(read_descriptor_, read_buffer, sizeof(read_buffer));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            finish_close(TransportCloseReason::kReadFailed,
                         "read from browser pipe failed: " + std::string(strerror(errno)));
            return;
        }
        if (bytes_read == 0) {
            if (decoder_.has_partial_frame()) {
                finish_close(TransportCloseReason::kFramingError, "truncated frame at end of stream");
            } else {
                finish_close(TransportCloseReason::kStreamEnded, "");
            }
            return;
        }

        std::vector<std::string> frames;
        bool within_limit = decoder_.feed(read_buffer, static_cast<size_t>(bytes_read), frames);
        for (const auto &frame : frames) {
            json message;
            std::string error_message;
            if (!decode_frame(frame, message, error_message)) {
                finish_close(TransportCloseReason::kFramingError, error_message);
                return;
            }
            debug_log::log("◀ RECV " + frame);
            if (on_message_) {
                on_message_(message);
            }
            if (closed_) {
                return;
            }
        }
        if (!within_limit) {
            finish_close(TransportCloseReason::kFramingError, "frame exceeds maximum frame size");
            return;
        }
    }
}

void PipeTransport::schedule_close(TransportCloseReason reason, const std::string &error_message) {
    if (closed_ || close_pending_) {
        return;
    }
    close_pending_ = true;
    pending_close_reason_ = reason;
    error_ = error_message;
}

void PipeTransport::finish_close(TransportCloseReason reason, const std::string &error_message) {
    if (closed_) {
        return;
    }
    closed_ = true;
    close_pending_ = false;
    close_reason_ = reason;
    error_ = error_message;
    write_buffer_.clear();
    close_descriptors();

    if (reason == TransportCloseReason::kFramingError) {
        std::cerr << "[wkmux] Browser pipe framing error: " << error_message << std::endl;
    } else {
        debug_log::log("pipe transport closed: " + connection_transport::describe(reason) +
                       (error_message.empty() ? "" : " (" + error_message + ")"));
    }

    CloseCallback callback = std::move(on_close_);
    on_close_ = nullptr;
    if (callback) {
        callback(reason);
    }
}

void PipeTransport::close_descriptors() {
    if (read_descriptor_ >= 0) {
        ::close(read_descriptor_);
        read_descriptor_ = -1;
    }
    if (write_descriptor_ >= 0) {
        ::close(write_descriptor_);
        write_descriptor_ = -1;
    }
}

} // namespace pipe_transport
