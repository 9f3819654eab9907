#ifndef WKMUX_PIPE_TRANSPORT_HPP
#define WKMUX_PIPE_TRANSPORT_HPP

// NUL-delimited JSON framing over the two halves of the browser pipe.
// Each frame is the JSON text of one message followed by a single '\0'.

#include <cstddef>
#include <string>
#include <vector>

#include "server/connection_transport.hpp"

namespace pipe_transport {

using json = nlohmann::json;
using connection_transport::TransportCloseReason;

// Upper bound for a single frame; anything larger is treated as desynchronized input.
constexpr size_t MAX_FRAME_SIZE = 256u * 1024u * 1024u;

// Reassembles frames from arbitrarily split reads.
class FrameDecoder {
public:
    // Append bytes and move every completed frame into frames.
    // Returns false when a frame exceeds MAX_FRAME_SIZE.
    bool feed(const char *data, size_t length, std::vector<std::string> &frames);

    // True when bytes of an unterminated frame are buffered.
    bool has_partial_frame() const { return !buffer_.empty(); }

private:
    std::string buffer_;
};

// Serialize one message into its wire frame.
std::string encode_frame(const json &message);

// Parse one frame. Malformed frames (empty, not JSON, not an object) return
// false with error_message set.
bool decode_frame(const std::string &frame, json &message, std::string &error_message);

class PipeTransport : public connection_transport::ConnectionTransport {
public:
    // Takes ownership of both descriptors.
    PipeTransport(int read_descriptor, int write_descriptor);
    ~PipeTransport() override;

    PipeTransport(const PipeTransport &) = delete;
    PipeTransport &operator=(const PipeTransport &) = delete;

    void send(const json &message) override;
    void close() override;

    // Wait up to timeout_milliseconds for pipe activity, flush queued output
    // and deliver every complete inbound message in arrival order.
    // Returns false once the transport is closed.
    bool service(int timeout_milliseconds);

    bool is_closed() const { return closed_; }
    TransportCloseReason close_reason() const { return close_reason_; }
    const std::string &last_error() const { return error_; }

private:
    void flush_writes();
    void read_available();
    void schedule_close(TransportCloseReason reason, const std::string &error_message);
    void finish_close(TransportCloseReason reason, const std::string &error_message);
    void close_descriptors();

    int read_descriptor_;
    int write_descriptor_;
    FrameDecoder decoder_;
    std::string write_buffer_;

    bool closed_ = false;
    bool close_pending_ = false;
    TransportCloseReason pending_close_reason_ = TransportCloseReason::kClosedLocally;
    TransportCloseReason close_reason_ = TransportCloseReason::kClosedLocally;
    std::string error_;
};

} // namespace pipe_transport

#endif // WKMUX_PIPE_TRANSPORT_HPP
