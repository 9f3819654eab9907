#ifndef WKMUX_CONNECTION_TRANSPORT_HPP
#define WKMUX_CONNECTION_TRANSPORT_HPP

// Message channel to the browser process, independent of any external-facing
// connection. The router only ever talks to this interface.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <utility>

namespace connection_transport {

using json = nlohmann::json;

// Why a transport stopped delivering messages.
enum class TransportCloseReason {
    kStreamEnded,   // peer closed its end
    kReadFailed,
    kWriteFailed,
    kFramingError,  // malformed frame; message boundaries can no longer be trusted
    kClosedLocally,
};

std::string describe(TransportCloseReason reason);

class ConnectionTransport {
public:
    using MessageCallback = std::function<void(const json &)>;
    using CloseCallback = std::function<void(TransportCloseReason)>;

    virtual ~ConnectionTransport() = default;

    // Queue one message for the browser. Never throws; failures surface
    // through the close callback.
    virtual void send(const json &message) = 0;

    virtual void close() = 0;

    void set_on_message(MessageCallback callback) { on_message_ = std::move(callback); }
    void set_on_close(CloseCallback callback) { on_close_ = std::move(callback); }

protected:
    MessageCallback on_message_;
    CloseCallback on_close_;
};

} // namespace connection_transport

#endif // WKMUX_CONNECTION_TRANSPORT_HPP
