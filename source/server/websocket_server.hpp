#ifndef WKMUX_WEBSOCKET_SERVER_HPP
#define WKMUX_WEBSOCKET_SERVER_HPP

// WebSocket listener for external controllers.
// Accepts connections on ws://127.0.0.1:<port>/<token> only and hands each one
// to the session router as an ExternalSession.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>

#include "server/session_router.hpp"

struct lws_context;
struct lws_vhost;
struct lws;

namespace websocket_server {

using json = nlohmann::json;

// Random hex token embedded in the listen path.
std::string generate_path_token();

// ws://127.0.0.1:<port>/<token>
std::string build_endpoint(int port, const std::string &token);

// True only for the exact path "/<token>".
bool is_authorized_path(const std::string &uri, const std::string &token);

// Largest client message accepted after reassembling fragments.
constexpr size_t MAX_MESSAGE_SIZE = 256u * 1024u * 1024u;

enum class FragmentResult {
    kIncomplete,
    kComplete,
    kTooLarge,
};

// One accepted WebSocket connection.
class WebSocketSession : public session_router::ExternalSession {
public:
    explicit WebSocketSession(struct lws *connection, size_t max_message_size = MAX_MESSAGE_SIZE);

    bool is_closing() const override { return closing_; }
    void send(const json &message) override;
    void close(const std::string &reason) override;

    // The peer started the close handshake.
    void mark_closing() { closing_ = true; }

    // Write the next queued message from the writeable callback.
    // Returns false when the connection must be closed now.
    bool write_pending();

    // Accumulate one received fragment. kTooLarge discards what was buffered.
    FragmentResult append_fragment(const char *data, size_t length, bool final_fragment);
    std::string take_message();

    session_router::SessionId session_id = session_router::INVALID_SESSION_ID;

private:
    struct lws *connection_;
    std::deque<std::string> outgoing_;
    size_t max_message_size_;
    std::string receive_buffer_;
    std::string close_reason_;
    bool closing_ = false;
};

struct ListenResult {
    bool success = false;
    std::string error_message;
};

class WebSocketServer {
public:
    explicit WebSocketServer(session_router::SessionRouter &router);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer &) = delete;
    WebSocketServer &operator=(const WebSocketServer &) = delete;

    // Bind 127.0.0.1:port (0 = any free port) and publish the endpoint.
    ListenResult listen(int port);

    // Run the libwebsockets event loop once. A timeout of 0 never blocks;
    // a positive one lets libwebsockets wait for its next event or timer.
    void service(int timeout_milliseconds);

    // Reject every further connection attempt.
    void stop_accepting() { accepting_ = false; }

    const std::string &endpoint() const { return endpoint_; }
    const std::string &token() const { return token_; }
    int port() const { return port_; }
    size_t connection_count() const { return sessions_.size(); }

    // Dispatch target of the libwebsockets protocol callback.
    int handle_callback(struct lws *connection, int reason, void *incoming_data, size_t incoming_length);

private:
    WebSocketSession *find_session(struct lws *connection);

    session_router::SessionRouter &router_;
    struct lws_context *context_ = nullptr;
    struct lws_vhost *vhost_ = nullptr;
    std::string token_;
    std::string endpoint_;
    int port_ = -1;
    bool accepting_ = true;
    std::map<struct lws *, std::unique_ptr<WebSocketSession>> sessions_;
};

} // namespace websocket_server

#endif // WKMUX_WEBSOCKET_SERVER_HPP
