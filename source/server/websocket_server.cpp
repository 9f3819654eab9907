#include "server/websocket_server.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <cstring>
#include <iostream>
#include <random>
#include <vector>

namespace websocket_server {

// Largest close reason a close frame can carry.
static constexpr size_t MAX_CLOSE_REASON_LENGTH = 123;

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// WebSocket protocol definition for libwebsockets. Clients that do not ask
// for a subprotocol are bound to the first entry.
static const struct lws_protocols websocket_protocols[] = {
    {
        "wkmux-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    if (websocket_instance == nullptr) {
        return 0;
    }
    auto *server = static_cast<WebSocketServer *>(lws_context_user(lws_get_context(websocket_instance)));
    if (server == nullptr) {
        return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
    }
    int result = server->handle_callback(websocket_instance, static_cast<int>(reason), incoming_data, incoming_length);
    if (result > 0) {
        return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
    }
    return result;
}

std::string generate_path_token() {
    static const char hex_digits[] = "0123456789abcdef";
    std::random_device random_source;
    std::uniform_int_distribution<int> byte_distribution(0, 255);
    std::string token;
    token.reserve(32);
    for (int index = 0; index < 16; ++index) {
        int value = byte_distribution(random_source);
        token.push_back(hex_digits[value >> 4]);
        token.push_back(hex_digits[value & 0x0f]);
    }
    return token;
}

std::string build_endpoint(int port, const std::string &token) {
    return "ws://127.0.0.1:" + std::to_string(port) + "/" + token;
}

bool is_authorized_path(const std::string &uri, const std::string &token) {
    return !token.empty() && uri == "/" + token;
}

// --- WebSocketSession ---

WebSocketSession::WebSocketSession(struct lws *connection, size_t max_message_size)
    : connection_(connection), max_message_size_(max_message_size) {}

void WebSocketSession::send(const json &message) {
    if (closing_) {
        return;
    }
    outgoing_.push_back(message.dump());
    lws_callback_on_writable(connection_);
}

void WebSocketSession::close(const std::string &reason) {
    if (closing_) {
        return;
    }
    closing_ = true;
    close_reason_ = reason.substr(0, MAX_CLOSE_REASON_LENGTH);
    lws_callback_on_writable(connection_);
}

bool WebSocketSession::write_pending() {
    if (!outgoing_.empty()) {
        const std::string &payload = outgoing_.front();
        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + payload.size());
        memcpy(send_buffer.data() + LWS_PRE, payload.data(), payload.size());
        int bytes_written = lws_write(connection_, send_buffer.data() + LWS_PRE, payload.size(), LWS_WRITE_TEXT);
        outgoing_.pop_front();
        if (bytes_written < 0) {
            debug_log::log("websocket: write failed for session " + std::to_string(session_id));
            return false;
        }
        if (!outgoing_.empty() || closing_) {
            lws_callback_on_writable(connection_);
        }
        return true;
    }
    if (closing_) {
        lws_close_reason(connection_, LWS_CLOSE_STATUS_GOINGAWAY,
                         reinterpret_cast<unsigned char *>(&close_reason_[0]), close_reason_.size());
        return false;
    }
    return true;
}

FragmentResult WebSocketSession::append_fragment(const char *data, size_t length, bool final_fragment) {
    if (length > max_message_size_ - receive_buffer_.size()) {
        receive_buffer_.clear();
        return FragmentResult::kTooLarge;
    }
    receive_buffer_.append(data, length);
    return final_fragment ? FragmentResult::kComplete : FragmentResult::kIncomplete;
}

std::string WebSocketSession::take_message() {
    std::string message = std::move(receive_buffer_);
    receive_buffer_.clear();
    return message;
}

// --- WebSocketServer ---

WebSocketServer::WebSocketServer(session_router::SessionRouter &router) : router_(router) {}

WebSocketServer::~WebSocketServer() {
    if (context_ != nullptr) {
        // Destroying the context reports LWS_CALLBACK_CLOSED for every live
        // connection, which unregisters them from the router.
        lws_context_destroy(context_);
        context_ = nullptr;
    }
    sessions_.clear();
}

ListenResult WebSocketServer::listen(int port) {
    ListenResult result;
    if (context_ != nullptr) {
        result.error_message = "WebSocket server is already listening.";
        return result;
    }

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN;
    context_info.options = LWS_SERVER_OPTION_EXPLICIT_VHOSTS;
    context_info.user = this;
    context_info.gid = -1;
    context_info.uid = -1;

    context_ = lws_create_context(&context_info);
    if (context_ == nullptr) {
        result.error_message = "Failed to create libwebsockets context.";
        return result;
    }

    struct lws_context_creation_info vhost_info;
    memset(&vhost_info, 0, sizeof(vhost_info));
    vhost_info.port = port;
    vhost_info.iface = "127.0.0.1";
    vhost_info.protocols = websocket_protocols;
    vhost_info.vhost_name = "wkmux";

    vhost_ = lws_create_vhost(context_, &vhost_info);
    if (vhost_ == nullptr) {
        result.error_message = "Failed to listen on 127.0.0.1:" + std::to_string(port);
        lws_context_destroy(context_);
        context_ = nullptr;
        return result;
    }

    port_ = lws_get_vhost_listen_port(vhost_);
    token_ = generate_path_token();
    endpoint_ = build_endpoint(port_, token_);
    debug_log::log("websocket: listening on port " + std::to_string(port_));

    result.success = true;
    return result;
}

void WebSocketServer::service(int timeout_milliseconds) {
    if (context_ != nullptr) {
        // Negative asks libwebsockets to service what is ready without waiting.
        lws_service(context_, timeout_milliseconds > 0 ? timeout_milliseconds : -1);
    }
}

WebSocketSession *WebSocketServer::find_session(struct lws *connection) {
    auto session_iterator = sessions_.find(connection);
    if (session_iterator == sessions_.end()) {
        return nullptr;
    }
    return session_iterator->second.get();
}

// Returns 0 to continue, -1 to close the connection, 1 to defer to the
// default HTTP handling.
int WebSocketServer::handle_callback(struct lws *connection, int reason_value,
                                     void *incoming_data, size_t incoming_length) {
    auto reason = static_cast<enum lws_callback_reasons>(reason_value);

    switch (reason) {
    case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION: {
        if (!accepting_) {
            debug_log::log("websocket: rejecting connection, server no longer accepting");
            return -1;
        }
        char uri_buffer[256];
        int uri_length = lws_hdr_copy(connection, uri_buffer, sizeof(uri_buffer), WSI_TOKEN_GET_URI);
        if (uri_length < 0 || !is_authorized_path(std::string(uri_buffer, static_cast<size_t>(uri_length)), token_)) {
            debug_log::log("websocket: rejecting connection to unknown path");
            return -1;
        }
        // The token path must match exactly, query string included.
        if (lws_hdr_total_length(connection, WSI_TOKEN_HTTP_URI_ARGS) > 0) {
            debug_log::log("websocket: rejecting connection with query string");
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_ESTABLISHED: {
        auto session = std::make_unique<WebSocketSession>(connection);
        WebSocketSession *session_pointer = session.get();
        sessions_[connection] = std::move(session);
        session_pointer->session_id = router_.on_connect(session_pointer);
        debug_log::log("websocket: connection established, session " + std::to_string(session_pointer->session_id));
        return 0;
    }

    case LWS_CALLBACK_RECEIVE: {
        WebSocketSession *session = find_session(connection);
        if (session == nullptr) {
            return 0;
        }
        bool final_fragment = lws_is_final_fragment(connection) && lws_remaining_packet_payload(connection) == 0;
        FragmentResult fragment_result =
            session->append_fragment(static_cast<const char *>(incoming_data), incoming_length, final_fragment);
        if (fragment_result == FragmentResult::kTooLarge) {
            std::cerr << "[wkmux] Closing session " << session->session_id << ": message exceeds "
                      << MAX_MESSAGE_SIZE << " bytes" << std::endl;
            session->mark_closing();
            static const char too_large_reason[] = "Message too large";
            lws_close_reason(connection, LWS_CLOSE_STATUS_MESSAGE_TOO_LARGE,
                             reinterpret_cast<unsigned char *>(const_cast<char *>(too_large_reason)),
                             sizeof(too_large_reason) - 1);
            return -1;
        }
        if (fragment_result == FragmentResult::kIncomplete) {
            return 0;
        }
        std::string text = session->take_message();
        if (session->is_closing()) {
            return 0;
        }
        json message;
        try {
            message = json::parse(text);
        } catch (const json::parse_error &parse_error) {
            std::cerr << "[wkmux] Dropping unparsable client message: " << parse_error.what() << std::endl;
            return 0;
        }
        if (!message.is_object()) {
            debug_log::log("websocket: dropping non-object client message");
            return 0;
        }
        router_.on_session_message(session->session_id, message);
        return 0;
    }

    case LWS_CALLBACK_SERVER_WRITEABLE: {
        WebSocketSession *session = find_session(connection);
        if (session == nullptr) {
            return 0;
        }
        return session->write_pending() ? 0 : -1;
    }

    case LWS_CALLBACK_WS_PEER_INITIATED_CLOSE: {
        WebSocketSession *session = find_session(connection);
        if (session != nullptr) {
            session->mark_closing();
        }
        return 0;
    }

    case LWS_CALLBACK_CLOSED: {
        auto session_iterator = sessions_.find(connection);
        if (session_iterator == sessions_.end()) {
            return 0;
        }
        session_iterator->second->mark_closing();
        router_.on_disconnect(session_iterator->second->session_id);
        sessions_.erase(session_iterator);
        return 0;
    }

    default:
        return 1;
    }
}

} // namespace websocket_server
