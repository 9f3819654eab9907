#ifndef WKMUX_SESSION_ROUTER_HPP
#define WKMUX_SESSION_ROUTER_HPP

// Session router.
// Shares the single browser pipe between many external sessions. Each
// session believes it owns the browser: its request ids are remapped onto the
// pipe's flat id space, and responses and page notifications are routed back
// to the session that owns the browser context or page proxy they concern.
// When a session goes away the contexts it created are deleted on its behalf.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "server/connection_transport.hpp"
#include "server/sequence_id_mixer.hpp"

namespace session_router {

using json = nlohmann::json;

// Router-assigned key for an external session. Never reused by one router.
using SessionId = uint64_t;
constexpr SessionId INVALID_SESSION_ID = 0;

// Close reason sent to every session when the browser pipe goes away.
static const char BROWSER_DISCONNECTED_REASON[] = "Browser disconnected";

// One external controller as seen by the router.
class ExternalSession {
public:
    virtual ~ExternalSession() = default;

    // True once the connection has started closing or is closed.
    // Nothing is delivered to a closing session.
    virtual bool is_closing() const = 0;

    virtual void send(const json &message) = 0;

    // Begin closing the connection. The owner reports the final
    // disconnect through SessionRouter::on_disconnect.
    virtual void close(const std::string &reason) = 0;
};

class SessionRouter {
public:
    explicit SessionRouter(connection_transport::ConnectionTransport &transport);

    SessionRouter(const SessionRouter &) = delete;
    SessionRouter &operator=(const SessionRouter &) = delete;

    // Register an accepted connection. The session must outlive its
    // registration (until on_disconnect). Returns INVALID_SESSION_ID and
    // closes the session when the router is dead.
    SessionId on_connect(ExternalSession *session);

    // Forget a session: its page proxies are dropped silently and every
    // browser context it owns is deleted in the browser.
    void on_disconnect(SessionId session_id);

    // Outbound: remap the session's id and forward to the browser.
    void on_session_message(SessionId session_id, const json &message);

    // Inbound: attribute a browser message and deliver it, or drop it.
    void on_transport_message(const json &message);

    // The browser pipe is gone: close all sessions and stop routing.
    void on_transport_close();

    std::optional<SessionId> context_owner(const std::string &browser_context_id) const;
    std::optional<SessionId> page_proxy_owner(const std::string &page_proxy_id) const;
    size_t session_count() const { return sessions_.size(); }
    size_t pending_request_count() const { return id_mixer_.pending_count(); }
    bool is_dead() const { return dead_; }

private:
    // Where a response to a mixed id must go.
    struct PendingRequest {
        int64_t original_id = 0;
        SessionId session_id = INVALID_SESSION_ID;
    };

    struct SessionState {
        ExternalSession *connection = nullptr;
        std::set<std::string> browser_context_ids;
        std::set<std::string> page_proxy_ids;
    };

    void handle_response(int64_t mixed_id, json message);
    void handle_page_proxy_created(const json &message);
    void handle_page_proxy_destroyed(const json &message);
    void route_by_page_proxy(const std::string &page_proxy_id, const json &message);

    // Session connection if it is registered and not closing, else nullptr.
    ExternalSession *open_connection(SessionId session_id) const;

    void attribute_context(const std::string &browser_context_id, SessionId session_id);
    void release_context(const std::string &browser_context_id);
    void attribute_page_proxy(const std::string &page_proxy_id, SessionId session_id);
    std::optional<SessionId> release_page_proxy(const std::string &page_proxy_id);

    // Fire-and-forget deletion with an internal sequence number.
    void send_delete_context(const std::string &browser_context_id);

    connection_transport::ConnectionTransport &transport_;
    sequence_id_mixer::SequenceIdMixer<PendingRequest> id_mixer_;

    std::set<int64_t> pending_context_creations_;
    std::map<int64_t, std::string> pending_context_deletions_;
    std::map<std::string, SessionId> browser_context_owners_;
    std::map<std::string, SessionId> page_proxy_owners_;
    std::map<SessionId, SessionState> sessions_;

    SessionId next_session_id_ = 1;
    bool dead_ = false;
};

} // namespace session_router

#endif // WKMUX_SESSION_ROUTER_HPP
