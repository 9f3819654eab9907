#include "server/session_router.hpp"
#include "protocol/protocol_message.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace session_router {

SessionRouter::SessionRouter(connection_transport::ConnectionTransport &transport)
    : transport_(transport) {}

SessionId SessionRouter::on_connect(ExternalSession *session) {
    if (session == nullptr) {
        return INVALID_SESSION_ID;
    }
    if (dead_) {
        debug_log::log("router: rejecting session, browser already disconnected");
        session->close(BROWSER_DISCONNECTED_REASON);
        return INVALID_SESSION_ID;
    }
    SessionId session_id = next_session_id_++;
    sessions_[session_id].connection = session;
    debug_log::log("router: session " + std::to_string(session_id) + " connected");
    return session_id;
}

void SessionRouter::on_disconnect(SessionId session_id) {
    auto session_iterator = sessions_.find(session_id);
    if (session_iterator == sessions_.end()) {
        return;
    }
    SessionState state = std::move(session_iterator->second);
    sessions_.erase(session_iterator);

    // The browser reports page proxy destruction on its own once the
    // contexts are gone; nothing is sent for them.
    for (const auto &page_proxy_id : state.page_proxy_ids) {
        page_proxy_owners_.erase(page_proxy_id);
    }
    for (const auto &browser_context_id : state.browser_context_ids) {
        browser_context_owners_.erase(browser_context_id);
        if (!dead_) {
            send_delete_context(browser_context_id);
        }
    }
    debug_log::log("router: session " + std::to_string(session_id) + " disconnected, released " +
                   std::to_string(state.browser_context_ids.size()) + " context(s) and " +
                   std::to_string(state.page_proxy_ids.size()) + " page proxy(ies)");
}

void SessionRouter::on_session_message(SessionId session_id, const json &message) {
    if (dead_) {
        debug_log::log("router: dropping session message, browser disconnected");
        return;
    }
    if (sessions_.find(session_id) == sessions_.end()) {
        debug_log::log("router: dropping message from unknown session " + std::to_string(session_id));
        return;
    }
    std::optional<int64_t> original_id = protocol_message::get_id(message);
    if (!original_id) {
        debug_log::log("router: dropping session message without integer id");
        return;
    }

    PendingRequest pending;
    pending.original_id = *original_id;
    pending.session_id = session_id;
    int64_t mixed_id = id_mixer_.generate(pending);

    std::string method = protocol_message::get_method(message);
    if (method == protocol_message::CREATE_CONTEXT_METHOD) {
        pending_context_creations_.insert(mixed_id);
    } else if (method == protocol_message::DELETE_CONTEXT_METHOD) {
        std::string browser_context_id =
            protocol_message::get_string(protocol_message::get_params(message), "browserContextId");
        if (!browser_context_id.empty()) {
            pending_context_deletions_[mixed_id] = browser_context_id;
        }
    }

    json forwarded = message;
    forwarded["id"] = mixed_id;
    transport_.send(forwarded);
}

void SessionRouter::on_transport_message(const json &message) {
    if (dead_) {
        return;
    }

    std::optional<int64_t> message_id = protocol_message::get_id(message);
    if (message_id) {
        if (*message_id == protocol_message::BROWSER_CLOSE_MESSAGE_ID) {
            return;
        }
        handle_response(*message_id, message);
        return;
    }

    std::string page_proxy_id = protocol_message::get_page_proxy_id(message);
    if (!page_proxy_id.empty()) {
        route_by_page_proxy(page_proxy_id, message);
        return;
    }

    std::string method = protocol_message::get_method(message);
    if (method == protocol_message::PAGE_PROXY_CREATED_METHOD) {
        handle_page_proxy_created(message);
        return;
    }
    if (method == protocol_message::PAGE_PROXY_DESTROYED_METHOD) {
        handle_page_proxy_destroyed(message);
        return;
    }

    // Remaining page-scoped notifications (Playwright.provisionalLoadFailed
    // and friends) name their page proxy in params.
    std::string params_page_proxy_id =
        protocol_message::get_string(protocol_message::get_params(message), "pageProxyId");
    if (!params_page_proxy_id.empty()) {
        route_by_page_proxy(params_page_proxy_id, message);
        return;
    }

    debug_log::log("router: dropping unattributable message " + method);
}

void SessionRouter::on_transport_close() {
    if (dead_) {
        return;
    }
    dead_ = true;

    std::map<SessionId, SessionState> sessions = std::move(sessions_);
    sessions_.clear();
    pending_context_creations_.clear();
    pending_context_deletions_.clear();
    browser_context_owners_.clear();
    page_proxy_owners_.clear();
    id_mixer_.clear();

    debug_log::log("router: browser disconnected, closing " + std::to_string(sessions.size()) + " session(s)");
    for (auto &entry : sessions) {
        entry.second.connection->close(BROWSER_DISCONNECTED_REASON);
    }
}

std::optional<SessionId> SessionRouter::context_owner(const std::string &browser_context_id) const {
    auto owner_iterator = browser_context_owners_.find(browser_context_id);
    if (owner_iterator == browser_context_owners_.end()) {
        return std::nullopt;
    }
    return owner_iterator->second;
}

std::optional<SessionId> SessionRouter::page_proxy_owner(const std::string &page_proxy_id) const {
    auto owner_iterator = page_proxy_owners_.find(page_proxy_id);
    if (owner_iterator == page_proxy_owners_.end()) {
        return std::nullopt;
    }
    return owner_iterator->second;
}

void SessionRouter::handle_response(int64_t mixed_id, json message) {
    std::optional<PendingRequest> pending = id_mixer_.take(mixed_id);
    if (!pending) {
        debug_log::log("router: dropping response with unknown id " + std::to_string(mixed_id));
        return;
    }

    bool was_context_creation = pending_context_creations_.erase(mixed_id) > 0;
    std::string deleted_context_id;
    auto deletion_iterator = pending_context_deletions_.find(mixed_id);
    if (deletion_iterator != pending_context_deletions_.end()) {
        deleted_context_id = deletion_iterator->second;
        pending_context_deletions_.erase(deletion_iterator);
    }

    std::string created_context_id;
    if (was_context_creation && message.contains("result")) {
        created_context_id = protocol_message::get_string(message["result"], "browserContextId");
    }

    ExternalSession *connection = open_connection(pending->session_id);
    if (connection == nullptr) {
        // The requester is gone; a context created for it would leak.
        if (!created_context_id.empty()) {
            debug_log::log("router: context " + created_context_id + " created for departed session " +
                           std::to_string(pending->session_id) + ", deleting it");
            send_delete_context(created_context_id);
        }
        if (!deleted_context_id.empty()) {
            release_context(deleted_context_id);
        }
        return;
    }

    if (!created_context_id.empty()) {
        attribute_context(created_context_id, pending->session_id);
    }
    if (!deleted_context_id.empty()) {
        release_context(deleted_context_id);
    }

    message["id"] = pending->original_id;
    connection->send(message);
}

void SessionRouter::handle_page_proxy_created(const json &message) {
    json page_proxy_info = protocol_message::get_params(message)["pageProxyInfo"];
    std::string browser_context_id = protocol_message::get_string(page_proxy_info, "browserContextId");
    std::string page_proxy_id = protocol_message::get_string(page_proxy_info, "pageProxyId");

    auto owner_iterator = browser_context_owners_.find(browser_context_id);
    if (owner_iterator == browser_context_owners_.end() || page_proxy_id.empty()) {
        debug_log::log("router: dropping pageProxyCreated for unowned context " + browser_context_id);
        return;
    }
    SessionId session_id = owner_iterator->second;
    ExternalSession *connection = open_connection(session_id);
    if (connection == nullptr) {
        return;
    }
    attribute_page_proxy(page_proxy_id, session_id);
    connection->send(message);
}

void SessionRouter::handle_page_proxy_destroyed(const json &message) {
    std::string page_proxy_id = protocol_message::get_string(protocol_message::get_params(message), "pageProxyId");
    std::optional<SessionId> owner = release_page_proxy(page_proxy_id);
    if (!owner) {
        return;
    }
    ExternalSession *connection = open_connection(*owner);
    if (connection != nullptr) {
        connection->send(message);
    }
}

void SessionRouter::route_by_page_proxy(const std::string &page_proxy_id, const json &message) {
    auto owner_iterator = page_proxy_owners_.find(page_proxy_id);
    if (owner_iterator == page_proxy_owners_.end()) {
        debug_log::log("router: dropping message for unknown page proxy " + page_proxy_id);
        return;
    }
    ExternalSession *connection = open_connection(owner_iterator->second);
    if (connection == nullptr) {
        return;
    }
    connection->send(message);
}

ExternalSession *SessionRouter::open_connection(SessionId session_id) const {
    auto session_iterator = sessions_.find(session_id);
    if (session_iterator == sessions_.end()) {
        return nullptr;
    }
    // Closing and closed are treated alike: a socket in the middle of its
    // close handshake gets nothing more.
    ExternalSession *connection = session_iterator->second.connection;
    if (connection == nullptr || connection->is_closing()) {
        return nullptr;
    }
    return connection;
}

void SessionRouter::attribute_context(const std::string &browser_context_id, SessionId session_id) {
    release_context(browser_context_id);
    browser_context_owners_[browser_context_id] = session_id;
    sessions_[session_id].browser_context_ids.insert(browser_context_id);
    debug_log::log("router: context " + browser_context_id + " -> session " + std::to_string(session_id));
}

void SessionRouter::release_context(const std::string &browser_context_id) {
    auto owner_iterator = browser_context_owners_.find(browser_context_id);
    if (owner_iterator == browser_context_owners_.end()) {
        return;
    }
    auto session_iterator = sessions_.find(owner_iterator->second);
    if (session_iterator != sessions_.end()) {
        session_iterator->second.browser_context_ids.erase(browser_context_id);
    }
    browser_context_owners_.erase(owner_iterator);
}

void SessionRouter::attribute_page_proxy(const std::string &page_proxy_id, SessionId session_id) {
    release_page_proxy(page_proxy_id);
    page_proxy_owners_[page_proxy_id] = session_id;
    sessions_[session_id].page_proxy_ids.insert(page_proxy_id);
}

std::optional<SessionId> SessionRouter::release_page_proxy(const std::string &page_proxy_id) {
    auto owner_iterator = page_proxy_owners_.find(page_proxy_id);
    if (owner_iterator == page_proxy_owners_.end()) {
        return std::nullopt;
    }
    SessionId session_id = owner_iterator->second;
    auto session_iterator = sessions_.find(session_id);
    if (session_iterator != sessions_.end()) {
        session_iterator->second.page_proxy_ids.erase(page_proxy_id);
    }
    page_proxy_owners_.erase(owner_iterator);
    return session_id;
}

void SessionRouter::send_delete_context(const std::string &browser_context_id) {
    json params;
    params["browserContextId"] = browser_context_id;
    transport_.send(protocol_message::build_request(id_mixer_.next_sequence_number(),
                                                    protocol_message::DELETE_CONTEXT_METHOD, params));
}

} // namespace session_router
