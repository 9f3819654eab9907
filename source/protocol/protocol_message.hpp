#ifndef WKMUX_PROTOCOL_MESSAGE_HPP
#define WKMUX_PROTOCOL_MESSAGE_HPP

// Envelope helpers for the browser's remote-debugging protocol.
// Only the envelope fields the router needs are interpreted here:
// id, method, params, result, pageProxyId.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace protocol_message {

using json = nlohmann::json;

// Methods the router inspects.
static const char CREATE_CONTEXT_METHOD[] = "Playwright.createContext";
static const char DELETE_CONTEXT_METHOD[] = "Playwright.deleteContext";
static const char PAGE_PROXY_CREATED_METHOD[] = "Playwright.pageProxyCreated";
static const char PAGE_PROXY_DESTROYED_METHOD[] = "Playwright.pageProxyDestroyed";
static const char PROVISIONAL_LOAD_FAILED_METHOD[] = "Playwright.provisionalLoadFailed";
static const char BROWSER_CLOSE_METHOD[] = "Playwright.close";

// Reserved id for the fire-and-forget browser close request. Responses
// carrying it are ignored by the router.
constexpr int64_t BROWSER_CLOSE_MESSAGE_ID = -9999;

// Build a request envelope {id, method, params}.
json build_request(int64_t message_id, const std::string &method, const json &params);

// Build the graceful browser close request.
json build_browser_close_request();

// Extract method name. Returns empty if missing or not a string.
std::string get_method(const json &message);

// Extract an integer id. Returns nullopt if missing, not an integer, or
// outside the int64_t range.
std::optional<int64_t> get_id(const json &message);

// Extract params. Returns empty object if missing or not an object.
json get_params(const json &message);

// Read a string member of an object. Returns empty if missing or not a string.
std::string get_string(const json &object, const char *key);

// Top-level pageProxyId carried by page-scoped notifications, or empty.
std::string get_page_proxy_id(const json &message);

} // namespace protocol_message

#endif // WKMUX_PROTOCOL_MESSAGE_HPP
