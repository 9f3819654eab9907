#include "protocol/protocol_message.hpp"

#include <limits>

namespace protocol_message {

json build_request(int64_t message_id, const std::string &method, const json &params) {
    json request;
    request["id"] = message_id;
    request["method"] = method;
    request["params"] = params.is_object() ? params : json::object();
    return request;
}

json build_browser_close_request() {
    return build_request(BROWSER_CLOSE_MESSAGE_ID, BROWSER_CLOSE_METHOD, json::object());
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

std::optional<int64_t> get_id(const json &message) {
    if (!message.contains("id") || !message["id"].is_number_integer()) {
        return std::nullopt;
    }
    const json &id = message["id"];
    if (id.is_number_unsigned() &&
        id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return id.get<int64_t>();
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

std::string get_string(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

std::string get_page_proxy_id(const json &message) {
    return get_string(message, "pageProxyId");
}

} // namespace protocol_message
