#include "Message.hpp"
#include "core/Overloaded.hpp"

namespace mcp_inspector {

bool RpcError::operator==(const RpcError& other) const {
    return code == other.code && message == other.message && data == other.data;
}

bool Request::operator==(const Request& other) const {
    return id == other.id && method == other.method && params == other.params;
}

bool Response::operator==(const Response& other) const {
    return id == other.id && result == other.result && error == other.error;
}

bool Notification::operator==(const Notification& other) const {
    return method == other.method && params == other.params;
}

json to_json(const Message& message) {
    return std::visit(overloaded{
        [](const Request& request) {
            json j = {
                {"jsonrpc", "2.0"},
                {"id", request.id},
                {"method", request.method}
            };
            if (request.params) {
                j["params"] = *request.params;
            }
            return j;
        },
        [](const Response& response) {
            json j = {
                {"jsonrpc", "2.0"},
                {"id", response.id}
            };
            if (response.error) {
                j["error"] = {
                    {"code", response.error->code},
                    {"message", response.error->message}
                };
                if (response.error->data) {
                    j["error"]["data"] = *response.error->data;
                }
            } else {
                j["result"] = response.result.value_or(json::object());
            }
            return j;
        },
        [](const Notification& notification) {
            json j = {
                {"jsonrpc", "2.0"},
                {"method", notification.method}
            };
            if (notification.params) {
                j["params"] = *notification.params;
            }
            return j;
        }
    }, message);
}

std::string describe(const Message& message) {
    return std::visit(overloaded{
        [](const Request& request) {
            return "request " + request.method + " id=" + request.id.dump();
        },
        [](const Response& response) {
            return std::string(response.is_error() ? "error response" : "response") +
                " id=" + response.id.dump();
        },
        [](const Notification& notification) {
            return "notification " + notification.method;
        }
    }, message);
}

} // namespace mcp_inspector
