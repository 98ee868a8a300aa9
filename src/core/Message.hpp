#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace mcp_inspector {

using json = nlohmann::json;

/**
 * @brief JSON-RPC error object carried by a failed response
 */
struct RpcError {
    int code = 0;
    std::string message;
    std::optional<json> data;

    bool operator==(const RpcError& other) const;
};

/**
 * @brief JSON-RPC request (has an id, expects a response)
 *
 * Requests issued by the client always carry integer ids. Requests received
 * from the server may use any id the server chose, so the id is kept as JSON.
 */
struct Request {
    json id;
    std::string method;
    std::optional<json> params;

    bool operator==(const Request& other) const;
};

/**
 * @brief JSON-RPC response; exactly one of result/error is set
 */
struct Response {
    json id;
    std::optional<json> result;
    std::optional<RpcError> error;

    bool is_error() const { return error.has_value(); }

    bool operator==(const Response& other) const;
};

/**
 * @brief JSON-RPC notification (no id, no response)
 */
struct Notification {
    std::string method;
    std::optional<json> params;

    bool operator==(const Notification& other) const;
};

using Message = std::variant<Request, Response, Notification>;

/**
 * @brief Convert a message to its JSON-RPC 2.0 object form
 */
json to_json(const Message& message);

/**
 * @brief Short human-readable label for logs, e.g. "request tools/list id=3"
 */
std::string describe(const Message& message);

} // namespace mcp_inspector
