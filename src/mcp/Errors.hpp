#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcp_inspector {

using json = nlohmann::json;

/**
 * @brief Failure categories surfaced by the session layer
 */
enum class ErrorKind {
    Spawn,
    Remote,
    Timeout,
    SessionFailed,
    SessionClosed
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base class for all session-layer failures
 */
class McpError : public std::runtime_error {
public:
    McpError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief The child process could not be started
 */
class SpawnError : public McpError {
public:
    explicit SpawnError(const std::string& message)
        : McpError(ErrorKind::Spawn, message) {}
};

/**
 * @brief The server answered with a JSON-RPC error object
 */
class RemoteError : public McpError {
public:
    RemoteError(int code, const std::string& message, std::optional<json> data);

    int code() const { return code_; }
    const std::string& remote_message() const { return remote_message_; }
    const std::optional<json>& data() const { return data_; }

private:
    int code_;
    std::string remote_message_;
    std::optional<json> data_;
};

/**
 * @brief No response arrived and the caller chose to stop waiting
 */
class TimeoutError : public McpError {
public:
    TimeoutError(const std::string& method, std::int64_t id);

    const std::string& method() const { return method_; }
    std::int64_t id() const { return id_; }

private:
    std::string method_;
    std::int64_t id_;
};

/**
 * @brief The session entered Failed; carries the failure reason
 */
class SessionFailedError : public McpError {
public:
    explicit SessionFailedError(const std::string& reason)
        : McpError(ErrorKind::SessionFailed, "session failed: " + reason), reason_(reason) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

/**
 * @brief The session was closed by the client
 */
class SessionClosedError : public McpError {
public:
    explicit SessionClosedError(const std::string& reason)
        : McpError(ErrorKind::SessionClosed, "session closed: " + reason), reason_(reason) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

} // namespace mcp_inspector
