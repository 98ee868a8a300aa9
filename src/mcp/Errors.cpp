#include "Errors.hpp"

namespace mcp_inspector {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Spawn: return "SpawnError";
        case ErrorKind::Remote: return "RemoteError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::SessionFailed: return "SessionFailed";
        case ErrorKind::SessionClosed: return "SessionClosed";
    }
    return "Unknown";
}

RemoteError::RemoteError(int code, const std::string& message, std::optional<json> data)
    : McpError(ErrorKind::Remote,
               "remote error " + std::to_string(code) + ": " + message),
      code_(code),
      remote_message_(message),
      data_(std::move(data)) {}

TimeoutError::TimeoutError(const std::string& method, std::int64_t id)
    : McpError(ErrorKind::Timeout,
               "timed out waiting for " + method + " (id=" + std::to_string(id) + ")"),
      method_(method),
      id_(id) {}

} // namespace mcp_inspector
