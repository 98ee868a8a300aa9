#pragma once

#include "core/Message.hpp"
#include "mcp/SessionState.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace mcp_inspector {

using Timestamp = std::chrono::system_clock::time_point;

enum class StreamKind {
    Stdout,
    Stderr
};

const char* to_string(StreamKind stream);

/**
 * @brief One line of child output that is not a protocol message
 */
struct RawLine {
    StreamKind stream;
    Timestamp timestamp;
    std::string text;
};

/**
 * @brief Sink for structured session events
 *
 * Every event is timestamped by the caller when it happens. Implementations
 * must return quickly and must not throw; they are advisory only.
 */
class SessionLog {
public:
    virtual ~SessionLog() = default;

    /**
     * @brief A message was written to the child's stdin
     */
    virtual void on_sent(Timestamp at, const Message& message) = 0;

    /**
     * @brief A protocol message was decoded from the child's stdout
     */
    virtual void on_received(Timestamp at, const Message& message) = 0;

    /**
     * @brief A non-protocol line was read from stdout or stderr
     */
    virtual void on_raw_output(const RawLine& line) = 0;

    /**
     * @brief The session moved between states
     */
    virtual void on_state_change(Timestamp at,
                                 SessionState old_state,
                                 SessionState new_state,
                                 const std::optional<std::string>& reason) = 0;
};

/**
 * @brief Sink that drops every event
 */
class NullSessionLog : public SessionLog {
public:
    void on_sent(Timestamp, const Message&) override {}
    void on_received(Timestamp, const Message&) override {}
    void on_raw_output(const RawLine&) override {}
    void on_state_change(Timestamp, SessionState, SessionState,
                         const std::optional<std::string>&) override {}
};

} // namespace mcp_inspector
