#pragma once

#include <string>

namespace mcp_inspector {

/**
 * @brief Lifecycle of one RpcSession
 *
 * Unstarted -> Handshaking -> Ready -> Closing -> Closed, in that order only.
 * Failed can be entered from any non-terminal state and never left.
 * The failure reason is held by the session alongside the state.
 */
enum class SessionState {
    Unstarted,
    Handshaking,
    Ready,
    Closing,
    Closed,
    Failed
};

const char* to_string(SessionState state);

/**
 * @brief Whether the state machine allows moving from one state to another
 */
bool is_valid_transition(SessionState from, SessionState to);

/**
 * @brief Closed and Failed accept no further calls
 */
inline bool is_terminal(SessionState state) {
    return state == SessionState::Closed || state == SessionState::Failed;
}

} // namespace mcp_inspector
