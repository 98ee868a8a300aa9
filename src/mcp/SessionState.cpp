#include "SessionState.hpp"

namespace mcp_inspector {

namespace {

int rank(SessionState state) {
    switch (state) {
        case SessionState::Unstarted: return 0;
        case SessionState::Handshaking: return 1;
        case SessionState::Ready: return 2;
        case SessionState::Closing: return 3;
        case SessionState::Closed: return 4;
        case SessionState::Failed: return 5;
    }
    return -1;
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Unstarted: return "Unstarted";
        case SessionState::Handshaking: return "Handshaking";
        case SessionState::Ready: return "Ready";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

bool is_valid_transition(SessionState from, SessionState to) {
    if (is_terminal(from)) {
        return false;
    }
    if (to == SessionState::Failed) {
        return true;
    }
    // Closing is reachable from any live state so a half-started session can be torn down
    if (to == SessionState::Closing) {
        return from != SessionState::Closing;
    }
    return rank(to) == rank(from) + 1;
}

} // namespace mcp_inspector
