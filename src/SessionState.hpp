#pragma once

enum class SessionState {
    Idle,
    Prefetching,
    EndOfStream,
    Failed,
    Closed
};

inline const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Prefetching: return "prefetching";
        case SessionState::EndOfStream: return "end_of_stream";
        case SessionState::Failed: return "failed";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

inline bool isTerminal(SessionState state) {
    return state == SessionState::EndOfStream || state == SessionState::Failed || state == SessionState::Closed;
}
