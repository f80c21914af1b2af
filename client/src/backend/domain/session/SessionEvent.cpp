#include "backend/domain/session/SessionEvent.h"

QString sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::AuthRequired: return "AuthRequired";
        case SessionState::Streaming: return "Streaming";
    }
    return "Unknown";
}

SessionEvent SessionEvent::stateChanged(SessionState state) {
    SessionEvent event;
    event.kind = Kind::StateChanged;
    event.state = state;
    return event;
}

SessionEvent SessionEvent::authRequired(const KvmDevice& device) {
    SessionEvent event;
    event.kind = Kind::AuthRequired;
    event.state = SessionState::AuthRequired;
    event.device = device;
    return event;
}

SessionEvent SessionEvent::connected(const KvmDevice& device) {
    SessionEvent event;
    event.kind = Kind::Connected;
    event.state = SessionState::Streaming;
    event.device = device;
    return event;
}

SessionEvent SessionEvent::disconnected(const QString& reason) {
    SessionEvent event;
    event.kind = Kind::Disconnected;
    event.state = SessionState::Disconnected;
    event.reason = reason;
    return event;
}

SessionEvent SessionEvent::failure(const KvmError& error) {
    SessionEvent event;
    event.kind = Kind::Error;
    event.error = error;
    event.reason = error.toString();
    return event;
}

SessionEvent SessionEvent::videoSizeChanged(const QSize& size) {
    SessionEvent event;
    event.kind = Kind::VideoSizeChanged;
    event.state = SessionState::Streaming;
    event.videoSize = size;
    return event;
}

QString SessionEvent::kindToString(Kind kind) {
    switch (kind) {
        case Kind::StateChanged: return "StateChanged";
        case Kind::AuthRequired: return "AuthRequired";
        case Kind::Connected: return "Connected";
        case Kind::Disconnected: return "Disconnected";
        case Kind::Error: return "Error";
        case Kind::VideoSizeChanged: return "VideoSizeChanged";
    }
    return "Unknown";
}
