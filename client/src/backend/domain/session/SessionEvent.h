#ifndef SESSIONEVENT_H
#define SESSIONEVENT_H

#include <QMetaType>
#include <QSize>
#include <QString>
#include "backend/domain/models/KvmDevice.h"
#include "backend/domain/models/KvmError.h"

enum class SessionState {
    Disconnected,
    Connecting,
    Authenticating,
    AuthRequired,
    Streaming
};

QString sessionStateToString(SessionState state);

/**
 * @brief One entry on the orchestrator's ordered event channel
 *
 * Only the fields relevant to the kind are filled: state for StateChanged,
 * device for AuthRequired and Connected, error for Error, videoSize for
 * VideoSizeChanged, reason for Disconnected.
 */
struct SessionEvent {
    enum class Kind {
        StateChanged,
        AuthRequired,
        Connected,
        Disconnected,
        Error,
        VideoSizeChanged
    };

    Kind kind = Kind::StateChanged;
    SessionState state = SessionState::Disconnected;
    KvmDevice device;
    KvmError error;
    QSize videoSize;
    QString reason;

    static SessionEvent stateChanged(SessionState state);
    static SessionEvent authRequired(const KvmDevice& device);
    static SessionEvent connected(const KvmDevice& device);
    static SessionEvent disconnected(const QString& reason = QString());
    static SessionEvent failure(const KvmError& error);
    static SessionEvent videoSizeChanged(const QSize& size);

    static QString kindToString(Kind kind);
};

Q_DECLARE_METATYPE(SessionEvent)

#endif // SESSIONEVENT_H
