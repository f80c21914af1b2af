#include "backend/domain/models/KvmError.h"

QString KvmError::kindName(KvmErrorKind kind) {
    switch (kind) {
        case KvmErrorKind::None: return "None";
        case KvmErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case KvmErrorKind::ConnectionFailed: return "ConnectionFailed";
        case KvmErrorKind::AuthenticationFailed: return "AuthenticationFailed";
        case KvmErrorKind::SignalingLost: return "SignalingLost";
        case KvmErrorKind::TransportFailed: return "TransportFailed";
        case KvmErrorKind::DecodingFailed: return "DecodingFailed";
        case KvmErrorKind::HttpError: return "HttpError";
    }
    return "Unknown";
}

QString KvmError::toString() const {
    switch (m_kind) {
        case KvmErrorKind::None:
            return QString();
        case KvmErrorKind::InvalidConfiguration:
            return QString("Invalid configuration: %1").arg(m_message);
        case KvmErrorKind::ConnectionFailed:
            return QString("Connection failed: %1").arg(m_message);
        case KvmErrorKind::AuthenticationFailed:
            return m_message.isEmpty() ? QString("Authentication failed") : QString("Authentication failed: %1").arg(m_message);
        case KvmErrorKind::SignalingLost:
            return m_message.isEmpty() ? QString("Signaling connection lost") : m_message;
        case KvmErrorKind::TransportFailed:
            return QString("Transport failed: %1").arg(m_message);
        case KvmErrorKind::DecodingFailed:
            return QString("Invalid response: %1").arg(m_message);
        case KvmErrorKind::HttpError:
            return QString("HTTP %1: %2").arg(m_httpStatus).arg(m_message);
    }
    return m_message;
}
