#ifndef KVMERROR_H
#define KVMERROR_H

#include <QString>
#include <QMetaType>

enum class KvmErrorKind {
    None,
    InvalidConfiguration,
    ConnectionFailed,
    AuthenticationFailed,
    SignalingLost,
    TransportFailed,
    DecodingFailed,
    HttpError
};

/**
 * @brief Error value shared by the control plane, signaling and HID layers
 *
 * A default constructed KvmError means success. HttpError carries the
 * response status; every kind may carry a human readable message that is
 * surfaced to the user verbatim.
 */
class KvmError {
public:
    KvmError() = default;
    KvmError(KvmErrorKind kind, const QString& message, int httpStatus = 0)
        : m_kind(kind), m_message(message), m_httpStatus(httpStatus) {}

    static KvmError invalidConfiguration(const QString& message) { return KvmError(KvmErrorKind::InvalidConfiguration, message); }
    static KvmError connectionFailed(const QString& message) { return KvmError(KvmErrorKind::ConnectionFailed, message); }
    static KvmError authenticationFailed(const QString& message = QString()) { return KvmError(KvmErrorKind::AuthenticationFailed, message); }
    static KvmError signalingLost(const QString& message = QString()) { return KvmError(KvmErrorKind::SignalingLost, message); }
    static KvmError transportFailed(const QString& message) { return KvmError(KvmErrorKind::TransportFailed, message); }
    static KvmError decodingFailed(const QString& message) { return KvmError(KvmErrorKind::DecodingFailed, message); }
    static KvmError httpError(int status, const QString& body) { return KvmError(KvmErrorKind::HttpError, body, status); }

    bool isError() const { return m_kind != KvmErrorKind::None; }
    KvmErrorKind kind() const { return m_kind; }
    QString message() const { return m_message; }
    int httpStatus() const { return m_httpStatus; }

    // Text suitable for a status line or dialog
    QString toString() const;

    static QString kindName(KvmErrorKind kind);

private:
    KvmErrorKind m_kind = KvmErrorKind::None;
    QString m_message;
    int m_httpStatus = 0;
};

Q_DECLARE_METATYPE(KvmError)

#endif // KVMERROR_H
