#ifndef APPLIANCEENDPOINTS_H
#define APPLIANCEENDPOINTS_H

#include <QByteArray>
#include <QNetworkRequest>
#include <QString>
#include <QUrl>

class KvmDevice;

// URL and header conventions shared by every appliance connection
namespace ApplianceEndpoints {
    const QString HID_SOCKET_PATH = "/api/ws";
    const QString SIGNALING_SOCKET_PATH = "/janus/ws";
    const QString SIGNALING_SUBPROTOCOL = "janus-protocol";

    QByteArray authCookie(const QString& token);
    QUrl webSocketUrl(const KvmDevice& device, const QString& path);
    // Cookie (when a token is set) plus optional Origin, TLS verification off
    QNetworkRequest webSocketRequest(const KvmDevice& device, const QString& path, const QString& token, bool withOrigin);
    // Short "abcd…" form for log lines
    QString redactToken(const QString& token);
}

#endif // APPLIANCEENDPOINTS_H
