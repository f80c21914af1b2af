#include "backend/network/ApplianceEndpoints.h"
#include "backend/domain/models/KvmDevice.h"
#include <QSslConfiguration>
#include <QSslSocket>

namespace ApplianceEndpoints {

QByteArray authCookie(const QString& token) {
    return QByteArray("auth_token=") + token.toUtf8();
}

QUrl webSocketUrl(const KvmDevice& device, const QString& path) {
    QUrl url(device.baseUrl());
    url.setScheme("wss");
    url.setPath(path);
    return url;
}

QNetworkRequest webSocketRequest(const KvmDevice& device, const QString& path, const QString& token, bool withOrigin) {
    QNetworkRequest request(webSocketUrl(device, path));
    if (!token.isEmpty()) {
        request.setRawHeader("Cookie", authCookie(token));
    }
    if (withOrigin) {
        request.setRawHeader("Origin", device.baseUrl().toUtf8());
    }
    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
    request.setSslConfiguration(ssl);
    return request;
}

QString redactToken(const QString& token) {
    if (token.isEmpty()) return "<none>";
    return token.left(4) + QString::fromUtf8("…");
}

} // namespace ApplianceEndpoints
