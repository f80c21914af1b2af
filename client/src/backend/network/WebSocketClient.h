#ifndef WEBSOCKETCLIENT_H
#define WEBSOCKETCLIENT_H

#include <QWebSocket>
#include "backend/network/IWebSocketChannel.h"

/**
 * @brief QWebSocket backed channel
 *
 * Appliances ship self-signed certificates, so TLS errors are ignored on
 * every connection this class opens.
 */
class WebSocketClient : public IWebSocketChannel {
    Q_OBJECT

public:
    explicit WebSocketClient(QObject* parent = nullptr);
    ~WebSocketClient() override;

    void open(const QNetworkRequest& request, const QStringList& subprotocols = QStringList()) override;
    void close() override;
    bool isOpen() const override;

    bool sendText(const QString& message) override;
    bool sendBinary(const QByteArray& payload) override;

private slots:
    void onConnected();
    void onDisconnected();
    void onError(QAbstractSocket::SocketError error);
    void onSslErrors(const QList<QSslError>& errors);

private:
    void releaseSocket();

    QWebSocket* m_webSocket = nullptr;
    QString m_url;
    bool m_closing = false;
};

#endif // WEBSOCKETCLIENT_H
