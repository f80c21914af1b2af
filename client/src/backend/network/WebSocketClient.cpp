#include "backend/network/WebSocketClient.h"
#include <QWebSocketHandshakeOptions>
#include <QSslError>
#include <QDebug>

WebSocketClient::WebSocketClient(QObject* parent)
    : IWebSocketChannel(parent)
{
}

WebSocketClient::~WebSocketClient() {
    releaseSocket();
}

void WebSocketClient::releaseSocket() {
    if (!m_webSocket) return;
    m_webSocket->disconnect(this);  // Disconnect all signals first
    if (m_webSocket->state() == QAbstractSocket::ConnectedState || m_webSocket->state() == QAbstractSocket::ConnectingState) {
        m_webSocket->abort();
    }
    m_webSocket->deleteLater();
    m_webSocket = nullptr;
}

void WebSocketClient::open(const QNetworkRequest& request, const QStringList& subprotocols) {
    releaseSocket();
    m_closing = false;
    m_url = request.url().toString();

    m_webSocket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    connect(m_webSocket, &QWebSocket::connected, this, &WebSocketClient::onConnected);
    connect(m_webSocket, &QWebSocket::disconnected, this, &WebSocketClient::onDisconnected);
    connect(m_webSocket, &QWebSocket::textMessageReceived, this, &WebSocketClient::textReceived);
    connect(m_webSocket, &QWebSocket::binaryMessageReceived, this, &WebSocketClient::binaryReceived);
    connect(m_webSocket, &QWebSocket::errorOccurred, this, &WebSocketClient::onError);
    connect(m_webSocket, &QWebSocket::sslErrors, this, &WebSocketClient::onSslErrors);

    QWebSocketHandshakeOptions options;
    if (!subprotocols.isEmpty()) {
        options.setSubprotocols(subprotocols);
    }
    qDebug() << "WebSocketClient: Connecting to" << m_url;
    m_webSocket->open(request, options);
}

void WebSocketClient::close() {
    if (!m_webSocket) return;
    m_closing = true;
    if (m_webSocket->state() == QAbstractSocket::ConnectedState || m_webSocket->state() == QAbstractSocket::ConnectingState) {
        m_webSocket->close(QWebSocketProtocol::CloseCodeNormal);
    }
}

bool WebSocketClient::isOpen() const {
    return m_webSocket && m_webSocket->state() == QAbstractSocket::ConnectedState;
}

bool WebSocketClient::sendText(const QString& message) {
    if (!isOpen()) return false;
    return m_webSocket->sendTextMessage(message) == message.toUtf8().size();
}

bool WebSocketClient::sendBinary(const QByteArray& payload) {
    if (!isOpen()) return false;
    return m_webSocket->sendBinaryMessage(payload) == payload.size();
}

void WebSocketClient::onConnected() {
    qDebug() << "WebSocketClient: Connected to" << m_url;
    emit opened();
}

void WebSocketClient::onDisconnected() {
    if (m_closing) {
        qDebug() << "WebSocketClient: Closed" << m_url;
    } else {
        qWarning() << "WebSocketClient: Connection dropped" << m_url
                   << "code" << (m_webSocket ? int(m_webSocket->closeCode()) : -1);
    }
    emit closed();
}

void WebSocketClient::onError(QAbstractSocket::SocketError error) {
    QString errorString;
    switch (error) {
        case QAbstractSocket::ConnectionRefusedError: errorString = "Connection refused"; break;
        case QAbstractSocket::RemoteHostClosedError: errorString = "Remote host closed connection"; break;
        case QAbstractSocket::HostNotFoundError: errorString = "Host not found"; break;
        case QAbstractSocket::SocketTimeoutError: errorString = "Connection timeout"; break;
        default: errorString = m_webSocket ? m_webSocket->errorString() : QString("Socket error: %1").arg(error);
    }
    if (m_closing) {
        qDebug() << "WebSocketClient: Error while closing:" << errorString;
        return;
    }
    qWarning() << "WebSocketClient: Error on" << m_url << ":" << errorString;
    emit errorOccurred(errorString);
}

void WebSocketClient::onSslErrors(const QList<QSslError>& errors) {
    qDebug() << "WebSocketClient: Ignoring" << errors.size() << "TLS errors for" << m_url;
    if (m_webSocket) m_webSocket->ignoreSslErrors();
}
