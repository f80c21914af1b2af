#ifndef LOCALHTTPSERVER_H
#define LOCALHTTPSERVER_H

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QMap>
#include <QNetworkProxy>
#include <QPair>
#include <QTcpServer>
#include <QTcpSocket>

/**
 * @brief Minimal HTTP/1.1 responder on 127.0.0.1 for exercising the real network path
 *
 * Each connection serves one request and is closed. Anything that does not
 * start like an HTTP request line (a TLS ClientHello for instance) is aborted,
 * which the client sees as a transport error.
 */
class LocalHttpServer {
public:
    struct Request {
        QByteArray method;
        QByteArray target;
        QMap<QByteArray, QByteArray> headers;
        QByteArray body;

        QByteArray path() const { return target.left(target.indexOf('?') < 0 ? target.size() : target.indexOf('?')); }
        QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    };

    struct Response {
        int status = 200;
        QByteArray body;
        QList<QPair<QByteArray, QByteArray>> headers;
        // Close the connection without answering
        bool drop = false;
    };

    LocalHttpServer() {
        QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
        QObject::connect(&m_server, &QTcpServer::newConnection, [this]() { acceptPending(); });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    int port() const { return m_server.serverPort(); }

    void route(const QByteArray& path, const Response& response) { m_routes.insert(path, response); }

    static Response json(int status, const QByteArray& body) {
        Response response;
        response.status = status;
        response.body = body;
        response.headers.append({ "Content-Type", "application/json" });
        return response;
    }

    QList<QByteArray> paths() const {
        QList<QByteArray> result;
        for (const Request& request : requests) result.append(request.path());
        return result;
    }

    QList<Request> requests;
    int abortedConnections = 0;

private:
    void acceptPending() {
        while (QTcpSocket* socket = m_server.nextPendingConnection()) {
            QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() { onReadyRead(socket); });
            QObject::connect(socket, &QObject::destroyed, &m_server, [this, socket]() { m_buffers.remove(socket); });
        }
    }

    void onReadyRead(QTcpSocket* socket) {
        QByteArray& buffer = m_buffers[socket];
        buffer.append(socket->readAll());
        if (buffer.isEmpty()) return;
        if (buffer.at(0) < 'A' || buffer.at(0) > 'Z') {
            ++abortedConnections;
            buffer.clear();
            socket->abort();
            return;
        }

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) return;

        Request request;
        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
        if (requestLine.size() < 2) {
            socket->abort();
            return;
        }
        request.method = requestLine.at(0);
        request.target = requestLine.at(1);
        for (int i = 1; i < lines.size(); ++i) {
            const QByteArray line = lines.at(i).trimmed();
            const int colon = line.indexOf(':');
            if (colon <= 0) continue;
            request.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
        }

        const int contentLength = request.headers.value("content-length").toInt();
        const int bodyStart = headerEnd + 4;
        if (buffer.size() - bodyStart < contentLength) return;
        request.body = buffer.mid(bodyStart, contentLength);
        buffer.clear();
        requests.append(request);

        Response response;
        response.status = 404;
        auto it = m_routes.constFind(request.path());
        if (it != m_routes.constEnd()) response = it.value();

        if (response.drop) {
            socket->abort();
            return;
        }

        QByteArray reply = "HTTP/1.1 " + QByteArray::number(response.status) + " Status\r\n";
        reply += "Content-Length: " + QByteArray::number(response.body.size()) + "\r\n";
        reply += "Connection: close\r\n";
        for (const auto& header : response.headers) {
            reply += header.first + ": " + header.second + "\r\n";
        }
        reply += "\r\n";
        reply += response.body;
        socket->write(reply);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QMap<QByteArray, Response> m_routes;
    QHash<QTcpSocket*, QByteArray> m_buffers;
};

// A port on 127.0.0.1 with nothing listening
inline int closedLocalPort() {
    QTcpServer server;
    server.listen(QHostAddress::LocalHost);
    const int port = server.serverPort();
    server.close();
    return port;
}

#endif // LOCALHTTPSERVER_H
