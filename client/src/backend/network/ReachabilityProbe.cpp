#include "backend/network/ReachabilityProbe.h"
#include <QTcpSocket>
#include <QTimer>
#include <memory>

TcpReachabilityProbe::TcpReachabilityProbe(QObject* parent)
    : QObject(parent)
{
}

void TcpReachabilityProbe::probe(const QString& host, int port, int timeoutMs, Callback callback) {
    QTcpSocket* socket = new QTcpSocket(this);
    QTimer* timer = new QTimer(socket);
    timer->setSingleShot(true);

    // Whichever of connect, error or timeout comes first settles the probe
    auto finished = std::make_shared<bool>(false);
    auto settle = [socket, finished, callback](bool reachable, const QString& error) {
        if (*finished) return;
        *finished = true;
        socket->abort();
        socket->deleteLater();
        if (callback) callback(reachable, error);
    };

    connect(socket, &QTcpSocket::connected, socket, [settle]() {
        settle(true, QString());
    });
    connect(socket, &QTcpSocket::errorOccurred, socket, [socket, settle](QAbstractSocket::SocketError) {
        settle(false, socket->errorString());
    });
    connect(timer, &QTimer::timeout, socket, [settle, host, port, timeoutMs]() {
        settle(false, QString("Timed out after %1 ms connecting to %2:%3").arg(timeoutMs).arg(host).arg(port));
    });

    timer->start(timeoutMs);
    socket->connectToHost(host, static_cast<quint16>(port));
}
