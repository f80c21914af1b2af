#ifndef IWEBSOCKETCHANNEL_H
#define IWEBSOCKETCHANNEL_H

#include <QObject>
#include <QByteArray>
#include <QNetworkRequest>
#include <QString>
#include <QStringList>

/**
 * @brief One persistent duplex WebSocket connection
 *
 * Owned by exactly one client (signaling or HID). Sends on a channel that is
 * not open are dropped and return false.
 */
class IWebSocketChannel : public QObject {
    Q_OBJECT

public:
    explicit IWebSocketChannel(QObject* parent = nullptr) : QObject(parent) {}
    ~IWebSocketChannel() override = default;

    virtual void open(const QNetworkRequest& request, const QStringList& subprotocols = QStringList()) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual bool sendText(const QString& message) = 0;
    virtual bool sendBinary(const QByteArray& payload) = 0;

signals:
    void opened();
    void closed();
    void textReceived(const QString& message);
    void binaryReceived(const QByteArray& payload);
    void errorOccurred(const QString& error);
};

#endif // IWEBSOCKETCHANNEL_H
