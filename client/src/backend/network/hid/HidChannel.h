#ifndef HIDCHANNEL_H
#define HIDCHANNEL_H

#include <QObject>
#include <QJsonValue>
#include <QTimer>
#include "backend/domain/models/KvmDevice.h"
#include "backend/domain/models/KvmError.h"
#include "backend/network/hid/IHidSink.h"

class IWebSocketChannel;
class MouseMoveCoalescer;

/**
 * @brief Persistent binary HID connection to the appliance (/api/ws)
 *
 * Encodes input events with HidWireCodec and writes them to the socket.
 * Sends are best-effort: while the socket is not open every event is
 * dropped. Absolute moves can go through the coalescing sender with
 * queueMouseMove(). A JSON ping keeps idle connections alive.
 */
class HidChannel : public QObject, public IHidSink {
    Q_OBJECT

public:
    static constexpr int KEEPALIVE_INTERVAL_MS = 25000;

    // Takes ownership of the channel
    explicit HidChannel(IWebSocketChannel* channel, QObject* parent = nullptr);
    ~HidChannel() override;

    void connectTo(const KvmDevice& device, const QString& authToken);
    void disconnect();
    bool isConnected() const;

    // IHidSink
    void sendKey(const QString& key, bool pressed, bool finish = false) override;
    void sendMouseButton(const QString& button, bool pressed) override;
    void sendMouseMove(int x, int y) override;
    void queueMouseMove(int x, int y) override;
    void sendMouseRelative(int dx, int dy) override;
    void sendMouseWheel(int dx, int dy) override;

    // JSON control message {"event_type": ..., "event": ...}
    bool sendEvent(const QString& eventType, const QJsonValue& event);

    MouseMoveCoalescer* moveCoalescer() const { return m_coalescer; }

signals:
    void connected();
    void disconnected();
    void connectionLost(const KvmError& error);
    void eventReceived(const QString& eventType, const QJsonValue& event);

private slots:
    void onOpened();
    void onClosed();
    void onError(const QString& error);
    void onTextReceived(const QString& message);
    void sendKeepalive();

private:
    void writeFrame(const QByteArray& frame);
    void teardown();

    IWebSocketChannel* m_channel;
    MouseMoveCoalescer* m_coalescer;
    QTimer* m_keepaliveTimer;
    bool m_active = false;
    bool m_lossReported = false;
};

#endif // HIDCHANNEL_H
