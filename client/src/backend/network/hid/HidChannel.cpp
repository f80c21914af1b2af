#include "backend/network/hid/HidChannel.h"
#include "backend/network/hid/HidWireCodec.h"
#include "backend/network/hid/MouseMoveCoalescer.h"
#include "backend/network/ApplianceEndpoints.h"
#include "backend/network/IWebSocketChannel.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace {
    bool hidDebugEnabled() {
        static const bool enabled = qEnvironmentVariableIsSet("PERISCOPE_HID_DEBUG");
        return enabled;
    }
}

HidChannel::HidChannel(IWebSocketChannel* channel, QObject* parent)
    : QObject(parent)
    , m_channel(channel)
    , m_coalescer(new MouseMoveCoalescer([this](int x, int y) { writeFrame(HidWireCodec::encodeMouseMove(x, y)); }, this))
    , m_keepaliveTimer(new QTimer(this))
{
    m_channel->setParent(this);
    m_keepaliveTimer->setInterval(KEEPALIVE_INTERVAL_MS);
    connect(m_keepaliveTimer, &QTimer::timeout, this, &HidChannel::sendKeepalive);

    connect(m_channel, &IWebSocketChannel::opened, this, &HidChannel::onOpened);
    connect(m_channel, &IWebSocketChannel::closed, this, &HidChannel::onClosed);
    connect(m_channel, &IWebSocketChannel::errorOccurred, this, &HidChannel::onError);
    connect(m_channel, &IWebSocketChannel::textReceived, this, &HidChannel::onTextReceived);
}

HidChannel::~HidChannel() {
    m_keepaliveTimer->stop();
    m_coalescer->stop();
}

void HidChannel::connectTo(const KvmDevice& device, const QString& authToken) {
    teardown();
    m_active = true;
    m_lossReported = false;
    qDebug() << "HidChannel: Opening HID socket to" << device.endpointKey()
             << "token" << ApplianceEndpoints::redactToken(authToken);
    m_channel->open(ApplianceEndpoints::webSocketRequest(device, ApplianceEndpoints::HID_SOCKET_PATH, authToken, false));
}

void HidChannel::disconnect() {
    if (!m_active) return;
    teardown();
    qDebug() << "HidChannel: Disconnected";
    emit disconnected();
}

void HidChannel::teardown() {
    // Timers first so nothing writes to a socket that is going away
    m_keepaliveTimer->stop();
    m_coalescer->stop();
    m_active = false;
    m_channel->close();
}

bool HidChannel::isConnected() const {
    return m_active && m_channel->isOpen();
}

void HidChannel::sendKey(const QString& key, bool pressed, bool finish) {
    writeFrame(HidWireCodec::encodeKey(key, pressed));
    if (finish) {
        writeFrame(HidWireCodec::encodeKeyFinish());
    }
}

void HidChannel::sendMouseButton(const QString& button, bool pressed) {
    writeFrame(HidWireCodec::encodeMouseButton(button, pressed));
}

void HidChannel::sendMouseMove(int x, int y) {
    // An immediate position supersedes whatever the coalescer still holds
    m_coalescer->discardPending();
    writeFrame(HidWireCodec::encodeMouseMove(x, y));
}

void HidChannel::queueMouseMove(int x, int y) {
    if (!isConnected()) return;
    m_coalescer->enqueue(x, y);
}

void HidChannel::sendMouseRelative(int dx, int dy) {
    writeFrame(HidWireCodec::encodeMouseRelative(dx, dy));
}

void HidChannel::sendMouseWheel(int dx, int dy) {
    writeFrame(HidWireCodec::encodeMouseWheel(dx, dy));
}

bool HidChannel::sendEvent(const QString& eventType, const QJsonValue& event) {
    if (!isConnected()) return false;
    QJsonObject obj;
    obj["event_type"] = eventType;
    obj["event"] = event;
    return m_channel->sendText(QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)));
}

void HidChannel::writeFrame(const QByteArray& frame) {
    if (!isConnected()) {
        if (hidDebugEnabled()) qDebug() << "HidChannel: Dropping frame, socket not open" << frame.toHex();
        return;
    }
    if (hidDebugEnabled()) qDebug() << "HidChannel: >>" << frame.toHex();
    if (!m_channel->sendBinary(frame)) {
        qWarning() << "HidChannel: Failed to write frame opcode" << int(quint8(frame.at(0)));
    }
}

void HidChannel::sendKeepalive() {
    if (!sendEvent("ping", QJsonObject())) {
        qDebug() << "HidChannel: Keepalive skipped, socket not open";
    }
}

void HidChannel::onOpened() {
    if (!m_active) return;
    qDebug() << "HidChannel: Connected";
    m_keepaliveTimer->start();
    emit connected();
}

void HidChannel::onClosed() {
    if (!m_active) return;
    teardown();
    if (!m_lossReported) {
        m_lossReported = true;
        emit connectionLost(KvmError::transportFailed("HID connection closed"));
    }
}

void HidChannel::onError(const QString& error) {
    if (!m_active) return;
    teardown();
    if (!m_lossReported) {
        m_lossReported = true;
        emit connectionLost(KvmError::transportFailed(error));
    }
}

void HidChannel::onTextReceived(const QString& message) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "HidChannel: Dropping malformed message:" << error.errorString();
        return;
    }
    const QJsonObject obj = doc.object();
    const QString type = obj.value("event_type").toString();
    if (type.isEmpty()) {
        qWarning() << "HidChannel: Dropping message without event_type";
        return;
    }
    if (hidDebugEnabled()) qDebug() << "HidChannel: <<" << type;
    emit eventReceived(type, obj.value("event"));
}
