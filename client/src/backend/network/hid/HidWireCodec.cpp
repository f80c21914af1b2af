#include "backend/network/hid/HidWireCodec.h"
#include <QtGlobal>

namespace HidWireCodec {

qint16 clampAbsolute(int value) {
    return static_cast<qint16>(qBound(-kAbsoluteMax, value, kAbsoluteMax));
}

qint8 clampInt8(int value) {
    return static_cast<qint8>(qBound(-128, value, 127));
}

namespace {
    QByteArray encodeNamed(quint8 opcode, const QString& name, bool pressed) {
        QByteArray payload;
        const QByteArray utf8 = name.toUtf8();
        payload.reserve(2 + utf8.size());
        payload.append(static_cast<char>(opcode));
        payload.append(static_cast<char>(pressed ? 0x01 : 0x00));
        payload.append(utf8);
        return payload;
    }

    QByteArray encodeDelta(quint8 opcode, int dx, int dy, bool squash) {
        QByteArray payload(4, '\0');
        payload[0] = static_cast<char>(opcode);
        payload[1] = static_cast<char>(squash ? 0x01 : 0x00);
        payload[2] = static_cast<char>(clampInt8(dx));
        payload[3] = static_cast<char>(clampInt8(dy));
        return payload;
    }
}

QByteArray encodeKey(const QString& key, bool pressed) {
    return encodeNamed(KeyEvent, key, pressed);
}

QByteArray encodeKeyFinish() {
    QByteArray payload(2, '\0');
    payload[0] = static_cast<char>(KeyEvent);
    return payload;
}

QByteArray encodeMouseButton(const QString& button, bool pressed) {
    return encodeNamed(MouseButton, button, pressed);
}

QByteArray encodeMouseMove(int x, int y) {
    const quint16 ux = static_cast<quint16>(clampAbsolute(x));
    const quint16 uy = static_cast<quint16>(clampAbsolute(y));
    QByteArray payload(5, '\0');
    payload[0] = static_cast<char>(MouseMove);
    payload[1] = static_cast<char>((ux >> 8) & 0xFF);
    payload[2] = static_cast<char>(ux & 0xFF);
    payload[3] = static_cast<char>((uy >> 8) & 0xFF);
    payload[4] = static_cast<char>(uy & 0xFF);
    return payload;
}

QByteArray encodeMouseRelative(int dx, int dy, bool squash) {
    return encodeDelta(MouseRelative, dx, dy, squash);
}

QByteArray encodeMouseWheel(int dx, int dy, bool squash) {
    return encodeDelta(MouseWheel, dx, dy, squash);
}

} // namespace HidWireCodec
