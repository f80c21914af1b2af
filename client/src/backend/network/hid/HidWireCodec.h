#ifndef HIDWIRECODEC_H
#define HIDWIRECODEC_H

#include <QByteArray>
#include <QString>

/**
 * @brief Binary frame encoder for the appliance HID WebSocket
 *
 * First byte is the opcode. Absolute coordinates are signed 16-bit
 * big-endian, relative and wheel deltas are signed 8-bit. Out-of-range
 * arguments are clamped, never wrapped.
 */
namespace HidWireCodec {
    enum Opcode : quint8 {
        KeyEvent = 0x01,
        MouseButton = 0x02,
        MouseMove = 0x03,
        MouseRelative = 0x04,
        MouseWheel = 0x05
    };

    constexpr int kAbsoluteMax = 32767;

    QByteArray encodeKey(const QString& key, bool pressed);
    // Sent after a key frame when the appliance should release everything
    QByteArray encodeKeyFinish();
    QByteArray encodeMouseButton(const QString& button, bool pressed);
    QByteArray encodeMouseMove(int x, int y);
    QByteArray encodeMouseRelative(int dx, int dy, bool squash = false);
    QByteArray encodeMouseWheel(int dx, int dy, bool squash = false);

    qint16 clampAbsolute(int value);
    qint8 clampInt8(int value);
}

#endif // HIDWIRECODEC_H
