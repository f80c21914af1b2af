#include "backend/input/InputManager.h"
#include "backend/input/KeyNameMapper.h"
#include "backend/input/VideoGeometry.h"
#include "backend/network/hid/HidWireCodec.h"
#include "backend/network/hid/IHidSink.h"
#include <QSettings>
#include <QtMath>
#include <QDebug>

namespace {
    const char* KEY_KEYBOARD_CAPTURE = "input/keyboardCapture";
    const char* KEY_MOUSE_CAPTURE = "input/mouseCapture";
    const char* KEY_RELATIVE_MOUSE = "input/relativeMouse";
}

InputManager::InputManager(QObject* parent)
    : QObject(parent)
{
}

void InputManager::start(IHidSink* sink) {
    if (m_sink) {
        stop();
    }
    m_sink = sink;
    m_hasLastPos = false;
    qDebug() << "InputManager: Started, keyboard" << m_keyboardEnabled << "mouse" << m_mouseEnabled
             << (m_relativeMouse ? "relative" : "absolute");
}

void InputManager::stop() {
    if (!m_sink) return;
    releaseAll();
    m_sink = nullptr;
    qDebug() << "InputManager: Stopped";
}

void InputManager::releaseAll() {
    if (!m_sink) return;
    // Keys released in reverse press order so modifiers go up last
    for (int i = m_pressedKeys.size() - 1; i >= 0; --i) {
        m_sink->sendKey(m_pressedKeys.at(i), false);
    }
    for (const QString& button : m_pressedButtons) {
        m_sink->sendMouseButton(button, false);
    }
    m_pressedKeys.clear();
    m_pressedButtons.clear();
    m_pendingMeta.clear();
    m_metaSent = false;
    m_hasLastPos = false;
}

void InputManager::setKeyboardCaptureEnabled(bool enabled) {
    if (m_keyboardEnabled == enabled) return;
    if (!enabled && m_sink) {
        for (int i = m_pressedKeys.size() - 1; i >= 0; --i) {
            m_sink->sendKey(m_pressedKeys.at(i), false);
        }
        m_pressedKeys.clear();
        m_pendingMeta.clear();
        m_metaSent = false;
    }
    m_keyboardEnabled = enabled;
    emit captureSettingsChanged();
}

void InputManager::setMouseCaptureEnabled(bool enabled) {
    if (m_mouseEnabled == enabled) return;
    if (!enabled && m_sink) {
        for (const QString& button : m_pressedButtons) {
            m_sink->sendMouseButton(button, false);
        }
        m_pressedButtons.clear();
    }
    m_mouseEnabled = enabled;
    m_hasLastPos = false;
    emit captureSettingsChanged();
}

void InputManager::setRelativeMouseEnabled(bool enabled) {
    if (m_relativeMouse == enabled) return;
    m_relativeMouse = enabled;
    m_hasLastPos = false;
    emit captureSettingsChanged();
}

void InputManager::loadSettings(QSettings& settings) {
    m_keyboardEnabled = settings.value(KEY_KEYBOARD_CAPTURE, true).toBool();
    m_mouseEnabled = settings.value(KEY_MOUSE_CAPTURE, true).toBool();
    m_relativeMouse = settings.value(KEY_RELATIVE_MOUSE, false).toBool();
    emit captureSettingsChanged();
}

void InputManager::saveSettings(QSettings& settings) const {
    settings.setValue(KEY_KEYBOARD_CAPTURE, m_keyboardEnabled);
    settings.setValue(KEY_MOUSE_CAPTURE, m_mouseEnabled);
    settings.setValue(KEY_RELATIVE_MOUSE, m_relativeMouse);
}

bool InputManager::handleKey(int qtKey, Qt::KeyboardModifiers modifiers, quint32 nativeScanCode, bool pressed, bool autoRepeat) {
    if (!m_sink || !m_keyboardEnabled) return false;
    if (autoRepeat) return true;

    const QString name = KeyNameMapper::keyName(qtKey, modifiers, nativeScanCode);
    if (name.isEmpty()) {
        qDebug() << "InputManager: Unmapped key" << Qt::hex << qtKey;
        return false;
    }
    processKey(name, pressed);
    return true;
}

void InputManager::processKey(const QString& keyName, bool pressed) {
    if (!m_sink || !m_keyboardEnabled || keyName.isEmpty()) return;

    if (KeyNameMapper::isMetaKey(keyName)) {
        if (pressed) {
            if (m_pendingMeta.isEmpty()) {
                m_pendingMeta = keyName;
                m_metaSent = false;
            }
            return;
        }
        if (keyName == m_pendingMeta) {
            if (m_metaSent) {
                sendKeyNow(keyName, false);
            }
            m_pendingMeta.clear();
            m_metaSent = false;
        } else if (m_pressedKeys.contains(keyName)) {
            sendKeyNow(keyName, false);
        }
        return;
    }

    // Plain modifiers leave a held Meta buffered, anything else completes the chord
    if (pressed && !m_pendingMeta.isEmpty() && !m_metaSent && !KeyNameMapper::isModifierKey(keyName)) {
        sendKeyNow(m_pendingMeta, true);
        m_metaSent = true;
    }
    sendKeyNow(keyName, pressed);
}

void InputManager::sendKeyNow(const QString& keyName, bool pressed) {
    if (pressed) {
        if (!m_pressedKeys.contains(keyName)) m_pressedKeys.append(keyName);
    } else {
        m_pressedKeys.removeAll(keyName);
    }
    m_sink->sendKey(keyName, pressed);
}

QPoint InputManager::toDevice(const QPointF& pos) const {
    return VideoGeometry::mapToDevice(pos, QSizeF(m_viewSize), QSizeF(m_videoSize));
}

void InputManager::handleMouseMove(const QPointF& pos) {
    if (!m_sink || !m_mouseEnabled) return;

    if (m_relativeMouse) {
        if (m_hasLastPos) {
            const int dx = HidWireCodec::clampInt8(qRound(pos.x() - m_lastPos.x()));
            const int dy = HidWireCodec::clampInt8(qRound(pos.y() - m_lastPos.y()));
            if (dx != 0 || dy != 0) {
                m_sink->sendMouseRelative(dx, dy);
            }
        }
        m_lastPos = pos;
        m_hasLastPos = true;
        return;
    }

    const QPoint device = toDevice(pos);
    m_sink->queueMouseMove(device.x(), device.y());
}

void InputManager::handleMouseButton(Qt::MouseButton button, bool pressed, const QPointF& pos) {
    if (!m_sink || !m_mouseEnabled) return;

    const QString name = KeyNameMapper::mouseButtonName(button);
    if (name.isEmpty()) return;

    if (pressed && !m_relativeMouse) {
        const QPoint device = toDevice(pos);
        m_sink->sendMouseMove(device.x(), device.y());
    }
    if (pressed) {
        if (!m_pressedButtons.contains(name)) m_pressedButtons.append(name);
    } else {
        m_pressedButtons.removeAll(name);
    }
    m_sink->sendMouseButton(name, pressed);
}

void InputManager::handleWheel(const QPoint& pixelDelta, const QPoint& angleDelta) {
    if (!m_sink || !m_mouseEnabled) return;

    // Angle deltas come in eighths of a degree
    const QPoint delta = pixelDelta.isNull() ? angleDelta / 8 : pixelDelta;
    const int dx = HidWireCodec::clampInt8(delta.x());
    const int dy = HidWireCodec::clampInt8(delta.y());
    if (dx == 0 && dy == 0) return;
    m_sink->sendMouseWheel(dx, dy);
}
