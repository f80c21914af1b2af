#ifndef INPUTMANAGER_H
#define INPUTMANAGER_H

#include <QObject>
#include <QPointF>
#include <QSize>
#include <QStringList>

class IHidSink;
class QSettings;

/**
 * @brief Turns local keyboard and pointer events into HID events
 *
 * Runs between start() and stop(), forwarding to the sink given to start().
 * Keyboard and mouse capture are toggled independently. Pointer positions
 * are mapped through the letterbox-aware video content rectangle into the
 * absolute device range. Absolute moves are coalesced by the sink; keys,
 * buttons and wheel steps are sent immediately in the order received.
 *
 * A lone Meta press is held back until another key is pressed while it is
 * down, so local Meta shortcuts never reach the target.
 */
class InputManager : public QObject {
    Q_OBJECT

public:
    explicit InputManager(QObject* parent = nullptr);
    ~InputManager() override = default;

    void start(IHidSink* sink);
    // Releases every key and button still held on the target
    void stop();
    bool isActive() const { return m_sink != nullptr; }
    // Key and button up for everything forwarded as down
    void releaseAll();

    bool isKeyboardCaptureEnabled() const { return m_keyboardEnabled; }
    bool isMouseCaptureEnabled() const { return m_mouseEnabled; }
    bool isRelativeMouseEnabled() const { return m_relativeMouse; }
    void setKeyboardCaptureEnabled(bool enabled);
    void setMouseCaptureEnabled(bool enabled);
    void setRelativeMouseEnabled(bool enabled);

    void loadSettings(QSettings& settings);
    void saveSettings(QSettings& settings) const;

    void setViewSize(const QSize& size) { m_viewSize = size; }
    void setVideoSize(const QSize& size) { m_videoSize = size; }
    QSize viewSize() const { return m_viewSize; }
    QSize videoSize() const { return m_videoSize; }

    // Returns false when the event was not forwarded
    bool handleKey(int qtKey, Qt::KeyboardModifiers modifiers, quint32 nativeScanCode, bool pressed, bool autoRepeat = false);
    void processKey(const QString& keyName, bool pressed);

    void handleMouseMove(const QPointF& pos);
    void handleMouseButton(Qt::MouseButton button, bool pressed, const QPointF& pos);
    void handleWheel(const QPoint& pixelDelta, const QPoint& angleDelta);

    QString pendingMeta() const { return m_pendingMeta; }
    QStringList pressedKeys() const { return m_pressedKeys; }

signals:
    void captureSettingsChanged();

private:
    void sendKeyNow(const QString& keyName, bool pressed);
    QPoint toDevice(const QPointF& pos) const;

    IHidSink* m_sink = nullptr;
    bool m_keyboardEnabled = true;
    bool m_mouseEnabled = true;
    bool m_relativeMouse = false;

    QSize m_viewSize;
    QSize m_videoSize;

    QString m_pendingMeta;
    bool m_metaSent = false;
    QStringList m_pressedKeys;
    QStringList m_pressedButtons;

    bool m_hasLastPos = false;
    QPointF m_lastPos;
};

#endif // INPUTMANAGER_H
