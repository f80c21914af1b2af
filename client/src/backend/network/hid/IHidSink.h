#ifndef IHIDSINK_H
#define IHIDSINK_H

#include <QString>

/**
 * @brief Destination for forwarded input events
 *
 * All calls are fire-and-forget. Implementations drop events silently when
 * the underlying transport is not open.
 */
class IHidSink {
public:
    virtual ~IHidSink() = default;

    virtual void sendKey(const QString& key, bool pressed, bool finish = false) = 0;
    virtual void sendMouseButton(const QString& button, bool pressed) = 0;
    // Absolute position in device space, [-32767, 32767] on both axes
    virtual void sendMouseMove(int x, int y) = 0;
    // Coalesced variant of sendMouseMove
    virtual void queueMouseMove(int x, int y) = 0;
    virtual void sendMouseRelative(int dx, int dy) = 0;
    virtual void sendMouseWheel(int dx, int dy) = 0;
};

#endif // IHIDSINK_H
