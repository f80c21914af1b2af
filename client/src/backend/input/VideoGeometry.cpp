#include "backend/input/VideoGeometry.h"
#include "backend/network/hid/HidWireCodec.h"
#include <QtMath>

namespace VideoGeometry {

QRectF contentRect(const QSizeF& viewSize, const QSizeF& videoSize) {
    const QRectF full(QPointF(0, 0), viewSize);
    if (viewSize.width() <= 0 || viewSize.height() <= 0) {
        return QRectF();
    }
    if (videoSize.width() <= 0 || videoSize.height() <= 0) {
        return full;
    }

    const qreal viewAspect = viewSize.width() / viewSize.height();
    const qreal videoAspect = videoSize.width() / videoSize.height();
    if (viewAspect > videoAspect) {
        const qreal contentWidth = viewSize.height() * videoAspect;
        return QRectF((viewSize.width() - contentWidth) / 2.0, 0, contentWidth, viewSize.height());
    }
    const qreal contentHeight = viewSize.width() / videoAspect;
    return QRectF(0, (viewSize.height() - contentHeight) / 2.0, viewSize.width(), contentHeight);
}

QPointF normalize(const QPointF& pointInView, const QRectF& content) {
    if (content.width() <= 0 || content.height() <= 0) {
        return QPointF(0, 0);
    }
    const qreal x = qBound(content.left(), pointInView.x(), content.right());
    const qreal y = qBound(content.top(), pointInView.y(), content.bottom());
    return QPointF(qBound<qreal>(0.0, (x - content.left()) / content.width(), 1.0),
                   qBound<qreal>(0.0, (y - content.top()) / content.height(), 1.0));
}

QPoint toAbsolute(const QPointF& normalized) {
    const qreal nx = qBound<qreal>(0.0, normalized.x(), 1.0);
    const qreal ny = qBound<qreal>(0.0, normalized.y(), 1.0);
    const qreal maxAxis = HidWireCodec::kAbsoluteMax;
    return QPoint(qRound((nx * 2.0 - 1.0) * maxAxis), qRound((ny * 2.0 - 1.0) * maxAxis));
}

QPoint mapToDevice(const QPointF& pointInView, const QSizeF& viewSize, const QSizeF& videoSize) {
    return toAbsolute(normalize(pointInView, contentRect(viewSize, videoSize)));
}

} // namespace VideoGeometry
