#ifndef VIDEOGEOMETRY_H
#define VIDEOGEOMETRY_H

#include <QPoint>
#include <QPointF>
#include <QRectF>
#include <QSizeF>

// Pointer mapping from the capture surface to device coordinates.
// The video is fitted into the view preserving aspect ratio; bars on the
// sides (pillarbox) or top/bottom (letterbox) are outside the content.
namespace VideoGeometry {
    // Whole view when the video size is unknown
    QRectF contentRect(const QSizeF& viewSize, const QSizeF& videoSize);
    // [0,1] on both axes, points outside the content are clamped to its edge
    QPointF normalize(const QPointF& pointInView, const QRectF& content);
    // [0,1] -> [-32767, 32767], (0.5, 0.5) -> (0, 0)
    QPoint toAbsolute(const QPointF& normalized);
    QPoint mapToDevice(const QPointF& pointInView, const QSizeF& viewSize, const QSizeF& videoSize);
}

#endif // VIDEOGEOMETRY_H
