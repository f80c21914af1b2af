#include "frontend/ui/widgets/VideoSurfaceWidget.h"
#include "backend/input/InputManager.h"
#include "backend/input/VideoGeometry.h"
#include <QKeyEvent>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QPainter>

VideoSurfaceWidget::VideoSurfaceWidget(InputManager* input, QWidget* parent)
    : QWidget(parent)
    , m_input(input)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setMinimumSize(320, 180);
}

void VideoSurfaceWidget::setVideoSize(const QSize& size) {
    if (m_videoSize == size) return;
    m_videoSize = size;
    m_input->setVideoSize(size);
    update();
}

void VideoSurfaceWidget::setStatusText(const QString& text) {
    if (m_statusText == text) return;
    m_statusText = text;
    update();
}

void VideoSurfaceWidget::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter p(this);
    p.fillRect(rect(), Qt::black);

    const QRectF content = VideoGeometry::contentRect(QSizeF(size()), QSizeF(m_videoSize));
    if (!m_videoSize.isEmpty()) {
        p.fillRect(content, QColor(24, 24, 28));
        p.setPen(QColor(60, 60, 68));
        p.drawRect(content.adjusted(0, 0, -1, -1));
    }

    if (!m_statusText.isEmpty()) {
        QFont f = font();
        f.setPointSizeF(f.pointSizeF() * 1.2);
        p.setFont(f);
        p.setPen(QColor(220, 220, 225));
        p.drawText(rect(), Qt::AlignCenter | Qt::TextWordWrap, m_statusText);
    }
}

void VideoSurfaceWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    m_input->setViewSize(size());
}

void VideoSurfaceWidget::keyPressEvent(QKeyEvent* event) {
    if (m_input->handleKey(event->key(), event->modifiers(), event->nativeScanCode(), true, event->isAutoRepeat())) {
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}

void VideoSurfaceWidget::keyReleaseEvent(QKeyEvent* event) {
    if (m_input->handleKey(event->key(), event->modifiers(), event->nativeScanCode(), false, event->isAutoRepeat())) {
        event->accept();
        return;
    }
    QWidget::keyReleaseEvent(event);
}

void VideoSurfaceWidget::mouseMoveEvent(QMouseEvent* event) {
    m_input->handleMouseMove(event->position());
    event->accept();
}

void VideoSurfaceWidget::mousePressEvent(QMouseEvent* event) {
    setFocus(Qt::MouseFocusReason);
    m_input->handleMouseButton(event->button(), true, event->position());
    event->accept();
}

void VideoSurfaceWidget::mouseReleaseEvent(QMouseEvent* event) {
    m_input->handleMouseButton(event->button(), false, event->position());
    event->accept();
}

void VideoSurfaceWidget::wheelEvent(QWheelEvent* event) {
    m_input->handleWheel(event->pixelDelta(), event->angleDelta());
    event->accept();
}

void VideoSurfaceWidget::focusOutEvent(QFocusEvent* event) {
    // Keys released while unfocused never arrive here
    if (m_input->isActive()) {
        m_input->releaseAll();
    }
    QWidget::focusOutEvent(event);
}

bool VideoSurfaceWidget::focusNextPrevChild(bool next) {
    Q_UNUSED(next);
    return false;
}
