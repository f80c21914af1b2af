#include "backend/network/hid/MouseMoveCoalescer.h"

MouseMoveCoalescer::MouseMoveCoalescer(Sender sender, QObject* parent)
    : QObject(parent)
    , m_sender(std::move(sender))
    , m_timer(new QTimer(this))
{
    m_timer->setTimerType(Qt::PreciseTimer);
    m_timer->setInterval(TICK_INTERVAL_MS);
    connect(m_timer, &QTimer::timeout, this, &MouseMoveCoalescer::tick);
}

void MouseMoveCoalescer::enqueue(int x, int y) {
    m_pendingX = x;
    m_pendingY = y;
    m_hasPending = true;
    if (!m_timer->isActive()) {
        m_timer->start();
    }
}

void MouseMoveCoalescer::tick() {
    if (!m_hasPending) {
        m_timer->stop();
        return;
    }
    m_hasPending = false;
    if (m_sender) {
        m_sender(m_pendingX, m_pendingY);
    }
}

void MouseMoveCoalescer::stop() {
    m_timer->stop();
    m_hasPending = false;
}
