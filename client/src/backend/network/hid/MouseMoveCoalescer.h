#ifndef MOUSEMOVECOALESCER_H
#define MOUSEMOVECOALESCER_H

#include <QObject>
#include <QTimer>
#include <functional>

/**
 * @brief Fixed-rate drain for absolute mouse positions
 *
 * enqueue() overwrites any unsent position; every tick sends at most one
 * position, always the most recent one. The timer stops itself on a tick
 * with nothing pending and restarts on the next enqueue().
 */
class MouseMoveCoalescer : public QObject {
    Q_OBJECT

public:
    using Sender = std::function<void(int x, int y)>;

    // ~120 Hz
    static constexpr int TICK_INTERVAL_MS = 8;

    explicit MouseMoveCoalescer(Sender sender, QObject* parent = nullptr);
    ~MouseMoveCoalescer() override = default;

    void enqueue(int x, int y);
    // Cancels the timer and drops any unsent position
    void stop();
    // Forgets the unsent position, the timer winds down on its next tick
    void discardPending() { m_hasPending = false; }

    bool isRunning() const { return m_timer->isActive(); }
    bool hasPending() const { return m_hasPending; }

public slots:
    void tick();

private:
    Sender m_sender;
    QTimer* m_timer;
    bool m_hasPending = false;
    int m_pendingX = 0;
    int m_pendingY = 0;
};

#endif // MOUSEMOVECOALESCER_H
