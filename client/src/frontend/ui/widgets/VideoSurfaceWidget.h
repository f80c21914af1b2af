#ifndef VIDEOSURFACEWIDGET_H
#define VIDEOSURFACEWIDGET_H

#include <QWidget>
#include <QSize>
#include <QString>

class InputManager;

// Capture surface for the remote screen. Forwards keyboard, pointer and
// wheel events to the input pipeline and paints the letterboxed video area
// with the current status line.
class VideoSurfaceWidget : public QWidget {
    Q_OBJECT

public:
    explicit VideoSurfaceWidget(InputManager* input, QWidget* parent = nullptr);

    void setVideoSize(const QSize& size);
    QSize videoSize() const { return m_videoSize; }
    void setStatusText(const QString& text);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void keyReleaseEvent(QKeyEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void focusOutEvent(QFocusEvent* event) override;
    // Keeps Tab and Backtab for the remote side
    bool focusNextPrevChild(bool next) override;
    QSize sizeHint() const override { return QSize(1280, 720); }

private:
    InputManager* m_input;
    QSize m_videoSize;
    QString m_statusText;
};

#endif // VIDEOSURFACEWIDGET_H
