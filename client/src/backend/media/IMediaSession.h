#ifndef IMEDIASESSION_H
#define IMEDIASESSION_H

#include <QObject>
#include <QByteArray>
#include <QSize>
#include <QString>

enum class MediaStatus {
    Connecting,
    Connected,
    Lost,
    Failed
};

QString mediaStatusToString(MediaStatus status);

/**
 * @brief Receive-only real-time video peer connection
 *
 * The far end always offers; this side answers. Transport callbacks are
 * delivered on the thread that owns the object.
 */
class IMediaSession : public QObject {
    Q_OBJECT

public:
    explicit IMediaSession(QObject* parent = nullptr) : QObject(parent) {}
    ~IMediaSession() override = default;

    // Creates the peer connection; host candidates only
    virtual bool start() = 0;
    // Applies the remote offer; the answer arrives via localAnswerReady()
    virtual void applyRemoteOffer(const QString& sdp) = 0;
    virtual void addRemoteCandidate(const QString& candidate, const QString& mid) = 0;
    virtual void close() = 0;

    virtual MediaStatus status() const = 0;
    virtual QString lastDisconnectReason() const = 0;
    virtual QSize videoSize() const = 0;

signals:
    void localAnswerReady(const QString& sdp);
    void localCandidate(const QString& candidate, const QString& mid, int mlineIndex);
    void gatheringComplete();
    void statusChanged(MediaStatus status);
    void negotiationFailed(const QString& reason);
    void videoSizeChanged(const QSize& size);
    // One H.264 access unit in Annex-B form
    void videoFrameReceived(const QByteArray& accessUnit, quint32 rtpTimestamp);
};

#endif // IMEDIASESSION_H
