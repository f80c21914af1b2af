#ifndef RTCMEDIASESSION_H
#define RTCMEDIASESSION_H

#include "backend/media/IMediaSession.h"
#include <memory>

namespace rtc {
class PeerConnection;
class Track;
}

/**
 * @brief libdatachannel peer connection answering a receive-only video offer
 *
 * libdatachannel invokes callbacks on its own threads; every callback is
 * re-posted to this object's thread before any state is touched.
 */
class RtcMediaSession : public IMediaSession {
    Q_OBJECT

public:
    explicit RtcMediaSession(QObject* parent = nullptr);
    ~RtcMediaSession() override;

    bool start() override;
    void applyRemoteOffer(const QString& sdp) override;
    void addRemoteCandidate(const QString& candidate, const QString& mid) override;
    void close() override;

    MediaStatus status() const override { return m_status; }
    QString lastDisconnectReason() const override { return m_lastDisconnectReason; }
    QSize videoSize() const override { return m_videoSize; }

private:
    void setupCallbacks();
    void attachVideoTrack(const std::shared_ptr<rtc::Track>& track);
    void updateStatus(MediaStatus status, const QString& reason = QString());
    void handleFrame(const QByteArray& accessUnit, quint32 timestamp);
    void releasePeerConnection();

    std::shared_ptr<rtc::PeerConnection> m_peerConnection;
    std::shared_ptr<rtc::Track> m_videoTrack;
    MediaStatus m_status = MediaStatus::Connecting;
    QString m_lastDisconnectReason;
    QSize m_videoSize;
    // Bumped per peer connection; callbacks from older ones are dropped
    quint64 m_generation = 0;
};

#endif // RTCMEDIASESSION_H
