#include "backend/media/RtcMediaSession.h"
#include "backend/media/H264SpsParser.h"
#include <rtc/rtc.hpp>
#include <QMetaObject>
#include <QDebug>

RtcMediaSession::RtcMediaSession(QObject* parent)
    : IMediaSession(parent)
{
}

RtcMediaSession::~RtcMediaSession() {
    releasePeerConnection();
}

bool RtcMediaSession::start() {
    releasePeerConnection();
    ++m_generation;
    m_status = MediaStatus::Connecting;
    m_lastDisconnectReason.clear();
    m_videoSize = QSize();

    try {
        // LAN appliances: host candidates only, no STUN/TURN
        rtc::Configuration config;
        m_peerConnection = std::make_shared<rtc::PeerConnection>(config);
    } catch (const std::exception& e) {
        qWarning() << "RtcMediaSession: Failed to create PeerConnection:" << e.what();
        m_peerConnection.reset();
        return false;
    }
    setupCallbacks();
    qDebug() << "RtcMediaSession: PeerConnection created";
    return true;
}

void RtcMediaSession::setupCallbacks() {
    const quint64 generation = m_generation;

    m_peerConnection->onLocalDescription([this, generation](rtc::Description description) {
        const QString type = QString::fromStdString(description.typeString());
        const QString sdp = QString::fromStdString(std::string(description));
        QMetaObject::invokeMethod(this, [this, generation, type, sdp]() {
            if (generation != m_generation) return;
            if (type != "answer") {
                qWarning() << "RtcMediaSession: Unexpected local description type" << type;
                return;
            }
            emit localAnswerReady(sdp);
        }, Qt::QueuedConnection);
    });

    m_peerConnection->onLocalCandidate([this, generation](rtc::Candidate candidate) {
        const QString line = QString::fromStdString(candidate.candidate());
        const QString mid = QString::fromStdString(candidate.mid());
        QMetaObject::invokeMethod(this, [this, generation, line, mid]() {
            if (generation != m_generation) return;
            // Single video m-line
            emit localCandidate(line, mid, 0);
        }, Qt::QueuedConnection);
    });

    m_peerConnection->onGatheringStateChange([this, generation](rtc::PeerConnection::GatheringState state) {
        if (state != rtc::PeerConnection::GatheringState::Complete) return;
        QMetaObject::invokeMethod(this, [this, generation]() {
            if (generation != m_generation) return;
            emit gatheringComplete();
        }, Qt::QueuedConnection);
    });

    m_peerConnection->onIceStateChange([this, generation](rtc::PeerConnection::IceState state) {
        QMetaObject::invokeMethod(this, [this, generation, state]() {
            if (generation != m_generation) return;
            switch (state) {
                case rtc::PeerConnection::IceState::Connected:
                case rtc::PeerConnection::IceState::Completed:
                    updateStatus(MediaStatus::Connected);
                    break;
                case rtc::PeerConnection::IceState::Disconnected:
                    updateStatus(MediaStatus::Lost, "Video connection lost");
                    break;
                case rtc::PeerConnection::IceState::Failed:
                    updateStatus(MediaStatus::Failed, "Video connection failed");
                    break;
                case rtc::PeerConnection::IceState::Closed:
                    updateStatus(MediaStatus::Lost, "Video connection closed");
                    break;
                default:
                    updateStatus(MediaStatus::Connecting);
                    break;
            }
        }, Qt::QueuedConnection);
    });

    m_peerConnection->onTrack([this, generation](std::shared_ptr<rtc::Track> track) {
        QMetaObject::invokeMethod(this, [this, generation, track]() {
            if (generation != m_generation) return;
            attachVideoTrack(track);
        }, Qt::QueuedConnection);
    });
}

void RtcMediaSession::attachVideoTrack(const std::shared_ptr<rtc::Track>& track) {
    const rtc::Description::Media description = track->description();
    if (description.type() != "video") {
        qDebug() << "RtcMediaSession: Ignoring" << QString::fromStdString(description.type()) << "track";
        return;
    }
    try {
        auto depacketizer = std::make_shared<rtc::H264RtpDepacketizer>();
        depacketizer->addToChain(std::make_shared<rtc::RtcpReceivingSession>());
        track->setMediaHandler(depacketizer);
    } catch (const std::exception& e) {
        qWarning() << "RtcMediaSession: Failed to set up H.264 depacketizer:" << e.what();
        emit negotiationFailed(QString("Video track setup failed: %1").arg(e.what()));
        return;
    }

    const quint64 generation = m_generation;
    track->onFrame([this, generation](rtc::binary data, rtc::FrameInfo info) {
        const QByteArray accessUnit(reinterpret_cast<const char*>(data.data()), static_cast<int>(data.size()));
        const quint32 timestamp = info.timestamp;
        QMetaObject::invokeMethod(this, [this, generation, accessUnit, timestamp]() {
            if (generation != m_generation) return;
            handleFrame(accessUnit, timestamp);
        }, Qt::QueuedConnection);
    });
    m_videoTrack = track;
    qDebug() << "RtcMediaSession: Video track attached, mid" << QString::fromStdString(track->mid());
}

void RtcMediaSession::handleFrame(const QByteArray& accessUnit, quint32 timestamp) {
    const QSize size = H264SpsParser::frameSizeFromAccessUnit(accessUnit);
    if (size.isValid() && size != m_videoSize) {
        qInfo() << "RtcMediaSession: Video size" << size;
        m_videoSize = size;
        emit videoSizeChanged(size);
    }
    emit videoFrameReceived(accessUnit, timestamp);
}

void RtcMediaSession::applyRemoteOffer(const QString& sdp) {
    if (!m_peerConnection) {
        emit negotiationFailed("No peer connection");
        return;
    }
    try {
        // Auto-negotiation answers as soon as the offer is applied
        m_peerConnection->setRemoteDescription(rtc::Description(sdp.toStdString(), rtc::Description::Type::Offer));
        qDebug() << "RtcMediaSession: Remote offer applied";
    } catch (const std::exception& e) {
        qWarning() << "RtcMediaSession: Failed to apply remote offer:" << e.what();
        emit negotiationFailed(QString::fromUtf8(e.what()));
    }
}

void RtcMediaSession::addRemoteCandidate(const QString& candidate, const QString& mid) {
    if (!m_peerConnection) return;
    try {
        m_peerConnection->addRemoteCandidate(rtc::Candidate(candidate.toStdString(), mid.toStdString()));
    } catch (const std::exception& e) {
        // A single bad candidate does not end the session
        qWarning() << "RtcMediaSession: Rejected remote candidate:" << e.what();
    }
}

void RtcMediaSession::updateStatus(MediaStatus status, const QString& reason) {
    if (!reason.isEmpty()) {
        m_lastDisconnectReason = reason;
    }
    if (m_status == status) return;
    qDebug() << "RtcMediaSession: Status" << mediaStatusToString(status) << reason;
    m_status = status;
    emit statusChanged(status);
}

void RtcMediaSession::close() {
    if (!m_peerConnection) return;
    releasePeerConnection();
    ++m_generation;
    updateStatus(MediaStatus::Lost, "Video connection closed");
}

void RtcMediaSession::releasePeerConnection() {
    if (m_videoTrack) {
        m_videoTrack->resetCallbacks();
        m_videoTrack.reset();
    }
    if (m_peerConnection) {
        m_peerConnection->resetCallbacks();
        try {
            m_peerConnection->close();
        } catch (const std::exception& e) {
            qWarning() << "RtcMediaSession: Error while closing PeerConnection:" << e.what();
        }
        m_peerConnection.reset();
    }
}
