#include "backend/network/signaling/JanusSignalingClient.h"
#include "backend/network/ApplianceEndpoints.h"
#include "backend/network/IWebSocketChannel.h"
#include <QJsonDocument>
#include <QUuid>
#include <QDebug>

namespace {
    bool signalingDebugEnabled() {
        static const bool enabled = qEnvironmentVariableIsSet("PERISCOPE_SIGNALING_DEBUG");
        return enabled;
    }

    // Janus reports failures as {"janus":"error","error":{"code":..,"reason":..}}
    QString errorReason(const QJsonObject& response) {
        const QJsonObject error = response.value("error").toObject();
        const QString reason = error.value("reason").toString();
        return reason.isEmpty() ? QString("Gateway error %1").arg(error.value("code").toInt()) : reason;
    }
}

JanusSignalingClient::JanusSignalingClient(IWebSocketChannel* channel, IMediaSession* media, QObject* parent)
    : QObject(parent)
    , m_channel(channel)
    , m_media(media)
    , m_keepaliveTimer(new QTimer(this))
{
    m_channel->setParent(this);
    m_media->setParent(this);

    m_keepaliveTimer->setInterval(KEEPALIVE_INTERVAL_MS);
    connect(m_keepaliveTimer, &QTimer::timeout, this, &JanusSignalingClient::sendKeepalive);

    connect(m_channel, &IWebSocketChannel::opened, this, &JanusSignalingClient::onChannelOpened);
    connect(m_channel, &IWebSocketChannel::closed, this, &JanusSignalingClient::onChannelClosed);
    connect(m_channel, &IWebSocketChannel::errorOccurred, this, &JanusSignalingClient::onChannelError);
    connect(m_channel, &IWebSocketChannel::textReceived, this, &JanusSignalingClient::onTextReceived);

    connect(m_media, &IMediaSession::localAnswerReady, this, &JanusSignalingClient::onLocalAnswer);
    connect(m_media, &IMediaSession::localCandidate, this, &JanusSignalingClient::onLocalCandidate);
    connect(m_media, &IMediaSession::gatheringComplete, this, &JanusSignalingClient::onGatheringComplete);
    connect(m_media, &IMediaSession::statusChanged, this, &JanusSignalingClient::onMediaStatusChanged);
    connect(m_media, &IMediaSession::negotiationFailed, this, &JanusSignalingClient::onNegotiationFailed);
}

JanusSignalingClient::~JanusSignalingClient() {
    m_keepaliveTimer->stop();
    ++m_generation;
    m_transactions.failAll(KvmError::signalingLost("Signaling client destroyed"));
}

QString JanusSignalingClient::stateToString(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::SessionCreating: return "SessionCreating";
        case State::HandleAttaching: return "HandleAttaching";
        case State::Watching: return "Watching";
        case State::Negotiating: return "Negotiating";
        case State::Streaming: return "Streaming";
        case State::Disconnected: return "Disconnected";
        case State::Failed: return "Failed";
    }
    return "Unknown";
}

void JanusSignalingClient::setState(State state) {
    if (m_state == state) return;
    qDebug() << "JanusSignalingClient:" << stateToString(m_state) << "->" << stateToString(state);
    m_state = state;
    emit stateChanged(state);
}

// ---------------------------------------------------------------------------
// Lifecycle

void JanusSignalingClient::connectTo(const KvmDevice& device, const QString& authToken) {
    if (m_state != State::Idle && m_state != State::Disconnected && m_state != State::Failed) {
        teardown();
    }
    setState(State::SessionCreating);
    qDebug() << "JanusSignalingClient: Opening signaling socket to" << device.endpointKey();
    m_channel->open(ApplianceEndpoints::webSocketRequest(device, ApplianceEndpoints::SIGNALING_SOCKET_PATH, authToken, true),
                    QStringList{ ApplianceEndpoints::SIGNALING_SUBPROTOCOL });
}

void JanusSignalingClient::disconnect() {
    if (m_state == State::Idle || m_state == State::Disconnected) return;
    teardown();
    setState(State::Disconnected);
    emit disconnected();
}

void JanusSignalingClient::fail(const KvmError& error) {
    if (m_tearingDown) return;
    if (m_state == State::Failed || m_state == State::Disconnected || m_state == State::Idle) return;
    qWarning() << "JanusSignalingClient: Failed in" << stateToString(m_state) << ":" << error.toString();
    teardown();
    setState(State::Failed);
    emit failed(error);
}

void JanusSignalingClient::teardown() {
    // Channel and media may report their own closure synchronously
    m_tearingDown = true;
    // Keepalive before the socket so nothing writes during close
    m_keepaliveTimer->stop();
    ++m_generation;
    const int failed = m_transactions.failAll(KvmError::signalingLost("Signaling connection lost"));
    if (failed > 0) {
        qDebug() << "JanusSignalingClient: Failed" << failed << "pending transactions";
    }
    m_channel->close();
    m_media->close();
    m_sessionId = 0;
    m_handleId = 0;
    m_tearingDown = false;
}

// ---------------------------------------------------------------------------
// Outbound

bool JanusSignalingClient::sendMessage(const QJsonObject& message) {
    const QString text = QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact));
    if (signalingDebugEnabled()) qDebug() << "JanusSignalingClient: >>" << text;
    return m_channel->sendText(text);
}

void JanusSignalingClient::call(QJsonObject message, ResponseHandler onSuccess) {
    const quint64 generation = m_generation;
    const QString verb = message.value("janus").toString();
    const QString transaction = m_transactions.registerWaiter(
        [this, generation, verb, onSuccess](const KvmError& error, const QJsonObject& response) {
            if (generation != m_generation) return;
            if (error.isError()) {
                fail(error);
                return;
            }
            if (response.value("janus").toString() == "error") {
                fail(KvmError::signalingLost(QString("%1 rejected: %2").arg(verb, errorReason(response))));
                return;
            }
            onSuccess(response);
        });
    message["transaction"] = transaction;
    if (!sendMessage(message)) {
        // fail() tears down, which fails the waiter registered above
        fail(KvmError::signalingLost(QString("Could not send %1").arg(verb)));
    }
}

void JanusSignalingClient::notify(QJsonObject message) {
    message["transaction"] = m_transactions.newTransactionId();
    if (!sendMessage(message)) {
        qDebug() << "JanusSignalingClient: Dropped" << message.value("janus").toString() << "(socket not open)";
    }
}

void JanusSignalingClient::createSession() {
    QJsonObject message;
    message["janus"] = "create";
    call(message, [this](const QJsonObject& response) {
        const QJsonValue id = response.value("data").toObject().value("id");
        if (!id.isDouble()) {
            fail(KvmError::decodingFailed("create response without session id"));
            return;
        }
        m_sessionId = id.toInteger();
        qDebug() << "JanusSignalingClient: Session" << m_sessionId;
        m_keepaliveTimer->start();
        attachPlugin();
    });
}

void JanusSignalingClient::attachPlugin() {
    setState(State::HandleAttaching);
    QJsonObject message;
    message["janus"] = "attach";
    message["session_id"] = m_sessionId;
    message["plugin"] = PLUGIN_NAME;
    message["opaque_id"] = QString("oid-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    call(message, [this](const QJsonObject& response) {
        const QJsonValue id = response.value("data").toObject().value("id");
        if (!id.isDouble()) {
            fail(KvmError::decodingFailed("attach response without handle id"));
            return;
        }
        m_handleId = id.toInteger();
        qDebug() << "JanusSignalingClient: Handle" << m_handleId;
        watchStream();
    });
}

void JanusSignalingClient::watchStream() {
    setState(State::Watching);
    if (!m_media->start()) {
        fail(KvmError::transportFailed("Could not create peer connection"));
        return;
    }

    QJsonObject params;
    params["orientation"] = 0;
    params["audio"] = false;
    params["video"] = true;
    params["mic"] = false;
    params["camera"] = false;
    QJsonObject body;
    body["request"] = "watch";
    body["params"] = params;

    QJsonObject message;
    message["janus"] = "message";
    message["session_id"] = m_sessionId;
    message["handle_id"] = m_handleId;
    message["body"] = body;
    call(message, [this](const QJsonObject& response) { onPluginResponse(response); });
}

void JanusSignalingClient::sendKeepalive() {
    if (m_sessionId == 0) return;
    QJsonObject message;
    message["janus"] = "keepalive";
    message["session_id"] = m_sessionId;
    notify(message);
}

// ---------------------------------------------------------------------------
// Inbound

void JanusSignalingClient::onChannelOpened() {
    if (m_state != State::SessionCreating) return;
    createSession();
}

void JanusSignalingClient::onChannelClosed() {
    fail(KvmError::signalingLost("Signaling connection closed"));
}

void JanusSignalingClient::onChannelError(const QString& error) {
    fail(KvmError::signalingLost(QString("Signaling connection lost: %1").arg(error)));
}

void JanusSignalingClient::onTextReceived(const QString& text) {
    if (signalingDebugEnabled()) qDebug() << "JanusSignalingClient: <<" << text;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "JanusSignalingClient: Dropping malformed message:" << parseError.errorString();
        return;
    }
    const QJsonObject message = doc.object();

    const QString transaction = message.value("transaction").toString();
    if (!transaction.isEmpty() && m_transactions.resolve(transaction, message)) {
        return;
    }

    const QString verb = message.value("janus").toString();
    if (verb == "event") {
        handleEvent(message);
    } else if (verb == "trickle") {
        handleTrickle(message);
    } else if (verb == "webrtcup") {
        qDebug() << "JanusSignalingClient: Gateway reports PeerConnection up";
    } else if (verb == "hangup") {
        fail(KvmError::signalingLost(QString("Stream hung up: %1").arg(message.value("reason").toString())));
    } else if (verb == "detached") {
        fail(KvmError::signalingLost("Plugin handle detached"));
    } else if (verb == "timeout") {
        fail(KvmError::signalingLost("Signaling session timed out"));
    } else if (verb == "media" || verb == "slowlink" || verb == "ack") {
        if (signalingDebugEnabled()) qDebug() << "JanusSignalingClient: Ignoring" << verb;
    } else {
        qDebug() << "JanusSignalingClient: Unhandled message" << verb;
    }
}

void JanusSignalingClient::handleEvent(const QJsonObject& message) {
    const QJsonObject data = message.value("plugindata").toObject().value("data").toObject();
    if (data.contains("error")) {
        fail(KvmError::signalingLost(QString("Stream error: %1").arg(data.value("error").toString())));
        return;
    }

    const QJsonObject jsep = message.value("jsep").toObject();
    if (jsep.value("type").toString() != "offer") {
        return;
    }
    const QString sdp = jsep.value("sdp").toString();
    if (sdp.isEmpty()) {
        fail(KvmError::decodingFailed("Offer without SDP"));
        return;
    }
    if (m_state != State::Watching && m_state != State::Negotiating && m_state != State::Streaming) {
        qWarning() << "JanusSignalingClient: Ignoring offer in" << stateToString(m_state);
        return;
    }
    setState(State::Negotiating);
    m_media->applyRemoteOffer(sdp);
}

void JanusSignalingClient::handleTrickle(const QJsonObject& message) {
    const QJsonObject candidate = message.value("candidate").toObject();
    if (candidate.value("completed").toBool(false)) {
        return;
    }
    const QString line = candidate.value("candidate").toString();
    if (line.isEmpty()) return;
    m_media->addRemoteCandidate(line, candidate.value("sdpMid").toString("0"));
}

// ---------------------------------------------------------------------------
// Media session events

void JanusSignalingClient::onLocalAnswer(const QString& sdp) {
    if (m_state != State::Negotiating || m_handleId == 0) return;

    QJsonObject body;
    body["request"] = "start";
    QJsonObject jsep;
    jsep["type"] = "answer";
    jsep["sdp"] = sdp;

    QJsonObject message;
    message["janus"] = "message";
    message["session_id"] = m_sessionId;
    message["handle_id"] = m_handleId;
    message["body"] = body;
    message["jsep"] = jsep;
    call(message, [this](const QJsonObject& response) { onPluginResponse(response); });
}

void JanusSignalingClient::onPluginResponse(const QJsonObject& response) {
    // The plugin may answer with its event before the gateway acks, reusing the transaction
    if (response.value("janus").toString() == "event") {
        handleEvent(response);
    }
}

void JanusSignalingClient::onLocalCandidate(const QString& candidate, const QString& mid, int mlineIndex) {
    if (m_handleId == 0) return;
    QJsonObject payload;
    payload["candidate"] = candidate;
    payload["sdpMid"] = mid.isEmpty() ? QString("0") : mid;
    payload["sdpMLineIndex"] = mlineIndex;

    QJsonObject message;
    message["janus"] = "trickle";
    message["session_id"] = m_sessionId;
    message["handle_id"] = m_handleId;
    message["candidate"] = payload;
    notify(message);
}

void JanusSignalingClient::onGatheringComplete() {
    if (m_handleId == 0) return;
    QJsonObject payload;
    payload["completed"] = true;

    QJsonObject message;
    message["janus"] = "trickle";
    message["session_id"] = m_sessionId;
    message["handle_id"] = m_handleId;
    message["candidate"] = payload;
    notify(message);
}

void JanusSignalingClient::onMediaStatusChanged(MediaStatus status) {
    switch (status) {
        case MediaStatus::Connected:
            if (m_state == State::Negotiating) {
                setState(State::Streaming);
                emit streaming();
            }
            break;
        case MediaStatus::Failed:
            fail(KvmError::transportFailed(m_media->lastDisconnectReason()));
            break;
        case MediaStatus::Lost:
        case MediaStatus::Connecting:
            break;
    }
}

void JanusSignalingClient::onNegotiationFailed(const QString& reason) {
    fail(KvmError::signalingLost(QString("Negotiation failed: %1").arg(reason)));
}
