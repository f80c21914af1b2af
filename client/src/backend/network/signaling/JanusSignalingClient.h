#ifndef JANUSSIGNALINGCLIENT_H
#define JANUSSIGNALINGCLIENT_H

#include <QObject>
#include <QJsonObject>
#include <QTimer>
#include "backend/domain/models/KvmDevice.h"
#include "backend/domain/models/KvmError.h"
#include "backend/media/IMediaSession.h"
#include "backend/network/signaling/JanusTransactionRegistry.h"

class IWebSocketChannel;

/**
 * @brief Negotiates the video stream with the appliance's media gateway
 *
 * Idle -> SessionCreating -> HandleAttaching -> Watching -> Negotiating
 *      -> Streaming -> Disconnected | Failed
 *
 * Every RPC except trickle and keepalive registers a waiter keyed by its
 * transaction id. Inbound messages resolve a waiter first; unmatched ones
 * are dispatched on the "janus" verb. Teardown fails all waiters with
 * SignalingLost.
 */
class JanusSignalingClient : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        SessionCreating,
        HandleAttaching,
        Watching,
        Negotiating,
        Streaming,
        Disconnected,
        Failed
    };
    Q_ENUM(State)

    static constexpr int KEEPALIVE_INTERVAL_MS = 25000;
    static constexpr const char* PLUGIN_NAME = "janus.plugin.ustreamer";

    // Takes ownership of channel and media
    JanusSignalingClient(IWebSocketChannel* channel, IMediaSession* media, QObject* parent = nullptr);
    ~JanusSignalingClient() override;

    void connectTo(const KvmDevice& device, const QString& authToken);
    void disconnect();

    State state() const { return m_state; }
    qint64 sessionId() const { return m_sessionId; }
    qint64 handleId() const { return m_handleId; }
    int pendingTransactions() const { return m_transactions.pendingCount(); }
    IMediaSession* media() const { return m_media; }

    static QString stateToString(State state);

signals:
    void stateChanged(JanusSignalingClient::State state);
    void streaming();
    void failed(const KvmError& error);
    void disconnected();

private slots:
    void onChannelOpened();
    void onChannelClosed();
    void onChannelError(const QString& error);
    void onTextReceived(const QString& message);
    void onLocalAnswer(const QString& sdp);
    void onLocalCandidate(const QString& candidate, const QString& mid, int mlineIndex);
    void onGatheringComplete();
    void onMediaStatusChanged(MediaStatus status);
    void onNegotiationFailed(const QString& reason);
    void sendKeepalive();

private:
    using ResponseHandler = std::function<void(const QJsonObject& response)>;

    void setState(State state);
    // Sends an RPC that waits for a correlated response
    void call(QJsonObject message, ResponseHandler onSuccess);
    // Sends an RPC nobody waits for (trickle, keepalive)
    void notify(QJsonObject message);
    bool sendMessage(const QJsonObject& message);

    void createSession();
    void attachPlugin();
    void watchStream();
    void handleEvent(const QJsonObject& message);
    void onPluginResponse(const QJsonObject& response);
    void handleTrickle(const QJsonObject& message);
    void fail(const KvmError& error);
    void teardown();

    IWebSocketChannel* m_channel;
    IMediaSession* m_media;
    JanusTransactionRegistry m_transactions;
    QTimer* m_keepaliveTimer;
    State m_state = State::Idle;
    qint64 m_sessionId = 0;
    qint64 m_handleId = 0;
    // Bumped on teardown so completions from an old session are ignored
    quint64 m_generation = 0;
    bool m_tearingDown = false;
};

#endif // JANUSSIGNALINGCLIENT_H
