#ifndef SESSIONORCHESTRATOR_H
#define SESSIONORCHESTRATOR_H

#include <QObject>
#include <QPointer>
#include <QSize>
#include <memory>
#include "backend/domain/models/KvmDevice.h"
#include "backend/domain/models/KvmError.h"
#include "backend/domain/session/SessionEvent.h"

class DeviceRegistry;
class HidChannel;
class IControlPlane;
class ISessionFactory;
class InputManager;
class JanusSignalingClient;

/**
 * @brief Owns the single active session and drives its lifecycle
 *
 * Disconnected -> Connecting -> Authenticating -> Streaming -> Disconnected,
 * with AuthRequired entered when the appliance rejects the stored token and
 * no password was given. Everything observable is published in order on
 * sessionEvent(). A failure after the session is up tears it down and
 * publishes Error then Disconnected; there is no automatic retry.
 */
class SessionOrchestrator : public QObject {
    Q_OBJECT

public:
    static constexpr int REACHABILITY_TIMEOUT_MS = 5000;

    SessionOrchestrator(ISessionFactory* factory, DeviceRegistry* registry, InputManager* input, QObject* parent = nullptr);
    ~SessionOrchestrator() override;

    void connectTo(const KvmDevice& device, const QString& password = QString());
    void submitPassword(const QString& password);
    void cancelAuth();
    void disconnect();
    void reconnect();

    SessionState state() const { return m_state; }
    KvmDevice currentDevice() const { return m_device; }
    bool hasSession() const { return m_state != SessionState::Disconnected; }

    void setUser(const QString& user) { m_user = user; }
    QString user() const { return m_user; }
    // Fixed-target deployments keep one token in settings and may push an EDID
    void setFixedTarget(bool enabled, const QString& edidHex = QString());
    bool isFixedTarget() const { return m_fixedTarget; }

    IControlPlane* controlPlane() const { return m_controlPlane.get(); }
    HidChannel* hidChannel() const { return m_hid; }
    JanusSignalingClient* signalingClient() const { return m_signaling; }

signals:
    void sessionEvent(const SessionEvent& event);

private:
    void setState(SessionState state);
    void publish(const SessionEvent& event);

    void checkReachability();
    void authenticate();
    void login(const QString& password);
    void enterAuthRequired();
    void onAuthenticated();
    void startStreaming();
    void onStreaming();
    void onVideoSizeChanged(const QSize& size);

    // Error during connect or a loss mid-session
    void failSession(const KvmError& error);
    void teardownSession();

    ISessionFactory* m_factory;
    DeviceRegistry* m_registry;
    InputManager* m_input;

    SessionState m_state = SessionState::Disconnected;
    KvmDevice m_device;
    QString m_user = "admin";
    bool m_fixedTarget = false;
    QString m_edidHex;

    std::shared_ptr<IControlPlane> m_controlPlane;
    QPointer<HidChannel> m_hid;
    QPointer<JanusSignalingClient> m_signaling;
    bool m_authenticated = false;
    QString m_pendingPassword;
    // Bumped whenever a session ends so late callbacks from it are ignored
    quint64 m_attempt = 0;
};

#endif // SESSIONORCHESTRATOR_H
