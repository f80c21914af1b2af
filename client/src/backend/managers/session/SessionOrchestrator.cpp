#include "backend/managers/session/SessionOrchestrator.h"
#include "backend/managers/session/ISessionFactory.h"
#include "backend/managers/devices/DeviceRegistry.h"
#include "backend/input/InputManager.h"
#include "backend/media/IMediaSession.h"
#include "backend/network/IControlPlane.h"
#include "backend/network/ReachabilityProbe.h"
#include "backend/network/hid/HidChannel.h"
#include "backend/network/signaling/JanusSignalingClient.h"
#include <QDebug>

SessionOrchestrator::SessionOrchestrator(ISessionFactory* factory, DeviceRegistry* registry, InputManager* input, QObject* parent)
    : QObject(parent)
    , m_factory(factory)
    , m_registry(registry)
    , m_input(input)
{
}

SessionOrchestrator::~SessionOrchestrator() {
    ++m_attempt;
    teardownSession();
}

void SessionOrchestrator::setFixedTarget(bool enabled, const QString& edidHex) {
    m_fixedTarget = enabled;
    m_edidHex = edidHex;
}

void SessionOrchestrator::setState(SessionState state) {
    if (m_state == state) return;
    qDebug() << "SessionOrchestrator:" << sessionStateToString(m_state) << "->" << sessionStateToString(state);
    m_state = state;
    publish(SessionEvent::stateChanged(state));
}

void SessionOrchestrator::publish(const SessionEvent& event) {
    emit sessionEvent(event);
}

// ---------------------------------------------------------------------------
// Connect

void SessionOrchestrator::connectTo(const KvmDevice& device, const QString& password) {
    if (!device.isValid()) {
        qWarning() << "SessionOrchestrator: Refusing to connect to invalid device" << device.getId();
        publish(SessionEvent::failure(KvmError::invalidConfiguration(
            QString("Invalid device address %1:%2").arg(device.getHost()).arg(device.getPort()))));
        return;
    }
    if (m_state != SessionState::Disconnected) {
        disconnect();
    }

    ++m_attempt;
    m_device = device;
    m_pendingPassword = password;
    m_authenticated = false;
    if (m_fixedTarget && m_device.getAuthToken().isEmpty() && m_registry) {
        m_device.setAuthToken(m_registry->store().loadToken());
    }
    if (m_registry) {
        m_registry->setActiveEndpoint(m_device.endpointKey());
    }

    qInfo() << "SessionOrchestrator: Connecting to" << m_device.getDisplayText();
    setState(SessionState::Connecting);
    checkReachability();
}

void SessionOrchestrator::checkReachability() {
    const quint64 attempt = m_attempt;
    QPointer<SessionOrchestrator> self(this);
    m_factory->reachabilityProbe()->probe(m_device.getHost(), m_device.getPort(), REACHABILITY_TIMEOUT_MS,
        [self, attempt](bool reachable, const QString& error) {
            if (!self || attempt != self->m_attempt) return;
            if (!reachable) {
                self->failSession(KvmError::connectionFailed(
                    QString("Cannot reach %1: %2").arg(self->m_device.endpointKey(), error)));
                return;
            }
            self->authenticate();
        });
}

void SessionOrchestrator::authenticate() {
    setState(SessionState::Authenticating);
    m_controlPlane = m_factory->createControlPlane(m_device, m_device.getAuthToken());

    const quint64 attempt = m_attempt;
    QPointer<SessionOrchestrator> self(this);
    m_controlPlane->checkAuth([self, attempt](const KvmError& error) {
        if (!self || attempt != self->m_attempt) return;
        if (!error.isError()) {
            self->onAuthenticated();
            return;
        }
        if (error.kind() != KvmErrorKind::AuthenticationFailed) {
            self->failSession(error);
            return;
        }
        const QString password = self->m_pendingPassword;
        self->m_pendingPassword.clear();
        if (password.isEmpty()) {
            self->enterAuthRequired();
        } else {
            self->login(password);
        }
    });
}

void SessionOrchestrator::login(const QString& password) {
    setState(SessionState::Authenticating);
    qDebug() << "SessionOrchestrator: Logging in as" << m_user;

    const quint64 attempt = m_attempt;
    QPointer<SessionOrchestrator> self(this);
    m_controlPlane->login(m_user, password, [self, attempt](const KvmError& error, const QString& token) {
        if (!self || attempt != self->m_attempt) return;
        if (error.isError()) {
            if (error.kind() == KvmErrorKind::AuthenticationFailed) {
                // Wrong password: stay parked so the caller can try again
                self->publish(SessionEvent::failure(error));
                self->enterAuthRequired();
                return;
            }
            self->failSession(error);
            return;
        }
        self->m_device.setAuthToken(token);
        self->onAuthenticated();
    });
}

void SessionOrchestrator::enterAuthRequired() {
    qInfo() << "SessionOrchestrator: Password required for" << m_device.endpointKey();
    setState(SessionState::AuthRequired);
    publish(SessionEvent::authRequired(m_device));
}

void SessionOrchestrator::submitPassword(const QString& password) {
    if (m_state != SessionState::AuthRequired) {
        qWarning() << "SessionOrchestrator: No password requested in state" << sessionStateToString(m_state);
        return;
    }
    login(password);
}

void SessionOrchestrator::cancelAuth() {
    if (m_state != SessionState::AuthRequired) return;
    qDebug() << "SessionOrchestrator: Authentication cancelled";
    ++m_attempt;
    teardownSession();
    setState(SessionState::Disconnected);
    publish(SessionEvent::disconnected("Authentication cancelled"));
}

void SessionOrchestrator::onAuthenticated() {
    m_authenticated = true;
    const QString token = m_controlPlane->authToken();
    if (!token.isEmpty()) {
        m_device.setAuthToken(token);
    }
    if (m_registry) {
        m_device = m_registry->persist(m_device);
    }
    if (m_fixedTarget && m_registry) {
        m_registry->store().saveToken(m_device.getAuthToken());
    }
    qInfo() << "SessionOrchestrator: Authenticated with" << m_device.endpointKey();

    const quint64 attempt = m_attempt;
    QPointer<SessionOrchestrator> self(this);
    m_controlPlane->setHidConnected(true, [self, attempt](const KvmError& error) {
        if (!self || attempt != self->m_attempt) return;
        if (error.isError()) {
            qWarning() << "SessionOrchestrator: Could not attach HID:" << error.toString();
        }
        self->startStreaming();
    });
}

void SessionOrchestrator::startStreaming() {
    if (!m_edidHex.isEmpty()) {
        m_controlPlane->setEdid(m_edidHex, [](const KvmError& error) {
            if (error.isError()) {
                qWarning() << "SessionOrchestrator: EDID push failed:" << error.toString();
            } else {
                qDebug() << "SessionOrchestrator: EDID pushed";
            }
        });
    }

    const QString token = m_device.getAuthToken();

    m_hid = m_factory->createHidChannel(this);
    connect(m_hid, &HidChannel::connectionLost, this, &SessionOrchestrator::failSession);
    m_hid->connectTo(m_device, token);
    if (m_input) {
        m_input->start(m_hid.data());
    }

    m_signaling = m_factory->createSignalingClient(this);
    connect(m_signaling, &JanusSignalingClient::streaming, this, &SessionOrchestrator::onStreaming);
    connect(m_signaling, &JanusSignalingClient::failed, this, &SessionOrchestrator::failSession);
    connect(m_signaling->media(), &IMediaSession::videoSizeChanged, this, &SessionOrchestrator::onVideoSizeChanged);
    m_signaling->connectTo(m_device, token);
}

void SessionOrchestrator::onStreaming() {
    if (m_state == SessionState::Streaming) return;
    qInfo() << "SessionOrchestrator: Streaming from" << m_device.endpointKey();
    setState(SessionState::Streaming);
    publish(SessionEvent::connected(m_device));
}

void SessionOrchestrator::onVideoSizeChanged(const QSize& size) {
    if (m_input) {
        m_input->setVideoSize(size);
    }
    publish(SessionEvent::videoSizeChanged(size));
}

// ---------------------------------------------------------------------------
// Teardown

void SessionOrchestrator::failSession(const KvmError& error) {
    if (m_state == SessionState::Disconnected) return;
    qWarning() << "SessionOrchestrator: Session failed in" << sessionStateToString(m_state) << ":" << error.toString();
    ++m_attempt;
    teardownSession();
    publish(SessionEvent::failure(error));
    setState(SessionState::Disconnected);
    publish(SessionEvent::disconnected(error.toString()));
}

void SessionOrchestrator::disconnect() {
    if (m_state == SessionState::Disconnected) return;
    qInfo() << "SessionOrchestrator: Disconnecting from" << m_device.endpointKey();
    ++m_attempt;
    teardownSession();
    setState(SessionState::Disconnected);
    publish(SessionEvent::disconnected());
}

void SessionOrchestrator::reconnect() {
    const KvmDevice device = m_device;
    if (!device.isValid()) {
        qWarning() << "SessionOrchestrator: Nothing to reconnect to";
        return;
    }
    disconnect();
    connectTo(device);
}

void SessionOrchestrator::teardownSession() {
    if (m_input) {
        m_input->stop();
    }
    if (m_signaling) {
        // Our own teardown must not come back as a failure
        QObject::disconnect(m_signaling.data(), nullptr, this, nullptr);
        QObject::disconnect(m_signaling->media(), nullptr, this, nullptr);
        m_signaling->disconnect();
        m_signaling->deleteLater();
        m_signaling = nullptr;
    }
    if (m_hid) {
        QObject::disconnect(m_hid.data(), nullptr, this, nullptr);
        m_hid->disconnect();
        m_hid->deleteLater();
        m_hid = nullptr;
    }
    if (m_controlPlane && m_authenticated) {
        std::shared_ptr<IControlPlane> plane = m_controlPlane;
        plane->setHidConnected(false, [plane](const KvmError& error) {
            if (error.isError()) {
                qDebug() << "SessionOrchestrator: Ignoring HID detach error:" << error.toString();
            }
        });
    }
    m_controlPlane.reset();
    m_authenticated = false;
    m_pendingPassword.clear();
    if (m_registry) {
        m_registry->setActiveEndpoint(QString());
    }
}
