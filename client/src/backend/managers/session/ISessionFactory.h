#ifndef ISESSIONFACTORY_H
#define ISESSIONFACTORY_H

#include <QObject>
#include <memory>
#include "backend/domain/models/KvmDevice.h"

class IControlPlane;
class IReachabilityProbe;
class HidChannel;
class JanusSignalingClient;
class QNetworkAccessManager;
class TcpReachabilityProbe;

/**
 * @brief Builds the per-session network objects
 *
 * HID and signaling clients are returned parented to the given object.
 */
class ISessionFactory {
public:
    virtual ~ISessionFactory() = default;

    virtual std::shared_ptr<IControlPlane> createControlPlane(const KvmDevice& device, const QString& authToken) = 0;
    virtual HidChannel* createHidChannel(QObject* parent) = 0;
    virtual JanusSignalingClient* createSignalingClient(QObject* parent) = 0;
    virtual IReachabilityProbe* reachabilityProbe() = 0;
};

/**
 * @brief Factory wiring real sockets, HTTPS and the WebRTC peer connection
 */
class NetworkSessionFactory : public QObject, public ISessionFactory {
    Q_OBJECT

public:
    explicit NetworkSessionFactory(QObject* parent = nullptr);
    ~NetworkSessionFactory() override = default;

    std::shared_ptr<IControlPlane> createControlPlane(const KvmDevice& device, const QString& authToken) override;
    HidChannel* createHidChannel(QObject* parent) override;
    JanusSignalingClient* createSignalingClient(QObject* parent) override;
    IReachabilityProbe* reachabilityProbe() override;

private:
    QNetworkAccessManager* m_network;
    TcpReachabilityProbe* m_reachability;
};

#endif // ISESSIONFACTORY_H
