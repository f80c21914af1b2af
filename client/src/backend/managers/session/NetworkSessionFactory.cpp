#include "backend/managers/session/ISessionFactory.h"
#include "backend/media/RtcMediaSession.h"
#include "backend/network/ControlPlaneClient.h"
#include "backend/network/ReachabilityProbe.h"
#include "backend/network/WebSocketClient.h"
#include "backend/network/hid/HidChannel.h"
#include "backend/network/signaling/JanusSignalingClient.h"
#include <QNetworkAccessManager>

NetworkSessionFactory::NetworkSessionFactory(QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_reachability(new TcpReachabilityProbe(this))
{
}

std::shared_ptr<IControlPlane> NetworkSessionFactory::createControlPlane(const KvmDevice& device, const QString& authToken) {
    ControlPlaneClient* client = new ControlPlaneClient(device.getHost(), device.getPort(), authToken, m_network);
    // Last owner may be a reply callback running inside the client
    return std::shared_ptr<IControlPlane>(client, [](IControlPlane* plane) {
        static_cast<ControlPlaneClient*>(plane)->deleteLater();
    });
}

HidChannel* NetworkSessionFactory::createHidChannel(QObject* parent) {
    return new HidChannel(new WebSocketClient(), parent);
}

JanusSignalingClient* NetworkSessionFactory::createSignalingClient(QObject* parent) {
    return new JanusSignalingClient(new WebSocketClient(), new RtcMediaSession(), parent);
}

IReachabilityProbe* NetworkSessionFactory::reachabilityProbe() {
    return m_reachability;
}
