#ifndef DEVICEDISCOVERY_H
#define DEVICEDISCOVERY_H

#include <QObject>
#include <QList>
#include <QPair>
#include <QStringList>
#include <functional>
#include "backend/domain/models/KvmDevice.h"

class QNetworkAccessManager;
class IReachabilityProbe;

/**
 * @brief LAN scan for KVM appliances
 *
 * Probes every host of the local private /24 networks on the usual web
 * ports, at most MAX_IN_FLIGHT at a time. A host answering the appliance
 * API (auth/check or init/is_inited) is listed as a GL.iNet Comet; one
 * whose landing page mentions a KVM keyword is listed as generic.
 */
class DeviceDiscovery : public QObject {
    Q_OBJECT

public:
    using Target = QPair<QString, int>;

    static constexpr int MAX_IN_FLIGHT = 64;
    static constexpr int PORT_CHECK_TIMEOUT_MS = 700;

    // Uses a TCP probe of its own when reachability is null
    explicit DeviceDiscovery(IReachabilityProbe* reachability = nullptr, QObject* parent = nullptr);
    ~DeviceDiscovery() override;

    void scan();
    // Results of an unfinished scan are dropped
    void cancel();
    bool isScanning() const { return m_scanning; }

    // Overrides the interface-derived host list
    void setTargets(const QList<Target>& targets) { m_targetOverride = targets; }
    // Default appliance addresses checked alongside the scan
    void setCommonTargets(const QList<Target>& targets) { m_commonTargets = targets; }
    int inFlightCount() const { return m_inFlight; }

    static QStringList localNetworkPrefixes();
    static QList<Target> buildTargets(const QStringList& prefixes);
    static QList<Target> commonTargets();
    static bool isPrivateIPv4(const QString& address);
    static bool looksLikeKvmPage(const QByteArray& body);

signals:
    void scanStarted(int total);
    void scanProgress(int done, int total);
    void scanFinished(const QList<KvmDevice>& devices);

private:
    void startNext();
    void checkService(const Target& target, std::function<void(bool found, const KvmDevice& device)> done);
    void probeApi(const Target& target, const QStringList& schemes, int schemeIndex, int pathIndex,
                  std::function<void(bool)> done);
    void probeLandingPage(const Target& target, const QStringList& schemes, int schemeIndex,
                          std::function<void(bool)> done);
    void probeCommonTargets(int index);
    void targetDone(bool found, const KvmDevice& device);
    void finishIfDone();

    QNetworkAccessManager* m_network;
    IReachabilityProbe* m_reachability;
    QList<Target> m_targetOverride;
    QList<Target> m_commonTargets;

    bool m_scanning = false;
    int m_generation = 0;
    QList<Target> m_queue;
    int m_nextIndex = 0;
    int m_inFlight = 0;
    int m_done = 0;
    int m_total = 0;
    bool m_commonDone = false;
    QList<KvmDevice> m_found;
};

#endif // DEVICEDISCOVERY_H
