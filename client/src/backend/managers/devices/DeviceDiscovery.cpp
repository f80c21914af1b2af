#include "backend/managers/devices/DeviceDiscovery.h"
#include "backend/network/ControlPlaneClient.h"
#include "backend/network/ReachabilityProbe.h"
#include <QNetworkAccessManager>
#include <QNetworkInterface>
#include <QHostAddress>
#include <QSet>
#include <QDebug>

namespace {
    const int KNOWN_PORTS[] = { 443, 8443, 80, 8080 };
    const char* const API_PATHS[] = { "api/auth/check", "api/init/is_inited" };
    constexpr int API_PATH_COUNT = 2;
    constexpr int LANDING_PAGE_SNIFF_BYTES = 4096;

    QStringList schemesFor(int port) {
        if (port == 443 || port == 8443) return { "https", "http" };
        return { "http", "https" };
    }

    bool isApiStatus(int status) {
        switch (status) {
            case 200: case 401: case 403:
            case 301: case 302: case 307: case 308:
                return true;
            default:
                return false;
        }
    }

    QString targetLabel(const DeviceDiscovery::Target& target) {
        return QString("%1:%2").arg(target.first).arg(target.second);
    }
}

DeviceDiscovery::DeviceDiscovery(IReachabilityProbe* reachability, QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_reachability(reachability)
    , m_commonTargets(commonTargets())
{
    if (!m_reachability) {
        m_reachability = new TcpReachabilityProbe(this);
    }
}

DeviceDiscovery::~DeviceDiscovery() {
    ++m_generation;
}

bool DeviceDiscovery::isPrivateIPv4(const QString& address) {
    const QStringList parts = address.split('.');
    if (parts.size() != 4) return false;
    const int a = parts.at(0).toInt();
    const int b = parts.at(1).toInt();
    return a == 10 || (a == 192 && b == 168) || (a == 172 && b >= 16 && b <= 31);
}

QStringList DeviceDiscovery::localNetworkPrefixes() {
    QSet<QString> prefixes;
    const QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface& iface : interfaces) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) || flags.testFlag(QNetworkInterface::IsLoopBack)) continue;
        for (const QNetworkAddressEntry& entry : iface.addressEntries()) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() != QAbstractSocket::IPv4Protocol) continue;
            const QString text = ip.toString();
            if (!isPrivateIPv4(text)) continue;
            // /24 around the interface address regardless of its real netmask
            prefixes.insert(text.section('.', 0, 2));
        }
    }

    if (prefixes.isEmpty()) {
        prefixes << "192.168.1" << "192.168.0" << "10.0.0";
    }
    prefixes.insert("192.168.200");

    QStringList sorted(prefixes.begin(), prefixes.end());
    sorted.sort();
    return sorted;
}

QList<DeviceDiscovery::Target> DeviceDiscovery::buildTargets(const QStringList& prefixes) {
    QList<Target> targets;
    targets.reserve(prefixes.size() * 254 * 4);
    for (const QString& prefix : prefixes) {
        for (int i = 1; i <= 254; ++i) {
            const QString host = QString("%1.%2").arg(prefix).arg(i);
            for (int port : KNOWN_PORTS) {
                targets.append(Target(host, port));
            }
        }
    }
    return targets;
}

QList<DeviceDiscovery::Target> DeviceDiscovery::commonTargets() {
    return {
        Target("192.168.200.5", 443),
        Target("192.168.200.1", 443),
        Target("192.168.200.1", 80),
    };
}

bool DeviceDiscovery::looksLikeKvmPage(const QByteArray& body) {
    // "kvm" also covers "kvmd" and "glkvm"
    const QString text = QString::fromUtf8(body.left(LANDING_PAGE_SNIFF_BYTES)).toLower();
    return text.contains("kvm") || text.contains("comet");
}

void DeviceDiscovery::scan() {
    if (m_scanning) {
        qDebug() << "DeviceDiscovery: Scan already running";
        return;
    }
    ++m_generation;
    m_scanning = true;
    m_queue = m_targetOverride.isEmpty() ? buildTargets(localNetworkPrefixes()) : m_targetOverride;
    m_nextIndex = 0;
    m_inFlight = 0;
    m_done = 0;
    m_commonDone = false;
    m_found.clear();

    m_total = m_queue.size() + m_commonTargets.size();
    qInfo() << "DeviceDiscovery: Scanning" << m_queue.size() << "targets," << m_commonTargets.size() << "common targets";
    emit scanStarted(m_total);

    startNext();
    probeCommonTargets(0);
}

void DeviceDiscovery::cancel() {
    if (!m_scanning) return;
    ++m_generation;
    m_scanning = false;
    m_queue.clear();
    m_found.clear();
    qDebug() << "DeviceDiscovery: Scan cancelled";
}

void DeviceDiscovery::startNext() {
    const int generation = m_generation;
    while (m_inFlight < MAX_IN_FLIGHT && m_nextIndex < m_queue.size()) {
        const Target target = m_queue.at(m_nextIndex++);
        ++m_inFlight;
        checkService(target, [this, generation](bool found, const KvmDevice& device) {
            if (generation != m_generation) return;
            --m_inFlight;
            targetDone(found, device);
            startNext();
            finishIfDone();
        });
    }
}

void DeviceDiscovery::checkService(const Target& target, std::function<void(bool, const KvmDevice&)> done) {
    const QStringList schemes = schemesFor(target.second);
    probeApi(target, schemes, 0, 0, [this, target, schemes, done](bool isAppliance) {
        if (isAppliance) {
            done(true, KvmDevice::createDiscovered(target.first, target.second, KvmDeviceType::GlinetComet,
                                                   QString("GLKVM @ %1").arg(targetLabel(target))));
            return;
        }
        probeLandingPage(target, schemes, 0, [target, done](bool isKvm) {
            if (!isKvm) {
                done(false, KvmDevice());
                return;
            }
            done(true, KvmDevice::createDiscovered(target.first, target.second, KvmDeviceType::Generic,
                                                   QString("KVM @ %1").arg(targetLabel(target))));
        });
    });
}

void DeviceDiscovery::probeApi(const Target& target, const QStringList& schemes, int schemeIndex, int pathIndex,
                               std::function<void(bool)> done) {
    if (schemeIndex >= schemes.size()) {
        done(false);
        return;
    }
    if (pathIndex >= API_PATH_COUNT) {
        probeApi(target, schemes, schemeIndex + 1, 0, done);
        return;
    }

    ControlPlaneClient* client = new ControlPlaneClient(target.first, target.second, QString(), m_network, this);
    client->setScheme(schemes.at(schemeIndex));
    client->probe(API_PATHS[pathIndex], [this, client, target, schemes, schemeIndex, pathIndex, done](
                      const KvmError& error, int status, const QByteArray&) {
        client->deleteLater();
        if (!error.isError() && isApiStatus(status)) {
            done(true);
            return;
        }
        // Nothing listens on this scheme, the other path would fail the same way
        const int nextPath = error.isError() ? API_PATH_COUNT : pathIndex + 1;
        probeApi(target, schemes, schemeIndex, nextPath, done);
    });
}

void DeviceDiscovery::probeLandingPage(const Target& target, const QStringList& schemes, int schemeIndex,
                                       std::function<void(bool)> done) {
    if (schemeIndex >= schemes.size()) {
        done(false);
        return;
    }

    ControlPlaneClient* client = new ControlPlaneClient(target.first, target.second, QString(), m_network, this);
    client->setScheme(schemes.at(schemeIndex));
    client->probe("/", [this, client, target, schemes, schemeIndex, done](
                      const KvmError& error, int status, const QByteArray& body) {
        client->deleteLater();
        if (!error.isError() && status >= 200 && status <= 399 && looksLikeKvmPage(body)) {
            done(true);
            return;
        }
        probeLandingPage(target, schemes, schemeIndex + 1, done);
    });
}

void DeviceDiscovery::probeCommonTargets(int index) {
    if (index >= m_commonTargets.size()) {
        m_commonDone = true;
        finishIfDone();
        return;
    }

    const int generation = m_generation;
    const Target target = m_commonTargets.at(index);
    checkService(target, [this, generation, target, index](bool found, const KvmDevice& device) {
        if (generation != m_generation) return;
        if (found) {
            targetDone(true, device);
            probeCommonTargets(index + 1);
            return;
        }
        // An open port on a default address is listed even when the probes could not identify it
        m_reachability->probe(target.first, target.second, PORT_CHECK_TIMEOUT_MS,
            [this, generation, target, index](bool reachable, const QString&) {
                if (generation != m_generation) return;
                if (reachable) {
                    targetDone(true, KvmDevice::createDiscovered(target.first, target.second, KvmDeviceType::GlinetComet,
                                                                 QString("KVM @ %1").arg(targetLabel(target))));
                } else {
                    targetDone(false, KvmDevice());
                }
                probeCommonTargets(index + 1);
            });
    });
}

void DeviceDiscovery::targetDone(bool found, const KvmDevice& device) {
    ++m_done;
    if (found) {
        bool duplicate = false;
        for (const KvmDevice& existing : m_found) {
            if (existing.sameEndpoint(device)) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            qInfo() << "DeviceDiscovery: Found" << device.getDisplayText();
            m_found.append(device);
        }
    }
    emit scanProgress(m_done, m_total);
}

void DeviceDiscovery::finishIfDone() {
    if (!m_scanning) return;
    if (m_inFlight > 0 || m_nextIndex < m_queue.size() || !m_commonDone) return;

    m_scanning = false;
    qInfo() << "DeviceDiscovery: Scan finished," << m_found.size() << "device(s) found";
    emit scanFinished(m_found);
}
