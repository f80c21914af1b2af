#include "backend/managers/devices/DeviceRegistry.h"
#include <QSet>
#include <QDebug>
#include <algorithm>

DeviceRegistry::DeviceRegistry(const DeviceStore& store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
}

QList<KvmDevice> DeviceRegistry::deduplicated(const QList<KvmDevice>& devices) {
    QList<KvmDevice> unique;
    QSet<QString> seen;
    for (const KvmDevice& device : devices) {
        const QString key = device.endpointKey();
        if (seen.contains(key)) continue;
        seen.insert(key);
        unique.append(device);
    }
    std::stable_sort(unique.begin(), unique.end(), [](const KvmDevice& a, const KvmDevice& b) {
        return a.getName() < b.getName();
    });
    return unique;
}

void DeviceRegistry::setDevices(const QList<KvmDevice>& devices) {
    m_devices = deduplicated(devices);
    emit devicesChanged();
}

KvmDevice DeviceRegistry::findById(const QString& id, bool* found) const {
    for (const KvmDevice& device : m_devices) {
        if (device.getId() == id) {
            if (found) *found = true;
            return device;
        }
    }
    if (found) *found = false;
    return KvmDevice();
}

KvmDevice DeviceRegistry::findByEndpoint(const QString& host, int port, bool* found) const {
    const QString key = KvmDevice::endpointKey(host, port);
    for (const KvmDevice& device : m_devices) {
        if (device.endpointKey() == key) {
            if (found) *found = true;
            return device;
        }
    }
    if (found) *found = false;
    return KvmDevice();
}

void DeviceRegistry::loadPersisted() {
    const QList<KvmDevice> records = m_store.loadDevices();
    qDebug() << "DeviceRegistry: Loaded" << records.size() << "saved device(s)";
    // Saved records take precedence over whatever is already listed
    setDevices(records + m_devices);
}

KvmDevice DeviceRegistry::addManual(const QString& host, int port, KvmDeviceType type) {
    bool exists = false;
    const KvmDevice existing = findByEndpoint(host, port, &exists);
    if (exists && existing.isPinned()) {
        qDebug() << "DeviceRegistry: Manual entry for" << existing.endpointKey() << "already listed as" << existing.getId();
        return existing;
    }

    const KvmDevice device = KvmDevice::createManual(host.trimmed(), port, type);
    if (!device.isValid()) {
        qWarning() << "DeviceRegistry: Refusing invalid manual entry" << host << port;
        return KvmDevice();
    }
    // A manual entry replaces a discovered one for the same endpoint
    QList<KvmDevice> devices = m_devices;
    devices.prepend(device);
    setDevices(devices);
    qDebug() << "DeviceRegistry: Added" << device.getDisplayText();
    return device;
}

bool DeviceRegistry::remove(const KvmDevice& device) {
    if (!m_activeEndpoint.isEmpty() && device.endpointKey() == m_activeEndpoint) {
        qWarning() << "DeviceRegistry: Not removing" << device.endpointKey() << "while its session is active";
        return false;
    }
    QList<KvmDevice> devices = m_devices;
    const int before = devices.size();
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [&device](const KvmDevice& d) { return d.getId() == device.getId(); }),
                  devices.end());
    if (devices.size() == before) return false;
    setDevices(devices);
    return true;
}

bool DeviceRegistry::forget(const KvmDevice& device) {
    const QString key = device.endpointKey();
    if (!m_activeEndpoint.isEmpty() && key == m_activeEndpoint) {
        qWarning() << "DeviceRegistry: Not forgetting" << key << "while its session is active";
        return false;
    }

    m_store.remove(device.getHost(), device.getPort());
    QList<KvmDevice> devices = m_devices;
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [&key](const KvmDevice& d) { return d.endpointKey() == key; }),
                  devices.end());
    setDevices(devices);
    qDebug() << "DeviceRegistry: Forgot" << key;
    return true;
}

KvmDevice DeviceRegistry::persist(const KvmDevice& device) {
    m_store.upsert(device);

    KvmDevice saved = device;
    saved.setId(KvmDevice::savedIdFor(device.getHost(), device.getPort()));

    const QString key = device.endpointKey();
    QList<KvmDevice> devices;
    devices.append(saved);
    for (const KvmDevice& d : m_devices) {
        if (d.endpointKey() != key) devices.append(d);
    }
    setDevices(devices);
    qDebug() << "DeviceRegistry: Persisted" << saved.getId();
    return saved;
}

void DeviceRegistry::mergeDiscovered(const QList<KvmDevice>& discovered) {
    QList<KvmDevice> devices;
    for (const KvmDevice& d : m_devices) {
        if (d.isPinned()) devices.append(d);
    }
    const int pinned = devices.size();
    devices.append(discovered);
    setDevices(devices);
    qDebug() << "DeviceRegistry: Merged" << discovered.size() << "discovered device(s) with" << pinned << "pinned";
}
