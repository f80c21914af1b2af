#ifndef DEVICEREGISTRY_H
#define DEVICEREGISTRY_H

#include <QObject>
#include <QList>
#include <QString>
#include "backend/domain/models/KvmDevice.h"
#include "backend/managers/devices/DeviceStore.h"

/**
 * @brief In-memory device catalog backed by persisted records
 *
 * The catalog holds manual, saved and discovered entries. Entries sharing
 * (host, port) collapse to one, manual and saved entries winning over
 * discovered ones. The list is kept sorted by name (case-sensitive).
 */
class DeviceRegistry : public QObject {
    Q_OBJECT

public:
    explicit DeviceRegistry(const DeviceStore& store = DeviceStore(), QObject* parent = nullptr);
    ~DeviceRegistry() override = default;

    QList<KvmDevice> getDevices() const { return m_devices; }
    KvmDevice findById(const QString& id, bool* found = nullptr) const;
    KvmDevice findByEndpoint(const QString& host, int port, bool* found = nullptr) const;

    void loadPersisted();
    KvmDevice addManual(const QString& host, int port, KvmDeviceType type = KvmDeviceType::GlinetComet);
    // Catalog only, persisted records are kept
    bool remove(const KvmDevice& device);
    // Catalog and persisted record; refused for the active device
    bool forget(const KvmDevice& device);
    // Upserts the record and returns the device under its saved id
    KvmDevice persist(const KvmDevice& device);
    void mergeDiscovered(const QList<KvmDevice>& discovered);

    // Set by the session owner while a session is up
    void setActiveEndpoint(const QString& endpointKey) { m_activeEndpoint = endpointKey; }
    QString activeEndpoint() const { return m_activeEndpoint; }

    const DeviceStore& store() const { return m_store; }

    // Keeps the first entry per (host, port), then sorts by name
    static QList<KvmDevice> deduplicated(const QList<KvmDevice>& devices);

signals:
    void devicesChanged();

private:
    void setDevices(const QList<KvmDevice>& devices);

    DeviceStore m_store;
    QList<KvmDevice> m_devices;
    QString m_activeEndpoint;
};

#endif // DEVICEREGISTRY_H
