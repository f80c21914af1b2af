#ifndef DEVICESTORE_H
#define DEVICESTORE_H

#include <QList>
#include <QString>
#include <memory>
#include "backend/domain/models/KvmDevice.h"

class QSettings;

/**
 * @brief Persisted device records and the fixed-target token
 *
 * Records live under "devices/saved.v1" as a JSON array, one object per
 * (host, port). By default the application settings are used; an explicit
 * INI file can be given instead.
 */
class DeviceStore {
public:
    static const char* DEVICES_KEY;
    static const char* TOKEN_KEY;

    explicit DeviceStore(const QString& settingsFile = QString());

    QList<KvmDevice> loadDevices() const;
    void saveDevices(const QList<KvmDevice>& devices) const;

    // Replaces the record with the same (host, port) or appends one
    void upsert(const KvmDevice& device) const;
    // Returns true when a record was removed
    bool remove(const QString& host, int port) const;

    QString loadToken() const;
    void saveToken(const QString& token) const;

    QString settingsFile() const { return m_settingsFile; }

private:
    std::unique_ptr<QSettings> openSettings() const;

    QString m_settingsFile;
};

#endif // DEVICESTORE_H
