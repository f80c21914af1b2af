#include "backend/managers/devices/DeviceStore.h"
#include <QSettings>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>
#include <algorithm>

const char* DeviceStore::DEVICES_KEY = "devices/saved.v1";
const char* DeviceStore::TOKEN_KEY = "auth/token";

DeviceStore::DeviceStore(const QString& settingsFile)
    : m_settingsFile(settingsFile)
{
}

std::unique_ptr<QSettings> DeviceStore::openSettings() const {
    if (m_settingsFile.isEmpty()) {
        return std::make_unique<QSettings>("Periscope", "Client");
    }
    return std::make_unique<QSettings>(m_settingsFile, QSettings::IniFormat);
}

QList<KvmDevice> DeviceStore::loadDevices() const {
    auto settings = openSettings();
    const QByteArray raw = settings->value(DEVICES_KEY).toByteArray();
    QList<KvmDevice> devices;
    if (raw.isEmpty()) {
        return devices;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "DeviceStore: Ignoring unreadable device records:" << error.errorString();
        return devices;
    }

    for (const QJsonValue& value : doc.array()) {
        bool ok = false;
        const KvmDevice device = KvmDevice::fromJson(value.toObject(), &ok);
        if (!ok) {
            qWarning() << "DeviceStore: Skipping malformed device record";
            continue;
        }
        devices.append(device);
    }
    return devices;
}

void DeviceStore::saveDevices(const QList<KvmDevice>& devices) const {
    QJsonArray array;
    for (const KvmDevice& device : devices) {
        array.append(device.toJson());
    }
    auto settings = openSettings();
    settings->setValue(DEVICES_KEY, QJsonDocument(array).toJson(QJsonDocument::Compact));
    settings->sync();
}

void DeviceStore::upsert(const KvmDevice& device) const {
    QList<KvmDevice> devices = loadDevices();
    bool replaced = false;
    for (KvmDevice& existing : devices) {
        if (existing.sameEndpoint(device)) {
            existing = device;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        devices.append(device);
    }
    saveDevices(devices);
}

bool DeviceStore::remove(const QString& host, int port) const {
    const QString key = KvmDevice::endpointKey(host, port);
    QList<KvmDevice> devices = loadDevices();
    const int before = devices.size();
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [&key](const KvmDevice& d) { return d.endpointKey() == key; }),
                  devices.end());
    if (devices.size() == before) {
        return false;
    }
    saveDevices(devices);
    return true;
}

QString DeviceStore::loadToken() const {
    return openSettings()->value(TOKEN_KEY).toString();
}

void DeviceStore::saveToken(const QString& token) const {
    auto settings = openSettings();
    if (token.isEmpty()) {
        settings->remove(TOKEN_KEY);
    } else {
        settings->setValue(TOKEN_KEY, token);
    }
    settings->sync();
}
