#include "backend/domain/models/KvmDevice.h"
#include <QJsonArray>
#include <QUuid>

QString deviceTypeToString(KvmDeviceType type) {
    switch (type) {
        case KvmDeviceType::GlinetComet: return "glinet_comet";
        case KvmDeviceType::Generic: return "generic";
        case KvmDeviceType::Custom: return "custom";
    }
    return "generic";
}

KvmDeviceType deviceTypeFromString(const QString& value) {
    if (value == "glinet_comet") return KvmDeviceType::GlinetComet;
    if (value == "custom") return KvmDeviceType::Custom;
    return KvmDeviceType::Generic;
}

QString deviceTypeDisplayName(KvmDeviceType type) {
    switch (type) {
        case KvmDeviceType::GlinetComet: return "GL.iNet Comet";
        case KvmDeviceType::Generic: return "Generic KVM";
        case KvmDeviceType::Custom: return "Custom KVM";
    }
    return "Generic KVM";
}

QString capabilityToString(KvmCapability capability) {
    switch (capability) {
        case KvmCapability::VideoStreaming: return "video_streaming";
        case KvmCapability::KeyboardInput: return "keyboard_input";
        case KvmCapability::MouseInput: return "mouse_input";
        case KvmCapability::VirtualMedia: return "virtual_media";
        case KvmCapability::PowerManagement: return "power_management";
    }
    return QString();
}

bool capabilityFromString(const QString& value, KvmCapability* out) {
    static const QList<KvmCapability> all = {
        KvmCapability::VideoStreaming, KvmCapability::KeyboardInput, KvmCapability::MouseInput,
        KvmCapability::VirtualMedia, KvmCapability::PowerManagement
    };
    for (KvmCapability c : all) {
        if (capabilityToString(c) == value) {
            if (out) *out = c;
            return true;
        }
    }
    return false;
}

KvmDevice::KvmDevice() {
}

KvmDevice::KvmDevice(const QString& id, const QString& name, const QString& host, int port, KvmDeviceType type)
    : m_id(id), m_name(name), m_host(host), m_port(port), m_type(type) {
}

KvmDevice KvmDevice::createManual(const QString& host, int port, KvmDeviceType type) {
    const QString id = QString("manual-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    KvmDevice device(id, QString("Manual KVM @ %1:%2").arg(host).arg(port), host, port, type);
    device.m_capabilities = { KvmCapability::VideoStreaming, KvmCapability::KeyboardInput, KvmCapability::MouseInput };
    return device;
}

KvmDevice KvmDevice::createDiscovered(const QString& host, int port, KvmDeviceType type, const QString& name) {
    KvmDevice device(QString("scanned-%1-%2").arg(host).arg(port), name, host, port, type);
    if (type == KvmDeviceType::GlinetComet) {
        device.m_capabilities = { KvmCapability::VideoStreaming, KvmCapability::KeyboardInput, KvmCapability::MouseInput,
                                  KvmCapability::VirtualMedia, KvmCapability::PowerManagement };
    } else {
        device.m_capabilities = { KvmCapability::VideoStreaming, KvmCapability::KeyboardInput, KvmCapability::MouseInput };
    }
    return device;
}

QString KvmDevice::savedIdFor(const QString& host, int port) {
    QString safeHost = host;
    safeHost.replace(':', '_');
    return QString("saved-%1-%2").arg(safeHost).arg(port);
}

QString KvmDevice::endpointKey(const QString& host, int port) {
    return QString("%1:%2").arg(host.toLower()).arg(port);
}

bool KvmDevice::isPinned() const {
    return m_id.startsWith("manual-") || m_id.startsWith("saved-");
}

QString KvmDevice::baseUrl() const {
    const QString host = m_host.contains(':') && !m_host.startsWith('[') ? QString("[%1]").arg(m_host) : m_host;
    return QString("https://%1:%2").arg(host).arg(m_port);
}

QString KvmDevice::getDisplayText() const {
    return QString("%1 (%2:%3)").arg(m_name, m_host).arg(m_port);
}

QJsonObject KvmDevice::toJson() const {
    QJsonObject obj;
    obj["host"] = m_host;
    obj["port"] = m_port;
    obj["name"] = m_name;
    obj["type"] = deviceTypeToString(m_type);
    if (!m_authToken.isEmpty()) obj["authToken"] = m_authToken;

    // Stable order keeps the stored blob diff-friendly
    QStringList caps;
    for (KvmCapability c : m_capabilities) caps.append(capabilityToString(c));
    caps.sort();
    obj["capabilities"] = QJsonArray::fromStringList(caps);
    return obj;
}

KvmDevice KvmDevice::fromJson(const QJsonObject& json, bool* ok) {
    KvmDevice device;
    device.m_host = json.value("host").toString().trimmed();
    device.m_port = json.value("port").toInt(0);
    device.m_name = json.value("name").toString();
    device.m_type = deviceTypeFromString(json.value("type").toString());
    device.m_authToken = json.value("authToken").toString();
    const QJsonArray caps = json.value("capabilities").toArray();
    for (const auto& v : caps) {
        KvmCapability c;
        if (capabilityFromString(v.toString(), &c)) device.m_capabilities.insert(c);
    }
    device.m_id = savedIdFor(device.m_host, device.m_port);
    if (device.m_name.isEmpty()) {
        device.m_name = QString("%1:%2").arg(device.m_host).arg(device.m_port);
    }
    if (ok) *ok = device.isValid();
    return device;
}
