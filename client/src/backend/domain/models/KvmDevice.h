#ifndef KVMDEVICE_H
#define KVMDEVICE_H

#include <QString>
#include <QList>
#include <QSet>
#include <QJsonObject>
#include <QMetaType>
#include <QHashFunctions>

enum class KvmDeviceType {
    GlinetComet,
    Generic,
    Custom
};

enum class KvmCapability {
    VideoStreaming,
    KeyboardInput,
    MouseInput,
    VirtualMedia,
    PowerManagement
};

inline size_t qHash(KvmCapability c, size_t seed = 0) noexcept { return ::qHash(static_cast<int>(c), seed); }

// Persisted (wire) names, e.g. "glinet_comet" / "video_streaming"
QString deviceTypeToString(KvmDeviceType type);
KvmDeviceType deviceTypeFromString(const QString& value);
QString deviceTypeDisplayName(KvmDeviceType type);
QString capabilityToString(KvmCapability capability);
bool capabilityFromString(const QString& value, KvmCapability* out);

/**
 * @brief One controllable target behind a KVM-over-IP appliance
 *
 * (host, port) is the durable identity. The id is prefix-tagged by origin
 * ("manual-", "saved-", "scanned-") and changes when a device is promoted
 * to a saved record.
 */
class KvmDevice {
public:
    KvmDevice();
    KvmDevice(const QString& id, const QString& name, const QString& host, int port, KvmDeviceType type);

    static KvmDevice createManual(const QString& host, int port, KvmDeviceType type = KvmDeviceType::GlinetComet);
    static KvmDevice createDiscovered(const QString& host, int port, KvmDeviceType type, const QString& name);

    static QString savedIdFor(const QString& host, int port);
    static QString endpointKey(const QString& host, int port);

    // Getters
    QString getId() const { return m_id; }
    QString getName() const { return m_name; }
    QString getHost() const { return m_host; }
    int getPort() const { return m_port; }
    QString getAuthToken() const { return m_authToken; }
    KvmDeviceType getType() const { return m_type; }
    QSet<KvmCapability> getCapabilities() const { return m_capabilities; }
    bool hasCapability(KvmCapability c) const { return m_capabilities.contains(c); }

    // Setters
    void setId(const QString& id) { m_id = id; }
    void setName(const QString& name) { m_name = name; }
    void setAuthToken(const QString& token) { m_authToken = token; }
    void setType(KvmDeviceType type) { m_type = type; }
    void setCapabilities(const QSet<KvmCapability>& caps) { m_capabilities = caps; }

    bool isValid() const { return !m_host.isEmpty() && m_port > 0 && m_port <= 65535; }
    bool isPinned() const;
    QString endpointKey() const { return endpointKey(m_host, m_port); }
    bool sameEndpoint(const KvmDevice& other) const { return endpointKey() == other.endpointKey(); }

    // "https://host:port", IPv6 literals bracketed
    QString baseUrl() const;
    QString getDisplayText() const;

    // Persisted record: host, port, name, type, authToken, capabilities
    QJsonObject toJson() const;
    static KvmDevice fromJson(const QJsonObject& json, bool* ok = nullptr);

private:
    QString m_id;
    QString m_name;
    QString m_host;
    int m_port = 443;
    QString m_authToken;
    KvmDeviceType m_type = KvmDeviceType::Generic;
    QSet<KvmCapability> m_capabilities;
};

Q_DECLARE_METATYPE(KvmDevice)

#endif // KVMDEVICE_H
