#ifndef APPLIANCETYPES_H
#define APPLIANCETYPES_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QJsonObject>

// Typed payloads of the appliance control-plane API. Each decoder follows
// the fromJson(json, ok) convention: ok is set to false when a required
// field is missing or has the wrong JSON type.

struct InitStatus {
    QString countryCode;
    bool isInited = false;

    static InitStatus fromJson(const QJsonObject& json, bool* ok = nullptr);
};

struct TurnCredentials {
    QString username;
    QString password;
    int ttl = 0;
    QStringList uris;

    static TurnCredentials fromJson(const QJsonObject& json, bool* ok = nullptr);
};

struct SystemConfigShortcut {
    QStringList keys;
    QString label;
};

struct SystemConfig {
    QList<SystemConfigShortcut> shortcuts;
    int orientation = 0;
    int streamQuality = 0;
    QString videoMode;
    bool showCursor = true;
    int mousePolling = 0;
    bool mouseControl = true;
    int relativeSense = 0;
    int scrollRate = 0;
    QString reverseScrolling;
    bool keyboardControl = true;
    QString themeMode;
    bool mouseJiggle = false;
    QString keymap;
    bool gotMutedPanelTip = false;
    bool isAbsoluteMouse = true;
    int fingerbotStrength = 0;
    QString videoProcessing;

    QJsonObject toJson() const;
    static SystemConfig fromJson(const QJsonObject& json, bool* ok = nullptr);
};

struct StreamerState {
    struct MinMax {
        int min = 0;
        int max = 0;
    };

    bool hasFeatures = false;
    bool featureQuality = false;
    bool featureResolution = false;
    bool featureH264 = false;
    bool featureZeroDelay = false;

    bool hasLimits = false;
    MinMax desiredFpsLimits;
    MinMax h264BitrateLimits;
    MinMax h264GopLimits;

    // Params are optional on the wire; -1 / empty means "not reported"
    int desiredFps = -1;
    int quality = -1;
    int h264Bitrate = -1;
    int h264Gop = -1;
    int zeroDelay = -1;
    QString resolution;

    static StreamerState fromJson(const QJsonObject& json, bool* ok = nullptr);
};

struct HidKeymaps {
    QString defaultKeymap;
    QStringList available;

    static HidKeymaps fromJson(const QJsonObject& json, bool* ok = nullptr);
};

struct MsdPartitionDevice {
    QString path;
    qint64 size = 0;
    QString uuid;
    QString filesystem;
    QString label;
    bool isCurrent = false;

    static MsdPartitionDevice fromJson(const QJsonObject& json, bool* ok = nullptr);
};

// Keyed by the device name reported by the appliance
using MsdPartitionMap = QMap<QString, MsdPartitionDevice>;
MsdPartitionMap msdPartitionsFromJson(const QJsonObject& json, bool* ok = nullptr);

struct MsdWriteResult {
    QString imageName;
    qint64 size = 0;
    qint64 written = 0;

    static MsdWriteResult fromJson(const QJsonObject& json, bool* ok = nullptr);
};

enum class AtxPowerAction { On, Off, OffHard, ResetHard };
enum class AtxButton { Power, PowerLong, Reset };

QString atxPowerActionToString(AtxPowerAction action);
QString atxButtonToString(AtxButton button);

#endif // APPLIANCETYPES_H
