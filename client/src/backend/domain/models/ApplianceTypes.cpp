#include "backend/domain/models/ApplianceTypes.h"
#include <QJsonArray>
#include <QJsonValue>

namespace {
    bool requireString(const QJsonObject& json, const char* key, QString* out) {
        const QJsonValue v = json.value(QLatin1String(key));
        if (!v.isString()) return false;
        *out = v.toString();
        return true;
    }

    bool requireBool(const QJsonObject& json, const char* key, bool* out) {
        const QJsonValue v = json.value(QLatin1String(key));
        if (!v.isBool()) return false;
        *out = v.toBool();
        return true;
    }

    bool requireInt(const QJsonObject& json, const char* key, int* out) {
        const QJsonValue v = json.value(QLatin1String(key));
        if (!v.isDouble()) return false;
        *out = v.toInt();
        return true;
    }

    QStringList stringArray(const QJsonValue& v) {
        QStringList out;
        for (const auto& item : v.toArray()) out.append(item.toString());
        return out;
    }

    StreamerState::MinMax minMaxFromJson(const QJsonValue& v, bool* ok) {
        StreamerState::MinMax mm;
        const QJsonObject obj = v.toObject();
        if (!requireInt(obj, "min", &mm.min) || !requireInt(obj, "max", &mm.max)) *ok = false;
        return mm;
    }

    void setOk(bool* ok, bool value) {
        if (ok) *ok = value;
    }
}

InitStatus InitStatus::fromJson(const QJsonObject& json, bool* ok) {
    InitStatus s;
    bool good = requireString(json, "country_code", &s.countryCode)
             && requireBool(json, "is_inited", &s.isInited);
    setOk(ok, good);
    return s;
}

TurnCredentials TurnCredentials::fromJson(const QJsonObject& json, bool* ok) {
    TurnCredentials c;
    bool good = requireString(json, "username", &c.username)
             && requireString(json, "password", &c.password)
             && requireInt(json, "ttl", &c.ttl)
             && json.value("uris").isArray();
    c.uris = stringArray(json.value("uris"));
    setOk(ok, good);
    return c;
}

QJsonObject SystemConfig::toJson() const {
    QJsonObject obj;
    QJsonArray shortcutArray;
    for (const auto& s : shortcuts) {
        QJsonObject so;
        so["keys"] = QJsonArray::fromStringList(s.keys);
        so["label"] = s.label;
        shortcutArray.append(so);
    }
    obj["shortcuts"] = shortcutArray;
    obj["orientation"] = orientation;
    obj["stream_quality"] = streamQuality;
    obj["video_mode"] = videoMode;
    obj["show_cursor"] = showCursor;
    obj["mouse_polling"] = mousePolling;
    obj["mouse_control"] = mouseControl;
    obj["relative_sense"] = relativeSense;
    obj["scroll_rate"] = scrollRate;
    obj["reverse_scrolling"] = reverseScrolling;
    obj["keyboard_control"] = keyboardControl;
    obj["theme_mode"] = themeMode;
    obj["mouse_jiggle"] = mouseJiggle;
    obj["keymap"] = keymap;
    obj["got_muted_panel_tip"] = gotMutedPanelTip;
    obj["is_absolute_mouse"] = isAbsoluteMouse;
    obj["fingerbot_strength"] = fingerbotStrength;
    obj["video_processing"] = videoProcessing;
    return obj;
}

SystemConfig SystemConfig::fromJson(const QJsonObject& json, bool* ok) {
    SystemConfig c;
    bool good = json.value("shortcuts").isArray();
    for (const auto& v : json.value("shortcuts").toArray()) {
        const QJsonObject so = v.toObject();
        SystemConfigShortcut s;
        s.keys = stringArray(so.value("keys"));
        s.label = so.value("label").toString();
        c.shortcuts.append(s);
    }
    good = good
        && requireInt(json, "orientation", &c.orientation)
        && requireInt(json, "stream_quality", &c.streamQuality)
        && requireString(json, "video_mode", &c.videoMode)
        && requireBool(json, "show_cursor", &c.showCursor)
        && requireInt(json, "mouse_polling", &c.mousePolling)
        && requireBool(json, "mouse_control", &c.mouseControl)
        && requireInt(json, "relative_sense", &c.relativeSense)
        && requireInt(json, "scroll_rate", &c.scrollRate)
        && requireString(json, "reverse_scrolling", &c.reverseScrolling)
        && requireBool(json, "keyboard_control", &c.keyboardControl)
        && requireString(json, "theme_mode", &c.themeMode)
        && requireBool(json, "mouse_jiggle", &c.mouseJiggle)
        && requireString(json, "keymap", &c.keymap)
        && requireBool(json, "got_muted_panel_tip", &c.gotMutedPanelTip)
        && requireBool(json, "is_absolute_mouse", &c.isAbsoluteMouse)
        && requireInt(json, "fingerbot_strength", &c.fingerbotStrength)
        && requireString(json, "video_processing", &c.videoProcessing);
    setOk(ok, good);
    return c;
}

StreamerState StreamerState::fromJson(const QJsonObject& json, bool* ok) {
    StreamerState s;
    bool good = true;

    if (json.value("features").isObject()) {
        const QJsonObject f = json.value("features").toObject();
        s.hasFeatures = true;
        good = requireBool(f, "quality", &s.featureQuality)
            && requireBool(f, "resolution", &s.featureResolution)
            && requireBool(f, "h264", &s.featureH264)
            && requireBool(f, "zero_delay", &s.featureZeroDelay);
    }

    if (json.value("limits").isObject()) {
        const QJsonObject l = json.value("limits").toObject();
        s.hasLimits = true;
        s.desiredFpsLimits = minMaxFromJson(l.value("desired_fps"), &good);
        s.h264BitrateLimits = minMaxFromJson(l.value("h264_bitrate"), &good);
        s.h264GopLimits = minMaxFromJson(l.value("h264_gop"), &good);
    }

    if (json.value("params").isObject()) {
        const QJsonObject p = json.value("params").toObject();
        s.desiredFps = p.value("desired_fps").toInt(-1);
        s.quality = p.value("quality").toInt(-1);
        s.h264Bitrate = p.value("h264_bitrate").toInt(-1);
        s.h264Gop = p.value("h264_gop").toInt(-1);
        if (p.value("zero_delay").isBool()) s.zeroDelay = p.value("zero_delay").toBool() ? 1 : 0;
        s.resolution = p.value("resolution").toString();
    }

    setOk(ok, good);
    return s;
}

HidKeymaps HidKeymaps::fromJson(const QJsonObject& json, bool* ok) {
    HidKeymaps k;
    const QJsonObject keymaps = json.value("keymaps").toObject();
    bool good = json.value("keymaps").isObject()
             && requireString(keymaps, "default", &k.defaultKeymap)
             && keymaps.value("available").isArray();
    k.available = stringArray(keymaps.value("available"));
    setOk(ok, good);
    return k;
}

MsdPartitionDevice MsdPartitionDevice::fromJson(const QJsonObject& json, bool* ok) {
    MsdPartitionDevice d;
    bool good = requireString(json, "path", &d.path)
             && json.value("size").isDouble()
             && requireString(json, "uuid", &d.uuid)
             && requireString(json, "filesystem", &d.filesystem)
             && requireString(json, "label", &d.label)
             && requireBool(json, "is_current", &d.isCurrent);
    d.size = static_cast<qint64>(json.value("size").toDouble());
    setOk(ok, good);
    return d;
}

MsdPartitionMap msdPartitionsFromJson(const QJsonObject& json, bool* ok) {
    MsdPartitionMap map;
    bool good = json.value("devices").isObject();
    const QJsonObject devices = json.value("devices").toObject();
    for (auto it = devices.constBegin(); it != devices.constEnd(); ++it) {
        bool itemOk = false;
        MsdPartitionDevice d = MsdPartitionDevice::fromJson(it.value().toObject(), &itemOk);
        if (!itemOk) {
            good = false;
            continue;
        }
        map.insert(it.key(), d);
    }
    setOk(ok, good);
    return map;
}

MsdWriteResult MsdWriteResult::fromJson(const QJsonObject& json, bool* ok) {
    MsdWriteResult r;
    const QJsonObject image = json.value("image").toObject();
    bool good = json.value("image").isObject()
             && requireString(image, "name", &r.imageName)
             && image.value("size").isDouble()
             && image.value("written").isDouble();
    r.size = static_cast<qint64>(image.value("size").toDouble());
    r.written = static_cast<qint64>(image.value("written").toDouble());
    setOk(ok, good);
    return r;
}

QString atxPowerActionToString(AtxPowerAction action) {
    switch (action) {
        case AtxPowerAction::On: return "on";
        case AtxPowerAction::Off: return "off";
        case AtxPowerAction::OffHard: return "off_hard";
        case AtxPowerAction::ResetHard: return "reset_hard";
    }
    return "on";
}

QString atxButtonToString(AtxButton button) {
    switch (button) {
        case AtxButton::Power: return "power";
        case AtxButton::PowerLong: return "power_long";
        case AtxButton::Reset: return "reset";
    }
    return "power";
}
