#include "backend/managers/app/SettingsManager.h"
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSettings>
#include <QUrl>
#include <QDebug>
#include <memory>

namespace {
    const char* OPT_CONFIG = "config";
    const char* OPT_HOST_URL = "host-url";
    const char* OPT_EDID = "edid";
    const char* OPT_USER = "user";
    const char* OPT_PASSWORD = "password";
    const char* OPT_SCAN = "scan";
    const char* OPT_NO_KEYBOARD = "no-keyboard";
    const char* OPT_NO_MOUSE = "no-mouse";
    const char* OPT_RELATIVE_MOUSE = "relative-mouse";

    // Placeholder left in generated config files when a value was not supplied
    const QString REQUIRED_PLACEHOLDER = "__REQUIRED__";

    QString cleaned(const QString& value) {
        const QString trimmed = value.trimmed();
        return trimmed == REQUIRED_PLACEHOLDER ? QString() : trimmed;
    }

    std::unique_ptr<QSettings> openSettings(const QString& file) {
        if (file.isEmpty()) {
            return std::make_unique<QSettings>("Periscope", "Client");
        }
        return std::make_unique<QSettings>(file, QSettings::IniFormat);
    }
}

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent)
{
}

void SettingsManager::configureParser(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption(OPT_CONFIG, "JSON configuration file.", "file"));
    parser.addOption(QCommandLineOption(OPT_HOST_URL, "Fixed target appliance, https://host[:port].", "url"));
    parser.addOption(QCommandLineOption(OPT_EDID, "EDID to push to the appliance after connecting, hex.", "hex"));
    parser.addOption(QCommandLineOption(OPT_USER, "Login user name.", "name"));
    parser.addOption(QCommandLineOption(OPT_PASSWORD, "Login password.", "password"));
    parser.addOption(QCommandLineOption(OPT_SCAN, "Scan the local network on startup."));
    parser.addOption(QCommandLineOption(OPT_NO_KEYBOARD, "Start with keyboard capture disabled."));
    parser.addOption(QCommandLineOption(OPT_NO_MOUSE, "Start with mouse capture disabled."));
    parser.addOption(QCommandLineOption(OPT_RELATIVE_MOUSE, "Send relative mouse motion."));
}

KvmError SettingsManager::loadSettings(const QCommandLineParser* parser, const QProcessEnvironment& env) {
    m_config = AppConfig();

    // Persisted values
    {
        auto settings = openSettings(m_settingsFile);
        m_config.hostUrl = settings->value("connection/hostUrl").toString();
        m_config.user = settings->value("connection/user", m_config.user).toString();
    }

    // Config file
    QString configFile = env.value("PERISCOPE_CONFIG");
    if (parser && parser->isSet(OPT_CONFIG)) {
        configFile = parser->value(OPT_CONFIG);
    }
    if (!configFile.isEmpty()) {
        const KvmError error = loadConfigFile(configFile);
        if (error.isError()) return error;
    }

    // Environment
    if (env.contains("PERISCOPE_HOST_URL")) m_config.hostUrl = env.value("PERISCOPE_HOST_URL");
    if (env.contains("PERISCOPE_EDID_HEX")) m_config.edidHex = env.value("PERISCOPE_EDID_HEX");
    if (env.contains("PERISCOPE_USER")) m_config.user = env.value("PERISCOPE_USER");

    // Command line
    if (parser) {
        if (parser->isSet(OPT_HOST_URL)) m_config.hostUrl = parser->value(OPT_HOST_URL);
        if (parser->isSet(OPT_EDID)) m_config.edidHex = parser->value(OPT_EDID);
        if (parser->isSet(OPT_USER)) m_config.user = parser->value(OPT_USER);
        if (parser->isSet(OPT_PASSWORD)) m_config.password = parser->value(OPT_PASSWORD);
        m_config.scanOnStart = parser->isSet(OPT_SCAN);
        if (parser->isSet(OPT_NO_KEYBOARD)) m_config.keyboardCapture = false;
        if (parser->isSet(OPT_NO_MOUSE)) m_config.mouseCapture = false;
        if (parser->isSet(OPT_RELATIVE_MOUSE)) m_config.relativeMouse = true;
    }

    const KvmError error = finalize();
    if (error.isError()) {
        qWarning() << "SettingsManager: Invalid configuration:" << error.message();
        return error;
    }

    qDebug() << "SettingsManager: Settings loaded - target:"
             << (m_config.isFixedTarget() ? QString("%1:%2").arg(m_config.host).arg(m_config.port) : QString("none"))
             << "user:" << m_config.user << "EDID:" << (m_config.edidHex.isEmpty() ? "none" : "set");
    return KvmError();
}

KvmError SettingsManager::loadConfigFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return KvmError::invalidConfiguration(QString("Cannot read config file %1: %2").arg(path, file.errorString()));
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return KvmError::invalidConfiguration(QString("Config file %1 is not a JSON object").arg(path));
    }

    const QJsonObject obj = doc.object();
    const QString appName = cleaned(obj.value("appName").toString());
    if (!appName.isEmpty()) m_config.appName = appName;
    const QString hostUrl = cleaned(obj.value("hostURL").toString());
    if (!hostUrl.isEmpty()) m_config.hostUrl = hostUrl;
    const QString edid = cleaned(obj.value("edidHex").toString());
    if (!edid.isEmpty()) m_config.edidHex = edid;
    const QString user = cleaned(obj.value("user").toString());
    if (!user.isEmpty()) m_config.user = user;

    qDebug() << "SettingsManager: Read config file" << path;
    return KvmError();
}

KvmError SettingsManager::finalize() {
    m_config.hostUrl = cleaned(m_config.hostUrl);
    if (!m_config.hostUrl.isEmpty()) {
        const KvmError error = parseHostUrl(m_config.hostUrl, &m_config.host, &m_config.port);
        if (error.isError()) return error;
    }

    QString edid;
    const KvmError edidError = normalizeEdid(m_config.edidHex, &edid);
    if (edidError.isError()) return edidError;
    m_config.edidHex = edid;

    if (m_config.user.trimmed().isEmpty()) {
        m_config.user = "admin";
    }
    return KvmError();
}

void SettingsManager::saveSettings() {
    auto settings = openSettings(m_settingsFile);
    settings->setValue("connection/user", m_config.user);
    settings->sync();
    qDebug() << "SettingsManager: Settings saved";
    emit settingsChanged();
}

KvmError SettingsManager::parseHostUrl(const QString& value, QString* host, int* port) {
    const QUrl url(value.trimmed(), QUrl::StrictMode);
    const QString path = url.path();
    if (!url.isValid() || url.scheme().toLower() != "https" || url.host().isEmpty()
        || !(path.isEmpty() || path == "/") || url.hasQuery() || url.hasFragment()) {
        return KvmError::invalidConfiguration(QString("Host URL must be a valid https URL: %1").arg(value));
    }
    if (host) *host = url.host();
    if (port) *port = url.port(443);
    return KvmError();
}

KvmError SettingsManager::normalizeEdid(const QString& value, QString* normalized) {
    QString compact = value;
    compact.remove(QRegularExpression("\\s"));
    if (compact.isEmpty()) {
        if (normalized) normalized->clear();
        return KvmError();
    }
    static const QRegularExpression hexOnly("^[0-9A-Fa-f]+$");
    if (!hexOnly.match(compact).hasMatch() || compact.size() % 2 != 0) {
        return KvmError::invalidConfiguration("EDID must contain an even number of hex characters");
    }
    if (normalized) *normalized = compact.toUpper();
    return KvmError();
}
