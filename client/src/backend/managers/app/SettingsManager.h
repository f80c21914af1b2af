#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QProcessEnvironment>
#include <QString>
#include <optional>
#include "backend/domain/models/KvmError.h"

class QCommandLineParser;

/**
 * @brief Startup configuration, lowest to highest precedence:
 * persisted settings, JSON config file, environment, command line.
 *
 * A configured host URL puts the client in fixed-target mode.
 */
struct AppConfig {
    QString appName = "Periscope";
    QString hostUrl;
    QString host;
    int port = 443;
    QString edidHex;
    QString user = "admin";
    QString password;
    bool scanOnStart = false;
    // Unset means keep the persisted capture toggle
    std::optional<bool> keyboardCapture;
    std::optional<bool> mouseCapture;
    std::optional<bool> relativeMouse;

    bool isFixedTarget() const { return !host.isEmpty(); }
};

class SettingsManager : public QObject {
    Q_OBJECT

public:
    explicit SettingsManager(QObject* parent = nullptr);
    ~SettingsManager() = default;

    static void configureParser(QCommandLineParser& parser);

    // InvalidConfiguration when a configured value is unusable
    KvmError loadSettings(const QCommandLineParser* parser = nullptr,
                          const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());
    void saveSettings();

    const AppConfig& config() const { return m_config; }

    // https URL with host, optional port, no path, query or fragment
    static KvmError parseHostUrl(const QString& value, QString* host, int* port);
    // Whitespace dropped, upper-cased, even number of hex digits; empty stays empty
    static KvmError normalizeEdid(const QString& value, QString* normalized);

    void setSettingsFile(const QString& path) { m_settingsFile = path; }

signals:
    void settingsChanged();

private:
    KvmError loadConfigFile(const QString& path);
    KvmError finalize();

    AppConfig m_config;
    QString m_settingsFile;
};

#endif // SETTINGSMANAGER_H
