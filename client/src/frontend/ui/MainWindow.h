#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include "backend/domain/session/SessionEvent.h"
#include "backend/managers/app/SettingsManager.h"

class QLabel;
class QListWidget;
class QPushButton;
class QProgressBar;
class QCheckBox;
class DeviceRegistry;
class DeviceDiscovery;
class InputManager;
class NetworkSessionFactory;
class SessionOrchestrator;
class VideoSurfaceWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const AppConfig& config, QWidget* parent = nullptr);
    ~MainWindow() override;

    // Connects right away in fixed-target mode, optionally starts a scan
    void start();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onSessionEvent(const SessionEvent& event);
    void onDevicesChanged();
    void onConnectClicked();
    void onAddClicked();
    void onForgetClicked();
    void onScanClicked();

private:
    void setupUI();
    void updateButtons();
    void promptPassword(const KvmDevice& device);
    KvmDevice selectedDevice(bool* found = nullptr) const;

    AppConfig m_config;

    DeviceRegistry* m_registry;
    DeviceDiscovery* m_discovery;
    InputManager* m_input;
    NetworkSessionFactory* m_factory;
    SessionOrchestrator* m_session;

    QListWidget* m_deviceList = nullptr;
    QPushButton* m_connectButton = nullptr;
    QPushButton* m_addButton = nullptr;
    QPushButton* m_forgetButton = nullptr;
    QPushButton* m_scanButton = nullptr;
    QCheckBox* m_keyboardCheck = nullptr;
    QCheckBox* m_mouseCheck = nullptr;
    QCheckBox* m_relativeCheck = nullptr;
    QProgressBar* m_scanProgress = nullptr;
    QLabel* m_statusLabel = nullptr;
    VideoSurfaceWidget* m_surface = nullptr;
};

#endif // MAINWINDOW_H
