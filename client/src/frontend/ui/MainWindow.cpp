#include "frontend/ui/MainWindow.h"
#include "frontend/ui/widgets/VideoSurfaceWidget.h"
#include "backend/input/InputManager.h"
#include "backend/managers/devices/DeviceDiscovery.h"
#include "backend/managers/devices/DeviceRegistry.h"
#include "backend/managers/session/ISessionFactory.h"
#include "backend/managers/session/SessionOrchestrator.h"
#include <QCheckBox>
#include <QCloseEvent>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QDebug>

namespace {
    QString statusTextFor(SessionState state) {
        switch (state) {
            case SessionState::Disconnected: return "Not connected";
            case SessionState::Connecting: return "Connecting...";
            case SessionState::Authenticating: return "Authenticating...";
            case SessionState::AuthRequired: return "Password required";
            case SessionState::Streaming: return QString();
        }
        return QString();
    }
}

MainWindow::MainWindow(const AppConfig& config, QWidget* parent)
    : QMainWindow(parent)
    , m_config(config)
    , m_registry(new DeviceRegistry(DeviceStore(), this))
    , m_discovery(new DeviceDiscovery(nullptr, this))
    , m_input(new InputManager(this))
    , m_factory(new NetworkSessionFactory(this))
    , m_session(new SessionOrchestrator(m_factory, m_registry, m_input, this))
{
    setWindowTitle(m_config.appName);

    QSettings settings("Periscope", "Client");
    m_input->loadSettings(settings);
    if (m_config.keyboardCapture) m_input->setKeyboardCaptureEnabled(*m_config.keyboardCapture);
    if (m_config.mouseCapture) m_input->setMouseCaptureEnabled(*m_config.mouseCapture);
    if (m_config.relativeMouse) m_input->setRelativeMouseEnabled(*m_config.relativeMouse);

    m_session->setUser(m_config.user);
    m_session->setFixedTarget(m_config.isFixedTarget(), m_config.edidHex);

    setupUI();

    connect(m_session, &SessionOrchestrator::sessionEvent, this, &MainWindow::onSessionEvent);
    connect(m_registry, &DeviceRegistry::devicesChanged, this, &MainWindow::onDevicesChanged);
    connect(m_discovery, &DeviceDiscovery::scanStarted, this, [this](int total) {
        m_scanProgress->setRange(0, qMax(1, total));
        m_scanProgress->setValue(0);
        m_scanProgress->setVisible(true);
        updateButtons();
    });
    connect(m_discovery, &DeviceDiscovery::scanProgress, this, [this](int done, int) {
        m_scanProgress->setValue(done);
    });
    connect(m_discovery, &DeviceDiscovery::scanFinished, this, [this](const QList<KvmDevice>& devices) {
        m_scanProgress->setVisible(false);
        m_registry->mergeDiscovered(devices);
        statusBar()->showMessage(QString("Scan finished, %1 device(s) found").arg(devices.size()), 5000);
        updateButtons();
    });
    connect(m_input, &InputManager::captureSettingsChanged, this, [this]() {
        QSettings s("Periscope", "Client");
        m_input->saveSettings(s);
    });

    m_registry->loadPersisted();
}

MainWindow::~MainWindow() {
    // The orchestrator's teardown still reaches the input pipeline and the registry
    delete m_session;
}

void MainWindow::setupUI() {
    QWidget* sidebar = new QWidget(this);
    QVBoxLayout* side = new QVBoxLayout(sidebar);
    side->setContentsMargins(8, 8, 8, 8);

    m_deviceList = new QListWidget(sidebar);
    side->addWidget(new QLabel("Devices", sidebar));
    side->addWidget(m_deviceList, 1);

    m_scanProgress = new QProgressBar(sidebar);
    m_scanProgress->setTextVisible(false);
    m_scanProgress->setVisible(false);
    side->addWidget(m_scanProgress);

    QHBoxLayout* row = new QHBoxLayout();
    m_scanButton = new QPushButton("Scan", sidebar);
    m_addButton = new QPushButton("Add...", sidebar);
    m_forgetButton = new QPushButton("Forget", sidebar);
    row->addWidget(m_scanButton);
    row->addWidget(m_addButton);
    row->addWidget(m_forgetButton);
    side->addLayout(row);

    m_connectButton = new QPushButton("Connect", sidebar);
    side->addWidget(m_connectButton);

    m_keyboardCheck = new QCheckBox("Capture keyboard", sidebar);
    m_mouseCheck = new QCheckBox("Capture mouse", sidebar);
    m_relativeCheck = new QCheckBox("Relative mouse", sidebar);
    m_keyboardCheck->setChecked(m_input->isKeyboardCaptureEnabled());
    m_mouseCheck->setChecked(m_input->isMouseCaptureEnabled());
    m_relativeCheck->setChecked(m_input->isRelativeMouseEnabled());
    side->addWidget(m_keyboardCheck);
    side->addWidget(m_mouseCheck);
    side->addWidget(m_relativeCheck);

    m_surface = new VideoSurfaceWidget(m_input, this);
    m_surface->setStatusText(statusTextFor(SessionState::Disconnected));

    QSplitter* splitter = new QSplitter(this);
    splitter->addWidget(sidebar);
    splitter->addWidget(m_surface);
    splitter->setStretchFactor(1, 1);
    setCentralWidget(splitter);

    // Fixed-target builds talk to one appliance only
    if (m_config.isFixedTarget()) {
        sidebar->setVisible(false);
    }

    m_statusLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_statusLabel);
    m_statusLabel->setText(statusTextFor(SessionState::Disconnected));

    connect(m_connectButton, &QPushButton::clicked, this, &MainWindow::onConnectClicked);
    connect(m_addButton, &QPushButton::clicked, this, &MainWindow::onAddClicked);
    connect(m_forgetButton, &QPushButton::clicked, this, &MainWindow::onForgetClicked);
    connect(m_scanButton, &QPushButton::clicked, this, &MainWindow::onScanClicked);
    connect(m_deviceList, &QListWidget::currentRowChanged, this, [this](int) { updateButtons(); });
    connect(m_deviceList, &QListWidget::itemDoubleClicked, this, [this](QListWidgetItem*) { onConnectClicked(); });
    connect(m_keyboardCheck, &QCheckBox::toggled, m_input, &InputManager::setKeyboardCaptureEnabled);
    connect(m_mouseCheck, &QCheckBox::toggled, m_input, &InputManager::setMouseCaptureEnabled);
    connect(m_relativeCheck, &QCheckBox::toggled, m_input, &InputManager::setRelativeMouseEnabled);

    resize(1440, 860);
    updateButtons();
}

void MainWindow::start() {
    if (m_config.isFixedTarget()) {
        bool found = false;
        KvmDevice device = m_registry->findByEndpoint(m_config.host, m_config.port, &found);
        if (!found) {
            device = m_registry->addManual(m_config.host, m_config.port, KvmDeviceType::GlinetComet);
        }
        m_session->connectTo(device, m_config.password);
        return;
    }
    if (m_config.scanOnStart) {
        m_discovery->scan();
    }
}

void MainWindow::onDevicesChanged() {
    const QString currentId = selectedDevice().getId();
    m_deviceList->clear();
    for (const KvmDevice& device : m_registry->getDevices()) {
        QListWidgetItem* item = new QListWidgetItem(device.getDisplayText(), m_deviceList);
        item->setData(Qt::UserRole, device.getId());
        item->setToolTip(deviceTypeDisplayName(device.getType()));
        if (device.getId() == currentId) {
            m_deviceList->setCurrentItem(item);
        }
    }
    updateButtons();
}

KvmDevice MainWindow::selectedDevice(bool* found) const {
    QListWidgetItem* item = m_deviceList ? m_deviceList->currentItem() : nullptr;
    if (!item) {
        if (found) *found = false;
        return KvmDevice();
    }
    return m_registry->findById(item->data(Qt::UserRole).toString(), found);
}

void MainWindow::updateButtons() {
    bool hasSelection = false;
    selectedDevice(&hasSelection);
    const bool idle = m_session->state() == SessionState::Disconnected;
    m_connectButton->setText(idle ? "Connect" : "Disconnect");
    m_connectButton->setEnabled(!idle || hasSelection);
    m_forgetButton->setEnabled(hasSelection && idle);
    m_scanButton->setEnabled(!m_discovery->isScanning());
}

void MainWindow::onConnectClicked() {
    if (m_session->state() != SessionState::Disconnected) {
        m_session->disconnect();
        return;
    }
    bool found = false;
    const KvmDevice device = selectedDevice(&found);
    if (!found) return;
    m_session->connectTo(device);
}

void MainWindow::onAddClicked() {
    bool ok = false;
    const QString address = QInputDialog::getText(this, "Add KVM", "Address (host or host:port)",
                                                  QLineEdit::Normal, QString(), &ok).trimmed();
    if (!ok || address.isEmpty()) return;

    QString host = address;
    int port = 443;
    const int colon = address.lastIndexOf(':');
    // A single colon separates the port, more than one is an IPv6 literal
    if (colon > 0 && address.count(':') == 1) {
        bool portOk = false;
        port = address.mid(colon + 1).toInt(&portOk);
        host = address.left(colon);
        if (!portOk) port = 0;
    }

    const KvmDevice device = m_registry->addManual(host, port);
    if (!device.isValid()) {
        QMessageBox::warning(this, "Add KVM", QString("\"%1\" is not a valid address.").arg(address));
    }
}

void MainWindow::onForgetClicked() {
    bool found = false;
    const KvmDevice device = selectedDevice(&found);
    if (!found) return;
    if (!m_registry->forget(device)) {
        statusBar()->showMessage("Disconnect before forgetting this device", 5000);
    }
}

void MainWindow::onScanClicked() {
    m_discovery->scan();
}

void MainWindow::promptPassword(const KvmDevice& device) {
    bool ok = false;
    const QString password = QInputDialog::getText(this, "Authentication required",
                                                   QString("Password for %1").arg(device.getDisplayText()),
                                                   QLineEdit::Password, QString(), &ok);
    if (!ok || password.isEmpty()) {
        m_session->cancelAuth();
        return;
    }
    m_session->submitPassword(password);
}

void MainWindow::onSessionEvent(const SessionEvent& event) {
    switch (event.kind) {
        case SessionEvent::Kind::StateChanged:
            m_statusLabel->setText(sessionStateToString(event.state));
            m_surface->setStatusText(statusTextFor(event.state));
            updateButtons();
            break;
        case SessionEvent::Kind::AuthRequired:
            // Queued so the dialog does not run inside the orchestrator's callback
            QMetaObject::invokeMethod(this, [this, device = event.device]() { promptPassword(device); },
                                      Qt::QueuedConnection);
            break;
        case SessionEvent::Kind::Connected:
            statusBar()->showMessage(QString("Connected to %1").arg(event.device.getDisplayText()), 5000);
            m_surface->setFocus(Qt::OtherFocusReason);
            break;
        case SessionEvent::Kind::Disconnected:
            m_surface->setVideoSize(QSize());
            if (!event.reason.isEmpty()) {
                m_surface->setStatusText(QString("Disconnected: %1").arg(event.reason));
            }
            break;
        case SessionEvent::Kind::Error:
            qWarning() << "MainWindow: Session error:" << event.error.toString();
            statusBar()->showMessage(event.error.toString(), 8000);
            break;
        case SessionEvent::Kind::VideoSizeChanged:
            m_surface->setVideoSize(event.videoSize);
            break;
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    m_discovery->cancel();
    m_session->disconnect();
    QMainWindow::closeEvent(event);
}
