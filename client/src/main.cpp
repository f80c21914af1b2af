#include <QApplication>
#include <QCommandLineParser>
#include <QMessageBox>
#include <QDebug>
#include "backend/domain/models/KvmDevice.h"
#include "backend/domain/models/KvmError.h"
#include "backend/domain/session/SessionEvent.h"
#include "backend/managers/app/SettingsManager.h"
#include "frontend/ui/MainWindow.h"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("Periscope");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Periscope");

    qRegisterMetaType<KvmError>();
    qRegisterMetaType<KvmDevice>();
    qRegisterMetaType<SessionEvent>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Remote control client for KVM-over-IP appliances");
    parser.addHelpOption();
    parser.addVersionOption();
    SettingsManager::configureParser(parser);
    parser.process(app);

    SettingsManager settings;
    const KvmError error = settings.loadSettings(&parser);
    if (error.isError()) {
        // A fixed-target build with a broken configuration cannot do anything useful
        qCritical() << "Invalid configuration:" << error.message();
        QMessageBox::critical(nullptr, "Periscope", error.toString());
        return 2;
    }

    MainWindow window(settings.config());
    window.show();
    window.start();
    return app.exec();
}
