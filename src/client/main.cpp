#include <QtWidgets/QApplication>

#include "common/logger.hpp"
#include "common/settings.hpp"
#include "hardware_service.hpp"
#include "monitor_window.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("fluxlink_monitor"));

    QString error;
    const fl::common::Settings settings = fl::common::load_settings(QApplication::arguments(), &error);

    Logger &logger = Logger::instance();
    logger.setMinimumLevel(settings.logLevel);
    logger.setEchoToStderr(true);
    if (!error.isEmpty()) {
        logger.log(LogLevel::Warn, QStringLiteral("config"), error);
    }

    fl::client::HardwareService service;
    service.setDecayWindowMs(settings.decayWindowMs);
    service.setSocketDebug(settings.socketDebug);
    service.setHttpPort(settings.httpPort);

    fl::client::MonitorWindow window(service);
    window.setConnectionDefaults(settings.host, settings.socketPort, settings.httpPort);
    window.show();

    if (settings.autoConnect) {
        window.startConnection();
    }
    return app.exec();
}
