#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "logger.hpp"

namespace fl::common {

constexpr quint16 kFallbackSocketPort = 3000;
constexpr quint16 kDefaultHttpPort = 3001;
constexpr int kDefaultDecayWindowMs = 1000;

struct Settings {
    QString host = QStringLiteral("http://localhost");
    quint16 socketPort = 0;  // 0: discover through the HTTP config endpoints
    quint16 httpPort = kDefaultHttpPort;
    int decayWindowMs = kDefaultDecayWindowMs;
    LogLevel logLevel = LogLevel::Info;
    bool socketDebug = false;
    bool autoConnect = false;
};

// Environment first (SOCKET_HOST, SOCKET_PORT, HTTP_PORT, FLUXLINK_*), then
// command-line overrides. Unparseable values keep the previous layer's value.
Settings load_settings(const QStringList &arguments, QString *error = nullptr);

// Strips any scheme and trailing slash: "http://localhost/" -> "localhost".
QString bare_host(const QString &host);

}  // namespace fl::common
