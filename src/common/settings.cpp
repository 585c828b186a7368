#include "settings.hpp"

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QtGlobal>

namespace fl::common {

namespace {

bool parse_port(const QString &text, quint16 *out) {
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < 0 || value > 65535) {
        return false;
    }
    *out = static_cast<quint16>(value);
    return true;
}

bool env_flag(const char *name) {
    const QString value = qEnvironmentVariable(name).trimmed().toLower();
    return value == QLatin1String("1") || value == QLatin1String("true") || value == QLatin1String("yes") ||
           value == QLatin1String("on");
}

}  // namespace

QString bare_host(const QString &host) {
    QString out = host.trimmed();
    const int scheme = out.indexOf(QStringLiteral("://"));
    if (scheme >= 0) {
        out = out.mid(scheme + 3);
    }
    while (out.endsWith(QLatin1Char('/'))) {
        out.chop(1);
    }
    return out;
}

Settings load_settings(const QStringList &arguments, QString *error) {
    Settings settings;

    if (qEnvironmentVariableIsSet("SOCKET_HOST")) {
        settings.host = qEnvironmentVariable("SOCKET_HOST");
    }
    if (qEnvironmentVariableIsSet("SOCKET_PORT") &&
        !parse_port(qEnvironmentVariable("SOCKET_PORT"), &settings.socketPort) && error) {
        *error = QStringLiteral("Invalid SOCKET_PORT '%1'").arg(qEnvironmentVariable("SOCKET_PORT"));
    }
    if (qEnvironmentVariableIsSet("HTTP_PORT") && !parse_port(qEnvironmentVariable("HTTP_PORT"), &settings.httpPort) &&
        error) {
        *error = QStringLiteral("Invalid HTTP_PORT '%1'").arg(qEnvironmentVariable("HTTP_PORT"));
    }
    if (qEnvironmentVariableIsSet("FLUXLINK_DECAY_MS")) {
        bool ok = false;
        const int decay = qEnvironmentVariable("FLUXLINK_DECAY_MS").toInt(&ok);
        if (ok && decay > 0) {
            settings.decayWindowMs = decay;
        }
    }
    if (qEnvironmentVariableIsSet("FLUXLINK_LOG_LEVEL")) {
        settings.logLevel = level_from_string(qEnvironmentVariable("FLUXLINK_LOG_LEVEL"), settings.logLevel);
    }
    settings.socketDebug = env_flag("FLUXLINK_SOCKET_DEBUG");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Force plate backend monitor"));
    parser.addHelpOption();
    const QCommandLineOption hostOption(QStringLiteral("host"), QStringLiteral("Backend host."), QStringLiteral("host"));
    const QCommandLineOption socketPortOption(QStringLiteral("socket-port"),
                                              QStringLiteral("Socket.IO port, 0 to discover."), QStringLiteral("port"));
    const QCommandLineOption httpPortOption(QStringLiteral("http-port"), QStringLiteral("Backend HTTP port."),
                                            QStringLiteral("port"));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"),
                                            QStringLiteral("debug, info, warn or error."), QStringLiteral("level"));
    const QCommandLineOption autoOption(QStringLiteral("auto-connect"),
                                        QStringLiteral("Discover and connect on startup."));
    parser.addOptions({hostOption, socketPortOption, httpPortOption, logLevelOption, autoOption});

    if (arguments.isEmpty()) {
        return settings;
    }
    if (!parser.parse(arguments)) {
        if (error) {
            *error = parser.errorText();
        }
        return settings;
    }

    if (parser.isSet(hostOption)) {
        settings.host = parser.value(hostOption);
    }
    if (parser.isSet(socketPortOption) && !parse_port(parser.value(socketPortOption), &settings.socketPort) && error) {
        *error = QStringLiteral("Invalid socket port '%1'").arg(parser.value(socketPortOption));
    }
    if (parser.isSet(httpPortOption) && !parse_port(parser.value(httpPortOption), &settings.httpPort) && error) {
        *error = QStringLiteral("Invalid HTTP port '%1'").arg(parser.value(httpPortOption));
    }
    if (parser.isSet(logLevelOption)) {
        settings.logLevel = level_from_string(parser.value(logLevelOption), settings.logLevel);
    }
    settings.autoConnect = parser.isSet(autoOption);
    return settings;
}

}  // namespace fl::common
