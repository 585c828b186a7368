#include "port_discovery.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>

#include "common/json_util.hpp"
#include "common/logger.hpp"
#include "http_client.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

const char *const kConfigPaths[] = {
    "config", "dynamo/config", "api/config", "flux/config", "v1/config", "backend/config",
};

bool names_socket_port(const QString &key) {
    const QString lowered = key.toLower();
    return lowered.contains(QLatin1String("socketport")) ||
           (lowered.contains(QLatin1String("socket")) && lowered.contains(QLatin1String("port")));
}

}  // namespace

std::optional<quint16> find_socket_port(const QJsonValue &document) {
    if (document.isObject()) {
        const QJsonObject obj = document.toObject();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (names_socket_port(it.key())) {
                const auto port = fl::json::to_int(it.value());
                if (port.has_value() && !it.value().isBool() && *port >= kMinSocketPort && *port <= kMaxSocketPort) {
                    return static_cast<quint16>(*port);
                }
            }
            const auto nested = find_socket_port(it.value());
            if (nested.has_value()) {
                return nested;
            }
        }
    } else if (document.isArray()) {
        for (const auto &item : document.toArray()) {
            const auto nested = find_socket_port(item);
            if (nested.has_value()) {
                return nested;
            }
        }
    }
    return std::nullopt;
}

QList<QUrl> candidate_urls(const QString &host, quint16 httpPort) {
    QString base = host.trimmed();
    if (!base.startsWith(QLatin1String("http://")) && !base.startsWith(QLatin1String("https://"))) {
        base.prepend(QStringLiteral("http://"));
    }
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }

    QList<QUrl> urls;
    for (const char *path : kConfigPaths) {
        urls.append(QUrl(QStringLiteral("%1:%2/%3").arg(base).arg(httpPort).arg(QLatin1String(path))));
    }
    return urls;
}

std::optional<quint16> discover_port(const HttpClient &http, const QString &host, quint16 httpPort, int timeoutMs) {
    auto &logger = Logger::instance();
    const QString category = QStringLiteral("discovery");

    for (const QUrl &url : candidate_urls(host, httpPort)) {
        const HttpResult result = http.get(url, timeoutMs);
        if (!result.ok) {
            logger.log(LogLevel::Debug, category, QStringLiteral("%1: %2").arg(url.toString(), result.error));
            continue;
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(result.payload, &parseError);
        if (parseError.error != QJsonParseError::NoError || doc.isNull()) {
            logger.log(LogLevel::Debug, category,
                       QStringLiteral("%1: invalid JSON (%2)").arg(url.toString(), parseError.errorString()));
            continue;
        }
        const QJsonValue root = doc.isObject() ? QJsonValue(doc.object()) : QJsonValue(doc.array());
        const auto port = find_socket_port(root);
        if (port.has_value()) {
            logger.log(LogLevel::Info, category, QStringLiteral("Socket port %1 found at %2").arg(*port).arg(url.toString()));
            return port;
        }
    }
    logger.log(LogLevel::Info, category, QStringLiteral("No socket port advertised on HTTP port %1").arg(httpPort));
    return std::nullopt;
}

}  // namespace fl::client
