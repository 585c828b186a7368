#pragma once

#include <QtCore/QJsonValue>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QUrl>

#include <optional>

namespace fl::client {

class HttpClient;

constexpr int kDiscoveryTimeoutMs = 700;
constexpr int kMinSocketPort = 1000;
constexpr int kMaxSocketPort = 65535;

// Depth-first search for a key naming the socket port ("socketPort",
// "socket_port", "socketIoPort", ...) whose value is a port in range.
std::optional<quint16> find_socket_port(const QJsonValue &document);

// The configuration endpoints queried, in order.
QList<QUrl> candidate_urls(const QString &host, quint16 httpPort);

// Queries the candidates and returns the first port found. A miss is
// std::nullopt; per-endpoint failures are logged and skipped.
std::optional<quint16> discover_port(const HttpClient &http, const QString &host, quint16 httpPort,
                                     int timeoutMs = kDiscoveryTimeoutMs);

}  // namespace fl::client
