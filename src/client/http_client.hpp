#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QUrl>

class QNetworkAccessManager;

namespace fl::client {

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

// Blocking GET on a local event loop. Must be called from a thread that owns
// the network manager.
class HttpClient {
public:
    explicit HttpClient(QNetworkAccessManager *manager);
    virtual ~HttpClient() = default;

    virtual HttpResult get(const QUrl &url, int timeoutMs,
                           const QByteArray &accept = QByteArrayLiteral("application/json")) const;

private:
    QNetworkAccessManager *manager_ = nullptr;
};

}  // namespace fl::client
