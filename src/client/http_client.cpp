#include "http_client.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace fl::client {

namespace {

constexpr int kDefaultTimeoutMs = 10000;

}  // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager) : manager_(manager) {}

HttpResult HttpClient::get(const QUrl &url, int timeoutMs, const QByteArray &accept) const {
    HttpResult result;
    if (!manager_) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }
    if (!url.isValid()) {
        result.error = QStringLiteral("Invalid URL %1").arg(url.toString());
        return result;
    }

    QNetworkRequest request(url);
    request.setRawHeader("Accept", accept);
    request.setRawHeader("User-Agent", "fluxlink/1.0");

    QNetworkReply *reply = manager_->get(request);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        reply->deleteLater();
        return result;
    }

    if (result.statusCode == 200) {
        result.ok = true;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }

    reply->deleteLater();
    return result;
}

}  // namespace fl::client
