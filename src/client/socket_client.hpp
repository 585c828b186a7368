#pragma once

#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QThread>

#include <functional>
#include <memory>

#include "event_channel.hpp"
#include "socket_worker.hpp"

namespace fl::client {

// Owns one connection to the backend. The socket and its reconnect loop live
// on a dedicated thread; handlers registered here run on that thread.
class SocketClient : public QObject, public EventChannel {
    Q_OBJECT

public:
    explicit SocketClient(QObject *parent = nullptr);
    ~SocketClient() override;

    void connectToBackend(const QString &host, quint16 port, quint16 httpPort);
    void disconnectFromBackend();
    bool isRunning() const;

    void emitEvent(const QString &event, const QJsonValue &payload = QJsonValue(QJsonValue::Undefined)) override;
    HandlerId on(const QString &event, EventHandler handler) override;
    HandlerId once(const QString &event, EventHandler handler) override;
    void off(HandlerId id) override;

    bool isConnected() const override;
    quint64 connectionEpoch() const override;

    // Runs `task` on the dispatch thread. Dropped when the client is stopped.
    void post(std::function<void()> task);

    Connection connection() const;
    void setSocketDebug(bool enabled);

signals:
    void reconnectScheduled(int delayMs);

private:
    std::shared_ptr<TransportState> state_;
    // Written on the owner thread, read from handlers on the transport thread.
    mutable QMutex workerMutex_;
    QThread *thread_ = nullptr;
    SocketWorker *worker_ = nullptr;
};

}  // namespace fl::client
