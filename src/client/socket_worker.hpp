#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <QtNetwork/QAbstractSocket>

#include <atomic>
#include <memory>
#include <optional>

#include "backoff.hpp"
#include "common/protocol.hpp"
#include "event_channel.hpp"

class QWebSocket;

namespace fl::client {

constexpr int kConnectTimeoutMs = 2000;

struct Connection {
    QString host;
    quint16 transportPort = 0;
    quint16 httpPort = 0;
    bool connected = false;
    QDateTime lastConnectTime;
    QDateTime lastDisconnectTime;
    QString lastError;
};

// Telemetry object carried by a simpleJsonData event, either inline or as a
// MessagePack attachment behind a placeholder. A non-object payload yields
// nullopt with `error` left empty; a missing or undecodable attachment sets it.
std::optional<QJsonObject> decode_compact_telemetry(const fl::protocol::InboundEvent &event,
                                                    QString *error = nullptr);

// State shared between the client facade and its worker thread.
struct TransportState {
    mutable QMutex mutex;
    Connection connection;
    std::atomic<quint64> epoch{0};
    std::atomic<bool> socketDebug{false};
    HandlerRegistry handlers;

    Connection snapshot() const;
    void setLastError(const QString &error);
};

// Lives on the transport thread and owns the socket, its timers and all
// Connection writes.
class SocketWorker : public QObject {
    Q_OBJECT

public:
    explicit SocketWorker(std::shared_ptr<TransportState> state, QObject *parent = nullptr);
    ~SocketWorker() override;

    void start(const QString &host, quint16 port, quint16 httpPort);
    void stop();
    void send(const QString &event, const QJsonValue &payload);

signals:
    void reconnectScheduled(int delayMs);

private slots:
    void attempt();
    void onTextMessage(const QString &message);
    void onBinaryMessage(const QByteArray &frame);
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onConnectTimeout();
    void onHeartbeatTimeout();

private:
    void handleSocketPacket(const QString &text);
    void deliver(const fl::protocol::InboundEvent &event);
    void deliverCompactTelemetry(const fl::protocol::InboundEvent &event);
    void onNamespaceConnected();
    void failAttempt(const QString &reason);
    void handleDrop(const QString &reason);
    void scheduleRetry(double multiplier);
    void armHeartbeat();
    void teardownSocket();
    bool sendText(const QString &text, QString *error = nullptr);

    std::shared_ptr<TransportState> state_;
    QPointer<QWebSocket> socket_;
    QTimer *connectTimer_ = nullptr;
    QTimer *retryTimer_ = nullptr;
    QTimer *heartbeatTimer_ = nullptr;
    ReconnectBackoff backoff_;
    fl::protocol::BinaryAssembler assembler_;
    fl::protocol::EngineHandshake handshake_;
    QString host_;
    quint16 port_ = 0;
    quint16 httpPort_ = 0;
    bool running_ = false;
    bool namespaceConnected_ = false;
};

}  // namespace fl::client
