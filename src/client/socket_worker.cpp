#include "socket_worker.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QMutexLocker>
#include <QtCore/QUrl>
#include <QtCore/QUrlQuery>
#include <QtWebSockets/QWebSocket>

#include "common/json_util.hpp"
#include "common/logger.hpp"
#include "common/msgpack.hpp"
#include "common/settings.hpp"
#include "protocol_capabilities.hpp"

using namespace fl::protocol;
using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

const QString kCategory = QStringLiteral("socket");

void log(LogLevel level, const QString &message) {
    Logger::instance().log(level, kCategory, message);
}

// Binary attachments outside the compact telemetry path are handed to
// handlers as base64 text.
QJsonValue resolve_placeholders(const QJsonValue &value, const QVector<QByteArray> &attachments) {
    int index = -1;
    if (is_placeholder(value, &index)) {
        if (index >= 0 && index < attachments.size()) {
            return QString::fromLatin1(attachments.at(index).toBase64());
        }
        return QJsonValue(QJsonValue::Null);
    }
    if (value.isArray()) {
        QJsonArray out;
        for (const auto &item : value.toArray()) {
            out.append(resolve_placeholders(item, attachments));
        }
        return out;
    }
    if (value.isObject()) {
        QJsonObject out;
        const QJsonObject obj = value.toObject();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            out.insert(it.key(), resolve_placeholders(it.value(), attachments));
        }
        return out;
    }
    return value;
}

QUrl socket_url(const QString &host, quint16 port) {
    QUrl url;
    url.setScheme(QStringLiteral("ws"));
    url.setHost(fl::common::bare_host(host));
    url.setPort(port);
    url.setPath(QStringLiteral("/socket.io/"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("EIO"), QString::number(kEngineProtocolVersion));
    query.addQueryItem(QStringLiteral("transport"), QStringLiteral("websocket"));
    url.setQuery(query);
    return url;
}

}  // namespace

std::optional<QJsonObject> decode_compact_telemetry(const InboundEvent &event, QString *error) {
    if (error) {
        error->clear();
    }
    const QJsonValue arg = event.firstArg();
    QJsonValue data = arg;
    int index = -1;
    if (is_placeholder(arg, &index)) {
        if (index < 0 || index >= event.attachments.size()) {
            if (error) {
                *error = QStringLiteral("simpleJsonData attachment %1 missing").arg(index);
            }
            return std::nullopt;
        }
        fl::msgpack::DecodeError decodeError = fl::msgpack::DecodeError::None;
        QString reason;
        const auto decoded = fl::msgpack::decode(event.attachments.at(index), &decodeError, &reason);
        if (!decoded.has_value()) {
            if (error) {
                *error = QStringLiteral("simpleJsonData decode failed: %1").arg(reason);
            }
            return std::nullopt;
        }
        data = *decoded;
    }
    if (!data.isObject()) {
        return std::nullopt;
    }
    return data.toObject();
}

Connection TransportState::snapshot() const {
    QMutexLocker locker(&mutex);
    return connection;
}

void TransportState::setLastError(const QString &error) {
    QMutexLocker locker(&mutex);
    connection.lastError = error;
}

SocketWorker::SocketWorker(std::shared_ptr<TransportState> state, QObject *parent)
    : QObject(parent),
      state_(std::move(state)),
      connectTimer_(new QTimer(this)),
      retryTimer_(new QTimer(this)),
      heartbeatTimer_(new QTimer(this)) {
    connectTimer_->setSingleShot(true);
    connectTimer_->setInterval(kConnectTimeoutMs);
    connect(connectTimer_, &QTimer::timeout, this, &SocketWorker::onConnectTimeout);

    retryTimer_->setSingleShot(true);
    connect(retryTimer_, &QTimer::timeout, this, &SocketWorker::attempt);

    heartbeatTimer_->setSingleShot(true);
    connect(heartbeatTimer_, &QTimer::timeout, this, &SocketWorker::onHeartbeatTimeout);
}

SocketWorker::~SocketWorker() {
    teardownSocket();
}

void SocketWorker::start(const QString &host, quint16 port, quint16 httpPort) {
    host_ = host;
    port_ = port;
    httpPort_ = httpPort;
    running_ = true;
    backoff_.reset();
    retryTimer_->stop();
    attempt();
}

void SocketWorker::stop() {
    running_ = false;
    retryTimer_->stop();
    const bool wasConnected = namespaceConnected_;
    if (wasConnected && socket_) {
        QString error;
        if (!sendText(build_namespace_disconnect(), &error)) {
            log(LogLevel::Debug, QStringLiteral("Namespace disconnect not sent: %1").arg(error));
        }
        socket_->close();
    }
    teardownSocket();
    if (wasConnected) {
        {
            QMutexLocker locker(&state_->mutex);
            state_->connection.connected = false;
            state_->connection.lastDisconnectTime = QDateTime::currentDateTimeUtc();
        }
        log(LogLevel::Info, QStringLiteral("Disconnected from %1:%2").arg(host_).arg(port_));
        state_->handlers.dispatch(QLatin1String(events::kDisconnect), QJsonValue(QJsonValue::Undefined));
    }
}

void SocketWorker::send(const QString &event, const QJsonValue &payload) {
    QString error = QStringLiteral("namespace not connected");
    if (!namespaceConnected_ || !sendText(build_event(event, payload), &error)) {
        const QString reason = QStringLiteral("emit '%1' failed: %2").arg(event, error);
        state_->setLastError(reason);
        log(LogLevel::Warn, reason);
        return;
    }
    if (state_->socketDebug.load()) {
        log(LogLevel::Debug, QStringLiteral("-> %1 %2").arg(event, fl::json::compact(payload)));
    }
}

void SocketWorker::attempt() {
    if (!running_) {
        return;
    }
    teardownSocket();
    {
        QMutexLocker locker(&state_->mutex);
        Connection fresh;
        fresh.host = host_;
        fresh.transportPort = port_;
        fresh.httpPort = httpPort_;
        fresh.lastDisconnectTime = state_->connection.lastDisconnectTime;
        state_->connection = fresh;
    }

    const QUrl url = socket_url(host_, port_);
    log(LogLevel::Info, QStringLiteral("Connecting to %1").arg(url.toString()));

    socket_ = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    connect(socket_.data(), &QWebSocket::textMessageReceived, this, &SocketWorker::onTextMessage);
    connect(socket_.data(), &QWebSocket::binaryMessageReceived, this, &SocketWorker::onBinaryMessage);
    connect(socket_.data(), &QWebSocket::disconnected, this, &SocketWorker::onSocketDisconnected);
    connect(socket_.data(), &QWebSocket::errorOccurred, this, &SocketWorker::onSocketError);

    connectTimer_->start();
    socket_->open(url);
}

void SocketWorker::onTextMessage(const QString &message) {
    if (state_->socketDebug.load()) {
        log(LogLevel::Debug, QStringLiteral("<- %1").arg(message.left(240)));
    }
    PacketError error = PacketError::None;
    QString reason;
    const auto packet = parse_engine_packet(message, &error, &reason);
    if (!packet.has_value()) {
        log(LogLevel::Warn, QStringLiteral("Dropped engine packet: %1").arg(reason));
        return;
    }

    switch (packet->type) {
        case EnginePacketType::Open: {
            const auto handshake = parse_handshake(packet->data);
            if (!handshake.has_value()) {
                failAttempt(QStringLiteral("Invalid engine handshake"));
                return;
            }
            handshake_ = *handshake;
            QString sendError;
            if (!sendText(build_namespace_connect(), &sendError)) {
                failAttempt(QStringLiteral("Namespace connect not sent: %1").arg(sendError));
                return;
            }
            armHeartbeat();
            break;
        }
        case EnginePacketType::Ping: {
            QString sendError;
            if (!sendText(build_pong(), &sendError)) {
                log(LogLevel::Warn, QStringLiteral("Pong not sent: %1").arg(sendError));
            }
            armHeartbeat();
            break;
        }
        case EnginePacketType::Close:
            handleDrop(QStringLiteral("Server closed the engine session"));
            break;
        case EnginePacketType::Message:
            handleSocketPacket(packet->data);
            break;
        case EnginePacketType::Pong:
        case EnginePacketType::Upgrade:
        case EnginePacketType::Noop:
            break;
    }
}

void SocketWorker::handleSocketPacket(const QString &text) {
    PacketError error = PacketError::None;
    QString reason;
    const auto packet = parse_socket_packet(text, &error, &reason);
    if (!packet.has_value()) {
        log(LogLevel::Warn, QStringLiteral("Dropped socket packet: %1").arg(reason));
        return;
    }

    switch (packet->type) {
        case SocketPacketType::Connect:
            if (!namespaceConnected_) {
                onNamespaceConnected();
            }
            break;
        case SocketPacketType::Disconnect:
            handleDrop(QStringLiteral("Server disconnected the namespace"));
            break;
        case SocketPacketType::ConnectError: {
            const QJsonValue data = packet->data;
            const QString message = data.isObject() ? data.toObject().value(QStringLiteral("message")).toString()
                                                    : data.toString();
            state_->handlers.dispatch(QLatin1String(events::kError), data);
            failAttempt(QStringLiteral("Namespace connect rejected: %1")
                            .arg(message.isEmpty() ? fl::json::compact(data) : message));
            break;
        }
        case SocketPacketType::Event: {
            const auto event = event_from_packet(*packet, &error, &reason);
            if (!event.has_value()) {
                log(LogLevel::Warn, QStringLiteral("Dropped event: %1").arg(reason));
                return;
            }
            deliver(*event);
            break;
        }
        case SocketPacketType::BinaryEvent: {
            const auto event = event_from_packet(*packet, &error, &reason);
            if (!event.has_value()) {
                log(LogLevel::Warn, QStringLiteral("Dropped binary event: %1").arg(reason));
                return;
            }
            if (!assembler_.start(*event, packet->attachments)) {
                deliver(*event);
            }
            break;
        }
        case SocketPacketType::Ack:
        case SocketPacketType::BinaryAck:
            log(LogLevel::Debug, QStringLiteral("Ignored acknowledgement packet"));
            break;
    }
}

void SocketWorker::onBinaryMessage(const QByteArray &frame) {
    PacketError error = PacketError::None;
    QString reason;
    if (!assembler_.append(frame, &error, &reason)) {
        log(LogLevel::Warn, QStringLiteral("Dropped binary frame: %1").arg(reason));
        return;
    }
    if (assembler_.isComplete()) {
        deliver(assembler_.take());
    }
}

void SocketWorker::deliver(const InboundEvent &event) {
    if (state_->socketDebug.load()) {
        log(LogLevel::Debug, QStringLiteral("recv event=%1 args=%2 attachments=%3")
                                 .arg(event.name)
                                 .arg(event.args.size())
                                 .arg(event.attachments.size()));
    }
    if (event.name == QLatin1String(events::kCompactTelemetry)) {
        deliverCompactTelemetry(event);
        return;
    }
    state_->handlers.dispatch(event.name, resolve_placeholders(event.firstArg(), event.attachments));
}

void SocketWorker::deliverCompactTelemetry(const InboundEvent &event) {
    QString reason;
    const auto telemetry = decode_compact_telemetry(event, &reason);
    if (!reason.isEmpty()) {
        state_->setLastError(reason);
        log(LogLevel::Warn, reason);
        return;
    }
    if (telemetry.has_value()) {
        state_->handlers.dispatch(QLatin1String(events::kTelemetry), *telemetry);
    }
}

void SocketWorker::onNamespaceConnected() {
    connectTimer_->stop();
    namespaceConnected_ = true;
    backoff_.reset();
    {
        QMutexLocker locker(&state_->mutex);
        state_->connection.connected = true;
        state_->connection.lastConnectTime = QDateTime::currentDateTimeUtc();
        state_->connection.lastError.clear();
    }
    const quint64 epoch = ++state_->epoch;
    log(LogLevel::Info, QStringLiteral("Connected to %1:%2 (sid %3, epoch %4)")
                            .arg(host_)
                            .arg(port_)
                            .arg(handshake_.sid)
                            .arg(epoch));
    state_->handlers.dispatch(QLatin1String(events::kConnect), QJsonValue(QJsonValue::Undefined));
}

void SocketWorker::onSocketDisconnected() {
    const QString reason = socket_ && !socket_->closeReason().isEmpty() ? socket_->closeReason()
                                                                         : QStringLiteral("Socket closed");
    handleDrop(reason);
}

void SocketWorker::onSocketError(QAbstractSocket::SocketError) {
    handleDrop(socket_ ? socket_->errorString() : QStringLiteral("Socket error"));
}

void SocketWorker::onConnectTimeout() {
    failAttempt(QStringLiteral("Timed out after %1 ms waiting for namespace connect").arg(kConnectTimeoutMs));
}

void SocketWorker::onHeartbeatTimeout() {
    handleDrop(QStringLiteral("No ping from server within %1 ms")
                   .arg(handshake_.pingIntervalMs + handshake_.pingTimeoutMs));
}

void SocketWorker::failAttempt(const QString &reason) {
    if (namespaceConnected_) {
        handleDrop(reason);
        return;
    }
    state_->setLastError(reason);
    log(LogLevel::Warn, QStringLiteral("Connect attempt failed: %1").arg(reason));
    teardownSocket();
    scheduleRetry(kFailureMultiplier);
}

void SocketWorker::handleDrop(const QString &reason) {
    if (!namespaceConnected_) {
        failAttempt(reason);
        return;
    }
    teardownSocket();
    {
        QMutexLocker locker(&state_->mutex);
        state_->connection.connected = false;
        state_->connection.lastDisconnectTime = QDateTime::currentDateTimeUtc();
        state_->connection.lastError = reason;
    }
    log(LogLevel::Warn, QStringLiteral("Connection dropped: %1").arg(reason));
    state_->handlers.dispatch(QLatin1String(events::kDisconnect), QJsonValue(QJsonValue::Undefined));
    scheduleRetry(kDropMultiplier);
}

void SocketWorker::scheduleRetry(double multiplier) {
    if (!running_ || retryTimer_->isActive()) {
        return;
    }
    const int delay = backoff_.next(multiplier);
    log(LogLevel::Info, QStringLiteral("Reconnecting in %1 ms").arg(delay));
    emit reconnectScheduled(delay);
    retryTimer_->start(delay);
}

void SocketWorker::armHeartbeat() {
    heartbeatTimer_->start(handshake_.pingIntervalMs + handshake_.pingTimeoutMs);
}

void SocketWorker::teardownSocket() {
    connectTimer_->stop();
    heartbeatTimer_->stop();
    assembler_.clear();
    namespaceConnected_ = false;
    if (!socket_) {
        return;
    }
    QWebSocket *socket = socket_.data();
    socket_.clear();
    disconnect(socket, nullptr, this, nullptr);
    // A socket in ClosingState is flushing its close frame.
    if (socket->state() != QAbstractSocket::UnconnectedState && socket->state() != QAbstractSocket::ClosingState) {
        socket->abort();
    }
    socket->deleteLater();
}

bool SocketWorker::sendText(const QString &text, QString *error) {
    if (!socket_) {
        if (error) {
            *error = QStringLiteral("no socket");
        }
        return false;
    }
    if (socket_->state() != QAbstractSocket::ConnectedState) {
        if (error) {
            *error = QStringLiteral("socket not open");
        }
        return false;
    }
    const qint64 expected = text.toUtf8().size();
    const qint64 written = socket_->sendTextMessage(text);
    if (written < expected) {
        if (error) {
            *error = QStringLiteral("short write (%1 of %2 bytes)").arg(written).arg(expected);
        }
        return false;
    }
    return true;
}

}  // namespace fl::client
