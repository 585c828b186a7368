#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace fl::protocol {

constexpr int kEngineProtocolVersion = 4;
constexpr int kMaxAttachments = 16;

enum class EnginePacketType {
    Open = 0,
    Close,
    Ping,
    Pong,
    Message,
    Upgrade,
    Noop,
};

enum class SocketPacketType {
    Connect = 0,
    Disconnect,
    Event,
    Ack,
    ConnectError,
    BinaryEvent,
    BinaryAck,
};

enum class PacketError {
    None = 0,
    Empty,
    UnknownEngineType,
    UnknownSocketType,
    MalformedAttachmentCount,
    MalformedJson,
    MissingEventName,
    UnexpectedBinary,
};

struct EnginePacket {
    EnginePacketType type = EnginePacketType::Noop;
    QString data;
};

struct SocketPacket {
    SocketPacketType type = SocketPacketType::Event;
    QString nsp = QStringLiteral("/");
    int attachments = 0;
    std::optional<int> ackId;
    QJsonValue data;
};

struct EngineHandshake {
    QString sid;
    int pingIntervalMs = 25000;
    int pingTimeoutMs = 20000;
};

// An event with its binary attachments; placeholders in `args` refer into
// `attachments` by index.
struct InboundEvent {
    QString name;
    QJsonArray args;
    QVector<QByteArray> attachments;

    QJsonValue firstArg() const;
};

std::optional<EnginePacket> parse_engine_packet(const QString &text, PacketError *error = nullptr,
                                                QString *message = nullptr);
std::optional<SocketPacket> parse_socket_packet(const QString &text, PacketError *error = nullptr,
                                                QString *message = nullptr);
std::optional<EngineHandshake> parse_handshake(const QString &json);
std::optional<InboundEvent> event_from_packet(const SocketPacket &packet, PacketError *error = nullptr,
                                              QString *message = nullptr);

bool is_placeholder(const QJsonValue &value, int *index = nullptr);

// Collects the binary frames that follow a BinaryEvent header.
class BinaryAssembler {
public:
    bool start(const InboundEvent &event, int expectedAttachments);
    bool append(const QByteArray &frame, PacketError *error = nullptr, QString *message = nullptr);
    bool isPending() const;
    bool isComplete() const;
    InboundEvent take();
    void clear();

private:
    std::optional<InboundEvent> pending_;
    int expected_ = 0;
};

QString build_event(const QString &event, const QJsonValue &payload);
QString build_namespace_connect();
QString build_namespace_disconnect();
QString build_pong();

}  // namespace fl::protocol
