#include "protocol.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>

namespace fl::protocol {

namespace {

void set_error(PacketError code, const QString &reason, PacketError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
}

bool parse_json_value(const QString &text, QJsonValue *out, QString *reason) {
    // QJsonDocument only accepts containers at the top level.
    const QByteArray wrapped = QByteArrayLiteral("[") + text.toUtf8() + QByteArrayLiteral("]");
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(wrapped, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray() || doc.array().size() != 1) {
        if (reason) {
            *reason = parseError.errorString();
        }
        return false;
    }
    *out = doc.array().at(0);
    return true;
}

}  // namespace

QJsonValue InboundEvent::firstArg() const {
    if (args.isEmpty()) {
        return QJsonValue(QJsonValue::Undefined);
    }
    return args.at(0);
}

std::optional<EnginePacket> parse_engine_packet(const QString &text, PacketError *error, QString *message) {
    set_error(PacketError::None, QString(), error, message);
    if (text.isEmpty()) {
        set_error(PacketError::Empty, QStringLiteral("Empty engine packet"), error, message);
        return std::nullopt;
    }

    const QChar head = text.at(0);
    const int code = head.digitValue();
    if (code < static_cast<int>(EnginePacketType::Open) || code > static_cast<int>(EnginePacketType::Noop)) {
        set_error(PacketError::UnknownEngineType, QStringLiteral("Unknown engine packet type '%1'").arg(head), error,
                  message);
        return std::nullopt;
    }

    EnginePacket packet;
    packet.type = static_cast<EnginePacketType>(code);
    packet.data = text.mid(1);
    return packet;
}

std::optional<SocketPacket> parse_socket_packet(const QString &text, PacketError *error, QString *message) {
    set_error(PacketError::None, QString(), error, message);
    if (text.isEmpty()) {
        set_error(PacketError::Empty, QStringLiteral("Empty socket packet"), error, message);
        return std::nullopt;
    }

    const int code = text.at(0).digitValue();
    if (code < static_cast<int>(SocketPacketType::Connect) || code > static_cast<int>(SocketPacketType::BinaryAck)) {
        set_error(PacketError::UnknownSocketType, QStringLiteral("Unknown socket packet type '%1'").arg(text.at(0)),
                  error, message);
        return std::nullopt;
    }

    SocketPacket packet;
    packet.type = static_cast<SocketPacketType>(code);
    int pos = 1;

    if (packet.type == SocketPacketType::BinaryEvent || packet.type == SocketPacketType::BinaryAck) {
        const int dash = text.indexOf(QLatin1Char('-'), pos);
        bool ok = false;
        const int count = dash > pos ? text.mid(pos, dash - pos).toInt(&ok) : 0;
        if (!ok || count < 0 || count > kMaxAttachments) {
            set_error(PacketError::MalformedAttachmentCount, QStringLiteral("Bad attachment count in '%1'").arg(text.left(16)),
                      error, message);
            return std::nullopt;
        }
        packet.attachments = count;
        pos = dash + 1;
    }

    if (pos < text.size() && text.at(pos) == QLatin1Char('/')) {
        const int comma = text.indexOf(QLatin1Char(','), pos);
        if (comma < 0) {
            packet.nsp = text.mid(pos);
            pos = text.size();
        } else {
            packet.nsp = text.mid(pos, comma - pos);
            pos = comma + 1;
        }
    }

    int idEnd = pos;
    while (idEnd < text.size() && text.at(idEnd).isDigit()) {
        ++idEnd;
    }
    if (idEnd > pos) {
        packet.ackId = text.mid(pos, idEnd - pos).toInt();
        pos = idEnd;
    }

    if (pos < text.size()) {
        QString reason;
        if (!parse_json_value(text.mid(pos), &packet.data, &reason)) {
            set_error(PacketError::MalformedJson, QStringLiteral("Malformed packet body: %1").arg(reason), error, message);
            return std::nullopt;
        }
    }
    return packet;
}

std::optional<EngineHandshake> parse_handshake(const QString &json) {
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        return std::nullopt;
    }
    const QJsonObject obj = doc.object();
    EngineHandshake handshake;
    handshake.sid = obj.value(QStringLiteral("sid")).toString();
    handshake.pingIntervalMs = obj.value(QStringLiteral("pingInterval")).toInt(handshake.pingIntervalMs);
    handshake.pingTimeoutMs = obj.value(QStringLiteral("pingTimeout")).toInt(handshake.pingTimeoutMs);
    return handshake;
}

std::optional<InboundEvent> event_from_packet(const SocketPacket &packet, PacketError *error, QString *message) {
    set_error(PacketError::None, QString(), error, message);
    const QJsonArray array = packet.data.toArray();
    if (array.isEmpty() || !array.at(0).isString()) {
        set_error(PacketError::MissingEventName, QStringLiteral("Event packet without a name"), error, message);
        return std::nullopt;
    }
    InboundEvent event;
    event.name = array.at(0).toString();
    for (int i = 1; i < array.size(); ++i) {
        event.args.append(array.at(i));
    }
    return event;
}

bool is_placeholder(const QJsonValue &value, int *index) {
    if (!value.isObject()) {
        return false;
    }
    const QJsonObject obj = value.toObject();
    if (!obj.value(QStringLiteral("_placeholder")).toBool()) {
        return false;
    }
    const QJsonValue num = obj.value(QStringLiteral("num"));
    if (!num.isDouble()) {
        return false;
    }
    if (index) {
        *index = num.toInt();
    }
    return true;
}

bool BinaryAssembler::start(const InboundEvent &event, int expectedAttachments) {
    if (expectedAttachments <= 0) {
        return false;
    }
    pending_ = event;
    pending_->attachments.clear();
    expected_ = expectedAttachments;
    return true;
}

bool BinaryAssembler::append(const QByteArray &frame, PacketError *error, QString *message) {
    set_error(PacketError::None, QString(), error, message);
    if (!pending_.has_value()) {
        set_error(PacketError::UnexpectedBinary, QStringLiteral("Binary frame without a pending event"), error, message);
        return false;
    }
    pending_->attachments.append(frame);
    return true;
}

bool BinaryAssembler::isPending() const {
    return pending_.has_value();
}

bool BinaryAssembler::isComplete() const {
    return pending_.has_value() && pending_->attachments.size() >= expected_;
}

InboundEvent BinaryAssembler::take() {
    InboundEvent event = std::move(*pending_);
    clear();
    return event;
}

void BinaryAssembler::clear() {
    pending_.reset();
    expected_ = 0;
}

QString build_event(const QString &event, const QJsonValue &payload) {
    QJsonArray array;
    array.append(event);
    if (!payload.isUndefined()) {
        array.append(payload);
    }
    const QByteArray body = QJsonDocument(array).toJson(QJsonDocument::Compact);
    return QStringLiteral("42") + QString::fromUtf8(body);
}

QString build_namespace_connect() {
    return QStringLiteral("40");
}

QString build_namespace_disconnect() {
    return QStringLiteral("41");
}

QString build_pong() {
    return QStringLiteral("3");
}

}  // namespace fl::protocol
