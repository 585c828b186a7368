#include "msgpack.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>

#include <cstdint>
#include <cstring>
#include <limits>

namespace fl::msgpack {

namespace {

constexpr int kMaxDepth = 64;

class Reader {
public:
    explicit Reader(const QByteArray &bytes) : bytes_(bytes) {}

    bool readValue(QJsonValue *out, int depth);

    bool atEnd() const { return offset_ >= bytes_.size(); }
    DecodeError error() const { return error_; }
    const QString &reason() const { return reason_; }

private:
    bool fail(DecodeError code, const QString &reason) {
        if (error_ == DecodeError::None) {
            error_ = code;
            reason_ = reason;
        }
        return false;
    }

    bool ensure(qsizetype count) {
        if (count < 0 || offset_ + count > bytes_.size()) {
            return fail(DecodeError::Truncated, QStringLiteral("Unexpected end of buffer at offset %1").arg(offset_));
        }
        return true;
    }

    bool readU8(uint8_t *out) {
        if (!ensure(1)) {
            return false;
        }
        *out = static_cast<uint8_t>(bytes_.at(offset_++));
        return true;
    }

    bool readU16(uint16_t *out) {
        if (!ensure(2)) {
            return false;
        }
        const auto hi = static_cast<uint8_t>(bytes_.at(offset_));
        const auto lo = static_cast<uint8_t>(bytes_.at(offset_ + 1));
        *out = static_cast<uint16_t>((hi << 8) | lo);
        offset_ += 2;
        return true;
    }

    bool readU32(uint32_t *out) {
        if (!ensure(4)) {
            return false;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | static_cast<uint8_t>(bytes_.at(offset_ + i));
        }
        offset_ += 4;
        *out = value;
        return true;
    }

    bool readU64(uint64_t *out) {
        if (!ensure(8)) {
            return false;
        }
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | static_cast<uint8_t>(bytes_.at(offset_ + i));
        }
        offset_ += 8;
        *out = value;
        return true;
    }

    bool readString(uint32_t length, QJsonValue *out) {
        if (!ensure(length)) {
            return false;
        }
        *out = QString::fromUtf8(bytes_.constData() + offset_, static_cast<qsizetype>(length));
        offset_ += length;
        return true;
    }

    bool readBinary(uint32_t length, QJsonValue *out) {
        if (!ensure(length)) {
            return false;
        }
        const QByteArray blob = bytes_.mid(offset_, static_cast<qsizetype>(length));
        *out = QString::fromLatin1(blob.toBase64());
        offset_ += length;
        return true;
    }

    bool skipExtension(uint32_t length, QJsonValue *out) {
        // Extension payloads carry a one-byte type tag before the data.
        if (!ensure(static_cast<qsizetype>(length) + 1)) {
            return false;
        }
        offset_ += static_cast<qsizetype>(length) + 1;
        *out = QJsonValue(QJsonValue::Null);
        return true;
    }

    bool readArray(uint32_t length, QJsonValue *out, int depth) {
        QJsonArray array;
        for (uint32_t i = 0; i < length; ++i) {
            QJsonValue item;
            if (!readValue(&item, depth + 1)) {
                return false;
            }
            array.append(item);
        }
        *out = array;
        return true;
    }

    bool readMap(uint32_t length, QJsonValue *out, int depth) {
        QJsonObject object;
        for (uint32_t i = 0; i < length; ++i) {
            QJsonValue key;
            QJsonValue value;
            if (!readValue(&key, depth + 1) || !readValue(&value, depth + 1)) {
                return false;
            }
            object.insert(keyText(key), value);
        }
        *out = object;
        return true;
    }

    static QString keyText(const QJsonValue &key) {
        if (key.isString()) {
            return key.toString();
        }
        if (key.isDouble()) {
            const double number = key.toDouble();
            if (number == static_cast<double>(static_cast<qint64>(number))) {
                return QString::number(static_cast<qint64>(number));
            }
            return QString::number(number);
        }
        if (key.isBool()) {
            return key.toBool() ? QStringLiteral("true") : QStringLiteral("false");
        }
        return QStringLiteral("null");
    }

    const QByteArray &bytes_;
    qsizetype offset_ = 0;
    DecodeError error_ = DecodeError::None;
    QString reason_;
};

bool Reader::readValue(QJsonValue *out, int depth) {
    if (depth > kMaxDepth) {
        return fail(DecodeError::TooDeep, QStringLiteral("Nesting deeper than %1").arg(kMaxDepth));
    }

    uint8_t marker = 0;
    if (!readU8(&marker)) {
        return false;
    }

    if (marker <= 0x7F) {
        *out = static_cast<qint64>(marker);
        return true;
    }
    if (marker >= 0xE0) {
        *out = static_cast<qint64>(static_cast<int8_t>(marker));
        return true;
    }
    if ((marker & 0xF0) == 0x80) {
        return readMap(marker & 0x0F, out, depth);
    }
    if ((marker & 0xF0) == 0x90) {
        return readArray(marker & 0x0F, out, depth);
    }
    if ((marker & 0xE0) == 0xA0) {
        return readString(marker & 0x1F, out);
    }

    uint8_t u8 = 0;
    uint16_t u16 = 0;
    uint32_t u32 = 0;
    uint64_t u64 = 0;

    switch (marker) {
        case 0xC0:
            *out = QJsonValue(QJsonValue::Null);
            return true;
        case 0xC2:
            *out = false;
            return true;
        case 0xC3:
            *out = true;
            return true;
        case 0xC4:
            return readU8(&u8) && readBinary(u8, out);
        case 0xC5:
            return readU16(&u16) && readBinary(u16, out);
        case 0xC6:
            return readU32(&u32) && readBinary(u32, out);
        case 0xC7:
            return readU8(&u8) && skipExtension(u8, out);
        case 0xC8:
            return readU16(&u16) && skipExtension(u16, out);
        case 0xC9:
            return readU32(&u32) && skipExtension(u32, out);
        case 0xCA: {
            if (!readU32(&u32)) {
                return false;
            }
            float number = 0.0F;
            std::memcpy(&number, &u32, sizeof(number));
            *out = static_cast<double>(number);
            return true;
        }
        case 0xCB: {
            if (!readU64(&u64)) {
                return false;
            }
            double number = 0.0;
            std::memcpy(&number, &u64, sizeof(number));
            *out = number;
            return true;
        }
        case 0xCC:
            if (!readU8(&u8)) {
                return false;
            }
            *out = static_cast<qint64>(u8);
            return true;
        case 0xCD:
            if (!readU16(&u16)) {
                return false;
            }
            *out = static_cast<qint64>(u16);
            return true;
        case 0xCE:
            if (!readU32(&u32)) {
                return false;
            }
            *out = static_cast<qint64>(u32);
            return true;
        case 0xCF:
            if (!readU64(&u64)) {
                return false;
            }
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<qint64>::max())) {
                *out = static_cast<qint64>(u64);
            } else {
                *out = static_cast<double>(u64);
            }
            return true;
        case 0xD0:
            if (!readU8(&u8)) {
                return false;
            }
            *out = static_cast<qint64>(static_cast<int8_t>(u8));
            return true;
        case 0xD1:
            if (!readU16(&u16)) {
                return false;
            }
            *out = static_cast<qint64>(static_cast<int16_t>(u16));
            return true;
        case 0xD2:
            if (!readU32(&u32)) {
                return false;
            }
            *out = static_cast<qint64>(static_cast<int32_t>(u32));
            return true;
        case 0xD3:
            if (!readU64(&u64)) {
                return false;
            }
            *out = static_cast<qint64>(u64);
            return true;
        case 0xD4:
            return skipExtension(1, out);
        case 0xD5:
            return skipExtension(2, out);
        case 0xD6:
            return skipExtension(4, out);
        case 0xD7:
            return skipExtension(8, out);
        case 0xD8:
            return skipExtension(16, out);
        case 0xD9:
            return readU8(&u8) && readString(u8, out);
        case 0xDA:
            return readU16(&u16) && readString(u16, out);
        case 0xDB:
            return readU32(&u32) && readString(u32, out);
        case 0xDC:
            return readU16(&u16) && readArray(u16, out, depth);
        case 0xDD:
            return readU32(&u32) && readArray(u32, out, depth);
        case 0xDE:
            return readU16(&u16) && readMap(u16, out, depth);
        case 0xDF:
            return readU32(&u32) && readMap(u32, out, depth);
        default:
            return fail(DecodeError::UnsupportedMarker,
                        QStringLiteral("Unsupported marker 0x%1").arg(QString::number(marker, 16)));
    }
}

void set_error(DecodeError code, const QString &reason, DecodeError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
}

}  // namespace

std::optional<QJsonValue> decode(const QByteArray &bytes, DecodeError *error, QString *message) {
    set_error(DecodeError::None, QString(), error, message);

    if (bytes.isEmpty()) {
        set_error(DecodeError::Truncated, QStringLiteral("Empty buffer"), error, message);
        return std::nullopt;
    }

    Reader reader(bytes);
    QJsonValue value;
    if (!reader.readValue(&value, 0)) {
        set_error(reader.error(), reader.reason(), error, message);
        return std::nullopt;
    }
    if (!reader.atEnd()) {
        set_error(DecodeError::TrailingBytes, QStringLiteral("Trailing bytes after document"), error, message);
        return std::nullopt;
    }
    return value;
}

}  // namespace fl::msgpack
