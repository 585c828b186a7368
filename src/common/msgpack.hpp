#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonValue>
#include <QtCore/QString>

#include <optional>

namespace fl::msgpack {

enum class DecodeError {
    None = 0,
    Truncated,
    UnsupportedMarker,
    TrailingBytes,
    TooDeep,
};

// Decodes one MessagePack document into its JSON equivalent. Binary blobs
// become base64 strings and non-string map keys are stringified.
std::optional<QJsonValue> decode(const QByteArray &bytes, DecodeError *error = nullptr, QString *message = nullptr);

}  // namespace fl::msgpack
