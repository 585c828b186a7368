#include "json_util.hpp"

#include <QtCore/QJsonDocument>

#include <cmath>
#include <limits>

namespace fl::json {

namespace {

// Range of doubles that convert to qint64 without overflow.
constexpr double kInt64Low = -9223372036854775808.0;
constexpr double kInt64High = 9223372036854775808.0;

}  // namespace

QString first_string(const QJsonObject &obj, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isString()) {
            const QString text = value.toString().trimmed();
            if (!text.isEmpty()) {
                return text;
            }
        } else if (value.isDouble()) {
            const double number = value.toDouble();
            if (!std::isfinite(number) || number < kInt64Low || number >= kInt64High) {
                continue;
            }
            if (number == std::floor(number)) {
                return QString::number(static_cast<qint64>(number));
            }
            return QString::number(number);
        }
    }
    return {};
}

std::optional<int> to_int(const QJsonValue &value) {
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (!std::isfinite(number) || number < std::numeric_limits<int>::min() ||
            number > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (ok) {
            return parsed;
        }
    }
    if (value.isBool()) {
        return value.toBool() ? 1 : 0;
    }
    return std::nullopt;
}

std::optional<int> first_int(const QJsonObject &obj, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
        const auto parsed = to_int(obj.value(QLatin1String(key)));
        if (parsed.has_value()) {
            return parsed;
        }
    }
    return std::nullopt;
}

QJsonArray first_array(const QJsonObject &obj, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isArray() && !value.toArray().isEmpty()) {
            return value.toArray();
        }
    }
    return {};
}

bool is_truthy(const QJsonValue &value) {
    switch (value.type()) {
        case QJsonValue::Bool:
            return value.toBool();
        case QJsonValue::Double:
            return value.toDouble() != 0.0;
        case QJsonValue::String:
            return !value.toString().isEmpty();
        case QJsonValue::Array:
            return !value.toArray().isEmpty();
        case QJsonValue::Object:
            return !value.toObject().isEmpty();
        default:
            return false;
    }
}

QString compact(const QJsonValue &value, int maxChars) {
    QString text;
    if (value.isObject()) {
        text = QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    } else if (value.isArray()) {
        text = QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    } else if (value.isString()) {
        text = value.toString();
    } else if (value.isDouble()) {
        text = QString::number(value.toDouble());
    } else if (value.isBool()) {
        text = value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    } else {
        text = QStringLiteral("null");
    }
    if (text.size() > maxChars) {
        text = text.left(maxChars) + QStringLiteral("...");
    }
    return text;
}

}  // namespace fl::json
