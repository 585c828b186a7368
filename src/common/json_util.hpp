#pragma once

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QString>

#include <initializer_list>
#include <optional>

namespace fl::json {

// First key whose value is a non-empty string (or a number rendered as text).
// Non-finite numbers and numbers outside qint64 are skipped.
QString first_string(const QJsonObject &obj, std::initializer_list<const char *> keys);

// First key whose value converts to an integer; numeric strings are accepted.
std::optional<int> first_int(const QJsonObject &obj, std::initializer_list<const char *> keys);

// First key whose value is a non-empty array.
QJsonArray first_array(const QJsonObject &obj, std::initializer_list<const char *> keys);

// nullopt for non-finite numbers and numbers outside int.
std::optional<int> to_int(const QJsonValue &value);

// True for non-empty containers, non-empty strings, non-zero numbers and true.
bool is_truthy(const QJsonValue &value);

QString compact(const QJsonValue &value, int maxChars = 240);

}  // namespace fl::json
