#include "liveness_tracker.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QStringList>

#include <algorithm>

#include "common/json_util.hpp"
#include "common/logger.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

QString id_of(const QJsonValue &item) {
    if (!item.isObject()) {
        return {};
    }
    return fl::json::first_string(item.toObject(), {"deviceId", "device_id", "id"});
}

QString describe(const QSet<QString> &ids) {
    QStringList sorted(ids.begin(), ids.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted.join(QStringLiteral(", "));
}

}  // namespace

LivenessTracker::LivenessTracker(int decayWindowMs) : decayWindowMs_(std::max(0, decayWindowMs)) {}

QSet<QString> LivenessTracker::extractDeviceIds(const QJsonValue &payload) {
    QSet<QString> ids;
    if (payload.isArray()) {
        for (const auto &item : payload.toArray()) {
            const QString id = id_of(item);
            if (!id.isEmpty()) {
                ids.insert(id);
            }
        }
        return ids;
    }
    if (!payload.isObject()) {
        return ids;
    }

    const QJsonObject obj = payload.toObject();
    // A single frame names its device at the top level.
    if (obj.contains(QLatin1String("deviceId")) || obj.contains(QLatin1String("device_id")) ||
        obj.contains(QLatin1String("id"))) {
        const QString id = id_of(payload);
        if (!id.isEmpty()) {
            ids.insert(id);
        }
        return ids;
    }

    const QJsonValue devices = obj.value(QLatin1String("devices"));
    if (devices.isArray()) {
        for (const auto &item : devices.toArray()) {
            const QString id = id_of(item);
            if (!id.isEmpty()) {
                ids.insert(id);
            }
        }
    } else if (devices.isObject()) {
        const QJsonObject byId = devices.toObject();
        for (auto it = byId.begin(); it != byId.end(); ++it) {
            ids.insert(it.key());
        }
    }
    return ids;
}

std::optional<ActiveSetDelta> LivenessTracker::onTelemetry(const QJsonValue &payload, qint64 nowMs) {
    for (const QString &id : extractDeviceIds(payload)) {
        lastSeen_.insert(id, nowMs);
    }
    return recompute(nowMs);
}

std::optional<ActiveSetDelta> LivenessTracker::tick(qint64 nowMs) {
    return recompute(nowMs);
}

std::optional<ActiveSetDelta> LivenessTracker::clear() {
    lastSeen_.clear();
    return publish({});
}

void LivenessTracker::setDecayWindowMs(int decayWindowMs) {
    decayWindowMs_ = std::max(0, decayWindowMs);
}

std::optional<ActiveSetDelta> LivenessTracker::recompute(qint64 nowMs) {
    QSet<QString> next;
    for (auto it = lastSeen_.begin(); it != lastSeen_.end();) {
        if (nowMs - it.value() <= decayWindowMs_) {
            next.insert(it.key());
            ++it;
        } else {
            it = lastSeen_.erase(it);
        }
    }
    return publish(next);
}

std::optional<ActiveSetDelta> LivenessTracker::publish(const QSet<QString> &next) {
    if (next == active_) {
        return std::nullopt;
    }
    ActiveSetDelta delta;
    delta.active = next;
    delta.added = QSet<QString>(next).subtract(active_);
    delta.removed = QSet<QString>(active_).subtract(next);
    active_ = next;
    Logger::instance().log(LogLevel::Debug, QStringLiteral("liveness"),
                           QStringLiteral("Active devices: %1 [%2]").arg(active_.size()).arg(describe(active_)));
    return delta;
}

}  // namespace fl::client
