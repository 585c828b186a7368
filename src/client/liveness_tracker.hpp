#pragma once

#include <QtCore/QHash>
#include <QtCore/QJsonValue>
#include <QtCore/QSet>
#include <QtCore/QString>

#include <optional>

#include "common/settings.hpp"

namespace fl::client {

struct ActiveSetDelta {
    QSet<QString> active;
    QSet<QString> added;
    QSet<QString> removed;
};

// Decaying set of devices that are streaming right now. Not thread-safe; the
// owner touches it from the dispatch thread only.
class LivenessTracker {
public:
    explicit LivenessTracker(int decayWindowMs = fl::common::kDefaultDecayWindowMs);

    // Stamps every device id found in `payload` with `nowMs` and returns the
    // change to the active set, if any.
    std::optional<ActiveSetDelta> onTelemetry(const QJsonValue &payload, qint64 nowMs);
    std::optional<ActiveSetDelta> tick(qint64 nowMs);
    std::optional<ActiveSetDelta> clear();

    void setDecayWindowMs(int decayWindowMs);
    int decayWindowMs() const { return decayWindowMs_; }
    QSet<QString> activeIds() const { return active_; }

    static QSet<QString> extractDeviceIds(const QJsonValue &payload);

private:
    std::optional<ActiveSetDelta> recompute(qint64 nowMs);
    std::optional<ActiveSetDelta> publish(const QSet<QString> &next);

    int decayWindowMs_;
    QHash<QString, qint64> lastSeen_;
    QSet<QString> active_;
};

}  // namespace fl::client
