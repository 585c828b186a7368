#pragma once

#include <QtCore/QHash>
#include <QtCore/QJsonValue>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <functional>
#include <memory>

namespace fl::client {

using EventHandler = std::function<void(const QJsonValue &payload)>;
using HandlerId = quint64;

// Handlers keyed by event name. Dispatch works on a copy of the handler list,
// so handlers may register or remove handlers while being called.
class HandlerRegistry {
public:
    HandlerId on(const QString &event, EventHandler handler);
    HandlerId once(const QString &event, EventHandler handler);
    void off(HandlerId id);
    void clear();

    // Returns the number of handlers invoked. A throwing handler is logged
    // and skipped.
    int dispatch(const QString &event, const QJsonValue &payload);
    int handlerCount(const QString &event) const;

private:
    struct Entry {
        HandlerId id = 0;
        std::shared_ptr<EventHandler> handler;
        bool once = false;
    };

    HandlerId add(const QString &event, EventHandler handler, bool once);

    mutable QMutex mutex_;
    QHash<QString, QVector<Entry>> handlers_;
    HandlerId nextId_ = 1;
};

// The send/subscribe surface the protocol components talk to.
class EventChannel {
public:
    virtual ~EventChannel() = default;

    // Never throws and never blocks on connection state; failures land in
    // the transport's last error.
    virtual void emitEvent(const QString &event, const QJsonValue &payload = QJsonValue(QJsonValue::Undefined)) = 0;
    virtual HandlerId on(const QString &event, EventHandler handler) = 0;
    virtual HandlerId once(const QString &event, EventHandler handler) = 0;
    virtual void off(HandlerId id) = 0;

    virtual bool isConnected() const = 0;
    virtual quint64 connectionEpoch() const = 0;
};

}  // namespace fl::client
