#include "event_channel.hpp"

#include <QtCore/QMutexLocker>

#include <exception>

#include "common/logger.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

HandlerId HandlerRegistry::on(const QString &event, EventHandler handler) {
    return add(event, std::move(handler), false);
}

HandlerId HandlerRegistry::once(const QString &event, EventHandler handler) {
    return add(event, std::move(handler), true);
}

HandlerId HandlerRegistry::add(const QString &event, EventHandler handler, bool once) {
    QMutexLocker locker(&mutex_);
    Entry entry;
    entry.id = nextId_++;
    entry.handler = std::make_shared<EventHandler>(std::move(handler));
    entry.once = once;
    handlers_[event].append(entry);
    return entry.id;
}

void HandlerRegistry::off(HandlerId id) {
    QMutexLocker locker(&mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
        auto &entries = it.value();
        for (int i = 0; i < entries.size(); ++i) {
            if (entries.at(i).id == id) {
                entries.remove(i);
                return;
            }
        }
    }
}

void HandlerRegistry::clear() {
    QMutexLocker locker(&mutex_);
    handlers_.clear();
}

int HandlerRegistry::handlerCount(const QString &event) const {
    QMutexLocker locker(&mutex_);
    return handlers_.value(event).size();
}

int HandlerRegistry::dispatch(const QString &event, const QJsonValue &payload) {
    QVector<Entry> snapshot;
    {
        QMutexLocker locker(&mutex_);
        auto it = handlers_.find(event);
        if (it == handlers_.end()) {
            return 0;
        }
        snapshot = it.value();
        // One-shot handlers leave the registry before they run.
        auto &entries = it.value();
        for (int i = entries.size() - 1; i >= 0; --i) {
            if (entries.at(i).once) {
                entries.remove(i);
            }
        }
    }

    int invoked = 0;
    for (const Entry &entry : snapshot) {
        ++invoked;
        try {
            (*entry.handler)(payload);
        } catch (const std::exception &ex) {
            Logger::instance().log(LogLevel::Error, QStringLiteral("socket"),
                                   QStringLiteral("Handler for '%1' threw: %2").arg(event, QString::fromUtf8(ex.what())));
        }
    }
    return invoked;
}

}  // namespace fl::client
