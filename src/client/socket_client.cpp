#include "socket_client.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QMutexLocker>

#include "common/logger.hpp"

using fl::common::Logger;
using fl::common::LogLevel;

namespace fl::client {

namespace {

constexpr unsigned long kStopWaitMs = 2000;

}  // namespace

SocketClient::SocketClient(QObject *parent) : QObject(parent), state_(std::make_shared<TransportState>()) {}

SocketClient::~SocketClient() {
    disconnectFromBackend();
}

void SocketClient::connectToBackend(const QString &host, quint16 port, quint16 httpPort) {
    QMutexLocker locker(&workerMutex_);
    if (!thread_) {
        auto *thread = new QThread(this);
        auto *worker = new SocketWorker(state_);
        worker->moveToThread(thread);
        connect(worker, &SocketWorker::reconnectScheduled, this, &SocketClient::reconnectScheduled);
        connect(thread, &QThread::finished, worker, &QObject::deleteLater);
        connect(thread, &QThread::finished, thread, &QObject::deleteLater);
        thread_ = thread;
        worker_ = worker;
        thread->start();
    }

    SocketWorker *worker = worker_;
    QMetaObject::invokeMethod(
        worker, [worker, host, port, httpPort]() { worker->start(host, port, httpPort); }, Qt::QueuedConnection);
}

void SocketClient::disconnectFromBackend() {
    QThread *thread = nullptr;
    SocketWorker *worker = nullptr;
    {
        // Cleared first so handlers still running see no worker to post to.
        QMutexLocker locker(&workerMutex_);
        thread = thread_;
        worker = worker_;
        thread_ = nullptr;
        worker_ = nullptr;
    }
    if (!thread || !worker) {
        return;
    }

    if (QThread::currentThread() == thread) {
        // Called from a handler: the worker's own loop exits after this turn.
        worker->stop();
        thread->quit();
        return;
    }

    // Blocking so stop() has run before the loop is asked to exit.
    QMetaObject::invokeMethod(worker, [worker]() { worker->stop(); }, Qt::BlockingQueuedConnection);
    thread->quit();
    if (!thread->wait(kStopWaitMs)) {
        Logger::instance().log(LogLevel::Warn, QStringLiteral("socket"),
                               QStringLiteral("Transport thread did not stop within %1 ms").arg(kStopWaitMs));
        // Handlers may still reference the caller; it must not return early.
        thread->wait();
    }
}

bool SocketClient::isRunning() const {
    QMutexLocker locker(&workerMutex_);
    return thread_ != nullptr;
}

void SocketClient::emitEvent(const QString &event, const QJsonValue &payload) {
    QMutexLocker locker(&workerMutex_);
    SocketWorker *worker = worker_;
    if (!worker) {
        locker.unlock();
        const QString reason = QStringLiteral("emit '%1' failed: no socket").arg(event);
        state_->setLastError(reason);
        Logger::instance().log(LogLevel::Warn, QStringLiteral("socket"), reason);
        return;
    }
    QMetaObject::invokeMethod(
        worker, [worker, event, payload]() { worker->send(event, payload); }, Qt::QueuedConnection);
}

HandlerId SocketClient::on(const QString &event, EventHandler handler) {
    return state_->handlers.on(event, std::move(handler));
}

HandlerId SocketClient::once(const QString &event, EventHandler handler) {
    return state_->handlers.once(event, std::move(handler));
}

void SocketClient::off(HandlerId id) {
    state_->handlers.off(id);
}

bool SocketClient::isConnected() const {
    return state_->snapshot().connected;
}

quint64 SocketClient::connectionEpoch() const {
    return state_->epoch.load();
}

void SocketClient::post(std::function<void()> task) {
    QMutexLocker locker(&workerMutex_);
    SocketWorker *worker = worker_;
    if (!worker) {
        return;
    }
    QMetaObject::invokeMethod(worker, std::move(task), Qt::QueuedConnection);
}

Connection SocketClient::connection() const {
    return state_->snapshot();
}

void SocketClient::setSocketDebug(bool enabled) {
    state_->socketDebug = enabled;
}

}  // namespace fl::client
