#include "call_queue.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QMutexLocker>
#include <QtCore/QTimer>

#include <exception>

#include "logger.hpp"

namespace fl::common {

CallQueue::CallQueue(QObject *parent) : QObject(parent) {}

void CallQueue::enqueue(std::function<void()> task) {
    {
        QMutexLocker locker(&mutex_);
        tasks_.push_back(std::move(task));
    }
    QMetaObject::invokeMethod(this, "drain", Qt::QueuedConnection);
}

int CallQueue::pendingCount() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(tasks_.size());
}

void CallQueue::drain() {
    while (true) {
        std::function<void()> task;
        {
            QMutexLocker locker(&mutex_);
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception &ex) {
            Logger::instance().log(LogLevel::Error, QStringLiteral("queue"),
                                   QStringLiteral("Queued task threw: %1").arg(QString::fromUtf8(ex.what())));
        }
    }
}

QtScheduler::QtScheduler(QObject *context) : context_(context) {
    if (context_) {
        queue_.moveToThread(context_->thread());
    }
}

void QtScheduler::post(Task task) {
    queue_.enqueue(std::move(task));
}

void QtScheduler::postDelayed(int delayMs, Task task) {
    QObject *context = context_ ? context_ : &queue_;
    queue_.enqueue([context, delayMs, task = std::move(task)]() mutable {
        QTimer::singleShot(delayMs, context, std::move(task));
    });
}

}  // namespace fl::common
