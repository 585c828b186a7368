#pragma once

#include <QtCore/QMutex>
#include <QtCore/QObject>

#include <deque>
#include <functional>

namespace fl::common {

// Work that has to run on a particular thread, posted from any thread.
class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual void post(Task task) = 0;
    virtual void postDelayed(int delayMs, Task task) = 0;
};

// FIFO drained by the thread that owns the CallQueue object.
class CallQueue : public QObject {
    Q_OBJECT

public:
    explicit CallQueue(QObject *parent = nullptr);

    void enqueue(std::function<void()> task);
    int pendingCount() const;

public slots:
    void drain();

private:
    mutable QMutex mutex_;
    std::deque<std::function<void()>> tasks_;
};

class QtScheduler : public Scheduler {
public:
    explicit QtScheduler(QObject *context);

    void post(Task task) override;
    void postDelayed(int delayMs, Task task) override;

private:
    QObject *context_;
    CallQueue queue_;
};

}  // namespace fl::common
