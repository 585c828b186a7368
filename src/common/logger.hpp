#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <atomic>

namespace fl::common {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

const char *level_name(LogLevel level);
LogLevel level_from_string(const QString &text, LogLevel fallback = LogLevel::Info);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger &instance();

    void log(LogLevel level, const QString &category, const QString &message);

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;
    void setEchoToStderr(bool enabled);

signals:
    void messageLogged(fl::common::LogLevel level, QString category, QString message, QDateTime timestamp);

private:
    explicit Logger(QObject *parent = nullptr);

    QMutex mutex_;
    std::atomic<int> minimumLevel_{static_cast<int>(LogLevel::Info)};
    std::atomic<bool> echoToStderr_{false};
};

}  // namespace fl::common
