#include "logger.hpp"

#include <QtCore/QMutexLocker>

#include <cstdio>

namespace fl::common {

const char *level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

LogLevel level_from_string(const QString &text, LogLevel fallback) {
    const QString key = text.trimmed().toLower();
    if (key == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (key == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (key == QLatin1String("warn") || key == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (key == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return fallback;
}

Logger::Logger(QObject *parent) : QObject(parent) {
    qRegisterMetaType<fl::common::LogLevel>();
}

Logger &Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const QString &category, const QString &message) {
    if (static_cast<int>(level) < minimumLevel_.load()) {
        return;
    }
    const QDateTime timestamp = QDateTime::currentDateTimeUtc();
    QMutexLocker locker(&mutex_);
    if (echoToStderr_.load()) {
        std::fprintf(stderr, "%s [%s] %s: %s\n",
                     qPrintable(timestamp.toString(Qt::ISODateWithMs)),
                     level_name(level),
                     qPrintable(category),
                     qPrintable(message));
    }
    emit messageLogged(level, category, message, timestamp);
}

void Logger::setMinimumLevel(LogLevel level) {
    minimumLevel_.store(static_cast<int>(level));
}

LogLevel Logger::minimumLevel() const {
    return static_cast<LogLevel>(minimumLevel_.load());
}

void Logger::setEchoToStderr(bool enabled) {
    echoToStderr_.store(enabled);
}

}  // namespace fl::common
