#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace streakguard::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    // Empty means STREAKGUARD_LOG_DIR, then ~/.local/share/streakguard/logs.
    QString directory;
    // Debug lines go to the main log and a separate -trace.log.
    bool trace = false;
    qint64 maxFileBytes = 5 * 1024 * 1024;
    // Rotated generations kept as <name>.log.1 .. <name>.log.N.
    int keepRotated = 3;
};

// Call early in main(), and again once the configuration is known. Re-init
// closes the open log files.
void initLogging(const QString &processName, const LogOptions &options = LogOptions());

bool isTraceEnabled();

// Thread-local correlation id linking the lines of one request. Set it through
// CorrelationScope.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line per event. A "chatId" in the context is also written as the
// top-level "chat" field.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
// pid and uid of this process, for lines no user caused.
QString defaultWho();
// "user:<id>" or "user:<id>,name:<display name>".
QString actorWho(const Actor &actor);
QString logsDirPath();

} // namespace streakguard::logging

#define SGLOG_DEBUG(component, where, what, why, how, who, corr, ...) \
    ::streakguard::logging::logEvent(::streakguard::logging::LogLevel::Debug, \
                                     ::streakguard::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))

#define SGLOG_INFO(component, where, what, why, how, who, corr, ...) \
    ::streakguard::logging::logEvent(::streakguard::logging::LogLevel::Info, \
                                     ::streakguard::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))

#define SGLOG_WARN(component, where, what, why, how, who, corr, ...) \
    ::streakguard::logging::logEvent(::streakguard::logging::LogLevel::Warn, \
                                     ::streakguard::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))

#define SGLOG_ERROR(component, where, what, why, how, who, corr, ...) \
    ::streakguard::logging::logEvent(::streakguard::logging::LogLevel::Error, \
                                     ::streakguard::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))
