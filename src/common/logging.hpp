#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace ptatemp::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

struct LoggingOptions {
    QString processName;
    // Empty selects defaultLogsDir().
    QString logDir;
    LogLevel minimumLevel = LogLevel::Info;
    // Mirrors every event, debug included, to <process>-trace.log.
    bool traceEnabled = false;
    qint64 maxFileBytes = 2 * 1024 * 1024;
    int keepRotated = 3;
};

void initLogging(const LoggingOptions &options);

bool isTraceEnabled();
bool isEnabled(LogLevel level);

// "debug", "info", "warn"/"warning", "error", "off"; case-insensitive.
std::optional<LogLevel> parseLogLevel(const QString &name);
QString toString(LogLevel level);

// $XDG_STATE_HOME/ptatemp/logs, falling back to ~/.local/state/ptatemp/logs.
QString defaultLogsDir();
QString logsDirPath();

// Correlation id shared by every event emitted during one CLI run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

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
QString defaultWho();

} // namespace ptatemp::logging

#define PLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::ptatemp::logging::logEvent(::ptatemp::logging::LogLevel::Debug, \
                                 ::ptatemp::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::ptatemp::logging::logEvent(::ptatemp::logging::LogLevel::Info, \
                                 ::ptatemp::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::ptatemp::logging::logEvent(::ptatemp::logging::LogLevel::Warn, \
                                 ::ptatemp::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::ptatemp::logging::logEvent(::ptatemp::logging::LogLevel::Error, \
                                 ::ptatemp::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
