#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace ptatemp::logging {

namespace {

std::mutex g_logMutex;
LoggingOptions g_options;

thread_local QString t_corrId;

QString logFilePath(const QString &dir, const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("ptatemp")
        : processName;
    return dir + QDir::separator() + base + suffix;
}

// ptatemp.log -> ptatemp.log.1 -> ... -> ptatemp.log.N, oldest dropped.
void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < g_options.maxFileBytes) {
        return;
    }

    const int keep = qMax(1, g_options.keepRotated);
    QFile::remove(path + QStringLiteral(".%1").arg(keep));
    for (int i = keep - 1; i >= 1; --i) {
        QFile::rename(path + QStringLiteral(".%1").arg(i),
                      path + QStringLiteral(".%1").arg(i + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void writeLine(const QString &dir, const QString &path, const QByteArray &line)
{
    QDir().mkpath(dir);

    // Several ptatemp runs may share one log file.
    QLockFile lock(path + QStringLiteral(".lock"));
    lock.setStaleLockTime(5000);
    const bool locked = lock.tryLock(500);

    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");

    if (locked) {
        lock.unlock();
    }
}

} // namespace

void initLogging(const LoggingOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_options = options;
}

bool isTraceEnabled()
{
    return g_options.traceEnabled;
}

bool isEnabled(LogLevel level)
{
    if (level == LogLevel::Off) {
        return false;
    }
    return g_options.traceEnabled || level >= g_options.minimumLevel;
}

std::optional<LogLevel> parseLogLevel(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (key == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (key == QStringLiteral("warn") || key == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (key == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    if (key == QStringLiteral("off")) {
        return LogLevel::Off;
    }
    return std::nullopt;
}

QString toString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    case LogLevel::Off:
        return QStringLiteral("OFF");
    }
    return QStringLiteral("INFO");
}

QString defaultLogsDir()
{
    const QString state = qEnvironmentVariable("XDG_STATE_HOME");
    if (!state.isEmpty()) {
        return state + QStringLiteral("/ptatemp/logs");
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/state/ptatemp/logs");
    }
    return home + QStringLiteral("/.local/state/ptatemp/logs");
}

QString logsDirPath()
{
    return g_options.logDir.isEmpty() ? defaultLogsDir() : g_options.logDir;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    if (!g_options.processName.isEmpty()) {
        return g_options.processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("ptatemp");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (!isEnabled(level)) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", toString(level).toStdString()},
        {"process", processName.toStdString()},
        {"pid", static_cast<int64_t>(QCoreApplication::applicationPid())},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Template sources and tool output may carry invalid UTF-8.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString dir = logsDirPath();
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    if (level >= g_options.minimumLevel) {
        writeLine(dir, logFilePath(dir, process, QStringLiteral(".log")), line);
    }
    if (g_options.traceEnabled) {
        writeLine(dir, logFilePath(dir, process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace ptatemp::logging
