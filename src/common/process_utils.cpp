#include "common/process_utils.hpp"

#include <QProcess>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace ptatemp {

std::optional<ProcessOutput> runProcess(const QString &program,
                                        const QStringList &args,
                                        int timeoutMs)
{
    PLOG_DEBUG(QStringLiteral("ProcessUtils"),
               QStringLiteral("runProcess"),
               QStringLiteral("process_start"),
               QStringLiteral("external_tool"),
               QStringLiteral("qprocess"),
               ptatemp::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"program", program.toStdString()},
                               {"args", args.join(' ').toStdString()}}));

    QProcess process;
    process.start(program, args);

    if (!process.waitForStarted()) {
        PLOG_DEBUG(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runProcess"),
                   QStringLiteral("process_start_failed"),
                   QStringLiteral("external_tool"),
                   QStringLiteral("qprocess"),
                   ptatemp::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"program", program.toStdString()},
                                   {"error", process.errorString().toStdString()}}));
        return std::nullopt;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        PLOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("runProcess"),
                  QStringLiteral("process_timeout"),
                  QStringLiteral("external_tool"),
                  QStringLiteral("qprocess"),
                  ptatemp::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", program.toStdString()},
                                  {"timeoutMs", timeoutMs}}));
        return std::nullopt;
    }

    ProcessOutput output;
    output.exitCode = process.exitCode();
    output.crashed = process.exitStatus() != QProcess::NormalExit;
    output.standardOutput = process.readAllStandardOutput();
    output.standardError = process.readAllStandardError();
    return output;
}

} // namespace ptatemp
