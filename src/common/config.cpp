#include "common/config.hpp"

#include <QtGlobal>

namespace ptatemp {

QStringList defaultBalanceCommands()
{
    return {QStringLiteral("hledger"), QStringLiteral("ledger")};
}

Config loadConfig()
{
    Config config;
    config.journalPath = qEnvironmentVariable("LEDGER_FILE");

    const QString commands = qEnvironmentVariable("PTATEMP_BALANCE_COMMANDS");
    for (const QString &command : commands.split(':', Qt::SkipEmptyParts)) {
        const QString trimmed = command.trimmed();
        if (!trimmed.isEmpty()) {
            config.balanceCommands.push_back(trimmed);
        }
    }
    if (config.balanceCommands.isEmpty()) {
        config.balanceCommands = defaultBalanceCommands();
    }

    config.logDir = qEnvironmentVariable("PTATEMP_LOG_DIR");
    const auto level = logging::parseLogLevel(qEnvironmentVariable("PTATEMP_LOG_LEVEL"));
    if (level.has_value()) {
        config.logLevel = *level;
    }

    config.traceEnabled = qEnvironmentVariableIntValue("PTATEMP_TRACE") == 1;
    return config;
}

logging::LoggingOptions loggingOptions(const Config &config, const QString &processName)
{
    logging::LoggingOptions options;
    options.processName = processName;
    options.logDir = config.logDir;
    options.minimumLevel = config.traceEnabled ? logging::LogLevel::Debug : config.logLevel;
    options.traceEnabled = config.traceEnabled;
    return options;
}

} // namespace ptatemp
