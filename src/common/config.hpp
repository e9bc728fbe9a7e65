#pragma once

#include <QString>
#include <QStringList>

#include "common/logging.hpp"

namespace ptatemp {

// Process-wide settings read from the environment. Command line flags are
// applied on top of this by the CLI.
struct Config {
    QString journalPath;
    QStringList balanceCommands;
    QString logDir;
    logging::LogLevel logLevel = logging::LogLevel::Info;
    bool traceEnabled = false;
};

QStringList defaultBalanceCommands();

Config loadConfig();

logging::LoggingOptions loggingOptions(const Config &config, const QString &processName);

} // namespace ptatemp
