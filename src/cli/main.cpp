#include <QCoreApplication>

#include "cli/PtaTempCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("ptatemp"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PTATEMP_VERSION));

    ptatemp::Config config = ptatemp::loadConfig();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    ptatemp::logging::initLogging(ptatemp::loggingOptions(config, QStringLiteral("ptatemp")));
    PLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              ptatemp::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()}}));

    ptatemp::PtaTempCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
