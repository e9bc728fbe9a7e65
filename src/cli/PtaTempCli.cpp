#include "cli/PtaTempCli.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QUuid>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "ledger/transaction.hpp"
#include "template/balance_placeholders.hpp"
#include "template/environment.hpp"
#include "template/errors.hpp"

namespace ptatemp {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  ptatemp -t TEMPLATE -D DESCRIPTION [-f JOURNAL] [-d YYYY-MM-DD]\n"
        "          [-v NAME=VALUE]... [-o 'ACCOUNT  AMOUNT']...\n"
        "          [--format ledger|json] [--post] [--trace]\n");
}

std::optional<int64_t> parseStrictInteger(const std::string &text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    const size_t digitsStart = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (digitsStart == text.size()) {
        return std::nullopt;
    }
    for (size_t i = digitsStart; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    errno = 0;
    const long long value = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

bool isCommentOrBlank(const std::string &line)
{
    for (char ch : line) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        return ch == ';' || ch == '#';
    }
    return true;
}

} // namespace

VarParseResult parseVars(const QStringList &vars)
{
    VarParseResult result;
    for (const QString &var : vars) {
        const QStringList parts = var.split('=');
        if (parts.size() < 2) {
            result.badVars.push_back(var.trimmed());
            continue;
        }

        const std::string key = parts.first().trimmed().toStdString();
        const std::string value = parts.last().toStdString();
        const auto integer = parseStrictInteger(value);
        if (integer.has_value()) {
            result.context[key] = *integer;
        } else {
            result.context[key] = value;
        }
    }
    return result;
}

std::optional<QDate> parseEntryDate(const QString &value)
{
    if (value.isEmpty()) {
        return std::nullopt;
    }
    const QDate date = QDate::fromString(value.trimmed(), QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

std::vector<LineItem> renderLineItems(const std::string &source,
                                      BalanceProvider &provider,
                                      const nlohmann::json &context)
{
    templating::Environment env;
    env.setTrimBlocks(true);

    const std::string expanded = templating::expandPlaceholders(source, provider);
    const std::string rendered = env.renderString(expanded, context);

    std::vector<LineItem> items;
    size_t start = 0;
    while (start <= rendered.size()) {
        size_t end = rendered.find('\n', start);
        if (end == std::string::npos) {
            end = rendered.size();
        }
        std::string line = rendered.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!isCommentOrBlank(line)) {
            items.push_back(parseLineItem(line));
        }
        start = end + 1;
    }
    return items;
}

int PtaTempCli::fail(const QString &prefix, const std::string &reason) const
{
    std::cerr << prefix.toStdString() << reason << std::endl;
    PLOG_ERROR(QStringLiteral("PtaTempCli"),
               QStringLiteral("run"),
               QStringLiteral("entry_failed"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               ptatemp::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"stage", prefix.trimmed().toStdString()},
                               {"reason", reason}}));
    return 1;
}

int PtaTempCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Render a plaintext-accounting journal entry from a template."));
    const QCommandLineOption helpOption(QStringList() << "h" << "help",
                                        QStringLiteral("Show this help."));
    const QCommandLineOption versionOption(QStringList() << "version",
                                           QStringLiteral("Show the version."));
    const QCommandLineOption journalOption(QStringList() << "f" << "journal",
                                           QStringLiteral("Journal file (default: $LEDGER_FILE)."),
                                           QStringLiteral("FILE"));
    const QCommandLineOption templateOption(QStringList() << "t" << "template",
                                            QStringLiteral("Template file."),
                                            QStringLiteral("FILE"));
    const QCommandLineOption dateOption(QStringList() << "d" << "date",
                                        QStringLiteral("Entry date, YYYY-MM-DD (default: today)."),
                                        QStringLiteral("DATE"));
    const QCommandLineOption descOption(QStringList() << "D" << "desc",
                                        QStringLiteral("Entry description."),
                                        QStringLiteral("TEXT"));
    const QCommandLineOption varOption(QStringList() << "v" << "var",
                                       QStringLiteral("Template variable NAME=VALUE."),
                                       QStringLiteral("NAME=VALUE"));
    const QCommandLineOption overrideOption(QStringList() << "o" << "override",
                                            QStringLiteral("Posting that replaces the template's posting for the same account."),
                                            QStringLiteral("ENTRY"));
    const QCommandLineOption formatOption(QStringList() << "format",
                                          QStringLiteral("Output format: ledger or json."),
                                          QStringLiteral("FORMAT"),
                                          QStringLiteral("ledger"));
    const QCommandLineOption postOption(QStringList() << "post",
                                        QStringLiteral("Also append the entry to the journal."));
    // Handled in main() before logging starts; declared here for --help.
    const QCommandLineOption traceOption(QStringList() << "trace",
                                         QStringLiteral("Write debug logs to ptatemp-trace.log (also PTATEMP_TRACE=1)."));
    parser.addOptions({helpOption, versionOption, journalOption, templateOption, dateOption,
                       descOption, varOption, overrideOption, formatOption, postOption,
                       traceOption});

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n"
                  << usageText().toStdString();
        return 1;
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return 0;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "ptatemp " << PTATEMP_VERSION << std::endl;
        return 0;
    }

    ptatemp::logging::CorrelationScope correlation(
        QUuid::createUuid().toString(QUuid::WithoutBraces));

    if (!parser.isSet(templateOption) || !parser.isSet(descOption)) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = parser.value(formatOption).toLower();
    if (format != QStringLiteral("ledger") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use ledger or json." << std::endl;
        return 1;
    }

    const Config config = loadConfig();
    const QString journal = parser.isSet(journalOption)
        ? parser.value(journalOption)
        : config.journalPath;
    if (journal.isEmpty()) {
        std::cerr << "No journal given. Pass -f FILE or set LEDGER_FILE." << std::endl;
        return 1;
    }

    const VarParseResult vars = parseVars(parser.values(varOption));
    for (const QString &bad : vars.badVars) {
        std::cerr << "Skipping bad var \"" << bad.toStdString()
                  << "\". Vars should be passed in the form of `-v name=value`"
                  << std::endl;
    }

    QDate date = QDate::currentDate();
    if (parser.isSet(dateOption)) {
        const auto parsed = parseEntryDate(parser.value(dateOption));
        if (parsed.has_value()) {
            date = *parsed;
        } else {
            PLOG_WARN(QStringLiteral("PtaTempCli"),
                      QStringLiteral("run"),
                      QStringLiteral("invalid_date"),
                      QStringLiteral("user_invocation"),
                      QStringLiteral("fallback_today"),
                      ptatemp::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"date", parser.value(dateOption).toStdString()}}));
        }
    }

    const QString templatePath = parser.value(templateOption);
    PLOG_INFO(QStringLiteral("PtaTempCli"),
              QStringLiteral("run"),
              QStringLiteral("render_entry"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              ptatemp::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"template", templatePath.toStdString()},
                              {"journal", journal.toStdString()},
                              {"vars", vars.context.size()},
                              {"overrides", parser.values(overrideOption).size()},
                              {"format", format.toStdString()}}));

    QFile templateFile(templatePath);
    if (!templateFile.open(QIODevice::ReadOnly)) {
        return fail(QStringLiteral("Failed to parse template because of "),
                    "cannot read " + templatePath.toStdString() + ": "
                        + templateFile.errorString().toStdString());
    }
    const std::string source = templateFile.readAll().toStdString();

    std::vector<LineItem> lineItems;
    try {
        LedgerBalanceProvider provider(journal, config.balanceCommands);
        lineItems = renderLineItems(source, provider, vars.context);
    } catch (const templating::TemplateError &e) {
        return fail(QStringLiteral("Failed to parse template because of "), e.what());
    } catch (const BalanceQueryError &e) {
        return fail(QStringLiteral("Failed to parse template because of "), e.what());
    } catch (const LineItemError &e) {
        return fail(QStringLiteral("Failed to parse template because of "), e.what());
    }

    std::vector<LineItem> overrides;
    try {
        for (const QString &entry : parser.values(overrideOption)) {
            overrides.push_back(parseLineItem(entry.toStdString()));
        }
    } catch (const LineItemError &e) {
        return fail(QStringLiteral("Failed to parse override because of "), e.what());
    }
    if (!overrides.empty()) {
        lineItems = mergeOverrides(std::move(lineItems), std::move(overrides));
    }

    Transaction transaction;
    try {
        transaction = TransactionBuilder()
                          .date(date)
                          .description(parser.value(descOption).toStdString())
                          .lineItems(std::move(lineItems))
                          .balance();
    } catch (const TransactionError &e) {
        return fail(QStringLiteral("Could not build transaction because of "), e.what());
    }

    if (format == QStringLiteral("json")) {
        const nlohmann::json payload = transaction;
        std::cout << payload.dump(2) << std::endl;
    } else {
        std::cout << formatTransaction(transaction) << std::endl;
    }

    if (parser.isSet(postOption)) {
        try {
            postTransaction(transaction, journal);
        } catch (const std::runtime_error &e) {
            return fail(QStringLiteral("Could not post transaction because of "), e.what());
        }
        PLOG_INFO(QStringLiteral("PtaTempCli"),
                  QStringLiteral("run"),
                  QStringLiteral("entry_posted"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("journal_append"),
                  ptatemp::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"journal", journal.toStdString()},
                                  {"postings", transaction.lineItems.size()}}));
    }

    return 0;
}

} // namespace ptatemp
