#include "ledger/balance_query.hpp"

#include <utility>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "ledger/line_item.hpp"

#include <nlohmann/json.hpp>

namespace ptatemp {

std::optional<int64_t> parseBalanceOutput(const QString &output)
{
    const QStringList lines = output.split('\n');
    // A trailing newline leaves an empty last element; the total sits just
    // before it.
    int index = lines.size() - 1;
    while (index >= 0 && lines.at(index).trimmed().isEmpty()) {
        --index;
    }
    if (index < 0) {
        return std::nullopt;
    }

    std::string digits;
    for (const QChar ch : lines.at(index)) {
        if (ch.isDigit() || ch == '-' || ch == '.') {
            digits.push_back(ch.toLatin1());
        }
    }
    if (digits.empty()) {
        return std::nullopt;
    }
    return parseAmountCents(digits);
}

LedgerBalanceProvider::LedgerBalanceProvider(QString journalPath, QStringList commands)
    : m_journalPath(std::move(journalPath))
    , m_commands(std::move(commands))
{
}

int64_t LedgerBalanceProvider::balanceCents(const std::string &account)
{
    const auto cached = m_cache.find(account);
    if (cached != m_cache.end()) {
        return cached->second;
    }

    const QStringList args = {QStringLiteral("-f"), m_journalPath,
                              QStringLiteral("bal"), QString::fromStdString(account)};

    std::optional<ProcessOutput> output;
    QString usedCommand;
    for (const QString &command : m_commands) {
        output = runProcess(command, args);
        if (output.has_value()) {
            usedCommand = command;
            break;
        }
    }

    if (!output.has_value()) {
        throw BalanceQueryError(
            "Failed to execute " + m_commands.join(QStringLiteral(" and ")).toStdString()
            + " commands. Are they installed?");
    }

    if (output->crashed) {
        throw BalanceQueryError(usedCommand.toStdString()
                                + " crashed while reading the balance of account " + account);
    }

    if (output->exitCode != 0) {
        PLOG_WARN(QStringLiteral("BalanceQuery"),
                  QStringLiteral("balanceCents"),
                  QStringLiteral("balance_command_failed"),
                  QStringLiteral("placeholder_expansion"),
                  QStringLiteral("qprocess"),
                  ptatemp::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"command", usedCommand.toStdString()},
                                  {"account", account},
                                  {"exitCode", output->exitCode},
                                  {"stderr", output->standardError.toStdString()}}));
    }

    const auto cents = parseBalanceOutput(QString::fromUtf8(output->standardOutput));
    if (!cents.has_value()) {
        throw BalanceQueryError("Could not parse balance for account " + account);
    }

    PLOG_DEBUG(QStringLiteral("BalanceQuery"),
               QStringLiteral("balanceCents"),
               QStringLiteral("balance_resolved"),
               QStringLiteral("placeholder_expansion"),
               QStringLiteral("qprocess"),
               ptatemp::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", usedCommand.toStdString()},
                               {"account", account},
                               {"cents", *cents}}));

    m_cache.emplace(account, *cents);
    return *cents;
}

} // namespace ptatemp
