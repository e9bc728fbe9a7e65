#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <QString>
#include <QStringList>

namespace ptatemp {

class BalanceQueryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Source of account balances for <<account>> placeholders.
class BalanceProvider
{
public:
    virtual ~BalanceProvider() = default;

    // Current balance of the account in cents. Throws BalanceQueryError.
    virtual int64_t balanceCents(const std::string &account) = 0;
};

// Asks hledger (or ledger) for "CMD -f JOURNAL bal ACCOUNT". Commands are tried
// in order; one that cannot be started is skipped. Results are cached for the
// lifetime of the provider.
class LedgerBalanceProvider : public BalanceProvider
{
public:
    LedgerBalanceProvider(QString journalPath, QStringList commands);

    int64_t balanceCents(const std::string &account) override;

private:
    QString m_journalPath;
    QStringList m_commands;
    std::map<std::string, int64_t> m_cache;
};

// Reads the total from `bal` output: the last non-empty line, reduced to its
// digits, '-' and '.'. Returns std::nullopt when no number can be read.
std::optional<int64_t> parseBalanceOutput(const QString &output);

} // namespace ptatemp
