#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <QDate>
#include <QString>

#include "ledger/line_item.hpp"

namespace ptatemp {

struct Transaction {
    QDate date;
    std::string description;
    std::vector<LineItem> lineItems;
};

enum class TransactionErrorKind {
    MissingDate,
    MissingDescription,
    NotEnoughLineItems,
    DoesNotBalance
};

class TransactionError : public std::runtime_error
{
public:
    explicit TransactionError(TransactionErrorKind kind, int64_t imbalance = 0);

    TransactionErrorKind kind() const { return m_kind; }
    // Sum of the offending postings in cents; only set for DoesNotBalance.
    int64_t imbalance() const { return m_imbalance; }

private:
    TransactionErrorKind m_kind;
    int64_t m_imbalance;
};

std::string toKindString(TransactionErrorKind kind);

class TransactionBuilder
{
public:
    TransactionBuilder &date(const QDate &date);
    TransactionBuilder &description(const std::string &description);
    TransactionBuilder &lineItems(std::vector<LineItem> items);
    TransactionBuilder &addLineItem(LineItem item);

    // Both throw DoesNotBalance with the saturated sum if it leaves the int64 range.
    int64_t currentRealBalance() const;
    int64_t currentVirtualBalance() const;

    // Validates and produces the transaction. Virtual postings are checked
    // before real ones; the first failure is thrown as TransactionError.
    Transaction balance() const;

private:
    std::optional<QDate> m_date;
    std::optional<std::string> m_description;
    std::vector<LineItem> m_lineItems;
};

std::string formatTransaction(const Transaction &transaction);

// Appends the formatted transaction to the journal, creating the file when
// missing. Throws std::runtime_error on I/O failure.
void postTransaction(const Transaction &transaction, const QString &journalPath);

// Sorts both lists and merges them; an override replaces the default posting
// for the same account and kind.
std::vector<LineItem> mergeOverrides(std::vector<LineItem> defaults,
                                     std::vector<LineItem> overrides);

} // namespace ptatemp
