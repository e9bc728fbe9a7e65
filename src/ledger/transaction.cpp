#include "ledger/transaction.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

#include <QFile>

namespace ptatemp {

namespace {

// Throws DoesNotBalance with the saturated sum when it leaves the int64 range.
int64_t sumWhere(const std::vector<LineItem> &items, bool real)
{
    return std::accumulate(items.begin(), items.end(), int64_t{0},
                           [real](int64_t acc, const LineItem &item) {
                               if (item.isReal != real) {
                                   return acc;
                               }
                               int64_t sum = 0;
                               if (__builtin_add_overflow(acc, item.value, &sum)) {
                                   throw TransactionError(
                                       TransactionErrorKind::DoesNotBalance,
                                       item.value > 0 ? std::numeric_limits<int64_t>::max()
                                                      : std::numeric_limits<int64_t>::min());
                               }
                               return sum;
                           });
}

std::string errorMessage(TransactionErrorKind kind, int64_t imbalance)
{
    if (kind == TransactionErrorKind::DoesNotBalance) {
        return "DoesNotBalance(" + std::to_string(imbalance) + ")";
    }
    return toKindString(kind);
}

} // namespace

TransactionError::TransactionError(TransactionErrorKind kind, int64_t imbalance)
    : std::runtime_error(errorMessage(kind, imbalance))
    , m_kind(kind)
    , m_imbalance(imbalance)
{
}

std::string toKindString(TransactionErrorKind kind)
{
    switch (kind) {
    case TransactionErrorKind::MissingDate:
        return "MissingDate";
    case TransactionErrorKind::MissingDescription:
        return "MissingDescription";
    case TransactionErrorKind::NotEnoughLineItems:
        return "NotEnoughLineItems";
    case TransactionErrorKind::DoesNotBalance:
        return "DoesNotBalance";
    }
    return "DoesNotBalance";
}

TransactionBuilder &TransactionBuilder::date(const QDate &date)
{
    m_date = date;
    return *this;
}

TransactionBuilder &TransactionBuilder::description(const std::string &description)
{
    m_description = description;
    return *this;
}

TransactionBuilder &TransactionBuilder::lineItems(std::vector<LineItem> items)
{
    m_lineItems = std::move(items);
    return *this;
}

TransactionBuilder &TransactionBuilder::addLineItem(LineItem item)
{
    m_lineItems.push_back(std::move(item));
    return *this;
}

int64_t TransactionBuilder::currentRealBalance() const
{
    return sumWhere(m_lineItems, true);
}

int64_t TransactionBuilder::currentVirtualBalance() const
{
    return sumWhere(m_lineItems, false);
}

Transaction TransactionBuilder::balance() const
{
    if (!m_date.has_value() || !m_date->isValid()) {
        throw TransactionError(TransactionErrorKind::MissingDate);
    }
    if (!m_description.has_value()) {
        throw TransactionError(TransactionErrorKind::MissingDescription);
    }
    if (m_lineItems.size() < 2) {
        throw TransactionError(TransactionErrorKind::NotEnoughLineItems);
    }

    const int64_t virtualBalance = currentVirtualBalance();
    if (virtualBalance != 0) {
        throw TransactionError(TransactionErrorKind::DoesNotBalance, virtualBalance);
    }
    const int64_t realBalance = currentRealBalance();
    if (realBalance != 0) {
        throw TransactionError(TransactionErrorKind::DoesNotBalance, realBalance);
    }

    return Transaction{*m_date, *m_description, m_lineItems};
}

std::string formatTransaction(const Transaction &transaction)
{
    std::string out = transaction.date.toString(QStringLiteral("yyyy-MM-dd")).toStdString();
    out += ' ';
    out += transaction.description;
    for (const auto &item : transaction.lineItems) {
        out += "\n    ";
        out += formatLineItem(item);
    }
    return out;
}

void postTransaction(const Transaction &transaction, const QString &journalPath)
{
    QFile file(journalPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        throw std::runtime_error("failed to open journal " + journalPath.toStdString()
                                 + ": " + file.errorString().toStdString());
    }

    std::string text = formatTransaction(transaction) + "\n";
    if (file.size() > 0) {
        text.insert(0, "\n");
    }
    const QByteArray data = QByteArray::fromStdString(text);
    if (file.write(data) != data.size()) {
        throw std::runtime_error("failed to append to journal " + journalPath.toStdString());
    }
}

std::vector<LineItem> mergeOverrides(std::vector<LineItem> defaults,
                                     std::vector<LineItem> overrides)
{
    std::stable_sort(defaults.begin(), defaults.end(), lineItemLess);
    std::stable_sort(overrides.begin(), overrides.end(), lineItemLess);

    std::vector<LineItem> merged;
    merged.reserve(defaults.size() + overrides.size());

    auto def = defaults.begin();
    auto over = overrides.begin();
    while (def != defaults.end() || over != overrides.end()) {
        if (def == defaults.end()) {
            merged.push_back(*over++);
        } else if (over == overrides.end()) {
            merged.push_back(*def++);
        } else if (lineItemLess(*over, *def)) {
            merged.push_back(*over++);
        } else if (lineItemLess(*def, *over)) {
            merged.push_back(*def++);
        } else {
            merged.push_back(*over++);
            ++def;
        }
    }
    return merged;
}

} // namespace ptatemp
