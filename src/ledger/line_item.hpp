#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace ptatemp {

// A single posting. Amounts are kept in integer cents so balancing is exact.
struct LineItem {
    std::string account;
    int64_t value = 0;
    // Real postings must balance among themselves; virtual ([bracketed])
    // postings must balance among themselves too.
    bool isReal = true;
};

enum class LineItemErrorKind {
    MissingAccount,
    MissingValue,
    MissingIsReal
};

class LineItemError : public std::runtime_error
{
public:
    LineItemError(LineItemErrorKind kind, const std::string &input);

    LineItemErrorKind kind() const { return m_kind; }
    const std::string &input() const { return m_input; }

private:
    LineItemErrorKind m_kind;
    std::string m_input;
};

std::string toKindString(LineItemErrorKind kind);

class LineItemBuilder
{
public:
    LineItemBuilder &account(const std::string &name);
    LineItemBuilder &value(int64_t cents);
    LineItemBuilder &isReal(bool real);

    // Throws LineItemError naming the first missing field.
    LineItem build() const;

private:
    std::optional<std::string> m_account;
    std::optional<int64_t> m_value;
    std::optional<bool> m_isReal;
};

// Parses "account  $12.34" or "[account]  -5". The account and the amount are
// separated by at least two spaces, as in ledger journals.
LineItem parseLineItem(const std::string &text);

// Parses a decimal amount ("$1,234.50", "-7") into cents, rounding half away
// from zero. Returns std::nullopt if the text is not a number.
std::optional<int64_t> parseAmountCents(const std::string &text);

std::string formatCents(int64_t cents);
std::string formatLineItem(const LineItem &item);

// Real before virtual, then by account. Values are not compared.
bool lineItemLess(const LineItem &a, const LineItem &b);
bool sameSlot(const LineItem &a, const LineItem &b);

bool operator==(const LineItem &a, const LineItem &b);
bool operator!=(const LineItem &a, const LineItem &b);

} // namespace ptatemp
