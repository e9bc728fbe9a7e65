#include "ledger/line_item.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace ptatemp {

namespace {

constexpr const char *kSeparator = "  ";

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::optional<int64_t> roundToCents(double value)
{
    const double cents = std::round(value * 100.0);
    // 2^63 is the first double outside the int64 range.
    if (!(std::fabs(cents) < 9223372036854775808.0)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(cents);
}

} // namespace

LineItemError::LineItemError(LineItemErrorKind kind, const std::string &input)
    : std::runtime_error(toKindString(kind) + " in line item \"" + input + "\"")
    , m_kind(kind)
    , m_input(input)
{
}

std::string toKindString(LineItemErrorKind kind)
{
    switch (kind) {
    case LineItemErrorKind::MissingAccount:
        return "MissingAccount";
    case LineItemErrorKind::MissingValue:
        return "MissingValue";
    case LineItemErrorKind::MissingIsReal:
        return "MissingIsReal";
    }
    return "MissingValue";
}

LineItemBuilder &LineItemBuilder::account(const std::string &name)
{
    m_account = name;
    return *this;
}

LineItemBuilder &LineItemBuilder::value(int64_t cents)
{
    m_value = cents;
    return *this;
}

LineItemBuilder &LineItemBuilder::isReal(bool real)
{
    m_isReal = real;
    return *this;
}

LineItem LineItemBuilder::build() const
{
    if (!m_account.has_value()) {
        throw LineItemError(LineItemErrorKind::MissingAccount, std::string());
    }
    if (!m_value.has_value()) {
        throw LineItemError(LineItemErrorKind::MissingValue, *m_account);
    }
    if (!m_isReal.has_value()) {
        throw LineItemError(LineItemErrorKind::MissingIsReal, *m_account);
    }
    return LineItem{*m_account, *m_value, *m_isReal};
}

std::optional<int64_t> parseAmountCents(const std::string &text)
{
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char ch : text) {
        if (ch != '$' && ch != ',') {
            cleaned.push_back(ch);
        }
    }
    cleaned = trim(cleaned);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    // strtod would also accept "inf", "nan" and hex floats.
    for (char ch : cleaned) {
        if (!std::isdigit(static_cast<unsigned char>(ch)) && ch != '-'
            && ch != '+' && ch != '.' && ch != 'e' && ch != 'E') {
            return std::nullopt;
        }
    }

    char *end = nullptr;
    const double value = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return roundToCents(value);
}

LineItem parseLineItem(const std::string &text)
{
    // Postings are usually indented inside a journal entry.
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    const std::string body = text.substr(begin);

    const size_t firstSep = body.find(kSeparator);
    if (firstSep == std::string::npos) {
        throw LineItemError(LineItemErrorKind::MissingValue, text);
    }

    const std::string lhs = trim(body.substr(0, firstSep));
    const size_t lastSep = body.rfind(kSeparator);
    const std::string rhs = trim(body.substr(lastSep + 2));

    if (lhs.empty()) {
        throw LineItemError(LineItemErrorKind::MissingIsReal, text);
    }

    const bool opens = lhs.front() == '[';
    const bool closes = lhs.back() == ']';
    if (opens != closes) {
        throw LineItemError(LineItemErrorKind::MissingIsReal, text);
    }

    LineItemBuilder builder;
    builder.isReal(!opens);
    if (opens) {
        if (lhs.size() < 2) {
            throw LineItemError(LineItemErrorKind::MissingAccount, text);
        }
        const std::string inner = lhs.substr(1, lhs.size() - 2);
        if (inner.empty()) {
            throw LineItemError(LineItemErrorKind::MissingAccount, text);
        }
        builder.account(inner);
    } else {
        builder.account(lhs);
    }

    const auto cents = parseAmountCents(rhs);
    if (!cents.has_value()) {
        throw LineItemError(LineItemErrorKind::MissingValue, text);
    }
    builder.value(*cents);

    return builder.build();
}

std::string formatCents(int64_t cents)
{
    const uint64_t magnitude = cents < 0
        ? static_cast<uint64_t>(-(cents + 1)) + 1
        : static_cast<uint64_t>(cents);
    std::ostringstream out;
    if (cents < 0) {
        out << '-';
    }
    out << magnitude / 100 << '.' << std::setw(2) << std::setfill('0') << magnitude % 100;
    return out.str();
}

std::string formatLineItem(const LineItem &item)
{
    const std::string name = item.isReal ? item.account : "[" + item.account + "]";
    return name + "  \t$" + formatCents(item.value);
}

bool lineItemLess(const LineItem &a, const LineItem &b)
{
    if (a.isReal != b.isReal) {
        return a.isReal;
    }
    return a.account < b.account;
}

bool sameSlot(const LineItem &a, const LineItem &b)
{
    return a.isReal == b.isReal && a.account == b.account;
}

bool operator==(const LineItem &a, const LineItem &b)
{
    return sameSlot(a, b) && a.value == b.value;
}

bool operator!=(const LineItem &a, const LineItem &b)
{
    return !(a == b);
}

} // namespace ptatemp
