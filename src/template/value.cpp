#include "template/value.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include "template/errors.hpp"

namespace ptatemp::templating {

namespace {

[[noreturn]] void unsupported(const char *op, const Value &a, const Value &b)
{
    throw ValueError(std::string("unsupported operand types for ") + op + ": "
                     + typeName(a) + " and " + typeName(b));
}

void requireDefined(const char *op, const Value &a, const Value &b)
{
    if (isUndefined(a) || isUndefined(b)) {
        throw ValueError(std::string("undefined value in operation ") + op);
    }
}

double floorMod(double a, double b)
{
    double result = std::fmod(a, b);
    if (result != 0.0 && ((result < 0) != (b < 0))) {
        result += b;
    }
    return result;
}

std::string quoted(const std::string &text)
{
    return nlohmann::json(text).dump(-1, ' ', false,
                                     nlohmann::json::error_handler_t::replace);
}

std::string reprForContainer(const Value &value)
{
    if (value.is_string()) {
        return quoted(value.get<std::string>());
    }
    if (isUndefined(value)) {
        return "undefined";
    }
    return toDisplayString(value);
}

} // namespace

Value makeUndefined()
{
    return Value(Value::value_t::discarded);
}

bool isUndefined(const Value &value)
{
    return value.is_discarded();
}

bool isInteger(const Value &value)
{
    return value.is_number_integer();
}

bool isFloat(const Value &value)
{
    return value.is_number_float();
}

bool isNumber(const Value &value)
{
    return value.is_number();
}

int64_t toInt64(const Value &value)
{
    if (value.is_number_unsigned()) {
        const uint64_t unsignedValue = value.get<uint64_t>();
        if (unsignedValue > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw ValueError("integer overflow converting " + std::to_string(unsignedValue));
        }
        return static_cast<int64_t>(unsignedValue);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        // 2^63 is the first double outside the int64 range.
        const double truncated = std::trunc(value.get<double>());
        if (!(std::fabs(truncated) < 9223372036854775808.0)) {
            throw ValueError("integer overflow converting " + formatFloat(value.get<double>()));
        }
        return static_cast<int64_t>(truncated);
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1 : 0;
    }
    throw ValueError("expected a number, got " + typeName(value));
}

double toDouble(const Value &value)
{
    if (value.is_number_float()) {
        return value.get<double>();
    }
    if (value.is_number_integer() || value.is_boolean()) {
        return static_cast<double>(toInt64(value));
    }
    throw ValueError("expected a number, got " + typeName(value));
}

std::string typeName(const Value &value)
{
    if (isUndefined(value)) {
        return "undefined";
    }
    switch (value.type()) {
    case Value::value_t::null:
        return "none";
    case Value::value_t::boolean:
        return "bool";
    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
        return "int";
    case Value::value_t::number_float:
        return "float";
    case Value::value_t::string:
        return "string";
    case Value::value_t::array:
        return "sequence";
    case Value::value_t::object:
        return "map";
    default:
        return "unknown";
    }
}

bool isTruthy(const Value &value)
{
    if (isUndefined(value) || value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return toInt64(value) != 0;
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        return !value.get_ref<const std::string &>().empty();
    }
    if (value.is_array() || value.is_object()) {
        return !value.empty();
    }
    return true;
}

std::string formatFloat(double value)
{
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    char buffer[64];
    if (value == std::floor(value) && std::fabs(value) < 1e16) {
        std::snprintf(buffer, sizeof(buffer), "%.1f", value);
        return buffer;
    }

    // Shortest representation that reads back to the same double.
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

std::string toDisplayString(const Value &value)
{
    if (isUndefined(value)) {
        return std::string();
    }
    switch (value.type()) {
    case Value::value_t::null:
        return "none";
    case Value::value_t::boolean:
        return value.get<bool>() ? "true" : "false";
    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
        return std::to_string(toInt64(value));
    case Value::value_t::number_float:
        return formatFloat(value.get<double>());
    case Value::value_t::string:
        return value.get<std::string>();
    case Value::value_t::array: {
        std::string out = "[";
        bool first = true;
        for (const auto &item : value) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += reprForContainer(item);
        }
        return out + "]";
    }
    case Value::value_t::object: {
        std::string out = "{";
        bool first = true;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += quoted(it.key()) + ": " + reprForContainer(it.value());
        }
        return out + "}";
    }
    default:
        return std::string();
    }
}

Value add(const Value &a, const Value &b)
{
    requireDefined("+", a, b);
    if (isInteger(a) && isInteger(b)) {
        int64_t result = 0;
        if (__builtin_add_overflow(toInt64(a), toInt64(b), &result)) {
            throw ValueError("integer overflow in +");
        }
        return result;
    }
    if (isNumber(a) && isNumber(b)) {
        return toDouble(a) + toDouble(b);
    }
    if (a.is_string() && b.is_string()) {
        return a.get<std::string>() + b.get<std::string>();
    }
    if (a.is_array() && b.is_array()) {
        Value result = a;
        for (const auto &item : b) {
            result.push_back(item);
        }
        return result;
    }
    unsupported("+", a, b);
}

Value subtract(const Value &a, const Value &b)
{
    requireDefined("-", a, b);
    if (isInteger(a) && isInteger(b)) {
        int64_t result = 0;
        if (__builtin_sub_overflow(toInt64(a), toInt64(b), &result)) {
            throw ValueError("integer overflow in -");
        }
        return result;
    }
    if (isNumber(a) && isNumber(b)) {
        return toDouble(a) - toDouble(b);
    }
    unsupported("-", a, b);
}

Value multiply(const Value &a, const Value &b)
{
    requireDefined("*", a, b);
    if (isInteger(a) && isInteger(b)) {
        int64_t result = 0;
        if (__builtin_mul_overflow(toInt64(a), toInt64(b), &result)) {
            throw ValueError("integer overflow in *");
        }
        return result;
    }
    if (isNumber(a) && isNumber(b)) {
        return toDouble(a) * toDouble(b);
    }
    if (a.is_string() && isInteger(b)) {
        std::string out;
        for (int64_t i = 0; i < toInt64(b); ++i) {
            out += a.get_ref<const std::string &>();
        }
        return out;
    }
    unsupported("*", a, b);
}

Value divide(const Value &a, const Value &b)
{
    requireDefined("/", a, b);
    if (!isNumber(a) || !isNumber(b)) {
        unsupported("/", a, b);
    }
    const double divisor = toDouble(b);
    if (divisor == 0.0) {
        throw ValueError("division by zero");
    }
    return toDouble(a) / divisor;
}

Value floorDivide(const Value &a, const Value &b)
{
    requireDefined("//", a, b);
    if (isInteger(a) && isInteger(b)) {
        const int64_t lhs = toInt64(a);
        const int64_t rhs = toInt64(b);
        if (rhs == 0) {
            throw ValueError("division by zero");
        }
        if (lhs == std::numeric_limits<int64_t>::min() && rhs == -1) {
            throw ValueError("integer overflow in //");
        }
        int64_t quotient = lhs / rhs;
        if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
            --quotient;
        }
        return quotient;
    }
    if (isNumber(a) && isNumber(b)) {
        const double divisor = toDouble(b);
        if (divisor == 0.0) {
            throw ValueError("division by zero");
        }
        return std::floor(toDouble(a) / divisor);
    }
    unsupported("//", a, b);
}

Value modulo(const Value &a, const Value &b)
{
    requireDefined("%", a, b);
    if (isInteger(a) && isInteger(b)) {
        const int64_t lhs = toInt64(a);
        const int64_t rhs = toInt64(b);
        if (rhs == 0) {
            throw ValueError("modulo by zero");
        }
        if (rhs == -1) {
            return int64_t{0};
        }
        int64_t result = lhs % rhs;
        if (result != 0 && ((result < 0) != (rhs < 0))) {
            result += rhs;
        }
        return result;
    }
    if (isNumber(a) && isNumber(b)) {
        const double divisor = toDouble(b);
        if (divisor == 0.0) {
            throw ValueError("modulo by zero");
        }
        return floorMod(toDouble(a), divisor);
    }
    unsupported("%", a, b);
}

Value power(const Value &a, const Value &b)
{
    requireDefined("**", a, b);
    if (isInteger(a) && isInteger(b) && toInt64(b) >= 0) {
        const int64_t base = toInt64(a);
        int64_t result = 1;
        for (int64_t i = 0; i < toInt64(b); ++i) {
            if (__builtin_mul_overflow(result, base, &result)) {
                throw ValueError("integer overflow in **");
            }
        }
        return result;
    }
    if (isNumber(a) && isNumber(b)) {
        return std::pow(toDouble(a), toDouble(b));
    }
    unsupported("**", a, b);
}

Value negate(const Value &a)
{
    if (isInteger(a)) {
        const int64_t value = toInt64(a);
        if (value == INT64_MIN) {
            throw ValueError("integer overflow in unary -");
        }
        return -value;
    }
    if (isFloat(a)) {
        return -a.get<double>();
    }
    throw ValueError("unsupported operand type for unary -: " + typeName(a));
}

bool valuesEqual(const Value &a, const Value &b)
{
    if (isUndefined(a) || isUndefined(b)) {
        return isUndefined(a) && isUndefined(b);
    }
    if (isNumber(a) && isNumber(b)) {
        if (isInteger(a) && isInteger(b)) {
            return toInt64(a) == toInt64(b);
        }
        return toDouble(a) == toDouble(b);
    }
    return a == b;
}

int compareValues(const Value &a, const Value &b)
{
    requireDefined("comparison", a, b);
    if (isNumber(a) && isNumber(b)) {
        if (isInteger(a) && isInteger(b)) {
            const int64_t lhs = toInt64(a);
            const int64_t rhs = toInt64(b);
            return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
        }
        const double lhs = toDouble(a);
        const double rhs = toDouble(b);
        return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string &>().compare(b.get_ref<const std::string &>());
    }
    if (a.is_boolean() && b.is_boolean()) {
        return static_cast<int>(a.get<bool>()) - static_cast<int>(b.get<bool>());
    }
    throw ValueError("cannot compare " + typeName(a) + " and " + typeName(b));
}

bool contains(const Value &container, const Value &needle)
{
    if (isUndefined(container)) {
        return false;
    }
    if (container.is_string()) {
        if (!needle.is_string()) {
            throw ValueError("'in <string>' requires a string, got " + typeName(needle));
        }
        return container.get_ref<const std::string &>().find(
                   needle.get_ref<const std::string &>())
            != std::string::npos;
    }
    if (container.is_array()) {
        for (const auto &item : container) {
            if (valuesEqual(item, needle)) {
                return true;
            }
        }
        return false;
    }
    if (container.is_object()) {
        return needle.is_string() && container.contains(needle.get<std::string>());
    }
    throw ValueError("cannot test membership in " + typeName(container));
}

std::vector<std::string> splitCodePoints(const std::string &text)
{
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 1;
        if (lead >= 0xF0) {
            length = 4;
        } else if (lead >= 0xE0) {
            length = 3;
        } else if (lead >= 0xC0) {
            length = 2;
        }
        out.push_back(text.substr(i, length));
        i += length;
    }
    return out;
}

std::vector<Value> iterate(const Value &value)
{
    std::vector<Value> items;
    if (isUndefined(value)) {
        return items;
    }
    if (value.is_array()) {
        items.assign(value.begin(), value.end());
        return items;
    }
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            items.emplace_back(it.key());
        }
        return items;
    }
    if (value.is_string()) {
        for (const auto &ch : splitCodePoints(value.get<std::string>())) {
            items.emplace_back(ch);
        }
        return items;
    }
    throw ValueError(typeName(value) + " is not iterable");
}

} // namespace ptatemp::templating
