#include "template/filters.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <optional>

#include <QString>

#include "template/errors.hpp"

namespace ptatemp::templating {

namespace {

using FilterFn = std::function<Value(const Value &, const Arguments &)>;

constexpr int64_t kMaxRangeLength = 1000000;

const Value &nullValue()
{
    static const Value value;
    return value;
}

std::string requireString(const std::string &filter, const Value &value)
{
    if (!value.is_string()) {
        throw ValueError("filter " + filter + " expects a string, got " + typeName(value));
    }
    return value.get<std::string>();
}

// Case mapping goes through QString so accented account and payee names
// change case too.
std::string toLower(const std::string &text)
{
    return QString::fromStdString(text).toLower().toStdString();
}

std::string toUpper(const std::string &text)
{
    return QString::fromStdString(text).toUpper().toStdString();
}

std::string stripChars(const std::string &text, const std::string &chars)
{
    auto strip = [&chars](char ch) {
        return chars.empty() ? std::isspace(static_cast<unsigned char>(ch)) != 0
                             : chars.find(ch) != std::string::npos;
    };
    size_t start = 0;
    while (start < text.size() && strip(text[start])) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && strip(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

std::optional<int64_t> parseInteger(const std::string &text)
{
    const std::string trimmed = stripChars(text, std::string());
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    errno = 0;
    const long long value = std::strtoll(trimmed.c_str(), &end, 10);
    if (*end == '\0' && errno == 0) {
        return static_cast<int64_t>(value);
    }
    const double asFloat = std::strtod(trimmed.c_str(), &end);
    if (*end == '\0' && std::isfinite(asFloat)) {
        return toInt64(Value(asFloat));
    }
    return std::nullopt;
}

std::optional<double> parseFloat(const std::string &text)
{
    const std::string trimmed = stripChars(text, std::string());
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (*end != '\0') {
        return std::nullopt;
    }
    return value;
}

Value attributeOf(const Value &item, const Value &attribute)
{
    if (attribute.is_null()) {
        return item;
    }
    if (!item.is_object() || !attribute.is_string()) {
        return makeUndefined();
    }
    const auto it = item.find(attribute.get<std::string>());
    return it == item.end() ? makeUndefined() : *it;
}

std::vector<Value> requireSequence(const std::string &filter, const Value &value)
{
    if (isUndefined(value)) {
        return {};
    }
    if (!value.is_array() && !value.is_string() && !value.is_object()) {
        throw ValueError("filter " + filter + " expects a sequence, got " + typeName(value));
    }
    return iterate(value);
}

Value filterRound(const Value &value, const Arguments &args)
{
    if (!isNumber(value)) {
        throw ValueError("filter round expects a number, got " + typeName(value));
    }
    const int64_t precision = toInt64(args.get(0, "precision", Value(0)));
    const std::string method = toDisplayString(args.get(1, "method", Value("common")));
    const double factor = std::pow(10.0, static_cast<double>(precision));
    const double scaled = toDouble(value) * factor;

    double rounded = 0.0;
    if (method == "common") {
        rounded = std::round(scaled);
    } else if (method == "ceil") {
        rounded = std::ceil(scaled);
    } else if (method == "floor") {
        rounded = std::floor(scaled);
    } else {
        throw ValueError("round method must be common, ceil or floor");
    }
    return rounded / factor;
}

Value filterMinMax(const std::string &filter, const Value &value, bool wantMax)
{
    const std::vector<Value> items = requireSequence(filter, value);
    if (items.empty()) {
        return makeUndefined();
    }
    const Value *best = &items.front();
    for (const auto &item : items) {
        const int order = compareValues(item, *best);
        if (wantMax ? order > 0 : order < 0) {
            best = &item;
        }
    }
    return *best;
}

Value filterSum(const Value &value, const Arguments &args)
{
    const Value &attribute = args.get(0, "attribute", nullValue());
    Value total = args.get(1, "start", Value(0));
    for (const auto &item : requireSequence("sum", value)) {
        total = add(total, attributeOf(item, attribute));
    }
    return total;
}

Value filterSort(const Value &value, const Arguments &args)
{
    const bool reverse = isTruthy(args.get(0, "reverse", Value(false)));
    const Value &attribute = args.get(2, "attribute", nullValue());
    std::vector<Value> items = requireSequence("sort", value);
    std::stable_sort(items.begin(), items.end(),
                     [&attribute, reverse](const Value &a, const Value &b) {
                         const int order = compareValues(attributeOf(a, attribute),
                                                         attributeOf(b, attribute));
                         return reverse ? order > 0 : order < 0;
                     });
    return Value(items);
}

Value filterJoin(const Value &value, const Arguments &args)
{
    const std::string separator = toDisplayString(args.get(0, "d", Value("")));
    const Value &attribute = args.get(1, "attribute", nullValue());
    std::string out;
    bool first = true;
    for (const auto &item : requireSequence("join", value)) {
        if (!first) {
            out += separator;
        }
        first = false;
        out += toDisplayString(attributeOf(item, attribute));
    }
    return out;
}

Value filterReplace(const Value &value, const Arguments &args)
{
    std::string text = requireString("replace", value);
    const std::string from = toDisplayString(args.get(0, "old", Value("")));
    const std::string to = toDisplayString(args.get(1, "new", Value("")));
    const Value &countArg = args.get(2, "count", nullValue());
    int64_t remaining = countArg.is_null() ? -1 : toInt64(countArg);
    if (from.empty()) {
        return text;
    }

    size_t pos = 0;
    while (remaining != 0 && (pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
        if (remaining > 0) {
            --remaining;
        }
    }
    return text;
}

Value filterTitle(const Value &value)
{
    QString text = QString::fromStdString(requireString("title", value));
    bool wordStart = true;
    for (QChar &ch : text) {
        if (ch.isLetterOrNumber() || ch.isMark() || ch.isSurrogate()) {
            if (!ch.isSurrogate()) {
                ch = wordStart ? ch.toUpper() : ch.toLower();
            }
            wordStart = false;
        } else {
            wordStart = true;
        }
    }
    return text.toStdString();
}

const std::map<std::string, FilterFn> &filterTable()
{
    static const std::map<std::string, FilterFn> table = {
        {"abs", [](const Value &value, const Arguments &) -> Value {
             if (isInteger(value)) {
                 const int64_t number = toInt64(value);
                 if (number == INT64_MIN) {
                     throw ValueError("integer overflow in abs");
                 }
                 return number < 0 ? -number : number;
             }
             if (isFloat(value)) {
                 return std::fabs(value.get<double>());
             }
             throw ValueError("filter abs expects a number, got " + typeName(value));
         }},
        {"round", filterRound},
        {"int", [](const Value &value, const Arguments &args) -> Value {
             const Value fallback = args.get(0, "default", Value(0));
             if (isNumber(value) || value.is_boolean()) {
                 return toInt64(value);
             }
             if (value.is_string()) {
                 const auto parsed = parseInteger(value.get<std::string>());
                 return parsed.has_value() ? Value(*parsed) : fallback;
             }
             return fallback;
         }},
        {"float", [](const Value &value, const Arguments &args) -> Value {
             const Value fallback = args.get(0, "default", Value(0.0));
             if (isNumber(value) || value.is_boolean()) {
                 return toDouble(value);
             }
             if (value.is_string()) {
                 const auto parsed = parseFloat(value.get<std::string>());
                 return parsed.has_value() ? Value(*parsed) : fallback;
             }
             return fallback;
         }},
        {"string", [](const Value &value, const Arguments &) -> Value {
             return toDisplayString(value);
         }},
        {"default", [](const Value &value, const Arguments &args) -> Value {
             const Value fallback = args.get(0, "default_value", Value(""));
             const bool boolean = isTruthy(args.get(1, "boolean", Value(false)));
             if (isUndefined(value) || (boolean && !isTruthy(value))) {
                 return fallback;
             }
             return value;
         }},
        {"upper", [](const Value &value, const Arguments &) -> Value {
             return toUpper(requireString("upper", value));
         }},
        {"lower", [](const Value &value, const Arguments &) -> Value {
             return toLower(requireString("lower", value));
         }},
        {"title", [](const Value &value, const Arguments &) -> Value {
             return filterTitle(value);
         }},
        {"capitalize", [](const Value &value, const Arguments &) -> Value {
             QString text = QString::fromStdString(requireString("capitalize", value)).toLower();
             if (!text.isEmpty() && !text.at(0).isSurrogate()) {
                 text[0] = text.at(0).toUpper();
             }
             return text.toStdString();
         }},
        {"trim", [](const Value &value, const Arguments &args) -> Value {
             const Value &chars = args.get(0, "chars", nullValue());
             return stripChars(requireString("trim", value),
                               chars.is_null() ? std::string() : toDisplayString(chars));
         }},
        {"length", [](const Value &value, const Arguments &) -> Value {
             if (value.is_string()) {
                 return static_cast<int64_t>(splitCodePoints(value.get<std::string>()).size());
             }
             if (value.is_array() || value.is_object()) {
                 return static_cast<int64_t>(value.size());
             }
             if (isUndefined(value)) {
                 return 0;
             }
             throw ValueError("filter length expects a sequence, got " + typeName(value));
         }},
        {"join", filterJoin},
        {"first", [](const Value &value, const Arguments &) -> Value {
             const auto items = requireSequence("first", value);
             return items.empty() ? makeUndefined() : items.front();
         }},
        {"last", [](const Value &value, const Arguments &) -> Value {
             const auto items = requireSequence("last", value);
             return items.empty() ? makeUndefined() : items.back();
         }},
        {"sum", filterSum},
        {"min", [](const Value &value, const Arguments &) -> Value {
             return filterMinMax("min", value, false);
         }},
        {"max", [](const Value &value, const Arguments &) -> Value {
             return filterMinMax("max", value, true);
         }},
        {"replace", filterReplace},
        {"list", [](const Value &value, const Arguments &) -> Value {
             return Value(requireSequence("list", value));
         }},
        {"reverse", [](const Value &value, const Arguments &) -> Value {
             if (value.is_string()) {
                 auto chars = splitCodePoints(value.get<std::string>());
                 std::reverse(chars.begin(), chars.end());
                 std::string out;
                 for (const auto &ch : chars) {
                     out += ch;
                 }
                 return out;
             }
             auto items = requireSequence("reverse", value);
             std::reverse(items.begin(), items.end());
             return Value(items);
         }},
        {"sort", filterSort},
    };
    return table;
}

} // namespace

const Value &Arguments::get(size_t index, const std::string &name, const Value &fallback) const
{
    if (index < positional.size()) {
        return positional[index];
    }
    const auto it = keyword.find(name);
    if (it != keyword.end()) {
        return it->second;
    }
    return fallback;
}

Value applyFilter(const std::string &name, const Value &value, const Arguments &args)
{
    std::string resolved = name;
    if (name == "d") {
        resolved = "default";
    } else if (name == "count") {
        resolved = "length";
    }

    const auto &table = filterTable();
    const auto it = table.find(resolved);
    if (it == table.end()) {
        throw ValueError("unknown filter: " + name);
    }
    return it->second(value, args);
}

bool applyTest(const std::string &name, const Value &value, const Arguments &args)
{
    if (name == "defined") {
        return !isUndefined(value);
    }
    if (name == "undefined") {
        return isUndefined(value);
    }
    if (name == "none") {
        return value.is_null();
    }
    if (name == "boolean") {
        return value.is_boolean();
    }
    if (name == "number") {
        return isNumber(value);
    }
    if (name == "integer") {
        return isInteger(value);
    }
    if (name == "float") {
        return isFloat(value);
    }
    if (name == "string") {
        return value.is_string();
    }
    if (name == "mapping") {
        return value.is_object();
    }
    if (name == "sequence") {
        return value.is_array() || value.is_string();
    }
    if (name == "even" || name == "odd") {
        if (!isInteger(value)) {
            throw ValueError("test " + name + " expects an integer, got " + typeName(value));
        }
        const bool even = toInt64(value) % 2 == 0;
        return name == "even" ? even : !even;
    }
    if (name == "divisibleby") {
        const Value &divisor = args.get(0, "num", nullValue());
        if (!isInteger(value) || !isInteger(divisor)) {
            throw ValueError("test divisibleby expects integers");
        }
        const int64_t lhs = toInt64(value);
        const int64_t rhs = toInt64(divisor);
        if (rhs == 0) {
            throw ValueError("division by zero");
        }
        if (rhs == -1) {
            return true;
        }
        return lhs % rhs == 0;
    }
    throw ValueError("unknown test: " + name);
}

Value callFunction(const std::string &name, const Arguments &args)
{
    if (name != "range") {
        throw ValueError("unknown function: " + name);
    }
    if (args.positional.empty() || args.positional.size() > 3) {
        throw ValueError("range expects 1 to 3 arguments");
    }
    for (const auto &arg : args.positional) {
        if (!isInteger(arg)) {
            throw ValueError("range expects integer arguments, got " + typeName(arg));
        }
    }

    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
    if (args.positional.size() == 1) {
        stop = toInt64(args.positional[0]);
    } else {
        start = toInt64(args.positional[0]);
        stop = toInt64(args.positional[1]);
        if (args.positional.size() == 3) {
            step = toInt64(args.positional[2]);
        }
    }
    if (step == 0) {
        throw ValueError("range step must not be zero");
    }

    Value result = Value::array();
    for (int64_t i = start; step > 0 ? i < stop : i > stop; i += step) {
        if (static_cast<int64_t>(result.size()) >= kMaxRangeLength) {
            throw ValueError("range is too large");
        }
        result.push_back(i);
    }
    return result;
}

Value callMethod(const Value &object, const std::string &name, const Arguments &args)
{
    if (!args.positional.empty() || !args.keyword.empty()) {
        throw ValueError("method " + name + " takes no arguments");
    }
    if (!object.is_object()) {
        throw ValueError(typeName(object) + " has no method " + name);
    }
    if (name != "items" && name != "keys" && name != "values") {
        throw ValueError("map has no method " + name);
    }

    Value result = Value::array();
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (name == "items") {
            result.push_back(Value::array({it.key(), it.value()}));
        } else if (name == "keys") {
            result.push_back(it.key());
        } else {
            result.push_back(it.value());
        }
    }
    return result;
}

} // namespace ptatemp::templating
