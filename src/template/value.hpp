#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ptatemp::templating {

// Template values are plain JSON values. An undefined value (a missing
// variable or attribute) is represented by a discarded JSON value.
using Value = nlohmann::json;

Value makeUndefined();
bool isUndefined(const Value &value);

bool isInteger(const Value &value);
bool isFloat(const Value &value);
bool isNumber(const Value &value);
int64_t toInt64(const Value &value);
double toDouble(const Value &value);

std::string typeName(const Value &value);

bool isTruthy(const Value &value);

// Text written to the output for {{ value }}.
std::string toDisplayString(const Value &value);
std::string formatFloat(double value);

// Arithmetic follows Jinja: '/' always produces a float, '//' and '%' floor.
// All of these throw ValueError on unsupported operands.
Value add(const Value &a, const Value &b);
Value subtract(const Value &a, const Value &b);
Value multiply(const Value &a, const Value &b);
Value divide(const Value &a, const Value &b);
Value floorDivide(const Value &a, const Value &b);
Value modulo(const Value &a, const Value &b);
Value power(const Value &a, const Value &b);
Value negate(const Value &a);

bool valuesEqual(const Value &a, const Value &b);
// Ordering for numbers and strings; negative, zero or positive.
int compareValues(const Value &a, const Value &b);
bool contains(const Value &container, const Value &needle);

// Elements produced by iterating a value in a for loop.
std::vector<Value> iterate(const Value &value);

// UTF-8 aware helpers shared by filters.
std::vector<std::string> splitCodePoints(const std::string &text);

} // namespace ptatemp::templating
