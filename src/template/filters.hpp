#pragma once

#include <map>
#include <string>
#include <vector>

#include "template/value.hpp"

namespace ptatemp::templating {

struct Arguments {
    std::vector<Value> positional;
    std::map<std::string, Value> keyword;

    // Positional argument at index, else the keyword argument, else fallback.
    const Value &get(size_t index, const std::string &name, const Value &fallback) const;
};

// Applies {{ value | name(args) }}. Throws ValueError for unknown filters and
// bad operands.
Value applyFilter(const std::string &name, const Value &value, const Arguments &args);

// Evaluates {{ value is name(args) }}.
bool applyTest(const std::string &name, const Value &value, const Arguments &args);

// Global functions callable from templates: range().
Value callFunction(const std::string &name, const Arguments &args);

// Methods on maps: items(), keys(), values().
Value callMethod(const Value &object, const std::string &name, const Arguments &args);

} // namespace ptatemp::templating
