#pragma once

#include <string>
#include <vector>

#include "ledger/balance_query.hpp"

namespace ptatemp::templating {

// Account names referenced as <<account>> in the template, in first-seen
// order, without duplicates.
std::vector<std::string> findPlaceholders(const std::string &source);

// Replaces every <<account>> with the account balance in integer cents.
// This runs before template rendering, so placeholders may appear inside
// expressions: {{ <<assets:checking>> / 100 }}.
std::string expandPlaceholders(const std::string &source, BalanceProvider &provider);

} // namespace ptatemp::templating
