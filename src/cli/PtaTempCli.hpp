#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDate>
#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "ledger/balance_query.hpp"
#include "ledger/line_item.hpp"

namespace ptatemp {

struct VarParseResult {
    // Template context built from the NAME=VALUE pairs.
    nlohmann::json context = nlohmann::json::object();
    // Entries without '=' that were skipped.
    QStringList badVars;
};

// "-v name=value" entries. The name is trimmed; the value is what follows
// the last '='. Values that are integers become integers, anything else a
// string.
VarParseResult parseVars(const QStringList &vars);

// Parses "YYYY-MM-DD"; an empty or invalid value yields std::nullopt.
std::optional<QDate> parseEntryDate(const QString &value);

// Expands balance placeholders, renders the template and parses each
// non-blank output line into a posting. Lines starting with ';' or '#' are
// journal comments and are skipped.
std::vector<LineItem> renderLineItems(const std::string &source,
                                      BalanceProvider &provider,
                                      const nlohmann::json &context);

class PtaTempCli
{
public:
    // Parses the command line, renders the entry and prints it.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int fail(const QString &prefix, const std::string &reason) const;
};

} // namespace ptatemp
