#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "ledger/line_item.hpp"
#include "ledger/transaction.hpp"

namespace ptatemp {

inline void to_json(nlohmann::json &j, const LineItem &item)
{
    j = nlohmann::json{
        {"account", item.account},
        {"amount", item.value},
        {"virtual", !item.isReal}
    };
}

inline void from_json(const nlohmann::json &j, LineItem &item)
{
    item.account = j.value("account", "");
    item.value = j.value("amount", static_cast<int64_t>(0));
    item.isReal = !j.value("virtual", false);
}

inline void to_json(nlohmann::json &j, const Transaction &transaction)
{
    int64_t realBalance = 0;
    int64_t virtualBalance = 0;
    for (const auto &item : transaction.lineItems) {
        (item.isReal ? realBalance : virtualBalance) += item.value;
    }

    j = nlohmann::json{
        {"date", transaction.date.toString(QStringLiteral("yyyy-MM-dd")).toStdString()},
        {"description", transaction.description},
        {"postings", transaction.lineItems},
        {"realBalance", realBalance},
        {"virtualBalance", virtualBalance}
    };
}

inline void from_json(const nlohmann::json &j, Transaction &transaction)
{
    transaction.date = QDate::fromString(QString::fromStdString(j.value("date", "")),
                                         QStringLiteral("yyyy-MM-dd"));
    transaction.description = j.value("description", "");
    transaction.lineItems.clear();
    if (j.contains("postings") && j.at("postings").is_array()) {
        transaction.lineItems = j.at("postings").get<std::vector<LineItem>>();
    }
}

} // namespace ptatemp
