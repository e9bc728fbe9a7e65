#include "template/balance_placeholders.hpp"

#include <algorithm>
#include <regex>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace ptatemp::templating {

std::vector<std::string> findPlaceholders(const std::string &source)
{
    // Non-greedy so two placeholders on one line stay separate.
    static const std::regex pattern(R"(<<(.+?)>>)");

    std::vector<std::string> accounts;
    for (auto it = std::sregex_iterator(source.begin(), source.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const std::string account = (*it)[1].str();
        if (std::find(accounts.begin(), accounts.end(), account) == accounts.end()) {
            accounts.push_back(account);
        }
    }
    return accounts;
}

std::string expandPlaceholders(const std::string &source, BalanceProvider &provider)
{
    std::string expanded = source;
    for (const auto &account : findPlaceholders(source)) {
        const std::string placeholder = "<<" + account + ">>";
        const std::string balance = std::to_string(provider.balanceCents(account));

        size_t pos = 0;
        while ((pos = expanded.find(placeholder, pos)) != std::string::npos) {
            expanded.replace(pos, placeholder.size(), balance);
            pos += balance.size();
        }

        PLOG_DEBUG(QStringLiteral("BalancePlaceholders"),
                   QStringLiteral("expandPlaceholders"),
                   QStringLiteral("placeholder_expanded"),
                   QStringLiteral("template_render"),
                   QStringLiteral("string_replace"),
                   ptatemp::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"account", account}, {"cents", balance}}));
    }
    return expanded;
}

} // namespace ptatemp::templating
