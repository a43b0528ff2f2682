#include "FilenameGenerator.h"

#include <algorithm>
#include <utility>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>

namespace filename {
    namespace {
        std::string despaced(std::string text) {
            text.erase(std::remove(text.begin(), text.end(), ' '), text.end());
            return text;
        }
    }

    std::string durationToken(const duration::Duration &historyDuration) {
        return despaced(historyDuration.toString());
    }

    std::string barSizeToken(const bar::BarSize &barSize) {
        // order matters: "mins" before "min", "month" after "min"
        static const std::vector<std::pair<std::string, std::string>> units{
                {"secs",  "s"},
                {"mins",  "m"},
                {"min",   "m"},
                {"hour",  "h"},
                {"day",   "d"},
                {"week",  "w"},
                {"month", "M"}
        };

        std::string token = despaced(barSize.label());
        for (const auto &unit : units) {
            boost::algorithm::replace_all(token, unit.first, unit.second);
        }
        return token;
    }

    std::string generate(
            const std::string &symbol,
            const std::string &securityType,
            const duration::Duration &historyDuration,
            const bar::BarSize &barSize,
            const boost::optional<std::string> &futureMonth,
            bool extendedHours
    ) {
        std::string upperSymbol = boost::algorithm::to_upper_copy(symbol);

        std::vector<std::string> parts{upperSymbol, securityType};
        if (securityType == "FUT" && futureMonth && !futureMonth->empty()) {
            parts.push_back(*futureMonth);
        }
        parts.push_back(durationToken(historyDuration));
        parts.push_back(barSizeToken(barSize));
        if (extendedHours) {
            parts.emplace_back("ETH");
        }
        parts.emplace_back("OHLCV");

        return boost::algorithm::join(parts, "_") + ".csv";
    }
}
