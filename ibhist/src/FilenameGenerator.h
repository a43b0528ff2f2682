#ifndef IBHIST_FILENAMEGENERATOR_H
#define IBHIST_FILENAMEGENERATOR_H

#include <string>

#include <boost/optional.hpp>

#include "dataStructs/bar.h"
#include "dataStructs/duration.h"

namespace filename {
    /**
     * Builds the default output file name,
     * SYMBOL_SECTYPE[_FUTUREMONTH]_DURATION_TIMEFRAME[_ETH]_OHLCV.csv,
     * e.g. SPY_STK_30D_1m_OHLCV.csv or ES_FUT_202409_1Y_1d_ETH_OHLCV.csv.
     *
     * The future month is only used for futures. Existing files are not
     * looked at.
     */
    std::string generate(
            const std::string &symbol,
            const std::string &securityType,
            const duration::Duration &historyDuration,
            const bar::BarSize &barSize,
            const boost::optional<std::string> &futureMonth,
            bool extendedHours
    );

    /** "30 D" -> "30D" */
    std::string durationToken(const duration::Duration &historyDuration);

    /** "1 min" -> "1m", "5 secs" -> "5s", "1 month" -> "1M" */
    std::string barSizeToken(const bar::BarSize &barSize);
}

#endif //IBHIST_FILENAMEGENERATOR_H
