#ifndef IBHIST_TIMEZONECONVERTER_H
#define IBHIST_TIMEZONECONVERTER_H

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/date_time/local_time/local_time.hpp>

#include "dataStructs/bar.h"
#include "utils/timeUtils.h"

namespace tzConvert {
    class UnparseableTimestamp : public std::invalid_argument {
    public:
        explicit UnparseableTimestamp(const std::string &timestamp);
    };

    enum class ZoneSelector {
        UTC,
        Market,
        Local
    };

    /**
     * Maps "UTC", "market" or "local" to a selector.
     *
     * @throws std::invalid_argument for any other value.
     */
    ZoneSelector parseZoneSelector(const std::string &selector);

    std::string toString(ZoneSelector selector);

    /** US Eastern time with the current US daylight saving rules. */
    extern const char *const kMarketZoneSpec;

    /**
     * A zone timestamps can be converted into: either a POSIX rule based
     * zone or whatever zone the process runs in.
     */
    class Zone {
    public:
        static Zone utc();

        static Zone posix(const std::string &name, const std::string &spec);

        static Zone systemLocal();

        timeUtils::ptime toLocal(const timeUtils::ptime &utc) const;

        /** Zone abbreviation in effect at the given instant, e.g. "EDT". */
        std::string abbreviation(const timeUtils::ptime &utc) const;

        const std::string &name() const;

    private:
        Zone(std::string name, boost::local_time::time_zone_ptr zone);

        std::string name_;
        // empty for the system zone
        boost::local_time::time_zone_ptr zone_;
    };

    /**
     * Zone the output timestamps are written in. Market always resolves to
     * US Eastern time, whatever the symbol.
     */
    Zone targetZone(ZoneSelector selector, const std::string &symbol);

    struct Timestamp {
        timeUtils::ptime utc;
        // daily and longer bars are reported as calendar dates
        bool dateOnly;
    };

    /**
     * Interprets a provider timestamp: epoch seconds, "YYYYMMDD HH:MM:SS"
     * or "YYYY-MM-DD HH:MM:SS" in UTC, optionally followed by "Z", " UTC"
     * or a "+HH:MM" offset, or a date-only "YYYYMMDD" / "YYYY-MM-DD".
     *
     * @throws UnparseableTimestamp
     */
    Timestamp parseUtcTimestamp(const std::string &timestamp);

    std::string formatTimestamp(
            const Timestamp &timestamp,
            const Zone &zone,
            bool intraday
    );

    /**
     * Rewrites every row's timestamp in the given zone, as
     * "YYYY-MM-DD HH:MM:SS" for intraday bars and "YYYY-MM-DD" otherwise.
     * A row whose timestamp cannot be interpreted keeps its value and a
     * warning is logged.
     *
     * @return The number of rows left unconverted.
     */
    std::size_t format(
            std::vector<bar::Bar> &rows,
            const Zone &zone,
            bool intraday
    );

    /**
     * "Date" for daily and longer bars, "DateTime_<abbreviation>" for
     * intraday bars.
     */
    std::string dateColumnName(
            const Zone &zone,
            bool intraday,
            const timeUtils::ptime &atUtc
    );
}

#endif //IBHIST_TIMEZONECONVERTER_H
