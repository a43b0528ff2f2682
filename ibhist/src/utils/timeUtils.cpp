#include "timeUtils.h"

#include <ctime>
#include <locale>
#include <sstream>
#include <stdexcept>

timeUtils::ptime timeUtils::timeStringParser(
        const std::string &format,
        const std::string &timeString
) {
    std::locale dtFormat(
            std::locale::classic(),
            new timeUtils::time_input_facet(format)
    );
    std::istringstream is(timeString);
    is.exceptions(std::ios_base::failbit);
    is.imbue(dtFormat);
    timeUtils::ptime pt;
    is >> pt;

    // The facet skips literals and stops at the end of the input without
    // complaining, so the only reliable check is formatting the result back.
    if (pt.is_special()
        || timeUtils::timeStringFormatter(format, pt) != timeString) {
        throw std::ios_base::failure(
                "'" + timeString + "' does not match format '" + format + "'"
        );
    }

    return pt;
}

boost::optional<timeUtils::ptime> timeUtils::tryTimeStringParser(
        const std::string &format,
        const std::string &timeString
) {
    try {
        return timeUtils::timeStringParser(format, timeString);
    } catch (const std::exception &) {
        // stream failure, or gregorian::bad_year, bad_month, bad_day_of_month
        return boost::none;
    }
}

timeUtils::ptime timeUtils::ibTimeStrParser(const std::string &timeString) {
    timeUtils::ptime pt = timeUtils::timeStringParser(
            "%Y%m%d %H:%M:%S",
            timeString
    );
    return pt;
}

std::string timeUtils::ibTimeStrFormatter(const timeUtils::ptime &dateTime) {
    return timeUtils::timeStringFormatter("%Y%m%d %H:%M:%S", dateTime);
}

timeUtils::ptime timeUtils::localToUtc(const timeUtils::ptime &localTime) {
    std::tm local = timeUtils::to_tm(localTime);
    // let the C library decide whether daylight saving applies
    local.tm_isdst = -1;
    std::time_t seconds = std::mktime(&local);
    if (seconds == static_cast<std::time_t>(-1)) {
        throw std::out_of_range(
                "Cannot convert " + timeUtils::to_simple_string(localTime) +
                " to UTC"
        );
    }
    return timeUtils::from_time_t(seconds);
}

std::string timeUtils::timeStringFormatter(
        const std::string &format,
        const timeUtils::ptime &dateTime
) {
    std::ostringstream os;
    os.imbue(std::locale(
            std::locale::classic(),
            new timeUtils::time_facet(format.c_str())
    ));
    os << dateTime;
    return os.str();
}
