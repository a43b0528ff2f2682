#ifndef IBHIST_TIMEUTILS_H
#define IBHIST_TIMEUTILS_H

#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/optional.hpp>

namespace timeUtils {
    using namespace boost::posix_time;
    using namespace boost::gregorian;

    /**
     * Parses the time from a string according to a predefined format.
     *
     * The string must match the format exactly, zero padding included.
     *
     * @param format The format for string parsing.
     * @param timeString The string to parse.
     * @return The parsed time.
     * @throws std::ios_base::failure if the string does not match, or
     *     std::out_of_range for an impossible date.
     */
    ptime timeStringParser(
            const std::string &format,
            const std::string &timeString
    );

    /**
     * Same as `timeStringParser` but reports a mismatch by returning an
     * empty value instead of throwing.
     */
    boost::optional<ptime> tryTimeStringParser(
            const std::string &format,
            const std::string &timeString
    );

    /**
     * Parses the time from a string following IBAPI's string format for
     * date-time (YYYYmmdd HH:MM:SS).
     *
     * @param timeString The IBAPI-generated date-time string.
     * @return The parsed date-time.
     */
    ptime ibTimeStrParser(const std::string &timeString);

    /**
     * Formats a date-time in IBAPI's string format (YYYYmmdd HH:MM:SS).
     */
    std::string ibTimeStrFormatter(const ptime &dateTime);

    /**
     * Converts a wall clock time in the zone the process runs in to UTC.
     *
     * @throws std::out_of_range if the C library cannot represent it.
     */
    ptime localToUtc(const ptime &localTime);

    /**
     * Formats a date-time with a strftime-like format.
     */
    std::string timeStringFormatter(
            const std::string &format,
            const ptime &dateTime
    );
};


#endif //IBHIST_TIMEUTILS_H
