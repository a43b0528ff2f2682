#ifndef IBHIST_DATERANGERESOLVER_H
#define IBHIST_DATERANGERESOLVER_H

#include <stdexcept>
#include <string>

#include <boost/optional.hpp>

#include "dataStructs/duration.h"
#include "utils/timeUtils.h"

/**
 * Turns the user's optional start and end dates into the end-anchor plus
 * backward-looking duration pair that historical data requests take.
 *
 * +-----------------+-------------+-----------------------+-------------+
 * | mode            | dates given | duration              | end anchor  |
 * +-----------------+-------------+-----------------------+-------------+
 * | DateRange       | start, end  | N D, or N/365 Y above | end         |
 * |                 |             | 365 days              |             |
 * | SingleDay       | start       | 1 D                   | start       |
 * | DurationWithEnd | end         | default duration      | end         |
 * | DurationOnly    | none        | default duration      | today       |
 * +-----------------+-------------+-----------------------+-------------+
 *
 * A date given without a time of day ends at the session close: 16:00 the
 * same day for regular hours, 02:00 the next day for extended hours. An
 * explicit end time is always produced, otherwise the provider cuts the
 * session off at the moment the request is sent.
 */
namespace dateRange {
    class InvalidDateFormat : public std::invalid_argument {
    public:
        explicit InvalidDateFormat(const std::string &dateString);
    };

    class InvalidRange : public std::invalid_argument {
    public:
        InvalidRange(const std::string &startDate, const std::string &endDate);
    };

    enum class SessionMode {
        Regular,
        Extended
    };

    enum class ResolutionMode {
        DateRange,
        SingleDay,
        DurationWithEnd,
        DurationOnly
    };

    std::string toString(ResolutionMode mode);

    /**
     * A user supplied date, with or without a time of day.
     */
    struct DateInput {
        timeUtils::ptime value;
        bool hasTime;
    };

    struct ResolvedRequest {
        std::string endTimestamp;
        duration::Duration historyDuration;
        ResolutionMode mode;
        std::string description;

        std::string durationString() const;
    };

    /**
     * Parses "YYYY-MM-DD", "YYYY-MM-DD HH:MM" or "YYYY-MM-DD HH:MM:SS".
     *
     * @throws InvalidDateFormat if none of the formats match.
     */
    DateInput parseDateInput(const std::string &dateString);

    /**
     * Applies the session close rule to a date without a time of day and
     * formats the result for the provider ("YYYYMMDD HH:MM:SS").
     */
    std::string sessionEndTimestamp(
            const DateInput &anchor,
            SessionMode sessionMode
    );

    /**
     * Number of calendar days covered by [start, end], both ends included.
     */
    long inclusiveDays(
            const timeUtils::ptime &start,
            const timeUtils::ptime &end
    );

    /**
     * Resolves the request window.
     *
     * @param startDate Optional start date.
     * @param endDate Optional end date.
     * @param defaultDuration Duration used when no start date is given,
     *     e.g. "1 Y".
     * @param sessionMode Regular or extended trading hours.
     * @param now The current local time, anchors requests without dates.
     * @throws InvalidDateFormat, InvalidRange, duration::InvalidDuration
     */
    ResolvedRequest resolve(
            const boost::optional<std::string> &startDate,
            const boost::optional<std::string> &endDate,
            const std::string &defaultDuration,
            SessionMode sessionMode,
            const timeUtils::ptime &now =
                    timeUtils::second_clock::local_time()
    );
}

#endif //IBHIST_DATERANGERESOLVER_H
