#include "DateRangeResolver.h"

namespace dateRange {
    namespace {
        const long kDaysPerYear = 365;

        struct AcceptedFormat {
            const char *format;
            bool hasTime;
        };

        const AcceptedFormat kAcceptedFormats[] = {
                {"%Y-%m-%d %H:%M:%S", true},
                {"%Y-%m-%d %H:%M",    true},
                {"%Y-%m-%d",          false}
        };

        duration::Duration rangeDuration(long days) {
            if (days <= kDaysPerYear) {
                return duration::Duration(days, duration::DurationUnit::Day);
            }
            return duration::Duration(
                    days / kDaysPerYear,
                    duration::DurationUnit::Year
            );
        }
    }

    InvalidDateFormat::InvalidDateFormat(const std::string &dateString) :
            std::invalid_argument(
                    "Invalid date format: " + dateString +
                    ". Use YYYY-MM-DD or YYYY-MM-DD HH:MM:SS"
            ) {}

    InvalidRange::InvalidRange(
            const std::string &startDate,
            const std::string &endDate
    ) : std::invalid_argument(
            "Start date cannot be after end date (" + startDate +
            " > " + endDate + ")"
    ) {}

    std::string toString(ResolutionMode mode) {
        switch (mode) {
            case ResolutionMode::DateRange:
                return "date_range";
            case ResolutionMode::SingleDay:
                return "single_day";
            case ResolutionMode::DurationWithEnd:
                return "duration_with_end";
            case ResolutionMode::DurationOnly:
                return "duration_only";
        }
        throw std::logic_error("Unknown resolution mode.");
    }

    std::string ResolvedRequest::durationString() const {
        return historyDuration.toString();
    }

    DateInput parseDateInput(const std::string &dateString) {
        for (const AcceptedFormat &accepted : kAcceptedFormats) {
            boost::optional<timeUtils::ptime> parsed =
                    timeUtils::tryTimeStringParser(
                            accepted.format,
                            dateString
                    );
            if (parsed) {
                return DateInput{*parsed, accepted.hasTime};
            }
        }
        throw InvalidDateFormat(dateString);
    }

    std::string sessionEndTimestamp(
            const DateInput &anchor,
            SessionMode sessionMode
    ) {
        if (anchor.hasTime) {
            return timeUtils::ibTimeStrFormatter(anchor.value);
        }

        timeUtils::date day = anchor.value.date();
        timeUtils::ptime sessionEnd;
        if (sessionMode == SessionMode::Extended) {
            // the post-market session runs past midnight
            sessionEnd = timeUtils::ptime(
                    day + timeUtils::days(1),
                    timeUtils::hours(2)
            );
        } else {
            sessionEnd = timeUtils::ptime(day, timeUtils::hours(16));
        }
        return timeUtils::ibTimeStrFormatter(sessionEnd);
    }

    long inclusiveDays(
            const timeUtils::ptime &start,
            const timeUtils::ptime &end
    ) {
        timeUtils::time_duration span = end - start;
        return static_cast<long>(span.total_seconds() / 86400) + 1;
    }

    ResolvedRequest resolve(
            const boost::optional<std::string> &startDate,
            const boost::optional<std::string> &endDate,
            const std::string &defaultDuration,
            SessionMode sessionMode,
            const timeUtils::ptime &now
    ) {
        boost::optional<DateInput> start;
        boost::optional<DateInput> end;
        if (startDate) {
            start = parseDateInput(*startDate);
        }
        if (endDate) {
            end = parseDateInput(*endDate);
        }

        if (start && end && start->value > end->value) {
            throw InvalidRange(*startDate, *endDate);
        }

        if (start && end) {
            duration::Duration span = rangeDuration(
                    inclusiveDays(start->value, end->value)
            );
            return ResolvedRequest{
                    sessionEndTimestamp(*end, sessionMode),
                    span,
                    ResolutionMode::DateRange,
                    "Date range mode: " + *startDate + " to " + *endDate +
                    " (calculated duration: " + span.toString() + ")"
            };
        }

        if (start) {
            // The provider looks backwards from an end anchor, so a single
            // day is requested as one day ending at that day's close.
            return ResolvedRequest{
                    sessionEndTimestamp(*start, sessionMode),
                    duration::Duration(1, duration::DurationUnit::Day),
                    ResolutionMode::SingleDay,
                    "Single day mode: " + *startDate
            };
        }

        duration::Duration history = duration::Duration::parse(defaultDuration);

        if (end) {
            return ResolvedRequest{
                    sessionEndTimestamp(*end, sessionMode),
                    history,
                    ResolutionMode::DurationWithEnd,
                    "Duration with end date: " + history.toString() +
                    " ending at " + *endDate
            };
        }

        DateInput today{timeUtils::ptime(now.date()), false};
        return ResolvedRequest{
                sessionEndTimestamp(today, sessionMode),
                history,
                ResolutionMode::DurationOnly,
                "Duration mode: " + history.toString()
        };
    }
}
