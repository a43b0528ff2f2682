#include "TimezoneConverter.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <utility>

#include <boost/date_time/c_local_time_adjustor.hpp>
#include <spdlog/spdlog.h>

namespace tzConvert {
    const char *const kMarketZoneSpec = "EST-05EDT,M3.2.0,M11.1.0";

    namespace {
        bool allDigits(const std::string &text) {
            return !text.empty() &&
                   std::all_of(text.begin(), text.end(), [](char c) {
                       return std::isdigit(static_cast<unsigned char>(c));
                   });
        }

        boost::optional<timeUtils::time_duration> parseOffset(
                const std::string &suffix
        ) {
            if (suffix.empty() || suffix == "Z" || suffix == " UTC") {
                return timeUtils::time_duration(0, 0, 0);
            }

            std::string digits;
            for (std::size_t i = 1; i < suffix.size(); ++i) {
                if (suffix[i] != ':') {
                    digits += suffix[i];
                }
            }
            if ((suffix[0] != '+' && suffix[0] != '-')
                || digits.size() != 4 || !allDigits(digits)) {
                return boost::none;
            }

            timeUtils::time_duration offset(
                    std::stoi(digits.substr(0, 2)),
                    std::stoi(digits.substr(2, 2)),
                    0
            );
            return suffix[0] == '-' ? offset.invert_sign() : offset;
        }
    }

    UnparseableTimestamp::UnparseableTimestamp(const std::string &timestamp) :
            std::invalid_argument(
                    "Timestamp '" + timestamp +
                    "' could not be interpreted as UTC or zone-aware"
            ) {}

    ZoneSelector parseZoneSelector(const std::string &selector) {
        if (selector == "UTC") {
            return ZoneSelector::UTC;
        } else if (selector == "market") {
            return ZoneSelector::Market;
        } else if (selector == "local") {
            return ZoneSelector::Local;
        }
        throw std::invalid_argument(
                "Unknown timezone '" + selector +
                "'. Choose from UTC, market, local."
        );
    }

    std::string toString(ZoneSelector selector) {
        switch (selector) {
            case ZoneSelector::UTC:
                return "UTC";
            case ZoneSelector::Market:
                return "market";
            case ZoneSelector::Local:
                return "local";
        }
        throw std::logic_error("Unknown zone selector.");
    }

    Zone::Zone(std::string name, boost::local_time::time_zone_ptr zone) :
            name_(std::move(name)), zone_(std::move(zone)) {}

    Zone Zone::utc() {
        return posix("UTC", "UTC+00");
    }

    Zone Zone::posix(const std::string &name, const std::string &spec) {
        return Zone(
                name,
                boost::local_time::time_zone_ptr(
                        new boost::local_time::posix_time_zone(spec)
                )
        );
    }

    Zone Zone::systemLocal() {
        return Zone("local", boost::local_time::time_zone_ptr());
    }

    timeUtils::ptime Zone::toLocal(const timeUtils::ptime &utc) const {
        if (!zone_) {
            return boost::date_time::c_local_adjustor<timeUtils::ptime>
                    ::utc_to_local(utc);
        }
        return boost::local_time::local_date_time(utc, zone_).local_time();
    }

    std::string Zone::abbreviation(const timeUtils::ptime &utc) const {
        if (!zone_) {
            std::time_t seconds = timeUtils::to_time_t(utc);
            std::tm local{};
            localtime_r(&seconds, &local);
            char buffer[16];
            if (std::strftime(buffer, sizeof(buffer), "%Z", &local) == 0) {
                return name_;
            }
            return buffer;
        }
        return boost::local_time::local_date_time(utc, zone_).zone_abbrev();
    }

    const std::string &Zone::name() const {
        return name_;
    }

    Zone targetZone(ZoneSelector selector, const std::string &symbol) {
        switch (selector) {
            case ZoneSelector::UTC:
                return Zone::utc();
            case ZoneSelector::Local:
                return Zone::systemLocal();
            case ZoneSelector::Market:
                // TODO: map non-US listings (e.g. forex pairs) to their own
                // exchange zone once the contract carries a primary exchange.
                static_cast<void>(symbol);
                return Zone::posix("US/Eastern", kMarketZoneSpec);
        }
        throw std::logic_error("Unknown zone selector.");
    }

    Timestamp parseUtcTimestamp(const std::string &timestamp) {
        if (allDigits(timestamp) && timestamp.size() == 8) {
            boost::optional<timeUtils::ptime> day =
                    timeUtils::tryTimeStringParser("%Y%m%d", timestamp);
            if (!day) {
                throw UnparseableTimestamp(timestamp);
            }
            return Timestamp{*day, true};
        }

        if (allDigits(timestamp)) {
            if (timestamp.size() > 12) {
                throw UnparseableTimestamp(timestamp);
            }
            return Timestamp{
                    timeUtils::from_time_t(
                            static_cast<std::time_t>(std::stoll(timestamp))
                    ),
                    false
            };
        }

        boost::optional<timeUtils::ptime> day =
                timeUtils::tryTimeStringParser("%Y-%m-%d", timestamp);
        if (day) {
            return Timestamp{*day, true};
        }

        static const std::pair<const char *, std::size_t> kDateTimeFormats[] = {
                {"%Y%m%d %H:%M:%S",   17},
                {"%Y-%m-%d %H:%M:%S", 19},
                {"%Y-%m-%dT%H:%M:%S", 19}
        };
        for (const auto &candidate : kDateTimeFormats) {
            if (timestamp.size() < candidate.second) {
                continue;
            }
            boost::optional<timeUtils::ptime> local =
                    timeUtils::tryTimeStringParser(
                            candidate.first,
                            timestamp.substr(0, candidate.second)
                    );
            boost::optional<timeUtils::time_duration> offset =
                    parseOffset(timestamp.substr(candidate.second));
            if (local && offset) {
                return Timestamp{*local - *offset, false};
            }
        }

        throw UnparseableTimestamp(timestamp);
    }

    std::string formatTimestamp(
            const Timestamp &timestamp,
            const Zone &zone,
            bool intraday
    ) {
        // a calendar date is the same date in every zone
        timeUtils::ptime inZone = timestamp.dateOnly
                                  ? timestamp.utc
                                  : zone.toLocal(timestamp.utc);
        return timeUtils::timeStringFormatter(
                intraday ? "%Y-%m-%d %H:%M:%S" : "%Y-%m-%d",
                inZone
        );
    }

    std::size_t format(
            std::vector<bar::Bar> &rows,
            const Zone &zone,
            bool intraday
    ) {
        std::size_t unconverted = 0;
        for (bar::Bar &row : rows) {
            try {
                row.timestamp = formatTimestamp(
                        parseUtcTimestamp(row.timestamp),
                        zone,
                        intraday
                );
            } catch (const UnparseableTimestamp &e) {
                spdlog::warn("{}. Leaving as is.", e.what());
                ++unconverted;
            }
        }
        return unconverted;
    }

    std::string dateColumnName(
            const Zone &zone,
            bool intraday,
            const timeUtils::ptime &atUtc
    ) {
        if (!intraday) {
            return "Date";
        }
        return "DateTime_" + zone.abbreviation(atUtc);
    }
}
