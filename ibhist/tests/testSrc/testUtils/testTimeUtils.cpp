#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>
#include <boost/date_time/c_local_time_adjustor.hpp>

#include "../../../src/utils/timeUtils.h"

TEST_CASE("General datetime string parsing.", "[datetime]") {
    REQUIRE_THROWS(
            timeUtils::timeStringParser(
                    "%Y-%m-%d %H-%M-%S",
                    "1993098-09-11 11-12-13"
            )
    );
    REQUIRE_NOTHROW(
            timeUtils::timeStringParser(
                    "%Y-%m-%d %H-%M-%S",
                    "1993-09-11 11-12-13"
            )
    );

    timeUtils::ptime res = timeUtils::timeStringParser(
            "%Y-%m-%d %H-%M-%S",
            "1993-09-11 11-12-13"
    );
    timeUtils::date targetDate(1993, 9, 11);
    timeUtils::time_duration targetTime(11, 12, 13);

    REQUIRE(res.date() == targetDate);
    REQUIRE(res.time_of_day() == targetTime);
}

TEST_CASE("Datetime parsing rejects format mismatches.", "[datetime]") {
    REQUIRE_THROWS(
            timeUtils::timeStringParser("%Y-%m-%d %H:%M:%S", "2024-01-15")
    );
    REQUIRE_THROWS(
            timeUtils::timeStringParser("%Y-%m-%d", "2024-01-15 10:00")
    );
    REQUIRE_THROWS(
            timeUtils::timeStringParser("%Y-%m-%d", "2024/01/15")
    );
    REQUIRE_THROWS(
            timeUtils::timeStringParser("%Y-%m-%d", "2024-02-30")
    );

    REQUIRE_FALSE(static_cast<bool>(timeUtils::tryTimeStringParser("%Y-%m-%d", "15-01-2024")));
    REQUIRE_FALSE(static_cast<bool>(timeUtils::tryTimeStringParser("%Y-%m-%d", "2023-02-29")));
    REQUIRE_FALSE(static_cast<bool>(timeUtils::tryTimeStringParser("%Y-%m-%d", "")));

    boost::optional<timeUtils::ptime> leapDay =
            timeUtils::tryTimeStringParser("%Y-%m-%d", "2024-02-29");
    REQUIRE(static_cast<bool>(leapDay));
    REQUIRE(leapDay->date() == timeUtils::date(2024, 2, 29));
    REQUIRE(leapDay->time_of_day() == timeUtils::time_duration(0, 0, 0));
}

TEST_CASE("IB datetime strings", "[datetime]") {
    timeUtils::ptime res = timeUtils::ibTimeStrParser("20240131 16:00:00");

    REQUIRE(res.date() == timeUtils::date(2024, 1, 31));
    REQUIRE(res.time_of_day() == timeUtils::hours(16));

    timeUtils::ptime early(timeUtils::date(2025, 1, 1), timeUtils::hours(2));
    REQUIRE(timeUtils::ibTimeStrFormatter(early) == "20250101 02:00:00");

    REQUIRE_THROWS(timeUtils::ibTimeStrParser("2024-01-31 16:00:00"));
}

TEST_CASE("Datetime formatting", "[datetime]") {
    timeUtils::ptime pt(
            timeUtils::date(2024, 7, 4),
            timeUtils::time_duration(9, 5, 7)
    );

    REQUIRE(timeUtils::timeStringFormatter("%Y-%m-%d", pt) == "2024-07-04");
    REQUIRE(
            timeUtils::timeStringFormatter("%Y-%m-%d %H:%M:%S", pt)
            == "2024-07-04 09:05:07"
    );
    REQUIRE(
            timeUtils::timeStringFormatter("%Y%m%d_%H%M%S", pt)
            == "20240704_090507"
    );
}

TEST_CASE("Local wall clock to UTC", "[datetime]") {
    timeUtils::ptime utc(
            timeUtils::date(2024, 1, 15),
            timeUtils::time_duration(14, 30, 0)
    );
    timeUtils::ptime local =
            boost::date_time::c_local_adjustor<timeUtils::ptime>::utc_to_local(utc);

    REQUIRE(timeUtils::localToUtc(local) == utc);

    timeUtils::ptime summer(
            timeUtils::date(2024, 7, 15),
            timeUtils::time_duration(13, 30, 0)
    );
    REQUIRE(timeUtils::localToUtc(
            boost::date_time::c_local_adjustor<timeUtils::ptime>::utc_to_local(summer)
    ) == summer);
}
