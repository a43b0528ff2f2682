#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>

#include "../../src/TimezoneConverter.h"

namespace {
    const tzConvert::Zone kMarket =
            tzConvert::targetZone(tzConvert::ZoneSelector::Market, "SPY");
    const tzConvert::Zone kUtc =
            tzConvert::targetZone(tzConvert::ZoneSelector::UTC, "SPY");

    std::string intraday(const std::string &timestamp, const tzConvert::Zone &zone) {
        return tzConvert::formatTimestamp(
                tzConvert::parseUtcTimestamp(timestamp),
                zone,
                true
        );
    }

    bar::Bar row(const std::string &timestamp) {
        return bar::Bar{timestamp, 1.0, 2.0, 0.5, 1.5, 100};
    }
}

TEST_CASE("Zone selectors", "[timezone]") {
    REQUIRE(tzConvert::parseZoneSelector("UTC") == tzConvert::ZoneSelector::UTC);
    REQUIRE(tzConvert::parseZoneSelector("market") == tzConvert::ZoneSelector::Market);
    REQUIRE(tzConvert::parseZoneSelector("local") == tzConvert::ZoneSelector::Local);
    REQUIRE_THROWS_AS(tzConvert::parseZoneSelector("Europe/Paris"), std::invalid_argument);
    REQUIRE(tzConvert::toString(tzConvert::ZoneSelector::Market) == "market");
}

TEST_CASE("Market zone does not depend on the symbol", "[timezone]") {
    REQUIRE(kMarket.name() == "US/Eastern");
    REQUIRE(tzConvert::targetZone(tzConvert::ZoneSelector::Market, "EURUSD").name()
            == "US/Eastern");
}

TEST_CASE("Epoch seconds are converted to the market zone", "[timezone]") {
    // winter, EST
    REQUIRE(intraday("1705329000", kMarket) == "2024-01-15 09:30:00");
    // summer, EDT
    REQUIRE(intraday("1721050200", kMarket) == "2024-07-15 09:30:00");
    REQUIRE(intraday("1705329000", kUtc) == "2024-01-15 14:30:00");
}

TEST_CASE("Daylight saving transition", "[timezone]") {
    REQUIRE(intraday("1710053940", kMarket) == "2024-03-10 01:59:00");
    REQUIRE(intraday("1710054000", kMarket) == "2024-03-10 03:00:00");

    timeUtils::ptime before = timeUtils::from_time_t(1710053940);
    timeUtils::ptime after = timeUtils::from_time_t(1710054000);
    REQUIRE(kMarket.abbreviation(before) == "EST");
    REQUIRE(kMarket.abbreviation(after) == "EDT");
}

TEST_CASE("Text timestamps with and without offsets", "[timezone]") {
    REQUIRE(intraday("20240115 14:30:00", kUtc) == "2024-01-15 14:30:00");
    REQUIRE(intraday("2024-01-15 14:30:00", kUtc) == "2024-01-15 14:30:00");
    REQUIRE(intraday("2024-01-15T14:30:00Z", kUtc) == "2024-01-15 14:30:00");
    REQUIRE(intraday("20240115 14:30:00 UTC", kUtc) == "2024-01-15 14:30:00");
    REQUIRE(intraday("2024-01-15 09:30:00-05:00", kUtc) == "2024-01-15 14:30:00");
    REQUIRE(intraday("2024-01-15T20:00:00+0530", kUtc) == "2024-01-15 14:30:00");
    REQUIRE(intraday("2024-01-15 09:30:00-05:00", kMarket) == "2024-01-15 09:30:00");
}

TEST_CASE("Calendar dates are not shifted", "[timezone]") {
    tzConvert::Timestamp compact = tzConvert::parseUtcTimestamp("20240115");
    REQUIRE(compact.dateOnly);
    REQUIRE(tzConvert::formatTimestamp(compact, kMarket, false) == "2024-01-15");

    tzConvert::Timestamp iso = tzConvert::parseUtcTimestamp("2024-01-15");
    REQUIRE(iso.dateOnly);
    REQUIRE(tzConvert::formatTimestamp(iso, kMarket, false) == "2024-01-15");
}

TEST_CASE("Unparseable timestamps are rejected", "[timezone]") {
    for (const std::string &bad : {
            "garbage", "", "2024-01-15 14:30", "20240115 14:30:00+5",
            "2024-13-01", "1234567890123"
    }) {
        REQUIRE_THROWS_AS(tzConvert::parseUtcTimestamp(bad),
                          tzConvert::UnparseableTimestamp);
    }
}

TEST_CASE("Formatting rows keeps what it cannot read", "[timezone]") {
    std::vector<bar::Bar> rows{
            row("1705329000"),
            row("not a time"),
            row("20240115 15:00:00")
    };

    std::size_t unconverted = tzConvert::format(rows, kMarket, true);

    REQUIRE(unconverted == 1);
    REQUIRE(rows[0].timestamp == "2024-01-15 09:30:00");
    REQUIRE(rows[1].timestamp == "not a time");
    REQUIRE(rows[2].timestamp == "2024-01-15 10:00:00");
    REQUIRE(rows[2].close == 1.5);
}

TEST_CASE("Daily rows become plain dates", "[timezone]") {
    std::vector<bar::Bar> rows{row("20240112"), row("20240116")};

    REQUIRE(tzConvert::format(rows, kMarket, false) == 0);
    REQUIRE(rows[0].timestamp == "2024-01-12");
    REQUIRE(rows[1].timestamp == "2024-01-16");
}

TEST_CASE("Date column names", "[timezone]") {
    timeUtils::ptime winter = timeUtils::from_time_t(1705329000);
    timeUtils::ptime summer = timeUtils::from_time_t(1721050200);

    REQUIRE(tzConvert::dateColumnName(kMarket, false, winter) == "Date");
    REQUIRE(tzConvert::dateColumnName(kMarket, true, winter) == "DateTime_EST");
    REQUIRE(tzConvert::dateColumnName(kMarket, true, summer) == "DateTime_EDT");
    REQUIRE(tzConvert::dateColumnName(kUtc, true, summer) == "DateTime_UTC");
}
