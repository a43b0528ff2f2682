#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>

#include "../../src/TimeframeClassifier.h"

TEST_CASE("Exactly day, week and month bars are not intraday", "[timeframe]") {
    std::vector<std::string> dailyAndAbove;
    std::size_t intradayCount = 0;
    for (const std::string &label : bar::BarSize::catalog()) {
        if (timeframe::classify(label).intraday) {
            ++intradayCount;
        } else {
            dailyAndAbove.push_back(label);
        }
    }

    REQUIRE(intradayCount == 18);
    REQUIRE(dailyAndAbove == std::vector<std::string>{"1 day", "1 week", "1 month"});
}

TEST_CASE("Bars of 30 seconds or less carry the availability risk", "[timeframe]") {
    std::vector<std::string> risky;
    for (const std::string &label : bar::BarSize::catalog()) {
        if (timeframe::classify(label).subMinuteRisk) {
            risky.push_back(label);
        }
    }

    REQUIRE(risky == std::vector<std::string>{
            "1 secs", "5 secs", "10 secs", "15 secs", "30 secs"
    });
    REQUIRE(timeframe::classify(bar::BarSize("30 secs")).intraday);
}

TEST_CASE("Unknown labels are rejected", "[timeframe]") {
    REQUIRE_THROWS_AS(timeframe::classify("45 mins"), std::invalid_argument);
}

TEST_CASE("Availability warnings", "[timeframe]") {
    duration::Duration thirtyDays(30, duration::DurationUnit::Day);
    duration::Duration oneYear(1, duration::DurationUnit::Year);

    REQUIRE(timeframe::availabilityWarnings(bar::BarSize("1 min"), oneYear).empty());
    REQUIRE(timeframe::availabilityWarnings(bar::BarSize("1 day"), oneYear).empty());

    std::vector<std::string> shortSpan =
            timeframe::availabilityWarnings(bar::BarSize("5 secs"), thirtyDays);
    REQUIRE(shortSpan.size() == 2);
    REQUIRE(shortSpan[0].find("'5 secs'") != std::string::npos);
    REQUIRE(shortSpan[0].find("'30 D'") != std::string::npos);
    REQUIRE(shortSpan[1].find("6 months") != std::string::npos);

    std::vector<std::string> yearSpan =
            timeframe::availabilityWarnings(bar::BarSize("30 secs"), oneYear);
    REQUIRE(yearSpan.size() == 3);
    REQUIRE(yearSpan[2].find("very large datasets") != std::string::npos);
}
