#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>

#include "../../../src/dataStructs/bar.h"

TEST_CASE("BarSize constructors", "[BarSize]") {
    REQUIRE_NOTHROW(bar::BarSize("5 mins"));

    bar::BarSize validBarSize = bar::BarSize("5 mins");

    REQUIRE_NOTHROW(bar::BarSize(validBarSize));
    REQUIRE(bar::BarSize(validBarSize).label() == "5 mins");

    REQUIRE_THROWS_AS(bar::BarSize("7 mins"), std::invalid_argument);
    REQUIRE_THROWS_AS(bar::BarSize("1 sec"), std::invalid_argument);
    REQUIRE_THROWS_AS(bar::BarSize("1 days"), std::invalid_argument);
    REQUIRE_THROWS_AS(bar::BarSize(""), std::invalid_argument);
}

TEST_CASE("BarSize catalog", "[BarSize]") {
    const std::vector<std::string> &catalog = bar::BarSize::catalog();

    REQUIRE(catalog.size() == 21);
    REQUIRE(catalog.front() == "1 secs");
    REQUIRE(catalog.back() == "1 month");

    for (const std::string &label : catalog) {
        REQUIRE(bar::BarSize(label).label() == label);
    }
    REQUIRE_THROWS_AS(bar::BarSize("1 year"), std::invalid_argument);
}

TEST_CASE("BarSize categories", "[BarSize]") {
    REQUIRE(bar::BarSize("30 secs").category() == bar::BarCategory::SubMinute);
    REQUIRE(bar::BarSize("1 min").category() == bar::BarCategory::Minute);
    REQUIRE(bar::BarSize("30 mins").category() == bar::BarCategory::Minute);
    REQUIRE(bar::BarSize("8 hours").category() == bar::BarCategory::Hour);
    REQUIRE(bar::BarSize("1 week").category() == bar::BarCategory::DayPlus);

    REQUIRE(bar::BarSize("8 hours").isIntraday());
    REQUIRE_FALSE(bar::BarSize("1 day").isIntraday());
    REQUIRE(bar::BarSize("1 secs").hasSubMinuteRisk());
    REQUIRE_FALSE(bar::BarSize("1 min").hasSubMinuteRisk());
}

TEST_CASE("BarSize + operator with string", "[BarSize]") {
    std::string baseStr = " time ";

    REQUIRE(baseStr + bar::BarSize("5 secs") == " time 5 secs");
    REQUIRE("Timeframe '" + bar::BarSize("1 month") + "'" == "Timeframe '1 month'");
}

TEST_CASE("BarSize equality", "[BarSize]") {
    bar::BarSize targetBar("2 hours");

    REQUIRE(targetBar == bar::BarSize("2 hours"));
    REQUIRE(targetBar != bar::BarSize("2 mins"));
    REQUIRE(targetBar != bar::BarSize("1 hour"));
}

TEST_CASE("BarData size", "[BarData]") {
    bar::BarData bars(bar::BarSize("5 mins"));

    REQUIRE(bars.size() == 0);
    REQUIRE(bars.empty());
    REQUIRE(bars.barSize() == bar::BarSize("5 mins"));
}

TEST_CASE("BarData addBar keeps provider order", "[BarData]") {
    bar::BarData bars(bar::BarSize("5 mins"));

    bars.addBar(bar::Bar{"1705329300", 180, 181, 179, 180.5, 1200});
    bars.addBar(bar::Bar{"1705329000", 179.5, 180, 179, 179.6, 12341234});

    REQUIRE(bars.size() == 2);
    REQUIRE_FALSE(bars.empty());
    REQUIRE(bars.bars()[0].timestamp == "1705329300");
    REQUIRE(bars.bars()[1].timestamp == "1705329000");
    REQUIRE(bars.bars()[1].volume == 12341234);
}
