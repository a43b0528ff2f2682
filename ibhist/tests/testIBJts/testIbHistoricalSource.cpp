#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>

#include "../../src/ib/IbHistoricalSource.h"

// Needs IB Gateway or TWS with API access on the paper trading port. Hidden
// by default, run with: testIbHistoricalSource "[live]"

namespace {
    ibSource::ConnectionSettings paperGateway() {
        return ibSource::ConnectionSettings{"127.0.0.1", 4002, 78, 15, 60};
    }

    histSource::RequestEnvelope spyRequest() {
        histSource::RequestEnvelope request;
        request.contract = histSource::ContractSpec{"SPY", "STK", "SMART", "USD", ""};
        request.endDateTime = "20240131 16:00:00";
        request.durationString = "5 D";
        request.barSizeSetting = "1 day";
        request.whatToShow = "TRADES";
        return request;
    }
}

TEST_CASE("Establish connection", "[.live]") {
    ibSource::IbHistoricalSource source(paperGateway());

    source.connect();
    REQUIRE(source.isConnected());

    source.disconnect();
    REQUIRE_FALSE(source.isConnected());
}

TEST_CASE("Nothing listening is a connection error", "[.live]") {
    ibSource::IbHistoricalSource source(
            ibSource::ConnectionSettings{"127.0.0.1", 1, 78, 2, 2}
    );

    REQUIRE_THROWS_AS(source.connect(), histSource::ConnectionError);
    REQUIRE_FALSE(source.isConnected());
}

TEST_CASE("Receive daily bars for SPY", "[.live]") {
    ibSource::IbHistoricalSource source(paperGateway());

    std::vector<bar::Bar> bars = source.fetch(spyRequest());

    REQUIRE(bars.size() == 5);
    REQUIRE(bars.front().timestamp == "20240125");
    REQUIRE(bars.back().timestamp == "20240131");
    for (const bar::Bar &daily : bars) {
        REQUIRE(daily.low <= daily.high);
        REQUIRE(daily.volume > 0);
    }
}

TEST_CASE("Unknown symbols are reported", "[.live]") {
    ibSource::IbHistoricalSource source(paperGateway());
    histSource::RequestEnvelope request = spyRequest();
    request.contract.symbol = "NOSUCHSYMBOLXYZ";

    REQUIRE_THROWS_AS(source.fetch(request), histSource::ContractNotFound);
}
