#define CATCH_CONFIG_MAIN

#include <fstream>
#include <sstream>

#include <catch2/catch.hpp>
#include <boost/filesystem.hpp>

#include "../../../src/utils/logging.h"

namespace fs = boost::filesystem;

TEST_CASE("Log level names", "[logging]") {
    REQUIRE(logging::parseLevel("none") == spdlog::level::off);
    REQUIRE(logging::parseLevel("error") == spdlog::level::err);
    REQUIRE(logging::parseLevel("warning") == spdlog::level::warn);
    REQUIRE(logging::parseLevel("information") == spdlog::level::info);
    REQUIRE(logging::parseLevel("debug") == spdlog::level::debug);
    REQUIRE_THROWS_AS(logging::parseLevel("info"), std::invalid_argument);
    REQUIRE_THROWS_AS(logging::parseLevel(""), std::invalid_argument);
}

TEST_CASE("Logging to a file", "[logging]") {
    fs::path dir = fs::temp_directory_path() / fs::unique_path("ibhist-log-%%%%-%%%%");
    fs::path logFile = dir / "nested" / "ibhist.log";

    logging::configure("warning", logFile.string());
    REQUIRE(fs::exists(logFile.parent_path()));
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::warn);

    spdlog::info("below the threshold");
    spdlog::warn("No historical data received.");
    spdlog::default_logger()->flush();

    std::ifstream in(logFile.string());
    std::stringstream contents;
    contents << in.rdbuf();
    REQUIRE(contents.str().find("No historical data received.") != std::string::npos);
    REQUIRE(contents.str().find("[warning]") != std::string::npos);
    REQUIRE(contents.str().find("below the threshold") == std::string::npos);

    logging::configure("debug", logFile.string());
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::debug);

    fs::remove_all(dir);
}
