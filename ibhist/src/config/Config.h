#ifndef IBHIST_CONFIG_H
#define IBHIST_CONFIG_H

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "../DateRangeResolver.h"
#include "../HistoricalDataSource.h"
#include "../TimezoneConverter.h"
#include "../dataStructs/bar.h"

namespace config {
    class ConfigError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * Settings for one run. Built once at startup and only passed around
     * as a const reference afterwards.
     */
    struct Config {
        // contract
        std::string symbol{"SPY"};
        std::string securityType{"STK"};
        std::string exchange{"SMART"};
        std::string currency{"USD"};
        std::string futureContractMonth;
        std::string futureExchange;

        // request
        std::string timeframe{"1 day"};
        std::string duration{"1 Y"};
        boost::optional<std::string> startDate;
        boost::optional<std::string> endDate;
        bool extendedHours{false};
        std::string whatToShow{"TRADES"};

        // output
        boost::optional<std::string> output;
        bool overwrite{false};
        std::string timezone{"market"};
        std::string onConflict{"prompt"};

        // connection
        std::string host{"127.0.0.1"};
        int port{4001};
        int clientId{77};
        int connectTimeoutSeconds{15};
        int requestTimeoutSeconds{60};

        // logging
        std::string logLevel{"information"};
        std::string logFile;

        bar::BarSize barSize() const;

        dateRange::SessionMode sessionMode() const;

        tzConvert::ZoneSelector zoneSelector() const;

        /** The future month if this is a futures contract. */
        boost::optional<std::string> futureMonth() const;

        histSource::ContractSpec contract() const;
    };

    const std::vector<std::string> &securityTypes();

    const std::vector<std::string> &whatToShowTypes();

    const std::vector<std::string> &logLevels();

    /**
     * Checks the choices and combinations a Config may hold.
     *
     * @throws ConfigError
     */
    void validate(const Config &config);

    /**
     * Reads the command line and, if --config names one, an INI style file
     * using the same long option names. The command line wins.
     *
     * @return The validated settings, or none if help was requested (the
     *     usage text is written to `helpOut`).
     * @throws ConfigError, boost::program_options::error
     */
    boost::optional<Config> fromCommandLine(
            int argc,
            const char *const argv[],
            std::ostream &helpOut = std::cout
    );
}

#endif //IBHIST_CONFIG_H
