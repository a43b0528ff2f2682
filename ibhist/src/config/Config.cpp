#include "Config.h"

#include <algorithm>
#include <fstream>

#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace config {
    namespace {
        bool contains(
                const std::vector<std::string> &choices,
                const std::string &value
        ) {
            return std::find(choices.begin(), choices.end(), value) !=
                   choices.end();
        }

        void requireChoice(
                const std::string &option,
                const std::string &value,
                const std::vector<std::string> &choices
        ) {
            if (!contains(choices, value)) {
                throw ConfigError(
                        option + ": '" + value + "' must be one of " +
                        boost::algorithm::join(choices, ", ") + "."
                );
            }
        }

        boost::optional<std::string> optionalValue(
                const po::variables_map &vm,
                const std::string &option,
                const std::string &alias
        ) {
            boost::optional<std::string> value;
            if (vm.count(option)) {
                value = vm[option].as<std::string>();
            }
            if (vm.count(alias)) {
                const std::string &aliased = vm[alias].as<std::string>();
                if (value && *value != aliased) {
                    throw ConfigError(
                            "--" + option + " and --" + alias +
                            " name the same setting but differ."
                    );
                }
                value = aliased;
            }
            return value;
        }
    }

    bar::BarSize Config::barSize() const {
        return bar::BarSize(timeframe);
    }

    dateRange::SessionMode Config::sessionMode() const {
        return extendedHours ? dateRange::SessionMode::Extended
                             : dateRange::SessionMode::Regular;
    }

    tzConvert::ZoneSelector Config::zoneSelector() const {
        return tzConvert::parseZoneSelector(timezone);
    }

    boost::optional<std::string> Config::futureMonth() const {
        if (securityType == "FUT" && !futureContractMonth.empty()) {
            return futureContractMonth;
        }
        return boost::none;
    }

    histSource::ContractSpec Config::contract() const {
        histSource::ContractSpec spec{symbol, securityType, exchange, currency, ""};

        if (securityType == "CASH") {
            // the pair names both currencies, e.g. EURUSD
            if (symbol.size() != 6) {
                throw ConfigError(
                        "Forex symbol '" + symbol +
                        "' must be a currency pair such as EURUSD."
                );
            }
            spec.symbol = symbol.substr(0, 3);
            spec.currency = symbol.substr(3, 3);
            spec.exchange = "IDEALPRO";
        } else if (securityType == "FUT") {
            if (futureContractMonth.empty() || futureExchange.empty()) {
                throw ConfigError(
                        "For Futures (FUT), the future contract month and"
                        " the future exchange must be specified."
                );
            }
            spec.exchange = futureExchange;
            spec.lastTradeDateOrContractMonth = futureContractMonth;
        }

        return spec;
    }

    const std::vector<std::string> &securityTypes() {
        static const std::vector<std::string> types{"STK", "CASH", "FUT"};
        return types;
    }

    const std::vector<std::string> &whatToShowTypes() {
        static const std::vector<std::string> types{
                "TRADES", "MIDPOINT", "BID", "ASK", "ADJUSTED_LAST"
        };
        return types;
    }

    const std::vector<std::string> &logLevels() {
        static const std::vector<std::string> levels{
                "none", "error", "warning", "information", "debug"
        };
        return levels;
    }

    void validate(const Config &config) {
        requireChoice("timeframe", config.timeframe, bar::BarSize::catalog());
        requireChoice("sec-type", config.securityType, securityTypes());
        requireChoice("what-to-show", config.whatToShow, whatToShowTypes());
        requireChoice("timezone", config.timezone, {"UTC", "market", "local"});
        requireChoice(
                "on-conflict",
                config.onConflict,
                {"prompt", "overwrite", "rename", "cancel"}
        );
        requireChoice("log-level", config.logLevel, logLevels());

        if (config.symbol.empty()) {
            throw ConfigError("symbol must not be empty.");
        }
        if (config.port <= 0 || config.port > 65535) {
            throw ConfigError(
                    "port: " + std::to_string(config.port) +
                    " is not a valid TCP port."
            );
        }
        if (config.connectTimeoutSeconds <= 0
            || config.requestTimeoutSeconds <= 0) {
            throw ConfigError("timeouts must be positive.");
        }

        // raises for incomplete futures or malformed forex pairs
        config.contract();
    }

    boost::optional<Config> fromCommandLine(
            int argc,
            const char *const argv[],
            std::ostream &helpOut
    ) {
        Config config;
        std::string configFile;

        po::options_description generic("General");
        generic.add_options()
                ("help,h", "produce help message")
                ("config", po::value<std::string>(&configFile),
                 "INI style file with any of the long options below");

        po::options_description request("Request");
        request.add_options()
                ("symbol,s", po::value<std::string>(&config.symbol)
                         ->default_value(config.symbol),
                 "symbol to download")
                ("timeframe,t", po::value<std::string>(&config.timeframe)
                         ->default_value(config.timeframe),
                 ("bar size, one of: " +
                  boost::algorithm::join(bar::BarSize::catalog(), ", ")).c_str())
                ("duration,d", po::value<std::string>(&config.duration)
                         ->default_value(config.duration),
                 "history duration when no start date is given, e.g. '30 D', '6 M', '1 Y'")
                ("start-date", po::value<std::string>(),
                 "start date, YYYY-MM-DD or YYYY-MM-DD HH:MM[:SS]")
                ("from", po::value<std::string>(), "same as --start-date")
                ("end-date", po::value<std::string>(),
                 "end date, YYYY-MM-DD or YYYY-MM-DD HH:MM[:SS]")
                ("to", po::value<std::string>(), "same as --end-date")
                ("eth", po::bool_switch(&config.extendedHours),
                 "include extended trading hours (pre-market and after-hours)")
                ("what-to-show", po::value<std::string>(&config.whatToShow)
                         ->default_value(config.whatToShow),
                 "TRADES, MIDPOINT, BID, ASK or ADJUSTED_LAST");

        po::options_description contract("Contract");
        contract.add_options()
                ("sec-type", po::value<std::string>(&config.securityType)
                         ->default_value(config.securityType),
                 "STK, CASH or FUT")
                ("exchange", po::value<std::string>(&config.exchange)
                         ->default_value(config.exchange),
                 "stock exchange")
                ("currency", po::value<std::string>(&config.currency)
                         ->default_value(config.currency),
                 "stock or future currency")
                ("future-month", po::value<std::string>(&config.futureContractMonth),
                 "future contract month, YYYYMM or YYYYMMDD")
                ("future-exchange", po::value<std::string>(&config.futureExchange),
                 "future exchange, e.g. CME");

        po::options_description output("Output");
        output.add_options()
                ("output,o", po::value<std::string>(),
                 "output file name (generated if not given)")
                ("overwrite", po::bool_switch(&config.overwrite),
                 "overwrite existing files without prompting")
                ("timezone", po::value<std::string>(&config.timezone)
                         ->default_value(config.timezone),
                 "UTC, market (US/Eastern) or local")
                ("on-conflict", po::value<std::string>(&config.onConflict)
                         ->default_value(config.onConflict),
                 "existing file handling: prompt, overwrite, rename or cancel");

        po::options_description connection("Connection");
        connection.add_options()
                ("host", po::value<std::string>(&config.host)
                         ->default_value(config.host),
                 "TWS / IB Gateway host")
                ("port", po::value<int>(&config.port)
                         ->default_value(config.port),
                 "TWS paper 7497, live 7496; Gateway paper 4002, live 4001")
                ("client-id", po::value<int>(&config.clientId)
                         ->default_value(config.clientId),
                 "API client id")
                ("connect-timeout", po::value<int>(&config.connectTimeoutSeconds)
                         ->default_value(config.connectTimeoutSeconds),
                 "seconds to wait for the connection")
                ("timeout", po::value<int>(&config.requestTimeoutSeconds)
                         ->default_value(config.requestTimeoutSeconds),
                 "seconds to wait for the historical data")
                ("log-level", po::value<std::string>(&config.logLevel)
                         ->default_value(config.logLevel),
                 "none, error, warning, information or debug")
                ("log-file", po::value<std::string>(&config.logFile),
                 "log to this file instead of the console");

        po::options_description fileOptions;
        fileOptions.add(request).add(contract).add(output).add(connection);

        po::options_description all("ibhist - download historical OHLCV bars from Interactive Brokers");
        all.add(generic).add(fileOptions);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, all), vm);

        if (vm.count("help")) {
            helpOut << all << "\n"
                    << "Bars 30 seconds or smaller older than 6 months are"
                       " not available from IBKR.\n";
            return boost::none;
        }

        if (vm.count("config")) {
            const std::string &path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file) {
                throw ConfigError("Cannot read config file '" + path + "'.");
            }
            po::store(po::parse_config_file(file, fileOptions), vm);
        }
        po::notify(vm);

        config.startDate = optionalValue(vm, "start-date", "from");
        config.endDate = optionalValue(vm, "end-date", "to");
        if (vm.count("output")) {
            config.output = vm["output"].as<std::string>();
        }

        validate(config);
        return config;
    }
}
