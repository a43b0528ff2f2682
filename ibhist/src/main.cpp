#include <cstdlib>
#include <iostream>
#include <memory>

#include <boost/program_options/errors.hpp>
#include <spdlog/spdlog.h>

#include "FileConflictResolver.h"
#include "HistoricalRetriever.h"
#include "OutputWriter.h"
#include "config/Config.h"
#include "ib/IbHistoricalSource.h"
#include "utils/logging.h"

namespace {
    void logSettings(const config::Config &config) {
        spdlog::info("IBKR Historical Data Downloader");
        spdlog::info("================================");
        spdlog::info("Symbol: {}", config.symbol);
        spdlog::info("Timeframe: {}", config.timeframe);
        spdlog::info("Duration: {}", config.duration);
        spdlog::info("Timezone: {}", config.timezone);
        if (config.startDate) {
            spdlog::info("Start date: {}", *config.startDate);
        }
        if (config.endDate) {
            spdlog::info("End date: {}", *config.endDate);
        }
        if (config.extendedHours) {
            spdlog::info("Extended hours: Enabled");
        }
        if (config.output) {
            spdlog::info("Output file: {}", *config.output);
        }
    }
}

int main(int argc, char *argv[]) {
    boost::optional<config::Config> parsed;
    try {
        parsed = config::fromCommandLine(argc, argv);
    } catch (const boost::program_options::error &e) {
        std::cerr << "ERROR: " << e.what() << "\nTry 'ibhist --help'." << std::endl;
        return EXIT_FAILURE;
    } catch (const config::ConfigError &e) {
        std::cerr << "ERROR: " << e.what() << "\nTry 'ibhist --help'." << std::endl;
        return EXIT_FAILURE;
    }
    if (!parsed) {
        return EXIT_SUCCESS;
    }
    const config::Config &config = *parsed;

    try {
        logging::configure(config.logLevel, config.logFile);
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    logSettings(config);

    try {
        std::unique_ptr<fileConflict::ConflictPolicy> policy =
                fileConflict::makePolicy(config.onConflict);
        ibSource::IbHistoricalSource source(ibSource::ConnectionSettings{
                config.host,
                config.port,
                config.clientId,
                config.connectTimeoutSeconds,
                config.requestTimeoutSeconds
        });

        // no data and a cancelled save are both normal endings
        histRetriever::retrieveBarData(config, source, *policy);
        source.disconnect();
        return EXIT_SUCCESS;
    } catch (const std::invalid_argument &e) {
        // bad dates, durations or contract settings, nothing was requested
        spdlog::error("{}", e.what());
    } catch (const histSource::ProviderError &e) {
        spdlog::error("{}", e.what());
    } catch (const outputWriter::WriteError &e) {
        spdlog::error("{}", e.what());
    } catch (const std::exception &e) {
        spdlog::error("An unexpected error occurred: {}", e.what());
    }
    return EXIT_FAILURE;
}
