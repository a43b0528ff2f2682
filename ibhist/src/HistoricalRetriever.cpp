#include "HistoricalRetriever.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "FilenameGenerator.h"
#include "OutputWriter.h"
#include "TimeframeClassifier.h"
#include "TimezoneConverter.h"

namespace histRetriever {
    namespace {
        void logNoData(const bar::BarSize &barSize) {
            spdlog::warn(
                    "No historical data received. This could be due to"
                    " several reasons:"
            );
            spdlog::warn("  - No data available for the requested contract or period.");
            spdlog::warn("  - Market data subscriptions might be required for this specific data.");
            spdlog::warn("  - Incorrect contract details or parameters.");
            spdlog::warn(
                    "  - {} data may not be available if the duration is too"
                    " short or data restrictions apply.",
                    barSize.label()
            );
            if (barSize.hasSubMinuteRisk()) {
                spdlog::warn(
                        "  - Remember: Bars 30 seconds or smaller older than"
                        " 6 months are not available from IBKR."
                );
            }
        }

        void logRequest(const histSource::RequestEnvelope &request) {
            spdlog::info("Requesting historical data for {}:", request.contract.symbol);
            spdlog::info("  Duration: {}", request.durationString);
            spdlog::info("  Bar size: {}", request.barSizeSetting);
            spdlog::info("  Data type: {}", request.whatToShow);
            spdlog::info("  Regular Trading Hours: {}", request.useRTH);
            if (!request.useRTH) {
                spdlog::info("  Extended Hours: Included (pre-market and after-hours data)");
            }
            spdlog::info("  End DateTime: {}", request.endDateTime);
        }
    }

    histSource::RequestEnvelope buildRequest(
            const config::Config &config,
            const dateRange::ResolvedRequest &resolved
    ) {
        histSource::RequestEnvelope request;
        request.contract = config.contract();
        request.endDateTime = resolved.endTimestamp;
        request.durationString = resolved.durationString();
        request.barSizeSetting = config.barSize().label();
        request.whatToShow = config.whatToShow;
        request.useRTH = config.sessionMode() == dateRange::SessionMode::Regular;
        request.formatDate = 2;
        return request;
    }

    RetrievalResult retrieveBarData(
            const config::Config &config,
            histSource::HistoricalDataSource &source,
            fileConflict::ConflictPolicy &policy,
            const timeUtils::ptime &now
    ) {
        bar::BarSize barSize = config.barSize();
        dateRange::ResolvedRequest resolved = dateRange::resolve(
                config.startDate,
                config.endDate,
                config.duration,
                config.sessionMode(),
                now
        );
        spdlog::info(resolved.description);

        for (const std::string &warning :
                timeframe::availabilityWarnings(barSize, resolved.historyDuration)) {
            spdlog::warn(warning);
        }

        std::string outputPath = config.output
                ? *config.output
                : filename::generate(
                        config.symbol,
                        config.securityType,
                        resolved.historyDuration,
                        barSize,
                        config.futureMonth(),
                        config.extendedHours
                );

        timeframe::Classification classification = timeframe::classify(barSize);
        tzConvert::Zone zone = tzConvert::targetZone(
                config.zoneSelector(),
                config.symbol
        );
        timeUtils::ptime nowUtc = timeUtils::localToUtc(now);
        if (classification.intraday) {
            spdlog::info(
                    "  Output timezone: {} ({})",
                    config.timezone,
                    zone.abbreviation(nowUtc)
            );
        }

        histSource::RequestEnvelope request = buildRequest(config, resolved);
        logRequest(request);

        bar::BarData data(barSize);
        for (bar::Bar &fetched : source.fetch(request)) {
            data.addBar(std::move(fetched));
        }

        if (data.empty()) {
            logNoData(barSize);
            return RetrievalResult{Outcome::NoData, "", 0};
        }
        spdlog::info("Successfully received {} bars of data.", data.size());

        std::size_t unconverted = tzConvert::format(
                data.bars(),
                zone,
                classification.intraday
        );
        if (unconverted != 0) {
            spdlog::warn(
                    "{} of {} timestamps could not be converted and were"
                    " left as is.",
                    unconverted,
                    data.size()
            );
        }
        std::string dateColumn = tzConvert::dateColumnName(
                zone,
                classification.intraday,
                nowUtc
        );

        fileConflict::Resolution target = fileConflict::resolve(
                outputPath,
                config.overwrite,
                policy,
                now
        );
        if (!target.proceed) {
            spdlog::warn(
                    "Data download was successful but file was not saved"
                    " due to user cancellation."
            );
            return RetrievalResult{Outcome::Cancelled, target.path, data.size()};
        }

        outputWriter::writeCsv(target.path, dateColumn, data.bars());
        spdlog::info("SUCCESS: Historical OHLCV data saved to: {}", target.path);

        return RetrievalResult{Outcome::Saved, target.path, data.size()};
    }
}
