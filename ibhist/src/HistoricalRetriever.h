#ifndef IBHIST_HISTORICALRETRIEVER_H
#define IBHIST_HISTORICALRETRIEVER_H

#include <string>

#include "DateRangeResolver.h"
#include "FileConflictResolver.h"
#include "HistoricalDataSource.h"
#include "config/Config.h"
#include "utils/timeUtils.h"

/**
 * One download is a single pass through:
 *
 *   dates, duration, session --> DateRangeResolver --+
 *   bar size ---------------> TimeframeClassifier --+--> RequestEnvelope
 *                                                          |
 *                                       HistoricalDataSource::fetch
 *                                                          |
 *   TimezoneConverter --> FilenameGenerator --> FileConflictResolver
 *                                                          |
 *                                                    OutputWriter (CSV)
 *
 * Nothing is written unless the provider returned bars and the conflict
 * policy agreed to a path.
 */
namespace histRetriever {
    enum class Outcome {
        Saved,
        NoData,
        Cancelled
    };

    struct RetrievalResult {
        Outcome outcome;
        std::string path;
        std::size_t rows;
    };

    /**
     * Builds the provider request for a resolved window.
     *
     * @throws config::ConfigError for an incomplete contract.
     */
    histSource::RequestEnvelope buildRequest(
            const config::Config &config,
            const dateRange::ResolvedRequest &resolved
    );

    /**
     * Retrieves historical bar data and stores it as CSV.
     *
     * @param config Settings of the run.
     * @param source Provider the bars are fetched from, exactly once.
     * @param policy Asked what to do if the output file already exists.
     * @param now Local time of the run, anchors requests without dates and
     *     names renamed files. The date column's zone abbreviation is the
     *     one in effect at this instant.
     * @return What happened and, for a saved file, its path and row count.
     * @throws dateRange::InvalidDateFormat, dateRange::InvalidRange,
     *     duration::InvalidDuration before anything is fetched;
     *     histSource::ProviderError from the fetch;
     *     outputWriter::WriteError if the file cannot be written.
     */
    RetrievalResult retrieveBarData(
            const config::Config &config,
            histSource::HistoricalDataSource &source,
            fileConflict::ConflictPolicy &policy,
            const timeUtils::ptime &now =
                    timeUtils::second_clock::local_time()
    );
}

#endif //IBHIST_HISTORICALRETRIEVER_H
