#ifndef IBHIST_TIMEFRAMECLASSIFIER_H
#define IBHIST_TIMEFRAMECLASSIFIER_H

#include <string>
#include <vector>

#include "dataStructs/bar.h"
#include "dataStructs/duration.h"

namespace timeframe {
    struct Classification {
        bool intraday;
        bool subMinuteRisk;
    };

    /**
     * Classifies a bar size label.
     *
     * @param label One of the catalog labels, e.g. "1 min" or "1 day".
     * @return Whether the bar size is intraday and whether it is subject to
     *     the provider's six months limit on bars of 30 seconds or less.
     * @throws std::invalid_argument if the label is not in the catalog.
     */
    Classification classify(const std::string &label);

    Classification classify(const bar::BarSize &barSize);

    /**
     * Availability notices for a bar size and history duration. None of
     * them prevent the request from being sent.
     */
    std::vector<std::string> availabilityWarnings(
            const bar::BarSize &barSize,
            const duration::Duration &historyDuration
    );
}

#endif //IBHIST_TIMEFRAMECLASSIFIER_H
