#include "TimeframeClassifier.h"

namespace timeframe {
    Classification classify(const std::string &label) {
        return classify(bar::BarSize(label));
    }

    Classification classify(const bar::BarSize &barSize) {
        return Classification{
                barSize.isIntraday(),
                barSize.hasSubMinuteRisk()
        };
    }

    std::vector<std::string> availabilityWarnings(
            const bar::BarSize &barSize,
            const duration::Duration &historyDuration
    ) {
        std::vector<std::string> warnings;
        if (!barSize.hasSubMinuteRisk()) {
            return warnings;
        }

        warnings.push_back(
                "Timeframe '" + barSize + "' with duration '" +
                historyDuration.toString() + "' may hit IBKR pacing limits"
        );
        warnings.emplace_back(
                "Bars 30 seconds or smaller older than 6 months are not"
                " available from IBKR"
        );
        if (historyDuration.unit() == duration::DurationUnit::Year) {
            warnings.emplace_back(
                    "Small timeframes with yearly durations may result in"
                    " very large datasets"
            );
        }

        return warnings;
    }
}
