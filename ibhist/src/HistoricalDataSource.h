#ifndef IBHIST_HISTORICALDATASOURCE_H
#define IBHIST_HISTORICALDATASOURCE_H

#include <stdexcept>
#include <string>
#include <vector>

#include "dataStructs/bar.h"

namespace histSource {
    /**
     * Instrument description handed to the provider, which resolves it to
     * a single contract.
     */
    struct ContractSpec {
        std::string symbol;
        std::string securityType;
        std::string exchange;
        std::string currency;
        // futures only, YYYYMM or YYYYMMDD
        std::string lastTradeDateOrContractMonth;
    };

    /**
     * Parameters of one historical bars request.
     *
     * formatDate 2 asks for epoch seconds on intraday bars, so timestamps
     * come back in UTC.
     */
    struct RequestEnvelope {
        ContractSpec contract;
        std::string endDateTime;
        std::string durationString;
        std::string barSizeSetting;
        std::string whatToShow;
        bool useRTH{true};
        int formatDate{2};
    };

    class ProviderError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConnectionError : public ProviderError {
    public:
        using ProviderError::ProviderError;
    };

    class ContractNotFound : public ProviderError {
    public:
        using ProviderError::ProviderError;
    };

    class RequestTimeout : public ProviderError {
    public:
        using ProviderError::ProviderError;
    };

    /**
     * Source of historical bars. A failed request is reported by throwing
     * one of the ProviderError types; it is never retried here.
     */
    class HistoricalDataSource {
    public:
        virtual ~HistoricalDataSource() = default;

        /**
         * @return The bars in the order the provider sent them, possibly
         *     none.
         */
        virtual std::vector<bar::Bar> fetch(const RequestEnvelope &request) = 0;
    };
}

#endif //IBHIST_HISTORICALDATASOURCE_H
