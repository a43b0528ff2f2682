#ifndef IBHIST_IBHISTORICALSOURCE_H
#define IBHIST_IBHISTORICALSOURCE_H

#include <memory>
#include <string>
#include <vector>

#include "../HistoricalDataSource.h"

namespace ibSource {
    struct ConnectionSettings {
        std::string host;
        int port;
        int clientId;
        int connectTimeoutSeconds;
        int requestTimeoutSeconds;
    };

    /**
     * Historical bars from TWS or IB Gateway through the TWS API.
     *
     * The connection is opened by `connect` and closed on destruction.
     * Calls block until the answer arrives, the provider reports an error
     * or the timeout from the settings expires.
     */
    class IbHistoricalSource : public histSource::HistoricalDataSource {
    public:
        explicit IbHistoricalSource(ConnectionSettings settings);

        ~IbHistoricalSource() override;

        IbHistoricalSource(const IbHistoricalSource &) = delete;

        IbHistoricalSource &operator=(const IbHistoricalSource &) = delete;

        /**
         * @throws histSource::ConnectionError if TWS / IB Gateway cannot be
         *     reached or does not answer within the connect timeout.
         */
        void connect();

        bool isConnected() const;

        void disconnect();

        /**
         * Qualifies the contract, then requests the bars.
         *
         * @throws histSource::ContractNotFound, histSource::RequestTimeout,
         *     histSource::ConnectionError, histSource::ProviderError
         */
        std::vector<bar::Bar> fetch(
                const histSource::RequestEnvelope &request
        ) override;

    private:
        struct Session;

        ConnectionSettings settings_;
        std::unique_ptr<Session> session_;
    };
}

#endif //IBHIST_IBHISTORICALSOURCE_H
