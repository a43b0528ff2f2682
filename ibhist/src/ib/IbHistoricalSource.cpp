#include "IbHistoricalSource.h"

#include <chrono>
#include <functional>
#include <utility>

#include <spdlog/spdlog.h>

#include "Contract.h"
#include "DefaultEWrapper.h"
#include "EClientSocket.h"
#include "EReader.h"
#include "EReaderOSSignal.h"

namespace ibSource {
    namespace {
        const int kContractRequestId = 1;
        const int kHistoryRequestId = 2;
        // lets the wait loop look at the clock between messages
        const unsigned long kSignalTimeoutMs = 500;

        enum class Failure {
            None,
            Connection,
            ContractNotFound,
            Provider
        };

        bool isInformational(int errorCode) {
            // 2100-2199: farm connection status and similar notices
            return errorCode >= 2100 && errorCode < 2200;
        }

        class HistoryWrapper : public DefaultEWrapper {
        public:
            OrderId orderId;
            std::vector<ContractDetails> contracts;
            bool contractsDone;
            std::vector<bar::Bar> bars;
            bool historyDone;
            bool closed;
            Failure failure;
            std::string failureMessage;

            HistoryWrapper() : orderId(-1), contractsDone(false),
                               historyDone(false), closed(false),
                               failure(Failure::None) {}

            void nextValidId(OrderId validId) override {
                orderId = validId;
            }

            void contractDetails(
                    int reqId,
                    const ContractDetails &details
            ) override {
                contracts.push_back(details);
            }

            void contractDetailsEnd(int reqId) override {
                contractsDone = true;
            }

            void historicalData(TickerId reqId, const Bar &ibBar) override {
                bars.push_back(bar::Bar{
                        ibBar.time,
                        ibBar.open,
                        ibBar.high,
                        ibBar.low,
                        ibBar.close,
                        ibBar.volume
                });
            }

            void historicalDataEnd(
                    int reqId,
                    const std::string &startDateStr,
                    const std::string &endDateStr
            ) override {
                historyDone = true;
            }

            void error(
                    int id,
                    int errorCode,
                    const std::string &errorString
            ) override {
                if (isInformational(errorCode)) {
                    spdlog::debug("TWS notice {}: {}", errorCode, errorString);
                    return;
                }

                spdlog::debug("TWS error {} for request {}: {}", errorCode, id, errorString);
                if (id == kHistoryRequestId && errorCode == 162
                    && errorString.find("returned no data") != std::string::npos) {
                    // an empty answer, not a failure
                    historyDone = true;
                    return;
                }

                if (errorCode == 200) {
                    failure = Failure::ContractNotFound;
                } else if (errorCode == 502 || errorCode == 504
                           || errorCode == 1100) {
                    failure = Failure::Connection;
                } else if (id == kContractRequestId || id == kHistoryRequestId) {
                    failure = Failure::Provider;
                } else {
                    spdlog::warn("TWS error {}: {}", errorCode, errorString);
                    return;
                }
                failureMessage = "TWS error " + std::to_string(errorCode) +
                                 ": " + errorString;
            }

            void connectionClosed() override {
                closed = true;
            }
        };

        Contract toContract(const histSource::ContractSpec &spec) {
            Contract contract;
            contract.symbol = spec.symbol;
            contract.secType = spec.securityType;
            contract.exchange = spec.exchange;
            contract.currency = spec.currency;
            contract.lastTradeDateOrContractMonth =
                    spec.lastTradeDateOrContractMonth;
            return contract;
        }
    }

    struct IbHistoricalSource::Session {
        HistoryWrapper wrapper;
        EReaderOSSignal signal;
        EClientSocket client;
        std::unique_ptr<EReader> reader;

        Session() : signal(kSignalTimeoutMs), client(&wrapper, &signal) {}

        ~Session() {
            if (client.isConnected()) {
                client.eDisconnect();
            }
            reader.reset();
        }

        void raiseFailure() {
            switch (wrapper.failure) {
                case Failure::None:
                    return;
                case Failure::Connection:
                    throw histSource::ConnectionError(wrapper.failureMessage);
                case Failure::ContractNotFound:
                    throw histSource::ContractNotFound(wrapper.failureMessage);
                case Failure::Provider:
                    throw histSource::ProviderError(wrapper.failureMessage);
            }
        }

        template<typename Error>
        void waitFor(
                const std::function<bool()> &done,
                int timeoutSeconds,
                const std::string &what
        ) {
            auto deadline = std::chrono::steady_clock::now() +
                            std::chrono::seconds(timeoutSeconds);
            while (!done()) {
                if (std::chrono::steady_clock::now() > deadline) {
                    throw Error(what + " timed out after " +
                                std::to_string(timeoutSeconds) + " seconds.");
                }
                if (wrapper.closed || !client.isConnected()) {
                    throw histSource::ConnectionError(
                            "Connection to TWS / IB Gateway was closed."
                    );
                }
                signal.waitForSignal();
                reader->processMsgs();
                raiseFailure();
            }
        }
    };

    IbHistoricalSource::IbHistoricalSource(ConnectionSettings settings) :
            settings_(std::move(settings)) {}

    IbHistoricalSource::~IbHistoricalSource() {
        disconnect();
    }

    void IbHistoricalSource::connect() {
        spdlog::info(
                "Attempting to connect to IBKR at {}:{} with Client ID {}...",
                settings_.host,
                settings_.port,
                settings_.clientId
        );

        session_.reset(new Session());
        if (!session_->client.eConnect(
                settings_.host.c_str(),
                settings_.port,
                settings_.clientId,
                false
        )) {
            session_.reset();
            throw histSource::ConnectionError(
                    "Connection refused. Ensure IB Gateway or TWS is running on " +
                    settings_.host + ":" + std::to_string(settings_.port) +
                    " and API access is enabled."
            );
        }

        session_->reader.reset(new EReader(&session_->client, &session_->signal));
        session_->reader->start();

        Session &session = *session_;
        session.waitFor<histSource::ConnectionError>(
                [&session] { return session.wrapper.orderId != -1; },
                settings_.connectTimeoutSeconds,
                "Connection to IBKR"
        );
        spdlog::info("Successfully connected to IBKR.");
    }

    bool IbHistoricalSource::isConnected() const {
        return session_ && session_->client.isConnected();
    }

    void IbHistoricalSource::disconnect() {
        if (!session_) {
            return;
        }
        if (session_->client.isConnected()) {
            spdlog::info("Disconnecting from IBKR...");
        }
        session_.reset();
    }

    std::vector<bar::Bar> IbHistoricalSource::fetch(
            const histSource::RequestEnvelope &request
    ) {
        if (!isConnected()) {
            connect();
        }
        Session &session = *session_;

        spdlog::info("Qualifying contract...");
        session.wrapper.contracts.clear();
        session.wrapper.contractsDone = false;
        session.client.reqContractDetails(
                kContractRequestId,
                toContract(request.contract)
        );
        session.waitFor<histSource::RequestTimeout>(
                [&session] { return session.wrapper.contractsDone; },
                settings_.requestTimeoutSeconds,
                "Contract qualification"
        );
        if (session.wrapper.contracts.empty()) {
            throw histSource::ContractNotFound(
                    "Contract for " + request.contract.symbol + " (" +
                    request.contract.securityType + ") could not be qualified."
                    " Please check symbol, security type, exchange, and other"
                    " parameters."
            );
        }
        Contract qualified = session.wrapper.contracts.front().contract;
        spdlog::info(
                "Contract qualified: {} on {} (conId: {})",
                qualified.localSymbol,
                qualified.exchange,
                qualified.conId
        );

        session.wrapper.bars.clear();
        session.wrapper.historyDone = false;
        session.client.reqHistoricalData(
                kHistoryRequestId,
                qualified,
                request.endDateTime,
                request.durationString,
                request.barSizeSetting,
                request.whatToShow,
                request.useRTH ? 1 : 0,
                request.formatDate,
                false,
                TagValueListSPtr()
        );
        session.waitFor<histSource::RequestTimeout>(
                [&session] { return session.wrapper.historyDone; },
                settings_.requestTimeoutSeconds,
                "Historical data request"
        );

        return std::move(session.wrapper.bars);
    }
}
