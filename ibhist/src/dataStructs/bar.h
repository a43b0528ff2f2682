#ifndef IBHIST_BAR_H
#define IBHIST_BAR_H

#include <string>
#include <vector>

namespace bar {
    /**
     * One OHLCV bar as returned by the data provider. The timestamp is kept
     * as the provider's text until it is converted for output.
     */
    struct Bar {
        std::string timestamp;
        double open{};
        double high{};
        double low{};
        double close{};
        long long volume{};
    };

    enum class BarCategory {
        SubMinute,
        Minute,
        Hour,
        DayPlus
    };

    /**
     * A bar size (timeframe) from the fixed catalog of bar sizes supported
     * by the provider, e.g. "1 secs", "5 mins", "1 hour", "1 day".
     */
    class BarSize {
    public:
        explicit BarSize(const std::string &label);

        BarSize(const BarSize &barSize);

        BarSize &operator=(const BarSize &other) = default;

        const std::string &label() const;

        BarCategory category() const;

        /** `true` for every bar size shorter than one day. */
        bool isIntraday() const;

        /**
         * `true` for bar sizes of 30 seconds or less, which the provider
         * does not serve for dates older than six months.
         */
        bool hasSubMinuteRisk() const;

        friend std::string
        operator+(const std::string &first, const BarSize &second);

        bool operator==(const BarSize &other) const;

        bool operator!=(const BarSize &other) const;

        /** All supported labels, shortest bar size first. */
        static const std::vector<std::string> &catalog();

    private:
        std::size_t index_;

        static std::size_t validateBarSize(const std::string &label);
    };

    std::string operator+(const std::string &first, const BarSize &second);

    /**
     * Bars of a single bar size, in the order the provider returned them
     * (chronological).
     */
    class BarData {
    public:
        explicit BarData(const BarSize &barSize);

        void addBar(Bar bar);

        size_t size() const;

        bool empty() const;

        const BarSize &barSize() const;

        std::vector<Bar> &bars();

        const std::vector<Bar> &bars() const;

    private:
        std::vector<Bar> bars_;
        BarSize barSize_;
    };
}

#endif //IBHIST_BAR_H
