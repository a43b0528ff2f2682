#ifndef IBHIST_DURATION_H
#define IBHIST_DURATION_H

#include <stdexcept>
#include <string>

namespace duration {
    class InvalidDuration : public std::invalid_argument {
    public:
        explicit InvalidDuration(const std::string &durationString);
    };

    enum class DurationUnit {
        Second,
        Day,
        Week,
        Month,
        Year
    };

    /**
     * A backward-looking history span, e.g. 30 days or 1 year. It is only
     * turned into the provider's "<integer> <unit>" text (e.g. "30 D") when
     * a request is built.
     */
    class Duration {
    public:
        Duration(long magnitude, DurationUnit unit);

        /**
         * Parses the provider grammar "<integer> <unit>" where unit is one
         * of S, D, W, M or Y (case-insensitive).
         *
         * @throws InvalidDuration if the text does not follow the grammar
         *     or the magnitude is not positive.
         */
        static Duration parse(const std::string &durationString);

        long magnitude() const;

        DurationUnit unit() const;

        std::string toString() const;

        bool operator==(const Duration &other) const;

        bool operator!=(const Duration &other) const;

    private:
        long magnitude_;
        DurationUnit unit_;
    };

    char unitCode(DurationUnit unit);
}

#endif //IBHIST_DURATION_H
