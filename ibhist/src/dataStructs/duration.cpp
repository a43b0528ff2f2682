#include "duration.h"

#include <cctype>

using namespace duration;

InvalidDuration::InvalidDuration(const std::string &durationString) :
        std::invalid_argument(
                "Invalid duration '" + durationString +
                "'. Use '<integer> <unit>' with unit S, D, W, M or Y,"
                " e.g. '30 D' or '1 Y'."
        ) {}

Duration::Duration(long magnitude, DurationUnit unit) :
        magnitude_(magnitude), unit_(unit) {
    if (magnitude_ <= 0) {
        throw InvalidDuration(std::to_string(magnitude_) + " " + unitCode(unit_));
    }
}

Duration Duration::parse(const std::string &durationString) {
    // digits, a single space, a single unit letter, nothing else
    std::size_t space = durationString.find(' ');
    if (space == std::string::npos || space == 0 || space > 9
        || durationString.size() != space + 2) {
        throw InvalidDuration(durationString);
    }
    for (std::size_t i = 0; i != space; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(durationString[i]))) {
            throw InvalidDuration(durationString);
        }
    }

    long magnitude = std::stol(durationString.substr(0, space));
    if (magnitude <= 0) {
        throw InvalidDuration(durationString);
    }

    char unitLetter = durationString[space + 1];
    switch (std::toupper(static_cast<unsigned char>(unitLetter))) {
        case 'S':
            return Duration(magnitude, DurationUnit::Second);
        case 'D':
            return Duration(magnitude, DurationUnit::Day);
        case 'W':
            return Duration(magnitude, DurationUnit::Week);
        case 'M':
            return Duration(magnitude, DurationUnit::Month);
        case 'Y':
            return Duration(magnitude, DurationUnit::Year);
        default:
            throw InvalidDuration(durationString);
    }
}

long Duration::magnitude() const {
    return magnitude_;
}

DurationUnit Duration::unit() const {
    return unit_;
}

std::string Duration::toString() const {
    return std::to_string(magnitude_) + " " + unitCode(unit_);
}

bool Duration::operator==(const Duration &other) const {
    return magnitude_ == other.magnitude_ && unit_ == other.unit_;
}

bool Duration::operator!=(const Duration &other) const {
    return !(*this == other);
}

char duration::unitCode(DurationUnit unit) {
    switch (unit) {
        case DurationUnit::Second:
            return 'S';
        case DurationUnit::Day:
            return 'D';
        case DurationUnit::Week:
            return 'W';
        case DurationUnit::Month:
            return 'M';
        case DurationUnit::Year:
            return 'Y';
    }
    throw std::logic_error("Unknown duration unit.");
}
