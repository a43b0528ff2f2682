#include "bar.h"

#include <stdexcept>
#include <utility>

using namespace bar;

namespace {
    struct CatalogEntry {
        const char *label;
        BarCategory category;
    };

    const std::vector<CatalogEntry> &catalogEntries() {
        static const std::vector<CatalogEntry> entries{
                {"1 secs",  BarCategory::SubMinute},
                {"5 secs",  BarCategory::SubMinute},
                {"10 secs", BarCategory::SubMinute},
                {"15 secs", BarCategory::SubMinute},
                {"30 secs", BarCategory::SubMinute},
                {"1 min",   BarCategory::Minute},
                {"2 mins",  BarCategory::Minute},
                {"3 mins",  BarCategory::Minute},
                {"5 mins",  BarCategory::Minute},
                {"10 mins", BarCategory::Minute},
                {"15 mins", BarCategory::Minute},
                {"20 mins", BarCategory::Minute},
                {"30 mins", BarCategory::Minute},
                {"1 hour",  BarCategory::Hour},
                {"2 hours", BarCategory::Hour},
                {"3 hours", BarCategory::Hour},
                {"4 hours", BarCategory::Hour},
                {"8 hours", BarCategory::Hour},
                {"1 day",   BarCategory::DayPlus},
                {"1 week",  BarCategory::DayPlus},
                {"1 month", BarCategory::DayPlus}
        };
        return entries;
    }
}

BarSize::BarSize(const std::string &label) :
        index_(validateBarSize(label)) {
}

BarSize::BarSize(const bar::BarSize &barSize) : index_(barSize.index_) {}

std::size_t BarSize::validateBarSize(const std::string &label) {
    const std::vector<CatalogEntry> &entries = catalogEntries();
    for (std::size_t i = 0; i != entries.size(); ++i) {
        if (label == entries[i].label) {
            return i;
        }
    }
    throw std::invalid_argument(
            "Unsupported bar size '" + label + "'."
    );
}

const std::string &BarSize::label() const {
    return catalog()[index_];
}

BarCategory BarSize::category() const {
    return catalogEntries()[index_].category;
}

bool BarSize::isIntraday() const {
    return category() != BarCategory::DayPlus;
}

bool BarSize::hasSubMinuteRisk() const {
    return category() == BarCategory::SubMinute;
}

std::string bar::operator+(const std::string &first, const BarSize &second) {
    return first + second.label();
}

bool BarSize::operator==(const BarSize &other) const {
    return index_ == other.index_;
}

bool BarSize::operator!=(const BarSize &other) const {
    return !(*this == other);
}

const std::vector<std::string> &BarSize::catalog() {
    static const std::vector<std::string> labels = [] {
        std::vector<std::string> result;
        for (const CatalogEntry &entry : catalogEntries()) {
            result.emplace_back(entry.label);
        }
        return result;
    }();
    return labels;
}

BarData::BarData(const bar::BarSize &barSize) : barSize_(barSize) {}

void BarData::addBar(Bar bar) {
    bars_.push_back(std::move(bar));
}

size_t BarData::size() const {
    return bars_.size();
}

bool BarData::empty() const {
    return bars_.empty();
}

const BarSize &BarData::barSize() const {
    return barSize_;
}

std::vector<Bar> &BarData::bars() {
    return bars_;
}

const std::vector<Bar> &BarData::bars() const {
    return bars_;
}
