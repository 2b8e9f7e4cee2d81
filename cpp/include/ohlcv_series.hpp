#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tidemark::data {

// =============================================================================
// OHLCV BAR + SERIES
// Shared read-only input of every indicator. Index 0 is the oldest bar.
// =============================================================================

struct OHLCVBar {
    std::chrono::year_month_day date;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

enum class Field {
    OPEN,
    HIGH,
    LOW,
    CLOSE,
    VOLUME
};

/**
 * Index-aligned series of optional reals.
 * std::nullopt marks an index with no value yet (insufficient history or an
 * undefined intermediate).
 */
using DerivedSeries = std::vector<std::optional<double>>;

inline double field_value(const OHLCVBar& bar, Field field) noexcept {
    switch (field) {
        case Field::OPEN:   return bar.open;
        case Field::HIGH:   return bar.high;
        case Field::LOW:    return bar.low;
        case Field::CLOSE:  return bar.close;
        case Field::VOLUME: return bar.volume;
    }
    return bar.close;
}

const char* field_name(Field field) noexcept;

// All five numeric fields strictly positive
bool is_valid_bar(const OHLCVBar& bar) noexcept;

// Dates strictly increasing
bool is_chronological(const std::vector<OHLCVBar>& bars) noexcept;

std::string format_date(const std::chrono::year_month_day& date);

/**
 * Immutable chronologically-ordered OHLCV series.
 *
 * Built once from data that already satisfies the input contract (positive
 * fields, increasing dates). No validation happens here: the data source is
 * responsible for that (see csv_loader.hpp).
 */
class OHLCVSeries {
public:
    OHLCVSeries() = default;
    explicit OHLCVSeries(std::vector<OHLCVBar> bars) : bars_(std::move(bars)) {}

    [[nodiscard]] size_t size() const noexcept { return bars_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bars_.empty(); }

    const OHLCVBar& operator[](size_t i) const noexcept { return bars_[i]; }
    const OHLCVBar& front() const noexcept { return bars_.front(); }
    const OHLCVBar& back() const noexcept { return bars_.back(); }

    const std::vector<OHLCVBar>& bars() const noexcept { return bars_; }

    auto begin() const noexcept { return bars_.begin(); }
    auto end() const noexcept { return bars_.end(); }

    // One field as a fully-defined derived series
    DerivedSeries column(Field field) const;

private:
    std::vector<OHLCVBar> bars_;
};

} // namespace tidemark::data
