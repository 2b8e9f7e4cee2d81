#pragma once

#include "ohlcv_series.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace tidemark::data {

enum class Timeframe {
    DAILY,
    WEEKLY
};

const char* timeframe_name(Timeframe timeframe) noexcept;
std::optional<Timeframe> parse_timeframe(std::string_view name) noexcept;

// Monday of the ISO week containing `date`
std::chrono::year_month_day week_start(const std::chrono::year_month_day& date) noexcept;

/**
 * Resample daily bars into weekly bars (Monday-anchored weeks).
 *
 * open = first open, high = max high, low = min low, close = last close,
 * volume = sum. Each weekly bar is dated with the Monday of its week.
 */
OHLCVSeries resample_weekly(const OHLCVSeries& daily);

} // namespace tidemark::data
