#pragma once

#include "ohlcv_series.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace tidemark::indicators {

using data::DerivedSeries;
using data::Field;
using data::OHLCVSeries;

// Technical indicator transforms. Every series result has the same length
// and index alignment as its input; std::nullopt marks "no value yet".

// Simple Moving Average
// Mean of the defined values in [i-lookback+1, i]; undefined before lookback-1.
DerivedSeries calculate_sma(const DerivedSeries& values, size_t lookback);
DerivedSeries calculate_sma(const OHLCVSeries& series, size_t lookback, Field field);

/**
 * Exponential Moving Average, k = 2 / (lookback + 1)
 *
 * Seeded at lookback-1 with the mean of the defined values in [0, lookback-1].
 * An undefined input after seeding emits an undefined output and leaves the
 * running EMA untouched, so the recurrence resumes from the last valid state.
 * If the seed window holds no defined value at all, seeding waits until
 * `lookback` defined values have been seen.
 */
DerivedSeries calculate_ema(const DerivedSeries& values, size_t lookback);
DerivedSeries calculate_ema(const OHLCVSeries& series, size_t lookback, Field field);

// MACD (Moving Average Convergence Divergence)
struct MACDResult {
    DerivedSeries macd_line;
    DerivedSeries signal_line;
    DerivedSeries histogram;
};

MACDResult calculate_macd(
    const DerivedSeries& values,
    size_t fast_period = 12,
    size_t slow_period = 26,
    size_t signal_period = 9
);

MACDResult calculate_macd(
    const OHLCVSeries& series,
    Field field,
    size_t fast_period = 12,
    size_t slow_period = 26,
    size_t signal_period = 9
);

// Bollinger Bands: SMA +/- multiplier * population standard deviation
struct BollingerBands {
    DerivedSeries upper;
    DerivedSeries middle;
    DerivedSeries lower;
};

BollingerBands calculate_bollinger_bands(
    const DerivedSeries& values,
    size_t period = 20,
    double std_dev_multiplier = 2.0
);

BollingerBands calculate_bollinger_bands(
    const OHLCVSeries& series,
    Field field,
    size_t period = 20,
    double std_dev_multiplier = 2.0
);

/**
 * Wilder's smoothing
 *
 * out[p-1] = mean(s[0..p-1]), out[i] = (out[i-1] * (p-1) + s[i]) / p.
 * Leading undefined samples are skipped: the seed is the mean of the first
 * p consecutive defined samples. After seeding, an undefined sample yields an
 * undefined output and the running value carries over unchanged.
 */
DerivedSeries wilder_smooth(const DerivedSeries& values, size_t period);

// True range and directional movement between adjacent bars (length n-1).
// Entry j describes the move from bar j to bar j+1.
struct DirectionalMovement {
    DerivedSeries true_range;
    DerivedSeries plus_dm;
    DerivedSeries minus_dm;
};

DirectionalMovement calculate_directional_movement(const OHLCVSeries& series);

// Every intermediate of the ADX pipeline, all of length n-1
struct ADXSeries {
    DerivedSeries smoothed_tr;
    DerivedSeries smoothed_plus_dm;
    DerivedSeries smoothed_minus_dm;
    DerivedSeries plus_di;
    DerivedSeries minus_di;
    DerivedSeries dx;
    DerivedSeries adx;
};

ADXSeries calculate_adx_series(const OHLCVSeries& series, size_t period = 14);

// Which index of the DI series is reported alongside the final ADX value
enum class DIIndexing {
    LEGACY_OFFSET,  // last index + period - 1, undefined when out of range
    LATEST          // last index, same as the ADX value
};

struct ADXSummary {
    std::optional<double> adx;
    std::optional<double> plus_di;
    std::optional<double> minus_di;
};

// Average Directional Index; all undefined when size < period + 1.
// With the default indexing +DI/-DI are only defined for period 1.
ADXSummary calculate_adx(
    const OHLCVSeries& series,
    size_t period = 14,
    DIIndexing indexing = DIIndexing::LEGACY_OFFSET
);

// (a - b) / b * 100, undefined when b is undefined or zero
std::optional<double> percent_change(std::optional<double> a, std::optional<double> b) noexcept;

} // namespace tidemark::indicators
