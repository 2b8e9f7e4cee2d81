#pragma once

/**
 * Indicator Snapshot
 *
 * Reduces a full OHLCV series to one reporting row: the latest price, a
 * reference price `reference_offset` bars back, DMA50/DMA200, four
 * percentage changes, MACD, Bollinger Bands and the ADX summary.
 *
 * Values keep full precision; rounding to two decimals happens only in the
 * presentation helpers at the bottom of this header.
 */

#include "config.hpp"
#include "ohlcv_series.hpp"

#include <array>
#include <optional>
#include <string>

namespace tidemark::snapshot {

constexpr size_t SNAPSHOT_FIELD_COUNT = 17;

struct SnapshotRow {
    std::optional<double> price;
    std::optional<double> reference_price;
    std::optional<double> dma_short;
    std::optional<double> dma_long;

    std::optional<double> price_reference_change;
    std::optional<double> price_dma_short_change;
    std::optional<double> price_dma_long_change;
    std::optional<double> dma_short_long_change;

    std::optional<double> macd_line;
    std::optional<double> macd_signal;
    std::optional<double> macd_histogram;

    std::optional<double> bollinger_upper;
    std::optional<double> bollinger_middle;
    std::optional<double> bollinger_lower;

    std::optional<double> adx;
    std::optional<double> plus_di;
    std::optional<double> minus_di;

    // Fields in report order
    std::array<std::optional<double>, SNAPSHOT_FIELD_COUNT> values() const;

    static const std::array<const char*, SNAPSHOT_FIELD_COUNT>& field_names();
};

/**
 * Either a snapshot row or the distinct "no data" outcome
 */
struct SnapshotResult {
    bool has_data{false};
    SnapshotRow row{};
    std::string error;
    data::Timeframe timeframe{data::Timeframe::DAILY};

    static SnapshotResult ok(const SnapshotRow& row, data::Timeframe timeframe) {
        return SnapshotResult{true, row, {}, timeframe};
    }

    static SnapshotResult no_data(std::string reason, data::Timeframe timeframe) {
        return SnapshotResult{false, {}, std::move(reason), timeframe};
    }
};

/**
 * Build the snapshot for the newest bar of `series`.
 *
 * The series must already be in the timeframe named by config.timeframe
 * (see resample_weekly). Moving-average lookbacks are capped at the series
 * length. An empty series yields SnapshotResult::no_data.
 */
SnapshotResult build_snapshot(
    const data::OHLCVSeries& series,
    const config::SnapshotConfig& config = {}
);

// =============================================================================
// PRESENTATION
// =============================================================================

// Two decimals, half away from zero
double round2(double value) noexcept;

SnapshotRow rounded(const SnapshotRow& row);

// "[189.84, 185.2, ..., None]" or "ERROR: <reason>"
std::string format_row(const SnapshotResult& result);

std::string format_header();

} // namespace tidemark::snapshot
