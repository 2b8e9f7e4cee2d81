#include "indicator_snapshot.hpp"
#include "technical_indicators.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tidemark::snapshot {

std::array<std::optional<double>, SNAPSHOT_FIELD_COUNT> SnapshotRow::values() const {
    return {
        price, reference_price, dma_short, dma_long,
        price_reference_change, price_dma_short_change, price_dma_long_change, dma_short_long_change,
        macd_line, macd_signal, macd_histogram,
        bollinger_upper, bollinger_middle, bollinger_lower,
        adx, plus_di, minus_di
    };
}

const std::array<const char*, SNAPSHOT_FIELD_COUNT>& SnapshotRow::field_names() {
    static const std::array<const char*, SNAPSHOT_FIELD_COUNT> names = {
        "price", "ten_day_price", "dma50", "dma200",
        "price_ten_day_change", "price_50dma_change", "price_200dma_change", "dma50_200dma_change",
        "macd_line", "macd_signal", "macd_histogram",
        "bb_upper", "bb_middle", "bb_lower",
        "adx", "plus_di", "minus_di"
    };
    return names;
}

SnapshotResult build_snapshot(const data::OHLCVSeries& series, const config::SnapshotConfig& config) {
    if (series.empty()) {
        return SnapshotResult::no_data("No data", config.timeframe);
    }

    const size_t n = series.size();
    const auto field = config.price_field;

    const auto dma_short = indicators::calculate_sma(series, std::min(config.short_ma, n), field);
    const auto dma_long = indicators::calculate_sma(series, std::min(config.long_ma, n), field);
    const auto macd = indicators::calculate_macd(
        series, field, config.macd_fast, config.macd_slow, config.macd_signal);
    const auto bands = indicators::calculate_bollinger_bands(
        series, field, config.bollinger_period, config.bollinger_multiplier);
    const auto adx = indicators::calculate_adx(series, config.adx_period, config.di_indexing);

    const size_t i = n - 1;
    const size_t i_ref = (i >= config.reference_offset) ? i - config.reference_offset : 0;

    SnapshotRow row;
    row.price = data::field_value(series[i], field);
    row.reference_price = data::field_value(series[i_ref], field);
    row.dma_short = dma_short[i];
    row.dma_long = dma_long[i];

    row.price_reference_change = indicators::percent_change(row.price, row.reference_price);
    row.price_dma_short_change = indicators::percent_change(row.price, row.dma_short);
    row.price_dma_long_change = indicators::percent_change(row.price, row.dma_long);
    row.dma_short_long_change = indicators::percent_change(row.dma_short, row.dma_long);

    row.macd_line = macd.macd_line[i];
    row.macd_signal = macd.signal_line[i];
    row.macd_histogram = macd.histogram[i];

    row.bollinger_upper = bands.upper[i];
    row.bollinger_middle = bands.middle[i];
    row.bollinger_lower = bands.lower[i];

    row.adx = adx.adx;
    row.plus_di = adx.plus_di;
    row.minus_di = adx.minus_di;

    return SnapshotResult::ok(row, config.timeframe);
}

double round2(double value) noexcept {
    return std::round(value * 100.0) / 100.0;
}

SnapshotRow rounded(const SnapshotRow& row) {
    const auto r = [](const std::optional<double>& v) -> std::optional<double> {
        if (!v) return std::nullopt;
        return round2(*v);
    };

    SnapshotRow out;
    out.price = r(row.price);
    out.reference_price = r(row.reference_price);
    out.dma_short = r(row.dma_short);
    out.dma_long = r(row.dma_long);
    out.price_reference_change = r(row.price_reference_change);
    out.price_dma_short_change = r(row.price_dma_short_change);
    out.price_dma_long_change = r(row.price_dma_long_change);
    out.dma_short_long_change = r(row.dma_short_long_change);
    out.macd_line = r(row.macd_line);
    out.macd_signal = r(row.macd_signal);
    out.macd_histogram = r(row.macd_histogram);
    out.bollinger_upper = r(row.bollinger_upper);
    out.bollinger_middle = r(row.bollinger_middle);
    out.bollinger_lower = r(row.bollinger_lower);
    out.adx = r(row.adx);
    out.plus_di = r(row.plus_di);
    out.minus_di = r(row.minus_di);
    return out;
}

std::string format_row(const SnapshotResult& result) {
    if (!result.has_data) {
        return "ERROR: " + result.error;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << '[';

    const auto values = rounded(result.row).values();
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ", ";
        if (values[i]) {
            // Avoid printing "-0.00"
            ss << (*values[i] == 0.0 ? 0.0 : *values[i]);
        } else {
            ss << "None";
        }
    }

    ss << ']';
    return ss.str();
}

std::string format_header() {
    std::string header;
    for (const char* name : SnapshotRow::field_names()) {
        if (!header.empty()) header += ',';
        header += name;
    }
    return header;
}

} // namespace tidemark::snapshot
