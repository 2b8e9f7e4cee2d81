#include "technical_indicators.hpp"
#include <algorithm>
#include <cmath>

namespace tidemark::indicators {

DerivedSeries calculate_sma(const DerivedSeries& values, size_t lookback) {
    DerivedSeries sma(values.size());

    if (lookback == 0 || values.size() < lookback) {
        return sma;
    }

    // Each window is summed afresh over its defined entries
    for (size_t i = lookback - 1; i < values.size(); ++i) {
        double sum = 0.0;
        size_t count = 0;
        for (size_t j = i + 1 - lookback; j <= i; ++j) {
            if (values[j]) {
                sum += *values[j];
                ++count;
            }
        }
        if (count > 0) {
            sma[i] = sum / static_cast<double>(count);
        }
    }

    return sma;
}

DerivedSeries calculate_sma(const OHLCVSeries& series, size_t lookback, Field field) {
    return calculate_sma(series.column(field), lookback);
}

DerivedSeries calculate_ema(const DerivedSeries& values, size_t lookback) {
    DerivedSeries ema(values.size());

    if (lookback == 0) {
        return ema;
    }

    const double k = 2.0 / (static_cast<double>(lookback) + 1.0);

    std::optional<double> prev_ema;
    double seed_sum = 0.0;
    size_t seed_count = 0;

    for (size_t i = 0; i < values.size(); ++i) {
        const auto& current = values[i];

        if (!prev_ema) {
            if (current) {
                seed_sum += *current;
                ++seed_count;
            }
            if (i + 1 < lookback) {
                continue;
            }
            // Regular seed at lookback-1, deferred seed once enough values arrived
            const bool seed_now = (i + 1 == lookback) ? seed_count > 0 : seed_count >= lookback;
            if (seed_now) {
                prev_ema = seed_sum / static_cast<double>(seed_count);
                ema[i] = prev_ema;
            }
            continue;
        }

        if (current) {
            prev_ema = *current * k + *prev_ema * (1.0 - k);
            ema[i] = prev_ema;
        }
    }

    return ema;
}

DerivedSeries calculate_ema(const OHLCVSeries& series, size_t lookback, Field field) {
    return calculate_ema(series.column(field), lookback);
}

MACDResult calculate_macd(
    const DerivedSeries& values,
    size_t fast_period,
    size_t slow_period,
    size_t signal_period
) {
    MACDResult result;

    const auto ema_fast = calculate_ema(values, fast_period);
    const auto ema_slow = calculate_ema(values, slow_period);

    result.macd_line.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (ema_fast[i] && ema_slow[i]) {
            result.macd_line[i] = *ema_fast[i] - *ema_slow[i];
        }
    }

    // Signal line re-enters the EMA as a single-field series
    result.signal_line = calculate_ema(result.macd_line, signal_period);

    result.histogram.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (result.macd_line[i] && result.signal_line[i]) {
            result.histogram[i] = *result.macd_line[i] - *result.signal_line[i];
        }
    }

    return result;
}

MACDResult calculate_macd(
    const OHLCVSeries& series,
    Field field,
    size_t fast_period,
    size_t slow_period,
    size_t signal_period
) {
    return calculate_macd(series.column(field), fast_period, slow_period, signal_period);
}

BollingerBands calculate_bollinger_bands(
    const DerivedSeries& values,
    size_t period,
    double std_dev_multiplier
) {
    BollingerBands bands;
    bands.upper.resize(values.size());
    bands.middle.resize(values.size());
    bands.lower.resize(values.size());

    if (period == 0 || values.size() < period) {
        return bands;
    }

    std::vector<double> window;
    window.reserve(period);

    for (size_t i = period - 1; i < values.size(); ++i) {
        window.clear();
        for (size_t j = i + 1 - period; j <= i; ++j) {
            if (values[j]) {
                window.push_back(*values[j]);
            }
        }
        if (window.empty()) {
            continue;
        }

        double sum = 0.0;
        for (double v : window) {
            sum += v;
        }
        const double mean = sum / static_cast<double>(window.size());

        double sum_sq = 0.0;
        for (double v : window) {
            const double diff = v - mean;
            sum_sq += diff * diff;
        }

        // Population standard deviation (divisor = window size)
        const double std_dev = std::sqrt(sum_sq / static_cast<double>(window.size()));
        bands.middle[i] = mean;
        bands.upper[i] = mean + std_dev_multiplier * std_dev;
        bands.lower[i] = mean - std_dev_multiplier * std_dev;
    }

    return bands;
}

BollingerBands calculate_bollinger_bands(
    const OHLCVSeries& series,
    Field field,
    size_t period,
    double std_dev_multiplier
) {
    return calculate_bollinger_bands(series.column(field), period, std_dev_multiplier);
}

DerivedSeries wilder_smooth(const DerivedSeries& values, size_t period) {
    DerivedSeries smoothed(values.size());

    if (period == 0) {
        return smoothed;
    }

    const double p = static_cast<double>(period);
    std::optional<double> prev;
    double seed_sum = 0.0;
    size_t run = 0;

    for (size_t i = 0; i < values.size(); ++i) {
        const auto& sample = values[i];

        if (!prev) {
            if (!sample) {
                seed_sum = 0.0;
                run = 0;
                continue;
            }
            seed_sum += *sample;
            if (++run == period) {
                prev = seed_sum / p;
                smoothed[i] = prev;
            }
            continue;
        }

        if (sample) {
            prev = (*prev * (p - 1.0) + *sample) / p;
            smoothed[i] = prev;
        }
    }

    return smoothed;
}

DirectionalMovement calculate_directional_movement(const OHLCVSeries& series) {
    DirectionalMovement dm;

    if (series.size() < 2) {
        return dm;
    }

    const size_t m = series.size() - 1;
    dm.true_range.reserve(m);
    dm.plus_dm.reserve(m);
    dm.minus_dm.reserve(m);

    for (size_t i = 1; i < series.size(); ++i) {
        const auto& prev = series[i - 1];
        const auto& cur = series[i];

        const double high_diff = cur.high - prev.high;
        const double low_diff = prev.low - cur.low;

        dm.plus_dm.emplace_back(high_diff > low_diff ? std::max(high_diff, 0.0) : 0.0);
        dm.minus_dm.emplace_back(low_diff > high_diff ? std::max(low_diff, 0.0) : 0.0);

        const double hl = cur.high - cur.low;
        const double hc = std::abs(cur.high - prev.close);
        const double lc = std::abs(cur.low - prev.close);
        dm.true_range.emplace_back(std::max({hl, hc, lc}));
    }

    return dm;
}

ADXSeries calculate_adx_series(const OHLCVSeries& series, size_t period) {
    ADXSeries result;

    const auto dm = calculate_directional_movement(series);
    result.smoothed_tr = wilder_smooth(dm.true_range, period);
    result.smoothed_plus_dm = wilder_smooth(dm.plus_dm, period);
    result.smoothed_minus_dm = wilder_smooth(dm.minus_dm, period);

    const size_t m = result.smoothed_tr.size();
    result.plus_di.resize(m);
    result.minus_di.resize(m);
    result.dx.resize(m);

    for (size_t i = 0; i < m; ++i) {
        const auto& tr = result.smoothed_tr[i];
        const auto& pdm = result.smoothed_plus_dm[i];
        const auto& mdm = result.smoothed_minus_dm[i];
        if (!tr || *tr == 0.0 || !pdm || !mdm) {
            continue;
        }

        const double plus_di = *pdm / *tr * 100.0;
        const double minus_di = *mdm / *tr * 100.0;
        const double sum_di = plus_di + minus_di;

        result.plus_di[i] = plus_di;
        result.minus_di[i] = minus_di;
        result.dx[i] = (sum_di != 0.0) ? std::abs(plus_di - minus_di) / sum_di * 100.0 : 0.0;
    }

    result.adx = wilder_smooth(result.dx, period);
    return result;
}

ADXSummary calculate_adx(const OHLCVSeries& series, size_t period, DIIndexing indexing) {
    ADXSummary summary;

    if (period == 0 || series.size() < period + 1) {
        return summary;
    }

    const auto adx = calculate_adx_series(series, period);
    const size_t last_idx = adx.adx.size() - 1;

    summary.adx = adx.adx[last_idx];

    const size_t di_idx = (indexing == DIIndexing::LEGACY_OFFSET) ? last_idx + period - 1 : last_idx;
    if (di_idx < adx.plus_di.size()) {
        summary.plus_di = adx.plus_di[di_idx];
        summary.minus_di = adx.minus_di[di_idx];
    }

    return summary;
}

std::optional<double> percent_change(std::optional<double> a, std::optional<double> b) noexcept {
    if (!a || !b || *b == 0.0) {
        return std::nullopt;
    }
    return (*a - *b) / *b * 100.0;
}

} // namespace tidemark::indicators
