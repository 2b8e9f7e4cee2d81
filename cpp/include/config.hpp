#pragma once

/**
 * Snapshot configuration
 *
 * Defaults reproduce the standard report: DMA50/DMA200, a 10-bar reference
 * price, MACD(12, 26, 9), Bollinger(20, 2.0) and ADX(14) on the close.
 * Overrides can be read from a YAML file:
 *
 *   moving_averages:
 *     short: 50
 *     long: 200
 *   reference_offset: 10
 *   macd: { fast: 12, slow: 26, signal: 9 }
 *   bollinger: { period: 20, multiplier: 2.0 }
 *   adx: { period: 14, di_indexing: legacy_offset }   # or latest
 *   price_field: close
 *   timeframe: daily                           # or weekly
 */

#include "ohlcv_series.hpp"
#include "technical_indicators.hpp"
#include "timeframe.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tidemark::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SnapshotConfig {
    size_t short_ma{50};
    size_t long_ma{200};
    size_t reference_offset{10};

    size_t macd_fast{12};
    size_t macd_slow{26};
    size_t macd_signal{9};

    size_t bollinger_period{20};
    double bollinger_multiplier{2.0};

    size_t adx_period{14};
    indicators::DIIndexing di_indexing{indicators::DIIndexing::LEGACY_OFFSET};

    data::Field price_field{data::Field::CLOSE};
    data::Timeframe timeframe{data::Timeframe::DAILY};
};

// Throws ConfigError on the first inconsistent setting
void validate(const SnapshotConfig& config);

// Parse YAML text on top of the defaults; unknown keys are ignored
SnapshotConfig parse_config(const std::string& yaml_text);

SnapshotConfig load_config(const std::string& path);

} // namespace tidemark::config
