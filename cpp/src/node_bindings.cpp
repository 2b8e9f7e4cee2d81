#define NAPI_VERSION 8
#include <node_api.h>

#include "config.hpp"
#include "csv_loader.hpp"
#include "indicator_snapshot.hpp"
#include "technical_indicators.hpp"
#include "timeframe.hpp"

#include <string>
#include <vector>

/**
 * Node.js N-API Bindings for the Tidemark indicator engine
 *
 * computeSnapshot(bars, options?) mirrors the spreadsheet-style output of the
 * report: one row of 17 rounded numbers (null when undefined) wrapped in an
 * outer array, or [["ERROR: No data"]].
 */

namespace tidemark::bindings {

// Helper macros for N-API error handling
#define NAPI_CALL(env, call)                                      \
  do {                                                            \
    napi_status status = (call);                                  \
    if (status != napi_ok) {                                      \
      napi_throw_error(env, nullptr, "N-API call failed");        \
      return nullptr;                                             \
    }                                                             \
  } while(0)

#define NAPI_ASSERT(env, condition, message)                      \
  do {                                                            \
    if (!(condition)) {                                           \
      napi_throw_error(env, nullptr, message);                    \
      return nullptr;                                             \
    }                                                             \
  } while(0)

// Helper to get string from napi_value
bool get_string(napi_env env, napi_value value, std::string& out) {
    size_t len;
    if (napi_get_value_string_utf8(env, value, nullptr, 0, &len) != napi_ok) {
        return false;
    }
    out.assign(len, '\0');
    return napi_get_value_string_utf8(env, value, &out[0], len + 1, &len) == napi_ok;
}

bool is_nullish(napi_env env, napi_value value) {
    napi_valuetype type;
    if (napi_typeof(env, value, &type) != napi_ok) {
        return true;
    }
    return type == napi_null || type == napi_undefined;
}

napi_value make_optional_double(napi_env env, const std::optional<double>& value) {
    napi_value result;
    if (value) {
        napi_create_double(env, *value, &result);
    } else {
        napi_get_null(env, &result);
    }
    return result;
}

napi_value make_series_array(napi_env env, const data::DerivedSeries& series) {
    napi_value array;
    napi_create_array_with_length(env, series.size(), &array);
    for (size_t i = 0; i < series.size(); i++) {
        napi_set_element(env, array, static_cast<uint32_t>(i), make_optional_double(env, series[i]));
    }
    return array;
}

// JS number[] (null/undefined entries allowed) -> DerivedSeries
bool read_series(napi_env env, napi_value array, data::DerivedSeries& out) {
    bool is_array = false;
    if (napi_is_array(env, array, &is_array) != napi_ok || !is_array) {
        return false;
    }

    uint32_t length;
    napi_get_array_length(env, array, &length);
    out.assign(length, std::nullopt);

    for (uint32_t i = 0; i < length; i++) {
        napi_value element;
        napi_get_element(env, array, i, &element);
        if (is_nullish(env, element)) {
            continue;
        }
        double value;
        if (napi_get_value_double(env, element, &value) != napi_ok) {
            return false;
        }
        out[i] = value;
    }
    return true;
}

// Optional positive integer property; leaves `out` untouched when absent
bool read_period_property(napi_env env, napi_value obj, const char* name, size_t& out) {
    bool has = false;
    napi_has_named_property(env, obj, name, &has);
    if (!has) {
        return true;
    }
    napi_value value;
    napi_get_named_property(env, obj, name, &value);
    if (is_nullish(env, value)) {
        return true;
    }
    int64_t period;
    if (napi_get_value_int64(env, value, &period) != napi_ok || period <= 0) {
        return false;
    }
    out = static_cast<size_t>(period);
    return true;
}

bool read_options(napi_env env, napi_value obj, config::SnapshotConfig& cfg) {
    if (!read_period_property(env, obj, "shortMa", cfg.short_ma) ||
        !read_period_property(env, obj, "longMa", cfg.long_ma) ||
        !read_period_property(env, obj, "macdFast", cfg.macd_fast) ||
        !read_period_property(env, obj, "macdSlow", cfg.macd_slow) ||
        !read_period_property(env, obj, "macdSignal", cfg.macd_signal) ||
        !read_period_property(env, obj, "bollingerPeriod", cfg.bollinger_period) ||
        !read_period_property(env, obj, "adxPeriod", cfg.adx_period)) {
        return false;
    }

    napi_value temp;
    bool has = false;

    napi_has_named_property(env, obj, "referenceOffset", &has);
    if (has) {
        napi_get_named_property(env, obj, "referenceOffset", &temp);
        int64_t offset;
        if (napi_get_value_int64(env, temp, &offset) != napi_ok || offset < 0) {
            return false;
        }
        cfg.reference_offset = static_cast<size_t>(offset);
    }

    napi_has_named_property(env, obj, "bollingerMultiplier", &has);
    if (has) {
        napi_get_named_property(env, obj, "bollingerMultiplier", &temp);
        if (napi_get_value_double(env, temp, &cfg.bollinger_multiplier) != napi_ok) {
            return false;
        }
    }

    napi_has_named_property(env, obj, "weekly", &has);
    if (has) {
        napi_get_named_property(env, obj, "weekly", &temp);
        bool weekly = false;
        if (napi_get_value_bool(env, temp, &weekly) != napi_ok) {
            return false;
        }
        cfg.timeframe = weekly ? data::Timeframe::WEEKLY : data::Timeframe::DAILY;
    }

    napi_has_named_property(env, obj, "latestDi", &has);
    if (has) {
        napi_get_named_property(env, obj, "latestDi", &temp);
        bool latest = false;
        if (napi_get_value_bool(env, temp, &latest) != napi_ok) {
            return false;
        }
        cfg.di_indexing = latest ? indicators::DIIndexing::LATEST : indicators::DIIndexing::LEGACY_OFFSET;
    }

    return true;
}

//=============================================================================
// SNAPSHOT BINDING
//=============================================================================

/**
 * computeSnapshot(bars: [date, open, high, low, close, volume][], options?)
 * Returns: [[price, tenDayPrice, dma50, ..., minusDI]] or [["ERROR: No data"]]
 */
napi_value ComputeSnapshot(napi_env env, napi_callback_info info) {
    size_t argc = 2;
    napi_value args[2];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 1, "Expected at least 1 argument: bars");

    bool is_array = false;
    NAPI_CALL(env, napi_is_array(env, args[0], &is_array));
    NAPI_ASSERT(env, is_array, "bars must be an array");

    config::SnapshotConfig cfg;
    if (argc >= 2 && !is_nullish(env, args[1])) {
        NAPI_ASSERT(env, read_options(env, args[1], cfg), "Invalid options: periods must be positive integers");
    }
    try {
        config::validate(cfg);
    } catch (const config::ConfigError& e) {
        napi_throw_range_error(env, nullptr, e.what());
        return nullptr;
    }

    uint32_t length;
    NAPI_CALL(env, napi_get_array_length(env, args[0], &length));

    std::vector<data::OHLCVBar> bars;
    bars.reserve(length);

    for (uint32_t i = 0; i < length; i++) {
        napi_value row;
        NAPI_CALL(env, napi_get_element(env, args[0], i, &row));

        napi_value date_value;
        NAPI_CALL(env, napi_get_element(env, row, 0, &date_value));

        std::string date_text;
        NAPI_ASSERT(env, get_string(env, date_value, date_text), "Bar date must be a YYYY-MM-DD string");
        const auto date = data::parse_date(date_text);
        NAPI_ASSERT(env, date.has_value(), "Bar date must be a YYYY-MM-DD string");

        data::OHLCVBar bar{};
        bar.date = *date;
        double* fields[] = {&bar.open, &bar.high, &bar.low, &bar.close, &bar.volume};
        for (uint32_t f = 0; f < 5; f++) {
            napi_value cell;
            NAPI_CALL(env, napi_get_element(env, row, f + 1, &cell));
            double value = 0.0;
            if (!is_nullish(env, cell)) {
                NAPI_ASSERT(env, napi_get_value_double(env, cell, &value) == napi_ok,
                            "Bar OHLCV fields must be numbers");
            }
            *fields[f] = value;
        }

        // Same trading-day rule as the CSV source
        if (data::is_valid_bar(bar)) {
            bars.push_back(bar);
        }
    }

    NAPI_ASSERT(env, data::is_chronological(bars), "Bars must be in strictly increasing date order");

    data::OHLCVSeries series(std::move(bars));
    if (cfg.timeframe == data::Timeframe::WEEKLY) {
        series = data::resample_weekly(series);
    }

    const auto result = snapshot::build_snapshot(series, cfg);

    napi_value row;
    napi_value outer;
    NAPI_CALL(env, napi_create_array_with_length(env, 1, &outer));

    if (!result.has_data) {
        NAPI_CALL(env, napi_create_array_with_length(env, 1, &row));
        const std::string message = "ERROR: " + result.error;
        napi_value text;
        NAPI_CALL(env, napi_create_string_utf8(env, message.c_str(), message.length(), &text));
        NAPI_CALL(env, napi_set_element(env, row, 0, text));
    } else {
        const auto values = snapshot::rounded(result.row).values();
        NAPI_CALL(env, napi_create_array_with_length(env, values.size(), &row));
        for (size_t i = 0; i < values.size(); i++) {
            NAPI_CALL(env, napi_set_element(env, row, static_cast<uint32_t>(i),
                                            make_optional_double(env, values[i])));
        }
    }

    NAPI_CALL(env, napi_set_element(env, outer, 0, row));
    return outer;
}

//=============================================================================
// SERIES BINDINGS
//=============================================================================

/**
 * movingAverage(values: (number|null)[], lookback: number): (number|null)[]
 */
napi_value MovingAverage(napi_env env, napi_callback_info info) {
    size_t argc = 2;
    napi_value args[2];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 2, "Expected 2 arguments: values, lookback");

    data::DerivedSeries values;
    NAPI_ASSERT(env, read_series(env, args[0], values), "values must be an array of numbers");

    int64_t lookback;
    NAPI_CALL(env, napi_get_value_int64(env, args[1], &lookback));
    NAPI_ASSERT(env, lookback > 0, "lookback must be positive");

    return make_series_array(env, indicators::calculate_sma(values, static_cast<size_t>(lookback)));
}

/**
 * ema(values: (number|null)[], lookback: number): (number|null)[]
 */
napi_value Ema(napi_env env, napi_callback_info info) {
    size_t argc = 2;
    napi_value args[2];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 2, "Expected 2 arguments: values, lookback");

    data::DerivedSeries values;
    NAPI_ASSERT(env, read_series(env, args[0], values), "values must be an array of numbers");

    int64_t lookback;
    NAPI_CALL(env, napi_get_value_int64(env, args[1], &lookback));
    NAPI_ASSERT(env, lookback > 0, "lookback must be positive");

    return make_series_array(env, indicators::calculate_ema(values, static_cast<size_t>(lookback)));
}

/**
 * macd(values: (number|null)[]): { line, signal, histogram }
 */
napi_value Macd(napi_env env, napi_callback_info info) {
    size_t argc = 1;
    napi_value args[1];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 1, "Expected 1 argument: values");

    data::DerivedSeries values;
    NAPI_ASSERT(env, read_series(env, args[0], values), "values must be an array of numbers");

    const auto macd = indicators::calculate_macd(values);

    napi_value result;
    NAPI_CALL(env, napi_create_object(env, &result));
    NAPI_CALL(env, napi_set_named_property(env, result, "line", make_series_array(env, macd.macd_line)));
    NAPI_CALL(env, napi_set_named_property(env, result, "signal", make_series_array(env, macd.signal_line)));
    NAPI_CALL(env, napi_set_named_property(env, result, "histogram", make_series_array(env, macd.histogram)));
    return result;
}

/**
 * bollinger(values: (number|null)[], period = 20, multiplier = 2): { upper, middle, lower }
 */
napi_value Bollinger(napi_env env, napi_callback_info info) {
    size_t argc = 3;
    napi_value args[3];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 1, "Expected at least 1 argument: values");

    data::DerivedSeries values;
    NAPI_ASSERT(env, read_series(env, args[0], values), "values must be an array of numbers");

    int64_t period = 20;
    double multiplier = 2.0;
    if (argc >= 2 && !is_nullish(env, args[1])) {
        NAPI_CALL(env, napi_get_value_int64(env, args[1], &period));
    }
    if (argc >= 3 && !is_nullish(env, args[2])) {
        NAPI_CALL(env, napi_get_value_double(env, args[2], &multiplier));
    }
    NAPI_ASSERT(env, period > 0, "period must be positive");

    const auto bands = indicators::calculate_bollinger_bands(values, static_cast<size_t>(period), multiplier);

    napi_value result;
    NAPI_CALL(env, napi_create_object(env, &result));
    NAPI_CALL(env, napi_set_named_property(env, result, "upper", make_series_array(env, bands.upper)));
    NAPI_CALL(env, napi_set_named_property(env, result, "middle", make_series_array(env, bands.middle)));
    NAPI_CALL(env, napi_set_named_property(env, result, "lower", make_series_array(env, bands.lower)));
    return result;
}

//=============================================================================
// MODULE INITIALIZATION
//=============================================================================

napi_value Init(napi_env env, napi_value exports) {
    napi_value fn;

    napi_create_function(env, nullptr, 0, ComputeSnapshot, nullptr, &fn);
    napi_set_named_property(env, exports, "computeSnapshot", fn);

    napi_create_function(env, nullptr, 0, MovingAverage, nullptr, &fn);
    napi_set_named_property(env, exports, "movingAverage", fn);

    napi_create_function(env, nullptr, 0, Ema, nullptr, &fn);
    napi_set_named_property(env, exports, "ema", fn);

    napi_create_function(env, nullptr, 0, Macd, nullptr, &fn);
    napi_set_named_property(env, exports, "macd", fn);

    napi_create_function(env, nullptr, 0, Bollinger, nullptr, &fn);
    napi_set_named_property(env, exports, "bollinger", fn);

    return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)

} // namespace tidemark::bindings
