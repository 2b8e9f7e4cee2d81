#pragma once

#include "ohlcv_series.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace tidemark::data {

// OHLCV data source for the indicator engine.
// Format: "Date,Open,High,Low,Close,Volume" with ISO dates, e.g.
// "2024-02-05,187.15,189.25,185.84,187.68,69668800"

class CsvLoadError : public std::runtime_error {
public:
    CsvLoadError(size_t line, const std::string& message)
        : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

    size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

struct LoadStats {
    size_t lines_read{0};
    size_t bars_loaded{0};
    size_t bars_dropped{0};   // missing or non-positive OHLCV
    bool header_detected{false};
};

struct LoadResult {
    OHLCVSeries series;
    LoadStats stats;
};

// Parse "YYYY-MM-DD"; std::nullopt when malformed or not a calendar date
std::optional<std::chrono::year_month_day> parse_date(const std::string& text);

/**
 * Parse one CSV row. Missing or empty numeric fields read as 0 so that the
 * positivity filter drops them. Throws CsvLoadError on unparseable fields.
 */
OHLCVBar parse_csv_row(const std::string& line, size_t line_number);

/**
 * Read a whole CSV stream.
 *
 * Rows with any non-positive field are dropped and counted. A first row
 * whose date column does not parse is treated as a header. Dates must be
 * strictly increasing.
 */
LoadResult parse_csv(std::istream& in);

LoadResult load_csv(const std::string& path);

} // namespace tidemark::data
