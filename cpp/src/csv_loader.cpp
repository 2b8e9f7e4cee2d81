#include "csv_loader.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace tidemark::data {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

double parse_number(const std::string& text, const char* name, size_t line_number) {
    if (text.empty() || text == "null" || text == "NaN" || text == "nan") {
        return 0.0;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        throw CsvLoadError(line_number, std::string("invalid ") + name + " value '" + text + "'");
    }
    return value;
}

// A header row has neither a date nor any numeric column
bool is_header_row(const std::vector<std::string>& fields) {
    if (fields.empty() || parse_date(fields[0])) {
        return false;
    }
    for (size_t i = 1; i < fields.size(); ++i) {
        char* end = nullptr;
        std::strtod(fields[i].c_str(), &end);
        if (!fields[i].empty() && end == fields[i].c_str() + fields[i].size()) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<std::chrono::year_month_day> parse_date(const std::string& text) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char dash1 = 0;
    char dash2 = 0;

    std::istringstream ss(text);
    ss >> y >> dash1 >> m >> dash2 >> d;
    if (ss.fail() || dash1 != '-' || dash2 != '-' || !ss.eof()) {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{
        std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

OHLCVBar parse_csv_row(const std::string& line, size_t line_number) {
    const auto fields = split_fields(line);
    if (fields.empty()) {
        throw CsvLoadError(line_number, "empty row");
    }

    const auto date = parse_date(fields[0]);
    if (!date) {
        throw CsvLoadError(line_number, "invalid date '" + fields[0] + "'");
    }

    const auto field_or_empty = [&fields](size_t idx) -> std::string {
        return idx < fields.size() ? fields[idx] : std::string{};
    };

    OHLCVBar bar{};
    bar.date = *date;
    bar.open = parse_number(field_or_empty(1), "open", line_number);
    bar.high = parse_number(field_or_empty(2), "high", line_number);
    bar.low = parse_number(field_or_empty(3), "low", line_number);
    bar.close = parse_number(field_or_empty(4), "close", line_number);
    bar.volume = parse_number(field_or_empty(5), "volume", line_number);
    return bar;
}

LoadResult parse_csv(std::istream& in) {
    LoadStats stats;
    std::vector<OHLCVBar> bars;

    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        ++stats.lines_read;

        // Header auto-detection on the first non-blank row
        if (stats.lines_read == 1) {
            if (is_header_row(split_fields(line))) {
                stats.header_detected = true;
                spdlog::debug("CSV header detected: {}", line);
                continue;
            }
        }

        const auto bar = parse_csv_row(line, line_number);

        // Trading-day filter: skip rows with any missing or non-positive OHLCV
        if (!is_valid_bar(bar)) {
            ++stats.bars_dropped;
            spdlog::debug("Dropping line {} ({}): non-positive OHLCV", line_number, format_date(bar.date));
            continue;
        }

        if (!bars.empty() &&
            std::chrono::sys_days{bar.date} <= std::chrono::sys_days{bars.back().date}) {
            throw CsvLoadError(line_number, "date " + format_date(bar.date) +
                               " is not after " + format_date(bars.back().date));
        }

        bars.push_back(bar);
    }

    stats.bars_loaded = bars.size();
    if (stats.bars_dropped > 0) {
        spdlog::warn("Dropped {} of {} rows with missing or non-positive OHLCV",
                     stats.bars_dropped, stats.bars_dropped + stats.bars_loaded);
    }

    return LoadResult{OHLCVSeries(std::move(bars)), stats};
}

LoadResult load_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open " + path);
    }

    auto result = parse_csv(file);
    spdlog::info("Loaded {} bars from {}", result.stats.bars_loaded, path);
    return result;
}

} // namespace tidemark::data
