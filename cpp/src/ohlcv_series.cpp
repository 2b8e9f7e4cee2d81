#include "ohlcv_series.hpp"
#include <cstdio>

namespace tidemark::data {

const char* field_name(Field field) noexcept {
    switch (field) {
        case Field::OPEN:   return "open";
        case Field::HIGH:   return "high";
        case Field::LOW:    return "low";
        case Field::CLOSE:  return "close";
        case Field::VOLUME: return "volume";
    }
    return "unknown";
}

bool is_valid_bar(const OHLCVBar& bar) noexcept {
    return bar.date.ok() &&
           bar.open > 0.0 && bar.high > 0.0 && bar.low > 0.0 &&
           bar.close > 0.0 && bar.volume > 0.0;
}

bool is_chronological(const std::vector<OHLCVBar>& bars) noexcept {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (std::chrono::sys_days{bars[i].date} <= std::chrono::sys_days{bars[i - 1].date}) {
            return false;
        }
    }
    return true;
}

std::string format_date(const std::chrono::year_month_day& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

DerivedSeries OHLCVSeries::column(Field field) const {
    DerivedSeries values;
    values.reserve(bars_.size());
    for (const auto& bar : bars_) {
        values.emplace_back(field_value(bar, field));
    }
    return values;
}

} // namespace tidemark::data
