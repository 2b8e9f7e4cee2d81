#include "timeframe.hpp"
#include <algorithm>
#include <vector>

namespace tidemark::data {

const char* timeframe_name(Timeframe timeframe) noexcept {
    switch (timeframe) {
        case Timeframe::DAILY:  return "daily";
        case Timeframe::WEEKLY: return "weekly";
    }
    return "daily";
}

std::optional<Timeframe> parse_timeframe(std::string_view name) noexcept {
    if (name == "daily" || name == "1d") return Timeframe::DAILY;
    if (name == "weekly" || name == "1wk") return Timeframe::WEEKLY;
    return std::nullopt;
}

std::chrono::year_month_day week_start(const std::chrono::year_month_day& date) noexcept {
    using namespace std::chrono;
    const sys_days day{date};
    // Days elapsed since Monday: Monday = 0 ... Sunday = 6
    const auto since_monday = (weekday{day} - Monday).count();
    return year_month_day{day - days{since_monday}};
}

OHLCVSeries resample_weekly(const OHLCVSeries& daily) {
    std::vector<OHLCVBar> weekly;

    for (const auto& bar : daily) {
        const auto monday = week_start(bar.date);

        if (weekly.empty() || weekly.back().date != monday) {
            weekly.push_back(OHLCVBar{
                .date = monday,
                .open = bar.open,
                .high = bar.high,
                .low = bar.low,
                .close = bar.close,
                .volume = bar.volume
            });
            continue;
        }

        auto& week = weekly.back();
        week.high = std::max(week.high, bar.high);
        week.low = std::min(week.low, bar.low);
        week.close = bar.close;
        week.volume += bar.volume;
    }

    return OHLCVSeries(std::move(weekly));
}

} // namespace tidemark::data
