#include "../include/technical_indicators.hpp"
#include "../include/indicator_snapshot.hpp"
#include "../include/timeframe.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <numeric>
#include <algorithm>
#include <cmath>
#include <random>
#include <functional>

using namespace tidemark;

// Benchmark utilities
struct BenchmarkStats {
    double mean_ns;
    double min_ns;
    double max_ns;
    double p50_ns;
    double p99_ns;
    int num_samples;
};

BenchmarkStats compute_stats(std::vector<int64_t>& times) {
    std::sort(times.begin(), times.end());

    const int n = static_cast<int>(times.size());
    const double sum = std::accumulate(times.begin(), times.end(), 0.0);

    return BenchmarkStats{
        sum / n,
        static_cast<double>(times.front()),
        static_cast<double>(times.back()),
        static_cast<double>(times[n / 2]),
        static_cast<double>(times[static_cast<int>(n * 0.99)]),
        n
    };
}

void print_stats(const std::string& name, const BenchmarkStats& stats, size_t bars) {
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  " << std::left << std::setw(24) << name << " | "
              << std::setw(10) << stats.mean_ns / 1000.0 << " us (mean) | "
              << std::setw(10) << stats.p50_ns / 1000.0 << " us (p50) | "
              << std::setw(10) << stats.p99_ns / 1000.0 << " us (p99) | "
              << std::setw(8) << (stats.mean_ns / bars) << " ns/bar\n";
}

// Geometric random walk of daily bars, weekdays only
data::OHLCVSeries make_random_walk(size_t num_bars, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> ret(0.0005, 0.015);
    std::uniform_real_distribution<double> wick(0.0, 0.01);

    std::vector<data::OHLCVBar> bars;
    bars.reserve(num_bars);

    std::chrono::sys_days day = std::chrono::sys_days{std::chrono::year{2000} / 1 / 3};
    double close = 100.0;

    while (bars.size() < num_bars) {
        const std::chrono::weekday wd{day};
        if (wd != std::chrono::Saturday && wd != std::chrono::Sunday) {
            const double open = close;
            close = open * std::exp(ret(rng));
            const double high = std::max(open, close) * (1.0 + wick(rng));
            const double low = std::min(open, close) * (1.0 - wick(rng));
            bars.push_back(data::OHLCVBar{
                .date = std::chrono::year_month_day{day},
                .open = open,
                .high = high,
                .low = low,
                .close = close,
                .volume = 1e6 * (1.0 + wick(rng) * 50.0)
            });
        }
        day += std::chrono::days{1};
    }

    return data::OHLCVSeries(std::move(bars));
}

void run(const std::string& name, size_t bars, int iterations, const std::function<void()>& fn) {
    for (int i = 0; i < iterations / 10 + 1; ++i) {
        fn();
    }

    std::vector<int64_t> times(iterations);
    for (int i = 0; i < iterations; ++i) {
        const auto start = std::chrono::steady_clock::now();
        fn();
        const auto end = std::chrono::steady_clock::now();
        times[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    }

    auto stats = compute_stats(times);
    print_stats(name, stats, bars);
}

// ============================================================================
// INDICATOR BENCHMARK
// ============================================================================

void benchmark_indicators(size_t num_bars, int iterations) {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "  INDICATORS - " << num_bars << " bars, " << iterations << " iterations\n";
    std::cout << "============================================================\n\n";

    const auto series = make_random_walk(num_bars, 42);
    const auto closes = series.column(data::Field::CLOSE);

    run("SMA(200)", num_bars, iterations, [&] {
        volatile auto n = indicators::calculate_sma(closes, 200).size();
        (void)n;
    });
    run("EMA(26)", num_bars, iterations, [&] {
        volatile auto n = indicators::calculate_ema(closes, 26).size();
        (void)n;
    });
    run("MACD(12,26,9)", num_bars, iterations, [&] {
        volatile auto n = indicators::calculate_macd(closes).histogram.size();
        (void)n;
    });
    run("Bollinger(20,2)", num_bars, iterations, [&] {
        volatile auto n = indicators::calculate_bollinger_bands(closes).middle.size();
        (void)n;
    });
    run("ADX(14)", num_bars, iterations, [&] {
        volatile bool defined = indicators::calculate_adx(series).adx.has_value();
        (void)defined;
    });
    run("Snapshot (daily)", num_bars, iterations, [&] {
        volatile bool ok = snapshot::build_snapshot(series).has_data;
        (void)ok;
    });
    run("Resample + snapshot", num_bars, iterations, [&] {
        config::SnapshotConfig cfg;
        cfg.timeframe = data::Timeframe::WEEKLY;
        volatile bool ok = snapshot::build_snapshot(data::resample_weekly(series), cfg).has_data;
        (void)ok;
    });
}

int main() {
    std::cout << "============================================================\n";
    std::cout << "          TIDEMARK INDICATOR ENGINE - BENCHMARK             \n";
    std::cout << "============================================================\n";

    benchmark_indicators(252, 2000);      // one year of daily bars
    benchmark_indicators(2520, 500);      // ten years
    benchmark_indicators(25200, 50);

    std::cout << "\nIndicator benchmarks complete.\n\n";

    return 0;
}
