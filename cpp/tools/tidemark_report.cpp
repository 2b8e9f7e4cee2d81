//
// Indicator report tool
// Loads daily OHLCV bars from CSV and prints the indicator snapshot row
//

#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.hpp"
#include "csv_loader.hpp"
#include "indicator_snapshot.hpp"
#include "timeframe.hpp"

using namespace tidemark;

struct ReportOptions {
    std::string csv_path;
    std::string config_path;
    std::string symbol;
    bool weekly = false;
    bool print_header = false;
    bool verbose = false;
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " --csv FILE [options]\n"
              << "Options:\n"
              << "  --csv FILE          Daily OHLCV bars (Date,Open,High,Low,Close,Volume)\n"
              << "  --weekly            Resample to weekly bars before computing\n"
              << "  --config FILE       YAML overrides for indicator periods\n"
              << "  --symbol NAME       Label printed in front of the row\n"
              << "  --header            Print the column names first\n"
              << "  --verbose           Debug logging\n"
              << "  --help              Show this help\n";
}

ReportOptions ParseArgs(int argc, char* argv[]) {
    ReportOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--csv" && i + 1 < argc) {
            options.csv_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--symbol" && i + 1 < argc) {
            options.symbol = argv[++i];
        } else if (arg == "--weekly") {
            options.weekly = true;
        } else if (arg == "--header") {
            options.print_header = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            std::exit(1);
        }
    }

    if (options.csv_path.empty()) {
        std::cerr << "Missing --csv\n";
        PrintUsage(argv[0]);
        std::exit(1);
    }

    return options;
}

int main(int argc, char* argv[]) {
    const auto options = ParseArgs(argc, argv);

    // Keep stdout for the report row
    spdlog::set_default_logger(spdlog::stderr_color_mt("tidemark"));
    spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        auto config = options.config_path.empty()
            ? config::SnapshotConfig{}
            : config::load_config(options.config_path);
        if (options.weekly) {
            config.timeframe = data::Timeframe::WEEKLY;
        }

        auto loaded = data::load_csv(options.csv_path);
        auto series = std::move(loaded.series);

        if (config.timeframe == data::Timeframe::WEEKLY) {
            series = data::resample_weekly(series);
            spdlog::info("Resampled to {} weekly bars", series.size());
        }

        if (!series.empty()) {
            spdlog::debug("Computing {} snapshot over {} .. {}",
                          data::timeframe_name(config.timeframe),
                          data::format_date(series.front().date),
                          data::format_date(series.back().date));
        }

        const auto result = snapshot::build_snapshot(series, config);

        if (options.print_header) {
            std::cout << (options.symbol.empty() ? "" : "symbol,") << snapshot::format_header() << "\n";
        }
        if (!options.symbol.empty()) {
            std::cout << options.symbol << " ";
        }
        std::cout << snapshot::format_row(result) << "\n";

        return result.has_data ? 0 : 2;
    } catch (const std::exception& e) {
        spdlog::error("Report failed: {}", e.what());
        return 1;
    }
}
