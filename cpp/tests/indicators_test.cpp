#include <gtest/gtest.h>
#include "../include/technical_indicators.hpp"
#include "test_series.hpp"
#include <cmath>
#include <limits>
#include <numeric>

using namespace tidemark::indicators;
using tidemark::data::DerivedSeries;
using tidemark::data::Field;
namespace fixtures = tidemark::testing;

// ============================================================================
// SIMPLE MOVING AVERAGE
// ============================================================================

TEST(SmaTest, ShorterThanLookbackIsUndefinedEverywhere) {
    DerivedSeries values = {1.0, 2.0, 3.0, 4.0};
    auto sma = calculate_sma(values, 5);

    ASSERT_EQ(sma.size(), values.size());
    for (const auto& v : sma) {
        EXPECT_FALSE(v.has_value());
    }
}

TEST(SmaTest, TrailingWindowMean) {
    DerivedSeries values = {1.0, 2.0, 3.0, 4.0, 5.0};
    auto sma = calculate_sma(values, 3);

    ASSERT_EQ(sma.size(), 5u);
    EXPECT_FALSE(sma[0].has_value());
    EXPECT_FALSE(sma[1].has_value());
    EXPECT_DOUBLE_EQ(*sma[2], 2.0);
    EXPECT_DOUBLE_EQ(*sma[3], 3.0);
    EXPECT_DOUBLE_EQ(*sma[4], 4.0);
}

TEST(SmaTest, UndefinedEntriesAreExcludedFromWindow) {
    DerivedSeries values = {1.0, std::nullopt, 3.0, 5.0};
    auto sma = calculate_sma(values, 2);

    EXPECT_FALSE(sma[0].has_value());
    EXPECT_DOUBLE_EQ(*sma[1], 1.0);   // only 1.0 available
    EXPECT_DOUBLE_EQ(*sma[2], 3.0);   // only 3.0 available
    EXPECT_DOUBLE_EQ(*sma[3], 4.0);
}

TEST(SmaTest, EmptyWindowIsUndefined) {
    DerivedSeries values = {std::nullopt, std::nullopt, 1.0};
    auto sma = calculate_sma(values, 2);

    EXPECT_FALSE(sma[1].has_value());
    EXPECT_DOUBLE_EQ(*sma[2], 1.0);
}

TEST(SmaTest, LargeValueLeavingWindowKeepsPrecision) {
    DerivedSeries values = {1e16, 1.0, 1.0, 1.0};
    auto sma = calculate_sma(values, 2);

    EXPECT_DOUBLE_EQ(*sma[1], (1e16 + 1.0) / 2.0);
    EXPECT_DOUBLE_EQ(*sma[2], 1.0);
    EXPECT_DOUBLE_EQ(*sma[3], 1.0);
}

TEST(SmaTest, NonFiniteValueOnlyAffectsItsWindows) {
    DerivedSeries values = {std::numeric_limits<double>::infinity(), 1.0, 2.0, 3.0, 4.0};
    auto sma = calculate_sma(values, 2);

    EXPECT_TRUE(std::isinf(*sma[1]));
    EXPECT_DOUBLE_EQ(*sma[2], 1.5);
    EXPECT_DOUBLE_EQ(*sma[3], 2.5);
    EXPECT_DOUBLE_EQ(*sma[4], 3.5);
}

TEST(SmaTest, ZeroLookbackIsUndefined) {
    DerivedSeries values = {1.0, 2.0};
    auto sma = calculate_sma(values, 0);

    ASSERT_EQ(sma.size(), 2u);
    EXPECT_FALSE(sma[0].has_value());
    EXPECT_FALSE(sma[1].has_value());
}

TEST(SmaTest, ReadsRequestedField) {
    auto series = fixtures::make_uptrend(30);
    auto sma = calculate_sma(series, 20, Field::CLOSE);

    ASSERT_EQ(sma.size(), 30u);
    EXPECT_FALSE(sma[18].has_value());
    // closes 110..129
    EXPECT_NEAR(*sma[29], 119.5, 1e-9);

    auto highs = calculate_sma(series, 20, Field::HIGH);
    EXPECT_NEAR(*highs[29], 120.0, 1e-9);
}

// ============================================================================
// EXPONENTIAL MOVING AVERAGE
// ============================================================================

TEST(EmaTest, ShorterThanLookbackIsUndefinedEverywhere) {
    DerivedSeries values = {5.0, 6.0, 7.0};
    auto ema = calculate_ema(values, 4);

    ASSERT_EQ(ema.size(), 3u);
    for (const auto& v : ema) {
        EXPECT_FALSE(v.has_value());
    }
}

TEST(EmaTest, SeedIsSimpleMean) {
    DerivedSeries values;
    for (int i = 1; i <= 10; ++i) values.emplace_back(static_cast<double>(i));

    auto ema = calculate_ema(values, 5);

    ASSERT_EQ(ema.size(), values.size());
    EXPECT_FALSE(ema[3].has_value());
    EXPECT_DOUBLE_EQ(*ema[4], 3.0);
}

TEST(EmaTest, Recurrence) {
    DerivedSeries values;
    for (int i = 1; i <= 10; ++i) values.emplace_back(static_cast<double>(i));

    auto ema = calculate_ema(values, 5);
    const double k = 2.0 / 6.0;

    for (size_t i = 5; i < values.size(); ++i) {
        const double expected = *values[i] * k + *ema[i - 1] * (1.0 - k);
        EXPECT_DOUBLE_EQ(*ema[i], expected) << "index " << i;
    }
}

TEST(EmaTest, UndefinedInputKeepsRunningState) {
    DerivedSeries values = {2.0, 4.0, 6.0, std::nullopt, 8.0};
    auto ema = calculate_ema(values, 3);   // k = 0.5

    EXPECT_DOUBLE_EQ(*ema[2], 4.0);
    EXPECT_FALSE(ema[3].has_value());
    // Resumes from the seed, not from the undefined gap
    EXPECT_DOUBLE_EQ(*ema[4], 8.0 * 0.5 + 4.0 * 0.5);
}

TEST(EmaTest, SeedWindowWithPartialData) {
    DerivedSeries values = {std::nullopt, 3.0, 5.0, 7.0};
    auto ema = calculate_ema(values, 3);

    EXPECT_DOUBLE_EQ(*ema[2], 4.0);
    EXPECT_DOUBLE_EQ(*ema[3], 7.0 * 0.5 + 4.0 * 0.5);
}

TEST(EmaTest, SeedDeferredUntilEnoughValues) {
    DerivedSeries values = {std::nullopt, std::nullopt, std::nullopt, 1.0, 2.0, 3.0, 4.0};
    auto ema = calculate_ema(values, 3);

    for (size_t i = 0; i < 5; ++i) {
        EXPECT_FALSE(ema[i].has_value()) << "index " << i;
    }
    EXPECT_DOUBLE_EQ(*ema[5], 2.0);
    EXPECT_DOUBLE_EQ(*ema[6], 4.0 * 0.5 + 2.0 * 0.5);
}

// ============================================================================
// MACD
// ============================================================================

TEST(MacdTest, HistogramIsLineMinusSignal) {
    auto series = fixtures::make_uptrend(60);
    auto macd = calculate_macd(series, Field::CLOSE);

    ASSERT_EQ(macd.macd_line.size(), 60u);
    ASSERT_EQ(macd.signal_line.size(), 60u);
    ASSERT_EQ(macd.histogram.size(), 60u);

    for (size_t i = 0; i < 60; ++i) {
        const auto& line = macd.macd_line[i];
        const auto& signal = macd.signal_line[i];
        const auto& hist = macd.histogram[i];
        if (line && signal) {
            ASSERT_TRUE(hist.has_value()) << "index " << i;
            EXPECT_DOUBLE_EQ(*hist, *line - *signal);
        } else {
            EXPECT_FALSE(hist.has_value()) << "index " << i;
        }
    }
}

TEST(MacdTest, DefinitionOffsets) {
    auto series = fixtures::make_uptrend(60);
    auto macd = calculate_macd(series, Field::CLOSE);

    // Line needs the 26-period EMA, signal needs nine line values on top
    EXPECT_FALSE(macd.macd_line[24].has_value());
    EXPECT_TRUE(macd.macd_line[25].has_value());
    EXPECT_FALSE(macd.signal_line[32].has_value());
    EXPECT_TRUE(macd.signal_line[33].has_value());
    EXPECT_FALSE(macd.histogram[32].has_value());
    EXPECT_TRUE(macd.histogram[33].has_value());

    // Uptrend: fast EMA above slow EMA
    EXPECT_GT(*macd.macd_line[59], 0.0);
}

TEST(MacdTest, SignalSeedIsMeanOfFirstNineLineValues) {
    auto series = fixtures::make_uptrend(40);
    auto macd = calculate_macd(series, Field::CLOSE);

    double sum = 0.0;
    for (size_t i = 25; i <= 33; ++i) sum += *macd.macd_line[i];
    EXPECT_NEAR(*macd.signal_line[33], sum / 9.0, 1e-12);
}

TEST(MacdTest, FlatSeriesIsZero) {
    auto series = fixtures::make_flat(60);
    auto macd = calculate_macd(series, Field::CLOSE);

    EXPECT_NEAR(*macd.macd_line[59], 0.0, 1e-9);
    EXPECT_NEAR(*macd.histogram[59], 0.0, 1e-9);
}

TEST(MacdTest, ShortSeriesIsUndefined) {
    auto series = fixtures::make_uptrend(20);
    auto macd = calculate_macd(series, Field::CLOSE);

    for (size_t i = 0; i < 20; ++i) {
        EXPECT_FALSE(macd.macd_line[i].has_value());
        EXPECT_FALSE(macd.signal_line[i].has_value());
        EXPECT_FALSE(macd.histogram[i].has_value());
    }
}

// ============================================================================
// BOLLINGER BANDS
// ============================================================================

TEST(BollingerTest, PopulationStandardDeviation) {
    DerivedSeries values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    auto bands = calculate_bollinger_bands(values, 8, 2.0);

    // mean 5, population std 2
    EXPECT_DOUBLE_EQ(*bands.middle[7], 5.0);
    EXPECT_DOUBLE_EQ(*bands.upper[7], 9.0);
    EXPECT_DOUBLE_EQ(*bands.lower[7], 1.0);
}

TEST(BollingerTest, SymmetricAroundMiddle) {
    auto series = fixtures::make_from_closes({
        101.2, 99.8, 102.5, 103.1, 100.9, 98.7, 97.5, 99.9, 101.4, 104.2,
        105.0, 103.3, 102.1, 100.0, 99.1, 101.7, 103.8, 106.2, 104.9, 103.5,
        102.2, 101.0, 99.4, 98.8, 100.6
    });
    auto bands = calculate_bollinger_bands(series, Field::CLOSE, 20, 2.0);

    for (size_t i = 0; i < 19; ++i) {
        EXPECT_FALSE(bands.middle[i].has_value());
        EXPECT_FALSE(bands.upper[i].has_value());
        EXPECT_FALSE(bands.lower[i].has_value());
    }
    for (size_t i = 19; i < series.size(); ++i) {
        ASSERT_TRUE(bands.middle[i].has_value());
        EXPECT_NEAR(*bands.upper[i] - *bands.middle[i], *bands.middle[i] - *bands.lower[i], 1e-9);
        EXPECT_GT(*bands.upper[i], *bands.lower[i]);
    }
}

TEST(BollingerTest, UndefinedEntriesAreExcluded) {
    DerivedSeries values = {std::nullopt, 2.0, 4.0};
    auto bands = calculate_bollinger_bands(values, 3, 1.0);

    EXPECT_DOUBLE_EQ(*bands.middle[2], 3.0);
    EXPECT_DOUBLE_EQ(*bands.upper[2], 4.0);
    EXPECT_DOUBLE_EQ(*bands.lower[2], 2.0);
}

TEST(BollingerTest, EmptyWindowIsUndefined) {
    DerivedSeries values = {std::nullopt, std::nullopt, std::nullopt};
    auto bands = calculate_bollinger_bands(values, 2, 2.0);

    EXPECT_FALSE(bands.middle[1].has_value());
    EXPECT_FALSE(bands.upper[2].has_value());
    EXPECT_FALSE(bands.lower[2].has_value());
}

// ============================================================================
// PERCENT CHANGE
// ============================================================================

TEST(PercentChangeTest, SignedPercentage) {
    EXPECT_DOUBLE_EQ(*percent_change(110.0, 100.0), 10.0);
    EXPECT_DOUBLE_EQ(*percent_change(90.0, 100.0), -10.0);
    EXPECT_DOUBLE_EQ(*percent_change(100.0, 100.0), 0.0);
}

TEST(PercentChangeTest, UndefinedDenominator) {
    EXPECT_FALSE(percent_change(110.0, 0.0).has_value());
    EXPECT_FALSE(percent_change(110.0, std::nullopt).has_value());
    EXPECT_FALSE(percent_change(std::nullopt, 100.0).has_value());
}
