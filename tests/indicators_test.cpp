#include <gtest/gtest.h>
#include <cmath>

#include "sma_indicator.hpp"
#include "bollinger_bands_indicator.hpp"
#include "atr_indicator.hpp"
#include "adx_indicator.hpp"
#include "triple_sma.hpp"
#include "test_helpers.hpp"

using test_support::candlesFromCloses;

TEST(SmaIndicatorTest, PartialWindowAveragesWarmupPrefix) {
    indicators::SmaIndicator sma(3, indicators::WindowMode::Partial);
    sma.calculate(candlesFromCloses({2.0, 4.0, 6.0, 8.0}));

    ASSERT_EQ(sma.getLookback(), 0);
    ASSERT_EQ(sma.getResult().size(), 4u);
    EXPECT_DOUBLE_EQ(sma.getResult()[0], 2.0);
    EXPECT_DOUBLE_EQ(sma.getResult()[1], 3.0);
    EXPECT_DOUBLE_EQ(sma.getResult()[2], 4.0);
    EXPECT_DOUBLE_EQ(sma.getResult()[3], 6.0);
}

TEST(SmaIndicatorTest, FullWindowSkipsLookback) {
    indicators::SmaIndicator sma(3, indicators::WindowMode::Full);
    sma.calculate(candlesFromCloses({2.0, 4.0, 6.0, 8.0}));

    EXPECT_EQ(sma.getLookback(), 2);
    ASSERT_EQ(sma.getResult().size(), 2u);
    EXPECT_DOUBLE_EQ(sma.getResult()[0], 4.0);
    EXPECT_DOUBLE_EQ(sma.getResult()[1], 6.0);
}

TEST(SmaIndicatorTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(indicators::SmaIndicator(0), std::invalid_argument);
}

TEST(BollingerBandsTest, KnownValuesUseSampleDeviation) {
    indicators::BollingerBandsIndicator bands(5, 2.0);
    bands.calculate(candlesFromCloses({1.0, 2.0, 3.0, 4.0, 5.0}));

    ASSERT_EQ(bands.getResult().size(), 1u);
    EXPECT_NEAR(bands.getResult()[0], 3.0, 1e-9);
    EXPECT_NEAR(bands.getUpper()[0], 3.0 + 2.0 * std::sqrt(2.5), 1e-9);
    EXPECT_NEAR(bands.getLower()[0], 3.0 - 2.0 * std::sqrt(2.5), 1e-9);
}

TEST(BollingerBandsTest, BandsAreSymmetricAroundMiddle) {
    indicators::BollingerBandsIndicator bands(8, 2.0);
    bands.calculate(candlesFromCloses({0.0410, 0.0412, 0.0409, 0.0415, 0.0420, 0.0418, 0.0411,
                                       0.0405, 0.0407, 0.0416, 0.0422, 0.0419}));

    ASSERT_EQ(bands.getResult().size(), 12u - 7u);
    for (std::size_t i = 0; i < bands.getResult().size(); ++i) {
        double mid = bands.getResult()[i];
        EXPECT_NEAR(bands.getUpper()[i] - mid, mid - bands.getLower()[i], 1e-12) << "index " << i;
        EXPECT_GT(bands.getUpper()[i], bands.getLower()[i]);
    }
}

TEST(BollingerBandsTest, FlatSeriesCollapsesBands) {
    indicators::BollingerBandsIndicator bands(4, 2.0);
    bands.calculate(candlesFromCloses({10.0, 10.0, 10.0, 10.0, 10.0}));

    ASSERT_EQ(bands.getResult().size(), 2u);
    EXPECT_NEAR(bands.getUpper().back(), 10.0, 1e-9);
    EXPECT_NEAR(bands.getLower().back(), 10.0, 1e-9);
    ASSERT_TRUE(bands.widthAt(0).has_value());
    EXPECT_NEAR(*bands.widthAt(0), 0.0, 1e-9);
}

TEST(BollingerBandsTest, ShortInputProducesNothing) {
    indicators::BollingerBandsIndicator bands(8, 2.0);
    bands.calculate(candlesFromCloses({1.0, 2.0, 3.0}));
    EXPECT_TRUE(bands.getResult().empty());
    EXPECT_FALSE(bands.widthAt(0).has_value());
}

TEST(AtrIndicatorTest, ResultLengthMatchesLookback) {
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) closes.push_back(100.0 + (i % 5));
    auto candles = candlesFromCloses(closes);

    indicators::AtrIndicator atr(14);
    atr.calculate(candles);
    EXPECT_EQ(atr.getLookback(), 14);
    EXPECT_EQ(atr.getResult().size(), candles.size() - 14);
    for (double value : atr.getResult()) {
        EXPECT_GT(value, 0.0);
    }
}

TEST(AdxIndicatorTest, ResultLengthAndRange) {
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) closes.push_back(100.0 + i * 0.5 + ((i % 3) ? 0.2 : -0.3));
    auto candles = candlesFromCloses(closes);

    indicators::AdxIndicator adx(5);
    adx.calculate(candles);
    EXPECT_EQ(adx.getLookback(), 9);
    ASSERT_EQ(adx.getResult().size(), candles.size() - 9);
    for (double value : adx.getResult()) {
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 100.0);
    }
    // Steady uptrend: buyers dominate
    EXPECT_GT(adx.getPlusDI().back(), adx.getMinusDI().back());
}

TEST(AdxIndicatorTest, TooFewCandlesGiveNoValue) {
    indicators::AdxIndicator adx(14);
    adx.calculate(candlesFromCloses({1.0, 2.0, 3.0}));
    EXPECT_TRUE(adx.getResult().empty());
}

TEST(TripleSmaAnalysisTest, DetectsBullishCrossAndAlignment) {
    auto reading = indicators::analyzeTripleSma(candlesFromCloses({10, 10, 10, 10, 10, 11}), 2, 3, 4);
    ASSERT_TRUE(reading.has_value());
    EXPECT_DOUBLE_EQ(reading->fast, 10.5);
    EXPECT_NEAR(reading->mid, 31.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(reading->slow, 10.25);
    EXPECT_EQ(reading->cross, core::Side::Long);
    EXPECT_EQ(reading->alignment, core::Side::Long);
}

TEST(TripleSmaAnalysisTest, NeedsSlowPeriodPlusOneCandles) {
    EXPECT_FALSE(indicators::analyzeTripleSma(candlesFromCloses({1, 2, 3, 4}), 2, 3, 4).has_value());
    EXPECT_THROW(indicators::analyzeTripleSma(candlesFromCloses({1, 2, 3, 4, 5}), 3, 3, 4), std::invalid_argument);
}
