#include <gtest/gtest.h>

#include "strategy_factory.hpp"
#include "common_types.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using test_support::candlesFromCloses;

namespace {

    core::StrategyParams tripleParams() {
        core::StrategyParams params;
        params.kind = core::StrategyKind::TripleSma;
        params.fast_period = 2;
        params.mid_period = 3;
        params.slow_period = 4;
        params.prior_extreme_lookback = 2;
        params.adx_period = 14;
        params.adx_min = 0.0;
        return params;
    }

    core::StrategyParams bollingerParams(core::BreakoutMode mode) {
        core::StrategyParams params;
        params.kind = core::StrategyKind::BollingerBreakout;
        params.period = 3;
        params.band_multiplier = 1.0;
        params.mode = mode;
        return params;
    }

} // end anonymous namespace

TEST(TripleSmaStrategyTest, LongWhenEveryComponentHolds) {
    auto strategy = StrategyFactory::createStrategy("triple", tripleParams());
    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 10, 10, 10, 10, 11}));

    ASSERT_TRUE(snapshot.sufficient);
    EXPECT_NEAR(*snapshot.value(keys::PriorHigh), 10.05, 1e-9);
    auto evaluation = strategy->evaluate(snapshot);
    EXPECT_TRUE(evaluation.long_holds);
    EXPECT_FALSE(evaluation.short_holds);
}

TEST(TripleSmaStrategyTest, NoSignalWithoutPriorHighBreakout) {
    auto candles = candlesFromCloses({10, 10, 10, 10, 10, 11});
    candles[4].high = 11.5; // Same closes and SMAs, but the last close stays under the prior high

    auto strategy = StrategyFactory::createStrategy("triple", tripleParams());
    auto snapshot = strategy->buildSnapshot(candles);

    ASSERT_TRUE(snapshot.sufficient);
    auto evaluation = strategy->evaluate(snapshot);
    EXPECT_FALSE(evaluation.long_holds);
    EXPECT_FALSE(evaluation.short_holds);
}

TEST(TripleSmaStrategyTest, SlopeFloorBlocksWeakMoves) {
    auto params = tripleParams();
    params.min_slope_pct = 10.0; // Fast SMA rose 5%
    auto strategy = StrategyFactory::createStrategy("triple", params);
    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 10, 10, 10, 10, 11}));

    EXPECT_NEAR(*snapshot.value(keys::FastSlopePct), 5.0, 1e-9);
    EXPECT_FALSE(strategy->evaluate(snapshot).long_holds);
}

TEST(TripleSmaStrategyTest, ShortMirrorsLong) {
    auto strategy = StrategyFactory::createStrategy("triple", tripleParams());
    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 10, 10, 10, 10, 9}));

    auto evaluation = strategy->evaluate(snapshot);
    EXPECT_FALSE(evaluation.long_holds);
    EXPECT_TRUE(evaluation.short_holds);
}

TEST(TripleSmaStrategyTest, AdxGateRaisesMinimumHistory) {
    auto params = tripleParams();
    params.adx_min = 25.0;
    auto strategy = StrategyFactory::createStrategy("triple", params);
    EXPECT_EQ(strategy->getMinimumCandles(), 28);
    EXPECT_DOUBLE_EQ(strategy->getEntryThreshold(), 25.0);

    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 10, 10, 10, 10, 11}));
    EXPECT_FALSE(snapshot.sufficient);
}

TEST(BollingerBreakoutStrategyTest, CloseAboveUpperIsLongInBreakoutMode) {
    auto strategy = StrategyFactory::createStrategy("bb", bollingerParams(core::BreakoutMode::Breakout));
    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 10, 10, 10, 10, 11}));

    ASSERT_TRUE(snapshot.sufficient);
    auto evaluation = strategy->evaluate(snapshot);
    EXPECT_TRUE(evaluation.long_holds);
    EXPECT_FALSE(evaluation.short_holds);

    auto strength = strategy->strength(snapshot, core::Side::Long);
    ASSERT_TRUE(strength.has_value());
    double upper = *snapshot.value(keys::BandUpper);
    EXPECT_NEAR(*strength, (11.0 - upper) / upper * 100.0, 1e-9);
    EXPECT_GT(*strength, 0.2);
}

TEST(BollingerBreakoutStrategyTest, FadeModeSwapsSides) {
    auto strategy = StrategyFactory::createStrategy("bb", bollingerParams(core::BreakoutMode::Fade));
    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 10, 10, 10, 10, 11}));

    auto evaluation = strategy->evaluate(snapshot);
    EXPECT_FALSE(evaluation.long_holds);
    EXPECT_TRUE(evaluation.short_holds);
    ASSERT_TRUE(strategy->strength(snapshot, core::Side::Short).has_value());
}

TEST(BollingerBreakoutStrategyTest, InsufficientHistoryIsExplicit) {
    auto strategy = StrategyFactory::createStrategy("bb", bollingerParams(core::BreakoutMode::Breakout));
    auto snapshot = strategy->buildSnapshot(candlesFromCloses({10, 11}));

    EXPECT_FALSE(snapshot.sufficient);
    EXPECT_FALSE(snapshot.value(keys::BandUpper).has_value());
    auto evaluation = strategy->evaluate(snapshot);
    EXPECT_FALSE(evaluation.long_holds);
    EXPECT_FALSE(evaluation.short_holds);
}

TEST(StrategyFactoryTest, InvalidParametersRaiseStrategyException) {
    auto params = tripleParams();
    params.mid_period = params.slow_period;
    EXPECT_THROW(StrategyFactory::createStrategy("bad", params), core::StrategyException);

    auto bands = bollingerParams(core::BreakoutMode::Breakout);
    bands.period = 1;
    EXPECT_THROW(StrategyFactory::createStrategy("bad", bands), core::StrategyException);
}
