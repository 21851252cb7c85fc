#include "bollinger_breakout_strategy.hpp"
#include "bollinger_bands_indicator.hpp"
#include "common_types.hpp"
#include "logging.hpp"

namespace strategy_engine {

BollingerBreakoutStrategy::BollingerBreakoutStrategy(std::string name,
                                                     const core::StrategyParams& params,
                                                     std::unique_ptr<ICondition> long_condition,
                                                     std::unique_ptr<ICondition> short_condition)
    : Strategy(std::move(name), std::move(long_condition), std::move(short_condition), params.entry_threshold_pct),
      period_(params.period),
      band_multiplier_(params.band_multiplier),
      mode_(params.mode)
{}

int BollingerBreakoutStrategy::getMinimumCandles() const {
    return period_;
}

IndicatorSnapshot BollingerBreakoutStrategy::buildSnapshot(const core::TimeSeries<core::Candle>& closed_candles) const {
    IndicatorSnapshot snapshot;
    if (closed_candles.empty()) {
        return snapshot;
    }
    snapshot.current_candle = closed_candles.back();

    indicators::BollingerBandsIndicator bands(period_, band_multiplier_);
    bands.calculate(closed_candles);
    if (bands.getResult().empty()) {
        return snapshot; // insufficient
    }

    auto store = [&](std::map<std::string, double>& target, std::size_t bars_back) {
        auto mid = indicators::valueAt(bands.getResult(), bars_back);
        if (!mid) {
            return;
        }
        target[keys::BandMid] = *mid;
        target[keys::BandUpper] = *indicators::valueAt(bands.getUpper(), bars_back);
        target[keys::BandLower] = *indicators::valueAt(bands.getLower(), bars_back);
        if (auto width = bands.widthAt(bars_back)) {
            target[keys::BandWidth] = *width;
        }
    };
    store(snapshot.indicator_values, 0);
    store(snapshot.indicator_values_prev, 1);

    snapshot.sufficient = true;
    return snapshot;
}

std::optional<double> BollingerBreakoutStrategy::strength(const IndicatorSnapshot& snapshot, core::Side side) const {
    if (!snapshot.current_candle || side == core::Side::None) {
        return std::nullopt;
    }
    // Which band a side breaks depends on the mode
    bool upper_band = (side == core::Side::Long) == (mode_ == core::BreakoutMode::Breakout);
    double close = snapshot.current_candle->close;

    if (upper_band) {
        auto upper = snapshot.value(keys::BandUpper);
        if (!upper || *upper <= 0.0) return std::nullopt;
        return (close - *upper) / *upper * 100.0;
    }
    auto lower = snapshot.value(keys::BandLower);
    if (!lower || *lower <= 0.0) return std::nullopt;
    return (*lower - close) / *lower * 100.0;
}

} // namespace strategy_engine
