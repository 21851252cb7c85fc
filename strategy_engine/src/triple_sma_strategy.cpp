#include "triple_sma_strategy.hpp"
#include "triple_sma.hpp"
#include "adx_indicator.hpp"
#include "atr_indicator.hpp"
#include "common_types.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace strategy_engine {

TripleSmaStrategy::TripleSmaStrategy(std::string name,
                                     const core::StrategyParams& params,
                                     std::unique_ptr<ICondition> long_condition,
                                     std::unique_ptr<ICondition> short_condition)
    : Strategy(std::move(name), std::move(long_condition), std::move(short_condition), params.adx_min),
      params_(params)
{}

int TripleSmaStrategy::getMinimumCandles() const {
    int needed = std::max(params_.slow_period + 1, params_.prior_extreme_lookback + 1);
    if (params_.adx_min > 0.0) {
        needed = std::max(needed, 2 * params_.adx_period); // First ADX value
    }
    return needed;
}

IndicatorSnapshot TripleSmaStrategy::buildSnapshot(const core::TimeSeries<core::Candle>& closed_candles) const {
    IndicatorSnapshot snapshot;
    if (closed_candles.empty()) {
        return snapshot;
    }
    snapshot.current_candle = closed_candles.back();
    if (closed_candles.size() < static_cast<std::size_t>(getMinimumCandles())) {
        return snapshot;
    }

    auto reading = indicators::analyzeTripleSma(closed_candles, params_.fast_period,
                                                params_.mid_period, params_.slow_period);
    if (!reading) {
        return snapshot;
    }

    auto& now = snapshot.indicator_values;
    auto& prev = snapshot.indicator_values_prev;
    now[keys::SmaFast] = reading->fast;
    now[keys::SmaMid] = reading->mid;
    now[keys::SmaSlow] = reading->slow;
    prev[keys::SmaFast] = reading->prev_fast;
    prev[keys::SmaMid] = reading->prev_mid;
    prev[keys::SmaSlow] = reading->prev_slow;

    if (reading->prev_fast != 0.0) {
        now[keys::FastSlopePct] = (reading->fast - reading->prev_fast) / reading->prev_fast * 100.0;
    }
    if (reading->mid != 0.0) {
        now[keys::SeparationPct] = std::fabs(reading->fast - reading->mid) / reading->mid * 100.0;
    }

    // Extremes of the N closed candles before the current one
    auto window_end = closed_candles.end() - 1;
    auto window_begin = window_end - params_.prior_extreme_lookback;
    now[keys::PriorHigh] = std::max_element(window_begin, window_end,
        [](const core::Candle& a, const core::Candle& b) { return a.high < b.high; })->high;
    now[keys::PriorLow] = std::min_element(window_begin, window_end,
        [](const core::Candle& a, const core::Candle& b) { return a.low < b.low; })->low;

    indicators::AdxIndicator adx(params_.adx_period);
    adx.calculate(closed_candles);
    if (auto value = indicators::valueAt(adx.getResult())) now[keys::Adx] = *value;
    if (auto value = indicators::valueAt(adx.getResult(), 1)) prev[keys::Adx] = *value;
    if (auto value = indicators::valueAt(adx.getPlusDI())) now[keys::PlusDI] = *value;
    if (auto value = indicators::valueAt(adx.getMinusDI())) now[keys::MinusDI] = *value;

    indicators::AtrIndicator atr(params_.adx_period);
    atr.calculate(closed_candles);
    if (auto value = indicators::valueAt(atr.getResult())) now[keys::Atr] = *value;

    if (reading->cross != core::Side::None) {
        core::logging::getLogger()->debug("{}: fast/mid cross {} (alignment {})", getName(),
                                          core::sideToString(reading->cross), core::sideToString(reading->alignment));
    }

    snapshot.sufficient = true;
    return snapshot;
}

std::optional<double> TripleSmaStrategy::strength(const IndicatorSnapshot& snapshot, core::Side side) const {
    if (side == core::Side::None) {
        return std::nullopt;
    }
    auto adx = snapshot.value(keys::Adx);
    if (params_.adx_min == 0.0) {
        return adx.value_or(0.0); // No gate
    }
    return adx;
}

} // namespace strategy_engine
