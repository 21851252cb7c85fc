#pragma once

#include "strategy.hpp"
#include "config.hpp"

namespace strategy_engine {

    // Close outside the Bollinger bands. In Breakout mode a close above the upper
    // band is LONG; in Fade mode it is SHORT. Strength is the percentage by which
    // the close is beyond the broken band.
    class BollingerBreakoutStrategy : public Strategy {
    public:
        BollingerBreakoutStrategy(std::string name,
                                  const core::StrategyParams& params,
                                  std::unique_ptr<ICondition> long_condition,
                                  std::unique_ptr<ICondition> short_condition);

        int getMinimumCandles() const override;
        IndicatorSnapshot buildSnapshot(const core::TimeSeries<core::Candle>& closed_candles) const override;
        std::optional<double> strength(const IndicatorSnapshot& snapshot, core::Side side) const override;

    private:
        int period_;
        double band_multiplier_;
        core::BreakoutMode mode_;
    };

} // namespace strategy_engine
