#pragma once

#include "strategy.hpp"
#include "config.hpp"

namespace strategy_engine {

    // Fast SMA crossing the mid SMA with full fast/mid/slow alignment, minimum
    // fast slope and fast/mid separation, confirmed by a close beyond the prior
    // N-candle extreme. Strength is the ADX; an adx_min of 0 disables the gate.
    class TripleSmaStrategy : public Strategy {
    public:
        TripleSmaStrategy(std::string name,
                          const core::StrategyParams& params,
                          std::unique_ptr<ICondition> long_condition,
                          std::unique_ptr<ICondition> short_condition);

        int getMinimumCandles() const override;
        IndicatorSnapshot buildSnapshot(const core::TimeSeries<core::Candle>& closed_candles) const override;
        std::optional<double> strength(const IndicatorSnapshot& snapshot, core::Side side) const override;

    private:
        core::StrategyParams params_;
    };

} // namespace strategy_engine
