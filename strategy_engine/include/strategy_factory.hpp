#pragma once

#include <string>
#include <memory> // For std::unique_ptr

#include "interfaces.hpp"
#include "config.hpp"

namespace strategy_engine {

    class StrategyFactory {
    public:
        // Builds the concrete strategy and its LONG/SHORT condition trees.
        // Throws core::StrategyException for parameters the strategy cannot run with.
        static std::unique_ptr<IStrategy> createStrategy(const std::string& name, const core::StrategyParams& params);

    private:
        static std::unique_ptr<IStrategy> createBollingerBreakout(const std::string& name, const core::StrategyParams& params);
        static std::unique_ptr<IStrategy> createTripleSma(const std::string& name, const core::StrategyParams& params);
        static std::unique_ptr<ICondition> tripleSmaCondition(const core::StrategyParams& params, core::Side side);
    };

} // namespace strategy_engine
