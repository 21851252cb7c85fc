#include "strategy_factory.hpp"
#include "bollinger_breakout_strategy.hpp"
#include "triple_sma_strategy.hpp"
#include "price_indicator_condition.hpp"
#include "indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "and_condition.hpp"
#include "common_types.hpp"
#include "logging.hpp"            // Use short path
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>              // For std::invalid_argument
#include <vector>

namespace strategy_engine {

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const std::string& name, const core::StrategyParams& params) {
        try {
            switch (params.kind) {
                case core::StrategyKind::BollingerBreakout:
                    return createBollingerBreakout(name, params);
                case core::StrategyKind::TripleSma:
                    return createTripleSma(name, params);
            }
        } catch (const std::invalid_argument& e) {
            core::logging::getLogger()->error("Invalid parameters for strategy '{}': {}", name, e.what());
            throw core::StrategyException(fmt::format("Cannot create strategy '{}': {}", name, e.what()));
        }
        throw core::StrategyException(fmt::format("Unknown strategy kind for '{}'", name));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createBollingerBreakout(const std::string& name, const core::StrategyParams& params) {
        if (params.period < 2) {
            throw std::invalid_argument("Bollinger period must be at least 2.");
        }

        auto above_upper = std::make_unique<PriceIndicatorCondition>(PriceField::Close, ComparisonOp::GT, keys::BandUpper);
        auto below_lower = std::make_unique<PriceIndicatorCondition>(PriceField::Close, ComparisonOp::LT, keys::BandLower);

        if (params.mode == core::BreakoutMode::Breakout) {
            return std::make_unique<BollingerBreakoutStrategy>(name, params, std::move(above_upper), std::move(below_lower));
        }
        // Fade: a break above the upper band arms a SHORT
        return std::make_unique<BollingerBreakoutStrategy>(name, params, std::move(below_lower), std::move(above_upper));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createTripleSma(const std::string& name, const core::StrategyParams& params) {
        if (!(0 < params.fast_period && params.fast_period < params.mid_period && params.mid_period < params.slow_period)) {
            throw std::invalid_argument("Triple SMA periods must satisfy 0 < fast < mid < slow.");
        }
        if (params.prior_extreme_lookback <= 0 || params.adx_period <= 0) {
            throw std::invalid_argument("Prior extreme lookback and ADX period must be positive.");
        }
        return std::make_unique<TripleSmaStrategy>(name, params,
                                                   tripleSmaCondition(params, core::Side::Long),
                                                   tripleSmaCondition(params, core::Side::Short));
    }

    // All of: cross, alignment, slope, separation, prior-extreme breakout
    std::unique_ptr<ICondition> StrategyFactory::tripleSmaCondition(const core::StrategyParams& params, core::Side side) {
        const bool is_long = side == core::Side::Long;
        const ComparisonOp trend_op = is_long ? ComparisonOp::GT : ComparisonOp::LT;

        std::vector<std::unique_ptr<ICondition>> parts;
        parts.push_back(std::make_unique<IndicatorCrossCondition>(
            keys::SmaFast, is_long ? CrossType::CrossesAbove : CrossType::CrossesBelow, keys::SmaMid));
        parts.push_back(std::make_unique<IndicatorCondition>(keys::SmaFast, trend_op, std::string(keys::SmaMid)));
        parts.push_back(std::make_unique<IndicatorCondition>(keys::SmaMid, trend_op, std::string(keys::SmaSlow)));
        parts.push_back(std::make_unique<IndicatorCondition>(
            keys::FastSlopePct, is_long ? ComparisonOp::GTE : ComparisonOp::LTE,
            is_long ? params.min_slope_pct : -params.min_slope_pct));
        parts.push_back(std::make_unique<IndicatorCondition>(keys::SeparationPct, ComparisonOp::GTE, params.min_separation_pct));
        parts.push_back(std::make_unique<PriceIndicatorCondition>(
            PriceField::Close, trend_op, is_long ? keys::PriorHigh : keys::PriorLow));
        return std::make_unique<AndCondition>(std::move(parts));
    }

} // namespace strategy_engine
