#include "price_indicator_condition.hpp"
#include "logging.hpp" // Use short path
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

PriceIndicatorCondition::PriceIndicatorCondition(PriceField price_field, ComparisonOp op, std::string indicator_name)
    : price_field_(price_field), op_(op), indicator_name_(std::move(indicator_name))
{
     if (indicator_name_.empty()) {
        throw std::invalid_argument("Indicator name cannot be empty for PriceIndicatorCondition.");
     }
}

bool PriceIndicatorCondition::evaluate(const IndicatorSnapshot& snapshot) const {
    if (!snapshot.current_candle) {
         core::logging::getLogger()->trace("PriceIndicatorCondition evaluate failed: Snapshot has no current candle.");
         return false;
    }

    auto rhs_value = snapshot.value(indicator_name_);
    if (!rhs_value) {
        core::logging::getLogger()->trace("PriceIndicatorCondition evaluate failed: Indicator '{}' not found in snapshot.", indicator_name_);
        return false;
    }
    return compare(priceValue(*snapshot.current_candle, price_field_), op_, *rhs_value);
}

std::string PriceIndicatorCondition::describe() const {
    return fmt::format("{} {} {}", toString(price_field_), toString(op_), indicator_name_);
}

} // namespace strategy_engine
