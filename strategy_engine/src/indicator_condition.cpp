#include "indicator_condition.hpp"
#include "logging.hpp"    // Use short path
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

// Constructor for comparing indicator to value
IndicatorCondition::IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, double value)
    : indicator_name1_(indicator_name1), op_(op), rhs_(value)
{
    if (indicator_name1_.empty()) {
        throw std::invalid_argument("Indicator name 1 cannot be empty.");
    }
}

// Constructor for comparing indicator to indicator
IndicatorCondition::IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, const std::string& indicator_name2)
     : indicator_name1_(indicator_name1), op_(op), rhs_(indicator_name2)
{
     if (indicator_name1_.empty() || indicator_name2.empty()) {
         throw std::invalid_argument("Indicator names cannot be empty.");
     }
      if (indicator_name1_ == indicator_name2) {
           throw std::invalid_argument("Cannot compare an indicator to itself in IndicatorCondition.");
      }
}

bool IndicatorCondition::evaluate(const IndicatorSnapshot& snapshot) const {
    auto lhs_value = snapshot.value(indicator_name1_);
    if (!lhs_value) {
        core::logging::getLogger()->trace("IndicatorCondition evaluate failed: LHS indicator '{}' not found in snapshot.", indicator_name1_);
        return false;
    }

    if (const double* fixed = std::get_if<double>(&rhs_)) {
        return compare(*lhs_value, op_, *fixed);
    }

    const std::string& indicator_name2 = std::get<std::string>(rhs_);
    auto rhs_value = snapshot.value(indicator_name2);
    if (!rhs_value) {
        core::logging::getLogger()->trace("IndicatorCondition evaluate failed: RHS indicator '{}' not found in snapshot.", indicator_name2);
        return false;
    }
    return compare(*lhs_value, op_, *rhs_value);
}

std::string IndicatorCondition::describe() const {
    if (const double* fixed = std::get_if<double>(&rhs_)) {
        return fmt::format("{} {} {}", indicator_name1_, toString(op_), *fixed);
    }
    return fmt::format("{} {} {}", indicator_name1_, toString(op_), std::get<std::string>(rhs_));
}

} // namespace strategy_engine
