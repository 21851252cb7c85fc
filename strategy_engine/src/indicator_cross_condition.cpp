#include "indicator_cross_condition.hpp"
#include "logging.hpp"    // Use short path
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

IndicatorCrossCondition::IndicatorCrossCondition(std::string indicator1_name,
                                               CrossType cross_type,
                                               std::string indicator2_name)
    : indicator1_name_(std::move(indicator1_name)),
      cross_type_(cross_type),
      indicator2_name_(std::move(indicator2_name))
{
     if (indicator1_name_.empty() || indicator2_name_.empty()) {
         throw std::invalid_argument("Indicator names cannot be empty for IndicatorCrossCondition.");
     }
      if (indicator1_name_ == indicator2_name_) {
           throw std::invalid_argument("Cannot check cross condition for the same indicator.");
      }
}

bool IndicatorCrossCondition::evaluate(const IndicatorSnapshot& snapshot) const {
    auto now1 = snapshot.value(indicator1_name_);
    auto now2 = snapshot.value(indicator2_name_);
    auto prev1 = snapshot.previous(indicator1_name_);
    auto prev2 = snapshot.previous(indicator2_name_);

    // All four values are needed
    if (!now1 || !now2 || !prev1 || !prev2) {
         core::logging::getLogger()->trace("IndicatorCrossCondition evaluate failed: Missing current or previous indicator values ('{}', '{}').",
                                           indicator1_name_, indicator2_name_);
         return false;
    }

    if (cross_type_ == CrossType::CrossesAbove) {
        // Was below or equal previously, AND is above now
        return (*prev1 <= *prev2) && (*now1 > *now2);
    }
    // Was above or equal previously, AND is below now
    return (*prev1 >= *prev2) && (*now1 < *now2);
}

std::string IndicatorCrossCondition::describe() const {
    return fmt::format("{} {} {}", indicator1_name_, toString(cross_type_), indicator2_name_);
}

} // namespace strategy_engine
