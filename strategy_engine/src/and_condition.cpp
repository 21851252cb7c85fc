#include "and_condition.hpp"
#include "logging.hpp"
#include <sstream> // For describe()
#include <stdexcept>

namespace strategy_engine {

AndCondition::AndCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
        throw std::invalid_argument("AndCondition must receive at least one condition.");
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw std::invalid_argument("AndCondition received a null sub-condition.");
        }
    }
}

bool AndCondition::evaluate(const IndicatorSnapshot& snapshot) const {
    for (const auto& condition : conditions_) {
        if (!condition->evaluate(snapshot)) {
            core::logging::getLogger()->trace("AND short-circuited on: {}", condition->describe());
            return false;
        }
    }
    return true;
}

std::string AndCondition::describe() const {
    std::stringstream ss;
    ss << "(";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        if (i > 0) {
            ss << " AND ";
        }
        ss << conditions_[i]->describe();
    }
    ss << ")";
    return ss.str();
}

} // namespace strategy_engine
