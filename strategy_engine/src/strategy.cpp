#include "strategy.hpp"
#include "logging.hpp" // Use short path
#include <spdlog/fmt/fmt.h>
#include <stdexcept>  // For std::invalid_argument

namespace strategy_engine {

Strategy::Strategy(std::string name,
                   std::unique_ptr<ICondition> long_condition,
                   std::unique_ptr<ICondition> short_condition,
                   double entry_threshold)
    : name_(std::move(name)),
      long_condition_(std::move(long_condition)),
      short_condition_(std::move(short_condition)),
      entry_threshold_(entry_threshold)
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (!long_condition_ || !short_condition_) {
        throw std::invalid_argument(fmt::format("Strategy '{}' requires both a LONG and a SHORT condition.", name_));
    }
    if (entry_threshold_ < 0.0) {
        throw std::invalid_argument(fmt::format("Strategy '{}' entry threshold must not be negative.", name_));
    }
    core::logging::getLogger()->debug("Strategy created: {}", describe());
}

std::string Strategy::getName() const { return name_; }

double Strategy::getEntryThreshold() const { return entry_threshold_; }

StrategyEvaluation Strategy::evaluate(const IndicatorSnapshot& snapshot) const {
    StrategyEvaluation result;
    if (!snapshot.sufficient) {
        return result;
    }
    result.long_holds = long_condition_->evaluate(snapshot);
    result.short_holds = short_condition_->evaluate(snapshot);

    core::logging::getLogger()->trace("Strategy '{}' evaluated: LONG={}, SHORT={}",
                                      name_, result.long_holds, result.short_holds);
    return result;
}

std::string Strategy::describe() const {
    return fmt::format("Strategy('{}'): LONG IF {} | SHORT IF {} | entry >= {}",
                       name_, long_condition_->describe(), short_condition_->describe(), entry_threshold_);
}

} // namespace strategy_engine
