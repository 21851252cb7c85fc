#include "atr_indicator.hpp"
#include "ta_support.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

AtrIndicator::AtrIndicator(int period) : period_(period) {
    if (period_ <= 0) {
        throw std::invalid_argument("ATR period must be positive.");
    }
    name_ = fmt::format("ATR({})", period_);
}

std::string AtrIndicator::getName() const {
    return name_;
}

int AtrIndicator::getLookback() const {
    return period_; // One candle for the first previous close, then a full period of TR
}

const core::TimeSeries<double>& AtrIndicator::getResult() const {
    return results_;
}

void AtrIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.clear();
    if (input.size() <= static_cast<std::size_t>(getLookback())) {
        core::logging::getLogger()->debug("Input size ({}) too short for {}. No results generated.",
                                          input.size(), name_);
        return;
    }
    results_ = ta::rollingMean(ta::trueRange(input, name_), period_, name_);
}

} // namespace indicators
