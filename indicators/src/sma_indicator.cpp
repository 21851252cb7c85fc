#include "sma_indicator.hpp"
#include "ta_support.hpp"
#include "logging.hpp"
#include <stdexcept>                   // For std::invalid_argument
#include <algorithm>                   // For std::min
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period, WindowMode mode) : period_(period), mode_(mode) {
    if (period_ <= 0) {
         throw std::invalid_argument("SMA period must be positive.");
    }
    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Mode={}", name_,
                                      mode_ == WindowMode::Full ? "full" : "partial");
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return mode_ == WindowMode::Full ? period_ - 1 : 0;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.empty()) {
        logger->debug("No input candles for {}. No results generated.", name_);
        return;
    }

    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }

    if (mode_ == WindowMode::Partial) {
        // Warm-up section: mean over the closes seen so far
        std::size_t warmup = std::min(close_prices.size(), static_cast<std::size_t>(period_ - 1));
        double running_sum = 0.0;
        for (std::size_t i = 0; i < warmup; ++i) {
            running_sum += close_prices[i];
            results_.push_back(running_sum / static_cast<double>(i + 1));
        }
    } else if (close_prices.size() < static_cast<std::size_t>(period_)) {
        logger->debug("Input size ({}) is less than period ({}) for {}. No results generated.",
                      close_prices.size(), period_, name_);
        return;
    }

    std::vector<double> full_window = ta::rollingMean(close_prices, period_, name_);
    results_.insert(results_.end(), full_window.begin(), full_window.end());

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
