#include "bollinger_bands_indicator.hpp"
#include "ta_support.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <cmath>
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double band_multiplier)
    : period_(period), band_multiplier_(band_multiplier)
{
    // TA_BBANDS accepts periods from 2
    if (period_ < 2) {
        throw std::invalid_argument("Bollinger period must be at least 2.");
    }
    if (band_multiplier_ <= 0.0) {
        throw std::invalid_argument("Bollinger band multiplier must be positive.");
    }
    name_ = fmt::format("BB({},{})", period_, band_multiplier_);
}

std::string BollingerBandsIndicator::getName() const {
    return name_;
}

int BollingerBandsIndicator::getLookback() const {
    return period_ - 1;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

std::optional<double> BollingerBandsIndicator::widthAt(std::size_t bars_back) const {
    auto mid = valueAt(middle_, bars_back);
    if (!mid || *mid == 0.0) {
        return std::nullopt;
    }
    return (*valueAt(upper_, bars_back) - *valueAt(lower_, bars_back)) / *mid;
}

void BollingerBandsIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() < static_cast<std::size_t>(period_)) {
        logger->debug("Input size ({}) is less than period ({}) for {}. No results generated.",
                      input.size(), period_, name_);
        return;
    }

    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }

    std::size_t output_size = close_prices.size() - static_cast<std::size_t>(getLookback());
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    // TA_BBANDS uses the population deviation; rescale so the bands use the sample one
    const double deviations = band_multiplier_ * std::sqrt(period_ / (period_ - 1.0));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        deviations,                            // optInNbDevUp
        deviations,                            // optInNbDevDn
        TA_MAType_SMA,                         // Middle band is a simple moving average
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );
    ta::checkRetCode(ret_code, "TA_BBANDS", name_);

    if (out_nb_element != static_cast<int>(output_size)) {
        logger->warn("TA_BBANDS out_nb_element ({}) does not match expected output size ({}) for {}.",
                     out_nb_element, output_size, name_);
        upper_.resize(static_cast<std::size_t>(out_nb_element));
        middle_.resize(static_cast<std::size_t>(out_nb_element));
        lower_.resize(static_cast<std::size_t>(out_nb_element));
    }
    logger->trace("Successfully calculated {} band values for {}", middle_.size(), name_);
}

} // namespace indicators
