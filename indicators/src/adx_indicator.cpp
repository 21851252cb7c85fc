#include "adx_indicator.hpp"
#include "ta_support.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {

    // Raw (one-bar) directional movement; output[j] belongs to input[j + 1]
    std::vector<double> directionalMovement(const std::vector<double>& highs,
                                            const std::vector<double>& lows,
                                            bool plus,
                                            const std::string& context)
    {
        std::vector<double> output(highs.size() - 1);
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = plus
            ? TA_PLUS_DM(0, static_cast<int>(highs.size()) - 1, highs.data(), lows.data(), 1,
                         &out_begin_idx, &out_nb_element, output.data())
            : TA_MINUS_DM(0, static_cast<int>(highs.size()) - 1, highs.data(), lows.data(), 1,
                          &out_begin_idx, &out_nb_element, output.data());
        ta::checkRetCode(ret_code, plus ? "TA_PLUS_DM" : "TA_MINUS_DM", context);
        output.resize(static_cast<std::size_t>(out_nb_element));
        return output;
    }

} // end anonymous namespace

AdxIndicator::AdxIndicator(int period) : period_(period) {
    if (period_ <= 0) {
        throw std::invalid_argument("ADX period must be positive.");
    }
    name_ = fmt::format("ADX({})", period_);
}

std::string AdxIndicator::getName() const {
    return name_;
}

int AdxIndicator::getLookback() const {
    return 2 * period_ - 1;
}

const core::TimeSeries<double>& AdxIndicator::getResult() const {
    return results_;
}

void AdxIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    plus_di_.clear();
    minus_di_.clear();
    results_.clear();

    if (input.size() <= static_cast<std::size_t>(period_)) {
        logger->debug("Input size ({}) too short for {}. No results generated.", input.size(), name_);
        return;
    }

    std::vector<double> highs, lows;
    highs.reserve(input.size());
    lows.reserve(input.size());
    for (const auto& candle : input) {
        highs.push_back(candle.high);
        lows.push_back(candle.low);
    }

    // All three raw series start at input[1]
    std::vector<double> atr = ta::rollingMean(ta::trueRange(input, name_), period_, name_);
    std::vector<double> plus_dm = ta::rollingMean(directionalMovement(highs, lows, true, name_), period_, name_);
    std::vector<double> minus_dm = ta::rollingMean(directionalMovement(highs, lows, false, name_), period_, name_);

    std::size_t count = std::min({atr.size(), plus_dm.size(), minus_dm.size()});
    std::vector<double> dx;
    dx.reserve(count);
    plus_di_.reserve(count);
    minus_di_.reserve(count);
    for (std::size_t j = 0; j < count; ++j) {
        double plus_di = atr[j] > 0.0 ? 100.0 * plus_dm[j] / atr[j] : 0.0;
        double minus_di = atr[j] > 0.0 ? 100.0 * minus_dm[j] / atr[j] : 0.0;
        double di_sum = plus_di + minus_di;
        plus_di_.push_back(plus_di);
        minus_di_.push_back(minus_di);
        dx.push_back(di_sum > 0.0 ? 100.0 * std::fabs(plus_di - minus_di) / di_sum : 0.0);
    }

    results_ = ta::rollingMean(dx, period_, name_);
    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
