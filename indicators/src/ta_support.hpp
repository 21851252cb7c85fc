#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>

// Thin helpers around TA-Lib shared by the indicator implementations
namespace indicators {
namespace ta {

    // Rolling simple mean: output[j] is the mean of input[j .. j + period - 1].
    // Empty when input is shorter than period. Throws IndicatorCalculationException
    // if TA-Lib reports an error.
    std::vector<double> rollingMean(const std::vector<double>& input, int period, const std::string& context);

    // True range of every candle that has a predecessor: output[j] belongs to input[j + 1]
    std::vector<double> trueRange(const core::TimeSeries<core::Candle>& input, const std::string& context);

    // Throws core::IndicatorCalculationException unless ret_code is TA_SUCCESS
    void checkRetCode(int ret_code, const char* function, const std::string& context);

} // namespace ta
} // namespace indicators
