#include "ta_support.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API
#include <spdlog/fmt/fmt.h>

namespace indicators {
namespace ta {

    void checkRetCode(int ret_code, const char* function, const std::string& context) {
        if (ret_code != TA_SUCCESS) {
            core::logging::getLogger()->error("TA-Lib {} failed for {} with error code: {}", function, context, ret_code);
            throw core::IndicatorCalculationException(
                fmt::format("{} failed for {} with code {}", function, context, ret_code));
        }
    }

    std::vector<double> rollingMean(const std::vector<double>& input, int period, const std::string& context) {
        std::vector<double> output;
        if (period <= 0 || input.size() < static_cast<std::size_t>(period)) {
            return output;
        }

        // TA_SMA accepts periods >= 2 only; a 1-period mean is the series itself
        if (period == 1) {
            return input;
        }

        output.resize(input.size() - static_cast<std::size_t>(period) + 1);
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_SMA(
            0,
            static_cast<int>(input.size()) - 1,
            input.data(),
            period,
            &out_begin_idx,
            &out_nb_element,
            output.data()
        );
        checkRetCode(ret_code, "TA_SMA", context);

        if (out_begin_idx != period - 1) {
            throw core::IndicatorCalculationException(
                fmt::format("TA_SMA returned begin index {} (expected {}) for {}", out_begin_idx, period - 1, context));
        }
        output.resize(static_cast<std::size_t>(out_nb_element));
        return output;
    }

    std::vector<double> trueRange(const core::TimeSeries<core::Candle>& input, const std::string& context) {
        std::vector<double> output;
        if (input.size() < 2) {
            return output;
        }

        std::vector<double> highs, lows, closes;
        highs.reserve(input.size());
        lows.reserve(input.size());
        closes.reserve(input.size());
        for (const auto& candle : input) {
            highs.push_back(candle.high);
            lows.push_back(candle.low);
            closes.push_back(candle.close);
        }

        output.resize(input.size() - 1);
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_TRANGE(
            0,
            static_cast<int>(input.size()) - 1,
            highs.data(),
            lows.data(),
            closes.data(),
            &out_begin_idx,
            &out_nb_element,
            output.data()
        );
        checkRetCode(ret_code, "TA_TRANGE", context);
        output.resize(static_cast<std::size_t>(out_nb_element));
        return output;
    }

} // namespace ta
} // namespace indicators
