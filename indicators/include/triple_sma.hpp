#pragma once

#include "datatypes.hpp"
#include <optional>

namespace indicators {

    // Current and previous-bar values of three full-window SMAs
    struct TripleSmaReading {
        double fast = 0.0;
        double mid = 0.0;
        double slow = 0.0;
        double prev_fast = 0.0;
        double prev_mid = 0.0;
        double prev_slow = 0.0;

        // Long when fast moved from <= mid to > mid on this bar, Short for the mirror
        core::Side cross = core::Side::None;
        // Long when fast > mid > slow, Short when fast < mid < slow
        core::Side alignment = core::Side::None;
    };

    // Needs slow_period + 1 closed candles (previous bar of the slowest average);
    // returns std::nullopt otherwise. Periods must satisfy 0 < fast < mid < slow.
    std::optional<TripleSmaReading> analyzeTripleSma(const core::TimeSeries<core::Candle>& candles,
                                                     int fast_period, int mid_period, int slow_period);

} // namespace indicators
