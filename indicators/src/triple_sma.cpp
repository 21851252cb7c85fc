#include "triple_sma.hpp"
#include "sma_indicator.hpp"
#include <stdexcept>

namespace indicators {

    std::optional<TripleSmaReading> analyzeTripleSma(const core::TimeSeries<core::Candle>& candles,
                                                     int fast_period, int mid_period, int slow_period)
    {
        if (!(0 < fast_period && fast_period < mid_period && mid_period < slow_period)) {
            throw std::invalid_argument("Triple SMA periods must satisfy 0 < fast < mid < slow.");
        }
        if (candles.size() < static_cast<std::size_t>(slow_period) + 1) {
            return std::nullopt;
        }

        SmaIndicator fast(fast_period, WindowMode::Full);
        SmaIndicator mid(mid_period, WindowMode::Full);
        SmaIndicator slow(slow_period, WindowMode::Full);
        fast.calculate(candles);
        mid.calculate(candles);
        slow.calculate(candles);

        TripleSmaReading reading;
        reading.fast = *valueAt(fast.getResult());
        reading.mid = *valueAt(mid.getResult());
        reading.slow = *valueAt(slow.getResult());
        reading.prev_fast = *valueAt(fast.getResult(), 1);
        reading.prev_mid = *valueAt(mid.getResult(), 1);
        reading.prev_slow = *valueAt(slow.getResult(), 1);

        if (reading.prev_fast <= reading.prev_mid && reading.fast > reading.mid) {
            reading.cross = core::Side::Long;
        } else if (reading.prev_fast >= reading.prev_mid && reading.fast < reading.mid) {
            reading.cross = core::Side::Short;
        }

        if (reading.fast > reading.mid && reading.mid > reading.slow) {
            reading.alignment = core::Side::Long;
        } else if (reading.fast < reading.mid && reading.mid < reading.slow) {
            reading.alignment = core::Side::Short;
        }
        return reading;
    }

} // namespace indicators
