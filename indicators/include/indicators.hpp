#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <cstddef>
#include <optional>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default; // Virtual destructor is important for interfaces!

    // Get the name of the indicator (e.g., "SMA(8)", "ADX(14)")
    virtual std::string getName() const = 0;

    // Number of leading input candles consumed before the first output value.
    // getResult()[j] corresponds to input[j + getLookback()].
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data (closed candles only).
    // It stores the result internally; too short an input yields an empty result.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Value `bars_back` positions before the end of a series.
// std::nullopt means "insufficient data", never a numeric 0.
inline std::optional<double> valueAt(const core::TimeSeries<double>& series, std::size_t bars_back = 0) {
    if (series.size() <= bars_back) {
        return std::nullopt;
    }
    return series[series.size() - 1 - bars_back];
}

} // namespace indicators
