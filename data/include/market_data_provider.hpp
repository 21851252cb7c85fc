#pragma once

#include <string>
#include "datatypes.hpp" // For TimeSeries, Candle
#include "result.hpp"

namespace data {

class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // Most recent `limit` candles, ascending by open time. The last one may still be
    // forming; callers drop it. Empty or malformed responses are MalformedData errors,
    // never an empty success.
    virtual core::Result<core::TimeSeries<core::Candle>> fetchCandles(const std::string& symbol,
                                                                     const std::string& interval,
                                                                     int limit) = 0;
};

} // namespace data
