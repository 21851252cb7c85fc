#pragma once

#include <string>
#include "market_data_provider.hpp"

namespace data {

// Public kline endpoint of the MEXC spot API (GET /api/v3/klines)
class MexcSpotClient : public IMarketDataProvider {
public:
    MexcSpotClient(std::string base_url, int timeout_ms);

    core::Result<core::TimeSeries<core::Candle>> fetchCandles(const std::string& symbol,
                                                             const std::string& interval,
                                                             int limit) override;

    // Converts a klines JSON payload; exposed for tests
    static core::Result<core::TimeSeries<core::Candle>> parseKlines(const std::string& body);

private:
    std::string base_url_;
    int timeout_ms_;
};

} // namespace data
