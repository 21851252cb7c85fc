#pragma once

#include <chrono>
#include <deque>
#include <set>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "result.hpp"
#include "exchange_client.hpp"
#include "market_data_provider.hpp"
#include "notifier.hpp"

namespace test_support {

    // One-minute candles from closes; high/low sit `spread` away from the close
    core::TimeSeries<core::Candle> candlesFromCloses(const std::vector<double>& closes, double spread = 0.05);

    core::Timestamp minute(int index);

    class FakeMarketData : public data::IMarketDataProvider {
    public:
        core::Result<core::TimeSeries<core::Candle>> fetchCandles(const std::string& symbol,
                                                                 const std::string& interval,
                                                                 int limit) override;

        core::TimeSeries<core::Candle> candles;
        std::deque<core::Error> failures;     // Returned, in order, before the candles
        bool always_fail = false;
        bool throw_on_fetch = false;
        std::set<std::string> failing_symbols;
        std::set<std::string> throwing_symbols;
        int calls = 0;
        std::string last_symbol;
        int last_limit = 0;
    };

    class FakeExchange : public data::IExchangeClient {
    public:
        core::Result<bool> hasOpenPosition(const std::string& symbol) override;
        core::Result<double> submitMarketOrder(const std::string& symbol, core::Side side, double quantity) override;
        core::Status submitConditionalOrder(const std::string& symbol, core::Side position_side,
                                            double trigger_price, double quantity,
                                            data::ConditionalOrderType type) override;

        struct ConditionalOrder {
            core::Side position_side;
            double trigger_price;
            double quantity;
            data::ConditionalOrderType type;
        };

        bool position_open = false;
        bool position_query_fails = false;
        bool reject_market_orders = false;
        bool throw_on_market_order = false;
        bool reject_stop_loss = false;
        double fill_price = 100.0;

        int position_queries = 0;
        int market_orders = 0;
        core::Side last_order_side = core::Side::None;
        std::vector<ConditionalOrder> conditional_orders;
    };

    class RecordingNotifier : public data::INotifier {
    public:
        core::Status sendMessage(const std::string& text) override;
        core::Status sendDocument(const std::string& path, const std::string& caption) override;

        std::vector<std::string> messages;
        bool fail = false;
    };

} // namespace test_support
