#include "test_helpers.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace test_support {

    core::Timestamp minute(int index) {
        return core::utils::fromEpochMillis(1700000000000LL + static_cast<std::int64_t>(index) * 60000LL);
    }

    core::TimeSeries<core::Candle> candlesFromCloses(const std::vector<double>& closes, double spread) {
        core::TimeSeries<core::Candle> candles;
        for (std::size_t i = 0; i < closes.size(); ++i) {
            core::Candle candle;
            candle.timestamp = minute(static_cast<int>(i));
            candle.open = i == 0 ? closes[i] : closes[i - 1];
            candle.close = closes[i];
            candle.high = std::max(candle.open, candle.close) + spread;
            candle.low = std::min(candle.open, candle.close) - spread;
            candle.volume = 1000.0;
            candles.push_back(candle);
        }
        return candles;
    }

    core::Result<core::TimeSeries<core::Candle>> FakeMarketData::fetchCandles(const std::string& symbol,
                                                                             const std::string&,
                                                                             int limit)
    {
        ++calls;
        last_symbol = symbol;
        last_limit = limit;
        if (throw_on_fetch || throwing_symbols.count(symbol) > 0) {
            throw std::runtime_error("provider exploded");
        }
        if (always_fail || failing_symbols.count(symbol) > 0) {
            return core::Error{core::ErrorKind::Transient, "timeout"};
        }
        if (!failures.empty()) {
            core::Error error = failures.front();
            failures.pop_front();
            return error;
        }
        return candles;
    }

    core::Result<bool> FakeExchange::hasOpenPosition(const std::string&) {
        ++position_queries;
        if (position_query_fails) {
            return core::Error{core::ErrorKind::Transient, "position query timed out"};
        }
        return position_open;
    }

    core::Result<double> FakeExchange::submitMarketOrder(const std::string&, core::Side side, double) {
        ++market_orders;
        last_order_side = side;
        if (throw_on_market_order) {
            throw std::out_of_range("stod");
        }
        if (reject_market_orders) {
            return core::Error{core::ErrorKind::ExchangeRejection, "insufficient margin"};
        }
        position_open = true;
        return fill_price;
    }

    core::Status FakeExchange::submitConditionalOrder(const std::string&, core::Side position_side,
                                                      double trigger_price, double quantity,
                                                      data::ConditionalOrderType type)
    {
        if (reject_stop_loss && type == data::ConditionalOrderType::StopLoss) {
            return core::Error{core::ErrorKind::ExchangeRejection, "trigger price invalid"};
        }
        conditional_orders.push_back({position_side, trigger_price, quantity, type});
        return core::success();
    }

    core::Status RecordingNotifier::sendMessage(const std::string& text) {
        messages.push_back(text);
        if (fail) {
            return core::Error{core::ErrorKind::Notification, "chat unreachable"};
        }
        return core::success();
    }

    core::Status RecordingNotifier::sendDocument(const std::string& path, const std::string& caption) {
        return sendMessage(caption + " [" + path + "]");
    }

} // namespace test_support
