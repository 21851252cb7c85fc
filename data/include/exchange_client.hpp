#pragma once

#include <string>
#include "datatypes.hpp"
#include "result.hpp"

namespace data {

enum class ConditionalOrderType {
    StopLoss,
    TakeProfit
};

inline const char* conditionalOrderTypeToString(ConditionalOrderType type) {
    return type == ConditionalOrderType::StopLoss ? "STOP_LOSS" : "TAKE_PROFIT";
}

// Private (signed) trading calls. Hedge mode: opening and closing are explicit legs.
class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    // Authoritative: true when the exchange holds a non-zero position on `symbol`
    virtual core::Result<bool> hasOpenPosition(const std::string& symbol) = 0;

    // Opens `side` at market; returns the fill price
    virtual core::Result<double> submitMarketOrder(const std::string& symbol, core::Side side, double quantity) = 0;

    // Conditional close order for an open `position_side` leg
    virtual core::Status submitConditionalOrder(const std::string& symbol,
                                                core::Side position_side,
                                                double trigger_price,
                                                double quantity,
                                                ConditionalOrderType type) = 0;
};

} // namespace data
