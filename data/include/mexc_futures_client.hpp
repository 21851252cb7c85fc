#pragma once

#include <map>
#include <string>
#include <optional>
#include "exchange_client.hpp"
#include "request_signer.hpp"

namespace data {

// MEXC contract (futures) API, cross margin, hedge mode.
//   side: 1 open long, 2 close short, 3 open short, 4 close long
//   type: 1 market, 5 stop market, 6 take-profit market
class MexcFuturesClient : public IExchangeClient {
public:
    MexcFuturesClient(RequestSigner signer, std::string base_url, int timeout_ms, int trigger_price_decimals = 6);

    core::Result<bool> hasOpenPosition(const std::string& symbol) override;
    core::Result<double> submitMarketOrder(const std::string& symbol, core::Side side, double quantity) override;
    core::Status submitConditionalOrder(const std::string& symbol,
                                        core::Side position_side,
                                        double trigger_price,
                                        double quantity,
                                        ConditionalOrderType type) override;

    // Signed position query run once at startup. Throws core::AuthenticationException
    // when the exchange rejects the credentials; other failures are only logged.
    void verifyCredentials(const std::string& symbol);

    // Response helpers, exposed for tests
    static core::Result<bool> parsePositionList(const std::string& body, const std::string& symbol);
    static core::Result<double> parseOrderFill(const std::string& body);

private:
    enum class Method { Get, Post };

    // Returns the body of a successful call or the classified error
    core::Result<std::string> send(Method method, const std::string& path,
                                   std::map<std::string, std::string> params);

    RequestSigner signer_;
    std::string base_url_;
    int timeout_ms_;
    int trigger_price_decimals_;
};

} // namespace data
