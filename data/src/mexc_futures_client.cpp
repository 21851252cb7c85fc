#include "mexc_futures_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cmath>
#include <set>
#include <stdexcept>

namespace data {

namespace {

    constexpr const char* kPositionListPath = "/api/v1/private/position/list";
    constexpr const char* kOrderSubmitPath = "/api/v1/private/order/submit";

    constexpr int kSideOpenLong = 1;
    constexpr int kSideCloseShort = 2;
    constexpr int kSideOpenShort = 3;
    constexpr int kSideCloseLong = 4;

    constexpr int kTypeMarket = 1;
    constexpr int kTypeStopMarket = 5;
    constexpr int kTypeTakeProfitMarket = 6;

    constexpr int kOpenTypeCross = 2;
    constexpr int kPositionTypeHedge = 2;

    // Business codes MEXC uses for key/signature problems
    const std::set<int> kAuthErrorCodes = {401, 402, 406, 602, 10072};

    std::int64_t nowMillis() {
        return core::utils::toEpochMillis(std::chrono::system_clock::now());
    }

    // Shortest decimal text with at most `decimals` places ("1000", "0.041234")
    std::string formatDecimal(double value, int decimals) {
        std::string text = fmt::format("{:.{}f}", value, decimals);
        if (text.find('.') != std::string::npos) {
            while (!text.empty() && text.back() == '0') text.pop_back();
            if (!text.empty() && text.back() == '.') text.pop_back();
        }
        return text;
    }

    double toDouble(const nlohmann::json& value) {
        if (value.is_string()) {
            return std::stod(value.get<std::string>());
        }
        return value.get<double>();
    }

    // Checks the {"success":..,"code":..,"message":..} envelope
    std::optional<core::Error> envelopeError(const nlohmann::json& body) {
        if (!body.is_object()) {
            return core::Error{core::ErrorKind::MalformedData, "response is not a JSON object"};
        }
        bool success = body.value("success", false);
        if (success) {
            return std::nullopt;
        }
        int code = body.value("code", -1);
        std::string message = body.contains("message") && body["message"].is_string()
                                  ? body["message"].get<std::string>() : std::string("no message");
        core::ErrorKind kind = kAuthErrorCodes.count(code) ? core::ErrorKind::Authentication
                                                           : core::ErrorKind::ExchangeRejection;
        return core::Error{kind, fmt::format("exchange code {}: {}", code, message)};
    }

} // end anonymous namespace

MexcFuturesClient::MexcFuturesClient(RequestSigner signer, std::string base_url, int timeout_ms, int trigger_price_decimals)
    : signer_(std::move(signer)),
      base_url_(std::move(base_url)),
      timeout_ms_(timeout_ms),
      trigger_price_decimals_(trigger_price_decimals)
{
    core::logging::getLogger()->debug("MexcFuturesClient created for {}", base_url_);
}

core::Result<std::string> MexcFuturesClient::send(Method method, const std::string& path,
                                                  std::map<std::string, std::string> params)
{
    using ResultType = core::Result<std::string>;
    auto logger = core::logging::getLogger();

    std::string full_url = base_url_ + path + "?" + signer_.signedQuery(std::move(params), nowMillis());
    cpr::Header headers = {
        {"ApiKey", signer_.apiKey()},
        {"Content-Type", "application/json"}
    };

    logger->trace("{} {}", method == Method::Get ? "GET" : "POST", path);
    cpr::Response response = method == Method::Get
        ? cpr::Get(cpr::Url{full_url}, headers, cpr::Timeout{timeout_ms_})
        : cpr::Post(cpr::Url{full_url}, headers, cpr::Timeout{timeout_ms_});

    if (response.error) {
        return ResultType::failure(core::ErrorKind::Transient,
            fmt::format("{} failed: {}", path, response.error.message));
    }
    if (response.status_code == 401 || response.status_code == 403) {
        return ResultType::failure(core::ErrorKind::Authentication,
            fmt::format("{} returned HTTP {}", path, response.status_code));
    }
    if (response.status_code == 429 || response.status_code >= 500) {
        return ResultType::failure(core::ErrorKind::Transient,
            fmt::format("{} returned HTTP {}", path, response.status_code));
    }
    if (response.status_code != 200) {
        return ResultType::failure(core::ErrorKind::ExchangeRejection,
            fmt::format("{} returned HTTP {}: {}", path, response.status_code, response.text.substr(0, 200)));
    }
    return response.text;
}

core::Result<bool> MexcFuturesClient::parsePositionList(const std::string& body, const std::string& symbol) {
    using ResultType = core::Result<bool>;
    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (auto error = envelopeError(json_response)) {
            return *error;
        }
        if (!json_response.contains("data") || !json_response["data"].is_array()) {
            return ResultType::failure(core::ErrorKind::MalformedData, "position list has no 'data' array");
        }
        for (const auto& position : json_response["data"]) {
            if (position.value("symbol", std::string()) != symbol) {
                continue;
            }
            auto size_it = position.find("positionSize");
            if (size_it == position.end()) {
                size_it = position.find("holdVol");
            }
            if (size_it != position.end() && toDouble(*size_it) != 0.0) {
                return true;
            }
        }
        return false;
    } catch (const nlohmann::json::exception& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("invalid position JSON: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("non-numeric position size: {}", e.what()));
    } catch (const std::out_of_range& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("position size out of range: {}", e.what()));
    }
}

core::Result<double> MexcFuturesClient::parseOrderFill(const std::string& body) {
    using ResultType = core::Result<double>;
    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (auto error = envelopeError(json_response)) {
            return *error;
        }
        const auto& data = json_response.contains("data") ? json_response["data"] : nlohmann::json();
        if (data.is_object()) {
            for (const char* field : {"price", "dealAvgPrice"}) {
                if (data.contains(field) && !data[field].is_null()) {
                    double price = toDouble(data[field]);
                    if (price > 0.0) {
                        return price;
                    }
                }
            }
        }
        return ResultType::failure(core::ErrorKind::MalformedData, "order accepted but no fill price in response");
    } catch (const nlohmann::json::exception& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("invalid order JSON: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("non-numeric fill price: {}", e.what()));
    } catch (const std::out_of_range& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("fill price out of range: {}", e.what()));
    }
}

core::Result<bool> MexcFuturesClient::hasOpenPosition(const std::string& symbol) {
    auto body = send(Method::Get, kPositionListPath, {});
    if (!body) {
        return body.error();
    }
    return parsePositionList(body.value(), symbol);
}

core::Result<double> MexcFuturesClient::submitMarketOrder(const std::string& symbol, core::Side side, double quantity) {
    if (side == core::Side::None) {
        return core::Result<double>::failure(core::ErrorKind::Unexpected, "market order without a side");
    }
    std::map<std::string, std::string> params = {
        {"symbol", symbol},
        {"price", "0"},
        {"vol", formatDecimal(quantity, 8)},
        {"side", std::to_string(side == core::Side::Long ? kSideOpenLong : kSideOpenShort)},
        {"type", std::to_string(kTypeMarket)},
        {"openType", std::to_string(kOpenTypeCross)},
        {"positionType", std::to_string(kPositionTypeHedge)}
    };

    auto body = send(Method::Post, kOrderSubmitPath, std::move(params));
    if (!body) {
        return body.error();
    }
    auto fill = parseOrderFill(body.value());
    if (fill) {
        core::logging::getLogger()->info("{} market {} filled at {:.8f} (vol {})",
                                         symbol, core::sideToString(side), fill.value(), quantity);
    }
    return fill;
}

core::Status MexcFuturesClient::submitConditionalOrder(const std::string& symbol,
                                                       core::Side position_side,
                                                       double trigger_price,
                                                       double quantity,
                                                       ConditionalOrderType type)
{
    if (position_side == core::Side::None) {
        return core::Status::failure(core::ErrorKind::Unexpected, "conditional order without a position side");
    }
    std::map<std::string, std::string> params = {
        {"symbol", symbol},
        {"vol", formatDecimal(quantity, 8)},
        {"side", std::to_string(position_side == core::Side::Long ? kSideCloseLong : kSideCloseShort)},
        {"type", std::to_string(type == ConditionalOrderType::StopLoss ? kTypeStopMarket : kTypeTakeProfitMarket)},
        {"triggerPrice", formatDecimal(core::utils::roundTo(trigger_price, trigger_price_decimals_), trigger_price_decimals_)},
        {"openType", std::to_string(kOpenTypeCross)},
        {"positionType", std::to_string(kPositionTypeHedge)}
    };

    auto body = send(Method::Post, kOrderSubmitPath, std::move(params));
    if (!body) {
        return body.error();
    }
    try {
        if (auto error = envelopeError(nlohmann::json::parse(body.value()))) {
            return *error;
        }
    } catch (const nlohmann::json::exception& e) {
        return core::Status::failure(core::ErrorKind::MalformedData, fmt::format("invalid order JSON: {}", e.what()));
    }
    return core::success();
}

void MexcFuturesClient::verifyCredentials(const std::string& symbol) {
    auto logger = core::logging::getLogger();
    auto result = hasOpenPosition(symbol);
    if (result) {
        logger->info("MEXC credentials verified ({} position open: {}).", symbol, result.value());
        return;
    }
    if (result.error().kind == core::ErrorKind::Authentication) {
        throw core::AuthenticationException("MEXC rejected the API credentials: " + result.error().message);
    }
    logger->warn("Could not verify MEXC credentials at startup ({}): {}",
                 core::errorKindToString(result.error().kind), result.error().message);
}

} // namespace data
