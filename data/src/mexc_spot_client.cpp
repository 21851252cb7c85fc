#include "mexc_spot_client.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <cstdint>

namespace data {

namespace {

    // MEXC sends prices and volumes as strings, open times as numbers
    double toDouble(const nlohmann::json& value) {
        if (value.is_string()) {
            return std::stod(value.get<std::string>());
        }
        return value.get<double>();
    }

} // end anonymous namespace

MexcSpotClient::MexcSpotClient(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    core::logging::getLogger()->debug("MexcSpotClient created for {}", base_url_);
}

core::Result<core::TimeSeries<core::Candle>> MexcSpotClient::fetchCandles(const std::string& symbol,
                                                                         const std::string& interval,
                                                                         int limit)
{
    using ResultType = core::Result<core::TimeSeries<core::Candle>>;
    auto logger = core::logging::getLogger();

    std::string full_url = base_url_ + "/api/v3/klines";
    logger->trace("Requesting klines: {} {} limit={}", symbol, interval, limit);

    cpr::Response response = cpr::Get(
        cpr::Url{full_url},
        cpr::Parameters{{"symbol", symbol}, {"interval", interval}, {"limit", std::to_string(limit)}},
        cpr::Header{{"User-Agent", "Mozilla/5.0"}, {"Accept", "application/json"}},
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        return ResultType::failure(core::ErrorKind::Transient,
            fmt::format("klines request for {} failed: {}", symbol, response.error.message));
    }
    if (response.status_code == 429 || response.status_code >= 500) {
        return ResultType::failure(core::ErrorKind::Transient,
            fmt::format("klines request for {} returned HTTP {}", symbol, response.status_code));
    }
    if (response.status_code != 200) {
        return ResultType::failure(core::ErrorKind::MalformedData,
            fmt::format("klines request for {} returned HTTP {}: {}", symbol, response.status_code,
                        response.text.substr(0, 200)));
    }

    auto parsed = parseKlines(response.text);
    if (parsed.ok()) {
        logger->debug("Received {} candles for {} ({}).", parsed.value().size(), symbol, interval);
    }
    return parsed;
}

core::Result<core::TimeSeries<core::Candle>> MexcSpotClient::parseKlines(const std::string& body) {
    using ResultType = core::Result<core::TimeSeries<core::Candle>>;
    core::TimeSeries<core::Candle> candles;

    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (!json_response.is_array()) {
            return ResultType::failure(core::ErrorKind::MalformedData, "klines payload is not an array");
        }
        if (json_response.empty()) {
            return ResultType::failure(core::ErrorKind::MalformedData, "klines payload is empty");
        }

        candles.reserve(json_response.size());
        for (const auto& json_candle : json_response) {
            // [openTime, open, high, low, close, volume, closeTime, quoteVolume]
            if (!json_candle.is_array() || json_candle.size() < 6) {
                return ResultType::failure(core::ErrorKind::MalformedData, "kline entry has fewer than 6 fields");
            }
            core::Candle candle;
            candle.timestamp = core::utils::fromEpochMillis(json_candle[0].get<std::int64_t>());
            candle.open = toDouble(json_candle[1]);
            candle.high = toDouble(json_candle[2]);
            candle.low = toDouble(json_candle[3]);
            candle.close = toDouble(json_candle[4]);
            candle.volume = toDouble(json_candle[5]);

            if (!candles.empty() && !(candles.back() < candle)) {
                return ResultType::failure(core::ErrorKind::MalformedData,
                    fmt::format("kline open times not increasing at index {}", candles.size()));
            }
            candles.push_back(candle);
        }
    } catch (const nlohmann::json::exception& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("invalid klines JSON: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("non-numeric kline field: {}", e.what()));
    } catch (const std::out_of_range& e) {
        return ResultType::failure(core::ErrorKind::MalformedData, fmt::format("kline field out of range: {}", e.what()));
    }
    return candles;
}

} // namespace data
