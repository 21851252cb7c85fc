#include <gtest/gtest.h>

#include "mexc_spot_client.hpp"
#include "mexc_futures_client.hpp"
#include "utils.hpp"

using data::MexcSpotClient;
using data::MexcFuturesClient;

TEST(MexcKlinesTest, ParsesStringAndNumericFields) {
    const std::string body = R"([
        [1700000000000, "0.04100", "0.04150", "0.04090", "0.04120", "152030.5", 1700000059999, "6263.1"],
        [1700000060000, 0.0412, 0.0416, 0.0411, 0.0415, 9800, 1700000119999, 406.7]
    ])";

    auto parsed = MexcSpotClient::parseKlines(body);
    ASSERT_TRUE(parsed.ok()) << parsed.error().message;
    const auto& candles = parsed.value();
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_EQ(core::utils::toEpochMillis(candles[0].timestamp), 1700000000000LL);
    EXPECT_DOUBLE_EQ(candles[0].open, 0.041);
    EXPECT_DOUBLE_EQ(candles[0].high, 0.0415);
    EXPECT_DOUBLE_EQ(candles[0].close, 0.0412);
    EXPECT_DOUBLE_EQ(candles[0].volume, 152030.5);
    EXPECT_DOUBLE_EQ(candles[1].close, 0.0415);
}

TEST(MexcKlinesTest, EmptyOrBrokenPayloadIsMalformed) {
    for (const char* body : {"[]", "{\"code\":-1121}", "not json",
                             "[[1700000000000, \"0.041\", \"0.042\"]]",
                             "[[1700000060000,1,1,1,1,1],[1700000000000,1,1,1,1,1]]",
                             "[[1700000000000,\"abc\",1,1,1,1]]"}) {
        auto parsed = MexcSpotClient::parseKlines(body);
        ASSERT_FALSE(parsed.ok()) << body;
        EXPECT_EQ(parsed.error().kind, core::ErrorKind::MalformedData) << body;
    }
}

TEST(MexcPositionsTest, DetectsOpenPositionForSymbol) {
    const std::string body = R"({"success": true, "code": 0, "data": [
        {"symbol": "BTC_USDT", "positionType": 1, "holdVol": 5},
        {"symbol": "ARPA_USDT", "positionType": 2, "positionSize": "12"}
    ]})";

    auto arpa = MexcFuturesClient::parsePositionList(body, "ARPA_USDT");
    ASSERT_TRUE(arpa.ok());
    EXPECT_TRUE(arpa.value());

    auto btc = MexcFuturesClient::parsePositionList(body, "BTC_USDT");
    ASSERT_TRUE(btc.ok());
    EXPECT_TRUE(btc.value());

    auto eth = MexcFuturesClient::parsePositionList(body, "ETH_USDT");
    ASSERT_TRUE(eth.ok());
    EXPECT_FALSE(eth.value());
}

TEST(MexcPositionsTest, ZeroSizeMeansNoPosition) {
    auto result = MexcFuturesClient::parsePositionList(
        R"({"success": true, "code": 0, "data": [{"symbol": "ARPA_USDT", "positionSize": 0}]})", "ARPA_USDT");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value());
}

TEST(MexcPositionsTest, AuthenticationCodesAreClassified) {
    auto result = MexcFuturesClient::parsePositionList(
        R"({"success": false, "code": 602, "message": "Signature verification failed"})", "ARPA_USDT");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, core::ErrorKind::Authentication);
}

TEST(MexcOrdersTest, FillPriceFromOrderResponse) {
    auto fill = MexcFuturesClient::parseOrderFill(
        R"({"success": true, "code": 0, "data": {"orderId": "7391", "price": "0.04153"}})");
    ASSERT_TRUE(fill.ok());
    EXPECT_DOUBLE_EQ(fill.value(), 0.04153);

    auto average = MexcFuturesClient::parseOrderFill(
        R"({"success": true, "code": 0, "data": {"orderId": "7392", "dealAvgPrice": 0.0416}})");
    ASSERT_TRUE(average.ok());
    EXPECT_DOUBLE_EQ(average.value(), 0.0416);
}

TEST(MexcOrdersTest, RejectionAndMissingFill) {
    auto rejected = MexcFuturesClient::parseOrderFill(
        R"({"success": false, "code": 2005, "message": "Insufficient balance"})");
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.error().kind, core::ErrorKind::ExchangeRejection);

    auto no_price = MexcFuturesClient::parseOrderFill(R"({"success": true, "code": 0, "data": "7393"})");
    ASSERT_FALSE(no_price.ok());
    EXPECT_EQ(no_price.error().kind, core::ErrorKind::MalformedData);
}

TEST(MexcOrdersTest, OutOfRangeNumbersAreMalformed) {
    auto fill = MexcFuturesClient::parseOrderFill(R"({"success": true, "code": 0, "data": {"price": "1e999"}})");
    ASSERT_FALSE(fill.ok());
    EXPECT_EQ(fill.error().kind, core::ErrorKind::MalformedData);

    auto position = MexcFuturesClient::parsePositionList(
        R"({"success": true, "code": 0, "data": [{"symbol": "ARPA_USDT", "positionSize": "1e999"}]})", "ARPA_USDT");
    ASSERT_FALSE(position.ok());
    EXPECT_EQ(position.error().kind, core::ErrorKind::MalformedData);
}
