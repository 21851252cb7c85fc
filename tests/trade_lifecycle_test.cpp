#include <gtest/gtest.h>

#include "trade_lifecycle.hpp"
#include "trade_journal.hpp"
#include "test_helpers.hpp"

using namespace execution;
using test_support::FakeExchange;

namespace {

    TradeSettings defaultSettings() {
        TradeSettings settings;
        settings.stop_loss_pct = 1.0;
        settings.take_profit_pct = 2.0;
        settings.trigger_price_decimals = 6;
        return settings;
    }

} // end anonymous namespace

TEST(ProtectiveOrdersTest, LongAndShortOffsets) {
    auto long_levels = computeProtectiveOrders(100.0, core::Side::Long, 1.0, 2.0);
    EXPECT_DOUBLE_EQ(long_levels.stop_loss, 99.0);
    EXPECT_DOUBLE_EQ(long_levels.take_profit, 102.0);
    EXPECT_EQ(long_levels.close_side, core::Side::Short);

    auto short_levels = computeProtectiveOrders(100.0, core::Side::Short, 1.0, 2.0);
    EXPECT_DOUBLE_EQ(short_levels.stop_loss, 101.0);
    EXPECT_DOUBLE_EQ(short_levels.take_profit, 98.0);
    EXPECT_EQ(short_levels.close_side, core::Side::Long);
}

TEST(ProtectiveOrdersTest, TriggerPricesRoundedToSixDecimals) {
    auto levels = computeProtectiveOrders(0.0412345, core::Side::Long, 1.0, 2.0);
    EXPECT_DOUBLE_EQ(levels.stop_loss, 0.040822);
    EXPECT_DOUBLE_EQ(levels.take_profit, 0.042059);
    EXPECT_THROW(computeProtectiveOrders(1.0, core::Side::None, 1.0, 2.0), std::invalid_argument);
}

TEST(TradeLifecycleTest, OpensWhenSlotIsFree) {
    FakeExchange exchange;
    exchange.fill_price = 0.0415;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;

    auto result = manager.open("ARPA_USDT", core::Side::Long, 10.0, record, test_support::minute(1));
    EXPECT_EQ(result.outcome, OpenOutcome::Opened);
    EXPECT_EQ(record.status, TradeStatus::Active);
    EXPECT_EQ(record.side, core::Side::Long);
    EXPECT_DOUBLE_EQ(record.entry_price, 0.0415);
    EXPECT_DOUBLE_EQ(record.quantity, 10.0);
    EXPECT_EQ(exchange.market_orders, 1);
    EXPECT_EQ(exchange.last_order_side, core::Side::Long);
}

TEST(TradeLifecycleTest, AtMostOnePositionPerInstrument) {
    FakeExchange exchange;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;

    ASSERT_EQ(manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1)).outcome,
              OpenOutcome::Opened);
    auto second = manager.open("ARPA_USDT", core::Side::Short, 1.0, record, test_support::minute(2));
    EXPECT_EQ(second.outcome, OpenOutcome::AlreadyOpen);
    EXPECT_EQ(exchange.market_orders, 1);
    EXPECT_EQ(record.side, core::Side::Long);
}

TEST(TradeLifecycleTest, ExchangePositionBlocksEntryEvenWithEmptyLocalRecord) {
    FakeExchange exchange;
    exchange.position_open = true; // Opened manually or before a restart
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;

    auto result = manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1));
    EXPECT_EQ(result.outcome, OpenOutcome::AlreadyOpen);
    EXPECT_EQ(exchange.market_orders, 0);
    EXPECT_EQ(record.status, TradeStatus::None);
}

TEST(TradeLifecycleTest, PositionQueryFailureSubmitsNothing) {
    FakeExchange exchange;
    exchange.position_query_fails = true;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;

    auto result = manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1));
    EXPECT_EQ(result.outcome, OpenOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, core::ErrorKind::Transient);
    EXPECT_EQ(exchange.market_orders, 0);
}

TEST(TradeLifecycleTest, RejectedOrderReturnsRecordToNone) {
    FakeExchange exchange;
    exchange.reject_market_orders = true;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;

    auto result = manager.open("ARPA_USDT", core::Side::Short, 1.0, record, test_support::minute(1));
    EXPECT_EQ(result.outcome, OpenOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, core::ErrorKind::ExchangeRejection);
    EXPECT_EQ(record.status, TradeStatus::None);
    EXPECT_EQ(record.side, core::Side::None);
}

TEST(TradeLifecycleTest, ThrowingOrderSubmissionNeverLeavesRecordOpening) {
    data::TradeJournal journal(":memory:");
    ASSERT_TRUE(journal.connect());
    ASSERT_TRUE(journal.initializeSchema());

    FakeExchange exchange;
    exchange.throw_on_market_order = true;
    TradeLifecycleManager manager(exchange, defaultSettings(), &journal);
    TradeRecord record;

    OpenResult result;
    ASSERT_NO_THROW(result = manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1)));
    EXPECT_EQ(result.outcome, OpenOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, core::ErrorKind::Unexpected);
    EXPECT_EQ(record.status, TradeStatus::None);
    EXPECT_EQ(record.side, core::Side::None);

    auto entries = journal.entriesFor("ARPA_USDT");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].event, "REJECTED");
}

TEST(TradeLifecycleTest, ProtectionUsesHedgeLegAndTriggers) {
    FakeExchange exchange;
    exchange.fill_price = 100.0;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;
    manager.open("ARPA_USDT", core::Side::Short, 3.0, record, test_support::minute(1));

    auto protection = manager.attachProtection("ARPA_USDT", record);
    EXPECT_TRUE(protection.complete());
    ASSERT_EQ(exchange.conditional_orders.size(), 2u);
    EXPECT_EQ(exchange.conditional_orders[0].type, data::ConditionalOrderType::StopLoss);
    EXPECT_DOUBLE_EQ(exchange.conditional_orders[0].trigger_price, 101.0);
    EXPECT_EQ(exchange.conditional_orders[0].position_side, core::Side::Short);
    EXPECT_DOUBLE_EQ(exchange.conditional_orders[0].quantity, 3.0);
    EXPECT_EQ(exchange.conditional_orders[1].type, data::ConditionalOrderType::TakeProfit);
    EXPECT_DOUBLE_EQ(exchange.conditional_orders[1].trigger_price, 98.0);
}

TEST(TradeLifecycleTest, ProtectionFailureNeverRollsBackEntry) {
    FakeExchange exchange;
    exchange.reject_stop_loss = true;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;
    manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1));

    auto protection = manager.attachProtection("ARPA_USDT", record);
    EXPECT_FALSE(protection.stop_loss_placed);
    EXPECT_TRUE(protection.take_profit_placed);
    EXPECT_FALSE(protection.complete());
    EXPECT_EQ(record.status, TradeStatus::Active);
    EXPECT_EQ(exchange.market_orders, 1);
}

TEST(TradeLifecycleTest, ReconcileReleasesClosedPosition) {
    FakeExchange exchange;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;
    manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1));

    EXPECT_FALSE(manager.reconcile("ARPA_USDT", record));   // Still open
    EXPECT_TRUE(record.isActive());

    exchange.position_open = false;                           // Stop-loss hit on the exchange
    EXPECT_TRUE(manager.reconcile("ARPA_USDT", record));
    EXPECT_EQ(record.status, TradeStatus::None);
    EXPECT_EQ(record.side, core::Side::None);

    EXPECT_FALSE(manager.reconcile("ARPA_USDT", record));    // Nothing to release twice
}

TEST(TradeLifecycleTest, ReconcileKeepsRecordWhenQueryFails) {
    FakeExchange exchange;
    TradeLifecycleManager manager(exchange, defaultSettings());
    TradeRecord record;
    manager.open("ARPA_USDT", core::Side::Long, 1.0, record, test_support::minute(1));

    exchange.position_open = false;
    exchange.position_query_fails = true;
    EXPECT_FALSE(manager.reconcile("ARPA_USDT", record));
    EXPECT_TRUE(record.isActive());
}

TEST(TradeLifecycleTest, LifecycleEventsReachTradeJournal) {
    data::TradeJournal journal(":memory:");
    ASSERT_TRUE(journal.connect());
    ASSERT_TRUE(journal.initializeSchema());

    FakeExchange exchange;
    exchange.fill_price = 50.0;
    TradeLifecycleManager manager(exchange, defaultSettings(), &journal);
    TradeRecord record;
    manager.open("ARPA_USDT", core::Side::Long, 2.0, record, test_support::minute(1));
    manager.attachProtection("ARPA_USDT", record);
    exchange.position_open = false;
    manager.reconcile("ARPA_USDT", record);

    auto entries = journal.entriesFor("ARPA_USDT");
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].event, "OPENED");
    EXPECT_DOUBLE_EQ(entries[0].price, 50.0);
    EXPECT_EQ(entries[0].side, "LONG");
    EXPECT_EQ(entries[1].event, "STOP_LOSS");
    EXPECT_DOUBLE_EQ(entries[1].price, 49.5);
    EXPECT_EQ(entries[2].event, "TAKE_PROFIT");
    EXPECT_DOUBLE_EQ(entries[2].price, 51.0);
    EXPECT_EQ(entries[3].event, "RELEASED");
}
