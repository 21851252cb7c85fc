#include <gtest/gtest.h>

#include "trade_journal.hpp"
#include "signal_journal.hpp"
#include "test_helpers.hpp"

TEST(TradeJournalTest, RecordsAndReadsBackInOrder) {
    data::TradeJournal journal(":memory:");
    ASSERT_TRUE(journal.connect());
    ASSERT_TRUE(journal.initializeSchema());

    data::TradeJournalEntry opened;
    opened.instrument = "ARPA_USDT";
    opened.event = "OPENED";
    opened.side = "SHORT";
    opened.price = 0.0415;
    opened.quantity = 10.0;
    opened.recorded_at_ms = 1700000000000LL;
    ASSERT_TRUE(journal.record(opened));

    data::TradeJournalEntry other = opened;
    other.instrument = "BTC_USDT";
    ASSERT_TRUE(journal.record(other));

    data::TradeJournalEntry failed = opened;
    failed.event = "PROTECTION_FAILED";
    failed.detail = "STOP_LOSS: trigger price invalid";
    failed.recorded_at_ms += 1000;
    ASSERT_TRUE(journal.record(failed));

    auto entries = journal.entriesFor("ARPA_USDT");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].event, "OPENED");
    EXPECT_DOUBLE_EQ(entries[0].price, 0.0415);
    EXPECT_EQ(entries[0].recorded_at_ms, 1700000000000LL);
    EXPECT_EQ(entries[1].event, "PROTECTION_FAILED");
    EXPECT_EQ(entries[1].detail, "STOP_LOSS: trigger price invalid");
}

TEST(TradeJournalTest, RecordWithoutConnectionFails) {
    data::TradeJournal journal(":memory:");
    EXPECT_FALSE(journal.isConnected());
    data::TradeJournalEntry entry;
    entry.instrument = "ARPA_USDT";
    entry.event = "OPENED";
    EXPECT_FALSE(journal.record(entry));
}

TEST(SignalJournalTest, LineCarriesEventIndicatorsAndTargets) {
    data::SignalRecord record;
    record.event.kind = core::SignalKind::Entry;
    record.event.side = core::Side::Long;
    record.event.instrument = "ARPAUSDT";
    record.event.price = 0.0415;
    record.event.strength = 0.3;
    record.event.timestamp = test_support::minute(0);
    record.indicator_values["BB_LOWER"] = 0.04;
    record.indicator_values["BB_UPPER"] = 0.0413;
    record.stop_loss = 0.041085;
    record.take_profit = 0.04233;

    EXPECT_EQ(data::SignalJournal::formatLine(record, -180),
              "2023-11-14 19:13:20 (UTC-03:00) | ARPAUSDT | ENTRY LONG | price=0.04150000 | strength=0.3000"
              " | BB_LOWER=0.04000000 | BB_UPPER=0.04130000 | sl=0.04108500 | tp=0.04233000");
}

TEST(SignalJournalTest, AlertLineHasNoTargets) {
    data::SignalRecord record;
    record.event.kind = core::SignalKind::Alert;
    record.event.side = core::Side::Short;
    record.event.instrument = "ARPAUSDT";
    record.event.price = 1.5;
    record.event.timestamp = test_support::minute(0);

    std::string line = data::SignalJournal::formatLine(record, 0);
    EXPECT_EQ(line, "2023-11-14 22:13:20 (UTC+00:00) | ARPAUSDT | ALERT SHORT | price=1.50000000 | strength=0.0000");
}
