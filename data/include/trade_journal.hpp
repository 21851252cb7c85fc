#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// One row of the audit trail
struct TradeJournalEntry {
    std::string instrument;
    std::string event;          // OPENED, REJECTED, STOP_LOSS, TAKE_PROFIT, PROTECTION_FAILED, RELEASED
    std::string side;
    double price = 0.0;
    double quantity = 0.0;
    std::string detail;
    std::int64_t recorded_at_ms = 0;
};

// SQLite audit trail of trade lifecycle events. Written by the engine, never read
// back by it. Pass ":memory:" for an in-memory database.
class TradeJournal {
public:
    explicit TradeJournal(const std::string& db_path);
    ~TradeJournal();

    TradeJournal(const TradeJournal&) = delete;
    TradeJournal& operator=(const TradeJournal&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool record(const TradeJournalEntry& entry);

    // Rows for one instrument, oldest first
    std::vector<TradeJournalEntry> entriesFor(const std::string& instrument);

private:
    bool executeSQL(const std::string& sql);

    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
};

} // namespace data
