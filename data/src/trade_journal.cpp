#include "trade_journal.hpp"
#include "logging.hpp"

namespace data
{

    TradeJournal::TradeJournal(const std::string &db_path)
        : database_path_(db_path), db_(nullptr)
    {
        core::logging::getLogger()->debug("TradeJournal (SQLite) created for path: {}", db_path);
    }

    TradeJournal::~TradeJournal()
    {
        disconnect();
    }

    bool TradeJournal::connect()
    {
        if (db_)
        {
            return true;
        }

        // SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE: Open for reading/writing, create if not exists
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open trade journal '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        sqlite3_busy_timeout(db_, 2000);
        core::logging::getLogger()->info("Trade journal opened: {}", database_path_);
        return true;
    }

    void TradeJournal::disconnect()
    {
        if (!db_)
        {
            return;
        }
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // This usually happens if prepared statements are not finalized
            core::logging::getLogger()->error("Error closing trade journal: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
    }

    bool TradeJournal::isConnected() const
    {
        return db_ != nullptr;
    }

    bool TradeJournal::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: trade journal not open.");
            return false;
        }

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool TradeJournal::initializeSchema()
    {
        const std::string create_events_sql = R"(
        CREATE TABLE IF NOT EXISTS trade_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            instrument TEXT NOT NULL,
            event TEXT NOT NULL,
            side TEXT NOT NULL,
            price REAL,
            quantity REAL,
            detail TEXT,
            recorded_at_ms INTEGER NOT NULL -- epoch milliseconds, UTC
        );
    )";
        const std::string create_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_trade_events_instrument
        ON trade_events (instrument, recorded_at_ms);
    )";

        bool success = executeSQL(create_events_sql) && executeSQL(create_index_sql);
        if (!success)
        {
            core::logging::getLogger()->error("Trade journal schema initialization failed.");
        }
        return success;
    }

    bool TradeJournal::record(const TradeJournalEntry &entry)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot record trade event: trade journal not open.");
            return false;
        }

        const char *sql = R"(
INSERT INTO trade_events (instrument, event, side, price, quantity, detail, recorded_at_ms)
VALUES (?, ?, ?, ?, ?, ?, ?);
)";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Safe if stmt is null
            return false;
        }

        // Indexes are 1-based
        sqlite3_bind_text(stmt, 1, entry.instrument.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, entry.event.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, entry.side.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 4, entry.price);
        sqlite3_bind_double(stmt, 5, entry.quantity);
        sqlite3_bind_text(stmt, 6, entry.detail.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 7, entry.recorded_at_ms);

        rc = sqlite3_step(stmt);
        bool success = rc == SQLITE_DONE;
        if (!success)
        {
            logger->error("Failed to insert trade event [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);

        if (success)
        {
            logger->debug("Trade journal: {} {} {} @ {}", entry.instrument, entry.event, entry.side, entry.price);
        }
        return success;
    }

    std::vector<TradeJournalEntry> TradeJournal::entriesFor(const std::string &instrument)
    {
        std::vector<TradeJournalEntry> entries;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query trade events: trade journal not open.");
            return entries;
        }

        const char *sql = R"(
            SELECT instrument, event, side, price, quantity, detail, recorded_at_ms
            FROM trade_events
            WHERE instrument = ?
            ORDER BY id ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare SELECT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return entries;
        }
        sqlite3_bind_text(stmt, 1, instrument.c_str(), -1, SQLITE_TRANSIENT);

        auto columnText = [stmt](int column) {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        };

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            TradeJournalEntry entry;
            entry.instrument = columnText(0);
            entry.event = columnText(1);
            entry.side = columnText(2);
            entry.price = sqlite3_column_double(stmt, 3);
            entry.quantity = sqlite3_column_double(stmt, 4);
            entry.detail = columnText(5);
            entry.recorded_at_ms = sqlite3_column_int64(stmt, 6);
            entries.push_back(entry);
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through trade events [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return entries;
    }

} // namespace data
