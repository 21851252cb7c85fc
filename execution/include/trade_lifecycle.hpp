#pragma once

#include <string>
#include <optional>

#include "datatypes.hpp"
#include "result.hpp"
#include "exchange_client.hpp"

namespace data { class TradeJournal; }

namespace execution {

    enum class TradeStatus {
        None,
        Opening,
        Active
    };

    const char* tradeStatusToString(TradeStatus status);

    // Local cache of the position on one instrument; the exchange is authoritative
    struct TradeRecord {
        TradeStatus status = TradeStatus::None;
        core::Side side = core::Side::None;
        double entry_price = 0.0;
        double quantity = 0.0;
        core::Timestamp opened_at;

        bool isActive() const { return status == TradeStatus::Active; }
    };

    struct ProtectiveOrderPair {
        double stop_loss = 0.0;
        double take_profit = 0.0;
        core::Side close_side = core::Side::None;  // Leg being closed is the entry side; orders act opposite
    };

    // Stop below/above entry by stop_loss_pct, target by take_profit_pct, rounded
    ProtectiveOrderPair computeProtectiveOrders(double entry_price, core::Side side,
                                                double stop_loss_pct, double take_profit_pct,
                                                int decimals = 6);

    struct TradeSettings {
        double stop_loss_pct = 1.0;
        double take_profit_pct = 2.0;
        int trigger_price_decimals = 6;
    };

    enum class OpenOutcome {
        Opened,
        AlreadyOpen,    // Local ACTIVE or exchange reports a position; nothing submitted
        Failed          // Position query or order failed; record back to None
    };

    struct OpenResult {
        OpenOutcome outcome = OpenOutcome::Failed;
        std::optional<core::Error> error;
    };

    struct ProtectionResult {
        ProtectiveOrderPair levels;
        bool stop_loss_placed = false;
        bool take_profit_placed = false;

        bool complete() const { return stop_loss_placed && take_profit_placed; }
    };

    // NONE -> OPENING -> ACTIVE -> (external close observed) -> NONE
    class TradeLifecycleManager {
    public:
        TradeLifecycleManager(data::IExchangeClient& exchange, TradeSettings settings,
                              data::TradeJournal* journal = nullptr);

        // Never opens while `record` is ACTIVE; always re-checks the exchange first
        OpenResult open(const std::string& instrument, core::Side side, double quantity,
                        TradeRecord& record, core::Timestamp now);

        // Submits stop-loss and take-profit; failures are reported, never rolled back
        ProtectionResult attachProtection(const std::string& instrument, const TradeRecord& record);

        // True when an ACTIVE record was released because the exchange reports no position.
        // A failed query leaves the record untouched.
        bool reconcile(const std::string& instrument, TradeRecord& record);

    private:
        void journal(const std::string& instrument, const char* event, core::Side side,
                     double price, double quantity, const std::string& detail);

        data::IExchangeClient& exchange_;
        TradeSettings settings_;
        data::TradeJournal* journal_;
    };

} // namespace execution
