#include "trade_lifecycle.hpp"
#include "trade_journal.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace execution {

    const char* tradeStatusToString(TradeStatus status) {
        switch (status) {
            case TradeStatus::None:    return "NONE";
            case TradeStatus::Opening: return "OPENING";
            case TradeStatus::Active:  return "ACTIVE";
        }
        return "UNKNOWN";
    }

    ProtectiveOrderPair computeProtectiveOrders(double entry_price, core::Side side,
                                                double stop_loss_pct, double take_profit_pct,
                                                int decimals)
    {
        if (side == core::Side::None) {
            throw std::invalid_argument("Protective orders need a position side.");
        }
        ProtectiveOrderPair pair;
        pair.close_side = core::opposite(side);
        const double stop_offset = stop_loss_pct / 100.0;
        const double target_offset = take_profit_pct / 100.0;

        if (side == core::Side::Long) {
            pair.stop_loss = core::utils::roundTo(entry_price * (1.0 - stop_offset), decimals);
            pair.take_profit = core::utils::roundTo(entry_price * (1.0 + target_offset), decimals);
        } else {
            pair.stop_loss = core::utils::roundTo(entry_price * (1.0 + stop_offset), decimals);
            pair.take_profit = core::utils::roundTo(entry_price * (1.0 - target_offset), decimals);
        }
        return pair;
    }

    TradeLifecycleManager::TradeLifecycleManager(data::IExchangeClient& exchange, TradeSettings settings,
                                                 data::TradeJournal* journal)
        : exchange_(exchange), settings_(settings), journal_(journal)
    {}

    void TradeLifecycleManager::journal(const std::string& instrument, const char* event, core::Side side,
                                        double price, double quantity, const std::string& detail)
    {
        if (!journal_) {
            return;
        }
        data::TradeJournalEntry entry;
        entry.instrument = instrument;
        entry.event = event;
        entry.side = core::sideToString(side);
        entry.price = price;
        entry.quantity = quantity;
        entry.detail = detail;
        entry.recorded_at_ms = core::utils::toEpochMillis(std::chrono::system_clock::now());
        if (!journal_->record(entry)) {
            core::logging::getLogger()->warn("{}: trade journal write failed for {}", instrument, event);
        }
    }

    OpenResult TradeLifecycleManager::open(const std::string& instrument, core::Side side, double quantity,
                                           TradeRecord& record, core::Timestamp now)
    {
        auto logger = core::logging::getLogger();
        OpenResult result;

        if (record.isActive()) {
            logger->info("{}: {} trade already active locally, entry ignored.", instrument, core::sideToString(record.side));
            result.outcome = OpenOutcome::AlreadyOpen;
            return result;
        }
        if (side == core::Side::None || quantity <= 0.0) {
            result.error = core::Error{core::ErrorKind::Unexpected, "open() needs a side and a positive quantity"};
            return result;
        }

        // Local memory is only a cache: ask the exchange
        auto position = exchange_.hasOpenPosition(instrument);
        if (!position) {
            logger->warn("{}: position check failed ({}): {}", instrument,
                         core::errorKindToString(position.error().kind), position.error().message);
            result.error = position.error();
            return result;
        }
        if (position.value()) {
            logger->info("{}: exchange reports an open position, entry skipped.", instrument);
            result.outcome = OpenOutcome::AlreadyOpen;
            return result;
        }

        record.status = TradeStatus::Opening;
        record.side = side;
        logger->info("{}: submitting {} market order, vol {}", instrument, core::sideToString(side), quantity);

        core::Result<double> fill = core::Error{core::ErrorKind::Unexpected, "no order response"};
        try {
            fill = exchange_.submitMarketOrder(instrument, side, quantity);
        } catch (const std::exception& e) {
            // The record must never stay OPENING
            fill = core::Error{core::ErrorKind::Unexpected, fmt::format("market order threw: {}", e.what())};
        }
        if (!fill) {
            logger->error("{}: market order rejected ({}): {}", instrument,
                          core::errorKindToString(fill.error().kind), fill.error().message);
            journal(instrument, "REJECTED", side, 0.0, quantity, fill.error().message);
            record = TradeRecord{};
            result.error = fill.error();
            return result;
        }

        record.status = TradeStatus::Active;
        record.entry_price = fill.value();
        record.quantity = quantity;
        record.opened_at = now;
        journal(instrument, "OPENED", side, record.entry_price, quantity, "");

        result.outcome = OpenOutcome::Opened;
        return result;
    }

    ProtectionResult TradeLifecycleManager::attachProtection(const std::string& instrument, const TradeRecord& record) {
        auto logger = core::logging::getLogger();
        ProtectionResult result;
        if (!record.isActive()) {
            logger->warn("{}: attachProtection called without an active trade.", instrument);
            return result;
        }

        result.levels = computeProtectiveOrders(record.entry_price, record.side,
                                                settings_.stop_loss_pct, settings_.take_profit_pct,
                                                settings_.trigger_price_decimals);

        auto place = [&](data::ConditionalOrderType type, double trigger, const char* event) {
            core::Status status = exchange_.submitConditionalOrder(instrument, record.side, trigger,
                                                                   record.quantity, type);
            if (!status) {
                logger->error("{}: {} at {} not placed ({}): {}. Position stays open without it.",
                              instrument, data::conditionalOrderTypeToString(type), trigger,
                              core::errorKindToString(status.error().kind), status.error().message);
                journal(instrument, "PROTECTION_FAILED", record.side, trigger, record.quantity,
                        std::string(data::conditionalOrderTypeToString(type)) + ": " + status.error().message);
                return false;
            }
            journal(instrument, event, record.side, trigger, record.quantity, "");
            return true;
        };

        result.stop_loss_placed = place(data::ConditionalOrderType::StopLoss, result.levels.stop_loss, "STOP_LOSS");
        result.take_profit_placed = place(data::ConditionalOrderType::TakeProfit, result.levels.take_profit, "TAKE_PROFIT");

        logger->info("{}: protection for {} entry {:.8f}: SL {} [{}], TP {} [{}]", instrument,
                     core::sideToString(record.side), record.entry_price,
                     result.levels.stop_loss, result.stop_loss_placed ? "ok" : "FAILED",
                     result.levels.take_profit, result.take_profit_placed ? "ok" : "FAILED");
        return result;
    }

    bool TradeLifecycleManager::reconcile(const std::string& instrument, TradeRecord& record) {
        if (!record.isActive()) {
            return false;
        }
        auto position = exchange_.hasOpenPosition(instrument);
        if (!position) {
            core::logging::getLogger()->warn("{}: reconcile skipped, position check failed: {}",
                                             instrument, position.error().message);
            return false;
        }
        if (position.value()) {
            return false;
        }

        core::logging::getLogger()->info("{}: {} position closed on the exchange, slot released.",
                                         instrument, core::sideToString(record.side));
        journal(instrument, "RELEASED", record.side, record.entry_price, record.quantity, "");
        record = TradeRecord{};
        return true;
    }

} // namespace execution
