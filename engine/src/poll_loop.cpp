#include "poll_loop.hpp"
#include "market_data_provider.hpp"
#include "notifier.hpp"
#include "signal_journal.hpp"
#include "connectivity_probe.hpp"
#include "watchdog.hpp"
#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <thread>

namespace engine {

    namespace {

        const char* strategyKindName(core::StrategyKind kind) {
            return kind == core::StrategyKind::TripleSma ? "triple_sma" : "bollinger_breakout";
        }

        std::string formatPrice(double price) {
            return fmt::format("{:.8f}", price);
        }

    } // end anonymous namespace

    PollLoop::PollLoop(const core::AppConfig& config, PollLoopServices services, std::atomic<bool>& shutdown_requested)
        : config_(config),
          services_(services),
          shutdown_requested_(shutdown_requested),
          retry_policy_(supervisor::RetryPolicy::fromConfig(config.retry)),
          sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
          clock_([] { return std::chrono::system_clock::now(); })
    {
        if (!services_.market_data || !services_.notifier) {
            throw core::ConfigException("PollLoop needs a market data provider and a notifier.");
        }

        auto logger = core::logging::getLogger();
        for (const auto& instrument_config : config_.instruments) {
            Instrument instrument;
            instrument.config = instrument_config;
            std::string name = instrument_config.market_symbol + ":" + strategyKindName(instrument_config.strategy.kind);
            instrument.detector = std::make_unique<strategy_engine::SignalDetector>(
                strategy_engine::StrategyFactory::createStrategy(name, instrument_config.strategy),
                instrument_config.strategy.policy);

            if (instrument_config.trading_enabled && !services_.lifecycle) {
                logger->warn("{}: trading enabled but no exchange client configured; alert-only.",
                             instrument_config.market_symbol);
            }
            logger->info("Instrument {} ({}): strategy {}, {} window {}, {}",
                         instrument_config.market_symbol, instrument_config.trading_symbol,
                         instrument.detector->getStrategy().getName(), instrument_config.interval,
                         instrument_config.window_size,
                         instrument_config.trading_enabled ? "trading" : "alert-only");
            instruments_.push_back(std::move(instrument));
        }
    }

    void PollLoop::setSleeper(supervisor::Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
    }

    void PollLoop::setClock(WallClock clock) {
        clock_ = std::move(clock);
    }

    bool PollLoop::tradingEnabled(const Instrument& instrument) const {
        return instrument.config.trading_enabled && services_.lifecycle != nullptr;
    }

    const InstrumentState* PollLoop::stateFor(const std::string& market_symbol) const {
        for (const auto& instrument : instruments_) {
            if (instrument.config.market_symbol == market_symbol) {
                return &instrument.state;
            }
        }
        return nullptr;
    }

    void PollLoop::sleepFor(std::chrono::milliseconds duration) {
        const std::chrono::milliseconds slice(std::max(1, config_.loop.sleep_slice_ms));
        while (duration.count() > 0 && !shutdown_requested_.load()) {
            auto step = std::min(duration, slice);
            sleeper_(step);
            duration -= step;
        }
    }

    void PollLoop::notify(const std::string& text, const char* what) {
        data::reportDelivery(services_.notifier->sendMessage(text), what);
    }

    void PollLoop::run() {
        auto logger = core::logging::getLogger();
        const std::chrono::milliseconds interval(config_.loop.interval_seconds * 1000LL);
        logger->info("Poll loop started: {} instrument(s), every {}s.", instruments_.size(), config_.loop.interval_seconds);

        while (!shutdown_requested_.load()) {
            auto started = std::chrono::steady_clock::now();
            try {
                runCycle();
            } catch (const std::exception& e) {
                logger->error("Unexpected error in poll cycle: {}. Pausing {}s.", e.what(), config_.loop.error_sleep_seconds);
                sleepFor(std::chrono::milliseconds(config_.loop.error_sleep_seconds * 1000LL));
                continue;
            } catch (...) {
                logger->error("Unknown non-standard error in poll cycle. Pausing {}s.", config_.loop.error_sleep_seconds);
                sleepFor(std::chrono::milliseconds(config_.loop.error_sleep_seconds * 1000LL));
                continue;
            }

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            if (elapsed < interval) {
                sleepFor(interval - elapsed);
            } else {
                logger->debug("Cycle took {} ms, longer than the {}s interval.", elapsed.count(), config_.loop.interval_seconds);
            }
        }
        logger->info("Poll loop stopped (shutdown requested).");
    }

    bool PollLoop::runCycle() {
        auto logger = core::logging::getLogger();

        if (services_.probe) {
            supervisor::ProbeResult probe = services_.probe->probe();
            if (!probe.reachable) {
                logger->warn("Exchange unreachable ({}); pausing {}s before the next cycle.",
                             probe.detail, config_.connectivity.cooldown_seconds);
                sleepFor(std::chrono::milliseconds(config_.connectivity.cooldown_seconds * 1000LL));
                return false;
            }
        }

        for (auto& instrument : instruments_) {
            if (shutdown_requested_.load()) {
                break;
            }
            try {
                processInstrument(instrument);
            } catch (const std::exception& e) {
                logger->error("{}: error while processing, skipped this cycle: {}",
                              instrument.config.market_symbol, e.what());
            }
        }

        if (services_.watchdog) {
            services_.watchdog->recordCycleCompleted();
        }
        return true;
    }

    void PollLoop::processInstrument(Instrument& instrument) {
        auto logger = core::logging::getLogger();
        const core::InstrumentConfig& cfg = instrument.config;
        InstrumentState& state = instrument.state;

        // 1. Authoritative position check releases the slot after an external close
        if (tradingEnabled(instrument) && state.trade.isActive()) {
            core::Side closed_side = state.trade.side;
            double entry_price = state.trade.entry_price;
            if (services_.lifecycle->reconcile(cfg.trading_symbol, state.trade)) {
                notify(fmt::format("[CLOSED] {} {} trade closed (entry {}), bot released.",
                                   cfg.trading_symbol, core::sideToString(closed_side), formatPrice(entry_price)),
                       "release notification");
            }
        }

        // 2. Candles, with bounded retry
        auto fetched = supervisor::withRetry(retry_policy_,
            [this](std::chrono::milliseconds d) { sleepFor(d); },
            cfg.market_symbol + " klines",
            [&] { return services_.market_data->fetchCandles(cfg.market_symbol, cfg.interval, cfg.window_size); });
        if (!fetched) {
            logger->warn("{}: no candles this cycle ({}), skipped.", cfg.market_symbol,
                         core::errorKindToString(fetched.error().kind));
            return;
        }

        // 3. The last candle is still forming
        core::TimeSeries<core::Candle> closed = fetched.value();
        if (!closed.empty()) {
            closed.pop_back();
        }

        // 4. Indicators and detection
        const strategy_engine::IStrategy& strategy = instrument.detector->getStrategy();
        strategy_engine::IndicatorSnapshot snapshot = strategy.buildSnapshot(closed);
        if (!snapshot.sufficient) {
            logger->debug("{}: {} closed candles, {} needs {}.", cfg.market_symbol, closed.size(),
                          strategy.getName(), strategy.getMinimumCandles());
            return;
        }

        std::vector<core::SignalEvent> events =
            instrument.detector->detect(cfg.market_symbol, snapshot, state.signal, state.trade.isActive());

        // A new latch episode may announce its entry again
        if (state.signal.latched_side != state.entry_notified_side) {
            state.entry_notified_side = core::Side::None;
        }

        for (const auto& event : events) {
            if (event.kind == core::SignalKind::Alert) {
                handleAlert(event, snapshot);
            } else {
                handleEntry(instrument, event, snapshot);
            }
        }
    }

    void PollLoop::handleAlert(const core::SignalEvent& event, const strategy_engine::IndicatorSnapshot& snapshot)
    {
        core::logging::getLogger()->info("{}: {} ALERT at {} (strength {:.4f})", event.instrument,
                                         core::sideToString(event.side), formatPrice(event.price), event.strength);
        if (services_.signal_journal) {
            data::SignalRecord record;
            record.event = event;
            record.indicator_values = snapshot.indicator_values;
            services_.signal_journal->record(record);
        }
        notify(formatSignalMessage(event, config_.notifications.utc_offset_minutes), "alert notification");
    }

    void PollLoop::handleEntry(Instrument& instrument, const core::SignalEvent& event,
                               const strategy_engine::IndicatorSnapshot& snapshot)
    {
        auto logger = core::logging::getLogger();
        const core::InstrumentConfig& cfg = instrument.config;
        InstrumentState& state = instrument.state;

        data::SignalRecord record;
        record.event = event;
        record.indicator_values = snapshot.indicator_values;

        if (!tradingEnabled(instrument)) {
            // Latch policy re-emits the entry every bar of the episode; announce it once
            if (state.entry_notified_side == event.side) {
                return;
            }
            state.entry_notified_side = event.side;

            auto levels = execution::computeProtectiveOrders(event.price, event.side,
                                                             config_.trading.stop_loss_pct,
                                                             config_.trading.take_profit_pct,
                                                             config_.trading.trigger_price_decimals);
            record.stop_loss = levels.stop_loss;
            record.take_profit = levels.take_profit;
            logger->info("{}: {} ENTRY signal at {} (alert-only)", event.instrument,
                         core::sideToString(event.side), formatPrice(event.price));
            if (services_.signal_journal) {
                services_.signal_journal->record(record);
            }
            notify(formatSignalMessage(event, config_.notifications.utc_offset_minutes) +
                   fmt::format("\nTargets: SL {} / TP {} (alert-only)", levels.stop_loss, levels.take_profit),
                   "entry notification");
            return;
        }

        execution::OpenResult opened = services_.lifecycle->open(cfg.trading_symbol, event.side, cfg.quantity,
                                                                 state.trade, clock_());
        switch (opened.outcome) {
            case execution::OpenOutcome::AlreadyOpen:
                logger->info("{}: {} entry skipped, position already open.", cfg.trading_symbol,
                             core::sideToString(event.side));
                return;
            case execution::OpenOutcome::Failed:
                logger->error("{}: {} entry not opened: {}", cfg.trading_symbol, core::sideToString(event.side),
                              opened.error ? opened.error->message : std::string("unknown error"));
                return;
            case execution::OpenOutcome::Opened:
                break;
        }

        execution::ProtectionResult protection = services_.lifecycle->attachProtection(cfg.trading_symbol, state.trade);
        record.event.price = state.trade.entry_price;
        record.stop_loss = protection.levels.stop_loss;
        record.take_profit = protection.levels.take_profit;
        if (services_.signal_journal) {
            services_.signal_journal->record(record);
        }

        std::string text = formatSignalMessage(event, config_.notifications.utc_offset_minutes);
        text += fmt::format("\nOpened {} x {} at {}", cfg.trading_symbol, cfg.quantity, formatPrice(state.trade.entry_price));
        text += fmt::format("\nSL {} [{}] / TP {} [{}]",
                            protection.levels.stop_loss, protection.stop_loss_placed ? "placed" : "FAILED",
                            protection.levels.take_profit, protection.take_profit_placed ? "placed" : "FAILED");
        if (!protection.complete()) {
            text += "\nWARNING: position is open without full protection.";
        }
        notify(text, "entry notification");
    }

    std::string PollLoop::formatSignalMessage(const core::SignalEvent& event, int utc_offset_minutes) {
        return fmt::format("[{}] {} {}\nPrice: {}\nStrength: {:.4f}\nCandle: {}",
                           core::signalKindToString(event.kind), event.instrument, core::sideToString(event.side),
                           formatPrice(event.price), event.strength,
                           core::utils::timestampToString(event.timestamp, utc_offset_minutes));
    }

} // namespace engine
