// cli/src/main.cpp

// Standard includes
#include <atomic>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

// Project includes
#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "shutdown.hpp"
#include "utils.hpp"
#include "mexc_spot_client.hpp"
#include "mexc_futures_client.hpp"
#include "request_signer.hpp"
#include "notifier.hpp"
#include "telegram_notifier.hpp"
#include "signal_journal.hpp"
#include "trade_journal.hpp"
#include "trade_lifecycle.hpp"
#include "connectivity_probe.hpp"
#include "watchdog.hpp"
#include "poll_loop.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

    std::atomic<bool> shutdown_requested{false};

    const char* kDefaultConfigPath = "config/sentinel.json";

    std::unique_ptr<data::INotifier> makeNotifier(const core::NotificationConfig& config) {
        if (!config.telegram_enabled) {
            core::logging::getLogger()->info("Telegram disabled; notifications go to the log.");
            return std::make_unique<data::LogNotifier>();
        }
        return std::make_unique<data::TelegramNotifier>(config.api_base_url, config.bot_token,
                                                        config.chat_id, config.timeout_ms);
    }

    std::string startupMessage(const core::AppConfig& config) {
        std::string text = "Breakout sentinel started.";
        for (const auto& instrument : config.instruments) {
            text += fmt::format("\n- {} {} ({})", instrument.market_symbol, instrument.interval,
                                instrument.trading_enabled ? "trading " + instrument.trading_symbol : "alert-only");
        }
        text += "\nStarted at " + core::utils::timestampToString(std::chrono::system_clock::now(),
                                                                  config.notifications.utc_offset_minutes);
        return text;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;
    const std::string config_path = argc > 1 ? argv[1] : kDefaultConfigPath;

    try {
        // --- Configuration first: logging settings live in it ---
        core::AppConfig config = core::config::loadFromFile(config_path);

        core::logging::LoggingOptions log_options;
        log_options.directory = config.logging.directory;
        log_options.base_file_name = config.logging.base_file_name;
        log_options.console_level = config.logging.console_level;
        log_options.file_level = config.logging.file_level;
        core::logging::initialize(log_options);
        logger = core::logging::getLogger();
        logger->info("Breakout sentinel starting with {} ({} instrument(s)).", config_path, config.instruments.size());

        // --- Notifications ---
        std::unique_ptr<data::INotifier> notifier = makeNotifier(config.notifications);

        // --- Market data ---
        data::MexcSpotClient market_data(config.trading.spot_base_url, config.trading.request_timeout_ms);

        // --- Trading (only if some instrument trades) ---
        std::unique_ptr<data::MexcFuturesClient> exchange;
        std::unique_ptr<data::TradeJournal> trade_journal;
        std::unique_ptr<execution::TradeLifecycleManager> lifecycle;
        if (config.anyTradingEnabled()) {
            data::RequestSigner signer(config.trading.api_key, config.trading.api_secret);
            exchange = std::make_unique<data::MexcFuturesClient>(std::move(signer), config.trading.futures_base_url,
                                                                 config.trading.request_timeout_ms,
                                                                 config.trading.trigger_price_decimals);
            for (const auto& instrument : config.instruments) {
                if (instrument.trading_enabled) {
                    exchange->verifyCredentials(instrument.trading_symbol);
                    break;
                }
            }

            if (config.journal.trades_enabled) {
                trade_journal = std::make_unique<data::TradeJournal>(config.journal.trade_db_path);
                if (!trade_journal->connect() || !trade_journal->initializeSchema()) {
                    logger->warn("Trade journal unavailable at {}; continuing without it.", config.journal.trade_db_path);
                    trade_journal.reset();
                }
            }

            execution::TradeSettings settings;
            settings.stop_loss_pct = config.trading.stop_loss_pct;
            settings.take_profit_pct = config.trading.take_profit_pct;
            settings.trigger_price_decimals = config.trading.trigger_price_decimals;
            lifecycle = std::make_unique<execution::TradeLifecycleManager>(*exchange, settings, trade_journal.get());
        } else {
            logger->info("No instrument has trading enabled; running alert-only.");
        }

        // --- Signal journal ---
        std::unique_ptr<data::SignalJournal> signal_journal;
        if (config.journal.signals_enabled) {
            signal_journal = std::make_unique<data::SignalJournal>(config.journal.signal_directory,
                                                                   config.journal.signal_file_base,
                                                                   config.notifications.utc_offset_minutes);
        }

        // --- Supervisor ---
        std::unique_ptr<supervisor::HttpConnectivityProbe> probe;
        if (config.connectivity.enabled) {
            probe = std::make_unique<supervisor::HttpConnectivityProbe>(config.connectivity.probe_url,
                                                                        config.connectivity.timeout_ms);
        }

        data::INotifier* notifier_ptr = notifier.get();
        std::unique_ptr<supervisor::Watchdog> watchdog;
        if (config.watchdog.enabled) {
            watchdog = std::make_unique<supervisor::Watchdog>(
                std::chrono::seconds(config.watchdog.check_interval_seconds),
                std::chrono::seconds(config.watchdog.stall_threshold_seconds),
                [notifier_ptr](std::chrono::seconds stalled_for) {
                    data::reportDelivery(notifier_ptr->sendMessage(
                        fmt::format("WARNING: poll loop stalled, no completed cycle for {}s.", stalled_for.count())),
                        "stall notification");
                });
        }

        // --- Loop ---
        engine::PollLoopServices services;
        services.market_data = &market_data;
        services.notifier = notifier.get();
        services.lifecycle = lifecycle.get();
        services.signal_journal = signal_journal.get();
        services.probe = probe.get();
        services.watchdog = watchdog.get();
        engine::PollLoop loop(config, services, shutdown_requested);

        core::installShutdownHandler(shutdown_requested);
        data::reportDelivery(notifier->sendMessage(startupMessage(config)), "startup notification");

        if (watchdog) {
            watchdog->start();
        }
        loop.run();
        if (watchdog) {
            watchdog->stop();
        }

        // --- Shutdown ---
        logger->info("Shutting down.");
        std::string farewell = "Breakout sentinel stopped at " +
            core::utils::timestampToString(std::chrono::system_clock::now(), config.notifications.utc_offset_minutes);
        if (signal_journal && std::filesystem::exists(signal_journal->currentFile())) {
            data::reportDelivery(notifier->sendDocument(signal_journal->currentFile(), farewell), "shutdown notification");
        } else {
            data::reportDelivery(notifier->sendMessage(farewell), "shutdown notification");
        }
        if (trade_journal) {
            trade_journal->disconnect();
        }

    } catch (const core::AuthenticationException& e) {
        std::cerr << "Authentication failed: " << e.what() << std::endl;
        if (logger) logger->critical("Authentication failed: {}", e.what());
        return 2;
    } catch (const core::ConfigException& e) {
        std::cerr << "Configuration error (" << config_path << "): " << e.what() << std::endl;
        if (logger) logger->critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (logger) logger->critical("Fatal error: {}", e.what());
        return 1;
    }

    if (logger) {
        logger->info("Breakout sentinel exited cleanly.");
    }
    spdlog::shutdown();
    return 0;
}
