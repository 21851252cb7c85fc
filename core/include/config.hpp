#pragma once

#include <string>
#include <vector>
#include <spdlog/common.h>

namespace core {

    enum class StrategyKind {
        BollingerBreakout,
        TripleSma
    };

    // Which band break arms which side
    enum class BreakoutMode {
        Breakout,   // close > upper -> LONG, close < lower -> SHORT
        Fade        // close > upper -> SHORT, close < lower -> LONG
    };

    enum class DetectorPolicy {
        Latch,      // NEUTRAL / ALERT_LONG / ALERT_SHORT, cleared when neither side holds
        Dedup       // last emitted side suppresses identical consecutive signals
    };

    struct StrategyParams {
        StrategyKind kind = StrategyKind::BollingerBreakout;
        DetectorPolicy policy = DetectorPolicy::Latch;

        // Bollinger breakout
        int period = 8;
        double band_multiplier = 2.0;
        double entry_threshold_pct = 0.2;
        BreakoutMode mode = BreakoutMode::Breakout;

        // Triple-SMA
        int fast_period = 5;
        int mid_period = 13;
        int slow_period = 34;
        double min_slope_pct = 0.0;          // % change of the fast SMA vs previous bar
        double min_separation_pct = 0.0;     // |fast - mid| / mid * 100
        int prior_extreme_lookback = 5;      // closed candles before the current one
        int adx_period = 14;
        double adx_min = 0.0;                // 0 disables the entry gate
    };

    struct InstrumentConfig {
        std::string market_symbol;           // Spot klines, e.g. ARPAUSDT
        std::string trading_symbol;          // Futures contract, e.g. ARPA_USDT
        std::string interval = "1m";
        int window_size = 200;
        bool trading_enabled = false;
        double quantity = 0.0;               // Contracts per market order
        StrategyParams strategy;
    };

    struct LoopConfig {
        int interval_seconds = 2;
        int error_sleep_seconds = 5;
        int sleep_slice_ms = 200;
    };

    struct RetryConfig {
        int max_attempts = 3;
        int initial_delay_ms = 500;
        double multiplier = 2.0;
        int max_delay_ms = 8000;
    };

    struct ConnectivityConfig {
        bool enabled = true;
        std::string probe_url = "https://api.mexc.com/api/v3/ping";
        int timeout_ms = 3000;
        int cooldown_seconds = 10;
    };

    struct WatchdogConfig {
        bool enabled = true;
        int check_interval_seconds = 10;
        int stall_threshold_seconds = 60;
    };

    struct TradingConfig {
        std::string spot_base_url = "https://api.mexc.com";
        std::string futures_base_url = "https://contract.mexc.com";
        int request_timeout_ms = 10000;
        double stop_loss_pct = 1.0;
        double take_profit_pct = 2.0;
        int trigger_price_decimals = 6;
        std::string api_key;                 // MEXC_API_KEY
        std::string api_secret;              // MEXC_API_SECRET
    };

    struct NotificationConfig {
        bool telegram_enabled = false;
        std::string api_base_url = "https://api.telegram.org";
        int timeout_ms = 10000;
        std::string bot_token;               // TELEGRAM_BOT_TOKEN
        std::string chat_id;                 // TELEGRAM_CHAT_ID
        int utc_offset_minutes = -180;       // America/Sao_Paulo, no DST
    };

    struct LoggingConfig {
        std::string directory = "logs";
        std::string base_file_name = "breakout_sentinel";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
    };

    struct JournalConfig {
        bool signals_enabled = true;
        std::string signal_directory = "signals";
        std::string signal_file_base = "signals";
        bool trades_enabled = true;
        std::string trade_db_path = "trades.db";
    };

    // Immutable after startup
    struct AppConfig {
        LoopConfig loop;
        RetryConfig retry;
        ConnectivityConfig connectivity;
        WatchdogConfig watchdog;
        TradingConfig trading;
        NotificationConfig notifications;
        LoggingConfig logging;
        JournalConfig journal;
        std::vector<InstrumentConfig> instruments;

        bool anyTradingEnabled() const;
    };

    namespace config {

        // Reads and validates the JSON file, then overlays credentials from the environment.
        // Throws core::ConfigException on any missing file, bad JSON or invalid value.
        AppConfig loadFromFile(const std::string& path);

        // Same, from an in-memory document (used by tests)
        AppConfig loadFromString(const std::string& json_text);

        // Credential overlay: MEXC_API_KEY, MEXC_API_SECRET, TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_ID
        void applyEnvironment(AppConfig& config);

        StrategyKind strategyKindFromString(const std::string& value);
        BreakoutMode breakoutModeFromString(const std::string& value);
        DetectorPolicy detectorPolicyFromString(const std::string& value);

    } // namespace config

} // namespace core
