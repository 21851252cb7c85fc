#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <cstdlib>      // For std::getenv
#include <algorithm>

namespace core {

    bool AppConfig::anyTradingEnabled() const {
        return std::any_of(instruments.begin(), instruments.end(),
                           [](const InstrumentConfig& i) { return i.trading_enabled; });
    }

namespace config {

    using json = nlohmann::json;

    namespace { // File-local parsing helpers

        // Returns obj[key] converted to T, or fallback when the key is absent.
        // A present key of the wrong type is a configuration error, not a silent default.
        template<typename T>
        T readOr(const json& obj, const char* key, const T& fallback, const std::string& section) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                return fallback;
            }
            try {
                return it->get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid value for '{}.{}': {}", section, key, e.what()));
            }
        }

        const json& sectionOrEmpty(const json& root, const char* name) {
            static const json empty = json::object();
            auto it = root.find(name);
            if (it == root.end()) {
                return empty;
            }
            if (!it->is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return *it;
        }

        void requirePositive(int value, const std::string& what) {
            if (value <= 0) {
                throw ConfigException(fmt::format("'{}' must be positive (got {}).", what, value));
            }
        }

        StrategyParams parseStrategy(const json& obj, const std::string& section) {
            StrategyParams p;
            p.kind = strategyKindFromString(readOr<std::string>(obj, "kind", "bollinger_breakout", section));
            p.policy = detectorPolicyFromString(readOr<std::string>(obj, "detector", "latch", section));

            p.period = readOr(obj, "period", p.period, section);
            p.band_multiplier = readOr(obj, "band_multiplier", p.band_multiplier, section);
            p.entry_threshold_pct = readOr(obj, "entry_threshold_pct", p.entry_threshold_pct, section);
            p.mode = breakoutModeFromString(readOr<std::string>(obj, "mode", "breakout", section));

            p.fast_period = readOr(obj, "fast_period", p.fast_period, section);
            p.mid_period = readOr(obj, "mid_period", p.mid_period, section);
            p.slow_period = readOr(obj, "slow_period", p.slow_period, section);
            p.min_slope_pct = readOr(obj, "min_slope_pct", p.min_slope_pct, section);
            p.min_separation_pct = readOr(obj, "min_separation_pct", p.min_separation_pct, section);
            p.prior_extreme_lookback = readOr(obj, "prior_extreme_lookback", p.prior_extreme_lookback, section);
            p.adx_period = readOr(obj, "adx_period", p.adx_period, section);
            p.adx_min = readOr(obj, "adx_min", p.adx_min, section);

            if (p.kind == StrategyKind::BollingerBreakout) {
                requirePositive(p.period, section + ".period");
                if (p.band_multiplier <= 0.0) {
                    throw ConfigException(section + ".band_multiplier must be positive.");
                }
                if (p.entry_threshold_pct < 0.0) {
                    throw ConfigException(section + ".entry_threshold_pct must not be negative.");
                }
            } else {
                requirePositive(p.fast_period, section + ".fast_period");
                requirePositive(p.prior_extreme_lookback, section + ".prior_extreme_lookback");
                requirePositive(p.adx_period, section + ".adx_period");
                if (!(p.fast_period < p.mid_period && p.mid_period < p.slow_period)) {
                    throw ConfigException(fmt::format("{}: periods must satisfy fast < mid < slow (got {}/{}/{}).",
                                                      section, p.fast_period, p.mid_period, p.slow_period));
                }
                if (p.adx_min < 0.0) {
                    throw ConfigException(section + ".adx_min must not be negative.");
                }
            }
            return p;
        }

        InstrumentConfig parseInstrument(const json& obj, std::size_t index) {
            const std::string section = fmt::format("instruments[{}]", index);
            if (!obj.is_object()) {
                throw ConfigException(section + " must be an object.");
            }
            InstrumentConfig inst;
            inst.market_symbol = readOr<std::string>(obj, "market_symbol", "", section);
            inst.trading_symbol = readOr<std::string>(obj, "trading_symbol", "", section);
            inst.interval = readOr(obj, "interval", inst.interval, section);
            inst.window_size = readOr(obj, "window_size", inst.window_size, section);
            inst.trading_enabled = readOr(obj, "trading_enabled", inst.trading_enabled, section);
            inst.quantity = readOr(obj, "quantity", inst.quantity, section);

            if (inst.market_symbol.empty()) {
                throw ConfigException(section + ".market_symbol is required.");
            }
            requirePositive(inst.window_size, section + ".window_size");
            if (inst.trading_enabled) {
                if (inst.trading_symbol.empty()) {
                    throw ConfigException(section + ".trading_symbol is required when trading is enabled.");
                }
                if (inst.quantity <= 0.0) {
                    throw ConfigException(section + ".quantity must be positive when trading is enabled.");
                }
            }

            auto strategy_it = obj.find("strategy");
            if (strategy_it != obj.end()) {
                inst.strategy = parseStrategy(*strategy_it, section + ".strategy");
            }

            // One extra candle is always dropped (still forming)
            int required = inst.strategy.kind == StrategyKind::BollingerBreakout
                               ? inst.strategy.period
                               : std::max(inst.strategy.slow_period, 2 * inst.strategy.adx_period);
            if (inst.window_size <= required) {
                throw ConfigException(fmt::format("{}.window_size ({}) too small for the strategy (needs > {}).",
                                                  section, inst.window_size, required));
            }
            return inst;
        }

        std::string envOrEmpty(const char* name) {
            const char* value = std::getenv(name);
            return value ? std::string(value) : std::string();
        }

        AppConfig parseDocument(const json& root) {
            if (!root.is_object()) {
                throw ConfigException("Config root must be a JSON object.");
            }
            AppConfig cfg;

            const json& loop = sectionOrEmpty(root, "loop");
            cfg.loop.interval_seconds = readOr(loop, "interval_seconds", cfg.loop.interval_seconds, "loop");
            cfg.loop.error_sleep_seconds = readOr(loop, "error_sleep_seconds", cfg.loop.error_sleep_seconds, "loop");
            cfg.loop.sleep_slice_ms = readOr(loop, "sleep_slice_ms", cfg.loop.sleep_slice_ms, "loop");
            requirePositive(cfg.loop.interval_seconds, "loop.interval_seconds");
            requirePositive(cfg.loop.sleep_slice_ms, "loop.sleep_slice_ms");

            const json& retry = sectionOrEmpty(root, "retry");
            cfg.retry.max_attempts = readOr(retry, "max_attempts", cfg.retry.max_attempts, "retry");
            cfg.retry.initial_delay_ms = readOr(retry, "initial_delay_ms", cfg.retry.initial_delay_ms, "retry");
            cfg.retry.multiplier = readOr(retry, "multiplier", cfg.retry.multiplier, "retry");
            cfg.retry.max_delay_ms = readOr(retry, "max_delay_ms", cfg.retry.max_delay_ms, "retry");
            requirePositive(cfg.retry.max_attempts, "retry.max_attempts");
            if (cfg.retry.multiplier < 1.0) {
                throw ConfigException("retry.multiplier must be >= 1.0.");
            }
            if (cfg.retry.initial_delay_ms < 0 || cfg.retry.max_delay_ms < cfg.retry.initial_delay_ms) {
                throw ConfigException("retry delays must satisfy 0 <= initial_delay_ms <= max_delay_ms.");
            }

            const json& conn = sectionOrEmpty(root, "connectivity");
            cfg.connectivity.enabled = readOr(conn, "enabled", cfg.connectivity.enabled, "connectivity");
            cfg.connectivity.probe_url = readOr(conn, "probe_url", cfg.connectivity.probe_url, "connectivity");
            cfg.connectivity.timeout_ms = readOr(conn, "timeout_ms", cfg.connectivity.timeout_ms, "connectivity");
            cfg.connectivity.cooldown_seconds = readOr(conn, "cooldown_seconds", cfg.connectivity.cooldown_seconds, "connectivity");

            const json& dog = sectionOrEmpty(root, "watchdog");
            cfg.watchdog.enabled = readOr(dog, "enabled", cfg.watchdog.enabled, "watchdog");
            cfg.watchdog.check_interval_seconds = readOr(dog, "check_interval_seconds", cfg.watchdog.check_interval_seconds, "watchdog");
            cfg.watchdog.stall_threshold_seconds = readOr(dog, "stall_threshold_seconds", cfg.watchdog.stall_threshold_seconds, "watchdog");
            if (cfg.watchdog.enabled) {
                requirePositive(cfg.watchdog.check_interval_seconds, "watchdog.check_interval_seconds");
                requirePositive(cfg.watchdog.stall_threshold_seconds, "watchdog.stall_threshold_seconds");
            }

            const json& trading = sectionOrEmpty(root, "trading");
            cfg.trading.spot_base_url = readOr(trading, "spot_base_url", cfg.trading.spot_base_url, "trading");
            cfg.trading.futures_base_url = readOr(trading, "futures_base_url", cfg.trading.futures_base_url, "trading");
            cfg.trading.request_timeout_ms = readOr(trading, "request_timeout_ms", cfg.trading.request_timeout_ms, "trading");
            cfg.trading.stop_loss_pct = readOr(trading, "stop_loss_pct", cfg.trading.stop_loss_pct, "trading");
            cfg.trading.take_profit_pct = readOr(trading, "take_profit_pct", cfg.trading.take_profit_pct, "trading");
            cfg.trading.trigger_price_decimals = readOr(trading, "trigger_price_decimals", cfg.trading.trigger_price_decimals, "trading");
            if (cfg.trading.stop_loss_pct <= 0.0 || cfg.trading.stop_loss_pct >= 100.0 || cfg.trading.take_profit_pct <= 0.0) {
                throw ConfigException("trading.stop_loss_pct must be in (0, 100) and take_profit_pct positive.");
            }

            const json& notify = sectionOrEmpty(root, "notifications");
            cfg.notifications.telegram_enabled = readOr(notify, "telegram_enabled", cfg.notifications.telegram_enabled, "notifications");
            cfg.notifications.api_base_url = readOr(notify, "api_base_url", cfg.notifications.api_base_url, "notifications");
            cfg.notifications.timeout_ms = readOr(notify, "timeout_ms", cfg.notifications.timeout_ms, "notifications");
            cfg.notifications.utc_offset_minutes = readOr(notify, "utc_offset_minutes", cfg.notifications.utc_offset_minutes, "notifications");

            const json& log = sectionOrEmpty(root, "logging");
            cfg.logging.directory = readOr(log, "directory", cfg.logging.directory, "logging");
            cfg.logging.base_file_name = readOr(log, "base_file_name", cfg.logging.base_file_name, "logging");
            if (log.contains("console_level")) {
                cfg.logging.console_level = logging::level_from_string(readOr<std::string>(log, "console_level", "info", "logging"));
            }
            if (log.contains("file_level")) {
                cfg.logging.file_level = logging::level_from_string(readOr<std::string>(log, "file_level", "debug", "logging"));
            }

            const json& journal = sectionOrEmpty(root, "journal");
            cfg.journal.signals_enabled = readOr(journal, "signals_enabled", cfg.journal.signals_enabled, "journal");
            cfg.journal.signal_directory = readOr(journal, "signal_directory", cfg.journal.signal_directory, "journal");
            cfg.journal.signal_file_base = readOr(journal, "signal_file_base", cfg.journal.signal_file_base, "journal");
            cfg.journal.trades_enabled = readOr(journal, "trades_enabled", cfg.journal.trades_enabled, "journal");
            cfg.journal.trade_db_path = readOr(journal, "trade_db_path", cfg.journal.trade_db_path, "journal");

            auto instruments_it = root.find("instruments");
            if (instruments_it == root.end() || !instruments_it->is_array() || instruments_it->empty()) {
                throw ConfigException("Config requires a non-empty 'instruments' array.");
            }
            for (std::size_t i = 0; i < instruments_it->size(); ++i) {
                cfg.instruments.push_back(parseInstrument((*instruments_it)[i], i));
            }

            applyEnvironment(cfg);

            if (cfg.notifications.telegram_enabled &&
                (cfg.notifications.bot_token.empty() || cfg.notifications.chat_id.empty())) {
                throw ConfigException("Telegram is enabled but TELEGRAM_BOT_TOKEN / TELEGRAM_CHAT_ID are not set.");
            }
            return cfg;
        }

    } // end anonymous namespace

    StrategyKind strategyKindFromString(const std::string& value) {
        if (value == "bollinger_breakout" || value == "bollinger") return StrategyKind::BollingerBreakout;
        if (value == "triple_sma") return StrategyKind::TripleSma;
        throw ConfigException("Unknown strategy kind: " + value);
    }

    BreakoutMode breakoutModeFromString(const std::string& value) {
        if (value == "breakout") return BreakoutMode::Breakout;
        if (value == "fade") return BreakoutMode::Fade;
        throw ConfigException("Unknown breakout mode: " + value);
    }

    DetectorPolicy detectorPolicyFromString(const std::string& value) {
        if (value == "latch") return DetectorPolicy::Latch;
        if (value == "dedup") return DetectorPolicy::Dedup;
        throw ConfigException("Unknown detector policy: " + value);
    }

    void applyEnvironment(AppConfig& config) {
        config.trading.api_key = envOrEmpty("MEXC_API_KEY");
        config.trading.api_secret = envOrEmpty("MEXC_API_SECRET");
        config.notifications.bot_token = envOrEmpty("TELEGRAM_BOT_TOKEN");
        config.notifications.chat_id = envOrEmpty("TELEGRAM_CHAT_ID");
    }

    AppConfig loadFromString(const std::string& json_text) {
        json root;
        try {
            root = json::parse(json_text);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config JSON: {}", e.what()));
        }
        return parseDocument(root);
    }

    AppConfig loadFromFile(const std::string& path) {
        std::ifstream config_file(path);
        if (!config_file.is_open()) {
            throw ConfigException("Could not open config file: " + path);
        }
        std::stringstream buffer;
        buffer << config_file.rdbuf();

        // Called before logging is initialised: report through exceptions only
        return loadFromString(buffer.str());
    }

} // namespace config
} // namespace core
