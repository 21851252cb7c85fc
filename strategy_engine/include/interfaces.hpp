#pragma once

#include <vector>
#include <string>
#include <map>
#include <optional>

#include "datatypes.hpp" // Provides Candle, TimeSeries etc.

namespace strategy_engine {

    // Indicator values for the last closed candle of one instrument, rebuilt every cycle.
    // A key missing from either map means "insufficient data", never 0.
    struct IndicatorSnapshot {
        bool sufficient = false;                 // Window long enough for the strategy
        std::optional<core::Candle> current_candle; // Last closed candle
        std::map<std::string, double> indicator_values;
        std::map<std::string, double> indicator_values_prev; // Same keys, one bar earlier

        std::optional<double> value(const std::string& key) const {
            auto it = indicator_values.find(key);
            if (it == indicator_values.end()) return std::nullopt;
            return it->second;
        }

        std::optional<double> previous(const std::string& key) const {
            auto it = indicator_values_prev.find(key);
            if (it == indicator_values_prev.end()) return std::nullopt;
            return it->second;
        }
    };

    // --- Condition Interface ---
    // A single logical test on the snapshot (e.g. Close > BB_UPPER)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        // Missing inputs evaluate to false
        virtual bool evaluate(const IndicatorSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
    };

    // Outcome of evaluating both composite rules of a strategy on one snapshot
    struct StrategyEvaluation {
        bool long_holds = false;
        bool short_holds = false;
    };

    // --- Strategy Interface ---
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual std::string getName() const = 0;

        // Closed candles needed before buildSnapshot() marks the snapshot sufficient
        virtual int getMinimumCandles() const = 0;

        // Computes every indicator the conditions read; `closed_candles` must not
        // contain the still-forming candle
        virtual IndicatorSnapshot buildSnapshot(const core::TimeSeries<core::Candle>& closed_candles) const = 0;

        virtual StrategyEvaluation evaluate(const IndicatorSnapshot& snapshot) const = 0;

        // Magnitude compared against the entry threshold for `side`; nullopt if unavailable
        virtual std::optional<double> strength(const IndicatorSnapshot& snapshot, core::Side side) const = 0;

        virtual double getEntryThreshold() const = 0;
    };

} // namespace strategy_engine
