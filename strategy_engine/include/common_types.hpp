#pragma once
#include "datatypes.hpp"     // Use short path (Provides core types)
#include <string>

namespace strategy_engine {

    // Enum to specify which candle price field to use
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    // Enum for Cross Type
    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    // Shared helpers for the condition classes
    double priceValue(const core::Candle& candle, PriceField field);
    bool compare(double lhs, ComparisonOp op, double rhs);
    std::string toString(PriceField field);
    std::string toString(ComparisonOp op);
    std::string toString(CrossType type);

    // Snapshot keys produced by the strategies
    namespace keys {
        inline constexpr const char* BandUpper = "BB_UPPER";
        inline constexpr const char* BandMid = "BB_MID";
        inline constexpr const char* BandLower = "BB_LOWER";
        inline constexpr const char* BandWidth = "BB_WIDTH";
        inline constexpr const char* SmaFast = "SMA_FAST";
        inline constexpr const char* SmaMid = "SMA_MID";
        inline constexpr const char* SmaSlow = "SMA_SLOW";
        inline constexpr const char* FastSlopePct = "FAST_SLOPE_PCT";
        inline constexpr const char* SeparationPct = "SEPARATION_PCT";
        inline constexpr const char* PriorHigh = "PRIOR_HIGH";
        inline constexpr const char* PriorLow = "PRIOR_LOW";
        inline constexpr const char* Atr = "ATR";
        inline constexpr const char* Adx = "ADX";
        inline constexpr const char* PlusDI = "PLUS_DI";
        inline constexpr const char* MinusDI = "MINUS_DI";
    } // namespace keys

} // namespace strategy_engine
