#include "common_types.hpp"
#include <cmath>     // For std::fabs

namespace strategy_engine {

    double priceValue(const core::Candle& candle, PriceField field) {
        switch (field) {
            case PriceField::Open:  return candle.open;
            case PriceField::High:  return candle.high;
            case PriceField::Low:   return candle.low;
            case PriceField::Close: return candle.close;
        }
        return candle.close;
    }

    bool compare(double lhs, ComparisonOp op, double rhs) {
        switch (op) {
            case ComparisonOp::GT:  return lhs > rhs;
            case ComparisonOp::LT:  return lhs < rhs;
            case ComparisonOp::GTE: return lhs >= rhs;
            case ComparisonOp::LTE: return lhs <= rhs;
            case ComparisonOp::EQ:  return std::fabs(lhs - rhs) < 1e-9; // Tolerance for floating point equality
        }
        return false;
    }

    std::string toString(PriceField field) {
        switch (field) {
            case PriceField::Open:  return "Open";
            case PriceField::High:  return "High";
            case PriceField::Low:   return "Low";
            case PriceField::Close: return "Close";
        }
        return "InvalidField";
    }

    std::string toString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT:  return ">";
            case ComparisonOp::LT:  return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ:  return "==";
        }
        return "InvalidOp";
    }

    std::string toString(CrossType type) {
        return type == CrossType::CrossesAbove ? "CrossesAbove" : "CrossesBelow";
    }

} // namespace strategy_engine
