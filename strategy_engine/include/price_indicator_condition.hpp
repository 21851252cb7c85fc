#pragma once

#include "interfaces.hpp"
#include "common_types.hpp" // For PriceField, ComparisonOp
#include <string>

namespace strategy_engine {

    // --- PriceIndicatorCondition Class ---
    // Compares a field of the last closed candle against a named snapshot value,
    // e.g. PriceIndicatorCondition(PriceField::Close, ComparisonOp::GT, keys::BandUpper)
    class PriceIndicatorCondition : public ICondition {
    public:
        PriceIndicatorCondition(PriceField price_field, ComparisonOp op, std::string indicator_name);

        virtual ~PriceIndicatorCondition() override = default;

        bool evaluate(const IndicatorSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        PriceField price_field_;
        ComparisonOp op_;
        std::string indicator_name_;
    };

} // namespace strategy_engine
