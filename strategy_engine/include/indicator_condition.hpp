#pragma once

#include "interfaces.hpp" // Include the base interface
#include "common_types.hpp"
#include <string>
#include <variant> // To hold either a double value or a second indicator name

namespace strategy_engine {

    // --- IndicatorCondition Class ---
    // Compares a snapshot value against a fixed value OR another snapshot value.
    class IndicatorCondition : public ICondition {
    public:
        // e.g. IndicatorCondition(keys::FastSlopePct, ComparisonOp::GTE, 0.05)
        IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, double value);

        // e.g. IndicatorCondition(keys::SmaFast, ComparisonOp::GT, std::string(keys::SmaMid))
        IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, const std::string& indicator_name2);

        virtual ~IndicatorCondition() override = default;

        bool evaluate(const IndicatorSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        std::string indicator_name1_;
        ComparisonOp op_;
        std::variant<double, std::string> rhs_;
    };

} // namespace strategy_engine
