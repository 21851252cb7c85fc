#pragma once

#include "interfaces.hpp"
#include <string>
#include <memory>      // For std::unique_ptr

namespace strategy_engine {

    // --- Strategy Class ---
    // Common part of the concrete strategies: owns the LONG and SHORT composite
    // conditions and the entry threshold. Subclasses supply the snapshot and the
    // strength measure.
    class Strategy : public IStrategy {
    public:
        Strategy(std::string name,
                 std::unique_ptr<ICondition> long_condition,
                 std::unique_ptr<ICondition> short_condition,
                 double entry_threshold);

        virtual ~Strategy() override = default;

        std::string getName() const override;
        StrategyEvaluation evaluate(const IndicatorSnapshot& snapshot) const override;
        double getEntryThreshold() const override;

        std::string describe() const;

    private:
        std::string name_;
        std::unique_ptr<ICondition> long_condition_;
        std::unique_ptr<ICondition> short_condition_;
        double entry_threshold_;
    };

} // namespace strategy_engine
