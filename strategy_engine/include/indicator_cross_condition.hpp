#pragma once

#include "interfaces.hpp"
#include "common_types.hpp" // For CrossType
#include <string>

namespace strategy_engine {

    // --- IndicatorCrossCondition Class ---
    // True when the ordering of indicator1 vs indicator2 flipped between the
    // previous bar and the current one.
    class IndicatorCrossCondition : public ICondition {
    public:
        // e.g. IndicatorCrossCondition(keys::SmaFast, CrossType::CrossesAbove, keys::SmaMid)
        IndicatorCrossCondition(std::string indicator1_name,
                                CrossType cross_type,
                                std::string indicator2_name);

        virtual ~IndicatorCrossCondition() override = default;

        bool evaluate(const IndicatorSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        std::string indicator1_name_;
        CrossType cross_type_;
        std::string indicator2_name_;
    };

} // namespace strategy_engine
