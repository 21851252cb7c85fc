#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory> // For std::unique_ptr
#include <string>

namespace strategy_engine {

    // --- AndCondition Class ---
    // True only when every sub-condition holds. Evaluation stops at the first
    // false one, so cheap tests should come first.
    class AndCondition : public ICondition {
    public:
        explicit AndCondition(std::vector<std::unique_ptr<ICondition>> conditions);

        virtual ~AndCondition() override = default;

        bool evaluate(const IndicatorSnapshot& snapshot) const override;
        std::string describe() const override;

        std::size_t size() const { return conditions_.size(); }

    private:
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace strategy_engine
