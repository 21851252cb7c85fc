#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Rolling mean of the true range; the first value needs `period` true ranges,
// i.e. period + 1 candles.
class AtrIndicator : public IIndicator {
public:
    explicit AtrIndicator(int period);

    virtual ~AtrIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
