#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Average Directional Index built from plain rolling means (not Wilder smoothing):
//   +DI = 100 * mean(+DM) / ATR, -DI = 100 * mean(-DM) / ATR
//   DX  = 100 * |+DI - -DI| / (+DI + -DI), 0 when the denominator is 0
//   ADX = mean(DX) over the same period
class AdxIndicator : public IIndicator {
public:
    explicit AdxIndicator(int period);

    virtual ~AdxIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;          // 2 * period - 1
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // Directional indicators, aligned to input[j + period]
    const core::TimeSeries<double>& getPlusDI() const { return plus_di_; }
    const core::TimeSeries<double>& getMinusDI() const { return minus_di_; }

private:
    const int period_;
    std::string name_;
    core::TimeSeries<double> plus_di_;
    core::TimeSeries<double> minus_di_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
