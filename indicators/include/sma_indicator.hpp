#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

// How the first period-1 candles are treated
enum class WindowMode {
    Partial,    // Mean of however many closes exist (>= 1); no lookback
    Full        // Defined only once `period` closes exist
};

class SmaIndicator : public IIndicator {
public:
    explicit SmaIndicator(int period, WindowMode mode = WindowMode::Partial);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    int getPeriod() const { return period_; }

private:
    const int period_;
    const WindowMode mode_;
    std::string name_;                 // e.g. "SMA(8)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
