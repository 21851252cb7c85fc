#pragma once

#include "indicators.hpp"
#include <string>
#include <optional>

namespace indicators {

// mid = SMA(close, p), upper/lower = mid +/- k * sigma, sigma the sample
// standard deviation of the trailing p closes. getResult() is the middle band.
class BollingerBandsIndicator : public IIndicator {
public:
    BollingerBandsIndicator(int period, double band_multiplier);

    virtual ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getUpper() const { return upper_; }
    const core::TimeSeries<double>& getLower() const { return lower_; }

    // (upper - lower) / mid at the given offset from the end; nullopt when
    // mid == 0 or no value exists
    std::optional<double> widthAt(std::size_t bars_back = 0) const;

private:
    const int period_;
    const double band_multiplier_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
