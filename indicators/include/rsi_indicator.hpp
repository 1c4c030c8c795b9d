#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Wilder RSI of closes. First value at index `period`, always in [0, 100].
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period, double upper_level = 70.0, double lower_level = 30.0);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<core::IndicatorPoint>& getResult() const override;

    double getUpperLevel() const { return upper_level_; }
    double getLowerLevel() const { return lower_level_; }

private:
    const int period_;
    const double upper_level_;
    const double lower_level_;
    int lookback_;
    std::string name_;
    core::TimeSeries<core::IndicatorPoint> results_;
};

} // namespace indicators
