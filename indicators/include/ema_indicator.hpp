#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// SMA-seeded exponential moving average of closes, k = 2/(period+1)
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period); // Throws std::invalid_argument for period < 2

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<core::IndicatorPoint>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<core::IndicatorPoint> results_;
};

} // namespace indicators
