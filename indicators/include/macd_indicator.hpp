#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// MACD = EMA(fast) - EMA(slow), signal = EMA(signal) over the MACD values,
// histogram = macd - signal. getResult() is the MACD line from index slow-1;
// getPoints() holds full triples from the first signal value on.
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_length = 12, int slow_length = 26, int signal_length = 9);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<core::IndicatorPoint>& getResult() const override;

    const core::TimeSeries<core::MacdPoint>& getPoints() const;

private:
    const int fast_length_;
    const int slow_length_;
    const int signal_length_;
    std::string name_;
    core::TimeSeries<core::IndicatorPoint> macd_line_;
    core::TimeSeries<core::MacdPoint> points_;
};

} // namespace indicators
