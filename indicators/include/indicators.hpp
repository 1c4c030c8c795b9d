#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries, IndicatorPoint
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Display name, e.g. "EMA(20)", "RSI(14)", "MACD(12,26,9)"
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first output
    virtual int getLookback() const = 0;

    // Recomputes over the full input sequence and stores the result internally
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Primary line, stamped with input bar times. Shorter than the input by the lookback.
    virtual const core::TimeSeries<core::IndicatorPoint>& getResult() const = 0;
};

} // namespace indicators
