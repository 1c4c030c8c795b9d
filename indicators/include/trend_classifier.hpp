#pragma once

#include "datatypes.hpp"
#include <string>

namespace indicators {

    enum class Trend {
        Unknown,
        Bullish,
        SidewaysUp,
        Bearish,
        SidewaysDown
    };

    // MACD(12,26,9) at the latest bar:
    //   macd > signal: BULLISH if macd > 0, else SIDEWAYS_UP
    //   otherwise:     BEARISH if macd < 0, else SIDEWAYS_DOWN
    // UNKNOWN with fewer than min_bars candles.
    Trend classifyTrend(const core::TimeSeries<core::Candle>& candles, std::size_t min_bars = 50);

    std::string toString(Trend trend);

} // namespace indicators
