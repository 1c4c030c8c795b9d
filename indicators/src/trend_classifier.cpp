#include "trend_classifier.hpp"
#include "macd_indicator.hpp"

namespace indicators {

    Trend classifyTrend(const core::TimeSeries<core::Candle>& candles, std::size_t min_bars) {
        if (candles.size() < min_bars) {
            return Trend::Unknown;
        }

        MacdIndicator macd(12, 26, 9);
        macd.calculate(candles);
        const auto& points = macd.getPoints();
        if (points.empty()) {
            return Trend::Unknown;
        }

        const auto& last = points.back();
        if (last.macd > last.signal) {
            return last.macd > 0.0 ? Trend::Bullish : Trend::SidewaysUp;
        }
        return last.macd < 0.0 ? Trend::Bearish : Trend::SidewaysDown;
    }

    std::string toString(Trend trend) {
        switch (trend) {
            case Trend::Bullish:      return "BULLISH";
            case Trend::SidewaysUp:   return "SIDEWAYS_UP";
            case Trend::Bearish:      return "BEARISH";
            case Trend::SidewaysDown: return "SIDEWAYS_DOWN";
            case Trend::Unknown:      break;
        }
        return "UNKNOWN";
    }

} // namespace indicators
