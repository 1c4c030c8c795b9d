#include "macd_indicator.hpp"
#include "ta_lib_support.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <vector>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_length, int slow_length, int signal_length)
    : fast_length_(fast_length), slow_length_(slow_length), signal_length_(signal_length) {
    if (fast_length_ < 2 || slow_length_ < 2 || signal_length_ < 2) {
        throw std::invalid_argument("MACD lengths must be at least 2.");
    }
    if (fast_length_ >= slow_length_) {
        throw std::invalid_argument("MACD fast length must be shorter than slow length.");
    }
    ensureTaLibInitialized();
    name_ = fmt::format("MACD({},{},{})", fast_length_, slow_length_, signal_length_);
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}'", name_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return slow_length_ - 1;
}

const core::TimeSeries<core::IndicatorPoint>& MacdIndicator::getResult() const {
    return macd_line_;
}

const core::TimeSeries<core::MacdPoint>& MacdIndicator::getPoints() const {
    return points_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    macd_line_.clear();
    points_.clear();

    if (input.size() < static_cast<std::size_t>(slow_length_)) {
        logger->trace("Input size ({}) is shorter than slow length ({}) for {}.", input.size(), slow_length_, name_);
        return;
    }

    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }

    // Two independent SMA-seeded EMAs rather than TA_MACD, which seeds both
    // averages at the slow lookback.
    int fast_begin = 0;
    int slow_begin = 0;
    std::vector<double> fast = computeEma(close_prices, fast_length_, fast_begin);
    std::vector<double> slow = computeEma(close_prices, slow_length_, slow_begin);
    if (fast.empty() || slow.empty()) {
        return;
    }

    std::vector<double> macd_values;
    macd_values.reserve(slow.size());
    for (std::size_t i = 0; i < slow.size(); ++i) {
        const std::size_t input_idx = static_cast<std::size_t>(slow_begin) + i;
        const double fast_value = fast[input_idx - static_cast<std::size_t>(fast_begin)];
        const double value = fast_value - slow[i];
        macd_values.push_back(value);
        macd_line_.push_back({input[input_idx].time, value});
    }

    int signal_begin = 0;
    std::vector<double> signal = computeEma(macd_values, signal_length_, signal_begin);
    points_.reserve(signal.size());
    for (std::size_t i = 0; i < signal.size(); ++i) {
        const std::size_t macd_idx = static_cast<std::size_t>(signal_begin) + i;
        core::MacdPoint point;
        point.time = macd_line_[macd_idx].time;
        point.macd = macd_values[macd_idx];
        point.signal = signal[i];
        point.histogram = point.macd - point.signal;
        points_.push_back(point);
    }
    logger->trace("Calculated {} MACD line points and {} signal points for {}", macd_line_.size(), points_.size(), name_);
}

} // namespace indicators
