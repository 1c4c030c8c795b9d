#include "ema_indicator.hpp"
#include "ta_lib_support.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("EMA period must be at least 2.");
    }
    ensureTaLibInitialized();

    lookback_ = TA_EMA_Lookback(period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_EMA_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<core::IndicatorPoint>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() < static_cast<std::size_t>(period_)) {
        logger->trace("Input size ({}) is shorter than period ({}) for {}. No results generated.",
                      input.size(), period_, name_);
        return;
    }

    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }

    int out_begin_idx = 0;
    std::vector<double> values = computeEma(close_prices, period_, out_begin_idx);
    if (values.empty()) {
        return;
    }
    if (out_begin_idx != lookback_) {
        logger->warn("TA_EMA out_begin_idx ({}) does not match lookback ({}) for {}.", out_begin_idx, lookback_, name_);
    }

    results_.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        results_.push_back({input[static_cast<std::size_t>(out_begin_idx) + i].time, values[i]});
    }
    logger->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
