#include "rsi_indicator.hpp"
#include "ta_lib_support.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <vector>
#include <stdexcept>

namespace indicators {

RsiIndicator::RsiIndicator(int period, double upper_level, double lower_level)
    : period_(period), upper_level_(upper_level), lower_level_(lower_level), lookback_(0) {
    if (period_ < 2) {
         throw std::invalid_argument("RSI period must be at least 2.");
    }
    ensureTaLibInitialized();

    // Determine the lookback period required by TA-Lib
    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<core::IndicatorPoint>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }

    std::vector<double> values(close_prices.size() - static_cast<size_t>(lookback_));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_RSI(
        0,                                         // startIdx
        static_cast<int>(close_prices.size()) - 1, // endIdx
        close_prices.data(),
        period_,                                   // optInTimePeriod
        &out_begin_idx,
        &out_nb_element,
        values.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_RSI calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        return;
    }
    if (out_begin_idx != lookback_) {
         logger->warn("TA_RSI out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    values.resize(static_cast<size_t>(out_nb_element));

    // TA-Lib reports 0 when both averages are 0. A zero average loss means 100,
    // and the Wilder loss average stays 0 exactly until the first down move.
    bool seen_down_move = false;
    size_t scanned = 0;
    results_.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const size_t input_idx = static_cast<size_t>(out_begin_idx) + i;
        for (; scanned < input_idx; ++scanned) {
            if (close_prices[scanned + 1] < close_prices[scanned]) {
                seen_down_move = true;
            }
        }
        double value = values[i];
        if (!seen_down_move) {
            value = 100.0;
        }
        results_.push_back({input[input_idx].time, std::clamp(value, 0.0, 100.0)});
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
