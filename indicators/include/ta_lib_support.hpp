#pragma once

#include <vector>

namespace indicators {

    // TA_Initialize once per process; EMA/RSI unstable periods set to 0 so
    // seeding follows the classic SMA-seed definition. Throws IndicatorCalculationException.
    void ensureTaLibInitialized();

    // TA_EMA over a raw series. Returns values aligned to input index out_begin_idx.
    // Empty when the input is shorter than `period`.
    std::vector<double> computeEma(const std::vector<double>& input, int period, int& out_begin_idx);

} // namespace indicators
