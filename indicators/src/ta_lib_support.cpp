#include "ta_lib_support.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <mutex>
#include <string>

namespace indicators {

    void ensureTaLibInitialized() {
        static std::once_flag init_flag;
        static TA_RetCode init_code = TA_SUCCESS;
        std::call_once(init_flag, []() {
            init_code = TA_Initialize();
            if (init_code == TA_SUCCESS) {
                TA_SetCompatibility(TA_COMPATIBILITY_DEFAULT);
                TA_SetUnstablePeriod(TA_FUNC_UNST_ALL, 0);
                core::logging::getLogger()->debug("TA-Lib initialized.");
            }
        });
        if (init_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException("TA_Initialize failed with code " +
                                                      std::to_string(static_cast<int>(init_code)));
        }
    }

    std::vector<double> computeEma(const std::vector<double>& input, int period, int& out_begin_idx) {
        out_begin_idx = 0;
        std::vector<double> output;
        const int lookback = TA_EMA_Lookback(period);
        if (lookback < 0 || input.size() <= static_cast<std::size_t>(lookback)) {
            return output;
        }

        output.resize(input.size() - static_cast<std::size_t>(lookback));
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_EMA(
            0,                                   // startIdx
            static_cast<int>(input.size()) - 1,  // endIdx
            input.data(),
            period,                              // optInTimePeriod
            &out_begin_idx,
            &out_nb_element,
            output.data()
        );

        if (ret_code != TA_SUCCESS) {
            core::logging::getLogger()->error("TA-Lib TA_EMA({}) failed with error code: {}", period, static_cast<int>(ret_code));
            out_begin_idx = 0;
            return {};
        }
        output.resize(static_cast<std::size_t>(out_nb_element));
        return output;
    }

} // namespace indicators
