#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace data {

    // An upstream field: absent, numeric, or numeric/ISO text
    using RawValue = std::variant<std::monostate, double, std::string>;

    struct RawCandle {
        RawValue time;
        RawValue open;
        RawValue high;
        RawValue low;
        RawValue close;
        RawValue volume;
    };

    // Normalizes upstream bars into a strictly increasing canonical sequence.
    // Unparseable bars and bars with close <= 0 are dropped, XAUUSD/XAGUSD scale
    // errors are corrected, duplicates keep their first occurrence.
    core::TimeSeries<core::Candle> sanitizeCandles(const std::vector<RawCandle>& raw_bars,
                                                   const std::string& symbol = "");

    // Same over a JSON array of {time, open, high, low, close, volume?} objects.
    // A non-array payload yields an empty series.
    core::TimeSeries<core::Candle> sanitizeJsonRows(const nlohmann::json& rows,
                                                    const std::string& symbol = "");

    // Buckets by floor(time / period). Input must be ascending.
    core::TimeSeries<core::Candle> resampleCandles(const core::TimeSeries<core::Candle>& base,
                                                   core::Timeframe target);

    // Folds an ascending span into one bar stamped with the first bar's time
    std::optional<core::Candle> aggregateCandles(const core::TimeSeries<core::Candle>& bars);

} // namespace data
