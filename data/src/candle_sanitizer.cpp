#include "candle_sanitizer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>

namespace data {

    namespace {

        constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

        // Leading-number semantics: "1.2345abc" -> 1.2345, "abc" -> NaN
        double parsePrice(const RawValue& value) {
            if (const double* number = std::get_if<double>(&value)) {
                return *number;
            }
            if (const std::string* text = std::get_if<std::string>(&value)) {
                const char* begin = text->c_str();
                char* end = nullptr;
                double parsed = std::strtod(begin, &end);
                if (end == begin) {
                    return kNaN;
                }
                return parsed;
            }
            return kNaN;
        }

        std::optional<core::Timestamp> parseTime(const RawValue& value) {
            if (const double* number = std::get_if<double>(&value)) {
                // 2^63: the first value past the Timestamp range
                constexpr double kTimestampLimit = 9223372036854775808.0;
                const double floored = std::isfinite(*number) ? std::floor(*number) : kTimestampLimit;
                if (floored >= kTimestampLimit || floored < -kTimestampLimit) {
                    return std::nullopt;
                }
                return static_cast<core::Timestamp>(floored);
            }
            if (const std::string* text = std::get_if<std::string>(&value)) {
                return core::utils::tryParseTimestamp(*text);
            }
            return std::nullopt;
        }

        RawValue fromJson(const nlohmann::json& row, const char* key) {
            auto it = row.find(key);
            if (it == row.end() || it->is_null()) {
                return std::monostate{};
            }
            if (it->is_number()) {
                return it->get<double>();
            }
            if (it->is_string()) {
                return it->get<std::string>();
            }
            return std::monostate{};
        }

    } // namespace

    core::TimeSeries<core::Candle> sanitizeCandles(const std::vector<RawCandle>& raw_bars,
                                                   const std::string& symbol)
    {
        auto logger = core::logging::getLogger();
        core::TimeSeries<core::Candle> valid;
        valid.reserve(raw_bars.size());

        std::size_t dropped = 0;
        for (const auto& raw : raw_bars) {
            auto time = parseTime(raw.time);
            core::Candle candle;
            candle.open = parsePrice(raw.open);
            candle.high = parsePrice(raw.high);
            candle.low = parsePrice(raw.low);
            candle.close = parsePrice(raw.close);

            if (!time || std::isnan(candle.close) || candle.close <= 0.0) {
                ++dropped;
                continue;
            }
            candle.time = *time;

            // Feeds occasionally deliver metals at 1/100 (gold) or 1/10 (silver) scale
            if (symbol == "XAUUSD" && candle.close < 500.0) {
                candle.open *= 100.0; candle.high *= 100.0; candle.low *= 100.0; candle.close *= 100.0;
            }
            if (symbol == "XAGUSD" && candle.close < 5.0) {
                candle.open *= 10.0; candle.high *= 10.0; candle.low *= 10.0; candle.close *= 10.0;
            }

            double volume = parsePrice(raw.volume);
            candle.volume = (std::isnan(volume) || volume < 0.0) ? 0.0 : volume;
            valid.push_back(candle);
        }

        // Stable sort so the first occurrence of a duplicate time survives
        std::stable_sort(valid.begin(), valid.end(),
                         [](const core::Candle& a, const core::Candle& b) { return a.time < b.time; });

        core::TimeSeries<core::Candle> unique;
        unique.reserve(valid.size());
        for (const auto& candle : valid) {
            if (!unique.empty() && unique.back().time == candle.time) {
                ++dropped;
                continue;
            }
            unique.push_back(candle);
        }

        if (dropped > 0) {
            logger->debug("Sanitizer dropped {} of {} raw bars for '{}'", dropped, raw_bars.size(), symbol);
        }
        return unique;
    }

    core::TimeSeries<core::Candle> sanitizeJsonRows(const nlohmann::json& rows, const std::string& symbol) {
        if (!rows.is_array()) {
            core::logging::getLogger()->warn("Received non-array candle payload for '{}': {}", symbol, rows.dump());
            return {};
        }

        std::vector<RawCandle> raw_bars;
        raw_bars.reserve(rows.size());
        for (const auto& row : rows) {
            if (!row.is_object()) {
                continue;
            }
            RawCandle raw;
            raw.time = fromJson(row, "time");
            raw.open = fromJson(row, "open");
            raw.high = fromJson(row, "high");
            raw.low = fromJson(row, "low");
            raw.close = fromJson(row, "close");
            raw.volume = fromJson(row, "volume");
            raw_bars.push_back(std::move(raw));
        }
        return sanitizeCandles(raw_bars, symbol);
    }

    core::TimeSeries<core::Candle> resampleCandles(const core::TimeSeries<core::Candle>& base,
                                                   core::Timeframe target)
    {
        core::TimeSeries<core::Candle> resampled;
        if (base.empty()) {
            return resampled;
        }

        // Map keeps buckets ordered and tolerates gaps
        std::map<core::Timestamp, core::TimeSeries<core::Candle>> buckets;
        for (const auto& candle : base) {
            buckets[core::utils::alignToTimeframe(candle.time, target)].push_back(candle);
        }

        resampled.reserve(buckets.size());
        for (const auto& entry : buckets) {
            auto folded = aggregateCandles(entry.second);
            if (folded) {
                folded->time = entry.first;
                resampled.push_back(*folded);
            }
        }
        return resampled;
    }

    std::optional<core::Candle> aggregateCandles(const core::TimeSeries<core::Candle>& bars) {
        if (bars.empty()) {
            return std::nullopt;
        }
        core::Candle folded;
        folded.time = bars.front().time;
        folded.open = bars.front().open;
        folded.close = bars.back().close;
        folded.high = -std::numeric_limits<double>::infinity();
        folded.low = std::numeric_limits<double>::infinity();
        folded.volume = 0.0;
        for (const auto& bar : bars) {
            folded.high = std::max(folded.high, bar.high);
            folded.low = std::min(folded.low, bar.low);
            folded.volume += bar.volume;
        }
        return folded;
    }

} // namespace data
