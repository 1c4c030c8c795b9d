#include "fallback_market_data_source.hpp"
#include "candle_sanitizer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace data {

FallbackMarketDataSource::FallbackMarketDataSource(std::shared_ptr<IMarketDataSource> inner, std::size_t limit_cap)
    : inner_(std::move(inner)), limit_cap_(limit_cap)
{
    if (!inner_) {
        throw std::invalid_argument("FallbackMarketDataSource requires an inner source.");
    }
}

std::size_t FallbackMarketDataSource::fineLimitFor(core::Timeframe tf, std::size_t limit) const {
    const long long ratio = core::utils::timeframeSeconds(tf) / core::utils::timeframeSeconds(core::Timeframe::M2);
    return std::min(limit * static_cast<std::size_t>(ratio), limit_cap_);
}

core::TimeSeries<core::Candle> FallbackMarketDataSource::backwardFallback(const std::string& symbol,
                                                                          core::Timeframe tf,
                                                                          core::Timestamp before,
                                                                          std::size_t limit,
                                                                          const core::CancellationToken& token)
{
    auto fine = inner_->fetchContext(symbol, core::Timeframe::M2, before, fineLimitFor(tf, limit), token);
    if (fine.empty()) {
        return {};
    }
    auto resampled = resampleCandles(fine, tf);
    if (resampled.size() > limit) {
        resampled.erase(resampled.begin(), resampled.end() - static_cast<std::ptrdiff_t>(limit));
    }
    core::logging::getLogger()->debug("M2 fallback for {} ({}) before {}: {} fine bars -> {} bars",
                                      symbol, core::utils::timeframeToString(tf),
                                      core::utils::timestampToString(before), fine.size(), resampled.size());
    return resampled;
}

core::TimeSeries<core::Candle> FallbackMarketDataSource::fetchContext(const std::string& symbol,
                                                                      core::Timeframe tf,
                                                                      core::Timestamp before,
                                                                      std::size_t limit,
                                                                      const core::CancellationToken& token)
{
    auto candles = inner_->fetchContext(symbol, tf, before, limit, token);
    if (!candles.empty() || tf == core::Timeframe::M2 || token.isCancelled()) {
        return candles;
    }
    return backwardFallback(symbol, tf, before, limit, token);
}

core::TimeSeries<core::Candle> FallbackMarketDataSource::fetchFuture(const std::string& symbol,
                                                                     core::Timeframe tf,
                                                                     core::Timestamp after,
                                                                     std::size_t limit,
                                                                     const core::CancellationToken& token)
{
    auto candles = inner_->fetchFuture(symbol, tf, after, limit, token);
    if (!candles.empty() || tf == core::Timeframe::M2 || token.isCancelled()) {
        return candles;
    }

    auto fine = inner_->fetchFuture(symbol, core::Timeframe::M2, after, fineLimitFor(tf, limit), token);
    if (fine.empty()) {
        return {};
    }
    // The first bucket may start before `after`
    core::TimeSeries<core::Candle> result;
    for (const auto& candle : resampleCandles(fine, tf)) {
        if (candle.time > after && result.size() < limit) {
            result.push_back(candle);
        }
    }
    core::logging::getLogger()->debug("M2 fallback for {} ({}) after {}: {} fine bars -> {} bars",
                                      symbol, core::utils::timeframeToString(tf),
                                      core::utils::timestampToString(after), fine.size(), result.size());
    return result;
}

std::optional<core::Candle> FallbackMarketDataSource::fetchFirst(const std::string& symbol,
                                                                 std::optional<core::Timeframe> tf,
                                                                 const core::CancellationToken& token)
{
    return inner_->fetchFirst(symbol, tf, token);
}

std::optional<core::Candle> FallbackMarketDataSource::fetchLast(const std::string& symbol,
                                                                std::optional<core::Timeframe> tf,
                                                                const core::CancellationToken& token)
{
    return inner_->fetchLast(symbol, tf, token);
}

core::TimeSeries<core::Candle> FallbackMarketDataSource::fetchHistorical(const std::string& symbol,
                                                                         core::Timeframe tf,
                                                                         core::Timestamp before,
                                                                         std::size_t limit,
                                                                         const core::CancellationToken& token)
{
    auto candles = inner_->fetchHistorical(symbol, tf, before, limit, token);
    if (!candles.empty() || tf == core::Timeframe::M2 || token.isCancelled()) {
        return candles;
    }
    return backwardFallback(symbol, tf, before, limit, token);
}

} // namespace data
