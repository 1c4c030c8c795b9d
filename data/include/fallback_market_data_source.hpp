#pragma once

#include "market_data_source.hpp"
#include <memory>

namespace data {

// Decorator: when the requested timeframe has no rows, fetch the fine M2
// series instead and resample it to the target timeframe.
class FallbackMarketDataSource : public IMarketDataSource {
public:
    FallbackMarketDataSource(std::shared_ptr<IMarketDataSource> inner, std::size_t limit_cap = 50000);

    core::TimeSeries<core::Candle> fetchContext(const std::string& symbol, core::Timeframe tf,
                                                core::Timestamp before, std::size_t limit,
                                                const core::CancellationToken& token) override;
    core::TimeSeries<core::Candle> fetchFuture(const std::string& symbol, core::Timeframe tf,
                                               core::Timestamp after, std::size_t limit,
                                               const core::CancellationToken& token) override;
    std::optional<core::Candle> fetchFirst(const std::string& symbol, std::optional<core::Timeframe> tf,
                                           const core::CancellationToken& token) override;
    std::optional<core::Candle> fetchLast(const std::string& symbol, std::optional<core::Timeframe> tf,
                                          const core::CancellationToken& token) override;
    core::TimeSeries<core::Candle> fetchHistorical(const std::string& symbol, core::Timeframe tf,
                                                   core::Timestamp before, std::size_t limit,
                                                   const core::CancellationToken& token) override;

    // M2 bars needed to cover `limit` bars of `tf`, capped
    std::size_t fineLimitFor(core::Timeframe tf, std::size_t limit) const;

private:
    core::TimeSeries<core::Candle> backwardFallback(const std::string& symbol, core::Timeframe tf,
                                                    core::Timestamp before, std::size_t limit,
                                                    const core::CancellationToken& token);

    std::shared_ptr<IMarketDataSource> inner_;
    std::size_t limit_cap_;
};

} // namespace data
