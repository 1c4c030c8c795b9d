#pragma once

#include "datatypes.hpp"
#include "cancellation.hpp"
#include <optional>
#include <string>

namespace data {

// Upstream candle provider. Implementations never throw: failures and
// cancellation resolve to empty series / std::nullopt. Series are ascending.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    // Newest `limit` bars with time < before
    virtual core::TimeSeries<core::Candle> fetchContext(const std::string& symbol,
                                                        core::Timeframe tf,
                                                        core::Timestamp before,
                                                        std::size_t limit,
                                                        const core::CancellationToken& token) = 0;

    // Oldest `limit` bars with time > after
    virtual core::TimeSeries<core::Candle> fetchFuture(const std::string& symbol,
                                                       core::Timeframe tf,
                                                       core::Timestamp after,
                                                       std::size_t limit,
                                                       const core::CancellationToken& token) = 0;

    // Without a timeframe the search spans every stored timeframe
    virtual std::optional<core::Candle> fetchFirst(const std::string& symbol,
                                                   std::optional<core::Timeframe> tf,
                                                   const core::CancellationToken& token) = 0;

    virtual std::optional<core::Candle> fetchLast(const std::string& symbol,
                                                  std::optional<core::Timeframe> tf,
                                                  const core::CancellationToken& token) = 0;

    // Paging backwards for backfill. Same window semantics as fetchContext.
    virtual core::TimeSeries<core::Candle> fetchHistorical(const std::string& symbol,
                                                           core::Timeframe tf,
                                                           core::Timestamp before,
                                                           std::size_t limit,
                                                           const core::CancellationToken& token) = 0;
};

} // namespace data
