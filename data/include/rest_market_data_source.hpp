#pragma once

#include "market_data_source.hpp"
#include "config.hpp"
#include <string>

namespace data {

// PostgREST-style HTTP source: GET {base_url}/rest/v1/{table}?symbol=eq.X&tf=eq.Y&time=lt.<ISO>...
class RestMarketDataSource : public IMarketDataSource {
public:
    RestMarketDataSource(const core::RestConfig& config, const std::string& api_key);

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

private:
    // `time_filter` is e.g. "lt.2024-01-01T00:00:00Z"; empty to skip
    core::TimeSeries<core::Candle> performQuery(const std::string& symbol,
                                                std::optional<core::Timeframe> tf,
                                                const std::string& time_filter,
                                                const std::string& order,
                                                std::size_t limit,
                                                const core::CancellationToken& token);

    std::string endpoint_;
    std::string api_key_;
};

} // namespace data
