#pragma once

#include "market_data_source.hpp"
#include "database_manager.hpp"

namespace data {

// Serves candles from the `market_data` table of a connected DatabaseManager
class SqliteMarketDataSource : public IMarketDataSource {
public:
    explicit SqliteMarketDataSource(DatabaseManager& db_manager);

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
    DatabaseManager& db_manager_; // Not owned
};

} // namespace data
