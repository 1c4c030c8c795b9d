#include "sqlite_market_data_source.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace data {

SqliteMarketDataSource::SqliteMarketDataSource(DatabaseManager& db_manager)
    : db_manager_(db_manager)
{
    core::logging::getLogger()->debug("SqliteMarketDataSource created.");
}

core::TimeSeries<core::Candle> SqliteMarketDataSource::fetchContext(const std::string& symbol,
                                                                    core::Timeframe tf,
                                                                    core::Timestamp before,
                                                                    std::size_t limit,
                                                                    const core::CancellationToken& token)
{
    if (token.isCancelled() || limit == 0) {
        return {};
    }
    try {
        return db_manager_.queryBefore(symbol, tf, before, limit);
    } catch (const std::exception& e) {
        core::logging::getLogger()->error("fetchContext failed for {} ({}): {}",
                                          symbol, core::utils::timeframeToString(tf), e.what());
        return {};
    }
}

core::TimeSeries<core::Candle> SqliteMarketDataSource::fetchFuture(const std::string& symbol,
                                                                   core::Timeframe tf,
                                                                   core::Timestamp after,
                                                                   std::size_t limit,
                                                                   const core::CancellationToken& token)
{
    if (token.isCancelled() || limit == 0) {
        return {};
    }
    try {
        return db_manager_.queryAfter(symbol, tf, after, limit);
    } catch (const std::exception& e) {
        core::logging::getLogger()->error("fetchFuture failed for {} ({}): {}",
                                          symbol, core::utils::timeframeToString(tf), e.what());
        return {};
    }
}

std::optional<core::Candle> SqliteMarketDataSource::fetchFirst(const std::string& symbol,
                                                               std::optional<core::Timeframe> tf,
                                                               const core::CancellationToken& token)
{
    if (token.isCancelled()) {
        return std::nullopt;
    }
    try {
        return db_manager_.queryBoundary(symbol, tf, true);
    } catch (const std::exception& e) {
        core::logging::getLogger()->error("fetchFirst failed for {}: {}", symbol, e.what());
        return std::nullopt;
    }
}

std::optional<core::Candle> SqliteMarketDataSource::fetchLast(const std::string& symbol,
                                                              std::optional<core::Timeframe> tf,
                                                              const core::CancellationToken& token)
{
    if (token.isCancelled()) {
        return std::nullopt;
    }
    try {
        return db_manager_.queryBoundary(symbol, tf, false);
    } catch (const std::exception& e) {
        core::logging::getLogger()->error("fetchLast failed for {}: {}", symbol, e.what());
        return std::nullopt;
    }
}

core::TimeSeries<core::Candle> SqliteMarketDataSource::fetchHistorical(const std::string& symbol,
                                                                       core::Timeframe tf,
                                                                       core::Timestamp before,
                                                                       std::size_t limit,
                                                                       const core::CancellationToken& token)
{
    return fetchContext(symbol, tf, before, limit, token);
}

} // namespace data
