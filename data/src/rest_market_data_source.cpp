#include "rest_market_data_source.hpp"
#include "candle_sanitizer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace data {

RestMarketDataSource::RestMarketDataSource(const core::RestConfig& config, const std::string& api_key)
    : endpoint_(config.base_url + "/rest/v1/" + config.table),
      api_key_(api_key)
{
    core::logging::getLogger()->debug("RestMarketDataSource created for endpoint {}", endpoint_);
    if (api_key_.empty()) {
        core::logging::getLogger()->warn("RestMarketDataSource created without API key. Requests will likely be rejected.");
    }
}

core::TimeSeries<core::Candle> RestMarketDataSource::performQuery(const std::string& symbol,
                                                                  std::optional<core::Timeframe> tf,
                                                                  const std::string& time_filter,
                                                                  const std::string& order,
                                                                  std::size_t limit,
                                                                  const core::CancellationToken& token)
{
    core::TimeSeries<core::Candle> candles;
    auto logger = core::logging::getLogger();
    if (token.isCancelled()) {
        return candles;
    }

    cpr::Parameters params{{"symbol", "eq." + symbol}};
    if (tf) {
        params.Add({"tf", "eq." + core::utils::timeframeToString(*tf)});
    }
    if (!time_filter.empty()) {
        params.Add({"time", time_filter});
    }
    params.Add({"order", order});
    params.Add({"limit", std::to_string(limit)});

    cpr::Header headers = {
        {"apikey", api_key_},
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };

    cpr::Response response = cpr::Get(cpr::Url{endpoint_}, params, headers, cpr::Timeout{15000});

    // No abort primitive in the HTTP layer: drop the result instead
    if (token.isCancelled()) {
        logger->debug("Discarding REST response for {}: request cancelled.", symbol);
        return {};
    }

    if (response.error) {
        logger->error("REST request failed (CPR error): Code={}, Message='{}'",
                      static_cast<int>(response.error.code), response.error.message);
        return candles;
    }
    if (response.status_code != 200) {
        logger->error("REST request failed: Status Code={}, Body='{}'", response.status_code, response.text);
        return candles;
    }

    try {
        nlohmann::json rows = nlohmann::json::parse(response.text);
        candles = sanitizeJsonRows(rows, symbol);
    } catch (const nlohmann::json::exception& e) {
        logger->error("Failed to parse REST candle payload for {}: {}", symbol, e.what());
        return {};
    }

    logger->debug("REST {} {} [{}] -> {} candles", symbol, tf ? core::utils::timeframeToString(*tf) : "*",
                  time_filter, candles.size());
    return candles;
}

core::TimeSeries<core::Candle> RestMarketDataSource::fetchContext(const std::string& symbol,
                                                                  core::Timeframe tf,
                                                                  core::Timestamp before,
                                                                  std::size_t limit,
                                                                  const core::CancellationToken& token)
{
    // Descending order returns the newest rows; sanitizing sorts them back
    return performQuery(symbol, tf, "lt." + core::utils::timestampToString(before), "time.desc", limit, token);
}

core::TimeSeries<core::Candle> RestMarketDataSource::fetchFuture(const std::string& symbol,
                                                                 core::Timeframe tf,
                                                                 core::Timestamp after,
                                                                 std::size_t limit,
                                                                 const core::CancellationToken& token)
{
    return performQuery(symbol, tf, "gt." + core::utils::timestampToString(after), "time.asc", limit, token);
}

std::optional<core::Candle> RestMarketDataSource::fetchFirst(const std::string& symbol,
                                                             std::optional<core::Timeframe> tf,
                                                             const core::CancellationToken& token)
{
    auto candles = performQuery(symbol, tf, "", "time.asc", 1, token);
    if (candles.empty()) {
        return std::nullopt;
    }
    return candles.front();
}

std::optional<core::Candle> RestMarketDataSource::fetchLast(const std::string& symbol,
                                                            std::optional<core::Timeframe> tf,
                                                            const core::CancellationToken& token)
{
    auto candles = performQuery(symbol, tf, "", "time.desc", 1, token);
    if (candles.empty()) {
        return std::nullopt;
    }
    return candles.back();
}

core::TimeSeries<core::Candle> RestMarketDataSource::fetchHistorical(const std::string& symbol,
                                                                     core::Timeframe tf,
                                                                     core::Timestamp before,
                                                                     std::size_t limit,
                                                                     const core::CancellationToken& token)
{
    return fetchContext(symbol, tf, before, limit, token);
}

} // namespace data
