#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "market_data_source.hpp"
#include "trend_classifier.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace session {

    using TrendReadings = std::map<core::Timeframe, indicators::Trend>;

    struct TrendRequest {
        std::string symbol;
        core::Timestamp sim_time = 0;
    };

    // Advisory higher-timeframe trend panel. Never feeds back into trading.
    class TrendMonitor {
    public:
        TrendMonitor(std::shared_ptr<data::IMarketDataSource> source, const core::EngineConfig& config);

        // A request when the symbol changed or the simulated time moved at least
        // trend_refresh_seconds since the last one; records it as issued.
        std::optional<TrendRequest> planRefresh(const std::string& symbol, core::Timestamp sim_time);
        // Off-lock part: fetches context bars per timeframe and classifies them
        TrendReadings fetch(const TrendRequest& request, const core::CancellationToken& token) const;
        void commit(const TrendRequest& request, TrendReadings readings, const core::CancellationToken& token);

        void invalidate();
        const TrendReadings& readings() const { return readings_; }
        std::optional<core::Timestamp> readingsTime() const { return readings_time_; }

    private:
        std::shared_ptr<data::IMarketDataSource> source_;
        core::EngineConfig config_;
        TrendReadings readings_;
        std::optional<core::Timestamp> readings_time_;
        std::optional<TrendRequest> last_request_;
    };

} // namespace session
