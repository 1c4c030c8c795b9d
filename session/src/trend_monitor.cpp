#include "trend_monitor.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <stdexcept>

namespace session {

    TrendMonitor::TrendMonitor(std::shared_ptr<data::IMarketDataSource> source, const core::EngineConfig& config)
        : source_(std::move(source)), config_(config)
    {
        if (!source_) {
            throw std::invalid_argument("TrendMonitor requires a market data source.");
        }
    }

    std::optional<TrendRequest> TrendMonitor::planRefresh(const std::string& symbol, core::Timestamp sim_time) {
        if (symbol.empty()) return std::nullopt;
        if (last_request_ && last_request_->symbol == symbol
            && std::llabs(sim_time - last_request_->sim_time) < config_.trend_refresh_seconds) {
            return std::nullopt;
        }
        last_request_ = TrendRequest{symbol, sim_time};
        return last_request_;
    }

    TrendReadings TrendMonitor::fetch(const TrendRequest& request, const core::CancellationToken& token) const {
        TrendReadings readings;
        for (auto tf : config_.trend_timeframes) {
            if (token.isCancelled()) break;
            auto bars = source_->fetchContext(request.symbol, tf, request.sim_time, config_.trend_context_bars, token);
            readings[tf] = indicators::classifyTrend(bars, config_.trend_min_bars);
        }
        return readings;
    }

    void TrendMonitor::commit(const TrendRequest& request, TrendReadings readings, const core::CancellationToken& token) {
        if (token.isCancelled()) return;
        readings_ = std::move(readings);
        readings_time_ = request.sim_time;

        auto logger = core::logging::getLogger();
        for (const auto& entry : readings_) {
            logger->debug("Trend {} {}: {}", request.symbol, core::utils::timeframeToString(entry.first),
                          indicators::toString(entry.second));
        }
    }

    void TrendMonitor::invalidate() {
        readings_.clear();
        readings_time_.reset();
        last_request_.reset();
    }

} // namespace session
