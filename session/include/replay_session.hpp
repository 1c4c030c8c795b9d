#pragma once

#include "candle_buffer.hpp"
#include "config.hpp"
#include "currency_converter.hpp"
#include "fetch_executor.hpp"
#include "indicator_engine.hpp"
#include "market_data_source.hpp"
#include "order_engine.hpp"
#include "periodic_timer.hpp"
#include "profile.hpp"
#include "simulation_clock.hpp"
#include "trade_statistics.hpp"
#include "trend_monitor.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace session {

    // Session events. Called without the session lock held, possibly from a
    // timer or fetch thread; handlers may call back into the session.
    class ISessionListener {
    public:
        virtual ~ISessionListener() = default;
        virtual void onStopOut(const core::AccountState& /*account*/) {}
        virtual void onNoData(const std::string& /*symbol*/, core::Timeframe /*timeframe*/) {}
        virtual void onLoadComplete(const std::string& /*symbol*/, core::Timeframe /*timeframe*/,
                                    simulation::LoadStatus /*status*/) {}
    };

    struct SessionOptions {
        // Without timers play() only arms playback; tick() must be driven by the caller
        bool start_timers = true;
    };

    // One replay engine instance: buffer, clock, indicators, orders and trend
    // panel for the active profile. Every public method is thread-safe.
    class ReplaySession {
    public:
        ReplaySession(const core::EngineConfig& config,
                      std::shared_ptr<data::IMarketDataSource> source,
                      std::shared_ptr<simulation::IFetchExecutor> executor = nullptr,
                      std::shared_ptr<const trading::ICurrencyConverter> converter = nullptr,
                      SessionOptions options = SessionOptions{});
        ~ReplaySession();

        ReplaySession(const ReplaySession&) = delete;
        ReplaySession& operator=(const ReplaySession&) = delete;

        void setListener(ISessionListener* listener) { listener_.store(listener); }

        // --- Profile binding ---
        void open(const TraderProfile& profile);
        // Throws core::SessionException when no profile is open
        TraderProfile snapshot() const;
        // Stops timers and in-flight fetches; returns the final snapshot
        std::optional<TraderProfile> close();
        bool isOpen() const;
        void addTimePlayed(long long seconds);
        void setDrawings(const nlohmann::json& drawings);

        // --- Instrument ---
        void setSymbol(const std::string& symbol);
        void setTimeframe(core::Timeframe timeframe);

        // --- Clock controls ---
        bool play();
        void pause();
        bool step();
        bool setSpeed(int speed_ms);
        void tick(); // One playback tick, what the playback timer calls
        void jumpToDate(core::Timestamp time);
        void jumpToFirstData();
        // Requests an older page of history; false when nothing can be requested
        bool loadMoreHistory();

        // --- Orders ---
        trading::OrderResult placeOrder(const trading::OrderRequest& request);
        trading::OrderResult closeOrder(const std::string& trade_id, std::optional<double> exit_price = std::nullopt);
        trading::OrderResult modifyTrade(const std::string& trade_id, double stop_loss, double take_profit);
        trading::OrderResult modifyPendingEntry(const std::string& trade_id, double entry_price);
        trading::OrderResult annotateTrade(const std::string& trade_id, const core::TradeJournal& journal);

        // --- Queries ---
        core::TimeSeries<core::Candle> visibleSlice() const; // Bars 0..index
        double currentPrice() const;
        std::optional<core::Timestamp> simTime() const;
        core::SimulationState simulationState() const;
        core::AccountState account() const;
        double usedMargin() const;
        double marginLevel() const;
        trading::TradeStatistics statistics() const;
        double suggestedLotSize(double entry_price, double stop_loss) const;

        std::vector<indicators::IndicatorView> indicatorViews(bool exclude_synthetic = false);
        void setIndicatorConfigs(const std::vector<core::IndicatorConfig>& configs);

        TrendReadings trendReadings() const;
        simulation::LoadStatus dataStatus() const;
        bool isLoading() const;
        std::string activeSymbol() const;
        core::Timeframe activeTimeframe() const;
        std::size_t bufferedBars() const;
        const core::EngineConfig& config() const { return config_; }

    private:
        using Notification = std::function<void(ISessionListener&)>;
        using Notifications = std::vector<Notification>;
        using Jobs = std::vector<simulation::FetchJob>;

        void requestReloadLocked(core::Timestamp anchor, Jobs& jobs);
        void completeLoad(simulation::BufferWindow window, const core::CancellationToken& token);
        void afterIndexChangeLocked(Notifications& notes, Jobs& jobs);
        void scheduleExtensionLocked(Jobs& jobs);
        void scheduleTrendLocked(Jobs& jobs);
        void cancelInFlightLocked();

        trading::MarketContext marketLocked() const;
        double currentPriceLocked() const;
        core::Timestamp simTimeOrAnchorLocked() const;

        // Fires listener callbacks, then submits fetch jobs. Never called with mutex_ held.
        void dispatch(Notifications& notes, Jobs& jobs);

        mutable std::mutex mutex_;
        core::EngineConfig config_;
        std::shared_ptr<data::IMarketDataSource> source_;
        std::shared_ptr<simulation::IFetchExecutor> executor_;

        simulation::CandleBufferManager buffer_;
        simulation::SimulationClock clock_;
        indicators::IndicatorEngine indicators_;
        trading::OrderEngine orders_;
        TrendMonitor trend_;

        std::optional<TraderProfile> profile_;
        std::string symbol_;
        core::Timeframe timeframe_ = core::Timeframe::H1;
        core::Timestamp session_start_ = 0;

        core::CancellationSource load_cancel_;
        bool loading_ = false;
        bool blown_notified_ = false;
        std::atomic<ISessionListener*> listener_{nullptr};

        std::unique_ptr<simulation::PeriodicTimer> playback_timer_;
        std::unique_ptr<simulation::PeriodicTimer> time_played_timer_;
    };

} // namespace session
