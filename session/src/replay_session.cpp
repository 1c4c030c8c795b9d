#include "replay_session.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "position_sizing.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace session {

    namespace {
        core::Timestamp wallClockNow() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    ReplaySession::ReplaySession(const core::EngineConfig& config,
                                 std::shared_ptr<data::IMarketDataSource> source,
                                 std::shared_ptr<simulation::IFetchExecutor> executor,
                                 std::shared_ptr<const trading::ICurrencyConverter> converter,
                                 SessionOptions options)
        : config_(config),
          source_(std::move(source)),
          executor_(executor ? std::move(executor)
                             : std::shared_ptr<simulation::IFetchExecutor>(std::make_shared<simulation::InlineFetchExecutor>())),
          buffer_(source_, config_),
          clock_(core::Timeframe::H1, config_.default_speed_ms,
                 [this](std::size_t index) -> std::optional<core::Timestamp> {
                     const auto& visible = buffer_.visible();
                     if (index < visible.size()) return visible[index].time;
                     return std::nullopt;
                 }),
          indicators_(config_.indicators),
          orders_(config_.initial_balance,
                  converter ? std::move(converter)
                            : std::shared_ptr<const trading::ICurrencyConverter>(
                                  std::make_shared<trading::StaticRateCurrencyConverter>(config_.leverage)),
                  config_.stop_out_level),
          trend_(source_, config_)
    {
        if (options.start_timers) {
            playback_timer_ = std::make_unique<simulation::PeriodicTimer>(
                "playback",
                [this]() { return std::chrono::milliseconds(clock_.speedMs()); },
                [this]() { tick(); });
            time_played_timer_ = std::make_unique<simulation::PeriodicTimer>(
                "time-played",
                []() { return std::chrono::milliseconds(1000); },
                [this]() { addTimePlayed(1); });
            clock_.attachTimer(playback_timer_.get());
        }
        core::logging::getLogger()->debug("ReplaySession created (timers {}).",
                                          options.start_timers ? "on" : "off");
    }

    ReplaySession::~ReplaySession() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_cancel_.cancel();
            clock_.pause();
        }
        if (playback_timer_) playback_timer_->shutdown();
        if (time_played_timer_) time_played_timer_->shutdown();
        executor_->shutdown();
    }

    // --- Internal helpers ---

    void ReplaySession::dispatch(Notifications& notes, Jobs& jobs) {
        ISessionListener* listener = listener_.load();
        if (listener) {
            for (auto& note : notes) {
                note(*listener);
            }
        }
        for (auto& job : jobs) {
            executor_->submit(std::move(job));
        }
    }

    void ReplaySession::cancelInFlightLocked() {
        load_cancel_.cancel();
        load_cancel_ = core::CancellationSource();
    }

    double ReplaySession::currentPriceLocked() const {
        const auto& visible = buffer_.visible();
        if (!buffer_.hasData() || clock_.isReloading() || clock_.index() >= visible.size()) {
            return 0.0;
        }
        return visible[clock_.index()].close;
    }

    core::Timestamp ReplaySession::simTimeOrAnchorLocked() const {
        return clock_.simTime().value_or(clock_.anchor());
    }

    trading::MarketContext ReplaySession::marketLocked() const {
        return trading::MarketContext{symbol_, currentPriceLocked(), simTimeOrAnchorLocked()};
    }

    void ReplaySession::requestReloadLocked(core::Timestamp anchor, Jobs& jobs) {
        auto logger = core::logging::getLogger();
        if (symbol_.empty()) {
            logger->warn("No active symbol; reload skipped.");
            return;
        }

        cancelInFlightLocked();
        const auto token = load_cancel_.token();
        clock_.beginReload(anchor);
        loading_ = true;
        trend_.invalidate();

        simulation::LoadRequest request{symbol_, timeframe_, anchor, session_start_};
        logger->info("Loading {} {} around {}", symbol_, core::utils::timeframeToString(timeframe_),
                     core::utils::timestampToString(anchor));

        jobs.push_back([this, request, token]() {
            auto window = buffer_.fetchWindow(request, token);
            completeLoad(std::move(window), token);
        });
    }

    void ReplaySession::completeLoad(simulation::BufferWindow window, const core::CancellationToken& token) {
        auto logger = core::logging::getLogger();
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (token.isCancelled()) {
                logger->debug("Load for {} superseded; result discarded.", window.request.symbol);
                return;
            }

            const auto request = window.request;
            const auto status = window.status;
            const auto cursor = window.cursor;
            const auto override_time = window.sim_time_override;
            if (!buffer_.commit(std::move(window), token)) {
                return;
            }
            loading_ = false;
            session_start_ = request.session_start;

            if (status == simulation::LoadStatus::NoData) {
                clock_.abortReload();
                logger->warn("No data for {} {} at {}", request.symbol,
                             core::utils::timeframeToString(request.timeframe),
                             core::utils::timestampToString(request.anchor_time));
                notes.push_back([request](ISessionListener& l) { l.onNoData(request.symbol, request.timeframe); });
            } else {
                clock_.setTimeframe(request.timeframe);
                clock_.completeReload(cursor, buffer_.visible().size(),
                                      override_time ? override_time : std::optional<core::Timestamp>(request.anchor_time));
                logger->info("Loaded {} {}: {} visible bars, cursor {} ({}), price {:.5f}",
                             request.symbol, core::utils::timeframeToString(request.timeframe),
                             buffer_.visible().size(), clock_.index(),
                             core::utils::timestampToString(buffer_.visible()[clock_.index()].time),
                             currentPriceLocked());
                scheduleTrendLocked(jobs);
            }
            notes.push_back([request, status](ISessionListener& l) {
                l.onLoadComplete(request.symbol, request.timeframe, status);
            });
        }
        dispatch(notes, jobs);
    }

    void ReplaySession::afterIndexChangeLocked(Notifications& notes, Jobs& jobs) {
        buffer_.releasePartialBar(clock_.index());
        if (!buffer_.hasData() || clock_.index() >= buffer_.visible().size()) return;

        const core::Candle bar = buffer_.visible()[clock_.index()];
        const auto report = orders_.onTick(bar, marketLocked());
        if (report.stopped_out) {
            clock_.pause();
            if (!blown_notified_) {
                blown_notified_ = true;
                const core::AccountState account = orders_.account();
                notes.push_back([account](ISessionListener& l) { l.onStopOut(account); });
            }
        }

        scheduleExtensionLocked(jobs);
        scheduleTrendLocked(jobs);
    }

    void ReplaySession::scheduleExtensionLocked(Jobs& jobs) {
        auto plan = buffer_.planExtension(clock_.index());
        if (!plan) return;

        const auto token = load_cancel_.token();
        jobs.push_back([this, plan = *plan, token]() {
            auto bars = buffer_.fetchExtension(plan, token);
            std::lock_guard<std::mutex> lock(mutex_);
            if (buffer_.commitExtension(plan, bars, token) > 0) {
                clock_.setMaxIndex(buffer_.visible().size());
            }
        });
    }

    void ReplaySession::scheduleTrendLocked(Jobs& jobs) {
        const auto sim_time = clock_.simTime();
        if (!sim_time) return;
        auto request = trend_.planRefresh(symbol_, *sim_time);
        if (!request) return;

        const auto token = load_cancel_.token();
        jobs.push_back([this, request = *request, token]() {
            auto readings = trend_.fetch(request, token);
            std::lock_guard<std::mutex> lock(mutex_);
            trend_.commit(request, std::move(readings), token);
        });
    }

    // --- Profile binding ---

    void ReplaySession::open(const TraderProfile& profile) {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            clock_.pause();
            cancelInFlightLocked();

            profile_ = profile;
            if (profile_->created_at == 0) profile_->created_at = wallClockNow();
            profile_->last_played = wallClockNow();

            symbol_ = profile.active_symbol;
            timeframe_ = profile.active_timeframe;
            session_start_ = profile.start_date;
            orders_.restore(profile.account, profile.initial_balance);
            blown_notified_ = profile.account.equity <= 0.0 && !profile.account.history.empty();
            buffer_.clear();
            trend_.invalidate();

            const core::Timestamp anchor = profile.current_sim_time > 0 ? profile.current_sim_time : profile.start_date;
            core::logging::getLogger()->info("Opening profile '{}' ({}) on {} {}", profile.name, profile.id,
                                             symbol_, core::utils::timeframeToString(timeframe_));
            requestReloadLocked(anchor, jobs);
        }
        if (time_played_timer_) time_played_timer_->start();
        dispatch(notes, jobs);
    }

    TraderProfile ReplaySession::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!profile_) {
            throw core::SessionException("No profile is open.");
        }
        TraderProfile result = *profile_;
        result.account = orders_.account();
        result.initial_balance = orders_.initialBalance();
        result.active_symbol = symbol_;
        result.active_timeframe = timeframe_;
        result.current_sim_time = simTimeOrAnchorLocked();
        result.last_played = wallClockNow();
        return result;
    }

    std::optional<TraderProfile> ReplaySession::close() {
        if (time_played_timer_) time_played_timer_->stop();
        std::lock_guard<std::mutex> lock(mutex_);
        clock_.pause();
        cancelInFlightLocked();
        loading_ = false;
        if (!profile_) return std::nullopt;

        TraderProfile result = *profile_;
        result.account = orders_.account();
        result.initial_balance = orders_.initialBalance();
        result.active_symbol = symbol_;
        result.active_timeframe = timeframe_;
        result.current_sim_time = simTimeOrAnchorLocked();
        result.last_played = wallClockNow();
        profile_.reset();
        core::logging::getLogger()->info("Profile '{}' closed after {} s of play", result.name, result.time_played);
        return result;
    }

    bool ReplaySession::isOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return profile_.has_value();
    }

    void ReplaySession::addTimePlayed(long long seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (profile_) profile_->time_played += seconds;
    }

    void ReplaySession::setDrawings(const nlohmann::json& drawings) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (profile_) profile_->drawings = drawings;
    }

    // --- Instrument ---

    void ReplaySession::setSymbol(const std::string& symbol) {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (symbol.empty() || symbol == symbol_) return;
            symbol_ = symbol;
            requestReloadLocked(simTimeOrAnchorLocked(), jobs);
        }
        dispatch(notes, jobs);
    }

    void ReplaySession::setTimeframe(core::Timeframe timeframe) {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (timeframe == timeframe_ && buffer_.hasData()) return;
            timeframe_ = timeframe;
            requestReloadLocked(simTimeOrAnchorLocked(), jobs);
        }
        dispatch(notes, jobs);
    }

    // --- Clock controls ---

    bool ReplaySession::play() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.hasData()) return false;
        return clock_.play();
    }

    void ReplaySession::pause() {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_.pause();
    }

    bool ReplaySession::step() {
        Notifications notes;
        Jobs jobs;
        bool advanced = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            advanced = clock_.step();
            if (advanced) afterIndexChangeLocked(notes, jobs);
        }
        dispatch(notes, jobs);
        return advanced;
    }

    bool ReplaySession::setSpeed(int speed_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        return clock_.setSpeed(speed_ms);
    }

    void ReplaySession::tick() {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!clock_.isPlaying()) return;
            if (clock_.tick()) {
                afterIndexChangeLocked(notes, jobs);
            } else {
                core::logging::getLogger()->info("End of buffered data reached; playback paused.");
            }
        }
        dispatch(notes, jobs);
    }

    void ReplaySession::jumpToDate(core::Timestamp time) {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requestReloadLocked(time, jobs);
        }
        dispatch(notes, jobs);
    }

    void ReplaySession::jumpToFirstData() {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (symbol_.empty()) return;
            cancelInFlightLocked();
            const auto token = load_cancel_.token();
            clock_.beginReload(simTimeOrAnchorLocked());
            loading_ = true;
            trend_.invalidate();

            simulation::LoadRequest request{symbol_, timeframe_, clock_.anchor(), session_start_};
            jobs.push_back([this, request, token]() mutable {
                auto first = buffer_.resolveFirstBar(request.symbol, request.timeframe, token);
                if (!first) {
                    simulation::BufferWindow empty;
                    empty.request = request;
                    empty.status = token.isCancelled() ? simulation::LoadStatus::Cancelled
                                                       : simulation::LoadStatus::NoData;
                    completeLoad(std::move(empty), token);
                    return;
                }
                request.anchor_time = first->time;
                request.session_start = std::min(request.session_start, first->time);
                core::logging::getLogger()->info("Earliest {} data at {}", request.symbol,
                                                 core::utils::timestampToString(first->time));
                completeLoad(buffer_.fetchWindow(request, token), token);
            });
        }
        dispatch(notes, jobs);
    }

    bool ReplaySession::loadMoreHistory() {
        Notifications notes;
        Jobs jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (clock_.isReloading()) return false;
            auto plan = buffer_.planBackfill();
            if (!plan) return false;

            const auto token = load_cancel_.token();
            jobs.push_back([this, plan = *plan, token]() {
                auto bars = buffer_.fetchBackfill(plan, token);
                std::lock_guard<std::mutex> lock(mutex_);
                const std::size_t k = buffer_.commitBackfill(plan, bars, token);
                if (k > 0) clock_.shift(k);
            });
        }
        dispatch(notes, jobs);
        return true;
    }

    // --- Orders ---

    trading::OrderResult ReplaySession::placeOrder(const trading::OrderRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.hasData() || clock_.isReloading()) {
            return trading::OrderResult::reject(trading::RejectReason::InvalidPrice, "No market data is loaded.");
        }
        return orders_.placeOrder(request, marketLocked());
    }

    trading::OrderResult ReplaySession::closeOrder(const std::string& trade_id, std::optional<double> exit_price) {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.closeOrder(trade_id, marketLocked(), exit_price);
    }

    trading::OrderResult ReplaySession::modifyTrade(const std::string& trade_id, double stop_loss, double take_profit) {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.modifyTrade(trade_id, stop_loss, take_profit, marketLocked());
    }

    trading::OrderResult ReplaySession::modifyPendingEntry(const std::string& trade_id, double entry_price) {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.modifyPendingEntry(trade_id, entry_price, marketLocked());
    }

    trading::OrderResult ReplaySession::annotateTrade(const std::string& trade_id, const core::TradeJournal& journal) {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.annotateTrade(trade_id, journal);
    }

    // --- Queries ---

    core::TimeSeries<core::Candle> ReplaySession::visibleSlice() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& visible = buffer_.visible();
        if (!buffer_.hasData() || clock_.isReloading()) return {};
        const std::size_t end = std::min(clock_.index() + 1, visible.size());
        return core::TimeSeries<core::Candle>(visible.begin(), visible.begin() + static_cast<std::ptrdiff_t>(end));
    }

    double ReplaySession::currentPrice() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentPriceLocked();
    }

    std::optional<core::Timestamp> ReplaySession::simTime() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clock_.simTime();
    }

    core::SimulationState ReplaySession::simulationState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clock_.state();
    }

    core::AccountState ReplaySession::account() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.account();
    }

    double ReplaySession::usedMargin() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.usedMargin();
    }

    double ReplaySession::marginLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.marginLevel();
    }

    trading::TradeStatistics ReplaySession::statistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return trading::computeStatistics(orders_.account());
    }

    double ReplaySession::suggestedLotSize(double entry_price, double stop_loss) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const double risk = profile_ ? profile_->lot_size.risk_percent : 1.0;
        return trading::calculatePositionSize(orders_.account().balance, risk, entry_price, stop_loss, symbol_);
    }

    std::vector<indicators::IndicatorView> ReplaySession::indicatorViews(bool exclude_synthetic) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.hasData() || clock_.isReloading()) return {};

        try {
            indicators_.update(buffer_.fullSequence(), buffer_.version());
        } catch (const core::IndicatorCalculationException& e) {
            core::logging::getLogger()->error("Indicator update failed: {}", e.what());
            return {};
        }

        const auto& visible = buffer_.visible();
        const std::size_t cursor = std::min(clock_.index(), visible.size() - 1);
        return indicators_.views(visible.front().time, visible[cursor].time, exclude_synthetic);
    }

    void ReplaySession::setIndicatorConfigs(const std::vector<core::IndicatorConfig>& configs) {
        std::lock_guard<std::mutex> lock(mutex_);
        indicators_.setConfigs(configs);
    }

    TrendReadings ReplaySession::trendReadings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return trend_.readings();
    }

    simulation::LoadStatus ReplaySession::dataStatus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.status();
    }

    bool ReplaySession::isLoading() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return loading_;
    }

    std::string ReplaySession::activeSymbol() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return symbol_;
    }

    core::Timeframe ReplaySession::activeTimeframe() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timeframe_;
    }

    std::size_t ReplaySession::bufferedBars() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.visible().size();
    }

} // namespace session
