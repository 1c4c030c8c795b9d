#include "replay_session.hpp"
#include "exceptions.hpp"
#include "fake_market_data_source.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <mutex>

using session::ReplaySession;
using simulation::LoadStatus;
using testing_support::FakeMarketDataSource;
using testing_support::makeBars;

namespace {

    constexpr core::Timestamp kStart = 1704067200; // 2024-01-01T00:00:00Z
    constexpr long long kHour = 3600;
    constexpr core::Timestamp kSessionStart = kStart + 100 * kHour;

    core::EngineConfig smallConfig() {
        core::EngineConfig config;
        config.visible_candles = 50;
        config.warmup_buffer = 20;
        config.min_warmup = 10;
        config.buffer_threshold = 5;
        config.stream_chunk = 10;
        config.history_page = 30;
        config.leverage = 500.0;
        config.trend_timeframes = {core::Timeframe::H1, core::Timeframe::H4};
        return config;
    }

    // Bar i closes at 1.1 + 0.001 * i and opens half a step lower
    double closeOf(int i) { return 1.1 + 0.001 * i; }
    double openOf(int i) { return closeOf(i) - 0.0005; }

    class RecordingListener : public session::ISessionListener {
    public:
        void onStopOut(const core::AccountState& account) override {
            ++stop_outs;
            stop_out_balance = account.balance;
        }
        void onNoData(const std::string& symbol, core::Timeframe) override {
            no_data_symbols.push_back(symbol);
        }
        void onLoadComplete(const std::string&, core::Timeframe, LoadStatus status) override {
            loads.push_back(status);
        }

        int stop_outs = 0;
        double stop_out_balance = -1.0;
        std::vector<std::string> no_data_symbols;
        std::vector<LoadStatus> loads;
    };

    // Queues jobs until the test runs them
    class ManualFetchExecutor : public simulation::IFetchExecutor {
    public:
        void submit(simulation::FetchJob job) override {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(job));
        }
        void shutdown() override {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.clear();
        }

        std::size_t runAll() {
            std::size_t ran = 0;
            for (;;) {
                simulation::FetchJob job;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (jobs_.empty()) return ran;
                    job = std::move(jobs_.front());
                    jobs_.pop_front();
                }
                job();
                ++ran;
            }
        }

        std::size_t pending() {
            std::lock_guard<std::mutex> lock(mutex_);
            return jobs_.size();
        }

    private:
        std::mutex mutex_;
        std::deque<simulation::FetchJob> jobs_;
    };

} // namespace

class ReplaySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        source->put("EURUSD", core::Timeframe::H1, makeBars(kStart, core::Timeframe::H1, 300));
        replay.setListener(&listener);
    }

    session::TraderProfile profile() const {
        return session::makeProfile("p1", "Practice", 10000.0, {"EURUSD", "GBPUSD"}, kSessionStart, 0);
    }

    trading::OrderRequest market(core::OrderSide side, double lots, double sl = 0.0, double tp = 0.0) const {
        trading::OrderRequest request;
        request.side = side;
        request.type = core::OrderType::Market;
        request.quantity = lots;
        request.stop_loss = sl;
        request.take_profit = tp;
        return request;
    }

    std::shared_ptr<FakeMarketDataSource> source = std::make_shared<FakeMarketDataSource>();
    RecordingListener listener;
    ReplaySession replay{smallConfig(), source, nullptr, nullptr, session::SessionOptions{false}};
};

TEST_F(ReplaySessionTest, OpenLoadsAroundSessionStart) {
    EXPECT_FALSE(replay.isOpen());
    replay.open(profile());

    EXPECT_TRUE(replay.isOpen());
    EXPECT_FALSE(replay.isLoading());
    EXPECT_EQ(replay.dataStatus(), LoadStatus::Loaded);
    ASSERT_EQ(listener.loads.size(), 1u);
    EXPECT_EQ(listener.loads.front(), LoadStatus::Loaded);

    ASSERT_TRUE(replay.simTime().has_value());
    EXPECT_EQ(*replay.simTime(), kSessionStart);
    EXPECT_EQ(replay.bufferedBars(), 51u);

    const auto state = replay.simulationState();
    EXPECT_EQ(state.current_index, 0u);
    EXPECT_EQ(state.max_index, 51u);
    EXPECT_FALSE(state.is_playing);

    // Standing on the open of bar 100: the bar is shown flat
    const auto slice = replay.visibleSlice();
    ASSERT_EQ(slice.size(), 1u);
    EXPECT_EQ(slice.back().time, kSessionStart);
    EXPECT_NEAR(replay.currentPrice(), openOf(100), 1e-9);
    EXPECT_NEAR(slice.back().high, openOf(100), 1e-9);
}

TEST_F(ReplaySessionTest, StepRevealsNextBarAndRestoresPartial) {
    replay.open(profile());
    ASSERT_TRUE(replay.step());

    EXPECT_EQ(*replay.simTime(), kSessionStart + 2 * kHour);
    EXPECT_NEAR(replay.currentPrice(), closeOf(101), 1e-9);
    const auto slice = replay.visibleSlice();
    ASSERT_EQ(slice.size(), 2u);
    EXPECT_NEAR(slice.front().close, closeOf(100), 1e-9);
    EXPECT_EQ(slice.back().time, kSessionStart + kHour);
}

TEST_F(ReplaySessionTest, PlayThenTickAdvances) {
    EXPECT_FALSE(replay.play());
    replay.open(profile());
    ASSERT_TRUE(replay.play());
    EXPECT_FALSE(replay.step());

    replay.tick();
    replay.tick();
    EXPECT_EQ(replay.simulationState().current_index, 2u);

    replay.pause();
    replay.tick();
    EXPECT_EQ(replay.simulationState().current_index, 2u);
    EXPECT_TRUE(replay.setSpeed(100));
    EXPECT_FALSE(replay.setSpeed(-5));
    EXPECT_EQ(replay.simulationState().speed, 100);
}

TEST_F(ReplaySessionTest, StreamsMoreBarsNearTheEnd) {
    replay.open(profile());
    for (int i = 0; i < 46; ++i) {
        ASSERT_TRUE(replay.step());
    }
    EXPECT_EQ(replay.bufferedBars(), 61u);
    EXPECT_EQ(replay.simulationState().max_index, 61u);
}

TEST_F(ReplaySessionTest, OrdersRejectedWithoutData) {
    auto result = replay.placeOrder(market(core::OrderSide::Long, 0.1));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, trading::RejectReason::InvalidPrice);
}

TEST_F(ReplaySessionTest, TradeLifecycleFeedsStatistics) {
    replay.open(profile());
    auto placed = replay.placeOrder(market(core::OrderSide::Long, 0.1, 1.1900));
    ASSERT_TRUE(placed.accepted) << placed.message;
    EXPECT_GT(replay.usedMargin(), 0.0);

    replay.step();
    replay.step();
    const auto account = replay.account();
    ASSERT_EQ(account.history.size(), 1u);
    EXPECT_NEAR(account.equity, account.balance + account.history.front().pnl, 1e-9);
    EXPECT_GT(account.history.front().pnl, 0.0);

    ASSERT_TRUE(replay.closeOrder(placed.trade_id).accepted);
    const auto stats = replay.statistics();
    EXPECT_EQ(stats.total_trades, 1);
    EXPECT_EQ(stats.wins, 1);
    // Closed at bar 102 against an entry at the open of bar 100
    EXPECT_NEAR(stats.total_pnl, (closeOf(102) - openOf(100)) * 10000.0, 1e-6);
}

TEST_F(ReplaySessionTest, StopOutPausesAndNotifiesOnce) {
    replay.open(profile());
    // 9 lots short into a rising market: about 900 lost per bar
    ASSERT_TRUE(replay.placeOrder(market(core::OrderSide::Short, 9.0)).accepted);
    ASSERT_TRUE(replay.play());

    for (int i = 0; i < 20 && replay.simulationState().is_playing; ++i) {
        replay.tick();
    }
    EXPECT_FALSE(replay.simulationState().is_playing);
    EXPECT_EQ(replay.simulationState().current_index, 11u);
    EXPECT_EQ(listener.stop_outs, 1);
    EXPECT_DOUBLE_EQ(listener.stop_out_balance, 0.0);

    const auto account = replay.account();
    EXPECT_DOUBLE_EQ(account.balance, 0.0);
    EXPECT_EQ(account.history.front().close_reason, core::CloseReason::StopOut);

    replay.step();
    EXPECT_EQ(listener.stop_outs, 1);
    EXPECT_EQ(replay.placeOrder(market(core::OrderSide::Long, 0.01)).reason,
              trading::RejectReason::AccountBlown);
}

TEST_F(ReplaySessionTest, LoadMoreHistoryKeepsCursorBar) {
    replay.open(profile());
    replay.step();
    const auto before = replay.visibleSlice().back().time;

    ASSERT_TRUE(replay.loadMoreHistory());
    EXPECT_EQ(replay.visibleSlice().back().time, before);
    EXPECT_EQ(replay.simulationState().current_index, 81u);
    EXPECT_EQ(replay.bufferedBars(), 131u);
    EXPECT_EQ(replay.visibleSlice().front().time, kStart + 20 * kHour);
}

TEST_F(ReplaySessionTest, JumpToDateLandsInsideBar) {
    replay.open(profile());
    const core::Timestamp target = kStart + 200 * kHour + 1800;
    replay.jumpToDate(target);

    EXPECT_EQ(*replay.simTime(), target);
    EXPECT_EQ(replay.visibleSlice().back().time, kStart + 200 * kHour);
    EXPECT_NEAR(replay.currentPrice(), openOf(200), 1e-9);
    EXPECT_EQ(listener.loads.size(), 2u);
}

TEST_F(ReplaySessionTest, JumpToFirstDataRewindsSessionStart) {
    replay.open(profile());
    replay.jumpToFirstData();

    EXPECT_EQ(*replay.simTime(), kStart);
    EXPECT_EQ(replay.simulationState().current_index, 0u);
    EXPECT_EQ(replay.visibleSlice().front().time, kStart);
}

TEST_F(ReplaySessionTest, SymbolWithoutDataReportsNoData) {
    replay.open(profile());
    replay.setSymbol("GBPUSD");

    EXPECT_EQ(replay.activeSymbol(), "GBPUSD");
    EXPECT_EQ(replay.dataStatus(), LoadStatus::NoData);
    ASSERT_EQ(listener.no_data_symbols.size(), 1u);
    EXPECT_EQ(listener.no_data_symbols.front(), "GBPUSD");
    EXPECT_EQ(listener.loads.back(), LoadStatus::NoData);
    EXPECT_TRUE(replay.visibleSlice().empty());
    EXPECT_DOUBLE_EQ(replay.currentPrice(), 0.0);
    EXPECT_FALSE(replay.play());
    EXPECT_FALSE(replay.placeOrder(market(core::OrderSide::Long, 0.1)).accepted);

    replay.setSymbol("EURUSD");
    EXPECT_EQ(replay.dataStatus(), LoadStatus::Loaded);
}

TEST_F(ReplaySessionTest, SnapshotAndCloseCarryTheAccount) {
    EXPECT_THROW(replay.snapshot(), core::SessionException);
    EXPECT_FALSE(replay.close().has_value());

    replay.open(profile());
    ASSERT_TRUE(replay.placeOrder(market(core::OrderSide::Long, 0.1)).accepted);
    replay.step();
    replay.addTimePlayed(5);
    replay.setDrawings(nlohmann::json::array({"line"}));

    const auto snapshot = replay.snapshot();
    EXPECT_EQ(snapshot.current_sim_time, kSessionStart + 2 * kHour);
    EXPECT_EQ(snapshot.time_played, 5);
    EXPECT_EQ(snapshot.account.history.size(), 1u);
    EXPECT_EQ(snapshot.drawings.size(), 1u);

    auto closed = replay.close();
    ASSERT_TRUE(closed.has_value());
    EXPECT_FALSE(replay.isOpen());

    // Reopening resumes where the trader stopped and keeps numbering trades
    replay.open(*closed);
    EXPECT_EQ(*replay.simTime(), kSessionStart + 2 * kHour);
    auto next = replay.placeOrder(market(core::OrderSide::Long, 0.1));
    EXPECT_EQ(next.trade_id, "T-2");
}

TEST_F(ReplaySessionTest, IndicatorViewsStopAtCursor) {
    EXPECT_TRUE(replay.indicatorViews().empty());
    replay.open(profile());
    for (int i = 0; i < 5; ++i) replay.step();

    const auto views = replay.indicatorViews();
    ASSERT_EQ(views.size(), 4u);
    const core::Timestamp cursor_time = kSessionStart + 5 * kHour;
    for (const auto& view : views) {
        for (const auto& point : view.values) EXPECT_LE(point.time, cursor_time) << view.id;
        for (const auto& point : view.macd) EXPECT_LE(point.time, cursor_time) << view.id;
    }
    ASSERT_FALSE(views.front().values.empty());
    EXPECT_EQ(views.front().values.back().time, cursor_time);
}

TEST_F(ReplaySessionTest, SuggestedLotSizeUsesProfileRisk) {
    auto custom = profile();
    custom.lot_size.risk_percent = 2.0;
    replay.open(custom);
    EXPECT_NEAR(replay.suggestedLotSize(1.2000, 1.1950), 0.4, 1e-9);
}

TEST_F(ReplaySessionTest, TrendReadingsCoverConfiguredTimeframes) {
    replay.open(profile());
    const auto readings = replay.trendReadings();
    ASSERT_EQ(readings.size(), 2u);
    ASSERT_EQ(readings.count(core::Timeframe::H4), 1u);
    EXPECT_EQ(readings.at(core::Timeframe::H4), indicators::Trend::Unknown);
    EXPECT_EQ(readings.count(core::Timeframe::H1), 1u);
}

// --- Deferred fetches ---

class DeferredReplaySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        source->put("EURUSD", core::Timeframe::H1, makeBars(kStart, core::Timeframe::H1, 300));
        replay.setListener(&listener);
    }

    std::shared_ptr<FakeMarketDataSource> source = std::make_shared<FakeMarketDataSource>();
    std::shared_ptr<ManualFetchExecutor> executor = std::make_shared<ManualFetchExecutor>();
    RecordingListener listener;
    ReplaySession replay{smallConfig(), source, executor, nullptr, session::SessionOptions{false}};
};

TEST_F(DeferredReplaySessionTest, NothingTradesWhileReloading) {
    replay.open(session::makeProfile("p1", "Practice", 10000.0, {"EURUSD"}, kSessionStart, 0));
    EXPECT_TRUE(replay.isLoading());
    EXPECT_FALSE(replay.simTime().has_value());
    EXPECT_DOUBLE_EQ(replay.currentPrice(), 0.0);

    trading::OrderRequest request;
    request.quantity = 0.1;
    EXPECT_FALSE(replay.placeOrder(request).accepted);
    EXPECT_FALSE(replay.loadMoreHistory());

    executor->runAll();
    EXPECT_FALSE(replay.isLoading());
    EXPECT_TRUE(replay.placeOrder(request).accepted);
}

TEST_F(DeferredReplaySessionTest, SupersededLoadIsDiscarded) {
    replay.open(session::makeProfile("p1", "Practice", 10000.0, {"EURUSD"}, kSessionStart, 0));
    const core::Timestamp target = kStart + 150 * kHour;
    replay.jumpToDate(target);
    EXPECT_EQ(executor->pending(), 2u);

    executor->runAll();
    ASSERT_EQ(listener.loads.size(), 1u);
    EXPECT_EQ(*replay.simTime(), target);
    EXPECT_EQ(replay.visibleSlice().back().time, target);
}
