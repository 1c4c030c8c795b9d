#include "candle_buffer.hpp"
#include "fake_market_data_source.hpp"
#include <gtest/gtest.h>
#include <memory>

using testing_support::FakeMarketDataSource;
using testing_support::makeBars;
using simulation::CandleBufferManager;
using simulation::LoadRequest;
using simulation::LoadStatus;

namespace {

    constexpr core::Timestamp kStart = 1704067200; // 2024-01-01T00:00:00Z
    constexpr long long kHour = 3600;

    core::EngineConfig smallConfig() {
        core::EngineConfig config;
        config.visible_candles = 50;
        config.warmup_buffer = 20;
        config.min_warmup = 10;
        config.buffer_threshold = 5;
        config.stream_chunk = 10;
        config.history_page = 30;
        return config;
    }

    // Only serves forward windows within `horizon` seconds of the request
    class HorizonSource : public FakeMarketDataSource {
    public:
        explicit HorizonSource(long long horizon) : horizon_(horizon) {}

        core::TimeSeries<core::Candle> fetchFuture(const std::string& symbol, core::Timeframe tf,
                                                   core::Timestamp after, std::size_t limit,
                                                   const core::CancellationToken& token) override {
            auto bars = FakeMarketDataSource::fetchFuture(symbol, tf, after, limit, token);
            core::TimeSeries<core::Candle> bounded;
            for (const auto& bar : bars) {
                if (bar.time <= after + horizon_) bounded.push_back(bar);
            }
            return bounded;
        }

    private:
        long long horizon_;
    };

} // namespace

class CandleBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        // H1 history from 100 hours before the session start to 199 hours after it
        source->put("EURUSD", core::Timeframe::H1, makeBars(kStart - 100 * kHour, core::Timeframe::H1, 300));
    }

    LoadRequest request(core::Timestamp anchor) const {
        return LoadRequest{"EURUSD", core::Timeframe::H1, anchor, kStart};
    }

    std::shared_ptr<FakeMarketDataSource> source = std::make_shared<FakeMarketDataSource>();
    core::EngineConfig config = smallConfig();
};

TEST_F(CandleBufferTest, LoadSplitsWarmupAndVisibleAroundSessionStart) {
    CandleBufferManager buffer(source, config);
    const core::Timestamp anchor = kStart + 10 * kHour;
    auto window = buffer.fetchWindow(request(anchor), {});

    ASSERT_EQ(window.status, LoadStatus::Loaded);
    // Context: 70 bars ending at the anchor bar; 59 of them precede the session start
    EXPECT_EQ(window.warmup.size(), 59u);
    EXPECT_EQ(window.warmup.back().time, kStart - kHour);
    for (const auto& bar : window.warmup) {
        EXPECT_FALSE(bar.synthetic);
        EXPECT_LT(bar.time, kStart);
    }
    ASSERT_EQ(window.visible.size(), 61u);
    EXPECT_EQ(window.visible.front().time, kStart);
    EXPECT_EQ(window.visible.back().time, kStart + 60 * kHour);
    EXPECT_EQ(window.cursor, 10u);
    EXPECT_EQ(window.visible[window.cursor].time, anchor);

    for (std::size_t i = 1; i < window.visible.size(); ++i) {
        EXPECT_LT(window.visible[i - 1].time, window.visible[i].time);
    }
}

TEST_F(CandleBufferTest, CommitInstallsWindowAndBumpsVersion) {
    CandleBufferManager buffer(source, config);
    EXPECT_FALSE(buffer.hasData());
    const auto before = buffer.version();

    EXPECT_EQ(buffer.load(request(kStart + 10 * kHour), {}), LoadStatus::Loaded);
    EXPECT_TRUE(buffer.hasData());
    EXPECT_GT(buffer.version(), before);
    EXPECT_EQ(buffer.symbol(), "EURUSD");
    EXPECT_EQ(buffer.sessionStart(), kStart);
    EXPECT_EQ(buffer.fullSequence().size(), buffer.warmup().size() + buffer.visible().size());
}

TEST_F(CandleBufferTest, PadsWarmupWithFlaggedSyntheticBars) {
    auto fresh = std::make_shared<FakeMarketDataSource>();
    fresh->put("EURUSD", core::Timeframe::H1, makeBars(kStart, core::Timeframe::H1, 100));
    CandleBufferManager buffer(fresh, config);

    ASSERT_EQ(buffer.load(request(kStart + 5 * kHour), {}), LoadStatus::Loaded);
    const auto& warmup = buffer.warmup();
    ASSERT_EQ(warmup.size(), config.min_warmup);
    const core::Candle& first_real = buffer.visible().front();
    for (std::size_t i = 0; i < warmup.size(); ++i) {
        EXPECT_TRUE(warmup[i].synthetic);
        EXPECT_DOUBLE_EQ(warmup[i].close, first_real.close);
        EXPECT_EQ(warmup[i].time, first_real.time - static_cast<long long>(warmup.size() - i) * kHour);
    }
    for (const auto& bar : buffer.visible()) {
        EXPECT_FALSE(bar.synthetic);
    }
}

TEST_F(CandleBufferTest, RebuildsPartialBarFromFineData) {
    const core::Timestamp bar_time = kStart + 10 * kHour;
    // Thirty M2 bars inside the anchor's hour, closes rising from 2.0
    source->put("EURUSD", core::Timeframe::M2, makeBars(bar_time, core::Timeframe::M2, 30, 2.0, 0.01));

    CandleBufferManager buffer(source, config);
    const core::Timestamp anchor = bar_time + 1800; // Half way through the hour
    ASSERT_EQ(buffer.load(request(anchor), {}), LoadStatus::Loaded);

    ASSERT_TRUE(buffer.partialIndex().has_value());
    EXPECT_EQ(*buffer.partialIndex(), 10u);
    ASSERT_TRUE(buffer.nominalBar().has_value());

    const core::Candle& partial = buffer.visible()[10];
    const core::Candle& nominal = *buffer.nominalBar();
    EXPECT_EQ(partial.time, bar_time);
    EXPECT_DOUBLE_EQ(partial.open, nominal.open);
    // Fifteen fine bars have fully closed by the anchor
    EXPECT_NEAR(partial.close, 2.0 + 0.01 * 14, 1e-9);
    EXPECT_NEAR(buffer.realTimePrice(), partial.close, 1e-12);
    EXPECT_GE(partial.high, partial.open);
    EXPECT_LE(partial.low, partial.open);

    EXPECT_FALSE(buffer.releasePartialBar(10));
    EXPECT_TRUE(buffer.releasePartialBar(11));
    EXPECT_DOUBLE_EQ(buffer.visible()[10].close, nominal.close);
    EXPECT_FALSE(buffer.partialIndex().has_value());
}

TEST_F(CandleBufferTest, PartialBarWithoutFineDataIsFlatAtOpen) {
    CandleBufferManager buffer(source, config);
    const core::Timestamp bar_time = kStart + 10 * kHour;
    ASSERT_EQ(buffer.load(request(bar_time + 600), {}), LoadStatus::Loaded);

    const core::Candle& partial = buffer.visible()[10];
    EXPECT_DOUBLE_EQ(partial.high, partial.open);
    EXPECT_DOUBLE_EQ(partial.low, partial.open);
    EXPECT_DOUBLE_EQ(partial.close, partial.open);
}

TEST_F(CandleBufferTest, NoDataAnywhere) {
    auto empty = std::make_shared<FakeMarketDataSource>();
    CandleBufferManager buffer(empty, config);
    EXPECT_EQ(buffer.load(request(kStart), {}), LoadStatus::NoData);
    EXPECT_FALSE(buffer.hasData());
    EXPECT_TRUE(buffer.visible().empty());
    EXPECT_EQ(simulation::toString(buffer.status()), "NO_DATA");
}

TEST_F(CandleBufferTest, JumpsToEarliestDataWhenAnchorPrecedesHistory) {
    auto bounded = std::make_shared<HorizonSource>(30 * 24 * kHour);
    const core::Timestamp data_start = kStart + 60 * 24 * kHour;
    bounded->put("EURUSD", core::Timeframe::H1, makeBars(data_start, core::Timeframe::H1, 80));
    CandleBufferManager buffer(bounded, config);

    auto window = buffer.fetchWindow(request(kStart), {});
    ASSERT_EQ(window.status, LoadStatus::Loaded);
    EXPECT_EQ(window.cursor, 0u);
    EXPECT_EQ(window.visible.front().time, data_start);
    ASSERT_TRUE(window.sim_time_override.has_value());
    EXPECT_EQ(*window.sim_time_override, data_start + kHour);
    EXPECT_EQ(window.warmup.size(), config.min_warmup);
    EXPECT_TRUE(window.warmup.front().synthetic);
}

TEST_F(CandleBufferTest, CancelledLoadLeavesBufferUntouched) {
    CandleBufferManager buffer(source, config);
    ASSERT_EQ(buffer.load(request(kStart + 10 * kHour), {}), LoadStatus::Loaded);
    const auto version = buffer.version();
    const auto front = buffer.visible().front().time;

    core::CancellationSource cancel;
    cancel.cancel();
    EXPECT_EQ(buffer.load(request(kStart + 100 * kHour), cancel.token()), LoadStatus::Cancelled);
    EXPECT_EQ(buffer.version(), version);
    EXPECT_EQ(buffer.visible().front().time, front);
}

TEST_F(CandleBufferTest, StreamsForwardNearTheEnd) {
    CandleBufferManager buffer(source, config);
    ASSERT_EQ(buffer.load(request(kStart + 10 * kHour), {}), LoadStatus::Loaded);
    ASSERT_EQ(buffer.visible().size(), 61u);

    EXPECT_FALSE(buffer.planExtension(10).has_value());

    auto plan = buffer.planExtension(57);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->tail_time, kStart + 60 * kHour);
    // Only one extension in flight
    EXPECT_FALSE(buffer.planExtension(58).has_value());

    auto bars = buffer.fetchExtension(*plan, {});
    // Overlapping bars are ignored
    auto overlap = bars;
    overlap.insert(overlap.begin(), buffer.visible().back());
    const auto version = buffer.version();
    EXPECT_EQ(buffer.commitExtension(*plan, overlap, {}), 10u);
    EXPECT_EQ(buffer.visible().size(), 71u);
    EXPECT_EQ(buffer.visible().back().time, kStart + 70 * kHour);
    EXPECT_GT(buffer.version(), version);
}

TEST_F(CandleBufferTest, ExhaustedTailIsNotRequestedAgain) {
    auto short_source = std::make_shared<FakeMarketDataSource>();
    short_source->put("EURUSD", core::Timeframe::H1, makeBars(kStart, core::Timeframe::H1, 20));
    CandleBufferManager buffer(short_source, config);
    ASSERT_EQ(buffer.load(request(kStart + 5 * kHour), {}), LoadStatus::Loaded);

    auto plan = buffer.planExtension(18);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(buffer.commitExtension(*plan, buffer.fetchExtension(*plan, {}), {}), 0u);
    EXPECT_FALSE(buffer.planExtension(19).has_value());
}

TEST_F(CandleBufferTest, StaleExtensionIsDroppedAfterReload) {
    CandleBufferManager buffer(source, config);
    ASSERT_EQ(buffer.load(request(kStart + 10 * kHour), {}), LoadStatus::Loaded);
    auto plan = buffer.planExtension(58);
    ASSERT_TRUE(plan.has_value());
    auto bars = buffer.fetchExtension(*plan, {});

    ASSERT_EQ(buffer.load(request(kStart + 100 * kHour), {}), LoadStatus::Loaded);
    const auto size = buffer.visible().size();
    EXPECT_EQ(buffer.commitExtension(*plan, bars, {}), 0u);
    EXPECT_EQ(buffer.visible().size(), size);
}

TEST_F(CandleBufferTest, BackfillKeepsCursorOnTheSameBar) {
    CandleBufferManager buffer(source, config);
    ASSERT_EQ(buffer.load(request(kStart + 10 * kHour + 1800), {}), LoadStatus::Loaded);
    const std::size_t cursor = 10;
    const core::Timestamp cursor_time = buffer.visible()[cursor].time;

    auto plan = buffer.planBackfill();
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->before, kStart - 59 * kHour);

    const std::size_t k = buffer.commitBackfill(*plan, buffer.fetchBackfill(*plan, {}), {});
    // 41 older bars: 20 become warmup, 21 plus the 59 former warmup bars are spliced in
    EXPECT_EQ(k, 80u);
    EXPECT_EQ(buffer.visible()[cursor + k].time, cursor_time);
    EXPECT_EQ(buffer.warmup().size(), config.warmup_buffer);
    EXPECT_EQ(buffer.warmup().front().time, kStart - 100 * kHour);
    ASSERT_TRUE(buffer.partialIndex().has_value());
    EXPECT_EQ(*buffer.partialIndex(), cursor + k);

    for (std::size_t i = 1; i < buffer.visible().size(); ++i) {
        EXPECT_LT(buffer.visible()[i - 1].time, buffer.visible()[i].time);
    }

    auto again = buffer.planBackfill();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(buffer.commitBackfill(*again, buffer.fetchBackfill(*again, {}), {}), 0u);
}

TEST_F(CandleBufferTest, BackfillDropsSyntheticPadding) {
    auto fresh = std::make_shared<FakeMarketDataSource>();
    fresh->put("EURUSD", core::Timeframe::H1, makeBars(kStart - 8 * kHour, core::Timeframe::H1, 60));
    CandleBufferManager buffer(fresh, config);
    ASSERT_EQ(buffer.load(request(kStart + 5 * kHour), {}), LoadStatus::Loaded);

    // Eight real warmup bars behind two synthetic ones
    ASSERT_EQ(buffer.warmup().size(), config.min_warmup);
    EXPECT_TRUE(buffer.warmup().front().synthetic);

    auto plan = buffer.planBackfill();
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->before, kStart - 8 * kHour);
    EXPECT_EQ(buffer.commitBackfill(*plan, buffer.fetchBackfill(*plan, {}), {}), 0u);
    EXPECT_EQ(buffer.visible().front().time, kStart);
}

TEST(CandleBufferConstructionTest, RequiresSource) {
    EXPECT_THROW(CandleBufferManager(nullptr, core::EngineConfig{}), std::invalid_argument);
}
