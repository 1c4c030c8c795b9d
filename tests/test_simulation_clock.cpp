#include "simulation_clock.hpp"
#include "periodic_timer.hpp"
#include "fetch_executor.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using simulation::SimulationClock;

namespace {
    constexpr core::Timestamp kStart = 1704067200;
    constexpr long long kHour = 3600;

    template <typename Predicate>
    bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }
}

class SimulationClockTest : public ::testing::Test {
protected:
    SimulationClockTest()
        : clock(core::Timeframe::H1, 500, [this](std::size_t index) -> std::optional<core::Timestamp> {
              if (index < bar_count) return kStart + static_cast<long long>(index) * kHour;
              return std::nullopt;
          }) {}

    void load(std::size_t bars, std::size_t cursor, core::Timestamp anchor) {
        bar_count = bars;
        clock.beginReload(anchor);
        clock.completeReload(cursor, bars);
    }

    std::size_t bar_count = 0;
    SimulationClock clock;
};

TEST_F(SimulationClockTest, ReloadSetsCursorAndAnchorTime) {
    const core::Timestamp anchor = kStart + 3 * kHour + 1200;
    clock.beginReload(anchor);
    EXPECT_TRUE(clock.isReloading());
    EXPECT_FALSE(clock.simTime().has_value());
    EXPECT_FALSE(clock.play());

    bar_count = 10;
    clock.completeReload(3, 10);
    EXPECT_FALSE(clock.isReloading());
    EXPECT_EQ(clock.index(), 3u);
    EXPECT_EQ(clock.maxIndex(), 10u);
    ASSERT_TRUE(clock.simTime().has_value());
    EXPECT_EQ(*clock.simTime(), anchor);
}

TEST_F(SimulationClockTest, OverrideWinsOverAnchor) {
    bar_count = 5;
    clock.beginReload(kStart - 100 * kHour);
    clock.completeReload(0, 5, kStart + kHour);
    EXPECT_EQ(*clock.simTime(), kStart + kHour);
}

TEST_F(SimulationClockTest, StepAdvancesToBarClose) {
    load(5, 0, kStart);
    EXPECT_TRUE(clock.step());
    EXPECT_EQ(clock.index(), 1u);
    EXPECT_EQ(*clock.simTime(), kStart + 2 * kHour);

    EXPECT_TRUE(clock.step());
    EXPECT_TRUE(clock.step());
    EXPECT_TRUE(clock.step());
    EXPECT_TRUE(clock.atEnd());
    EXPECT_FALSE(clock.step());
    EXPECT_EQ(clock.index(), 4u);
}

TEST_F(SimulationClockTest, StepIsIgnoredWhilePlaying) {
    load(5, 0, kStart);
    ASSERT_TRUE(clock.play());
    EXPECT_FALSE(clock.step());
    EXPECT_EQ(clock.index(), 0u);
}

TEST_F(SimulationClockTest, TickPausesAtTheEnd) {
    load(3, 0, kStart);
    ASSERT_TRUE(clock.play());
    EXPECT_TRUE(clock.tick());
    EXPECT_TRUE(clock.tick());
    EXPECT_FALSE(clock.tick());
    EXPECT_FALSE(clock.isPlaying());
    EXPECT_EQ(clock.index(), 2u);
}

TEST_F(SimulationClockTest, TickDoesNothingWhenPaused) {
    load(3, 0, kStart);
    EXPECT_FALSE(clock.tick());
    EXPECT_EQ(clock.index(), 0u);
}

TEST_F(SimulationClockTest, PlayNeedsBars) {
    EXPECT_FALSE(clock.play());
    load(0, 0, kStart);
    EXPECT_FALSE(clock.play());
}

TEST_F(SimulationClockTest, AbortReloadFallsBackToAnchor) {
    load(5, 2, kStart);
    clock.beginReload(kStart + 50 * kHour);
    clock.abortReload();
    EXPECT_FALSE(clock.isReloading());
    EXPECT_EQ(clock.index(), 0u);
    EXPECT_EQ(clock.maxIndex(), 0u);
    EXPECT_EQ(*clock.simTime(), kStart + 50 * kHour);
}

TEST_F(SimulationClockTest, ShiftAndMaxIndex) {
    load(10, 4, kStart);
    clock.shift(6);
    EXPECT_EQ(clock.index(), 10u);
    EXPECT_EQ(clock.maxIndex(), 16u);

    clock.setMaxIndex(5);
    EXPECT_EQ(clock.index(), 4u);
}

TEST_F(SimulationClockTest, SpeedMustBePositive) {
    EXPECT_TRUE(clock.setSpeed(100));
    EXPECT_EQ(clock.speedMs(), 100);
    EXPECT_EQ(clock.state().speed, 100);
    EXPECT_FALSE(clock.setSpeed(0));
    EXPECT_EQ(clock.speedMs(), 100);
}

TEST(SimulationClockConstructionTest, RejectsBadArguments) {
    auto lookup = [](std::size_t) -> std::optional<core::Timestamp> { return std::nullopt; };
    EXPECT_THROW(SimulationClock(core::Timeframe::H1, 0, lookup), std::invalid_argument);
    EXPECT_THROW(SimulationClock(core::Timeframe::H1, 100, nullptr), std::invalid_argument);
}

// --- PeriodicTimer ---

TEST(PeriodicTimerTest, FiresWhileRunningAndStopsFromCallback) {
    std::atomic<int> fired{0};
    simulation::PeriodicTimer* self = nullptr;
    simulation::PeriodicTimer timer(
        "test",
        []() { return std::chrono::milliseconds(5); },
        [&]() {
            if (++fired == 3) self->stop();
        });
    self = &timer;

    EXPECT_FALSE(timer.isRunning());
    timer.start();
    ASSERT_TRUE(waitFor([&] { return !timer.isRunning(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(fired.load(), 3);
    timer.shutdown();
}

TEST(PeriodicTimerTest, DoesNotFireWhenStopped) {
    std::atomic<int> fired{0};
    simulation::PeriodicTimer timer(
        "idle", []() { return std::chrono::milliseconds(1); }, [&]() { ++fired; });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(fired.load(), 0);
}

// --- Fetch executors ---

TEST(FetchExecutorTest, InlineRunsBeforeReturning) {
    simulation::InlineFetchExecutor executor;
    int ran = 0;
    executor.submit([&]() { ++ran; });
    EXPECT_EQ(ran, 1);
}

TEST(FetchExecutorTest, WorkerRunsInOrderAndDrainsOnShutdown) {
    simulation::WorkerFetchExecutor executor;
    std::vector<int> order;
    std::mutex order_mutex;
    for (int i = 0; i < 20; ++i) {
        executor.submit([&, i]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
    }
    executor.shutdown();
    ASSERT_EQ(order.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }

    bool late = false;
    executor.submit([&]() { late = true; });
    EXPECT_FALSE(late);
}

TEST(FetchExecutorTest, FailingJobDoesNotStopTheWorker) {
    simulation::WorkerFetchExecutor executor;
    std::atomic<bool> ran{false};
    executor.submit([]() { throw std::runtime_error("boom"); });
    executor.submit([&]() { ran = true; });
    executor.shutdown();
    EXPECT_TRUE(ran.load());
}
