#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include "cancellation.hpp"
#include "market_data_source.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace simulation {

    enum class LoadStatus {
        Loaded,
        NoData,
        Cancelled
    };

    struct LoadRequest {
        std::string symbol;
        core::Timeframe timeframe = core::Timeframe::H1;
        core::Timestamp anchor_time = 0;   // Where the trader is standing
        core::Timestamp session_start = 0; // Bars before this are warmup only
    };

    // Immutable result of a load fetch. Built off-lock, installed by commit().
    struct BufferWindow {
        LoadRequest request;
        LoadStatus status = LoadStatus::NoData;
        core::TimeSeries<core::Candle> warmup;
        core::TimeSeries<core::Candle> visible;
        std::size_t cursor = 0;
        std::optional<std::size_t> partial_index; // Visible index rebuilt from M2 data
        std::optional<core::Candle> nominal_bar;  // That bar as stored upstream
        double real_time_price = 0.0;
        // Set by the earliest-data recovery path: visible[0].time + tf
        std::optional<core::Timestamp> sim_time_override;
    };

    struct ExtensionPlan {
        std::string symbol;
        core::Timeframe timeframe = core::Timeframe::H1;
        core::Timestamp tail_time = 0;
        std::uint64_t generation = 0;
    };

    struct BackfillPlan {
        std::string symbol;
        core::Timeframe timeframe = core::Timeframe::H1;
        core::Timestamp before = 0; // Earliest real (non-synthetic) held bar
        std::uint64_t generation = 0;
    };

    // Owns the warmup and visible windows of the active symbol+timeframe.
    // fetch*() methods only read configuration and the source and may run on a
    // worker thread; commit*() methods mutate and must be serialized by the owner.
    class CandleBufferManager {
    public:
        CandleBufferManager(std::shared_ptr<data::IMarketDataSource> source, const core::EngineConfig& config);

        // --- Initial load / reload ---
        BufferWindow fetchWindow(const LoadRequest& request, const core::CancellationToken& token) const;
        // False (and no mutation) when the token was cancelled
        bool commit(BufferWindow window, const core::CancellationToken& token);
        LoadStatus load(const LoadRequest& request, const core::CancellationToken& token);

        // Earliest bar for the timeframe, else across all timeframes
        std::optional<core::Candle> resolveFirstBar(const std::string& symbol,
                                                    core::Timeframe tf,
                                                    const core::CancellationToken& token) const;

        // --- Forward streaming ---
        // A plan when fewer than buffer_threshold bars remain after the cursor,
        // no extension is in flight, and this tail has not already come back empty.
        std::optional<ExtensionPlan> planExtension(std::size_t cursor);
        core::TimeSeries<core::Candle> fetchExtension(const ExtensionPlan& plan, const core::CancellationToken& token) const;
        // Appends bars strictly newer than the tail; returns the number appended
        std::size_t commitExtension(const ExtensionPlan& plan,
                                    const core::TimeSeries<core::Candle>& bars,
                                    const core::CancellationToken& token);

        // --- Backward paging ---
        std::optional<BackfillPlan> planBackfill();
        core::TimeSeries<core::Candle> fetchBackfill(const BackfillPlan& plan, const core::CancellationToken& token) const;
        // Splices older bars in front of the visible window; returns k, the
        // number of bars inserted before the cursor's bar.
        std::size_t commitBackfill(const BackfillPlan& plan,
                                   const core::TimeSeries<core::Candle>& bars,
                                   const core::CancellationToken& token);

        // Restores the nominal bar once the cursor has moved past a rebuilt partial bar
        bool releasePartialBar(std::size_t cursor);

        void clear();

        // --- Accessors ---
        const core::TimeSeries<core::Candle>& warmup() const { return warmup_; }
        const core::TimeSeries<core::Candle>& visible() const { return visible_; }
        // Warmup followed by visible, the indicator input sequence
        core::TimeSeries<core::Candle> fullSequence() const;

        std::uint64_t version() const { return version_; }
        LoadStatus status() const { return status_; }
        bool hasData() const { return status_ == LoadStatus::Loaded && !visible_.empty(); }
        const std::string& symbol() const { return symbol_; }
        core::Timeframe timeframe() const { return timeframe_; }
        double realTimePrice() const { return real_time_price_; }
        std::optional<std::size_t> partialIndex() const { return partial_index_; }
        std::optional<core::Candle> nominalBar() const { return nominal_bar_; }
        core::Timestamp sessionStart() const { return session_start_; }

    private:
        BufferWindow fetchEarliestWindow(const LoadRequest& request, const core::CancellationToken& token) const;
        void applyPartialBar(BufferWindow& window, const core::CancellationToken& token) const;

        std::shared_ptr<data::IMarketDataSource> source_;
        core::EngineConfig config_;

        std::string symbol_;
        core::Timeframe timeframe_ = core::Timeframe::H1;
        core::Timestamp session_start_ = 0;
        LoadStatus status_ = LoadStatus::NoData;
        core::TimeSeries<core::Candle> warmup_;
        core::TimeSeries<core::Candle> visible_;
        std::optional<std::size_t> partial_index_;
        std::optional<core::Candle> nominal_bar_;
        double real_time_price_ = 0.0;

        std::uint64_t version_ = 0;    // Bumped on every content change
        std::uint64_t generation_ = 0; // Bumped on every committed load; stale plans are rejected
        bool extension_in_flight_ = false;
        bool backfill_in_flight_ = false;
        std::optional<core::Timestamp> exhausted_tail_;
    };

    std::string toString(LoadStatus status);

} // namespace simulation
