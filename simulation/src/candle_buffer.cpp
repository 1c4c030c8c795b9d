#include "candle_buffer.hpp"
#include "candle_sanitizer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace simulation {

    namespace {
        constexpr core::Timeframe kFineTimeframe = core::Timeframe::M2;

        // Flat copies of template_bar spaced one timeframe apart, ending just before it
        core::TimeSeries<core::Candle> syntheticPadding(const core::Candle& template_bar,
                                                        std::size_t count,
                                                        core::Timeframe tf) {
            const long long step = core::utils::timeframeSeconds(tf);
            core::TimeSeries<core::Candle> padding;
            padding.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                core::Candle bar = template_bar;
                bar.time = template_bar.time - static_cast<long long>(count - i) * step;
                bar.synthetic = true;
                padding.push_back(bar);
            }
            return padding;
        }
    }

    std::string toString(LoadStatus status) {
        switch (status) {
            case LoadStatus::Loaded:    return "LOADED";
            case LoadStatus::NoData:    return "NO_DATA";
            case LoadStatus::Cancelled: return "CANCELLED";
        }
        return "NO_DATA";
    }

    CandleBufferManager::CandleBufferManager(std::shared_ptr<data::IMarketDataSource> source,
                                             const core::EngineConfig& config)
        : source_(std::move(source)), config_(config)
    {
        if (!source_) {
            throw std::invalid_argument("CandleBufferManager requires a market data source.");
        }
    }

    // --- Initial load / reload ---

    BufferWindow CandleBufferManager::fetchWindow(const LoadRequest& request,
                                                  const core::CancellationToken& token) const {
        auto logger = core::logging::getLogger();
        BufferWindow window;
        window.request = request;

        const long long tf_seconds = core::utils::timeframeSeconds(request.timeframe);
        const core::Timestamp aligned = core::utils::alignToTimeframe(request.anchor_time, request.timeframe);

        logger->debug("Buffer fetch {} {} anchor={} aligned={}",
                      request.symbol, core::utils::timeframeToString(request.timeframe),
                      core::utils::timestampToString(request.anchor_time),
                      core::utils::timestampToString(aligned));

        auto context = source_->fetchContext(request.symbol, request.timeframe, aligned + tf_seconds,
                                             config_.visible_candles + config_.warmup_buffer, token);
        auto future = source_->fetchFuture(request.symbol, request.timeframe, aligned,
                                           config_.visible_candles, token);

        if (token.isCancelled()) {
            window.status = LoadStatus::Cancelled;
            return window;
        }

        if (context.empty() && future.empty()) {
            return fetchEarliestWindow(request, token);
        }

        std::map<core::Timestamp, core::Candle> visible_by_time;
        for (const auto& bar : context) {
            if (bar.time < request.session_start) {
                window.warmup.push_back(bar);
            } else {
                visible_by_time[bar.time] = bar;
            }
        }
        for (const auto& bar : future) {
            visible_by_time[bar.time] = bar; // future wins on duplicate times
        }

        if (window.warmup.size() < config_.min_warmup) {
            const core::Candle& earliest = !context.empty() ? context.front() : future.front();
            auto padding = syntheticPadding(earliest, config_.min_warmup - window.warmup.size(),
                                            request.timeframe);
            window.warmup.insert(window.warmup.begin(), padding.begin(), padding.end());
        }

        window.visible.reserve(visible_by_time.size());
        for (const auto& entry : visible_by_time) {
            window.visible.push_back(entry.second);
        }

        if (window.visible.empty()) {
            logger->warn("No bars at or after session start for {} {}", request.symbol,
                         core::utils::timeframeToString(request.timeframe));
            window.warmup.clear();
            window.status = LoadStatus::NoData;
            return window;
        }

        for (std::size_t i = window.visible.size(); i-- > 0;) {
            if (window.visible[i].time <= request.anchor_time) {
                window.cursor = i;
                break;
            }
        }

        window.real_time_price = window.visible[window.cursor].close;
        applyPartialBar(window, token);
        if (token.isCancelled()) {
            window.status = LoadStatus::Cancelled;
            return window;
        }

        window.status = LoadStatus::Loaded;
        logger->debug("Buffer fetch complete: warmup={}, visible={}, cursor={}",
                      window.warmup.size(), window.visible.size(), window.cursor);
        return window;
    }

    void CandleBufferManager::applyPartialBar(BufferWindow& window, const core::CancellationToken& token) const {
        const auto tf = window.request.timeframe;
        if (tf == kFineTimeframe) return;

        const core::Candle& bar = window.visible[window.cursor];
        const long long tf_seconds = core::utils::timeframeSeconds(tf);
        const core::Timestamp anchor = window.request.anchor_time;
        if (bar.time > anchor || anchor >= bar.time + tf_seconds - 1) return;

        const long long fine_seconds = core::utils::timeframeSeconds(kFineTimeframe);
        const std::size_t fine_limit = static_cast<std::size_t>(tf_seconds / fine_seconds);
        auto fine = source_->fetchFuture(window.request.symbol, kFineTimeframe, bar.time - 1, fine_limit, token);
        if (token.isCancelled()) return;

        core::TimeSeries<core::Candle> elapsed;
        for (const auto& f : fine) {
            if (f.time >= bar.time && f.time + fine_seconds <= anchor) {
                elapsed.push_back(f);
            }
        }

        core::Candle partial = bar;
        if (auto folded = data::aggregateCandles(elapsed)) {
            partial.high = std::max(bar.open, folded->high);
            partial.low = std::min(bar.open, folded->low);
            partial.close = folded->close;
            partial.volume = folded->volume;
        } else {
            partial.high = bar.open;
            partial.low = bar.open;
            partial.close = bar.open;
            partial.volume = 0.0;
        }

        window.nominal_bar = bar;
        window.partial_index = window.cursor;
        window.visible[window.cursor] = partial;
        window.real_time_price = partial.close;

        core::logging::getLogger()->debug("Partial bar at {} rebuilt from {} fine bars, price {:.5f}",
                                          core::utils::timestampToString(bar.time), elapsed.size(),
                                          partial.close);
    }

    BufferWindow CandleBufferManager::fetchEarliestWindow(const LoadRequest& request,
                                                          const core::CancellationToken& token) const {
        auto logger = core::logging::getLogger();
        BufferWindow window;
        window.request = request;

        auto first = source_->fetchFirst(request.symbol, std::nullopt, token);
        if (token.isCancelled()) {
            window.status = LoadStatus::Cancelled;
            return window;
        }
        if (!first) {
            logger->warn("No market data at all for {}", request.symbol);
            window.status = LoadStatus::NoData;
            return window;
        }

        auto future = source_->fetchFuture(request.symbol, request.timeframe, first->time - 1,
                                           config_.visible_candles, token);
        if (token.isCancelled()) {
            window.status = LoadStatus::Cancelled;
            return window;
        }
        if (future.empty()) {
            logger->warn("Earliest data for {} is {}, but nothing on {}", request.symbol,
                         core::utils::timestampToString(first->time),
                         core::utils::timeframeToString(request.timeframe));
            window.status = LoadStatus::NoData;
            return window;
        }

        const long long tf_seconds = core::utils::timeframeSeconds(request.timeframe);
        window.warmup = syntheticPadding(future.front(), config_.min_warmup, request.timeframe);

        window.visible = std::move(future);
        window.cursor = 0;
        window.real_time_price = window.visible.front().close;
        window.sim_time_override = window.visible.front().time + tf_seconds;
        window.status = LoadStatus::Loaded;

        logger->info("Requested time has no data for {}; starting at earliest bar {}", request.symbol,
                     core::utils::timestampToString(window.visible.front().time));
        return window;
    }

    bool CandleBufferManager::commit(BufferWindow window, const core::CancellationToken& token) {
        if (token.isCancelled() || window.status == LoadStatus::Cancelled) {
            core::logging::getLogger()->debug("Discarding cancelled buffer load for {}", window.request.symbol);
            return false;
        }

        symbol_ = window.request.symbol;
        timeframe_ = window.request.timeframe;
        session_start_ = window.request.session_start;
        status_ = window.status;
        warmup_ = std::move(window.warmup);
        visible_ = std::move(window.visible);
        partial_index_ = window.partial_index;
        nominal_bar_ = window.nominal_bar;
        real_time_price_ = window.real_time_price;

        extension_in_flight_ = false;
        backfill_in_flight_ = false;
        exhausted_tail_.reset();
        ++generation_;
        ++version_;
        return true;
    }

    LoadStatus CandleBufferManager::load(const LoadRequest& request, const core::CancellationToken& token) {
        BufferWindow window = fetchWindow(request, token);
        const LoadStatus status = window.status;
        if (!commit(std::move(window), token)) {
            return LoadStatus::Cancelled;
        }
        return status;
    }

    std::optional<core::Candle> CandleBufferManager::resolveFirstBar(const std::string& symbol,
                                                                     core::Timeframe tf,
                                                                     const core::CancellationToken& token) const {
        auto first = source_->fetchFirst(symbol, tf, token);
        if (first || token.isCancelled()) return first;
        return source_->fetchFirst(symbol, std::nullopt, token);
    }

    void CandleBufferManager::clear() {
        status_ = LoadStatus::NoData;
        warmup_.clear();
        visible_.clear();
        partial_index_.reset();
        nominal_bar_.reset();
        real_time_price_ = 0.0;
        extension_in_flight_ = false;
        backfill_in_flight_ = false;
        exhausted_tail_.reset();
        ++generation_;
        ++version_;
    }

    core::TimeSeries<core::Candle> CandleBufferManager::fullSequence() const {
        core::TimeSeries<core::Candle> sequence;
        sequence.reserve(warmup_.size() + visible_.size());
        sequence.insert(sequence.end(), warmup_.begin(), warmup_.end());
        sequence.insert(sequence.end(), visible_.begin(), visible_.end());
        return sequence;
    }

    // --- Forward streaming ---

    std::optional<ExtensionPlan> CandleBufferManager::planExtension(std::size_t cursor) {
        if (!hasData() || extension_in_flight_) return std::nullopt;

        const std::size_t remaining = cursor + 1 < visible_.size() ? visible_.size() - 1 - cursor : 0;
        if (remaining >= config_.buffer_threshold) return std::nullopt;

        const core::Timestamp tail = visible_.back().time;
        if (exhausted_tail_ && *exhausted_tail_ == tail) return std::nullopt;

        extension_in_flight_ = true;
        return ExtensionPlan{symbol_, timeframe_, tail, generation_};
    }

    core::TimeSeries<core::Candle> CandleBufferManager::fetchExtension(const ExtensionPlan& plan,
                                                                       const core::CancellationToken& token) const {
        return source_->fetchFuture(plan.symbol, plan.timeframe, plan.tail_time, config_.stream_chunk, token);
    }

    std::size_t CandleBufferManager::commitExtension(const ExtensionPlan& plan,
                                                     const core::TimeSeries<core::Candle>& bars,
                                                     const core::CancellationToken& token) {
        auto logger = core::logging::getLogger();
        if (plan.generation != generation_) {
            logger->debug("Dropping stale stream extension for {}", plan.symbol);
            return 0;
        }
        extension_in_flight_ = false;
        if (token.isCancelled() || visible_.empty()) return 0;

        const core::Timestamp tail = visible_.back().time;
        std::size_t appended = 0;
        for (const auto& bar : bars) {
            if (bar.time > visible_.back().time) {
                visible_.push_back(bar);
                ++appended;
            }
        }

        if (appended == 0) {
            exhausted_tail_ = tail;
            logger->debug("Stream tail {} exhausted for {}", core::utils::timestampToString(tail), plan.symbol);
            return 0;
        }

        exhausted_tail_.reset();
        ++version_;
        logger->debug("Streamed {} bars for {} {}", appended, plan.symbol,
                      core::utils::timeframeToString(plan.timeframe));
        return appended;
    }

    // --- Backward paging ---

    std::optional<BackfillPlan> CandleBufferManager::planBackfill() {
        if (!hasData() || backfill_in_flight_) return std::nullopt;

        core::Timestamp earliest_real = visible_.front().time;
        for (const auto& bar : warmup_) {
            if (!bar.synthetic) {
                earliest_real = bar.time;
                break;
            }
        }

        backfill_in_flight_ = true;
        return BackfillPlan{symbol_, timeframe_, earliest_real, generation_};
    }

    core::TimeSeries<core::Candle> CandleBufferManager::fetchBackfill(const BackfillPlan& plan,
                                                                      const core::CancellationToken& token) const {
        return source_->fetchHistorical(plan.symbol, plan.timeframe, plan.before,
                                        config_.history_page + config_.warmup_buffer, token);
    }

    std::size_t CandleBufferManager::commitBackfill(const BackfillPlan& plan,
                                                    const core::TimeSeries<core::Candle>& bars,
                                                    const core::CancellationToken& token) {
        auto logger = core::logging::getLogger();
        if (plan.generation != generation_) {
            logger->debug("Dropping stale backfill for {}", plan.symbol);
            return 0;
        }
        backfill_in_flight_ = false;
        if (token.isCancelled() || visible_.empty()) return 0;

        core::TimeSeries<core::Candle> raw;
        raw.reserve(bars.size());
        for (const auto& bar : bars) {
            if (bar.time < plan.before && (raw.empty() || bar.time > raw.back().time)) {
                raw.push_back(bar);
            }
        }
        if (raw.empty()) {
            logger->info("No older history for {} before {}", plan.symbol,
                         core::utils::timestampToString(plan.before));
            return 0;
        }

        core::TimeSeries<core::Candle> real_old_warmup;
        for (const auto& bar : warmup_) {
            if (!bar.synthetic) real_old_warmup.push_back(bar);
        }

        core::TimeSeries<core::Candle> spliced;
        core::TimeSeries<core::Candle> new_warmup;
        if (raw.size() > config_.warmup_buffer) {
            new_warmup.assign(raw.begin(), raw.begin() + static_cast<std::ptrdiff_t>(config_.warmup_buffer));
            spliced.assign(raw.begin() + static_cast<std::ptrdiff_t>(config_.warmup_buffer), raw.end());
        } else {
            spliced = raw;
            new_warmup = syntheticPadding(raw.front(), config_.min_warmup, plan.timeframe);
        }
        spliced.insert(spliced.end(), real_old_warmup.begin(), real_old_warmup.end());

        const std::size_t k = spliced.size();
        spliced.insert(spliced.end(), visible_.begin(), visible_.end());
        visible_ = std::move(spliced);
        warmup_ = std::move(new_warmup);
        if (partial_index_) {
            *partial_index_ += k;
        }
        ++version_;

        logger->info("Backfilled {} bars for {} {} (warmup now {})", k, plan.symbol,
                     core::utils::timeframeToString(plan.timeframe), warmup_.size());
        return k;
    }

    bool CandleBufferManager::releasePartialBar(std::size_t cursor) {
        if (!partial_index_ || !nominal_bar_ || cursor <= *partial_index_) return false;
        if (*partial_index_ < visible_.size() && visible_[*partial_index_].time == nominal_bar_->time) {
            visible_[*partial_index_] = *nominal_bar_;
            ++version_;
        }
        partial_index_.reset();
        nominal_bar_.reset();
        return true;
    }

} // namespace simulation
