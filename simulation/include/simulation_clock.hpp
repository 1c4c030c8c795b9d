#pragma once

#include "datatypes.hpp"
#include "periodic_timer.hpp"
#include <atomic>
#include <functional>
#include <optional>

namespace simulation {

    // Playback state of the replay: which visible bar is current and what time it is.
    // Not internally synchronized; the owning session serializes every call except
    // speedMs(), which the playback timer reads from its own thread.
    class SimulationClock {
    public:
        // Returns the open time of visible bar `index`, if held
        using BarTimeLookup = std::function<std::optional<core::Timestamp>(std::size_t)>;

        SimulationClock(core::Timeframe timeframe, int speed_ms, BarTimeLookup bar_time);

        // The timer started by play() and stopped by pause(); not owned
        void attachTimer(PeriodicTimer* timer) { timer_ = timer; }

        bool play();
        void pause();
        bool step();
        // One playback tick; at the last bar playback is forced off and false returned
        bool tick();
        bool setSpeed(int speed_ms);

        // --- Reload protocol ---
        void beginReload(core::Timestamp anchor);
        void completeReload(std::size_t index, std::size_t max_index,
                            std::optional<core::Timestamp> sim_time_override = std::nullopt);
        void abortReload();
        bool isReloading() const { return reloading_; }

        // --- Buffer changes ---
        void setMaxIndex(std::size_t max_index);
        void shift(std::size_t k); // Bars spliced in front of the cursor
        void setTimeframe(core::Timeframe timeframe) { timeframe_ = timeframe; }

        const core::SimulationState& state() const { return state_; }
        bool isPlaying() const { return state_.is_playing; }
        std::size_t index() const { return state_.current_index; }
        std::size_t maxIndex() const { return state_.max_index; }
        bool atEnd() const { return state_.current_index + 1 >= state_.max_index; }
        int speedMs() const { return speed_ms_.load(); }
        core::Timeframe timeframe() const { return timeframe_; }

        // Unset while a reload is in progress
        std::optional<core::Timestamp> simTime() const { return sim_time_; }
        // Last anchor handed to beginReload()
        core::Timestamp anchor() const { return anchor_; }

    private:
        void refreshSimTime();

        core::Timeframe timeframe_;
        BarTimeLookup bar_time_;
        PeriodicTimer* timer_ = nullptr;

        core::SimulationState state_;
        std::atomic<int> speed_ms_;
        std::optional<core::Timestamp> sim_time_;
        core::Timestamp anchor_ = 0;
        bool reloading_ = false;
    };

} // namespace simulation
