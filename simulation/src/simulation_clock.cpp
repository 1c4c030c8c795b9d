#include "simulation_clock.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace simulation {

    SimulationClock::SimulationClock(core::Timeframe timeframe, int speed_ms, BarTimeLookup bar_time)
        : timeframe_(timeframe), bar_time_(std::move(bar_time)), speed_ms_(speed_ms)
    {
        if (speed_ms <= 0) {
            throw std::invalid_argument("Playback speed must be positive.");
        }
        if (!bar_time_) {
            throw std::invalid_argument("SimulationClock requires a bar time lookup.");
        }
        state_.speed = speed_ms;
    }

    void SimulationClock::refreshSimTime() {
        if (auto open_time = bar_time_(state_.current_index)) {
            sim_time_ = *open_time + core::utils::timeframeSeconds(timeframe_);
        }
    }

    bool SimulationClock::play() {
        if (reloading_ || state_.max_index == 0) {
            return false;
        }
        state_.is_playing = true;
        if (timer_) timer_->start();
        core::logging::getLogger()->debug("Playback started at index {} ({} ms/bar)",
                                          state_.current_index, speedMs());
        return true;
    }

    void SimulationClock::pause() {
        if (timer_) timer_->stop();
        if (state_.is_playing) {
            core::logging::getLogger()->debug("Playback paused at index {}", state_.current_index);
        }
        state_.is_playing = false;
    }

    bool SimulationClock::step() {
        if (state_.is_playing || reloading_ || atEnd()) {
            return false;
        }
        ++state_.current_index;
        refreshSimTime();
        return true;
    }

    bool SimulationClock::tick() {
        if (!state_.is_playing || reloading_) {
            return false;
        }
        if (atEnd()) {
            pause();
            return false;
        }
        ++state_.current_index;
        refreshSimTime();
        return true;
    }

    bool SimulationClock::setSpeed(int speed_ms) {
        if (speed_ms <= 0) {
            core::logging::getLogger()->warn("Ignoring non-positive playback speed {}", speed_ms);
            return false;
        }
        speed_ms_.store(speed_ms);
        state_.speed = speed_ms;
        return true;
    }

    // --- Reload protocol ---

    void SimulationClock::beginReload(core::Timestamp anchor) {
        pause();
        reloading_ = true;
        anchor_ = anchor;
        sim_time_.reset();
    }

    void SimulationClock::completeReload(std::size_t index, std::size_t max_index,
                                         std::optional<core::Timestamp> sim_time_override) {
        state_.max_index = max_index;
        state_.current_index = max_index == 0 ? 0 : std::min(index, max_index - 1);
        sim_time_ = sim_time_override ? *sim_time_override : anchor_;
        reloading_ = false;
    }

    void SimulationClock::abortReload() {
        reloading_ = false;
        state_.current_index = 0;
        state_.max_index = 0;
        sim_time_ = anchor_;
    }

    // --- Buffer changes ---

    void SimulationClock::setMaxIndex(std::size_t max_index) {
        state_.max_index = max_index;
        if (max_index == 0) {
            state_.current_index = 0;
        } else if (state_.current_index >= max_index) {
            state_.current_index = max_index - 1;
        }
    }

    void SimulationClock::shift(std::size_t k) {
        state_.current_index += k;
        state_.max_index += k;
    }

} // namespace simulation
