#include "indicator_engine.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace indicators {

    IndicatorEngine::IndicatorEngine(const std::vector<core::IndicatorConfig>& configs) {
        setConfigs(configs);
    }

    IndicatorEngine::~IndicatorEngine() = default;

    void IndicatorEngine::setConfigs(const std::vector<core::IndicatorConfig>& configs) {
        std::vector<Slot> slots;
        slots.reserve(configs.size());
        try {
            for (const auto& config : configs) {
                Slot slot;
                slot.config = config;
                switch (config.type) {
                    case core::IndicatorType::EMA:
                        slot.indicator = std::make_unique<EmaIndicator>(config.period);
                        break;
                    case core::IndicatorType::RSI:
                        slot.indicator = std::make_unique<RsiIndicator>(config.period, config.upper_level, config.lower_level);
                        break;
                    case core::IndicatorType::MACD: {
                        auto macd = std::make_unique<MacdIndicator>(config.fast_length, config.slow_length, config.signal_length);
                        slot.macd = macd.get();
                        slot.indicator = std::move(macd);
                        break;
                    }
                }
                slots.push_back(std::move(slot));
            }
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(std::string("Invalid indicator configuration: ") + e.what());
        }

        configs_ = configs;
        slots_ = std::move(slots);
        dirty_ = true;
        core::logging::getLogger()->debug("IndicatorEngine configured with {} indicators.", slots_.size());
    }

    const std::vector<core::IndicatorConfig>& IndicatorEngine::getConfigs() const {
        return configs_;
    }

    bool IndicatorEngine::update(const core::TimeSeries<core::Candle>& sequence, std::uint64_t buffer_version) {
        if (!dirty_ && has_computed_ && buffer_version == computed_version_) {
            return false;
        }

        // Last synthetic index; warmup padding is always a prefix
        std::optional<std::size_t> last_synthetic;
        for (std::size_t i = 0; i < sequence.size(); ++i) {
            if (sequence[i].synthetic) {
                last_synthetic = i;
            }
        }

        for (auto& slot : slots_) {
            slot.indicator->calculate(sequence);

            std::size_t seed_span = static_cast<std::size_t>(slot.indicator->getLookback());
            if (slot.macd) {
                seed_span += static_cast<std::size_t>(slot.config.signal_length - 1);
            }
            if (!last_synthetic) {
                slot.first_trusted_time = std::numeric_limits<core::Timestamp>::min();
            } else {
                const std::size_t trusted_idx = *last_synthetic + 1 + seed_span;
                slot.first_trusted_time = trusted_idx < sequence.size()
                    ? sequence[trusted_idx].time
                    : std::numeric_limits<core::Timestamp>::max();
            }
        }

        computed_version_ = buffer_version;
        has_computed_ = true;
        dirty_ = false;
        ++recompute_count_;
        core::logging::getLogger()->trace("Indicators recomputed for buffer version {} over {} bars.",
                                          buffer_version, sequence.size());
        return true;
    }

    IndicatorView IndicatorEngine::buildView(const Slot& slot, core::Timestamp visible_start,
                                             core::Timestamp cursor_time, bool exclude_synthetic) const {
        IndicatorView view;
        view.id = slot.config.id;
        view.name = slot.indicator->getName();
        view.type = slot.config.type;
        view.visible = slot.config.visible;

        const core::Timestamp lower = exclude_synthetic ? std::max(visible_start, slot.first_trusted_time) : visible_start;
        for (const auto& point : slot.indicator->getResult()) {
            if (point.time >= lower && point.time <= cursor_time) {
                view.values.push_back(point);
            }
        }
        if (slot.macd) {
            for (const auto& point : slot.macd->getPoints()) {
                if (point.time >= lower && point.time <= cursor_time) {
                    view.macd.push_back(point);
                }
            }
        }
        return view;
    }

    std::vector<IndicatorView> IndicatorEngine::views(core::Timestamp visible_start,
                                                      core::Timestamp cursor_time,
                                                      bool exclude_synthetic) const {
        std::vector<IndicatorView> result;
        result.reserve(slots_.size());
        for (const auto& slot : slots_) {
            result.push_back(buildView(slot, visible_start, cursor_time, exclude_synthetic));
        }
        return result;
    }

    std::optional<IndicatorView> IndicatorEngine::view(const std::string& id,
                                                       core::Timestamp visible_start,
                                                       core::Timestamp cursor_time,
                                                       bool exclude_synthetic) const {
        for (const auto& slot : slots_) {
            if (slot.config.id == id) {
                return buildView(slot, visible_start, cursor_time, exclude_synthetic);
            }
        }
        return std::nullopt;
    }

} // namespace indicators
