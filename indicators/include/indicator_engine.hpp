#pragma once

#include "config.hpp"
#include "indicators.hpp"
#include "datatypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace indicators {

    class MacdIndicator;

    // Cursor-safe slice of one configured indicator
    struct IndicatorView {
        std::string id;
        std::string name;
        core::IndicatorType type = core::IndicatorType::EMA;
        bool visible = true;
        core::TimeSeries<core::IndicatorPoint> values; // EMA/RSI value, MACD line
        core::TimeSeries<core::MacdPoint> macd;        // MACD only
    };

    // Holds the configured indicators and recomputes them over the full
    // (warmup + visible) candle sequence whenever the buffer version or the
    // configuration changes.
    class IndicatorEngine {
    public:
        explicit IndicatorEngine(const std::vector<core::IndicatorConfig>& configs = core::defaultIndicators());
        ~IndicatorEngine();

        // Replaces the configuration. Throws core::ConfigException on invalid parameters.
        void setConfigs(const std::vector<core::IndicatorConfig>& configs);
        const std::vector<core::IndicatorConfig>& getConfigs() const;

        // Returns true when a recomputation happened
        bool update(const core::TimeSeries<core::Candle>& sequence, std::uint64_t buffer_version);

        // Points with visible_start <= time <= cursor_time. With exclude_synthetic,
        // points whose seed window reaches into synthetic warmup bars are dropped.
        std::vector<IndicatorView> views(core::Timestamp visible_start,
                                         core::Timestamp cursor_time,
                                         bool exclude_synthetic = false) const;

        std::optional<IndicatorView> view(const std::string& id,
                                          core::Timestamp visible_start,
                                          core::Timestamp cursor_time,
                                          bool exclude_synthetic = false) const;

        std::uint64_t computedVersion() const { return computed_version_; }
        std::size_t recomputeCount() const { return recompute_count_; }

    private:
        struct Slot {
            core::IndicatorConfig config;
            std::unique_ptr<IIndicator> indicator;
            MacdIndicator* macd = nullptr; // Non-owning view into indicator for MACD slots
            core::Timestamp first_trusted_time = 0;
        };

        IndicatorView buildView(const Slot& slot, core::Timestamp visible_start,
                                core::Timestamp cursor_time, bool exclude_synthetic) const;

        std::vector<core::IndicatorConfig> configs_;
        std::vector<Slot> slots_;
        std::uint64_t computed_version_ = 0;
        bool has_computed_ = false;
        bool dirty_ = true;
        std::size_t recompute_count_ = 0;
    };

} // namespace indicators
