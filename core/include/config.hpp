#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core {

    enum class IndicatorType {
        EMA,
        RSI,
        MACD
    };

    // One configured indicator. Fields irrelevant to the type are ignored.
    struct IndicatorConfig {
        std::string id;
        IndicatorType type = IndicatorType::EMA;
        bool visible = true;
        int period = 14;
        double upper_level = 70.0;
        double lower_level = 30.0;
        int fast_length = 12;
        int slow_length = 26;
        int signal_length = 9;
    };

    // Default indicator set: EMA(20), EMA(50), RSI(14), MACD(12,26,9)
    std::vector<IndicatorConfig> defaultIndicators();

    struct RestConfig {
        std::string base_url;
        std::string table = "market_data";
        std::string api_key_env = "REPLAY_API_KEY";
    };

    struct EngineConfig {
        // --- Account ---
        double initial_balance = 10000.0;
        double leverage = 100.0;
        double stop_out_level = 0.0; // Margin level percent

        // --- Buffer ---
        std::size_t visible_candles = 1000;
        std::size_t warmup_buffer = 500;
        std::size_t min_warmup = 200;
        std::size_t buffer_threshold = 50;
        std::size_t stream_chunk = 100;
        std::size_t history_page = 500;
        std::size_t fallback_limit_cap = 50000;

        // --- Playback ---
        int default_speed_ms = 500;

        // --- Trend ---
        std::size_t trend_min_bars = 50;
        std::size_t trend_context_bars = 100;
        long long trend_refresh_seconds = 300;
        std::vector<Timeframe> trend_timeframes {Timeframe::D1, Timeframe::H4, Timeframe::H2, Timeframe::M30};

        // --- Infrastructure ---
        std::string database_path = "replay_trainer.db";
        std::string log_level = "info";
        std::string log_file = "replay_trainer";
        RestConfig rest;

        std::vector<IndicatorConfig> indicators = defaultIndicators();
    };

    std::string toString(IndicatorType type);
    IndicatorType indicatorTypeFromString(const std::string& value); // Throws ConfigException

    void to_json(nlohmann::json& j, const IndicatorConfig& config);
    void from_json(const nlohmann::json& j, IndicatorConfig& config);
    void to_json(nlohmann::json& j, const EngineConfig& config);
    // Missing keys keep their defaults. Throws ConfigException on bad values.
    void from_json(const nlohmann::json& j, EngineConfig& config);

    // Throws ConfigException on I/O, parse or validation errors
    EngineConfig loadEngineConfig(const std::string& path);

} // namespace core
