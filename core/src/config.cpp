#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <fstream>
#include <stdexcept>

namespace core {

    using json = nlohmann::json;

    std::string toString(IndicatorType type) {
        switch (type) {
            case IndicatorType::EMA:  return "EMA";
            case IndicatorType::RSI:  return "RSI";
            case IndicatorType::MACD: return "MACD";
        }
        return "EMA";
    }

    IndicatorType indicatorTypeFromString(const std::string& value) {
        if (value == "EMA") return IndicatorType::EMA;
        if (value == "RSI") return IndicatorType::RSI;
        if (value == "MACD") return IndicatorType::MACD;
        throw ConfigException("Unknown indicator type: " + value);
    }

    std::vector<IndicatorConfig> defaultIndicators() {
        IndicatorConfig ema_fast;
        ema_fast.id = "ema-20";
        ema_fast.type = IndicatorType::EMA;
        ema_fast.period = 20;

        IndicatorConfig ema_slow;
        ema_slow.id = "ema-50";
        ema_slow.type = IndicatorType::EMA;
        ema_slow.period = 50;

        IndicatorConfig rsi;
        rsi.id = "rsi-14";
        rsi.type = IndicatorType::RSI;
        rsi.period = 14;

        IndicatorConfig macd;
        macd.id = "macd";
        macd.type = IndicatorType::MACD;

        return {ema_fast, ema_slow, rsi, macd};
    }

    // --- IndicatorConfig ---

    void to_json(json& j, const IndicatorConfig& config) {
        j = json{
            {"id", config.id},
            {"type", toString(config.type)},
            {"visible", config.visible},
            {"period", config.period},
            {"upper_level", config.upper_level},
            {"lower_level", config.lower_level},
            {"fast_length", config.fast_length},
            {"slow_length", config.slow_length},
            {"signal_length", config.signal_length}
        };
    }

    void from_json(const json& j, IndicatorConfig& config) {
        if (!j.is_object()) {
            throw ConfigException("Indicator entry must be a JSON object.");
        }
        config.type = indicatorTypeFromString(j.value("type", std::string("EMA")));
        config.id = j.value("id", toString(config.type));
        config.visible = j.value("visible", config.visible);
        config.period = j.value("period", config.period);
        config.upper_level = j.value("upper_level", config.upper_level);
        config.lower_level = j.value("lower_level", config.lower_level);
        config.fast_length = j.value("fast_length", config.fast_length);
        config.slow_length = j.value("slow_length", config.slow_length);
        config.signal_length = j.value("signal_length", config.signal_length);
    }

    // --- EngineConfig ---

    void to_json(json& j, const EngineConfig& config) {
        std::vector<std::string> trend_labels;
        for (auto tf : config.trend_timeframes) {
            trend_labels.push_back(utils::timeframeToString(tf));
        }
        j = json{
            {"initial_balance", config.initial_balance},
            {"leverage", config.leverage},
            {"stop_out_level", config.stop_out_level},
            {"visible_candles", config.visible_candles},
            {"warmup_buffer", config.warmup_buffer},
            {"min_warmup", config.min_warmup},
            {"buffer_threshold", config.buffer_threshold},
            {"stream_chunk", config.stream_chunk},
            {"history_page", config.history_page},
            {"fallback_limit_cap", config.fallback_limit_cap},
            {"default_speed_ms", config.default_speed_ms},
            {"trend_min_bars", config.trend_min_bars},
            {"trend_context_bars", config.trend_context_bars},
            {"trend_refresh_seconds", config.trend_refresh_seconds},
            {"trend_timeframes", trend_labels},
            {"database_path", config.database_path},
            {"log_level", config.log_level},
            {"log_file", config.log_file},
            {"rest", {
                {"base_url", config.rest.base_url},
                {"table", config.rest.table},
                {"api_key_env", config.rest.api_key_env}
            }},
            {"indicators", config.indicators}
        };
    }

    void from_json(const json& j, EngineConfig& config) {
        if (!j.is_object()) {
            throw ConfigException("Engine configuration must be a JSON object.");
        }

        try {
            config.initial_balance = j.value("initial_balance", config.initial_balance);
            config.leverage = j.value("leverage", config.leverage);
            config.stop_out_level = j.value("stop_out_level", config.stop_out_level);
            config.visible_candles = j.value("visible_candles", config.visible_candles);
            config.warmup_buffer = j.value("warmup_buffer", config.warmup_buffer);
            config.min_warmup = j.value("min_warmup", config.min_warmup);
            config.buffer_threshold = j.value("buffer_threshold", config.buffer_threshold);
            config.stream_chunk = j.value("stream_chunk", config.stream_chunk);
            config.history_page = j.value("history_page", config.history_page);
            config.fallback_limit_cap = j.value("fallback_limit_cap", config.fallback_limit_cap);
            config.default_speed_ms = j.value("default_speed_ms", config.default_speed_ms);
            config.trend_min_bars = j.value("trend_min_bars", config.trend_min_bars);
            config.trend_context_bars = j.value("trend_context_bars", config.trend_context_bars);
            config.trend_refresh_seconds = j.value("trend_refresh_seconds", config.trend_refresh_seconds);
            config.database_path = j.value("database_path", config.database_path);
            config.log_level = j.value("log_level", config.log_level);
            config.log_file = j.value("log_file", config.log_file);

            if (j.contains("trend_timeframes")) {
                config.trend_timeframes.clear();
                for (const auto& label : j.at("trend_timeframes")) {
                    config.trend_timeframes.push_back(utils::timeframeFromString(label.get<std::string>()));
                }
            }

            if (j.contains("rest")) {
                const auto& rest = j.at("rest");
                config.rest.base_url = rest.value("base_url", config.rest.base_url);
                config.rest.table = rest.value("table", config.rest.table);
                config.rest.api_key_env = rest.value("api_key_env", config.rest.api_key_env);
            }

            if (j.contains("indicators")) {
                config.indicators = j.at("indicators").get<std::vector<IndicatorConfig>>();
            }
        } catch (const json::exception& e) {
            throw ConfigException(std::string("Invalid engine configuration: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigException(std::string("Invalid engine configuration: ") + e.what());
        }

        // --- Validation ---
        if (config.initial_balance <= 0.0) throw ConfigException("initial_balance must be positive.");
        if (config.leverage <= 0.0) throw ConfigException("leverage must be positive.");
        if (config.default_speed_ms <= 0) throw ConfigException("default_speed_ms must be positive.");
        if (config.visible_candles == 0) throw ConfigException("visible_candles must be positive.");
        if (config.stream_chunk == 0) throw ConfigException("stream_chunk must be positive.");
        if (config.warmup_buffer == 0) throw ConfigException("warmup_buffer must be positive.");
        if (config.warmup_buffer < config.min_warmup) {
            throw ConfigException("warmup_buffer must be at least min_warmup.");
        }
    }

    EngineConfig loadEngineConfig(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading engine configuration from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException("Could not open configuration file: " + path);
        }

        json document;
        try {
            document = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException("Failed to parse configuration file '" + path + "': " + e.what());
        }

        EngineConfig config = document.get<EngineConfig>();
        logger->debug("Engine configuration loaded: balance={:.2f}, leverage={}, visible={}, warmup={}",
                      config.initial_balance, config.leverage, config.visible_candles, config.warmup_buffer);
        return config;
    }

} // namespace core
