#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    struct LogSettings {
        std::string file_prefix = "replay_trainer"; // <directory>/<prefix>_<UTC stamp>.log
        std::string directory = "logs";
        bool file_enabled = true;
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
    };

    // Builds the shared "replay" logger. May be called again to replace it,
    // e.g. once the engine configuration names a different log file.
    // REPLAY_LOG_LEVEL (or SPDLOG_LEVEL) overrides both sink levels.
    void initialize(const LogSettings& settings);
    void initialize(const std::string& base_log_filename = "replay_trainer",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Throws std::runtime_error before initialize()
    std::shared_ptr<spdlog::logger>& getLogger();

    // Sets the logger threshold from a config string such as "debug"
    void applyLevel(const std::string& level_str);

    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
