#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

namespace core {
namespace logging {

    namespace {
        const char* kLoggerName = "replay";
        const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] [t%t] %v";
        constexpr std::size_t kMaxFileBytes = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        std::shared_ptr<spdlog::logger> global_logger;

        std::optional<spdlog::level::level_enum> levelFromEnvironment() {
            for (const char* name : {"REPLAY_LOG_LEVEL", "SPDLOG_LEVEL"}) {
                if (const char* value = std::getenv(name)) {
                    std::cout << "[Logging] " << name << "=" << value << " overrides configured levels" << std::endl;
                    return level_from_string(value);
                }
            }
            return std::nullopt;
        }

        // Falls back to the working directory when the log directory cannot be created
        std::string logFilePath(const LogSettings& settings) {
            std::string directory = settings.directory.empty() ? "." : settings.directory;
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create '" << directory << "': " << ec.message() << std::endl;
                directory = ".";
            }

            const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm;
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif

            std::ostringstream name;
            name << settings.file_prefix << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return directory + "/" + name.str();
        }
    }

    void initialize(const LogSettings& settings) {
        auto console_level = settings.console_level;
        auto file_level = settings.file_level;
        if (auto forced = levelFromEnvironment()) {
            console_level = *forced;
            file_level = *forced;
        }

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(console_level);
        console_sink->set_pattern(kPattern);
        sinks.push_back(console_sink);

        std::string file_path = "(none)";
        if (settings.file_enabled) {
            try {
                file_path = logFilePath(settings);
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file_path, kMaxFileBytes, kMaxFiles, true);
                file_sink->set_level(file_level);
                file_sink->set_pattern(kPattern);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "[Logging] File sink disabled: " << ex.what() << std::endl;
                file_path = "(none)";
            }
        }

        spdlog::drop(kLoggerName);
        global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        global_logger->set_level(settings.file_enabled ? std::min(console_level, file_level) : console_level);
        global_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(global_logger);
        spdlog::set_default_logger(global_logger);

        #ifdef NDEBUG
            const char* build_type = "Release";
        #else
            const char* build_type = "Debug";
        #endif
        global_logger->info("Logging initialized ({} build). Console: {}, file: {} -> {}",
                            build_type,
                            spdlog::level::to_string_view(console_level),
                            spdlog::level::to_string_view(file_level),
                            file_path);
    }

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level) {
        LogSettings settings;
        settings.file_prefix = base_log_filename;
        settings.console_level = console_level;
        settings.file_level = file_level;
        initialize(settings);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    void applyLevel(const std::string& level_str) {
        auto& logger = getLogger();
        const auto level = level_from_string(level_str);
        logger->set_level(level);
        logger->debug("Log level set to {}", spdlog::level::to_string_view(level));
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower = level_str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "trace") return spdlog::level::trace;
        if (lower == "debug") return spdlog::level::debug;
        if (lower == "info") return spdlog::level::info;
        if (lower == "warn" || lower == "warning") return spdlog::level::warn;
        if (lower == "error" || lower == "err") return spdlog::level::err;
        if (lower == "critical" || lower == "crit") return spdlog::level::critical;
        if (lower == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level '" << level_str << "', using info." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
