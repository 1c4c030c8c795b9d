#include "logging.hpp"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    core::logging::LogSettings settings;
    settings.file_prefix = "replay_tests";
    settings.file_enabled = false;
    settings.console_level = spdlog::level::warn;
    core::logging::initialize(settings);

    return RUN_ALL_TESTS();
}
