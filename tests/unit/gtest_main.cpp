#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        px::config::Config config;
        config.logging.log_dir = px::paths::getTestLogPath();
        config.logging.levels.console_log_level = spdlog::level::err;
        config.logging.levels.subsystem_levels.context = spdlog::level::debug;
        config.sync.worker_threads = 2;

        px::config::ConfigRegistry::init(config);
        px::logging::LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize Parallax test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    px::logging::LogRegistry::shutdown();
    return rc;
}
