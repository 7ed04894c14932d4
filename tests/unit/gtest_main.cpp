#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        gdfs::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        gdfs::config::ConfigRegistry::init(cfg);
        gdfs::log::Registry::init(gdfs::config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize gdfs test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
