#include <gtest/gtest.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // no config file: every default applies
        cs::config::ConfigRegistry::init(std::filesystem::path{});
        cs::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize codesearch test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
