/**
 * @file test_main.cpp
 * @brief Test runner: installs the library logger before running the suites
 */

#include <gtest/gtest.h>
#include "pubid/common/config_manager.h"
#include "pubid/common/logger.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    auto& config = pubid::common::ConfigManager::getInstance();
    pubid::common::Logger::initialize(
        "pubid-tests", config.getString(pubid::common::ConfigManager::LOG_LEVEL, "warn"));

    return RUN_ALL_TESTS();
}
