/**
 * @file test_config_manager.cpp
 * @brief Unit tests for ConfigManager and ParseOptions::fromConfig
 */

#include <gtest/gtest.h>
#include "pubid/common/config_manager.h"
#include "pubid/parser.h"

using namespace pubid;
using pubid::common::ConfigManager;

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& config = ConfigManager::getInstance();
        config.unset("PUBID_TEST_KEY");
        config.unset(ConfigManager::DEFAULT_PUBLISHER);
        config.unset(ConfigManager::ALLOW_MISSING_PUBLISHER);
    }
};

TEST_F(ConfigManagerTest, GetInstance_ReturnsSingleton) {
    EXPECT_EQ(&ConfigManager::getInstance(), &ConfigManager::getInstance());
}

TEST_F(ConfigManagerTest, GetString_DefaultWhenMissing) {
    auto& config = ConfigManager::getInstance();
    EXPECT_FALSE(config.has("PUBID_TEST_KEY"));
    EXPECT_EQ(config.getString("PUBID_TEST_KEY", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, SetAndUnset) {
    auto& config = ConfigManager::getInstance();
    config.set("PUBID_TEST_KEY", "value");
    EXPECT_TRUE(config.has("PUBID_TEST_KEY"));
    EXPECT_EQ(config.getString("PUBID_TEST_KEY"), "value");

    config.unset("PUBID_TEST_KEY");
    EXPECT_FALSE(config.has("PUBID_TEST_KEY"));
}

TEST_F(ConfigManagerTest, GetBool_AcceptedSpellings) {
    auto& config = ConfigManager::getInstance();
    for (const char* value : {"true", "1", "YES", " on "}) {
        config.set("PUBID_TEST_KEY", value);
        EXPECT_TRUE(config.getBool("PUBID_TEST_KEY", false)) << value;
    }
    for (const char* value : {"false", "0", "No", "OFF"}) {
        config.set("PUBID_TEST_KEY", value);
        EXPECT_FALSE(config.getBool("PUBID_TEST_KEY", true)) << value;
    }
}

TEST_F(ConfigManagerTest, GetBool_InvalidUsesDefault) {
    auto& config = ConfigManager::getInstance();
    config.set("PUBID_TEST_KEY", "maybe");
    EXPECT_TRUE(config.getBool("PUBID_TEST_KEY", true));
    EXPECT_FALSE(config.getBool("PUBID_TEST_KEY", false));
}

// =============================================================================
// ParseOptions from configuration
// =============================================================================

TEST_F(ConfigManagerTest, ParseOptions_Defaults) {
    ParseOptions options = ParseOptions::fromConfig();
    EXPECT_EQ(options.defaultPublisher, Publisher::NIST);
    EXPECT_TRUE(options.allowMissingPublisher);
}

TEST_F(ConfigManagerTest, ParseOptions_FromOverrides) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::DEFAULT_PUBLISHER, "nbs");
    config.set(ConfigManager::ALLOW_MISSING_PUBLISHER, "false");

    ParseOptions options = ParseOptions::fromConfig();
    EXPECT_EQ(options.defaultPublisher, Publisher::NBS);
    EXPECT_FALSE(options.allowMissingPublisher);
}

TEST_F(ConfigManagerTest, ParseOptions_UnknownPublisherFallsBackToNist) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::DEFAULT_PUBLISHER, "ANSI");

    ParseOptions options = ParseOptions::fromConfig();
    EXPECT_EQ(options.defaultPublisher, Publisher::NIST);
}
