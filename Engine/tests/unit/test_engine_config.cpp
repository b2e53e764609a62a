/**
 * @file test_engine_config.cpp
 * @brief Environment-driven configuration and log thresholds
 */

#include <gtest/gtest.h>
#include <core/engine_config.hpp>
#include <cstdlib>

using namespace Cadis;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::get_threshold();
        for (const char* name : kVars) unsetenv(name);
    }

    void TearDown() override {
        for (const char* name : kVars) unsetenv(name);
        Logger::set_threshold(saved_level_);
    }

    static constexpr const char* kVars[] = {
        "CADIS_DATASET_DIR", "CADIS_LOG_LEVEL", "CADIS_BOUNDARY_EPSILON", "CADIS_GRID_TARGET_PER_CELL"
    };

    Logger::Level saved_level_ = Logger::Level::Info;
};

TEST_F(EngineConfigTest, DefaultsWithoutEnvironment) {
    EngineConfig cfg = EngineConfig::from_env();
    EXPECT_EQ(cfg.dataset_dir, "");
    EXPECT_EQ(cfg.log_level, Logger::Level::Info);
    EXPECT_DOUBLE_EQ(cfg.boundary_epsilon, 1e-9);
    EXPECT_EQ(cfg.grid_target_per_cell, 4u);
}

TEST_F(EngineConfigTest, ReadsEnvironment) {
    setenv("CADIS_DATASET_DIR", "/srv/cadis/tw", 1);
    setenv("CADIS_LOG_LEVEL", "debug", 1);
    setenv("CADIS_BOUNDARY_EPSILON", "1e-7", 1);
    setenv("CADIS_GRID_TARGET_PER_CELL", "16", 1);

    EngineConfig cfg = EngineConfig::from_env();
    EXPECT_EQ(cfg.dataset_dir, "/srv/cadis/tw");
    EXPECT_EQ(cfg.log_level, Logger::Level::Debug);
    EXPECT_DOUBLE_EQ(cfg.boundary_epsilon, 1e-7);
    EXPECT_EQ(cfg.grid_target_per_cell, 16u);

    cfg.apply_logging();
    EXPECT_EQ(Logger::get_threshold(), Logger::Level::Debug);
    EXPECT_TRUE(Logger::enabled(Logger::Level::Debug));
}

TEST_F(EngineConfigTest, BadValuesKeepDefaults) {
    setenv("CADIS_LOG_LEVEL", "error", 1);   // keeps the warnings below quiet
    setenv("CADIS_BOUNDARY_EPSILON", "tiny", 1);
    setenv("CADIS_GRID_TARGET_PER_CELL", "-3", 1);
    Logger::set_threshold(Logger::Level::Error);

    EngineConfig cfg = EngineConfig::from_env();
    EXPECT_DOUBLE_EQ(cfg.boundary_epsilon, 1e-9);
    EXPECT_EQ(cfg.grid_target_per_cell, 4u);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::Warning);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::Warning);
    EXPECT_EQ(Logger::parse_level("off"), Logger::Level::Off);
    EXPECT_EQ(Logger::parse_level("verbose"), Logger::Level::Info);
}

TEST(LoggerTest, OffSuppressesEverything) {
    const auto saved = Logger::get_threshold();
    Logger::set_threshold(Logger::Level::Off);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Error));
    EXPECT_FALSE(Logger::enabled(Logger::Level::Off));
    Logger::set_threshold(Logger::Level::Warning);
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    Logger::set_threshold(saved);
}
