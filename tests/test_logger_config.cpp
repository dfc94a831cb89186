#include "log/logger.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

namespace orderkv::test {

    class LoggerConfigTest : public ::testing::Test {
      protected:
        void SetUp() override {
            unsetenv("ORDERKV_LOG_LEVEL");
            unsetenv("ORDERKV_LOG_FILE");
        }

        void TearDown() override {
            unsetenv("ORDERKV_LOG_LEVEL");
            unsetenv("ORDERKV_LOG_FILE");
        }
    };

    // ============================================================================
    // LEVEL PARSING
    // ============================================================================

    TEST_F(LoggerConfigTest, ParsesEveryLevelName) {
        EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
        EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
        EXPECT_EQ(log::parse_level("info"), log::Level::Info);
        EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
        EXPECT_EQ(log::parse_level("error"), log::Level::Error);
        EXPECT_EQ(log::parse_level("fatal"), log::Level::Fatal);
        EXPECT_EQ(log::parse_level("off"), log::Level::Off);
    }

    TEST_F(LoggerConfigTest, ParsingIgnoresCase) {
        EXPECT_EQ(log::parse_level("DEBUG"), log::Level::Debug);
        EXPECT_EQ(log::parse_level("Warning"), log::Level::Warn);
    }

    TEST_F(LoggerConfigTest, RejectsUnknownLevel) {
        EXPECT_FALSE(log::parse_level("verbose").has_value());
        EXPECT_FALSE(log::parse_level("").has_value());
    }

    // ============================================================================
    // ENVIRONMENT OVERLAY
    // ============================================================================

    TEST_F(LoggerConfigTest, EmptyEnvironmentKeepsBase) {
        log::LogConfig base;
        base.level = log::Level::Error;
        base.console_output = false;
        base.file_path = "base.log";

        auto config = log::config_from_env(base);
        EXPECT_EQ(config.level, log::Level::Error);
        EXPECT_FALSE(config.console_output);
        EXPECT_EQ(config.file_path, "base.log");
    }

    TEST_F(LoggerConfigTest, EnvironmentOverridesLevelAndFile) {
        setenv("ORDERKV_LOG_LEVEL", "trace", 1);
        setenv("ORDERKV_LOG_FILE", "/tmp/orderkv_test.log", 1);

        auto config = log::config_from_env();
        EXPECT_EQ(config.level, log::Level::Trace);
        EXPECT_EQ(config.file_path, "/tmp/orderkv_test.log");
        EXPECT_TRUE(config.console_output);
    }

    TEST_F(LoggerConfigTest, UnparsableLevelIsIgnored) {
        setenv("ORDERKV_LOG_LEVEL", "loud", 1);

        log::LogConfig base;
        base.level = log::Level::Warn;
        EXPECT_EQ(log::config_from_env(base).level, log::Level::Warn);
    }

    TEST_F(LoggerConfigTest, SetLevelIsVisible) {
        auto &logger = log::Logger::instance();
        const auto previous = logger.level();

        logger.set_level(log::Level::Debug);
        EXPECT_EQ(logger.level(), log::Level::Debug);
        LOG_DEBUG("debug line {}", 1);

        logger.set_level(previous);
        EXPECT_EQ(logger.level(), previous);
    }

} // namespace orderkv::test
