#include "log/logger.hpp"
#include <gtest/gtest.h>

int main(int argc, char **argv) {
    // Quiet by default; ORDERKV_LOG_LEVEL / ORDERKV_LOG_FILE can turn tracing on for a run
    orderkv::log::LogConfig config;
    config.level = orderkv::log::Level::Error;
    config.console_output = false;
    orderkv::log::Logger::instance().init(orderkv::log::config_from_env(config));

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

    orderkv::log::Logger::instance().shutdown();
    return result;
}
