/*
 * test_log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for LogConfig logger setup

**************************************************/

#include <gtest/gtest.h>

#include "logging/log_config.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <thread>
#include <vector>

using namespace pyvault::logging;

class LogConfigTest : public ::testing::Test {
protected:
    void TearDown() override { LogConfig::setGlobalLevel(LogLevel::INFO); }
};

// ============================================================================
// Registry Tests
// ============================================================================

TEST_F(LogConfigTest, DefaultLoggerIsLibraryLogger) {
    auto logger = LogConfig::getLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "pyvault");
}

TEST_F(LogConfigTest, SameNameReturnsSameLogger) {
    auto first = LogConfig::getLogger("pyvault.test");
    auto second = LogConfig::getLogger("pyvault.test");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(first.get(), LogConfig::getLogger().get());
}

TEST_F(LogConfigTest, HostRegisteredLoggerWins) {
    auto host = std::make_shared<spdlog::logger>(
        "pyvault.host", std::make_shared<spdlog::sinks::null_sink_mt>());
    spdlog::register_logger(host);

    EXPECT_EQ(LogConfig::getLogger("pyvault.host").get(), host.get());
}

TEST_F(LogConfigTest, ConcurrentLookupsConverge) {
    std::vector<std::shared_ptr<spdlog::logger>> loggers(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < loggers.size(); ++i) {
        threads.emplace_back(
            [&loggers, i] { loggers[i] = LogConfig::getLogger("pyvault.concurrent"); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& logger : loggers) {
        EXPECT_EQ(logger.get(), loggers.front().get());
    }
}

// ============================================================================
// Level Tests
// ============================================================================

TEST_F(LogConfigTest, GlobalLevelAppliesToExistingLoggers) {
    auto logger = LogConfig::getLogger("pyvault.level");
    LogConfig::setGlobalLevel(LogLevel::WARN);
    EXPECT_EQ(LogConfig::globalLevel(), LogLevel::WARN);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
}

TEST_F(LogConfigTest, ConvertLevel) {
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::TRACE), spdlog::level::trace);
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::ERROR), spdlog::level::err);
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::OFF), spdlog::level::off);
}

TEST_F(LogConfigTest, MacrosLogWithoutInitialize) {
    auto logger = LogConfig::getLogger("pyvault.macros");
    PYVAULT_LOG_INFO(logger, "value {}", 42);
    PYVAULT_LOG_DEBUG(logger, "suppressed at info level");
    LogConfig::flushAll();
    EXPECT_EQ(LogConfig::errorCount(), 0u);
}

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(LogConfigTest, InitializeRebuildsLoggersCreatedEarlier) {
    namespace fs = std::filesystem;
    const auto logDir = fs::temp_directory_path() / "pyvault_log_config_test";
    fs::remove_all(logDir);

    auto early = LogConfig::getLogger("pyvault.early");

    LoggerConfig config;
    config.console_output = false;
    config.file_output = true;
    config.log_file_path = (logDir / "pyvault.log").string();
    LogConfig::initialize(config);

    auto rebuilt = LogConfig::getLogger("pyvault.early");
    EXPECT_NE(rebuilt.get(), early.get());
    EXPECT_EQ(spdlog::get("pyvault.early").get(), rebuilt.get());
    ASSERT_EQ(rebuilt->sinks().size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::rotating_file_sink_mt>(
                  rebuilt->sinks().front()),
              nullptr);
    EXPECT_EQ(rebuilt->flush_level(), spdlog::level::err);

    PYVAULT_LOG_INFO(rebuilt, "written after initialize");
    LogConfig::flushAll();
    EXPECT_GT(fs::file_size(logDir / "pyvault.log"), 0u);

    fs::remove_all(logDir);
}
