/*
 * log_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Logger setup shared by the sandbox library and its tools

**************************************************/

#ifndef PYVAULT_LOGGING_LOG_CONFIG_HPP
#define PYVAULT_LOGGING_LOG_CONFIG_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pyvault::logging {

/// Name of the logger used by library code.
inline constexpr std::string_view kLibraryLogger = "pyvault";

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

struct LoggerConfig {
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] [%t] %v";
    bool console_output = true;
    bool file_output = false;
    std::string log_file_path = "logs/pyvault.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;
};

/**
 * @brief Process-wide spdlog configuration
 *
 * Loggers are created lazily on first use. Library code never requires
 * initialize() to have been called; without it loggers write to a colour
 * stdout sink at INFO level.
 */
class LogConfig {
public:
    /**
     * @brief Initialize global spdlog configuration
     * @param config Logger configuration
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Get or create a named logger
     * @param name Logger name
     * @return Shared pointer to logger
     */
    static auto getLogger(std::string_view name = kLibraryLogger)
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set global log level
     */
    static void setGlobalLevel(LogLevel level) noexcept;

    [[nodiscard]] static LogLevel globalLevel() noexcept {
        return global_level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Flush all loggers
     */
    static void flushAll() noexcept;

    [[nodiscard]] static std::uint64_t errorCount() noexcept {
        return error_count_.load(std::memory_order_relaxed);
    }

    static auto convertLevel(LogLevel level) noexcept
        -> spdlog::level::level_enum;

    static inline std::atomic<std::uint64_t> error_count_{0};

private:
    static auto createLogger(std::string_view name)
        -> std::shared_ptr<spdlog::logger>;

    static inline std::atomic<bool> initialized_{false};
    static inline std::atomic<LogLevel> global_level_{LogLevel::INFO};
};

#define PYVAULT_LOG_TRACE(logger, ...) \
    if (logger && logger->should_log(spdlog::level::trace)) { \
        logger->trace(__VA_ARGS__); \
    }

#define PYVAULT_LOG_DEBUG(logger, ...) \
    if (logger && logger->should_log(spdlog::level::debug)) { \
        logger->debug(__VA_ARGS__); \
    }

#define PYVAULT_LOG_INFO(logger, ...) \
    if (logger && logger->should_log(spdlog::level::info)) { \
        logger->info(__VA_ARGS__); \
    }

#define PYVAULT_LOG_WARN(logger, ...) \
    if (logger && logger->should_log(spdlog::level::warn)) { \
        logger->warn(__VA_ARGS__); \
    }

#define PYVAULT_LOG_ERROR(logger, ...) \
    if (logger && logger->should_log(spdlog::level::err)) { \
        logger->error(__VA_ARGS__); \
        ::pyvault::logging::LogConfig::error_count_.fetch_add(1, std::memory_order_relaxed); \
    }

}  // namespace pyvault::logging

#endif  // PYVAULT_LOGGING_LOG_CONFIG_HPP
