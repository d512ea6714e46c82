/*
 * log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "log_config.hpp"

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pyvault::logging {

namespace {
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>
    logger_registry_;
std::unordered_set<std::string> owned_loggers_;
std::shared_mutex registry_mutex_;
LoggerConfig active_config_;
}  // namespace

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    try {
        if (const auto directory =
                std::filesystem::path(config.log_file_path).parent_path();
            config.file_output && !directory.empty()) {
            std::filesystem::create_directories(directory);
        }
        {
            std::unique_lock lock(registry_mutex_);
            active_config_ = config;

            // Loggers handed out before initialize() get the new sinks.
            for (const auto& name : owned_loggers_) {
                auto rebuilt = createLogger(name);
                spdlog::drop(name);
                spdlog::register_logger(rebuilt);
                logger_registry_[name] = std::move(rebuilt);
            }
        }

        setGlobalLevel(config.level);

        auto default_logger = getLogger(kLibraryLogger);
        spdlog::set_default_logger(default_logger);

        spdlog::set_error_handler([](const std::string& msg) {
            error_count_.fetch_add(1, std::memory_order_relaxed);
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });

        PYVAULT_LOG_DEBUG(default_logger, "Logging initialized at level {}",
                          static_cast<int>(config.level));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

auto LogConfig::getLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    std::string nameStr{name};

    {
        std::shared_lock lock(registry_mutex_);
        if (auto it = logger_registry_.find(nameStr);
            it != logger_registry_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(registry_mutex_);

    // Double-check pattern
    if (auto it = logger_registry_.find(nameStr);
        it != logger_registry_.end()) {
        return it->second;
    }

    // A logger registered directly with spdlog by the host application wins.
    auto logger = spdlog::get(nameStr);
    if (!logger) {
        logger = createLogger(name);
        spdlog::register_logger(logger);
        owned_loggers_.insert(nameStr);
    }
    logger_registry_.emplace(nameStr, logger);
    return logger;
}

auto LogConfig::createLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (active_config_.console_output) {
            auto console_sink =
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(active_config_.pattern);
            sinks.push_back(console_sink);
        }

        if (active_config_.file_output) {
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    active_config_.log_file_path, active_config_.max_file_size,
                    active_config_.max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern(
                "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(
            std::string{name}, sinks.begin(), sinks.end());
        logger->set_level(convertLevel(globalLevel()));

        if (active_config_.flush_on_error) {
            logger->flush_on(spdlog::level::err);
        }
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error(
            fmt::format("Failed to create logger '{}': {}", name, e.what()));
    }
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    global_level_.store(level, std::memory_order_release);
    spdlog::set_level(convertLevel(level));
}

void LogConfig::flushAll() noexcept {
    try {
        spdlog::apply_all(
            [](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to flush loggers: %s\n", e.what());
    }
}

auto LogConfig::convertLevel(LogLevel level) noexcept
    -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERROR:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace pyvault::logging
