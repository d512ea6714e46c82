/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

namespace pyvault::sandbox {

using json = nlohmann::json;

namespace {

// Unsigned integer under @p key, nullopt when absent or null.
Result<std::optional<std::uint64_t>> readUnsigned(const json& object,
                                                  const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<std::uint64_t>{};
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(SandboxError::config(
            fmt::format("'{}' must be a non-negative integer", key)));
    }
    return std::optional{it->get<std::uint64_t>()};
}

Result<std::optional<std::string>> readString(const json& object,
                                              const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(
            SandboxError::config(fmt::format("'{}' must be a string", key)));
    }
    return std::optional{it->get<std::string>()};
}

Result<std::vector<std::pair<std::string, std::string>>> readEnv(
    const json& object) {
    std::vector<std::pair<std::string, std::string>> vars;
    const auto it = object.find("env");
    if (it == object.end() || it->is_null()) {
        return vars;
    }
    if (!it->is_array()) {
        return std::unexpected(SandboxError::config(
            "'env' must be an array of [key, value] pairs"));
    }
    for (const auto& entry : *it) {
        if (!entry.is_array() || entry.size() != 2 || !entry[0].is_string() ||
            !entry[1].is_string()) {
            return std::unexpected(SandboxError::config(
                fmt::format("invalid 'env' entry: {}", entry.dump())));
        }
        vars.emplace_back(entry[0].get<std::string>(),
                          entry[1].get<std::string>());
    }
    return vars;
}

}  // namespace

// ============================================================================
// SandboxConfig
// ============================================================================

SandboxConfigBuilder SandboxConfig::builder() { return SandboxConfigBuilder{}; }

Result<void> SandboxConfig::validate() const {
    if (timeout.count() <= 0) {
        return std::unexpected(
            SandboxError::config("timeout must be greater than zero"));
    }
    if (maxMemory == 0) {
        return std::unexpected(
            SandboxError::config("max_memory must be greater than zero"));
    }
    if (epochTickInterval.count() <= 0) {
        return std::unexpected(SandboxError::config(
            "epoch_tick_interval must be greater than zero"));
    }
    if (interpreterPath.empty()) {
        return std::unexpected(
            SandboxError::config("interpreter_path must not be empty"));
    }
    return {};
}

json SandboxConfig::toJson() const {
    json env = json::array();
    for (const auto& [key, value] : envVars) {
        env.push_back(json::array({key, value}));
    }

    json object = {
        {"timeout_ms", timeout.count()},
        {"max_memory", maxMemory},
        {"max_fuel", nullptr},
        {"interpreter_path", interpreterPath.string()},
        {"epoch_tick_interval_ms", epochTickInterval.count()},
        {"stdin", nullptr},
        {"env", std::move(env)},
        {"prelude", nullptr},
    };
    if (maxFuel) {
        object["max_fuel"] = *maxFuel;
    }
    if (stdinData) {
        object["stdin"] = *stdinData;
    }
    if (prelude) {
        object["prelude"] = *prelude;
    }
    return object;
}

Result<SandboxConfig> SandboxConfig::fromJson(const json& object) {
    if (!object.is_object()) {
        return std::unexpected(
            SandboxError::config("configuration must be a JSON object"));
    }

    SandboxConfig config;

    auto timeoutMs = readUnsigned(object, "timeout_ms");
    if (!timeoutMs) {
        return std::unexpected(timeoutMs.error());
    }
    if (*timeoutMs) {
        config.timeout = std::chrono::milliseconds(**timeoutMs);
    }

    auto maxMemory = readUnsigned(object, "max_memory");
    if (!maxMemory) {
        return std::unexpected(maxMemory.error());
    }
    if (*maxMemory) {
        config.maxMemory = **maxMemory;
    }

    auto maxFuel = readUnsigned(object, "max_fuel");
    if (!maxFuel) {
        return std::unexpected(maxFuel.error());
    }
    config.maxFuel = *maxFuel;

    auto interpreterPath = readString(object, "interpreter_path");
    if (!interpreterPath) {
        return std::unexpected(interpreterPath.error());
    }
    if (*interpreterPath) {
        config.interpreterPath = **interpreterPath;
    }

    auto tickMs = readUnsigned(object, "epoch_tick_interval_ms");
    if (!tickMs) {
        return std::unexpected(tickMs.error());
    }
    if (*tickMs) {
        config.epochTickInterval = std::chrono::milliseconds(**tickMs);
    }

    auto stdinData = readString(object, "stdin");
    if (!stdinData) {
        return std::unexpected(stdinData.error());
    }
    config.stdinData = std::move(*stdinData);

    auto env = readEnv(object);
    if (!env) {
        return std::unexpected(env.error());
    }
    config.envVars = std::move(*env);

    auto prelude = readString(object, "prelude");
    if (!prelude) {
        return std::unexpected(prelude.error());
    }
    config.prelude = std::move(*prelude);

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

// ============================================================================
// SandboxConfigBuilder
// ============================================================================

SandboxConfigBuilder& SandboxConfigBuilder::timeout(
    std::chrono::milliseconds value) {
    config_.timeout = value;
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::maxMemory(std::uint64_t bytes) {
    config_.maxMemory = bytes;
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::maxFuel(std::uint64_t fuel) {
    config_.maxFuel = fuel;
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::interpreterPath(
    std::filesystem::path path) {
    config_.interpreterPath = std::move(path);
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::epochTickInterval(
    std::chrono::milliseconds interval) {
    config_.epochTickInterval = interval;
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::stdinData(std::string data) {
    config_.stdinData = std::move(data);
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::env(std::string key,
                                                std::string value) {
    config_.envVars.emplace_back(std::move(key), std::move(value));
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::envs(
    std::vector<std::pair<std::string, std::string>> vars) {
    for (auto& var : vars) {
        config_.envVars.push_back(std::move(var));
    }
    return *this;
}

SandboxConfigBuilder& SandboxConfigBuilder::prelude(std::string code) {
    config_.prelude = std::move(code);
    return *this;
}

Result<SandboxConfig> SandboxConfigBuilder::tryBuild() const {
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config_;
}

// ============================================================================
// Files and discovery
// ============================================================================

Result<SandboxConfig> loadConfigFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return std::unexpected(SandboxError::io(
                ec, fmt::format("cannot access {}: {}", path.string(),
                                ec.message())));
        }
        return std::unexpected(SandboxError::config(
            fmt::format("configuration file not found: {}", path.string())));
    }

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(SandboxError::io(
            std::make_error_code(std::errc::io_error),
            fmt::format("cannot open {}", path.string())));
    }

    json object;
    try {
        object = json::parse(file);
    } catch (const json::parse_error& e) {
        return std::unexpected(SandboxError::config(
            fmt::format("invalid JSON in {}: {}", path.string(), e.what())));
    }
    return SandboxConfig::fromJson(object);
}

std::optional<std::filesystem::path> findInterpreter() {
    std::vector<std::filesystem::path> searchPaths;
    if (const char* fromEnv = std::getenv(kInterpreterPathEnv);
        fromEnv != nullptr && *fromEnv != '\0') {
        searchPaths.emplace_back(fromEnv);
    }
    searchPaths.emplace_back(kDefaultInterpreterPath);
    searchPaths.emplace_back("/usr/local/share/pyvault/rustpython.wasm");
    searchPaths.emplace_back("/usr/share/pyvault/rustpython.wasm");

    for (const auto& path : searchPaths) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

}  // namespace pyvault::sandbox
