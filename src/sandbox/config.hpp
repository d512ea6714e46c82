/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file config.hpp
 * @brief Sandbox configuration, its builder and JSON representation
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_SANDBOX_CONFIG_HPP
#define PYVAULT_SANDBOX_CONFIG_HPP

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pyvault::sandbox {

inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};
inline constexpr std::uint64_t kDefaultMaxMemory = 64ULL * 1024 * 1024;
inline constexpr std::chrono::milliseconds kDefaultEpochTickInterval{10};
inline constexpr const char* kDefaultInterpreterPath = "assets/rustpython.wasm";

/// Environment variable naming the interpreter artifact for findInterpreter().
inline constexpr const char* kInterpreterPathEnv = "PYVAULT_INTERPRETER_PATH";

class SandboxConfigBuilder;

/**
 * @brief Configuration of one sandbox
 *
 * Treated as an immutable value once a sandbox has been created from it.
 */
struct SandboxConfig {
    std::chrono::milliseconds timeout{kDefaultTimeout};  ///< Wall-clock limit
    std::uint64_t maxMemory{kDefaultMaxMemory};          ///< Linear memory ceiling in bytes
    std::optional<std::uint64_t> maxFuel;                ///< Instruction budget (none = unlimited)
    std::filesystem::path interpreterPath{kDefaultInterpreterPath};
    std::chrono::milliseconds epochTickInterval{kDefaultEpochTickInterval};
    std::optional<std::string> stdinData;                ///< Takes precedence over per-call input
    std::vector<std::pair<std::string, std::string>> envVars;  ///< Ordered, duplicates kept
    std::optional<std::string> prelude;                  ///< Prepended to every snippet

    [[nodiscard]] static SandboxConfigBuilder builder();

    /**
     * @brief Check the invariants
     * @return Config error naming the first violated constraint
     */
    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Read a configuration from JSON
     *
     * Missing keys take their defaults and unknown keys are ignored.
     */
    [[nodiscard]] static Result<SandboxConfig> fromJson(const nlohmann::json& json);
};

/**
 * @brief Accumulating builder for SandboxConfig
 */
class SandboxConfigBuilder {
public:
    SandboxConfigBuilder& timeout(std::chrono::milliseconds value);
    SandboxConfigBuilder& maxMemory(std::uint64_t bytes);
    SandboxConfigBuilder& maxFuel(std::uint64_t fuel);
    SandboxConfigBuilder& interpreterPath(std::filesystem::path path);
    SandboxConfigBuilder& epochTickInterval(std::chrono::milliseconds interval);
    SandboxConfigBuilder& stdinData(std::string data);
    SandboxConfigBuilder& env(std::string key, std::string value);
    SandboxConfigBuilder& envs(
        std::vector<std::pair<std::string, std::string>> vars);
    SandboxConfigBuilder& prelude(std::string code);

    /// The accumulated configuration, not validated.
    [[nodiscard]] SandboxConfig build() const { return config_; }

    /// The accumulated configuration after validate().
    [[nodiscard]] Result<SandboxConfig> tryBuild() const;

private:
    SandboxConfig config_;
};

/**
 * @brief Load a configuration from a JSON file
 */
[[nodiscard]] Result<SandboxConfig> loadConfigFile(
    const std::filesystem::path& path);

/**
 * @brief Locate the interpreter artifact
 *
 * Checks the PYVAULT_INTERPRETER_PATH environment variable, the default
 * relative path, then the system share directories.
 */
[[nodiscard]] std::optional<std::filesystem::path> findInterpreter();

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_CONFIG_HPP
