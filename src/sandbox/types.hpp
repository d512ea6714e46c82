/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Python sandbox result type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_SANDBOX_TYPES_HPP
#define PYVAULT_SANDBOX_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pyvault::sandbox {

/**
 * @brief Measurements taken during one execution
 */
struct ExecutionMetadata {
    std::chrono::nanoseconds duration{0};   ///< Wall-clock execution time
    std::size_t peakMemoryBytes{0};         ///< Highest linear memory granted
    std::optional<std::uint64_t> fuelConsumed;  ///< Set when a budget was configured
    bool usedCachedModule{false};           ///< Module came from a cache hit

    [[nodiscard]] static ExecutionMetadata empty() noexcept {
        return ExecutionMetadata{};
    }
};

/**
 * @brief Result of a completed execution
 *
 * A guest that raised an uncaught exception still produces a result, with a
 * nonzero exit code and the traceback in stderrText.
 */
struct ExecutionResult {
    std::string stdoutText;             ///< Captured stdout, lossily decoded
    std::string stderrText;             ///< Captured stderr, lossily decoded
    int exitCode{0};                    ///< Guest exit code
    ExecutionMetadata metadata;

    [[nodiscard]] bool isSuccess() const noexcept { return exitCode == 0; }
};

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_TYPES_HPP
