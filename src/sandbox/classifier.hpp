/*
 * classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file classifier.hpp
 * @brief Mapping of engine run failures onto SandboxError
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_SANDBOX_CLASSIFIER_HPP
#define PYVAULT_SANDBOX_CLASSIFIER_HPP

#include "error.hpp"
#include "limiter.hpp"
#include "runtime/engine.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace pyvault::sandbox {

/**
 * @brief Whether @p failure is an interrupt-counter trap
 *
 * Decided by the trap kind. Only when the backend reports the kind as
 * Unavailable is the message chain searched for "epoch"/"interrupt"; that
 * fallback logs a warning every time it is used.
 */
[[nodiscard]] bool isInterruptFailure(const runtime::RunFailure& failure);

/**
 * @brief Whether @p failure is an instruction budget exhaustion
 */
[[nodiscard]] bool isOutOfFuelFailure(const runtime::RunFailure& failure);

/**
 * @brief Instructions consumed from @p initialFuel
 * @return nullopt when no budget was configured
 */
[[nodiscard]] std::optional<std::uint64_t> fuelConsumed(
    std::optional<std::uint64_t> initialFuel,
    std::optional<std::uint64_t> remaining) noexcept;

/**
 * @brief Classify the outcome of one run
 *
 * For failures of the entry point call the checks run in this order, first
 * match wins: limiter exceeded, interrupt trap, fuel exhaustion, guest exit
 * request, anything else.
 *
 * @return The guest exit code (0 when the entry point returned), or the error
 */
[[nodiscard]] Result<int> classifyRun(const runtime::RunReport& report,
                                      const SandboxLimiter& limiter,
                                      std::optional<std::uint64_t> initialFuel,
                                      std::chrono::nanoseconds elapsed);

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_CLASSIFIER_HPP
