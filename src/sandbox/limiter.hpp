/*
 * limiter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef PYVAULT_SANDBOX_LIMITER_HPP
#define PYVAULT_SANDBOX_LIMITER_HPP

#include "runtime/engine.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace pyvault::sandbox {

/// Table-element ceiling, a backstop rather than a tuning knob.
inline constexpr std::uint64_t kDefaultMaxTableElements = 10000;

/**
 * @brief Per-execution memory and table growth policy
 *
 * The only enforcement point of the memory ceiling. Once a growth has been
 * denied, exceeded() stays true for the lifetime of the limiter. All readers
 * are safe to call from other threads while the guest runs.
 */
class SandboxLimiter final : public runtime::ResourceLimiter {
public:
    explicit SandboxLimiter(
        std::uint64_t maxMemory,
        std::uint64_t maxTableElements = kDefaultMaxTableElements) noexcept;

    /**
     * @brief Approve or deny linear memory growth to @p desired bytes
     *
     * The module's own declared maximum is not consulted; the engine enforces
     * it separately.
     */
    bool memoryGrowing(std::uint64_t current, std::uint64_t desired,
                       std::optional<std::uint64_t> maximum) override;

    bool tableGrowing(std::uint64_t current, std::uint64_t desired,
                      std::optional<std::uint64_t> maximum) override;

    [[nodiscard]] std::uint64_t tableElementLimit() const override {
        return maxTableElements_;
    }

    [[nodiscard]] bool exceeded() const noexcept {
        return exceeded_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint64_t currentMemory() const noexcept {
        return currentMemory_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint64_t peakMemory() const noexcept {
        return peakMemory_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint64_t maxMemory() const noexcept { return maxMemory_; }

    /// "memory limit exceeded during execution (used X bytes, ...)"
    [[nodiscard]] std::string describeExceeded() const;

private:
    const std::uint64_t maxMemory_;
    const std::uint64_t maxTableElements_;
    std::atomic<std::uint64_t> currentMemory_{0};
    std::atomic<std::uint64_t> peakMemory_{0};
    std::atomic<bool> exceeded_{false};
};

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_LIMITER_HPP
