/*
 * limiter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "limiter.hpp"

#include <fmt/format.h>

namespace pyvault::sandbox {

SandboxLimiter::SandboxLimiter(std::uint64_t maxMemory,
                               std::uint64_t maxTableElements) noexcept
    : maxMemory_(maxMemory), maxTableElements_(maxTableElements) {}

bool SandboxLimiter::memoryGrowing(std::uint64_t /*current*/,
                                   std::uint64_t desired,
                                   std::optional<std::uint64_t> /*maximum*/) {
    if (desired > maxMemory_) {
        exceeded_.store(true, std::memory_order_release);
        return false;
    }

    currentMemory_.store(desired, std::memory_order_release);
    auto peak = peakMemory_.load(std::memory_order_relaxed);
    while (desired > peak &&
           !peakMemory_.compare_exchange_weak(peak, desired,
                                              std::memory_order_acq_rel)) {
    }
    return true;
}

bool SandboxLimiter::tableGrowing(std::uint64_t /*current*/,
                                  std::uint64_t desired,
                                  std::optional<std::uint64_t> /*maximum*/) {
    if (desired > maxTableElements_) {
        exceeded_.store(true, std::memory_order_release);
        return false;
    }
    return true;
}

std::string SandboxLimiter::describeExceeded() const {
    return fmt::format(
        "memory limit exceeded during execution (used {} bytes, peak {} bytes, "
        "limit {} bytes)",
        currentMemory(), peakMemory(), maxMemory_);
}

}  // namespace pyvault::sandbox
