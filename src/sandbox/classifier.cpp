/*
 * classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "classifier.hpp"

#include "logging/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace pyvault::sandbox {

namespace {

bool chainMentions(const runtime::RunFailure& failure,
                   std::initializer_list<std::string_view> markers) {
    for (const auto& message : failure.messages) {
        std::string lower(message);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        for (const auto marker : markers) {
            if (lower.find(marker) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

bool isInterruptFailure(const runtime::RunFailure& failure) {
    if (failure.trap != runtime::TrapKind::Unavailable) {
        return failure.trap == runtime::TrapKind::Interrupt;
    }

    const bool matched = chainMentions(failure, {"epoch", "interrupt"});
    if (matched) {
        auto logger = logging::LogConfig::getLogger();
        PYVAULT_LOG_WARN(logger,
                         "Trap kind unavailable, classified as interrupt from "
                         "message text: {}",
                         failure.describe());
    }
    return matched;
}

bool isOutOfFuelFailure(const runtime::RunFailure& failure) {
    if (failure.trap != runtime::TrapKind::Unavailable) {
        return failure.trap == runtime::TrapKind::OutOfFuel;
    }

    const bool matched = chainMentions(failure, {"fuel"});
    if (matched) {
        auto logger = logging::LogConfig::getLogger();
        PYVAULT_LOG_WARN(logger,
                         "Trap kind unavailable, classified as fuel exhaustion "
                         "from message text: {}",
                         failure.describe());
    }
    return matched;
}

std::optional<std::uint64_t> fuelConsumed(
    std::optional<std::uint64_t> initialFuel,
    std::optional<std::uint64_t> remaining) noexcept {
    if (!initialFuel) {
        return std::nullopt;
    }
    const auto left = remaining.value_or(0);
    return left >= *initialFuel ? 0 : *initialFuel - left;
}

Result<int> classifyRun(const runtime::RunReport& report,
                        const SandboxLimiter& limiter,
                        std::optional<std::uint64_t> initialFuel,
                        std::chrono::nanoseconds elapsed) {
    if (!report.failure) {
        return 0;
    }
    const auto& failure = *report.failure;

    switch (failure.stage) {
        case runtime::FailureStage::Setup:
            return std::unexpected(SandboxError::runtimeInit(failure.describe()));

        case runtime::FailureStage::FuelSetup:
            return std::unexpected(SandboxError::runtimeInit(
                fmt::format("failed to set fuel: {}", failure.describe())));

        case runtime::FailureStage::Instantiate:
            if (limiter.exceeded()) {
                return std::unexpected(SandboxError::memoryLimitExceeded(
                    fmt::format("memory limit exceeded during instantiation "
                                "(used {} bytes, limit {} bytes)",
                                limiter.currentMemory(), limiter.maxMemory())));
            }
            return std::unexpected(SandboxError::moduleLoad(
                fmt::format("failed to instantiate: {}", failure.describe())));

        case runtime::FailureStage::EntryPoint:
            return std::unexpected(SandboxError::moduleLoad(fmt::format(
                "failed to get _start function: {}", failure.describe())));

        case runtime::FailureStage::Call:
            break;
    }

    if (limiter.exceeded()) {
        return std::unexpected(
            SandboxError::memoryLimitExceeded(limiter.describeExceeded()));
    }
    if (isInterruptFailure(failure)) {
        return std::unexpected(SandboxError::timeout(elapsed));
    }
    if (isOutOfFuelFailure(failure)) {
        return std::unexpected(SandboxError::outOfFuel(
            fuelConsumed(initialFuel, report.fuelRemaining)));
    }
    if (failure.exitStatus) {
        return *failure.exitStatus;
    }
    return std::unexpected(SandboxError::executionFailed(failure.describe()));
}

}  // namespace pyvault::sandbox
