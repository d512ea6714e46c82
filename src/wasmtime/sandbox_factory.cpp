/*
 * sandbox_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_factory.hpp"

#include "logging/log_config.hpp"
#include "wasmtime_engine.hpp"

#include <mutex>
#include <optional>

#include <fmt/format.h>

namespace pyvault::wasmtime {

using sandbox::EngineHandle;
using sandbox::PythonSandbox;
using sandbox::Result;
using sandbox::SandboxConfig;
using sandbox::SandboxError;

namespace {

std::filesystem::path defaultInterpreter() {
    return sandbox::findInterpreter().value_or(sandbox::kDefaultInterpreterPath);
}

}  // namespace

Result<EngineHandle> SandboxFactory::createEngine(bool consumeFuel) {
    auto engine = WasmtimeEngine::create(consumeFuel);
    if (!engine) {
        auto logger = logging::LogConfig::getLogger();
        PYVAULT_LOG_ERROR(logger, "Failed to create Wasmtime engine: {}",
                          engine.error());
        return std::unexpected(SandboxError::runtimeInit(
            fmt::format("failed to create engine: {}", engine.error())));
    }
    return EngineHandle::fromEngine(std::move(*engine));
}

Result<EngineHandle> SandboxFactory::sharedEngine(bool consumeFuel) {
    static std::mutex mutex;
    static std::optional<EngineHandle> withFuel;
    static std::optional<EngineHandle> withoutFuel;

    std::lock_guard lock(mutex);
    auto& slot = consumeFuel ? withFuel : withoutFuel;
    if (!slot) {
        auto engine = createEngine(consumeFuel);
        if (!engine) {
            return std::unexpected(engine.error());
        }
        slot = std::move(*engine);
    }
    return *slot;
}

Result<PythonSandbox> SandboxFactory::create(SandboxConfig config,
                                             sandbox::SandboxOptions options) {
    auto engine = sharedEngine(config.maxFuel.has_value());
    if (!engine) {
        return std::unexpected(engine.error());
    }
    return PythonSandbox::create(std::move(config), std::move(*engine),
                                 std::move(options));
}

Result<PythonSandbox> SandboxFactory::createQuick() { return create(quickConfig()); }

Result<PythonSandbox> SandboxFactory::createSecure() {
    return create(secureConfig());
}

Result<PythonSandbox> SandboxFactory::createComputeHeavy() {
    return create(computeHeavyConfig());
}

SandboxConfig SandboxFactory::quickConfig() {
    return SandboxConfig::builder()
        .interpreterPath(defaultInterpreter())
        .timeout(std::chrono::seconds{5})
        .maxMemory(32ULL * 1024 * 1024)
        .build();
}

SandboxConfig SandboxFactory::secureConfig() {
    return SandboxConfig::builder()
        .interpreterPath(defaultInterpreter())
        .timeout(std::chrono::seconds{10})
        .maxMemory(32ULL * 1024 * 1024)
        .maxFuel(10'000'000'000ULL)
        .epochTickInterval(std::chrono::milliseconds{5})
        .build();
}

SandboxConfig SandboxFactory::computeHeavyConfig() {
    return SandboxConfig::builder()
        .interpreterPath(defaultInterpreter())
        .timeout(std::chrono::seconds{300})
        .maxMemory(512ULL * 1024 * 1024)
        .epochTickInterval(std::chrono::milliseconds{50})
        .build();
}

}  // namespace pyvault::wasmtime
