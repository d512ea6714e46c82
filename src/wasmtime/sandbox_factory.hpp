/*
 * sandbox_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox_factory.hpp
 * @brief Construction of Wasmtime-backed sandboxes
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_WASMTIME_SANDBOX_FACTORY_HPP
#define PYVAULT_WASMTIME_SANDBOX_FACTORY_HPP

#include "sandbox/config.hpp"
#include "sandbox/engine_handle.hpp"
#include "sandbox/error.hpp"
#include "sandbox/python_sandbox.hpp"

namespace pyvault::wasmtime {

/**
 * @brief Factory for Wasmtime-backed sandboxes
 */
class SandboxFactory {
public:
    /**
     * @brief Creates a new, unshared engine
     * @param consumeFuel Enable instruction budget accounting
     */
    [[nodiscard]] static sandbox::Result<sandbox::EngineHandle> createEngine(
        bool consumeFuel);

    /**
     * @brief Process-wide engine for the given fuel requirement, created on
     *        first use
     */
    [[nodiscard]] static sandbox::Result<sandbox::EngineHandle> sharedEngine(
        bool consumeFuel);

    /**
     * @brief Creates a sandbox on the shared engine matching the config
     */
    [[nodiscard]] static sandbox::Result<sandbox::PythonSandbox> create(
        sandbox::SandboxConfig config = {}, sandbox::SandboxOptions options = {});

    /**
     * @brief Creates a sandbox for short snippets
     */
    [[nodiscard]] static sandbox::Result<sandbox::PythonSandbox> createQuick();

    /**
     * @brief Creates a sandbox with tight limits and an instruction budget
     */
    [[nodiscard]] static sandbox::Result<sandbox::PythonSandbox> createSecure();

    /**
     * @brief Creates a sandbox for long-running computations
     */
    [[nodiscard]] static sandbox::Result<sandbox::PythonSandbox> createComputeHeavy();

    [[nodiscard]] static sandbox::SandboxConfig quickConfig();
    [[nodiscard]] static sandbox::SandboxConfig secureConfig();
    [[nodiscard]] static sandbox::SandboxConfig computeHeavyConfig();
};

}  // namespace pyvault::wasmtime

#endif  // PYVAULT_WASMTIME_SANDBOX_FACTORY_HPP
