/*
 * wasmtime_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file wasmtime_engine.hpp
 * @brief runtime::Engine implemented over the Wasmtime C API
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_WASMTIME_WASMTIME_ENGINE_HPP
#define PYVAULT_WASMTIME_WASMTIME_ENGINE_HPP

#include "runtime/engine.hpp"

#include <wasmtime.h>

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace pyvault::wasmtime {

/**
 * @brief Compiled Wasmtime module
 */
class WasmtimeModule final : public runtime::Module {
public:
    explicit WasmtimeModule(wasmtime_module_t* module) noexcept
        : module_(module) {}
    ~WasmtimeModule() override;

    WasmtimeModule(const WasmtimeModule&) = delete;
    WasmtimeModule& operator=(const WasmtimeModule&) = delete;

    [[nodiscard]] const wasmtime_module_t* get() const noexcept { return module_; }

private:
    wasmtime_module_t* module_;
};

/**
 * @brief Wasmtime engine with epoch interruption always on
 *
 * Each run() gets a fresh store with its own WASI context: argv and env from
 * the invocation, stdin from the provided bytes, stdout and stderr captured
 * through private temporary files, no preopened directories and no sockets.
 * The epoch deadline is one tick ahead; at each tick the store asks the
 * run's RunControl whether to trap or to continue for one more tick.
 */
class WasmtimeEngine final : public runtime::Engine {
public:
    /**
     * @brief Create an engine
     * @param consumeFuel Enable instruction budget accounting
     * @return The engine, or Wasmtime's error text
     */
    [[nodiscard]] static std::expected<std::shared_ptr<WasmtimeEngine>, std::string>
    create(bool consumeFuel);

    ~WasmtimeEngine() override;

    WasmtimeEngine(const WasmtimeEngine&) = delete;
    WasmtimeEngine& operator=(const WasmtimeEngine&) = delete;

    [[nodiscard]] bool fuelEnabled() const noexcept override { return fuel_; }

    void incrementEpoch() noexcept override;

    [[nodiscard]] runtime::CompileResult compile(
        std::span<const std::uint8_t> bytes) override;

    [[nodiscard]] runtime::RunReport run(const runtime::Module& module,
                                         const runtime::GuestInvocation& invocation,
                                         runtime::GuestIo& io,
                                         runtime::ResourceLimiter& limiter,
                                         runtime::RunControl& control) override;

private:
    WasmtimeEngine(wasm_engine_t* engine, bool fuel) noexcept
        : engine_(engine), fuel_(fuel) {}

    wasm_engine_t* engine_;
    bool fuel_;
};

/**
 * @brief Text of a Wasmtime error, without consuming it
 */
[[nodiscard]] std::string errorMessage(const wasmtime_error_t* error);

/**
 * @brief Text of a trap, without consuming it
 */
[[nodiscard]] std::string trapMessage(const wasm_trap_t* trap);

}  // namespace pyvault::wasmtime

#endif  // PYVAULT_WASMTIME_WASMTIME_ENGINE_HPP
