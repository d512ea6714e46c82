/*
 * engine_handle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file engine_handle.hpp
 * @brief Shareable reference to a configured execution engine
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_SANDBOX_ENGINE_HANDLE_HPP
#define PYVAULT_SANDBOX_ENGINE_HANDLE_HPP

#include "error.hpp"
#include "runtime/engine.hpp"

#include <cstdint>
#include <memory>
#include <utility>

namespace pyvault::sandbox {

/**
 * @brief Reference-counted handle to a runtime::Engine
 *
 * Copies share the engine; the last copy to go releases it. Every engine
 * wrapped by a handle runs with interrupt-counter checks enabled. Compiled
 * modules belong to the engine that compiled them, so each live engine has
 * one process-unique id, shared by every handle that wraps it, that the
 * module cache keys on.
 */
class EngineHandle {
public:
    /**
     * @brief Wrap an engine
     * @return RuntimeInit error if @p engine is null
     */
    [[nodiscard]] static Result<EngineHandle> fromEngine(
        std::shared_ptr<runtime::Engine> engine);

    [[nodiscard]] bool fuelEnabled() const noexcept {
        return engine_->fuelEnabled();
    }

    void incrementEpoch() const noexcept { engine_->incrementEpoch(); }

    [[nodiscard]] runtime::Engine& engine() const noexcept { return *engine_; }

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

    [[nodiscard]] bool sharesEngineWith(const EngineHandle& other) const noexcept {
        return engine_ == other.engine_;
    }

    [[nodiscard]] long useCount() const noexcept { return engine_.use_count(); }

private:
    EngineHandle(std::shared_ptr<runtime::Engine> engine, std::uint64_t id)
        : engine_(std::move(engine)), id_(id) {}

    std::shared_ptr<runtime::Engine> engine_;
    std::uint64_t id_;
};

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_ENGINE_HANDLE_HPP
