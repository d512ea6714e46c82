/*
 * host_memory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file host_memory.hpp
 * @brief Linear memories allocated by the host under a ResourceLimiter
 * @date 2024
 * @version 1.0.0
 *
 * Wasmtime's C API has no per-store growth callback, so the engine is
 * configured with a host memory creator instead. Every linear memory is a
 * PROT_NONE reservation committed page range by page range, and every
 * commit, the initial one included, is approved by the limiter active on
 * the creating thread.
 */

#ifndef PYVAULT_WASMTIME_HOST_MEMORY_HPP
#define PYVAULT_WASMTIME_HOST_MEMORY_HPP

#include "runtime/engine.hpp"

#include <wasmtime.h>

namespace pyvault::wasmtime {

/**
 * @brief Installs a limiter for memories created on this thread
 *
 * Memories created while the scope is alive keep a pointer to the limiter,
 * so the scope must enclose the whole lifetime of the store.
 */
class ActiveLimiterScope {
public:
    explicit ActiveLimiterScope(runtime::ResourceLimiter& limiter) noexcept;
    ~ActiveLimiterScope();

    ActiveLimiterScope(const ActiveLimiterScope&) = delete;
    ActiveLimiterScope& operator=(const ActiveLimiterScope&) = delete;

    /// Limiter of the innermost scope on this thread, or nullptr.
    [[nodiscard]] static runtime::ResourceLimiter* current() noexcept;

private:
    runtime::ResourceLimiter* previous_;
};

/**
 * @brief Creator to pass to wasmtime_config_host_memory_creator_set()
 */
[[nodiscard]] wasmtime_memory_creator_t makeLimitedMemoryCreator() noexcept;

}  // namespace pyvault::wasmtime

#endif  // PYVAULT_WASMTIME_HOST_MEMORY_HPP
