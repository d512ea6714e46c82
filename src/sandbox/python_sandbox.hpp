/*
 * python_sandbox.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file python_sandbox.hpp
 * @brief Python Sandbox - Public API
 * @date 2024
 * @version 1.0.0
 *
 * Runs untrusted Python source inside the WebAssembly interpreter with hard
 * bounds on wall-clock time, linear memory and, optionally, instruction
 * count.
 *
 * Guest failures are data, engine failures are errors: code that raises an
 * uncaught exception completes with a nonzero exitCode and its traceback in
 * stderrText, while timeouts, memory exhaustion, fuel exhaustion and setup
 * problems come back as SandboxError. Call parseException() on stderrText
 * to recover the guest's exception.
 */

#ifndef PYVAULT_SANDBOX_PYTHON_SANDBOX_HPP
#define PYVAULT_SANDBOX_PYTHON_SANDBOX_HPP

#include "config.hpp"
#include "engine_handle.hpp"
#include "error.hpp"
#include "execution_pool.hpp"
#include "module_cache.hpp"
#include "types.hpp"

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <optional>
#include <string>

namespace pyvault::sandbox {

namespace detail {
struct SandboxState;
}  // namespace detail

/**
 * @brief How a sandbox obtains its module and where it runs guests
 */
struct SandboxOptions {
    bool useCache{true};                  ///< Resolve the module through a cache
    std::shared_ptr<ModuleCache> cache;   ///< Private cache (default: ModuleCache::global())
    std::shared_ptr<ExecutionPool> pool;  ///< Blocking pool (default: ExecutionPool::global())
};

/**
 * @brief Python execution sandbox
 *
 * Each execute() call gets its own isolated instance, limiter and I/O
 * buffers, so concurrent calls on one sandbox never observe each other.
 */
class PythonSandbox {
public:
    /**
     * @brief Create a sandbox
     * @param config Validated before use
     * @param engine Engine to compile and run with; must have fuel accounting
     *        enabled when config.maxFuel is set
     * @param options Module resolution and thread pool
     */
    [[nodiscard]] static Result<PythonSandbox> create(SandboxConfig config,
                                                      EngineHandle engine,
                                                      SandboxOptions options = {});

    ~PythonSandbox();

    // Disable copy
    PythonSandbox(const PythonSandbox&) = delete;
    PythonSandbox& operator=(const PythonSandbox&) = delete;

    // Enable move
    PythonSandbox(PythonSandbox&&) noexcept;
    PythonSandbox& operator=(PythonSandbox&&) noexcept;

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Execute Python code
     *
     * The returned awaitable owns everything it needs; the sandbox object
     * may be destroyed while it is pending. On timeout the guest run is
     * interrupted and abandoned, never joined.
     *
     * @param code Python source, appended to the configured prelude
     * @param input Stdin payload, ignored when the config carries one
     */
    [[nodiscard]] boost::asio::awaitable<Result<ExecutionResult>> execute(
        std::string code, std::optional<std::string> input = std::nullopt) const;

    /**
     * @brief Execute Python code, blocking the calling thread
     */
    [[nodiscard]] Result<ExecutionResult> executeSync(
        std::string code, std::optional<std::string> input = std::nullopt) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    /// False for a moved-from sandbox; execute() then fails with
    /// ExecutionFailed and the other accessors must not be called.
    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] const SandboxConfig& config() const;

    [[nodiscard]] const EngineHandle& engine() const;

    /// Whether the module was already cached when the sandbox was created.
    [[nodiscard]] bool isUsingCachedModule() const;

private:
    explicit PythonSandbox(std::shared_ptr<const detail::SandboxState> state);

    std::shared_ptr<const detail::SandboxState> state_;
};

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_PYTHON_SANDBOX_HPP
