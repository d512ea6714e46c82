/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file engine.hpp
 * @brief Virtual machine capability consumed by the sandbox
 * @date 2024
 * @version 1.0.0
 *
 * The sandbox never talks to a WebAssembly runtime directly. It compiles,
 * instantiates and runs guest modules through the Engine interface below,
 * which reports every failure as a structured RunFailure instead of throwing.
 */

#ifndef PYVAULT_RUNTIME_ENGINE_HPP
#define PYVAULT_RUNTIME_ENGINE_HPP

#include "guest_io.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyvault::runtime {

/**
 * @brief Growth policy consulted before linear memory or a table grows
 *
 * Returning false denies the growth. The engine must surface a denial to the
 * guest as a failed grow, never by silently truncating.
 */
class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;

    virtual bool memoryGrowing(std::uint64_t current, std::uint64_t desired,
                               std::optional<std::uint64_t> maximum) = 0;

    virtual bool tableGrowing(std::uint64_t current, std::uint64_t desired,
                              std::optional<std::uint64_t> maximum) = 0;

    /// Static table ceiling for engines that cannot call tableGrowing().
    [[nodiscard]] virtual std::uint64_t tableElementLimit() const = 0;
};

/**
 * @brief Kind of trap reported by the engine
 */
enum class TrapKind {
    None,         ///< The failure is not a trap (host error, exit request)
    Interrupt,    ///< Interrupt-counter deadline reached
    OutOfFuel,    ///< Instruction budget exhausted
    Other,        ///< Any other well-identified trap
    Unavailable   ///< The engine could not tell which trap occurred
};

[[nodiscard]] constexpr std::string_view trapKindToString(TrapKind kind) noexcept {
    switch (kind) {
        case TrapKind::None: return "None";
        case TrapKind::Interrupt: return "Interrupt";
        case TrapKind::OutOfFuel: return "OutOfFuel";
        case TrapKind::Other: return "Other";
        case TrapKind::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

/**
 * @brief Phase of a run in which a failure occurred
 */
enum class FailureStage {
    Setup,        ///< Building the isolated context or linking host functions
    FuelSetup,    ///< Charging the instruction budget into the context
    Instantiate,  ///< Instantiating the module
    EntryPoint,   ///< Locating the entry point export
    Call          ///< Running the entry point
};

/**
 * @brief Structured description of a failed run
 */
struct RunFailure {
    FailureStage stage{FailureStage::Call};
    TrapKind trap{TrapKind::None};
    std::optional<int> exitStatus;      ///< Set for a clean guest exit request
    std::vector<std::string> messages;  ///< Error chain, outermost first

    /// The message chain joined with ": ".
    [[nodiscard]] std::string describe() const {
        std::string text;
        for (const auto& message : messages) {
            if (!text.empty()) {
                text += ": ";
            }
            text += message;
        }
        return text;
    }
};

/**
 * @brief What the guest sees of the host
 */
struct GuestInvocation {
    std::vector<std::string> argv;
    std::vector<std::pair<std::string, std::string>> env;
    std::optional<std::uint64_t> fuel;  ///< Instruction budget to charge
};

/**
 * @brief Cancellation state shared between the orchestrator and one run
 *
 * The engine consults shouldInterrupt() at every interrupt-counter safepoint.
 * A control starts without a deadline; the run arms one when it actually
 * begins executing.
 */
class RunControl {
public:
    using Clock = std::chrono::steady_clock;

    RunControl() = default;

    explicit RunControl(Clock::time_point deadline) { setDeadline(deadline); }

    void setDeadline(Clock::time_point deadline) noexcept {
        deadline_.store(deadline.time_since_epoch().count(),
                        std::memory_order_release);
    }

    void requestInterrupt() noexcept {
        interruptRequested_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool interruptRequested() const noexcept {
        return interruptRequested_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool shouldInterrupt() const noexcept {
        return interruptRequested() || Clock::now() >= deadline();
    }

    [[nodiscard]] Clock::time_point deadline() const noexcept {
        return Clock::time_point(
            Clock::duration(deadline_.load(std::memory_order_acquire)));
    }

private:
    std::atomic<Clock::rep> deadline_{
        Clock::time_point::max().time_since_epoch().count()};
    std::atomic<bool> interruptRequested_{false};
};

/**
 * @brief Outcome of Engine::run
 */
struct RunReport {
    std::optional<RunFailure> failure;  ///< nullopt when the entry point returned
    std::optional<std::uint64_t> fuelRemaining;
};

/**
 * @brief A compiled, immutable module artifact
 */
class Module {
public:
    virtual ~Module() = default;
};

using CompileResult = std::expected<std::shared_ptr<const Module>, std::string>;

/**
 * @brief Compilation and execution context
 *
 * Implementations must be safe for concurrent compile(), run() and
 * incrementEpoch() calls. One run() owns its limiter, control and I/O.
 */
class Engine {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual bool fuelEnabled() const noexcept = 0;

    /**
     * @brief Advance the interrupt counter
     *
     * Every running guest reaches a safepoint at which the engine asks its
     * RunControl whether to trap.
     */
    virtual void incrementEpoch() noexcept = 0;

    /**
     * @brief Compile module bytes
     * @return The module, or the engine's error text
     */
    [[nodiscard]] virtual CompileResult compile(
        std::span<const std::uint8_t> bytes) = 0;

    /**
     * @brief Instantiate @p module in a fresh isolated context and run its
     *        entry point to completion
     */
    [[nodiscard]] virtual RunReport run(const Module& module,
                                        const GuestInvocation& invocation,
                                        GuestIo& io, ResourceLimiter& limiter,
                                        RunControl& control) = 0;
};

}  // namespace pyvault::runtime

#endif  // PYVAULT_RUNTIME_ENGINE_HPP
