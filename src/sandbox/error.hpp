/*
 * error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file error.hpp
 * @brief Sandbox error taxonomy
 * @date 2024
 * @version 1.0.0
 *
 * Failures fall in four classes:
 * - resource-policy violations (Timeout, MemoryLimitExceeded, OutOfFuel)
 * - setup failures (RuntimeInit, ModuleLoad, InterpreterNotFound, Io, Config)
 * - ExecutionFailed, carrying the raw engine message
 * - PythonException, produced only by parsing guest stderr on request
 *
 * A guest that exits nonzero is not an error: execute() returns a result
 * with a nonzero exit code. Callers that want the guest's exception call
 * parseException() on the captured stderr.
 */

#ifndef PYVAULT_SANDBOX_ERROR_HPP
#define PYVAULT_SANDBOX_ERROR_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace pyvault::sandbox {

/**
 * @brief Discriminator of SandboxError
 */
enum class SandboxErrorKind {
    Timeout,
    MemoryLimitExceeded,
    RuntimeInit,
    ModuleLoad,
    ExecutionFailed,
    PythonException,
    Io,
    Config,
    InterpreterNotFound,
    OutOfFuel
};

/**
 * @brief Get string representation of SandboxErrorKind
 */
[[nodiscard]] constexpr std::string_view sandboxErrorKindToString(
    SandboxErrorKind kind) noexcept {
    switch (kind) {
        case SandboxErrorKind::Timeout: return "Timeout";
        case SandboxErrorKind::MemoryLimitExceeded: return "MemoryLimitExceeded";
        case SandboxErrorKind::RuntimeInit: return "RuntimeInit";
        case SandboxErrorKind::ModuleLoad: return "ModuleLoad";
        case SandboxErrorKind::ExecutionFailed: return "ExecutionFailed";
        case SandboxErrorKind::PythonException: return "PythonException";
        case SandboxErrorKind::Io: return "Io";
        case SandboxErrorKind::Config: return "Config";
        case SandboxErrorKind::InterpreterNotFound: return "InterpreterNotFound";
        case SandboxErrorKind::OutOfFuel: return "OutOfFuel";
    }
    return "Unknown";
}

/**
 * @brief Tagged union describing one sandbox failure
 */
class SandboxError {
public:
    struct Timeout {
        std::chrono::nanoseconds duration{0};
    };
    struct MemoryLimitExceeded {
        std::string detail;
    };
    struct RuntimeInit {
        std::string cause;
    };
    struct ModuleLoad {
        std::string cause;
    };
    struct ExecutionFailed {
        std::string detail;
    };
    struct PythonException {
        std::string exceptionType;  ///< e.g. "ValueError"
        std::string message;
        std::optional<std::string> traceback;
    };
    struct Io {
        std::error_code code;
        std::string cause;
    };
    struct Config {
        std::string detail;
    };
    struct InterpreterNotFound {
        std::string path;
    };
    struct OutOfFuel {
        std::optional<std::uint64_t> consumed;
    };

    using Variant =
        std::variant<Timeout, MemoryLimitExceeded, RuntimeInit, ModuleLoad,
                     ExecutionFailed, PythonException, Io, Config,
                     InterpreterNotFound, OutOfFuel>;

    SandboxError(Variant value) : value_(std::move(value)) {}

    // Factories
    [[nodiscard]] static SandboxError timeout(std::chrono::nanoseconds duration);
    [[nodiscard]] static SandboxError memoryLimitExceeded(std::string detail);
    [[nodiscard]] static SandboxError runtimeInit(std::string cause);
    [[nodiscard]] static SandboxError moduleLoad(std::string cause);
    [[nodiscard]] static SandboxError executionFailed(std::string detail);
    [[nodiscard]] static SandboxError pythonException(
        std::string exceptionType, std::string message,
        std::optional<std::string> traceback = std::nullopt);
    [[nodiscard]] static SandboxError io(std::error_code code,
                                         std::string cause = {});
    [[nodiscard]] static SandboxError config(std::string detail);
    [[nodiscard]] static SandboxError interpreterNotFound(std::string path);
    [[nodiscard]] static SandboxError outOfFuel(
        std::optional<std::uint64_t> consumed);

    /**
     * @brief Parse a guest exception out of captured stderr
     * @return A PythonException error, or nullopt if nothing looks like one
     */
    [[nodiscard]] static std::optional<SandboxError> fromPythonStderr(
        std::string_view stderrText);

    [[nodiscard]] SandboxErrorKind kind() const noexcept {
        return static_cast<SandboxErrorKind>(value_.index());
    }

    [[nodiscard]] bool isTimeout() const noexcept {
        return kind() == SandboxErrorKind::Timeout;
    }
    [[nodiscard]] bool isMemoryLimit() const noexcept {
        return kind() == SandboxErrorKind::MemoryLimitExceeded;
    }
    [[nodiscard]] bool isPythonException() const noexcept {
        return kind() == SandboxErrorKind::PythonException;
    }
    [[nodiscard]] bool isOutOfFuel() const noexcept {
        return kind() == SandboxErrorKind::OutOfFuel;
    }

    /// Timeout, memory ceiling or instruction budget.
    [[nodiscard]] bool isResourcePolicy() const noexcept;

    /// Environment or artifact problem, not retriable as-is.
    [[nodiscard]] bool isSetup() const noexcept;

    [[nodiscard]] const Variant& value() const noexcept { return value_; }

    template <typename T>
    [[nodiscard]] const T* getIf() const noexcept {
        return std::get_if<T>(&value_);
    }

    /**
     * @brief Human-readable description
     */
    [[nodiscard]] std::string message() const;

private:
    Variant value_;
};

/**
 * @brief Result type for sandbox operations
 */
template <typename T>
using Result = std::expected<T, SandboxError>;

/**
 * @brief Parse a Python exception from stderr output
 *
 * Keeps the last unindented line that looks like an exception
 * ("ValueError: bad", "KeyboardInterrupt"). The traceback, if a
 * "Traceback (most recent call last):" marker precedes it, spans the marker
 * through the exception line.
 */
[[nodiscard]] std::optional<SandboxError> parseException(
    std::string_view stderrText);

/**
 * @brief Format a duration the way error messages print it ("1.5s", "500ms")
 */
[[nodiscard]] std::string formatDuration(std::chrono::nanoseconds duration);

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_ERROR_HPP
