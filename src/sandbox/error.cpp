/*
 * error.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error.hpp"

#include <array>
#include <vector>

#include <fmt/format.h>

namespace pyvault::sandbox {

namespace {

constexpr std::string_view kTracebackMarker =
    "Traceback (most recent call last):";

constexpr std::array<std::string_view, 3> kExceptionSuffixes = {
    "Error", "Exception", "Warning"};

constexpr std::array<std::string_view, 4> kStandaloneExceptions = {
    "KeyboardInterrupt", "SystemExit", "StopIteration", "GeneratorExit"};

bool isBlank(std::string_view text) {
    return text.find_first_not_of(" \t\r\n\v\f") == std::string_view::npos;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n\v\f");
    return text.substr(first, last - first + 1);
}

// Splits on '\n', dropping a trailing '\r' and the empty piece after a
// final newline.
std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool terminatesName(std::string_view line, std::size_t position) {
    return position >= line.size() || line[position] == ':' ||
           line[position] == ' ' || line[position] == '\n';
}

bool looksLikeException(std::string_view line) {
    if (line.empty() || line.front() < 'A' || line.front() > 'Z') {
        return false;
    }

    for (const auto suffix : kExceptionSuffixes) {
        for (auto index = line.find(suffix); index != std::string_view::npos;
             index = line.find(suffix, index + 1)) {
            if (terminatesName(line, index + suffix.size())) {
                return true;
            }
        }
    }

    for (const auto name : kStandaloneExceptions) {
        if (line.starts_with(name) && terminatesName(line, name.size())) {
            return true;
        }
    }
    return false;
}

}  // namespace

// ============================================================================
// Factories
// ============================================================================

SandboxError SandboxError::timeout(std::chrono::nanoseconds duration) {
    return SandboxError{Timeout{duration}};
}

SandboxError SandboxError::memoryLimitExceeded(std::string detail) {
    return SandboxError{MemoryLimitExceeded{std::move(detail)}};
}

SandboxError SandboxError::runtimeInit(std::string cause) {
    return SandboxError{RuntimeInit{std::move(cause)}};
}

SandboxError SandboxError::moduleLoad(std::string cause) {
    return SandboxError{ModuleLoad{std::move(cause)}};
}

SandboxError SandboxError::executionFailed(std::string detail) {
    return SandboxError{ExecutionFailed{std::move(detail)}};
}

SandboxError SandboxError::pythonException(
    std::string exceptionType, std::string message,
    std::optional<std::string> traceback) {
    return SandboxError{PythonException{std::move(exceptionType),
                                        std::move(message),
                                        std::move(traceback)}};
}

SandboxError SandboxError::io(std::error_code code, std::string cause) {
    if (cause.empty()) {
        cause = code.message();
    }
    return SandboxError{Io{code, std::move(cause)}};
}

SandboxError SandboxError::config(std::string detail) {
    return SandboxError{Config{std::move(detail)}};
}

SandboxError SandboxError::interpreterNotFound(std::string path) {
    return SandboxError{InterpreterNotFound{std::move(path)}};
}

SandboxError SandboxError::outOfFuel(std::optional<std::uint64_t> consumed) {
    return SandboxError{OutOfFuel{consumed}};
}

std::optional<SandboxError> SandboxError::fromPythonStderr(
    std::string_view stderrText) {
    return parseException(stderrText);
}

// ============================================================================
// Queries
// ============================================================================

bool SandboxError::isResourcePolicy() const noexcept {
    switch (kind()) {
        case SandboxErrorKind::Timeout:
        case SandboxErrorKind::MemoryLimitExceeded:
        case SandboxErrorKind::OutOfFuel:
            return true;
        default:
            return false;
    }
}

bool SandboxError::isSetup() const noexcept {
    switch (kind()) {
        case SandboxErrorKind::RuntimeInit:
        case SandboxErrorKind::ModuleLoad:
        case SandboxErrorKind::InterpreterNotFound:
        case SandboxErrorKind::Io:
        case SandboxErrorKind::Config:
            return true;
        default:
            return false;
    }
}

std::string SandboxError::message() const {
    switch (kind()) {
        case SandboxErrorKind::Timeout:
            return fmt::format("execution timed out after {}",
                               formatDuration(std::get<Timeout>(value_).duration));
        case SandboxErrorKind::MemoryLimitExceeded:
            return fmt::format("memory limit exceeded: {}",
                               std::get<MemoryLimitExceeded>(value_).detail);
        case SandboxErrorKind::RuntimeInit:
            return fmt::format("failed to initialize runtime: {}",
                               std::get<RuntimeInit>(value_).cause);
        case SandboxErrorKind::ModuleLoad:
            return fmt::format("failed to load Python interpreter: {}",
                               std::get<ModuleLoad>(value_).cause);
        case SandboxErrorKind::ExecutionFailed:
            return fmt::format("execution failed: {}",
                               std::get<ExecutionFailed>(value_).detail);
        case SandboxErrorKind::PythonException: {
            const auto& exception = std::get<PythonException>(value_);
            return fmt::format("Python {}: {}", exception.exceptionType,
                               exception.message);
        }
        case SandboxErrorKind::Io:
            return fmt::format("I/O error: {}", std::get<Io>(value_).cause);
        case SandboxErrorKind::Config:
            return fmt::format("configuration error: {}",
                               std::get<Config>(value_).detail);
        case SandboxErrorKind::InterpreterNotFound:
            return fmt::format("Python interpreter wasm not found at: {}",
                               std::get<InterpreterNotFound>(value_).path);
        case SandboxErrorKind::OutOfFuel: {
            const auto& consumed = std::get<OutOfFuel>(value_).consumed;
            if (!consumed) {
                return "execution ran out of fuel (instruction count "
                       "unavailable)";
            }
            return fmt::format("execution ran out of fuel after {} instructions",
                               *consumed);
        }
    }
    return "unknown sandbox error";
}

// ============================================================================
// Stderr parsing
// ============================================================================

std::optional<SandboxError> parseException(std::string_view stderrText) {
    if (isBlank(stderrText)) {
        return std::nullopt;
    }

    const auto lines = splitLines(stderrText);

    std::optional<std::size_t> exceptionIndex;
    std::optional<std::size_t> tracebackStart;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto line = lines[i];
        if (line.starts_with(kTracebackMarker)) {
            tracebackStart = i;
            continue;
        }
        if (line.empty() || line.front() == ' ' || line.front() == '\t') {
            continue;
        }
        if (looksLikeException(line)) {
            exceptionIndex = i;
        }
    }

    if (!exceptionIndex) {
        return std::nullopt;
    }

    const auto line = lines[*exceptionIndex];
    std::string exceptionType;
    std::string message;
    if (const auto colon = line.find(':'); colon != std::string_view::npos) {
        exceptionType = std::string(trim(line.substr(0, colon)));
        message = std::string(trim(line.substr(colon + 1)));
    } else {
        exceptionType = std::string(trim(line));
    }

    std::optional<std::string> traceback;
    if (tracebackStart && *tracebackStart <= *exceptionIndex) {
        std::string text;
        for (auto i = *tracebackStart; i <= *exceptionIndex; ++i) {
            if (i != *tracebackStart) {
                text += '\n';
            }
            text += lines[i];
        }
        traceback = std::move(text);
    }

    return SandboxError::pythonException(std::move(exceptionType),
                                         std::move(message),
                                         std::move(traceback));
}

std::string formatDuration(std::chrono::nanoseconds duration) {
    using namespace std::chrono;

    const auto count = duration.count();
    auto trimmed = [](double value, std::string_view unit) {
        auto text = fmt::format("{:.9f}", value);
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
        return text + std::string(unit);
    };

    if (duration >= seconds{1}) {
        return trimmed(static_cast<double>(count) / 1e9, "s");
    }
    if (duration >= milliseconds{1}) {
        return trimmed(static_cast<double>(count) / 1e6, "ms");
    }
    if (duration >= microseconds{1}) {
        return trimmed(static_cast<double>(count) / 1e3, "µs");
    }
    return fmt::format("{}ns", count);
}

}  // namespace pyvault::sandbox
