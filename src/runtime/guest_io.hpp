/*
 * guest_io.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file guest_io.hpp
 * @brief In-memory stdin/stdout/stderr endpoints for one guest execution
 * @date 2024
 * @version 1.0.0
 */

#ifndef PYVAULT_RUNTIME_GUEST_IO_HPP
#define PYVAULT_RUNTIME_GUEST_IO_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pyvault::runtime {

/**
 * @brief Decode bytes as UTF-8, replacing invalid sequences with U+FFFD
 */
[[nodiscard]] std::string decodeLossy(std::string_view bytes);

/**
 * @brief Append-only byte buffer receiving one guest output stream
 */
class CapturedOutput {
public:
    CapturedOutput() = default;

    CapturedOutput(const CapturedOutput&) = delete;
    CapturedOutput& operator=(const CapturedOutput&) = delete;

    void write(std::string_view bytes);

    /// Captured bytes decoded with decodeLossy().
    [[nodiscard]] std::string toStringLossy() const;
    [[nodiscard]] std::string bytes() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }
    void clear();

private:
    mutable std::mutex mutex_;
    std::string buffer_;
};

/**
 * @brief Read cursor over the stdin payload handed to the guest
 */
class ProvidedInput {
public:
    ProvidedInput() = default;
    explicit ProvidedInput(std::string data) : data_(std::move(data)) {}

    ProvidedInput(const ProvidedInput&) = delete;
    ProvidedInput& operator=(const ProvidedInput&) = delete;

    /// Everything not yet consumed; advances the cursor to the end.
    [[nodiscard]] std::string readRemaining();

    [[nodiscard]] std::size_t remaining() const;

private:
    mutable std::mutex mutex_;
    std::string data_;
    std::size_t position_{0};
};

/**
 * @brief The three standard streams of one execution
 *
 * Owned by exactly one execution and never shared.
 */
struct GuestIo {
    GuestIo() = default;
    explicit GuestIo(std::optional<std::string> stdinData)
        : stdinStream(stdinData.value_or(std::string{})),
          hasStdin(stdinData.has_value()) {}

    ProvidedInput stdinStream;
    CapturedOutput stdoutStream;
    CapturedOutput stderrStream;
    bool hasStdin{false};
};

}  // namespace pyvault::runtime

#endif  // PYVAULT_RUNTIME_GUEST_IO_HPP
