/*
 * host_memory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "host_memory.hpp"

#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace pyvault::wasmtime {

namespace {

thread_local runtime::ResourceLimiter* activeLimiter = nullptr;

// Upper bound of a reservation when the engine leaves it to the creator.
constexpr std::size_t kMaxDynamicReservation = std::size_t{4} << 30;

std::size_t pageSize() noexcept {
    static const std::size_t size = static_cast<std::size_t>(::sysconf(_SC_PAGESIZE));
    return size;
}

std::size_t roundUpToPage(std::size_t bytes) noexcept {
    const auto page = pageSize();
    return (bytes + page - 1) / page * page;
}

wasmtime_error_t* makeError(const std::string& message) {
    return wasmtime_error_new(message.c_str());
}

/**
 * @brief One linear memory: a reservation with a committed prefix
 */
class LimitedMemory {
public:
    LimitedMemory(std::uint8_t* base, std::size_t reserved, std::size_t mapped,
                  std::size_t maximum, runtime::ResourceLimiter& limiter)
        : base_(base), reserved_(reserved), mapped_(mapped), maximum_(maximum),
          limiter_(limiter) {}

    ~LimitedMemory() { ::munmap(base_, mapped_); }

    static wasmtime_error_t* create(void* env, const wasm_memorytype_t* type,
                                    std::size_t minimum, std::size_t maximum,
                                    std::size_t reservedSize,
                                    std::size_t guardSize,
                                    wasmtime_linear_memory_t* out);

private:
    wasmtime_error_t* growTo(std::size_t newSize) {
        if (newSize <= size_) {
            return nullptr;
        }
        const std::optional<std::uint64_t> declaredMax =
            maximum_ == std::numeric_limits<std::size_t>::max()
                ? std::nullopt
                : std::optional<std::uint64_t>{maximum_};
        if (!limiter_.memoryGrowing(size_, newSize, declaredMax)) {
            return makeError(fmt::format(
                "memory growth to {} bytes denied by resource limiter", newSize));
        }
        if (newSize > reserved_) {
            return makeError(fmt::format(
                "memory growth to {} bytes exceeds the {} byte reservation",
                newSize, reserved_));
        }
        if (::mprotect(base_, roundUpToPage(newSize), PROT_READ | PROT_WRITE) != 0) {
            return makeError(
                fmt::format("mprotect failed: {}", std::strerror(errno)));
        }
        size_ = newSize;
        return nullptr;
    }

    static std::uint8_t* getMemory(void* env, std::size_t* byteSize,
                                   std::size_t* maximumByteSize) {
        auto* memory = static_cast<LimitedMemory*>(env);
        *byteSize = memory->size_;
        *maximumByteSize = std::min(memory->maximum_, memory->reserved_);
        return memory->base_;
    }

    static wasmtime_error_t* growMemory(void* env, std::size_t newSize) {
        return static_cast<LimitedMemory*>(env)->growTo(newSize);
    }

    static void finalize(void* env) { delete static_cast<LimitedMemory*>(env); }

    std::uint8_t* base_;
    std::size_t reserved_;  ///< Bytes the memory may ever grow to
    std::size_t mapped_;    ///< Reservation plus guard region
    std::size_t maximum_;
    std::size_t size_{0};
    runtime::ResourceLimiter& limiter_;
};

wasmtime_error_t* LimitedMemory::create(void* /*env*/,
                                        const wasm_memorytype_t* /*type*/,
                                        std::size_t minimum,
                                        std::size_t maximum,
                                        std::size_t reservedSize,
                                        std::size_t guardSize,
                                        wasmtime_linear_memory_t* out) {
    auto* limiter = ActiveLimiterScope::current();
    if (limiter == nullptr) {
        return makeError("linear memory requested outside a sandboxed run");
    }

    const auto reserved = roundUpToPage(
        reservedSize > 0 ? reservedSize
                         : std::max(minimum, std::min(maximum, kMaxDynamicReservation)));
    const auto mapped = reserved + roundUpToPage(guardSize);

    void* base = ::mmap(nullptr, mapped, PROT_NONE,
                        MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (base == MAP_FAILED) {
        return makeError(fmt::format("failed to reserve {} bytes: {}", mapped,
                                     std::strerror(errno)));
    }

    auto* memory = new (std::nothrow) LimitedMemory(
        static_cast<std::uint8_t*>(base), reserved, mapped, maximum, *limiter);
    if (memory == nullptr) {
        ::munmap(base, mapped);
        return makeError("out of host memory");
    }

    if (auto* error = memory->growTo(minimum); error != nullptr) {
        delete memory;
        return error;
    }

    out->env = memory;
    out->get_memory = &LimitedMemory::getMemory;
    out->grow_memory = &LimitedMemory::growMemory;
    out->finalizer = &LimitedMemory::finalize;
    return nullptr;
}

}  // namespace

ActiveLimiterScope::ActiveLimiterScope(runtime::ResourceLimiter& limiter) noexcept
    : previous_(activeLimiter) {
    activeLimiter = &limiter;
}

ActiveLimiterScope::~ActiveLimiterScope() { activeLimiter = previous_; }

runtime::ResourceLimiter* ActiveLimiterScope::current() noexcept {
    return activeLimiter;
}

wasmtime_memory_creator_t makeLimitedMemoryCreator() noexcept {
    wasmtime_memory_creator_t creator{};
    creator.env = nullptr;
    creator.new_memory = &LimitedMemory::create;
    creator.finalizer = nullptr;
    return creator;
}

}  // namespace pyvault::wasmtime
