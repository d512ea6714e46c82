/*
 * module_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file module_cache.hpp
 * @brief Thread-safe cache of compiled interpreter modules
 * @date 2024
 * @version 1.0.0
 *
 * Compiling the interpreter is by far the most expensive step of creating a
 * sandbox. The cache compiles each artifact once per engine and hands out
 * shared references to the immutable result.
 */

#ifndef PYVAULT_SANDBOX_MODULE_CACHE_HPP
#define PYVAULT_SANDBOX_MODULE_CACHE_HPP

#include "engine_handle.hpp"
#include "error.hpp"
#include "runtime/engine.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <utility>

namespace pyvault::sandbox {

using ModulePtr = std::shared_ptr<const runtime::Module>;

/**
 * @brief Resolve @p path to its canonical form
 * @return InterpreterNotFound if nothing exists there, Io for other failures
 */
[[nodiscard]] Result<std::filesystem::path> canonicalizeModulePath(
    const std::filesystem::path& path);

/**
 * @brief Read and compile a module without consulting any cache
 */
[[nodiscard]] Result<ModulePtr> compileModuleFile(
    const EngineHandle& engine, const std::filesystem::path& path);

/**
 * @brief Mapping from (engine, canonical path) to a compiled module
 *
 * Lookups take a shared lock. Compilation runs outside any lock, so
 * concurrent misses compile in parallel; the insert re-checks under the
 * exclusive lock and a losing compile is discarded in favour of the entry
 * already present.
 */
class ModuleCache {
public:
    /**
     * @brief Cache statistics for monitoring
     */
    struct Statistics {
        std::atomic<std::uint64_t> hits{0};
        std::atomic<std::uint64_t> misses{0};
        std::atomic<std::uint64_t> compilations{0};
        std::atomic<std::uint64_t> discarded{0};  ///< Compiles that lost an insert race

        Statistics(const Statistics& other)
            : hits(other.hits.load()),
              misses(other.misses.load()),
              compilations(other.compilations.load()),
              discarded(other.discarded.load()) {}

        Statistics() = default;

        [[nodiscard]] double getHitRatio() const noexcept {
            const auto totalAccess = hits.load() + misses.load();
            return totalAccess > 0
                       ? (static_cast<double>(hits.load()) / totalAccess) *
                             100.0
                       : 0.0;
        }
    };

    ModuleCache() = default;

    ModuleCache(const ModuleCache&) = delete;
    ModuleCache& operator=(const ModuleCache&) = delete;

    /**
     * @brief Process-wide cache, created on first use
     */
    [[nodiscard]] static ModuleCache& global();

    /**
     * @brief Get the module compiled by @p engine from @p path, compiling it
     *        on a miss
     *
     * Two calls with the same engine and canonical path return the same
     * module object.
     */
    [[nodiscard]] Result<ModulePtr> getOrCompile(const EngineHandle& engine,
                                                 const std::filesystem::path& path);

    /// Whether any engine has a module cached for @p path.
    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

    [[nodiscard]] bool contains(const EngineHandle& engine,
                                const std::filesystem::path& path) const;

    /**
     * @brief Evict every entry for @p path
     * @return True if at least one entry was removed
     */
    bool remove(const std::filesystem::path& path);

    void clear();

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] Statistics statistics() const { return stats_; }

    void resetStatistics() noexcept;

private:
    using Key = std::pair<std::uint64_t, std::filesystem::path>;

    mutable std::shared_mutex mutex_;
    std::map<Key, ModulePtr> modules_;
    Statistics stats_;
};

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_MODULE_CACHE_HPP
