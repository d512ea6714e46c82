/*
 * module_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "module_cache.hpp"

#include "logging/log_config.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <mutex>
#include <span>
#include <vector>

#include <fmt/format.h>

namespace pyvault::sandbox {

namespace fs = std::filesystem;

namespace {

Result<std::vector<std::uint8_t>> readModuleBytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(SandboxError::io(
            std::make_error_code(std::errc::io_error),
            fmt::format("cannot open {}", path.string())));
    }

    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(file),
                                    std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::unexpected(SandboxError::io(
            std::make_error_code(std::errc::io_error),
            fmt::format("failed to read {}", path.string())));
    }
    return bytes;
}

Result<ModulePtr> compileCanonical(const EngineHandle& engine,
                                   const fs::path& canonicalPath) {
    auto bytes = readModuleBytes(canonicalPath);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    auto module = engine.engine().compile(std::span<const std::uint8_t>(*bytes));
    if (!module) {
        return std::unexpected(SandboxError::moduleLoad(
            fmt::format("failed to compile module: {}", module.error())));
    }
    return *module;
}

}  // namespace

Result<fs::path> canonicalizeModulePath(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::canonical(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return std::unexpected(SandboxError::interpreterNotFound(path.string()));
        }
        return std::unexpected(SandboxError::io(
            ec, fmt::format("cannot resolve {}: {}", path.string(), ec.message())));
    }
    return canonical;
}

Result<ModulePtr> compileModuleFile(const EngineHandle& engine,
                                    const fs::path& path) {
    auto canonical = canonicalizeModulePath(path);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return compileCanonical(engine, *canonical);
}

// ============================================================================
// ModuleCache
// ============================================================================

ModuleCache& ModuleCache::global() {
    static ModuleCache instance;
    return instance;
}

Result<ModulePtr> ModuleCache::getOrCompile(const EngineHandle& engine,
                                            const fs::path& path) {
    auto canonical = canonicalizeModulePath(path);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    Key key{engine.id(), *canonical};

    {
        std::shared_lock lock(mutex_);
        if (auto it = modules_.find(key); it != modules_.end()) {
            stats_.hits.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }
    stats_.misses.fetch_add(1, std::memory_order_relaxed);

    auto logger = logging::LogConfig::getLogger();
    PYVAULT_LOG_DEBUG(logger, "Compiling module {} for engine #{}",
                      key.second.string(), key.first);

    auto compiled = compileCanonical(engine, key.second);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    stats_.compilations.fetch_add(1, std::memory_order_relaxed);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = modules_.try_emplace(std::move(key), *compiled);
    if (!inserted) {
        stats_.discarded.fetch_add(1, std::memory_order_relaxed);
        PYVAULT_LOG_DEBUG(logger,
                          "Discarding redundant compile of {}, already cached",
                          it->first.second.string());
    }
    return it->second;
}

bool ModuleCache::contains(const fs::path& path) const {
    std::error_code ec;
    auto canonical = fs::canonical(path, ec);
    if (ec) {
        return false;
    }

    std::shared_lock lock(mutex_);
    for (const auto& [key, module] : modules_) {
        if (key.second == canonical) {
            return true;
        }
    }
    return false;
}

bool ModuleCache::contains(const EngineHandle& engine,
                           const fs::path& path) const {
    std::error_code ec;
    auto canonical = fs::canonical(path, ec);
    if (ec) {
        return false;
    }

    std::shared_lock lock(mutex_);
    return modules_.contains(Key{engine.id(), canonical});
}

bool ModuleCache::remove(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::canonical(path, ec);
    if (ec) {
        return false;
    }

    std::unique_lock lock(mutex_);
    return std::erase_if(modules_, [&canonical](const auto& entry) {
               return entry.first.second == canonical;
           }) > 0;
}

void ModuleCache::clear() {
    std::unique_lock lock(mutex_);
    modules_.clear();
}

std::size_t ModuleCache::size() const {
    std::shared_lock lock(mutex_);
    return modules_.size();
}

void ModuleCache::resetStatistics() noexcept {
    stats_.hits.store(0);
    stats_.misses.store(0);
    stats_.compilations.store(0);
    stats_.discarded.store(0);
}

}  // namespace pyvault::sandbox
