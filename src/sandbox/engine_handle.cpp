/*
 * engine_handle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "engine_handle.hpp"

#include <mutex>
#include <unordered_map>

namespace pyvault::sandbox {

namespace {

struct EngineIdentity {
    std::weak_ptr<runtime::Engine> engine;
    std::uint64_t id;
};

std::mutex identityMutex;
std::unordered_map<const runtime::Engine*, EngineIdentity> identities;
std::uint64_t nextEngineId = 1;

// Same live engine, same id. An address reused after the engine died gets a
// fresh id so stale cache entries never match it.
std::uint64_t idFor(const std::shared_ptr<runtime::Engine>& engine) {
    std::lock_guard lock(identityMutex);
    std::erase_if(identities,
                  [](const auto& entry) { return entry.second.engine.expired(); });

    auto [it, inserted] = identities.try_emplace(
        engine.get(), EngineIdentity{engine, nextEngineId});
    if (inserted) {
        ++nextEngineId;
    }
    return it->second.id;
}

}  // namespace

Result<EngineHandle> EngineHandle::fromEngine(
    std::shared_ptr<runtime::Engine> engine) {
    if (!engine) {
        return std::unexpected(
            SandboxError::runtimeInit("no execution engine supplied"));
    }
    const auto id = idFor(engine);
    return EngineHandle(std::move(engine), id);
}

}  // namespace pyvault::sandbox
