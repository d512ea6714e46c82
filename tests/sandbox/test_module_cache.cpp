/*
 * test_module_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_module_cache.cpp
 * @brief Tests for the compiled interpreter module cache
 */

#include <gtest/gtest.h>
#include "sandbox/module_cache.hpp"

#include "fake_engine.hpp"

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace pyvault::sandbox;
using pyvault::test::FakeEngine;
namespace fs = std::filesystem;

// =============================================================================
// Test Fixture
// =============================================================================

class ModuleCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "pyvault_module_cache_test";
        fs::create_directories(testDir_);
        modulePath_ = testDir_ / "python.wasm";
        pyvault::test::writeFakeModule(modulePath_);

        fakeEngine_ = std::make_shared<FakeEngine>();
        engine_.emplace(*EngineHandle::fromEngine(fakeEngine_));
    }

    void TearDown() override {
        if (fs::exists(testDir_)) {
            fs::remove_all(testDir_);
        }
    }

    fs::path testDir_;
    fs::path modulePath_;
    std::shared_ptr<FakeEngine> fakeEngine_;
    std::optional<EngineHandle> engine_;
    ModuleCache cache_;
};

// =============================================================================
// Lookup Tests
// =============================================================================

TEST_F(ModuleCacheTest, CompilesOnceAndReturnsSameModule) {
    auto first = cache_.getOrCompile(*engine_, modulePath_);
    auto second = cache_.getOrCompile(*engine_, modulePath_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->get(), second->get());
    EXPECT_EQ(fakeEngine_->compilations(), 1);

    auto stats = cache_.statistics();
    EXPECT_EQ(stats.hits.load(), 1u);
    EXPECT_EQ(stats.misses.load(), 1u);
    EXPECT_EQ(stats.compilations.load(), 1u);
    EXPECT_DOUBLE_EQ(stats.getHitRatio(), 50.0);
}

TEST_F(ModuleCacheTest, EquivalentPathsShareAnEntry) {
    ASSERT_TRUE(cache_.getOrCompile(*engine_, modulePath_).has_value());
    auto indirect = testDir_ / "." / "python.wasm";
    ASSERT_TRUE(cache_.getOrCompile(*engine_, indirect).has_value());
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_TRUE(cache_.contains(indirect));
}

TEST_F(ModuleCacheTest, ModulesAreKeptPerEngine) {
    auto otherFake = std::make_shared<FakeEngine>();
    auto other = *EngineHandle::fromEngine(otherFake);

    auto mine = cache_.getOrCompile(*engine_, modulePath_);
    auto theirs = cache_.getOrCompile(other, modulePath_);
    ASSERT_TRUE(mine.has_value());
    ASSERT_TRUE(theirs.has_value());
    EXPECT_NE(mine->get(), theirs->get());
    EXPECT_EQ(cache_.size(), 2u);
    EXPECT_TRUE(cache_.contains(*engine_, modulePath_));
    EXPECT_TRUE(cache_.contains(other, modulePath_));
}

TEST_F(ModuleCacheTest, HandlesOverOneEngineShareEntries) {
    auto rewrapped = *EngineHandle::fromEngine(fakeEngine_);

    auto first = cache_.getOrCompile(*engine_, modulePath_);
    auto second = cache_.getOrCompile(rewrapped, modulePath_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->get(), second->get());
    EXPECT_EQ(fakeEngine_->compilations(), 1);
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(ModuleCacheTest, MissingFileIsInterpreterNotFound) {
    auto result = cache_.getOrCompile(*engine_, testDir_ / "missing.wasm");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), SandboxErrorKind::InterpreterNotFound);
    EXPECT_TRUE(cache_.empty());
}

TEST_F(ModuleCacheTest, CompileFailureIsModuleLoad) {
    auto bogus = testDir_ / "bogus.wasm";
    std::ofstream(bogus) << "not a module";

    auto result = cache_.getOrCompile(*engine_, bogus);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), SandboxErrorKind::ModuleLoad);
    EXPECT_NE(result.error().message().find("failed to compile module"),
              std::string::npos);
    EXPECT_FALSE(cache_.contains(bogus));
}

// =============================================================================
// Maintenance Tests
// =============================================================================

TEST_F(ModuleCacheTest, RemoveAndClear) {
    ASSERT_TRUE(cache_.getOrCompile(*engine_, modulePath_).has_value());
    EXPECT_TRUE(cache_.remove(modulePath_));
    EXPECT_FALSE(cache_.remove(modulePath_));
    EXPECT_FALSE(cache_.contains(modulePath_));

    ASSERT_TRUE(cache_.getOrCompile(*engine_, modulePath_).has_value());
    EXPECT_EQ(fakeEngine_->compilations(), 2);
    cache_.clear();
    EXPECT_TRUE(cache_.empty());

    cache_.resetStatistics();
    EXPECT_EQ(cache_.statistics().misses.load(), 0u);
}

TEST_F(ModuleCacheTest, CompileModuleFileBypassesCache) {
    auto first = compileModuleFile(*engine_, modulePath_);
    auto second = compileModuleFile(*engine_, modulePath_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->get(), second->get());
    EXPECT_EQ(fakeEngine_->compilations(), 2);
}

TEST_F(ModuleCacheTest, ConcurrentLookupsConverge) {
    constexpr int kThreads = 8;
    std::vector<ModulePtr> modules(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, &modules, i] {
            auto module = cache_.getOrCompile(*engine_, modulePath_);
            if (module) {
                modules[i] = *module;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& module : modules) {
        ASSERT_NE(module, nullptr);
        EXPECT_EQ(module.get(), modules.front().get());
    }
    EXPECT_EQ(cache_.size(), 1u);
    auto stats = cache_.statistics();
    EXPECT_EQ(stats.compilations.load() - stats.discarded.load(), 1u);
}
