/*
 * test_python_sandbox.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_python_sandbox.cpp
 * @brief Tests for sandbox orchestration against a scripted engine
 */

#include <gtest/gtest.h>
#include "sandbox/python_sandbox.hpp"

#include "fake_engine.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pyvault::sandbox;
using pyvault::test::FakeEngine;
using namespace std::chrono_literals;
namespace fs = std::filesystem;
namespace net = boost::asio;

// =============================================================================
// Test Fixture
// =============================================================================

class PythonSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "pyvault_sandbox_test";
        fs::create_directories(testDir_);
        modulePath_ = testDir_ / "python.wasm";
        pyvault::test::writeFakeModule(modulePath_);

        pool_ = std::make_shared<ExecutionPool>(4);
        cache_ = std::make_shared<ModuleCache>();
        useEngine(false);
    }

    void TearDown() override {
        pool_->join();
        if (fs::exists(testDir_)) {
            fs::remove_all(testDir_);
        }
    }

    void useEngine(bool fuel) {
        fakeEngine_ = std::make_shared<FakeEngine>(fuel);
        engine_.emplace(*EngineHandle::fromEngine(fakeEngine_));
    }

    SandboxConfigBuilder configBuilder() {
        auto builder = SandboxConfig::builder();
        builder.interpreterPath(modulePath_).timeout(5s);
        return builder;
    }

    SandboxOptions options() {
        SandboxOptions opts;
        opts.cache = cache_;
        opts.pool = pool_;
        return opts;
    }

    PythonSandbox makeSandbox(SandboxConfig config) {
        auto sandbox = PythonSandbox::create(std::move(config), *engine_, options());
        if (!sandbox) {
            throw std::runtime_error(sandbox.error().message());
        }
        return std::move(*sandbox);
    }

    static Result<ExecutionResult> runAsync(
        const PythonSandbox& sandbox, std::string code,
        std::optional<std::string> input = std::nullopt) {
        net::io_context ioContext;
        auto future = net::co_spawn(
            ioContext, sandbox.execute(std::move(code), std::move(input)),
            net::use_future);
        ioContext.run();
        return future.get();
    }

    fs::path testDir_;
    fs::path modulePath_;
    std::shared_ptr<ExecutionPool> pool_;
    std::shared_ptr<ModuleCache> cache_;
    std::shared_ptr<FakeEngine> fakeEngine_;
    std::optional<EngineHandle> engine_;
};

// =============================================================================
// Creation Tests
// =============================================================================

TEST_F(PythonSandboxTest, CreateRejectsInvalidConfig) {
    auto result = PythonSandbox::create(configBuilder().timeout(0ms).build(),
                                        *engine_, options());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), SandboxErrorKind::Config);
}

TEST_F(PythonSandboxTest, CreateRequiresFuelCapableEngine) {
    auto result = PythonSandbox::create(configBuilder().maxFuel(1000).build(),
                                        *engine_, options());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), SandboxErrorKind::Config);
}

TEST_F(PythonSandboxTest, CreateReportsMissingInterpreter) {
    auto result = PythonSandbox::create(
        configBuilder().interpreterPath(testDir_ / "absent.wasm").build(),
        *engine_, options());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), SandboxErrorKind::InterpreterNotFound);
}

TEST_F(PythonSandboxTest, CachedModuleFlag) {
    auto first = makeSandbox(configBuilder().build());
    auto second = makeSandbox(configBuilder().build());
    EXPECT_FALSE(first.isUsingCachedModule());
    EXPECT_TRUE(second.isUsingCachedModule());
    EXPECT_EQ(fakeEngine_->compilations(), 1);

    auto result = second.executeSync("print hi");
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_TRUE(result->metadata.usedCachedModule);
}

TEST_F(PythonSandboxTest, CacheCanBeBypassed) {
    auto opts = options();
    opts.useCache = false;
    auto first = PythonSandbox::create(configBuilder().build(), *engine_, opts);
    auto second = PythonSandbox::create(configBuilder().build(), *engine_, opts);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second->isUsingCachedModule());
    EXPECT_EQ(fakeEngine_->compilations(), 2);
    EXPECT_TRUE(cache_->empty());
}

TEST_F(PythonSandboxTest, AccessorsExposeConfiguration) {
    auto sandbox = makeSandbox(configBuilder().maxMemory(1 << 24).build());
    EXPECT_EQ(sandbox.config().maxMemory, 1u << 24);
    EXPECT_TRUE(sandbox.engine().sharesEngineWith(*engine_));
}

// =============================================================================
// Execution Tests
// =============================================================================

TEST_F(PythonSandboxTest, CapturesOutput) {
    auto sandbox = makeSandbox(configBuilder().build());
    auto result = runAsync(sandbox, "print hello\neprint warning");
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_TRUE(result->isSuccess());
    EXPECT_EQ(result->stdoutText, "hello\n");
    EXPECT_EQ(result->stderrText, "warning\n");
    EXPECT_GT(result->metadata.duration.count(), 0);
    EXPECT_EQ(result->metadata.peakMemoryBytes, 1024u * 1024u);
    EXPECT_FALSE(result->metadata.fuelConsumed.has_value());
}

TEST_F(PythonSandboxTest, NonzeroExitIsAResult) {
    auto sandbox = makeSandbox(configBuilder().build());
    auto result = sandbox.executeSync("exit 3");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_FALSE(result->isSuccess());
}

TEST_F(PythonSandboxTest, GuestExceptionIsParsedFromStderr) {
    auto sandbox = makeSandbox(configBuilder().build());
    auto result = sandbox.executeSync("raise ZeroDivisionError: division by zero");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 1);

    auto exception = parseException(result->stderrText);
    ASSERT_TRUE(exception.has_value());
    const auto* details = exception->getIf<SandboxError::PythonException>();
    ASSERT_NE(details, nullptr);
    EXPECT_EQ(details->exceptionType, "ZeroDivisionError");
    EXPECT_EQ(details->message, "division by zero");
}

TEST_F(PythonSandboxTest, PreludeRunsFirst) {
    auto sandbox = makeSandbox(configBuilder().prelude("print setup").build());
    auto result = sandbox.executeSync("print main");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "setup\nmain\n");
}

TEST_F(PythonSandboxTest, EnvironmentIsPassedThrough) {
    auto sandbox = makeSandbox(configBuilder().env("GREETING", "hi").build());
    auto result = sandbox.executeSync("env GREETING\nenv HOME");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "hi\n<unset>\n");
}

TEST_F(PythonSandboxTest, StdinFromCall) {
    auto sandbox = makeSandbox(configBuilder().build());
    auto result = sandbox.executeSync("echo_stdin", "from call");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "from call");

    auto empty = sandbox.executeSync("echo_stdin");
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->stdoutText, "");
}

TEST_F(PythonSandboxTest, ConfiguredStdinTakesPrecedence) {
    auto sandbox = makeSandbox(configBuilder().stdinData("from config").build());
    auto result = sandbox.executeSync("echo_stdin", "from call");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "from config");
}

TEST_F(PythonSandboxTest, EngineExceptionIsExecutionFailure) {
    auto sandbox = makeSandbox(configBuilder().build());
    auto result = sandbox.executeSync("throw");
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(result.error().kind(), SandboxErrorKind::ExecutionFailed);
    EXPECT_EQ(result.error().message(),
              "execution failed: task panicked: engine crashed");
}

// =============================================================================
// Resource Limit Tests
// =============================================================================

TEST_F(PythonSandboxTest, TimeoutInterruptsRunawayGuest) {
    auto sandbox = makeSandbox(
        configBuilder().timeout(200ms).epochTickInterval(5ms).build());

    const auto start = std::chrono::steady_clock::now();
    auto result = runAsync(sandbox, "print started\nspin");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(result.error().isTimeout());
    EXPECT_EQ(result.error().getIf<SandboxError::Timeout>()->duration, 200ms);
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_GT(fakeEngine_->epoch(), 0u);
}

TEST_F(PythonSandboxTest, TimeoutDoesNotWaitForBlockedGuest) {
    auto sandbox = makeSandbox(configBuilder().timeout(100ms).build());

    const auto start = std::chrono::steady_clock::now();
    auto result = sandbox.executeSync("sleep 1500");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isTimeout());
    EXPECT_LT(elapsed, 1s);
}

TEST_F(PythonSandboxTest, MemoryLimitDuringExecution) {
    auto sandbox = makeSandbox(configBuilder().maxMemory(4 << 20).build());
    auto result = sandbox.executeSync("alloc 2097152\nalloc 8388608");
    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(result.error().isMemoryLimit());
    EXPECT_NE(result.error().message().find("limit 4194304 bytes"),
              std::string::npos);
    EXPECT_NE(result.error().message().find("peak 2097152 bytes"),
              std::string::npos);
}

TEST_F(PythonSandboxTest, MemoryLimitDuringInstantiation) {
    auto sandbox = makeSandbox(configBuilder().maxMemory(512 * 1024).build());
    auto result = sandbox.executeSync("print unreachable");
    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(result.error().isMemoryLimit());
    EXPECT_NE(result.error().message().find("during instantiation"),
              std::string::npos);
}

TEST_F(PythonSandboxTest, PeakMemoryIsReported) {
    auto sandbox = makeSandbox(configBuilder().build());
    auto result = sandbox.executeSync("alloc 3145728\nalloc 2097152");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->metadata.peakMemoryBytes, 3145728u);
}

TEST_F(PythonSandboxTest, FuelIsMetered) {
    useEngine(true);
    auto sandbox = makeSandbox(configBuilder().maxFuel(1000).build());
    auto result = sandbox.executeSync("burn 300");
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_EQ(result->metadata.fuelConsumed, 300u);
}

TEST_F(PythonSandboxTest, FuelExhaustion) {
    useEngine(true);
    auto sandbox = makeSandbox(configBuilder().maxFuel(1000).build());
    auto result = sandbox.executeSync("burn 300\nburn 5000");
    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(result.error().isOutOfFuel());
    EXPECT_EQ(result.error().getIf<SandboxError::OutOfFuel>()->consumed, 1000u);
}

// =============================================================================
// Concurrency Tests
// =============================================================================

TEST_F(PythonSandboxTest, ConcurrentExecutionsAreIsolated) {
    auto sandbox = makeSandbox(configBuilder().build());

    constexpr int kRuns = 8;
    net::io_context ioContext;
    std::vector<std::future<Result<ExecutionResult>>> futures;
    for (int i = 0; i < kRuns; ++i) {
        futures.push_back(net::co_spawn(
            ioContext,
            sandbox.execute("print run " + std::to_string(i) + "\necho_stdin",
                            "input " + std::to_string(i)),
            net::use_future));
    }
    ioContext.run();

    for (int i = 0; i < kRuns; ++i) {
        auto result = futures[i].get();
        ASSERT_TRUE(result.has_value()) << result.error().message();
        EXPECT_EQ(result->stdoutText,
                  "run " + std::to_string(i) + "\ninput " + std::to_string(i));
    }
    EXPECT_EQ(fakeEngine_->runs(), kRuns);
}

TEST_F(PythonSandboxTest, TimeoutDoesNotAffectSiblingRun) {
    auto sandbox = makeSandbox(
        configBuilder().timeout(300ms).epochTickInterval(5ms).build());

    net::io_context ioContext;
    auto runaway = net::co_spawn(ioContext, sandbox.execute("spin"), net::use_future);
    auto quick = net::co_spawn(ioContext, sandbox.execute("print done"),
                               net::use_future);
    ioContext.run();

    auto runawayResult = runaway.get();
    ASSERT_FALSE(runawayResult.has_value());
    EXPECT_TRUE(runawayResult.error().isTimeout());

    auto quickResult = quick.get();
    ASSERT_TRUE(quickResult.has_value());
    EXPECT_EQ(quickResult->stdoutText, "done\n");
}

TEST_F(PythonSandboxTest, PendingExecutionOutlivesSandbox) {
    net::io_context ioContext;
    std::future<Result<ExecutionResult>> future;
    {
        auto sandbox = makeSandbox(configBuilder().build());
        future = net::co_spawn(ioContext, sandbox.execute("sleep 50\nprint late"),
                               net::use_future);
    }
    ioContext.run();

    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "late\n");
}

TEST_F(PythonSandboxTest, MoreConcurrentRunsThanCoreThreads) {
    pool_ = std::make_shared<ExecutionPool>(2);
    auto sandbox = makeSandbox(configBuilder().timeout(500ms).build());

    constexpr int kRuns = 6;
    net::io_context ioContext;
    std::vector<std::future<Result<ExecutionResult>>> futures;
    for (int i = 0; i < kRuns; ++i) {
        futures.push_back(net::co_spawn(
            ioContext, sandbox.execute("sleep 300\nprint ok"), net::use_future));
    }
    ioContext.run();

    for (auto& future : futures) {
        auto result = future.get();
        ASSERT_TRUE(result.has_value()) << result.error().message();
        EXPECT_EQ(result->stdoutText, "ok\n");
    }
    EXPECT_GE(pool_->threadCount(), static_cast<std::size_t>(kRuns));
}

TEST_F(PythonSandboxTest, TimeQueuedForAThreadIsNotCharged) {
    pool_ = std::make_shared<ExecutionPool>(1, 1);
    auto sandbox = makeSandbox(configBuilder().timeout(500ms).build());

    net::io_context ioContext;
    auto first = net::co_spawn(ioContext, sandbox.execute("sleep 300\nprint first"),
                               net::use_future);
    auto second = net::co_spawn(
        ioContext, sandbox.execute("sleep 300\nprint second"), net::use_future);
    ioContext.run();

    auto firstResult = first.get();
    ASSERT_TRUE(firstResult.has_value()) << firstResult.error().message();
    auto secondResult = second.get();
    ASSERT_TRUE(secondResult.has_value()) << secondResult.error().message();
    EXPECT_EQ(secondResult->stdoutText, "second\n");
}

TEST_F(PythonSandboxTest, AbandonedBlockedRunDoesNotStarveLaterRuns) {
    pool_ = std::make_shared<ExecutionPool>(1);
    auto sandbox = makeSandbox(configBuilder().timeout(100ms).build());

    auto stuck = sandbox.executeSync("sleep 1500");
    ASSERT_FALSE(stuck.has_value());
    EXPECT_TRUE(stuck.error().isTimeout());

    const auto start = std::chrono::steady_clock::now();
    auto result = sandbox.executeSync("print ok");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_EQ(result->stdoutText, "ok\n");
    EXPECT_LT(elapsed, 1s);
}

TEST_F(PythonSandboxTest, UnboundedTimeoutRunsNormally) {
    auto sandbox = makeSandbox(
        configBuilder().timeout(std::chrono::milliseconds::max()).build());

    auto result = sandbox.executeSync("print ok");
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_EQ(result->stdoutText, "ok\n");

    auto async = runAsync(sandbox, "print async");
    ASSERT_TRUE(async.has_value()) << async.error().message();
    EXPECT_EQ(async->stdoutText, "async\n");
}

TEST_F(PythonSandboxTest, JoinedPoolRejectsExecution) {
    auto sandbox = makeSandbox(configBuilder().build());
    pool_->join();

    auto result = sandbox.executeSync("print unreachable");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), SandboxErrorKind::ExecutionFailed);
    EXPECT_EQ(fakeEngine_->runs(), 0);
}

TEST_F(PythonSandboxTest, MovedFromSandboxRejectsExecution) {
    auto sandbox = makeSandbox(configBuilder().build());
    PythonSandbox moved = std::move(sandbox);
    EXPECT_TRUE(moved.valid());
    EXPECT_FALSE(sandbox.valid());  // NOLINT(bugprone-use-after-move)

    auto syncResult = sandbox.executeSync("print hi");  // NOLINT(bugprone-use-after-move)
    ASSERT_FALSE(syncResult.has_value());
    EXPECT_EQ(syncResult.error().kind(), SandboxErrorKind::ExecutionFailed);

    auto asyncResult = runAsync(sandbox, "print hi");  // NOLINT(bugprone-use-after-move)
    ASSERT_FALSE(asyncResult.has_value());
    EXPECT_EQ(asyncResult.error().kind(), SandboxErrorKind::ExecutionFailed);

    auto result = moved.executeSync("print hi");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "hi\n");
}
