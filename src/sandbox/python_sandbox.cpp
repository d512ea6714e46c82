/*
 * python_sandbox.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "python_sandbox.hpp"

#include "classifier.hpp"
#include "limiter.hpp"
#include "logging/log_config.hpp"
#include "runtime/engine.hpp"
#include "runtime/guest_io.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>

#include <fmt/format.h>

namespace pyvault::sandbox {

namespace net = boost::asio;

namespace detail {

/**
 * @brief What a blocking run needs, kept alive by in-flight runs
 *
 * Holds no reference to the pool, so a pool thread never releases it.
 */
struct GuestProgram {
    SandboxConfig config;
    EngineHandle engine;
    ModulePtr module;
    bool usedCachedModule{false};
};

struct SandboxState {
    std::shared_ptr<const GuestProgram> program;
    std::shared_ptr<ExecutionPool> ownedPool;
    ExecutionPool* pool{nullptr};
};

}  // namespace detail

namespace {

using detail::GuestProgram;
using detail::SandboxState;

using Clock = std::chrono::steady_clock;

/**
 * @brief Hand-off point between the orchestrator and one blocking run
 */
struct RunSlot {
    explicit RunSlot(std::chrono::milliseconds timeout) : timeout(timeout) {}

    const std::chrono::milliseconds timeout;
    runtime::RunControl control;

    std::mutex mutex;
    std::optional<Clock::time_point> deadline;  ///< Set when the run starts
    std::optional<Result<ExecutionResult>> outcome;
    bool abandoned{false};
    std::function<void()> notify;  ///< Wakes the orchestrator; cleared on abandon
};

/**
 * @brief start + timeout, saturating at the clock's maximum
 */
Clock::time_point deadlineAfter(Clock::time_point start,
                                std::chrono::milliseconds timeout) {
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - start);
    if (timeout >= headroom) {
        return Clock::time_point::max();
    }
    return start + timeout;
}

/**
 * @brief Marks the slot abandoned when the orchestrating coroutine ends,
 *        including when its frame is destroyed with the event loop
 */
struct AbandonOnExit {
    std::shared_ptr<RunSlot> slot;

    ~AbandonOnExit() {
        std::lock_guard lock(slot->mutex);
        slot->abandoned = true;
        slot->notify = nullptr;
    }
};

/**
 * @brief Periodically advances the engine's interrupt counter
 */
class EpochTicker : public std::enable_shared_from_this<EpochTicker> {
public:
    EpochTicker(net::any_io_executor executor, EngineHandle engine,
                std::chrono::milliseconds interval)
        : timer_(std::move(executor)), engine_(std::move(engine)),
          interval_(interval) {}

    void start() {
        net::co_spawn(timer_.get_executor(), run(shared_from_this()),
                      net::detached);
    }

    /// Must be called on the ticker's executor.
    void stop() {
        stopped_ = true;
        timer_.cancel();
    }

private:
    static net::awaitable<void> run(std::shared_ptr<EpochTicker> self) {
        while (!self->stopped_) {
            self->timer_.expires_after(self->interval_);
            boost::system::error_code ec;
            co_await self->timer_.async_wait(
                net::redirect_error(net::use_awaitable, ec));
            if (self->stopped_) {
                break;
            }
            self->engine_.incrementEpoch();
        }
    }

    net::steady_timer timer_;
    EngineHandle engine_;
    std::chrono::milliseconds interval_;
    bool stopped_{false};
};

Result<ExecutionResult> runGuest(const GuestProgram& program,
                                 const std::string& code,
                                 std::optional<std::string> input,
                                 runtime::RunControl& control) {
    const auto& config = program.config;
    const auto start = Clock::now();

    std::string fullCode =
        config.prelude ? fmt::format("{}\n{}", *config.prelude, code) : code;

    runtime::GuestIo io(config.stdinData ? config.stdinData : std::move(input));

    runtime::GuestInvocation invocation;
    invocation.argv = {"python", "-c", std::move(fullCode)};
    invocation.env = config.envVars;
    invocation.fuel = config.maxFuel;

    SandboxLimiter limiter(config.maxMemory);

    const auto report = program.engine.engine().run(*program.module, invocation,
                                                    io, limiter, control);
    const auto elapsed = Clock::now() - start;

    auto exitCode = classifyRun(report, limiter, config.maxFuel, elapsed);
    if (!exitCode) {
        return std::unexpected(exitCode.error());
    }

    ExecutionResult result;
    result.stdoutText = io.stdoutStream.toStringLossy();
    result.stderrText = io.stderrStream.toStringLossy();
    result.exitCode = *exitCode;
    result.metadata.duration = elapsed;
    result.metadata.peakMemoryBytes = limiter.peakMemory();
    result.metadata.fuelConsumed =
        fuelConsumed(config.maxFuel, report.fuelRemaining);
    result.metadata.usedCachedModule = program.usedCachedModule;
    return result;
}

void runBlocking(const std::shared_ptr<const GuestProgram>& program,
                 const std::shared_ptr<RunSlot>& slot, const std::string& code,
                 std::optional<std::string> input) {
    {
        std::lock_guard lock(slot->mutex);
        if (slot->abandoned) {
            return;
        }
        const auto deadline = deadlineAfter(Clock::now(), slot->timeout);
        slot->control.setDeadline(deadline);
        slot->deadline = deadline;
        if (slot->notify) {
            slot->notify();
        }
    }

    Result<ExecutionResult> outcome;
    try {
        outcome = runGuest(*program, code, std::move(input), slot->control);
    } catch (const std::exception& e) {
        outcome = std::unexpected(SandboxError::executionFailed(
            fmt::format("task panicked: {}", e.what())));
    } catch (...) {
        outcome = std::unexpected(
            SandboxError::executionFailed("task panicked: unknown exception"));
    }

    std::lock_guard lock(slot->mutex);
    if (slot->abandoned) {
        auto logger = logging::LogConfig::getLogger();
        PYVAULT_LOG_DEBUG(logger, "Discarding outcome of an abandoned execution");
        return;
    }
    slot->outcome = std::move(outcome);
    if (slot->notify) {
        slot->notify();
    }
}

net::awaitable<Result<ExecutionResult>> orchestrate(
    std::shared_ptr<const SandboxState> sandbox, std::string code,
    std::optional<std::string> input) {
    auto executor = co_await net::this_coro::executor;
    const auto& program = sandbox->program;
    const auto& config = program->config;
    auto logger = logging::LogConfig::getLogger();

    PYVAULT_LOG_DEBUG(logger, "Starting execution ({} bytes of code)",
                      code.size());

    auto ticker = std::make_shared<EpochTicker>(executor, program->engine,
                                                config.epochTickInterval);
    ticker->start();

    auto slot = std::make_shared<RunSlot>(config.timeout);
    AbandonOnExit guard{slot};

    // Armed once the run has a thread; time spent queued does not count.
    auto deadline = std::make_shared<net::steady_timer>(executor);
    deadline->expires_at(Clock::time_point::max());
    slot->notify = [executor, weak = std::weak_ptr(deadline)] {
        net::post(executor, [weak] {
            if (auto timer = weak.lock()) {
                timer->cancel();
            }
        });
    };

    const bool submitted = sandbox->pool->submit(
        [program, slot, code = std::move(code),
         input = std::move(input)]() mutable {
            runBlocking(program, slot, code, std::move(input));
        });
    if (!submitted) {
        ticker->stop();
        PYVAULT_LOG_ERROR(logger, "Execution pool no longer accepts work");
        co_return std::unexpected(
            SandboxError::executionFailed("execution pool is shut down"));
    }

    std::optional<Result<ExecutionResult>> outcome;
    bool armed = false;
    for (;;) {
        boost::system::error_code ec;
        co_await deadline->async_wait(
            net::redirect_error(net::use_awaitable, ec));

        std::lock_guard lock(slot->mutex);
        if (slot->outcome) {
            outcome = std::move(slot->outcome);
            break;
        }
        if (!slot->deadline) {
            continue;
        }
        if (!armed) {
            deadline->expires_at(*slot->deadline);
            armed = true;
            continue;
        }
        if (Clock::now() >= *slot->deadline) {
            break;
        }
    }
    ticker->stop();
    {
        std::lock_guard lock(slot->mutex);
        slot->abandoned = true;
        slot->notify = nullptr;
    }

    if (!outcome) {
        slot->control.requestInterrupt();
        program->engine.incrementEpoch();
        PYVAULT_LOG_WARN(logger, "Execution timed out after {}",
                         formatDuration(config.timeout));
        co_return std::unexpected(SandboxError::timeout(config.timeout));
    }

    if (*outcome) {
        const auto& result = **outcome;
        PYVAULT_LOG_INFO(
            logger,
            "Execution finished: exit_code={}, duration={}, peak_memory={}",
            result.exitCode, formatDuration(result.metadata.duration),
            result.metadata.peakMemoryBytes);
    } else {
        PYVAULT_LOG_DEBUG(logger, "Execution failed: {}",
                          outcome->error().message());
    }
    co_return std::move(*outcome);
}

SandboxError movedFromError() {
    return SandboxError::executionFailed("sandbox has been moved from");
}

net::awaitable<Result<ExecutionResult>> rejectMovedFrom() {
    co_return std::unexpected(movedFromError());
}

net::awaitable<Result<ExecutionResult>> orchestrateOnStrand(
    std::shared_ptr<const SandboxState> sandbox, std::string code,
    std::optional<std::string> input) {
    auto executor = co_await net::this_coro::executor;
    co_return co_await net::co_spawn(
        net::make_strand(executor),
        orchestrate(std::move(sandbox), std::move(code), std::move(input)),
        net::use_awaitable);
}

Result<ModulePtr> resolveModule(const SandboxConfig& config,
                                const EngineHandle& engine,
                                const SandboxOptions& options,
                                bool& wasCached) {
    if (!options.useCache) {
        wasCached = false;
        return compileModuleFile(engine, config.interpreterPath);
    }
    auto& cache = options.cache ? *options.cache : ModuleCache::global();
    wasCached = cache.contains(engine, config.interpreterPath);
    return cache.getOrCompile(engine, config.interpreterPath);
}

}  // namespace

// ============================================================================
// PythonSandbox
// ============================================================================

PythonSandbox::PythonSandbox(std::shared_ptr<const detail::SandboxState> state)
    : state_(std::move(state)) {}

PythonSandbox::~PythonSandbox() = default;

PythonSandbox::PythonSandbox(PythonSandbox&&) noexcept = default;
PythonSandbox& PythonSandbox::operator=(PythonSandbox&&) noexcept = default;

Result<PythonSandbox> PythonSandbox::create(SandboxConfig config,
                                            EngineHandle engine,
                                            SandboxOptions options) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (config.maxFuel && !engine.fuelEnabled()) {
        return std::unexpected(SandboxError::config(
            "max_fuel requires an engine with fuel accounting enabled"));
    }

    auto logger = logging::LogConfig::getLogger();

    bool wasCached = false;
    auto module = resolveModule(config, engine, options, wasCached);
    if (!module) {
        PYVAULT_LOG_ERROR(logger, "Failed to load interpreter {}: {}",
                          config.interpreterPath.string(),
                          module.error().message());
        return std::unexpected(module.error());
    }

    PYVAULT_LOG_DEBUG(logger, "Sandbox created for {} (cached module: {})",
                      config.interpreterPath.string(), wasCached);

    auto program = std::make_shared<const GuestProgram>(GuestProgram{
        .config = std::move(config),
        .engine = std::move(engine),
        .module = std::move(*module),
        .usedCachedModule = wasCached,
    });
    auto state = std::make_shared<SandboxState>(SandboxState{
        .program = std::move(program),
        .ownedPool = std::move(options.pool),
    });
    state->pool =
        state->ownedPool ? state->ownedPool.get() : &ExecutionPool::global();

    return PythonSandbox(std::move(state));
}

net::awaitable<Result<ExecutionResult>> PythonSandbox::execute(
    std::string code, std::optional<std::string> input) const {
    if (!state_) {
        return rejectMovedFrom();
    }
    return orchestrateOnStrand(state_, std::move(code), std::move(input));
}

Result<ExecutionResult> PythonSandbox::executeSync(
    std::string code, std::optional<std::string> input) const {
    if (!state_) {
        return std::unexpected(movedFromError());
    }
    net::io_context ioContext;
    auto future = net::co_spawn(
        net::make_strand(ioContext),
        orchestrate(state_, std::move(code), std::move(input)), net::use_future);
    ioContext.run();

    try {
        return future.get();
    } catch (const std::exception& e) {
        return std::unexpected(SandboxError::executionFailed(
            fmt::format("execution aborted: {}", e.what())));
    }
}

const SandboxConfig& PythonSandbox::config() const { return state_->program->config; }

const EngineHandle& PythonSandbox::engine() const { return state_->program->engine; }

bool PythonSandbox::isUsingCachedModule() const {
    return state_->program->usedCachedModule;
}

}  // namespace pyvault::sandbox
