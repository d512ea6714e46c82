/*
 * execution_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef PYVAULT_SANDBOX_EXECUTION_POOL_HPP
#define PYVAULT_SANDBOX_EXECUTION_POOL_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pyvault::sandbox {

/**
 * @brief Threads reserved for blocking guest runs
 *
 * Guest code runs synchronously inside the engine, so it never executes on
 * the caller's event loop. The pool starts with a core set of workers and
 * adds one whenever every worker is busy, up to maxThreads(); only then do
 * runs queue. A run abandoned after a timeout keeps its thread until the
 * engine reaches its next interrupt safepoint or its host call returns.
 */
class ExecutionPool {
public:
    static constexpr std::size_t kDefaultMaxThreads = 512;

    explicit ExecutionPool(std::size_t threads = defaultThreadCount(),
                           std::size_t maxThreads = kDefaultMaxThreads);

    /// Waits for runs still in flight.
    ~ExecutionPool();

    ExecutionPool(const ExecutionPool&) = delete;
    ExecutionPool& operator=(const ExecutionPool&) = delete;

    /**
     * @brief Process-wide pool, created on first use
     *
     * Never destroyed, so process exit does not wait on a guest parked in a
     * host call.
     */
    [[nodiscard]] static ExecutionPool& global();

    /**
     * @brief Queue a blocking task, growing the pool if no worker is idle
     * @return false once the pool has been joined
     */
    [[nodiscard]] bool submit(std::function<void()> task);

    /// Workers started so far.
    [[nodiscard]] std::size_t threadCount() const;

    [[nodiscard]] std::size_t maxThreads() const noexcept { return maxThreads_; }

    /// Tasks queued or running.
    [[nodiscard]] std::size_t pendingCount() const;

    /// Stop accepting work and wait for queued and running tasks.
    void join();

    [[nodiscard]] static std::size_t defaultThreadCount() noexcept;

private:
    void spawnWorker();

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        workGuard_;
    const std::size_t maxThreads_;

    mutable std::mutex mutex_;
    std::vector<std::thread> workers_;
    std::size_t pending_{0};
    bool joined_{false};
};

}  // namespace pyvault::sandbox

#endif  // PYVAULT_SANDBOX_EXECUTION_POOL_HPP
