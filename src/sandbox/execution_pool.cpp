/*
 * execution_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "execution_pool.hpp"

#include "logging/log_config.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>

namespace pyvault::sandbox {

ExecutionPool::ExecutionPool(std::size_t threads, std::size_t maxThreads)
    : workGuard_(boost::asio::make_work_guard(ioContext_)),
      maxThreads_(std::max<std::size_t>(maxThreads, 1)) {
    const auto core = std::clamp<std::size_t>(threads, 1, maxThreads_);
    std::lock_guard lock(mutex_);
    workers_.reserve(core);
    for (std::size_t i = 0; i < core; ++i) {
        spawnWorker();
    }
}

ExecutionPool::~ExecutionPool() { join(); }

ExecutionPool& ExecutionPool::global() {
    static auto* instance = new ExecutionPool();
    return *instance;
}

bool ExecutionPool::submit(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (joined_) {
            return false;
        }
        ++pending_;
        if (pending_ > workers_.size() && workers_.size() < maxThreads_) {
            spawnWorker();
            auto logger = logging::LogConfig::getLogger();
            PYVAULT_LOG_DEBUG(logger, "Execution pool grew to {} threads",
                              workers_.size());
        }
    }

    boost::asio::post(ioContext_, [this, task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            auto logger = logging::LogConfig::getLogger();
            PYVAULT_LOG_ERROR(logger, "Blocking task failed: {}", e.what());
        }
        std::lock_guard lock(mutex_);
        --pending_;
    });
    return true;
}

std::size_t ExecutionPool::threadCount() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
}

std::size_t ExecutionPool::pendingCount() const {
    std::lock_guard lock(mutex_);
    return pending_;
}

void ExecutionPool::join() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        if (joined_) {
            return;
        }
        joined_ = true;
        workers = std::move(workers_);
    }

    workGuard_.reset();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t ExecutionPool::defaultThreadCount() noexcept {
    return std::max<std::size_t>(4, std::thread::hardware_concurrency());
}

// Caller holds mutex_.
void ExecutionPool::spawnWorker() {
    workers_.emplace_back([this] { ioContext_.run(); });
}

}  // namespace pyvault::sandbox
