// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for chunk tasks
 *
 * Chunk hashing, probing and uploading run on a worker pool behind
 * upload_worker_pool. thread_system's thread_pool is used when available;
 * otherwise tasks run on std::async threads. In both cases the number of
 * tasks alive at once is bounded by the dispatcher's admission gate, not
 * by the pool.
 *
 * Features:
 * - Stage-based task tracking ("chunk_upload" by default)
 * - Seamless integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::chunked_upload::adapters {

/**
 * @brief Per-stage count of submitted but unfinished tasks
 */
class stage_tracker {
public:
    void enter(const std::string& stage_name);

    void leave(const std::string& stage_name);

    [[nodiscard]] auto count(const std::string& stage_name) const -> std::size_t;

    [[nodiscard]] auto total() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> counts_;
};

/**
 * @brief Interface for the pool that executes chunk tasks
 */
class upload_worker_pool {
public:
    static constexpr const char* default_stage = "chunk_upload";

    virtual ~upload_worker_pool() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that completes when the task has run; an exception
     *         thrown by the task is stored in the future
     */
    virtual auto submit(std::function<void()> task) -> std::future<void> = 0;

    /**
     * @brief Submit a task counted under a named stage
     * @param task The task to execute
     * @param stage_name Stage name for pending_tasks(stage_name)
     */
    virtual auto submit_to_stage(std::function<void()> task,
                                 const std::string& stage_name) -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual auto pending_tasks() const -> std::size_t = 0;

    [[nodiscard]] virtual auto pending_tasks(const std::string& stage_name) const
        -> std::size_t = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Runs chunk tasks on thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public upload_worker_pool {
public:
    /**
     * @brief Construct with an existing, started thread_pool
     * @param pool thread_system pool
     * @param pool_name Name used in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                       std::string pool_name = "chunk_upload_pool",
                                       std::size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    auto operator=(const thread_system_worker_pool&) -> thread_system_worker_pool& = delete;

    /**
     * @brief Create and start a pool with the given number of workers
     * @param worker_count Worker threads (0 = hardware concurrency)
     * @param pool_name Name used in logs
     */
    [[nodiscard]] static auto create(std::size_t worker_count = 0,
                                     const std::string& pool_name = "chunk_upload_pool")
        -> std::shared_ptr<thread_system_worker_pool>;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;

    [[nodiscard]] auto underlying_pool() const -> std::shared_ptr<kcenon::thread::thread_pool>;

    [[nodiscard]] auto pool_name() const -> const std::string&;

private:
    auto enqueue(std::function<void()> task, std::string stage_name) -> std::future<void>;

    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::string pool_name_;
    std::size_t worker_count_;
    std::shared_ptr<stage_tracker> tracker_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool running each task on its own std::async thread
 *
 * worker_count() reports hardware concurrency. The effective parallelism
 * is whatever the caller admits.
 */
class async_worker_pool : public upload_worker_pool {
public:
    async_worker_pool();
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    auto operator=(const async_worker_pool&) -> async_worker_pool& = delete;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;

private:
    std::shared_ptr<stage_tracker> tracker_;
};

/**
 * @brief Selects the worker pool implementation
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @brief Create the best available pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static auto create(std::size_t worker_count = 0,
                                     const std::string& pool_name = "chunk_upload_pool")
        -> std::shared_ptr<upload_worker_pool>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::chunked_upload::adapters
