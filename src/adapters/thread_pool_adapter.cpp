// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::chunked_upload::adapters {

// ============================================================================
// stage_tracker implementation
// ============================================================================

void stage_tracker::enter(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[stage_name];
}

void stage_tracker::leave(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    if (it != counts_.end() && it->second > 0) {
        --it->second;
    }
}

auto stage_tracker::count(const std::string& stage_name) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    return it != counts_.end() ? it->second : 0;
}

auto stage_tracker::total() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t sum = 0;
    for (const auto& [name, count] : counts_) {
        sum += count;
    }
    return sum;
}

namespace {

auto default_worker_count() -> std::size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief Wrap a task so it settles a promise and leaves its stage
 */
auto make_settling_task(std::function<void()> task,
                        std::shared_ptr<std::promise<void>> promise,
                        std::shared_ptr<stage_tracker> tracker,
                        std::string stage_name) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise),
            tracker = std::move(tracker), stage = std::move(stage_name)]() {
        try {
            task();
        } catch (...) {
            tracker->leave(stage);
            promise->set_exception(std::current_exception());
            return;
        }
        tracker->leave(stage);
        promise->set_value();
    };
}

}  // namespace

/**
 * @brief Job that runs one chunk task on a thread_system worker
 */
class chunk_task_job : public kcenon::thread::job {
public:
    explicit chunk_task_job(std::function<void()> func)
        : job("chunk_task"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    std::string pool_name,
    std::size_t worker_count)
    : pool_(std::move(pool)),
      pool_name_(std::move(pool_name)),
      worker_count_(worker_count),
      tracker_(std::make_shared<stage_tracker>()) {}

thread_system_worker_pool::~thread_system_worker_pool() {
    if (pool_) {
        pool_->stop(false);
    }
}

auto thread_system_worker_pool::create(std::size_t worker_count,
                                       const std::string& pool_name)
    -> std::shared_ptr<thread_system_worker_pool> {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name,
                                                       worker_count);
}

auto thread_system_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    return enqueue(std::move(task), std::string{});
}

auto thread_system_worker_pool::submit_to_stage(std::function<void()> task,
                                                const std::string& stage_name)
    -> std::future<void> {
    return enqueue(std::move(task), stage_name);
}

auto thread_system_worker_pool::enqueue(std::function<void()> task, std::string stage_name)
    -> std::future<void> {
    tracker_->enter(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto job = std::make_unique<chunk_task_job>(
        make_settling_task(std::move(task), promise, tracker_, std::move(stage_name)));
    pool_->enqueue(std::move(job));

    return future;
}

auto thread_system_worker_pool::worker_count() const -> std::size_t {
    return worker_count_;
}

auto thread_system_worker_pool::is_running() const -> bool {
    return pool_ != nullptr;
}

auto thread_system_worker_pool::pending_tasks() const -> std::size_t {
    return tracker_->total();
}

auto thread_system_worker_pool::pending_tasks(const std::string& stage_name) const
    -> std::size_t {
    return tracker_->count(stage_name);
}

auto thread_system_worker_pool::underlying_pool() const
    -> std::shared_ptr<kcenon::thread::thread_pool> {
    return pool_;
}

auto thread_system_worker_pool::pool_name() const -> const std::string& {
    return pool_name_;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

async_worker_pool::async_worker_pool() : tracker_(std::make_shared<stage_tracker>()) {}

async_worker_pool::~async_worker_pool() = default;

auto async_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    return submit_to_stage(std::move(task), std::string{});
}

auto async_worker_pool::submit_to_stage(std::function<void()> task,
                                        const std::string& stage_name)
    -> std::future<void> {
    tracker_->enter(stage_name);

    return std::async(std::launch::async,
                      [tracker = tracker_, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              tracker->leave(stage);
                              throw;
                          }
                          tracker->leave(stage);
                      });
}

auto async_worker_pool::worker_count() const -> std::size_t {
    return default_worker_count();
}

auto async_worker_pool::is_running() const -> bool {
    return true;
}

auto async_worker_pool::pending_tasks() const -> std::size_t {
    return tracker_->total();
}

auto async_worker_pool::pending_tasks(const std::string& stage_name) const -> std::size_t {
    return tracker_->count(stage_name);
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

auto worker_pool_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<upload_worker_pool> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_worker_pool>();
#endif
}

}  // namespace kcenon::chunked_upload::adapters
