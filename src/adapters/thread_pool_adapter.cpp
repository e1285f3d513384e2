// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation for p2p_convert_system
 */

#include "kcenon/p2p_convert/adapters/thread_pool_adapter.h"

#include "kcenon/p2p_convert/core/logging.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::p2p_convert::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    const auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

/**
 * @brief Per-stage count of queued and running tasks
 */
class stage_tracker {
public:
    void enter(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
        ++total_;
    }

    void leave(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
            --total_;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

    [[nodiscard]] size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
    size_t total_{0};
};

/**
 * @brief Wrap @p task so that it settles @p promise and leaves its stage
 *
 * The tracker is shared so that a task finishing after its adapter is gone
 * does not touch freed memory.
 */
auto make_tracked_task(std::function<void()> task, std::shared_ptr<std::promise<void>> promise,
                       std::shared_ptr<stage_tracker> tracker, std::string stage_name)
    -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise), tracker = std::move(tracker),
            stage_name = std::move(stage_name)]() {
        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }
        tracker->leave(stage_name);
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs a single std::function on a thread_system worker
 */
class function_job : public kcenon::thread::job {
public:
    function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() = default;

std::shared_ptr<thread_system_pool_adapter> thread_system_pool_adapter::create(
    size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    P2PC_LOG_DEBUG(log_category::transfer, "thread_system pool '" + pool_name + "' started with " +
                                               std::to_string(worker_count) + " workers");
    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task,
                                                     const std::string& stage_name) {
    pimpl_->tracker->enter(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto job = std::make_unique<function_job>(
        make_tracked_task(std::move(task), promise, pimpl_->tracker, stage_name),
        pimpl_->pool_name + ":" + stage_name);
    pimpl_->pool->enqueue(std::move(job));
    return future;
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pool_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

size_t thread_system_pool_adapter::pending_tasks() const {
    return pimpl_->tracker->total();
}

std::string thread_system_pool_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_pool_adapter::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::string pool_name;
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

network_pool_adapter::network_pool_adapter(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
    const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
}

network_pool_adapter::~network_pool_adapter() = default;

std::shared_ptr<network_pool_adapter> network_pool_adapter::create(size_t worker_count,
                                                                   const std::string& pool_name) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        resolve_worker_count(worker_count));
    return std::make_shared<network_pool_adapter>(std::move(pool), pool_name);
}

std::future<void> network_pool_adapter::submit(std::function<void()> task,
                                               const std::string& stage_name) {
    pimpl_->tracker->enter(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    // The pool's own future is not needed; completion flows through the promise
    (void)pimpl_->pool->submit(
        make_tracked_task(std::move(task), promise, pimpl_->tracker, stage_name));
    return future;
}

size_t network_pool_adapter::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_pool_adapter::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_pool_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

size_t network_pool_adapter::pending_tasks() const {
    return pimpl_->tracker->total();
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_task_pool implementation
// ============================================================================

struct async_task_pool::impl {
    size_t worker_count{0};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

async_task_pool::async_task_pool(size_t worker_count) : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_task_pool::~async_task_pool() = default;

std::future<void> async_task_pool::submit(std::function<void()> task,
                                          const std::string& stage_name) {
    pimpl_->tracker->enter(stage_name);

    auto tracker = pimpl_->tracker;
    return std::async(std::launch::async,
                      [task = std::move(task), tracker = std::move(tracker), stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              tracker->leave(stage_name);
                              throw;
                          }
                          tracker->leave(stage_name);
                      });
}

size_t async_task_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_task_pool::is_running() const {
    return true;
}

size_t async_task_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

size_t async_task_pool::pending_tasks() const {
    return pimpl_->tracker->total();
}

// ============================================================================
// task_pool_factory implementation
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(size_t worker_count,
                                                               const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_pool_adapter::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_task_pool>(worker_count);
#endif
}

}  // namespace kcenon::p2p_convert::adapters
