// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for p2p_convert_system
 *
 * Sender transfers and receiver streams run as independent tasks on a pool
 * obtained through this adapter:
 * - thread_system's thread_pool when available
 * - network_system's basic_thread_pool otherwise
 * - std::async as the last resort
 *
 * Every task is submitted to a named stage ("send", "serve") so the number
 * of queued or running tasks per stage can be observed.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::p2p_convert::adapters {

/**
 * @brief Stage names used by the orchestrators
 */
namespace stage {
inline constexpr const char* send = "send";
inline constexpr const char* serve = "serve";
}  // namespace stage

/**
 * @brief Worker pool used by the sender and receiver
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Run @p task on the pool under @p stage_name
     * @return Future completed when the task returns; exceptions thrown by
     *         the task are stored in it
     */
    virtual std::future<void> submit(std::function<void()> task,
                                     const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks queued or running in @p stage_name
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;

    /**
     * @brief Tasks queued or running in any stage
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over kcenon::thread::thread_pool
 */
class thread_system_pool_adapter : public task_pool_interface {
public:
    thread_system_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                               const std::string& pool_name, size_t worker_count);
    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of workers (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task,
                             const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Adapter over network_system's thread_pool_interface
 */
class network_pool_adapter : public task_pool_interface {
public:
    network_pool_adapter(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
        const std::string& pool_name);
    ~network_pool_adapter() override;

    network_pool_adapter(const network_pool_adapter&) = delete;
    network_pool_adapter& operator=(const network_pool_adapter&) = delete;

    /**
     * @brief Create an adapter backed by network_system's basic_thread_pool
     */
    [[nodiscard]] static std::shared_ptr<network_pool_adapter> create(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task,
                             const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback running every task through std::async
 *
 * @note worker_count() reports the configured count, but tasks are not
 *       bounded by it.
 */
class async_task_pool : public task_pool_interface {
public:
    explicit async_task_pool(size_t worker_count = 0);
    ~async_task_pool() override;

    async_task_pool(const async_task_pool&) = delete;
    async_task_pool& operator=(const async_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task,
                             const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available pool implementation
 *
 * Priority: thread_system, then network_system, then std::async.
 */
class task_pool_factory {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count, const std::string& pool_name);

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::p2p_convert::adapters
