// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pools that run upload and prefetch work
 *
 * The engine and the preflight optimizer never create threads per file; they
 * hand work to an upload_worker_pool_interface. The implementation is chosen
 * from what is compiled in:
 * - thread_system_worker_pool (KCENON_WITH_THREAD_SYSTEM)
 * - network_worker_pool (KCENON_WITH_NETWORK_SYSTEM only)
 * - async_worker_pool (std::async fallback)
 *
 * Work is tagged with a stage so pending counts can be reported per stage.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::image_upload::adapters {

/**
 * @brief Stage names used for pending-task accounting
 */
namespace stage {
inline constexpr const char* upload = "upload";
inline constexpr const char* prefetch = "prefetch";
}  // namespace stage

/**
 * @brief Pool of workers executing upload work
 */
class upload_worker_pool_interface {
public:
    virtual ~upload_worker_pool_interface() = default;

    /**
     * @brief Run a task on a worker
     * @return Future that completes (or rethrows) when the task finishes
     */
    virtual auto submit(std::function<void()> task) -> std::future<void> = 0;

    /**
     * @brief Run a task after a delay (retry backoff)
     */
    virtual auto submit_delayed(std::function<void()> task,
                                std::chrono::milliseconds delay) -> std::future<void> = 0;

    /**
     * @brief Run a task and count it against a stage until it finishes
     */
    virtual auto submit_to_stage(std::function<void()> task,
                                 const std::string& stage_name) -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual auto pending_tasks() const -> std::size_t = 0;

    /**
     * @brief Unfinished tasks submitted to a stage
     */
    [[nodiscard]] virtual auto pending_tasks(const std::string& stage_name) const
        -> std::size_t = 0;

    /**
     * @brief Name used in log messages
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system's thread_pool
 *
 * @note Thread-safe.
 */
class thread_system_worker_pool : public upload_worker_pool_interface {
public:
    thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                              std::string pool_name, std::size_t workers);
    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    auto operator=(const thread_system_worker_pool&) -> thread_system_worker_pool& = delete;

    /**
     * @brief Create and start a pool with the given number of workers
     * @param workers Worker count (0 = hardware concurrency)
     */
    [[nodiscard]] static auto create(std::size_t workers, const std::string& pool_name)
        -> std::shared_ptr<thread_system_worker_pool>;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_delayed(std::function<void()> task,
                        std::chrono::milliseconds delay) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;
    [[nodiscard]] auto name() const -> std::string override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Pool backed by network_system's thread_pool_interface
 *
 * Lets uploads share the pool network_system already runs I/O on.
 */
class network_worker_pool : public upload_worker_pool_interface {
public:
    network_worker_pool(std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
                        std::string pool_name);
    ~network_worker_pool() override;

    network_worker_pool(const network_worker_pool&) = delete;
    auto operator=(const network_worker_pool&) -> network_worker_pool& = delete;

    /**
     * @brief Create a pool over network_system's basic_thread_pool
     */
    [[nodiscard]] static auto create(std::size_t workers, const std::string& pool_name)
        -> std::shared_ptr<network_worker_pool>;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_delayed(std::function<void()> task,
                        std::chrono::milliseconds delay) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;
    [[nodiscard]] auto name() const -> std::string override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief std::async fallback
 *
 * Every task gets its own thread; the caller bounds how many it submits.
 * worker_count() reports the configured size.
 */
class async_worker_pool : public upload_worker_pool_interface {
public:
    explicit async_worker_pool(std::size_t workers = 0, std::string pool_name = "async_pool");
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    auto operator=(const async_worker_pool&) -> async_worker_pool& = delete;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_delayed(std::function<void()> task,
                        std::chrono::milliseconds delay) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;
    [[nodiscard]] auto name() const -> std::string override;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

/**
 * @brief Selects the best available pool
 *
 * Priority: thread_system, then network_system, then std::async.
 */
class worker_pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t workers, const std::string& pool_name)
        -> std::shared_ptr<upload_worker_pool_interface>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr auto has_network_pool() noexcept -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::image_upload::adapters
