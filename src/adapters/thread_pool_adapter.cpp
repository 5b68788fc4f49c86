// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations
 */

#include "kcenon/image_upload/adapters/thread_pool_adapter.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::image_upload::adapters {

// ============================================================================
// Task accounting (shared by every implementation)
// ============================================================================

namespace {

auto resolve_worker_count(std::size_t workers) -> std::size_t {
    if (workers > 0) {
        return workers;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

/**
 * @brief Counts unfinished tasks, overall and per stage
 *
 * Held by shared_ptr so queued tasks keep it alive past the pool.
 */
class task_accounting {
public:
    /**
     * @brief Wrap a task so its completion is counted and reported
     * @param task Work to run
     * @param stage Stage to count against (empty = none)
     * @param delay Sleep before running
     * @param[out] future Completes when the task finishes
     */
    static auto wrap(const std::shared_ptr<task_accounting>& self,
                     std::function<void()> task,
                     std::string stage,
                     std::chrono::milliseconds delay,
                     std::future<void>& future) -> std::function<void()> {
        auto promise = std::make_shared<std::promise<void>>();
        future = promise->get_future();
        self->begin(stage);

        return [self, task = std::move(task), stage = std::move(stage), delay, promise]() {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            self->end(stage);
        };
    }

    [[nodiscard]] auto total() const -> std::size_t {
        return total_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto count(const std::string& stage) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = stages_.find(stage);
        return it != stages_.end() ? it->second : 0;
    }

private:
    void begin(const std::string& stage) {
        total_.fetch_add(1, std::memory_order_relaxed);
        if (!stage.empty()) {
            std::lock_guard lock(mutex_);
            ++stages_[stage];
        }
    }

    void end(const std::string& stage) {
        total_.fetch_sub(1, std::memory_order_relaxed);
        if (!stage.empty()) {
            std::lock_guard lock(mutex_);
            auto it = stages_.find(stage);
            if (it != stages_.end() && it->second > 0) {
                --it->second;
            }
        }
    }

    std::atomic<std::size_t> total_{0};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> stages_;
};

}  // namespace

// ============================================================================
// thread_system_worker_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief thread_system job running one wrapped task
 */
class upload_job : public kcenon::thread::job {
public:
    upload_job(std::function<void()> work, const std::string& name)
        : job(name), work_(std::move(work)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (work_) {
            work_();
        }
        return common::ok();
    }

private:
    std::function<void()> work_;
};

}  // namespace

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    std::size_t workers{0};
    std::shared_ptr<task_accounting> accounting = std::make_shared<task_accounting>();

    auto enqueue(std::function<void()> task, std::string stage,
                 std::chrono::milliseconds delay, const char* job_name) -> std::future<void> {
        std::future<void> future;
        auto work = task_accounting::wrap(accounting, std::move(task), std::move(stage),
                                          delay, future);
        pool->enqueue(std::make_unique<upload_job>(std::move(work), job_name));
        return future;
    }
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::string pool_name,
    std::size_t workers)
    : impl_(std::make_unique<impl>()) {
    impl_->pool = std::move(pool);
    impl_->pool_name = std::move(pool_name);
    impl_->workers = workers;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

auto thread_system_worker_pool::create(std::size_t workers, const std::string& pool_name)
    -> std::shared_ptr<thread_system_worker_pool> {
    workers = resolve_worker_count(workers);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name, workers);
}

auto thread_system_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    return impl_->enqueue(std::move(task), {}, std::chrono::milliseconds(0), "upload_task");
}

auto thread_system_worker_pool::submit_delayed(std::function<void()> task,
                                               std::chrono::milliseconds delay)
    -> std::future<void> {
    return impl_->enqueue(std::move(task), {}, delay, "delayed_upload_task");
}

auto thread_system_worker_pool::submit_to_stage(std::function<void()> task,
                                                const std::string& stage_name)
    -> std::future<void> {
    return impl_->enqueue(std::move(task), stage_name, std::chrono::milliseconds(0),
                          "staged_upload_task");
}

auto thread_system_worker_pool::worker_count() const -> std::size_t {
    return impl_->workers;
}

auto thread_system_worker_pool::is_running() const -> bool {
    return impl_->pool != nullptr;
}

auto thread_system_worker_pool::pending_tasks() const -> std::size_t {
    return impl_->accounting->total();
}

auto thread_system_worker_pool::pending_tasks(const std::string& stage_name) const
    -> std::size_t {
    return impl_->accounting->count(stage_name);
}

auto thread_system_worker_pool::name() const -> std::string {
    return impl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_worker_pool
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_worker_pool::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::string pool_name;
    std::shared_ptr<task_accounting> accounting = std::make_shared<task_accounting>();
};

network_worker_pool::network_worker_pool(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
    std::string pool_name)
    : impl_(std::make_unique<impl>()) {
    impl_->pool = std::move(pool);
    impl_->pool_name = std::move(pool_name);
}

network_worker_pool::~network_worker_pool() = default;

auto network_worker_pool::create(std::size_t workers, const std::string& pool_name)
    -> std::shared_ptr<network_worker_pool> {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        resolve_worker_count(workers));
    return std::make_shared<network_worker_pool>(std::move(pool), pool_name);
}

auto network_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    std::future<void> future;
    auto work = task_accounting::wrap(impl_->accounting, std::move(task), {},
                                      std::chrono::milliseconds(0), future);
    (void)impl_->pool->submit(std::move(work));
    return future;
}

auto network_worker_pool::submit_delayed(std::function<void()> task,
                                         std::chrono::milliseconds delay)
    -> std::future<void> {
    std::future<void> future;
    auto work = task_accounting::wrap(impl_->accounting, std::move(task), {},
                                      std::chrono::milliseconds(0), future);
    (void)impl_->pool->submit_delayed(std::move(work), delay);
    return future;
}

auto network_worker_pool::submit_to_stage(std::function<void()> task,
                                          const std::string& stage_name)
    -> std::future<void> {
    std::future<void> future;
    auto work = task_accounting::wrap(impl_->accounting, std::move(task), stage_name,
                                      std::chrono::milliseconds(0), future);
    (void)impl_->pool->submit(std::move(work));
    return future;
}

auto network_worker_pool::worker_count() const -> std::size_t {
    return impl_->pool ? impl_->pool->worker_count() : 0;
}

auto network_worker_pool::is_running() const -> bool {
    return impl_->pool ? impl_->pool->is_running() : false;
}

auto network_worker_pool::pending_tasks() const -> std::size_t {
    return impl_->accounting->total();
}

auto network_worker_pool::pending_tasks(const std::string& stage_name) const -> std::size_t {
    return impl_->accounting->count(stage_name);
}

auto network_worker_pool::name() const -> std::string {
    return impl_->pool_name;
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

struct async_worker_pool::impl {
    std::size_t workers{0};
    std::string pool_name;
    std::shared_ptr<task_accounting> accounting = std::make_shared<task_accounting>();

    std::mutex running_mutex;
    std::vector<std::future<void>> running;  ///< std::async handles; joined on destruction

    auto launch(std::function<void()> task, std::string stage,
                std::chrono::milliseconds delay) -> std::future<void> {
        std::future<void> completion;
        auto work = task_accounting::wrap(accounting, std::move(task), std::move(stage),
                                          delay, completion);

        std::lock_guard lock(running_mutex);
        std::erase_if(running, [](const std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
        running.push_back(std::async(std::launch::async, std::move(work)));
        return completion;
    }
};

async_worker_pool::async_worker_pool(std::size_t workers, std::string pool_name)
    : impl_(std::make_shared<impl>()) {
    impl_->workers = resolve_worker_count(workers);
    impl_->pool_name = std::move(pool_name);
}

async_worker_pool::~async_worker_pool() = default;

auto async_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    return impl_->launch(std::move(task), {}, std::chrono::milliseconds(0));
}

auto async_worker_pool::submit_delayed(std::function<void()> task,
                                       std::chrono::milliseconds delay) -> std::future<void> {
    return impl_->launch(std::move(task), {}, delay);
}

auto async_worker_pool::submit_to_stage(std::function<void()> task,
                                        const std::string& stage_name) -> std::future<void> {
    return impl_->launch(std::move(task), stage_name, std::chrono::milliseconds(0));
}

auto async_worker_pool::worker_count() const -> std::size_t {
    return impl_->workers;
}

auto async_worker_pool::is_running() const -> bool {
    return true;
}

auto async_worker_pool::pending_tasks() const -> std::size_t {
    return impl_->accounting->total();
}

auto async_worker_pool::pending_tasks(const std::string& stage_name) const -> std::size_t {
    return impl_->accounting->count(stage_name);
}

auto async_worker_pool::name() const -> std::string {
    return impl_->pool_name;
}

// ============================================================================
// worker_pool_factory
// ============================================================================

auto worker_pool_factory::create(std::size_t workers, const std::string& pool_name)
    -> std::shared_ptr<upload_worker_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create(workers, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_worker_pool::create(workers, pool_name);
#else
    return std::make_shared<async_worker_pool>(workers, pool_name);
#endif
}

}  // namespace kcenon::image_upload::adapters
