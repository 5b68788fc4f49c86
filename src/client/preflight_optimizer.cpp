/**
 * @file preflight_optimizer.cpp
 * @brief Destination prefetch cache
 */

#include "kcenon/image_upload/client/preflight_optimizer.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "kcenon/image_upload/core/logging.h"

namespace kcenon::image_upload {

namespace {

enum class entry_state {
    queued,      ///< Waiting for a prefetch worker
    in_flight,   ///< Claimed by a prefetch batch or an on-demand fetch
    resolved
};

struct cache_entry {
    upload_descriptor descriptor;
    entry_state state = entry_state::queued;
    std::optional<upload_destination> destination;
    bool consumed = false;  ///< Handed out by get_signed_url
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct preflight_optimizer::impl {
    std::shared_ptr<destination_allocator> allocator;
    std::string container_id;
    preflight_config config;
    std::shared_ptr<adapters::upload_worker_pool_interface> pool;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::unordered_map<std::string, cache_entry> entries;
    uint64_t generation = 0;  ///< Bumped by clear(); older results are stale
    bool shutting_down = false;
    std::vector<std::future<void>> jobs;

    auto call_allocator(const std::vector<upload_descriptor>& descriptors)
        -> result<std::vector<upload_destination>> {
        try {
            return allocator->allocate(container_id, descriptors);
        } catch (const std::exception& e) {
            return unexpected{error{error_code::allocation_failed,
                std::string("Allocator threw: ") + e.what()}};
        }
    }

    void release_unused(const std::vector<upload_destination>& destinations) {
        if (destinations.empty()) {
            return;
        }
        try {
            auto released = allocator->release(container_id, destinations);
            if (!released.has_value()) {
                IU_LOG_WARN(log_category::preflight,
                    "Failed to release " + std::to_string(destinations.size()) +
                    " destination(s): " + released.error().message);
                return;
            }
        } catch (const std::exception& e) {
            IU_LOG_WARN(log_category::preflight,
                std::string("Allocator release threw: ") + e.what());
            return;
        }
        IU_LOG_DEBUG(log_category::preflight,
            "Released " + std::to_string(destinations.size()) + " unused destination(s)");
    }

    // Caller holds mutex
    void submit_batch(std::vector<std::string> ids, std::size_t attempt, uint64_t gen,
                      std::chrono::milliseconds delay) {
        std::erase_if(jobs, [](const std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
        jobs.push_back(pool->submit_to_stage(
            [this, ids = std::move(ids), attempt, gen, delay]() {
                run_batch(ids, attempt, gen, delay);
            },
            adapters::stage::prefetch));
    }

    /**
     * @brief Sleep for a retry delay unless cleared or shut down first
     */
    auto wait_delay(std::chrono::milliseconds delay, uint64_t gen) -> bool {
        std::unique_lock lock(mutex);
        cv.wait_for(lock, delay, [&] { return shutting_down || gen != generation; });
        return !shutting_down && gen == generation;
    }

    // Caller holds mutex
    void schedule_retry(std::vector<std::string> ids, std::size_t attempt, uint64_t gen,
                        const std::string& reason) {
        if (ids.empty()) {
            return;
        }
        if (shutting_down || attempt >= config.retry.max_attempts) {
            IU_LOG_WARN(log_category::preflight,
                "Prefetch gave up on " + std::to_string(ids.size()) +
                " descriptor(s) after " + std::to_string(attempt) + " attempt(s): " + reason +
                "; falling back to on-demand allocation");
            return;
        }
        auto delay = calculate_retry_delay(config.retry, attempt);
        IU_LOG_DEBUG(log_category::preflight,
            "Prefetch of " + std::to_string(ids.size()) + " descriptor(s) failed (" + reason +
            "), retrying in " + std::to_string(delay.count()) + "ms");
        submit_batch(std::move(ids), attempt + 1, gen, delay);
    }

    void run_batch(const std::vector<std::string>& ids, std::size_t attempt, uint64_t gen,
                   std::chrono::milliseconds delay) {
        if (delay.count() > 0 && !wait_delay(delay, gen)) {
            return;
        }

        std::vector<upload_descriptor> batch;
        std::unordered_set<std::string> claimed;
        {
            std::lock_guard lock(mutex);
            if (shutting_down || gen != generation) {
                return;
            }
            // Entries taken over by an on-demand fetch are no longer queued
            for (const auto& id : ids) {
                auto it = entries.find(id);
                if (it != entries.end() && it->second.state == entry_state::queued) {
                    it->second.state = entry_state::in_flight;
                    batch.push_back(it->second.descriptor);
                    claimed.insert(id);
                }
            }
        }
        if (batch.empty()) {
            return;
        }

        auto allocated = call_allocator(batch);

        std::vector<upload_destination> unused;
        {
            std::lock_guard lock(mutex);
            if (gen != generation) {
                if (allocated.has_value()) {
                    unused = std::move(allocated.value());
                }
            } else {
                if (allocated.has_value()) {
                    for (auto& destination : allocated.value()) {
                        auto it = entries.find(destination.local_id);
                        if (claimed.count(destination.local_id) == 0 || it == entries.end() ||
                            it->second.state != entry_state::in_flight) {
                            unused.push_back(std::move(destination));
                            continue;
                        }
                        it->second.state = entry_state::resolved;
                        it->second.destination = std::move(destination);
                    }
                }

                std::vector<std::string> missing;
                for (const auto& id : claimed) {
                    auto it = entries.find(id);
                    if (it != entries.end() && it->second.state == entry_state::in_flight) {
                        it->second.state = entry_state::queued;
                        missing.push_back(id);
                    }
                }
                schedule_retry(std::move(missing), attempt, gen,
                               allocated.has_value() ? "missing from response"
                                                     : allocated.error().message);
            }
        }
        cv.notify_all();
        release_unused(unused);
    }

    auto fetch_on_demand(const upload_descriptor& descriptor, uint64_t gen,
                         std::unique_lock<std::mutex>& lock) -> result<upload_destination> {
        lock.unlock();
        auto allocated = call_allocator({descriptor});

        std::optional<upload_destination> found;
        std::vector<upload_destination> extra;
        if (allocated.has_value()) {
            for (auto& destination : allocated.value()) {
                if (!found && destination.local_id == descriptor.local_id) {
                    found = std::move(destination);
                } else {
                    extra.push_back(std::move(destination));
                }
            }
        }
        release_unused(extra);

        lock.lock();
        auto it = entries.find(descriptor.local_id);
        bool owned = gen == generation && it != entries.end() &&
                     it->second.state == entry_state::in_flight;

        if (!found) {
            if (owned) {
                entries.erase(it);
            }
            cv.notify_all();
            if (!allocated.has_value()) {
                return unexpected{allocated.error()};
            }
            return unexpected{error{error_code::allocation_incomplete,
                "No destination returned for " + descriptor.filename}};
        }

        if (owned) {
            it->second.state = entry_state::resolved;
            it->second.destination = *found;
            it->second.consumed = true;
        }
        cv.notify_all();
        return *found;
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

preflight_optimizer::preflight_optimizer(
    std::shared_ptr<destination_allocator> allocator, std::string container_id,
    preflight_config config, std::shared_ptr<adapters::upload_worker_pool_interface> pool)
    : impl_(std::make_unique<impl>()) {
    impl_->allocator = std::move(allocator);
    impl_->container_id = std::move(container_id);
    impl_->config = config;
    impl_->config.prefetch_concurrency = std::max<std::size_t>(1, config.prefetch_concurrency);
    impl_->config.batch_size = std::max<std::size_t>(1, config.batch_size);
    impl_->config.retry.max_attempts = std::max<std::size_t>(1, config.retry.max_attempts);
    impl_->pool = pool ? std::move(pool)
                       : adapters::worker_pool_factory::create(
                             impl_->config.prefetch_concurrency, "preflight_pool");
}

preflight_optimizer::~preflight_optimizer() {
    std::vector<std::future<void>> jobs;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->shutting_down = true;
        jobs = std::move(impl_->jobs);
    }
    impl_->cv.notify_all();

    for (auto& job : jobs) {
        if (job.valid()) {
            job.wait();
        }
    }
    clear();
}

// ============================================================================
// Operations
// ============================================================================

void preflight_optimizer::queue_for_prefetch(const std::vector<upload_descriptor>& descriptors) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->shutting_down) {
        return;
    }

    std::vector<std::string> fresh;
    for (const auto& descriptor : descriptors) {
        auto [it, inserted] = impl_->entries.try_emplace(descriptor.local_id);
        if (inserted) {
            it->second.descriptor = descriptor;
            fresh.push_back(descriptor.local_id);
        }
    }
    if (fresh.empty()) {
        return;
    }

    const auto batch_size = impl_->config.batch_size;
    for (std::size_t offset = 0; offset < fresh.size(); offset += batch_size) {
        auto end = std::min(fresh.size(), offset + batch_size);
        std::vector<std::string> ids(fresh.begin() + static_cast<std::ptrdiff_t>(offset),
                                     fresh.begin() + static_cast<std::ptrdiff_t>(end));
        impl_->submit_batch(std::move(ids), 1, impl_->generation, std::chrono::milliseconds(0));
    }

    IU_LOG_DEBUG(log_category::preflight,
        "Queued " + std::to_string(fresh.size()) + " descriptor(s) for prefetch");
}

auto preflight_optimizer::get_signed_url(const upload_descriptor& descriptor)
    -> result<upload_destination> {
    std::unique_lock lock(impl_->mutex);

    while (true) {
        if (impl_->shutting_down) {
            return unexpected{error{error_code::engine_destroyed,
                "Preflight optimizer is shutting down"}};
        }

        const auto gen = impl_->generation;
        auto it = impl_->entries.find(descriptor.local_id);

        if (it == impl_->entries.end()) {
            auto& entry = impl_->entries[descriptor.local_id];
            entry.descriptor = descriptor;
            entry.state = entry_state::in_flight;
            return impl_->fetch_on_demand(descriptor, gen, lock);
        }

        auto& entry = it->second;
        switch (entry.state) {
            case entry_state::resolved:
                if (!entry.destination->expires_within(impl_->config.expiry_buffer)) {
                    entry.consumed = true;
                    return *entry.destination;
                }
                IU_LOG_DEBUG(log_category::preflight,
                    "Destination for " + descriptor.filename + " is near expiry, refreshing");
                entry.state = entry_state::in_flight;
                entry.destination.reset();
                entry.consumed = false;
                return impl_->fetch_on_demand(descriptor, gen, lock);

            case entry_state::queued:
                entry.descriptor = descriptor;
                entry.state = entry_state::in_flight;
                return impl_->fetch_on_demand(descriptor, gen, lock);

            case entry_state::in_flight:
                impl_->cv.wait(lock, [&] {
                    auto current = impl_->entries.find(descriptor.local_id);
                    return impl_->shutting_down || gen != impl_->generation ||
                           current == impl_->entries.end() ||
                           current->second.state != entry_state::in_flight;
                });
                break;
        }
    }
}

void preflight_optimizer::clear() {
    std::vector<upload_destination> unused;
    {
        std::lock_guard lock(impl_->mutex);
        ++impl_->generation;
        for (auto& [id, entry] : impl_->entries) {
            if (entry.state == entry_state::resolved && !entry.consumed && entry.destination) {
                unused.push_back(std::move(*entry.destination));
            }
        }
        impl_->entries.clear();
    }
    impl_->cv.notify_all();
    impl_->release_unused(unused);
}

auto preflight_optimizer::stats() const -> preflight_stats {
    std::lock_guard lock(impl_->mutex);
    preflight_stats result;
    for (const auto& [id, entry] : impl_->entries) {
        switch (entry.state) {
            case entry_state::queued: ++result.queued; break;
            case entry_state::in_flight: ++result.pending; break;
            case entry_state::resolved: ++result.cached; break;
        }
    }
    return result;
}

auto preflight_optimizer::config() const -> const preflight_config& {
    return impl_->config;
}

}  // namespace kcenon::image_upload
