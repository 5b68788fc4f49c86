/**
 * @file preflight_optimizer.h
 * @brief Prefetching of upload destinations ahead of need
 */

#ifndef KCENON_IMAGE_UPLOAD_CLIENT_PREFLIGHT_OPTIMIZER_H
#define KCENON_IMAGE_UPLOAD_CLIENT_PREFLIGHT_OPTIMIZER_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/image_upload/adapters/thread_pool_adapter.h"
#include "kcenon/image_upload/core/types.h"
#include "kcenon/image_upload/remote/http_client.h"
#include "kcenon/image_upload/remote/upload_api.h"

namespace kcenon::image_upload {

/**
 * @brief Preflight configuration
 */
struct preflight_config {
    std::size_t prefetch_concurrency = 4;   ///< Allocation calls in flight at once
    std::size_t batch_size = 20;            ///< Descriptors per allocation call

    /// Cached destinations expiring within this margin are re-allocated
    std::chrono::milliseconds expiry_buffer{std::chrono::seconds(60)};

    /// Backoff for failed prefetch batches; max_attempts bounds the retries
    retry_policy retry;
};

/**
 * @brief Preflight cache counters
 */
struct preflight_stats {
    std::size_t cached = 0;    ///< Resolved destinations held
    std::size_t pending = 0;   ///< Allocations in flight
    std::size_t queued = 0;    ///< Waiting for a prefetch worker
};

/**
 * @brief Requests destinations before the engine needs them
 *
 * Prefetching only hides latency. get_signed_url() falls back to an
 * on-demand allocation whenever the prefetched destination is not ready,
 * so the engine never depends on prefetch timing.
 *
 * Each local_id resolves to one destination; repeated get_signed_url() calls
 * return the same destination until it nears expiry.
 *
 * @note Thread-safe. Prefetch runs on its own worker pool, separate from
 *       the pool that processes uploads.
 */
class preflight_optimizer {
public:
    /**
     * @param allocator Remote allocator
     * @param container_id Container the destinations belong to
     * @param config Prefetch settings
     * @param pool Prefetch pool; created from prefetch_concurrency when null
     */
    preflight_optimizer(std::shared_ptr<destination_allocator> allocator,
                        std::string container_id,
                        preflight_config config = {},
                        std::shared_ptr<adapters::upload_worker_pool_interface> pool = nullptr);

    /**
     * @brief Waits for outstanding prefetch work after clearing the cache
     */
    ~preflight_optimizer();

    preflight_optimizer(const preflight_optimizer&) = delete;
    auto operator=(const preflight_optimizer&) -> preflight_optimizer& = delete;
    preflight_optimizer(preflight_optimizer&&) = delete;
    auto operator=(preflight_optimizer&&) -> preflight_optimizer& = delete;

    /**
     * @brief Start background allocation for descriptors not yet known
     *
     * Returns immediately. Descriptors are grouped into batch_size requests.
     */
    void queue_for_prefetch(const std::vector<upload_descriptor>& descriptors);

    /**
     * @brief Destination for a descriptor
     *
     * Returns the cached destination when resolved, waits for an allocation
     * already in flight, and otherwise allocates on demand.
     */
    [[nodiscard]] auto get_signed_url(const upload_descriptor& descriptor)
        -> result<upload_destination>;

    /**
     * @brief Drop every cached and queued destination
     *
     * Destinations that were never handed out are released through the
     * allocator. Results of allocations still in flight are discarded and
     * released when they arrive.
     */
    void clear();

    [[nodiscard]] auto stats() const -> preflight_stats;

    [[nodiscard]] auto config() const -> const preflight_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CLIENT_PREFLIGHT_OPTIMIZER_H
