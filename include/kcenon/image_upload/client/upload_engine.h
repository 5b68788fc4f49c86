/**
 * @file upload_engine.h
 * @brief Adaptive parallel upload engine
 */

#ifndef KCENON_IMAGE_UPLOAD_CLIENT_UPLOAD_ENGINE_H
#define KCENON_IMAGE_UPLOAD_CLIENT_UPLOAD_ENGINE_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/image_upload/adapters/thread_pool_adapter.h"
#include "kcenon/image_upload/client/confirmation_batcher.h"
#include "kcenon/image_upload/client/preflight_optimizer.h"
#include "kcenon/image_upload/client/upload_types.h"
#include "kcenon/image_upload/core/concurrency_controller.h"
#include "kcenon/image_upload/core/image_compressor.h"
#include "kcenon/image_upload/core/types.h"
#include "kcenon/image_upload/remote/upload_api.h"

namespace kcenon::image_upload {

/**
 * @brief Everything an engine is built from
 */
struct upload_engine_config {
    std::string container_id;
    std::shared_ptr<destination_allocator> allocator;
    std::shared_ptr<blob_transport> transport;
    std::shared_ptr<upload_confirmer> confirmer;

    bool compression_enabled = true;
    compression_options compression;
    concurrency_config concurrency;
    preflight_config preflight;
    confirmation_batch_config confirmation;
    bool natural_sort = false;
    bool capture_date_sort = false;   ///< Takes precedence over natural_sort

    /// Runs per-task processing; created from max_concurrency when null
    std::shared_ptr<adapters::upload_worker_pool_interface> worker_pool;
};

/**
 * @brief Uploads batches of images with adaptive parallelism
 *
 * Each file becomes a task that moves through
 * PENDING -> COMPRESSING -> UPLOADING -> COMPLETED (or ERROR). A dispatcher
 * thread admits pending tasks in FIFO order while the number of active tasks
 * is below the adaptive concurrency, and sleeps on a condition variable
 * otherwise. Completion order is unordered.
 *
 * Confirmations are grouped: a task that has finished its transfer stays
 * UPLOADING at 100% until its confirmation batch has been accepted.
 *
 * A failing task never aborts the batch: it ends in ERROR with a message and
 * can be re-queued with retry_failed(). cancel() only stops admission; tasks
 * already compressing or uploading run to completion.
 *
 * Callbacks run on worker or dispatcher threads, never under the engine lock.
 * A callback registered while a batch is running sees only later events.
 *
 * @code
 * auto engine = upload_engine::builder()
 *     .with_container_id("gallery-42")
 *     .with_allocator(allocator)
 *     .with_transport(transport)
 *     .with_confirmer(confirmer)
 *     .build();
 * if (engine) {
 *     engine.value().on_all_complete([] { std::puts("done"); });
 *     engine.value().add_files({upload_source::from_file("IMG_0001.jpg")});
 *     engine.value().wait_for_completion(std::chrono::minutes(5));
 * }
 * @endcode
 */
class upload_engine {
public:
    /**
     * @brief Builder for upload_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Container the confirmed uploads are recorded in (required)
         */
        auto with_container_id(std::string container_id) -> builder&;

        auto with_allocator(std::shared_ptr<destination_allocator> allocator) -> builder&;
        auto with_transport(std::shared_ptr<blob_transport> transport) -> builder&;
        auto with_confirmer(std::shared_ptr<upload_confirmer> confirmer) -> builder&;

        /**
         * @brief Enable or disable compression before transfer (default: enabled)
         */
        auto with_compression(bool enable) -> builder&;

        auto with_compression_options(const compression_options& options) -> builder&;

        /**
         * @brief Concurrency bounds and adaptation policy
         */
        auto with_concurrency(const concurrency_config& config) -> builder&;

        auto with_preflight(const preflight_config& config) -> builder&;

        /**
         * @brief Share an existing pool for task processing
         */
        auto with_worker_pool(std::shared_ptr<adapters::upload_worker_pool_interface> pool)
            -> builder&;

        /**
         * @brief Order each added batch by natural file name order (default: off)
         */
        auto with_natural_sort(bool enable) -> builder&;

        /**
         * @brief Order each added batch by EXIF capture time (default: off)
         *
         * Dated JPEGs come first, oldest first; the rest follow in natural
         * file name order. Reads the head of every JPEG when files are added.
         */
        auto with_capture_date_sort(bool enable) -> builder&;

        /**
         * @brief Records per confirmer call and the longest wait for a batch to fill
         */
        auto with_confirmation_batching(std::size_t batch_size,
                                        std::chrono::milliseconds linger) -> builder&;

        /**
         * @brief Validate the configuration and create the engine
         * @return The engine, or a configuration error
         */
        [[nodiscard]] auto build() -> result<upload_engine>;

    private:
        upload_engine_config config_;
    };

    // Non-copyable, movable
    upload_engine(const upload_engine&) = delete;
    auto operator=(const upload_engine&) -> upload_engine& = delete;
    upload_engine(upload_engine&&) noexcept;
    auto operator=(upload_engine&&) noexcept -> upload_engine&;

    /**
     * @brief Destroys the engine and waits for in-flight tasks
     */
    ~upload_engine();

    /**
     * @brief Queue files for upload
     * @return One handle per source, in queue order
     *
     * Never fails: sources are checked when their task is processed, and a
     * bad source ends in ERROR. Safe to call while a batch is running; new
     * tasks join the same queue. Returns no handles after destroy().
     */
    auto add_files(std::vector<upload_source> sources) -> std::vector<upload_handle>;

    auto add_file(upload_source source) -> upload_handle;

    /**
     * @brief Aggregate statistics, computed from the current task set
     */
    [[nodiscard]] auto get_stats() const -> batch_stats;

    /**
     * @brief Snapshot of one task
     */
    [[nodiscard]] auto get_task(const std::string& id) const -> result<upload_task>;

    /**
     * @brief Snapshots of every task, in submission order
     */
    [[nodiscard]] auto get_tasks() const -> std::vector<upload_task>;

    /**
     * @brief Re-queue every task in ERROR
     * @return Number of tasks re-queued
     *
     * Progress and error are cleared. Other tasks are untouched.
     */
    auto retry_failed() -> std::size_t;

    /**
     * @brief Stop admitting pending tasks
     * @return Number of tasks cancelled
     *
     * Pending tasks move to ERROR with transfer_cancelled and stay retryable.
     * Tasks already compressing or uploading are not interrupted.
     */
    auto cancel() -> std::size_t;

    /**
     * @brief Stop admitting pending tasks until resume()
     *
     * Tasks already admitted run to completion, including their
     * confirmation. Queued tasks stay PENDING. While paused with work queued,
     * wait_for_completion() does not return true.
     */
    void pause();

    /**
     * @brief Resume admission after pause()
     */
    void resume();

    [[nodiscard]] auto is_paused() const -> bool;

    /**
     * @brief Cancel, drop prefetched destinations and clear the task registry
     *
     * Idempotent. Tasks in flight finish without further callbacks.
     */
    void destroy();

    [[nodiscard]] auto is_destroyed() const -> bool;

    /**
     * @brief Whether a batch is being drained
     */
    [[nodiscard]] auto is_processing() const -> bool;

    /**
     * @brief Block until no task is pending or active
     * @return false if the timeout expired first
     */
    auto wait_for_completion(std::chrono::milliseconds timeout) -> bool;

    // Subscribers (each call replaces the previous callback)

    /**
     * @brief Called on every state or progress change of a task
     */
    void on_file_update(file_update_callback callback);

    /**
     * @brief Called once per drain with the registry's completed and failed counts
     */
    void on_batch_complete(batch_complete_callback callback);

    /**
     * @brief Called once per drain, after on_batch_complete
     */
    void on_all_complete(all_complete_callback callback);

    /**
     * @brief Called after each task reaches a terminal state
     */
    void on_stats_update(stats_update_callback callback);

    [[nodiscard]] auto container_id() const -> const std::string&;

    /**
     * @brief Identifier shared by every task id this engine creates
     */
    [[nodiscard]] auto get_session_id() const -> const std::string&;

    [[nodiscard]] auto get_concurrency_metrics() const -> concurrency_metrics;
    [[nodiscard]] auto get_preflight_stats() const -> preflight_stats;
    [[nodiscard]] auto get_compression_stats() const -> image_compression_stats;

private:
    upload_engine(upload_engine_config config, std::string session);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CLIENT_UPLOAD_ENGINE_H
