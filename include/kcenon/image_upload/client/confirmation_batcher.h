/**
 * @file confirmation_batcher.h
 * @brief Groups per-task confirmations into batched confirmer calls
 */

#ifndef KCENON_IMAGE_UPLOAD_CLIENT_CONFIRMATION_BATCHER_H
#define KCENON_IMAGE_UPLOAD_CLIENT_CONFIRMATION_BATCHER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "kcenon/image_upload/core/types.h"
#include "kcenon/image_upload/remote/upload_api.h"

namespace kcenon::image_upload {

/**
 * @brief Confirmation batching settings
 */
struct confirmation_batch_config {
    std::size_t batch_size = 50;               ///< Records per confirmer call
    std::chrono::milliseconds linger{100};     ///< Longest wait for a batch to fill
};

/**
 * @brief Collects confirmation records from upload workers and sends them
 *        to the confirmer in batches
 *
 * confirm() blocks the calling worker until the batch holding its record has
 * been confirmed. A batch is sent when it reaches batch_size, when the
 * readiness check reports that no other record is on its way, or when the
 * oldest waiting record has lingered for the configured time. The worker that
 * triggers the send performs the confirmer call itself, so batching needs no
 * thread of its own.
 *
 * A failed confirmer call fails every record of that batch.
 *
 * @note Thread-safe.
 */
class confirmation_batcher {
public:
    /**
     * @brief Told how many records are waiting; true sends them now
     *
     * Called with the batcher's lock held. It must not call back into the
     * batcher.
     */
    using readiness_check = std::function<bool(std::size_t waiting)>;

    confirmation_batcher(std::shared_ptr<upload_confirmer> confirmer,
                         std::string container_id,
                         confirmation_batch_config config = {},
                         readiness_check ready = {});

    ~confirmation_batcher();

    confirmation_batcher(const confirmation_batcher&) = delete;
    auto operator=(const confirmation_batcher&) -> confirmation_batcher& = delete;
    confirmation_batcher(confirmation_batcher&&) = delete;
    auto operator=(confirmation_batcher&&) -> confirmation_batcher& = delete;

    /**
     * @brief Queue a record and wait for its batch
     * @return Image id assigned by the confirmer (empty if it returned none),
     *         or the batch's error
     */
    [[nodiscard]] auto confirm(confirmation_record record) -> result<std::string>;

    /**
     * @brief Re-run the readiness check for waiting records
     *
     * Call after something the readiness check depends on has changed.
     */
    void poke();

    /**
     * @brief Number of confirmer calls made so far
     */
    [[nodiscard]] auto batches_sent() const -> std::size_t;

    [[nodiscard]] auto config() const -> const confirmation_batch_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CLIENT_CONFIRMATION_BATCHER_H
